#include <cmath>

#include <gtest/gtest.h>

#include "pnode/core/Errors.hpp"
#include "pnode/core/LinearAlgebra.hpp"

namespace {

bool isLowerTriangular(const pnode::Matrix& matrix) {
  for (Eigen::Index r = 0; r < matrix.rows(); ++r) {
    for (Eigen::Index c = r + 1; c < matrix.cols(); ++c) {
      if (matrix(r, c) != 0.0) {
        return false;
      }
    }
  }
  return true;
}

} // namespace

TEST(LinearAlgebraTests, TriangularizeReproducesGram) {
  pnode::Matrix stacked(3, 5);
  stacked << 1.0, 0.5, -2.0, 0.1, 3.0,
      0.0, 2.0, 1.0, -1.0, 0.2,
      4.0, -0.3, 0.7, 0.0, 1.5;
  const pnode::Matrix lower = pnode::triangularize(stacked);

  ASSERT_EQ(lower.rows(), 3);
  ASSERT_EQ(lower.cols(), 3);
  EXPECT_TRUE(isLowerTriangular(lower));
  for (Eigen::Index i = 0; i < 3; ++i) {
    EXPECT_GE(lower(i, i), 0.0);
  }
  const pnode::Matrix gram = stacked * stacked.transpose();
  EXPECT_TRUE((lower * lower.transpose()).isApprox(gram, 1e-12));
}

TEST(LinearAlgebraTests, TriangularizeHandlesRankDeficientInput) {
  pnode::Matrix stacked = pnode::Matrix::Zero(3, 4);
  stacked(0, 0) = 2.0;
  stacked(2, 1) = 1.0;
  const pnode::Matrix lower = pnode::triangularize(stacked);

  EXPECT_TRUE(isLowerTriangular(lower));
  EXPECT_TRUE((lower * lower.transpose()).isApprox(stacked * stacked.transpose(), 1e-12));
  EXPECT_NEAR(lower(1, 1), 0.0, 1e-15);
}

TEST(LinearAlgebraTests, CholeskyFactorOfPositiveDefiniteMatrix) {
  pnode::Matrix covariance(2, 2);
  covariance << 4.0, 2.0,
      2.0, 3.0;
  const pnode::Matrix lower = pnode::choleskyFactor(covariance);

  EXPECT_TRUE(isLowerTriangular(lower));
  EXPECT_NEAR(lower(0, 0), 2.0, 1e-14);
  EXPECT_NEAR(lower(1, 0), 1.0, 1e-14);
  EXPECT_NEAR(lower(1, 1), std::sqrt(2.0), 1e-14);
}

TEST(LinearAlgebraTests, CholeskyFactorFallsBackForSemiDefiniteMatrix) {
  pnode::Matrix covariance(3, 3);
  covariance << 1.0, 1.0, 0.0,
      1.0, 1.0, 0.0,
      0.0, 0.0, 0.0;
  const pnode::Matrix lower = pnode::choleskyFactor(covariance);

  ASSERT_TRUE(lower.allFinite());
  EXPECT_TRUE(isLowerTriangular(lower));
  EXPECT_TRUE((lower * lower.transpose()).isApprox(covariance, 1e-12));
}

TEST(LinearAlgebraTests, SymmetrizeAveragesTranspose) {
  pnode::Matrix matrix(2, 2);
  matrix << 1.0, 2.0,
      4.0, 5.0;
  const pnode::Matrix sym = pnode::symmetrize(matrix);
  EXPECT_DOUBLE_EQ(sym(0, 1), 3.0);
  EXPECT_DOUBLE_EQ(sym(1, 0), 3.0);
  EXPECT_DOUBLE_EQ(sym(1, 1), 5.0);
}

TEST(LinearAlgebraTests, SolveWithFactorSolvesNormalSystem) {
  pnode::Matrix lower(2, 2);
  lower << 2.0, 0.0,
      1.0, 3.0;
  pnode::Matrix rhs(2, 1);
  rhs << 1.0, -2.0;
  const pnode::Matrix solution = pnode::solveWithFactor(lower, rhs, pnode::NumericalTolerance_t{});
  EXPECT_TRUE((lower * lower.transpose() * solution).isApprox(rhs, 1e-12));
}

TEST(LinearAlgebraTests, SolveWithFactorRejectsSingularFactor) {
  pnode::Matrix lower(2, 2);
  lower << 1.0, 0.0,
      1.0, 0.0;
  const pnode::Matrix rhs = pnode::Matrix::Identity(2, 2);
  EXPECT_THROW(pnode::solveWithFactor(lower, rhs, pnode::NumericalTolerance_t{}), pnode::SingularCovarianceError);
}

TEST(LinearAlgebraTests, MinAbsDiagonal) {
  pnode::Matrix lower(3, 3);
  lower << 2.0, 0.0, 0.0,
      1.0, -0.5, 0.0,
      1.0, 1.0, 3.0;
  EXPECT_DOUBLE_EQ(pnode::minAbsDiagonal(lower), 0.5);
  EXPECT_DOUBLE_EQ(pnode::minAbsDiagonal(pnode::Matrix()), 0.0);
}
