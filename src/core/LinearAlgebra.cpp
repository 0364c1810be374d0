#include "pnode/core/LinearAlgebra.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/core.h>

#include "pnode/core/Errors.hpp"
#include "pnode/core/Logger.hpp"

namespace pnode {

Matrix symmetrize(const Matrix& matrix) {
  if (matrix.rows() != matrix.cols()) {
    throw DimensionMismatchError(
        fmt::format("symmetrize: expected square matrix, got {}x{}", matrix.rows(), matrix.cols()));
  }
  return 0.5 * (matrix + matrix.transpose());
}

Matrix triangularize(const Matrix& stacked) {
  const Eigen::Index n = stacked.rows();
  const Eigen::Index k = stacked.cols();
  Matrix lower = Matrix::Zero(n, n);
  if (n == 0 || k == 0) {
    return lower;
  }

  Eigen::HouseholderQR<Matrix> qr(stacked.transpose());
  const Eigen::Index usedRows = std::min(n, k);
  Matrix upper = qr.matrixQR().topRows(usedRows);
  for (Eigen::Index r = 1; r < usedRows; ++r) {
    upper.row(r).head(r).setZero();
  }
  lower.leftCols(usedRows) = upper.transpose();

  for (Eigen::Index i = 0; i < usedRows; ++i) {
    if (lower(i, i) < 0.0) {
      lower.col(i) *= -1.0;
    }
  }
  return lower;
}

Matrix choleskyFactor(const Matrix& covariance) {
  if (covariance.rows() != covariance.cols()) {
    throw DimensionMismatchError(fmt::format("choleskyFactor: expected square matrix, got {}x{}",
                                             covariance.rows(),
                                             covariance.cols()));
  }
  const Eigen::Index n = covariance.rows();
  if (n == 0) {
    return Matrix::Zero(0, 0);
  }
  const Matrix symmetric = symmetrize(covariance);

  Eigen::LLT<Matrix> llt(symmetric);
  if (llt.info() == Eigen::Success) {
    const Matrix lower = llt.matrixL();
    if (lower.allFinite()) {
      return lower;
    }
  }

  // P^T L D L^T P = A; the factor P^T L sqrt(D) is then re-triangularised.
  Eigen::LDLT<Matrix> ldlt(symmetric);
  if (ldlt.info() != Eigen::Success) {
    throw SingularCovarianceError("choleskyFactor: LDLT factorisation failed");
  }
  const Vector pivots = ldlt.vectorD().cwiseMax(0.0).cwiseSqrt();
  Matrix unitLower = ldlt.matrixL();
  Matrix factor = ldlt.transpositionsP().transpose() * (unitLower * pivots.asDiagonal());
  if (auto logger = Logger::GetClass("LinearAlgebra")) {
    logger->debug("choleskyFactor: semi-definite input of size {}, using LDLT fallback (min pivot {:.3e})",
                  n,
                  ldlt.vectorD().minCoeff());
  }
  return triangularize(factor);
}

double minAbsDiagonal(const Matrix& triangular) {
  if (triangular.rows() == 0 || triangular.cols() == 0) {
    return 0.0;
  }
  return triangular.diagonal().cwiseAbs().minCoeff();
}

Matrix solveWithFactor(const Matrix& lower, const Matrix& rhs, const NumericalTolerance_t& tolerance) {
  if (lower.rows() != lower.cols() || lower.rows() != rhs.rows()) {
    throw DimensionMismatchError(fmt::format("solveWithFactor: factor {}x{} incompatible with rhs {}x{}",
                                             lower.rows(),
                                             lower.cols(),
                                             rhs.rows(),
                                             rhs.cols()));
  }
  const double minDiag = minAbsDiagonal(lower);
  if (!(minDiag > tolerance.singularThreshold)) {
    throw SingularCovarianceError(
        fmt::format("solveWithFactor: factor diagonal {:.3e} below threshold {:.3e}",
                    minDiag,
                    tolerance.singularThreshold));
  }
  const Matrix halfSolved = lower.triangularView<Eigen::Lower>().solve(rhs);
  return lower.transpose().triangularView<Eigen::Upper>().solve(halfSolved);
}

} // namespace pnode
