#include "pnode/prior/StochasticPrior.hpp"

#include <cmath>

#include <fmt/core.h>
#include <unsupported/Eigen/MatrixFunctions>

#include "pnode/core/Errors.hpp"
#include "pnode/core/LinearAlgebra.hpp"

namespace pnode {

namespace {

constexpr double kMaxFractionNorm = 0.5;

} // namespace

StochasticPrior::StochasticPrior(int order, int spatialDimension, double diffusion, double initialVarianceInput)
    : initialVariance(initialVarianceInput),
      orderValue(order),
      spatialDim(spatialDimension),
      diffusionValue(diffusion) {
  if (order < 0 || spatialDimension < 1) {
    throw DimensionMismatchError(
        fmt::format("StochasticPrior: invalid order {} / spatial dimension {}", order, spatialDimension));
  }
  if (!(diffusion > 0.0) || !std::isfinite(diffusion)) {
    throw PnodeError(fmt::format("StochasticPrior: diffusion must be positive, got {}", diffusion));
  }
  if (!(initialVarianceInput > 0.0) || !std::isfinite(initialVarianceInput)) {
    throw PnodeError(fmt::format("StochasticPrior: initial variance must be positive, got {}", initialVarianceInput));
  }
}

DiscreteTransition_t StochasticPrior::discretize(double step) const {
  if (!(step > 0.0) || !std::isfinite(step)) {
    throw InvalidStepSizeError(fmt::format("{}: step size must be positive and finite, got {}", name(), step));
  }

  Matrix transitionBlock;
  Matrix noiseBlock;
  discretizeBlock(step, transitionBlock, noiseBlock);
  noiseBlock = symmetrize(noiseBlock);

  DiscreteTransition_t out;
  out.step = step;
  out.transition = blockDiagonal(transitionBlock);
  out.processNoise = blockDiagonal(noiseBlock);
  out.processNoiseFactor = blockDiagonal(choleskyFactor(noiseBlock));
  return out;
}

Matrix StochasticPrior::stationaryCovariance() const {
  return Matrix::Identity(stateDimension(), stateDimension()) * initialVariance;
}

Matrix StochasticPrior::projection(int derivative) const {
  if (derivative < 0 || derivative > orderValue) {
    throw DimensionMismatchError(
        fmt::format("{}: derivative {} not represented by a prior of order {}", name(), derivative, orderValue));
  }
  Matrix out = Matrix::Zero(spatialDim, stateDimension());
  for (int k = 0; k < spatialDim; ++k) {
    out(k, k * (orderValue + 1) + derivative) = 1.0;
  }
  return out;
}

Matrix StochasticPrior::blockDiagonal(const Matrix& block) const {
  const Eigen::Index b = block.rows();
  Matrix out = Matrix::Zero(b * spatialDim, b * spatialDim);
  for (int k = 0; k < spatialDim; ++k) {
    out.block(k * b, k * b, b, b) = block;
  }
  return out;
}

Vector LtiSdePrior::dispersionBlock() const {
  Vector out = Vector::Zero(order() + 1);
  out(order()) = diffusion();
  return out;
}

void LtiSdePrior::discretizeBlock(double step, Matrix& transition, Matrix& processNoise) const {
  const Matrix drift = driftBlock();
  const Vector dispersion = dispersionBlock();
  const Eigen::Index n = drift.rows();

  // The -F^T block of the matrix fraction grows like exp(|F| h), so it is only
  // evaluated on a sub-step h / 2^s with |F| h / 2^s <= kMaxFractionNorm.
  const double driftNorm = drift.cwiseAbs().rowwise().sum().maxCoeff();
  double subStep = step;
  int squarings = 0;
  while (subStep * driftNorm > kMaxFractionNorm) {
    subStep *= 0.5;
    ++squarings;
  }

  // exp([[F, L L^T], [0, -F^T]] h) = [[A, B], [0, A^-T]] and Q = B A^T.
  Matrix fraction = Matrix::Zero(2 * n, 2 * n);
  fraction.topLeftCorner(n, n) = drift;
  fraction.topRightCorner(n, n) = dispersion * dispersion.transpose();
  fraction.bottomRightCorner(n, n) = -drift.transpose();
  const Matrix exponential = (fraction * subStep).exp();

  transition = exponential.topLeftCorner(n, n);
  processNoise = symmetrize(exponential.topRightCorner(n, n) * transition.transpose());
  if (squarings == 0) {
    return;
  }

  // Doubling in square-root form: A_2h = A_h A_h, chol Q_2h = tria([A_h chol Q_h, chol Q_h]).
  Matrix factor = choleskyFactor(processNoise);
  Matrix stacked(n, 2 * n);
  for (int i = 0; i < squarings; ++i) {
    stacked << transition * factor, factor;
    factor = triangularize(stacked);
    transition = transition * transition;
  }
  if (!transition.allFinite() || !factor.allFinite()) {
    throw InvalidStepSizeError(fmt::format("{}: discretisation overflows for step size {}", name(), step));
  }
  processNoise = factor * factor.transpose();
}

Matrix LtiSdePrior::lyapunovBlock() const {
  const Matrix drift = driftBlock();
  const Vector dispersion = dispersionBlock();
  const Eigen::Index n = drift.rows();

  // (I kron F + F kron I) vec(P) = -vec(L L^T), column-major vec.
  Matrix system = Matrix::Zero(n * n, n * n);
  for (Eigen::Index col = 0; col < n; ++col) {
    for (Eigen::Index row = 0; row < n; ++row) {
      const Eigen::Index eq = col * n + row;
      for (Eigen::Index k = 0; k < n; ++k) {
        system(eq, col * n + k) += drift(row, k);
        system(eq, k * n + row) += drift(col, k);
      }
    }
  }
  const Matrix source = dispersion * dispersion.transpose();
  const Vector rhs = -Eigen::Map<const Vector>(source.data(), n * n);

  Eigen::FullPivLU<Matrix> lu(system);
  if (!lu.isInvertible()) {
    throw SingularCovarianceError(fmt::format("{}: drift has no stationary covariance", name()));
  }
  const Vector solution = lu.solve(rhs);
  return symmetrize(Eigen::Map<const Matrix>(solution.data(), n, n));
}

} // namespace pnode
