#include "pnode/prior/MaternProcess.hpp"

#include <cmath>

#include <fmt/core.h>

#include "pnode/core/Errors.hpp"

namespace pnode {

namespace {

double binomial(int n, int k) {
  double out = 1.0;
  for (int i = 1; i <= k; ++i) {
    out = out * static_cast<double>(n - k + i) / static_cast<double>(i);
  }
  return out;
}

} // namespace

MaternProcess::MaternProcess(int order, int spatialDimension, double lengthScale, double diffusion)
    : LtiSdePrior(order, spatialDimension, diffusion), length(lengthScale) {
  if (!(lengthScale > 0.0) || !std::isfinite(lengthScale)) {
    throw PnodeError(fmt::format("MaternProcess: length scale must be positive, got {}", lengthScale));
  }
}

Matrix MaternProcess::driftBlock() const {
  const int q = order();
  const int dim = q + 1;
  const double nu = q + 0.5;
  const double lambda = std::sqrt(2.0 * nu) / length;

  Matrix drift = Matrix::Zero(dim, dim);
  for (int i = 0; i < q; ++i) {
    drift(i, i + 1) = 1.0;
  }
  for (int i = 0; i < dim; ++i) {
    drift(q, i) = -binomial(dim, i) * std::pow(lambda, dim - i);
  }
  return drift;
}

Matrix MaternProcess::stationaryCovariance() const {
  return blockDiagonal(lyapunovBlock());
}

} // namespace pnode
