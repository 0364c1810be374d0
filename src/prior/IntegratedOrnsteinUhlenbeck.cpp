#include "pnode/prior/IntegratedOrnsteinUhlenbeck.hpp"

#include <cmath>

#include <fmt/core.h>

#include "pnode/core/Errors.hpp"

namespace pnode {

IntegratedOrnsteinUhlenbeck::IntegratedOrnsteinUhlenbeck(int order,
                                                         int spatialDimension,
                                                         double driftSpeed,
                                                         double diffusion,
                                                         double initialVariance)
    : LtiSdePrior(order, spatialDimension, diffusion, initialVariance), speed(driftSpeed) {
  if (!(driftSpeed >= 0.0) || !std::isfinite(driftSpeed)) {
    throw PnodeError(fmt::format("IntegratedOrnsteinUhlenbeck: drift speed must be non-negative, got {}", driftSpeed));
  }
}

Matrix IntegratedOrnsteinUhlenbeck::driftBlock() const {
  const int q = order();
  Matrix drift = Matrix::Zero(q + 1, q + 1);
  for (int i = 0; i < q; ++i) {
    drift(i, i + 1) = 1.0;
  }
  drift(q, q) = -speed;
  return drift;
}

} // namespace pnode
