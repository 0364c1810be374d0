#pragma once

#include "pnode/prior/StochasticPrior.hpp"

namespace pnode {

// q-times integrated Ornstein-Uhlenbeck process: the q-th derivative
// reverts to zero with rate driftSpeed.
class IntegratedOrnsteinUhlenbeck : public LtiSdePrior {
public:
  IntegratedOrnsteinUhlenbeck(int order,
                              int spatialDimension,
                              double driftSpeed,
                              double diffusion = 1.0,
                              double initialVariance = 1.0);

  double driftSpeed() const { return speed; }
  Matrix driftBlock() const override;
  std::string name() const override { return "IntegratedOrnsteinUhlenbeck"; }

private:
  double speed = 0.0;
};

} // namespace pnode
