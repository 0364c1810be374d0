#pragma once

#include "pnode/prior/StochasticPrior.hpp"

namespace pnode {

// Matern process of smoothness q + 1/2 in companion (state-space) form.
// Stationary, so the prior at t_0 is the Lyapunov solution.
class MaternProcess : public LtiSdePrior {
public:
  MaternProcess(int order, int spatialDimension, double lengthScale, double diffusion = 1.0);

  double lengthScale() const { return length; }
  Matrix driftBlock() const override;
  Matrix stationaryCovariance() const override;
  std::string name() const override { return "MaternProcess"; }

private:
  double length = 1.0;
};

} // namespace pnode
