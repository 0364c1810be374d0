#pragma once

#include "pnode/prior/StochasticPrior.hpp"

namespace pnode {

// q-times integrated Wiener process (IBM(q)); the q-th derivative of each
// component is scaled white noise. Default prior of the ODE filter.
class IntegratedWienerProcess : public StochasticPrior {
public:
  IntegratedWienerProcess(int order, int spatialDimension, double diffusion = 1.0, double initialVariance = 1.0);

  std::string name() const override { return "IntegratedWienerProcess"; }

protected:
  void discretizeBlock(double step, Matrix& transition, Matrix& processNoise) const override;
};

} // namespace pnode
