#pragma once

#include <string>

#include "pnode/core/Types.hpp"

namespace pnode {

// Discretised dynamics x_{t+h} = A x_t + w, w ~ N(0, Q), for one step h.
struct DiscreteTransition_t {
  double step = 0.0;
  Matrix transition;
  Matrix processNoise;
  Matrix processNoiseFactor;
};

// Continuous-time Gauss-Markov prior over d ODE components, each carrying
// q + 1 derivatives. The state is ordered per component:
// [x_1, x_1', ..., x_1^(q), x_2, ..., x_d^(q)].
class StochasticPrior {
public:
  StochasticPrior(int order, int spatialDimension, double diffusion, double initialVariance = 1.0);
  virtual ~StochasticPrior() = default;

  int order() const { return orderValue; }
  int spatialDimension() const { return spatialDim; }
  int stateDimension() const { return spatialDim * (orderValue + 1); }
  double diffusion() const { return diffusionValue; }

  // Closed-form or matrix-fraction discretisation for a step h > 0.
  // Recomputed on every call; throws InvalidStepSizeError otherwise.
  DiscreteTransition_t discretize(double step) const;

  // Covariance of the prior at t_0. Non-stationary priors return the
  // diffuse initialVariance * I.
  virtual Matrix stationaryCovariance() const;

  // d x stateDimension() matrix selecting the given derivative.
  Matrix projection(int derivative) const;

  virtual std::string name() const = 0;

protected:
  // Transition and process noise of a single (q + 1)-dimensional component.
  virtual void discretizeBlock(double step, Matrix& transition, Matrix& processNoise) const = 0;

  Matrix blockDiagonal(const Matrix& block) const;

  double initialVariance = 1.0;

private:
  int orderValue = 0;
  int spatialDim = 1;
  double diffusionValue = 1.0;
};

// Linear time-invariant SDE prior dx = F x dt + L dB, discretised with the
// matrix-fraction decomposition of Van Loan on a short sub-step, then
// doubled up to the full step with the process noise kept in factored form.
class LtiSdePrior : public StochasticPrior {
public:
  using StochasticPrior::StochasticPrior;

  // Drift F of a single component, (q + 1) x (q + 1).
  virtual Matrix driftBlock() const = 0;
  // Dispersion L of a single component: diffusion * e_q.
  Vector dispersionBlock() const;

protected:
  void discretizeBlock(double step, Matrix& transition, Matrix& processNoise) const override;

  // Solves F P + P F^T + L L^T = 0 for one component.
  Matrix lyapunovBlock() const;
};

} // namespace pnode
