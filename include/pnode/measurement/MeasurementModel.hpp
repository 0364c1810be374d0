#pragma once

#include <memory>
#include <string>

#include "pnode/core/GaussianBelief.hpp"
#include "pnode/core/LinearAlgebra.hpp"
#include "pnode/measurement/OdeProblem.hpp"
#include "pnode/prior/StochasticPrior.hpp"

namespace pnode {

// Affine approximation z ~ H (x - m) + predictedObservation + v,
// v ~ N(0, observationNoise), of the ODE residual around a belief.
struct Linearization_t {
  Matrix observationMatrix;
  Matrix observationNoise;
  Vector predictedObservation;
};

// Observation model of the ODE filter. The residual
// h(t, X) = E1 X - f(t, E0 X) is observed to be exactly zero.
class MeasurementModel {
public:
  MeasurementModel(std::shared_ptr<const StochasticPrior> prior,
                   InitialValueProblem_t problem,
                   NumericalTolerance_t tolerance = {});
  virtual ~MeasurementModel() = default;

  virtual Linearization_t linearize(const GaussianBelief& belief, double t) const = 0;
  virtual std::string name() const = 0;

  Vector residual(double t, const Vector& state) const;
  // E1 - J(t, E0 x) E0.
  Matrix residualJacobian(double t, const Vector& state) const;
  // df/dy at y, analytic when available, forward differences otherwise.
  Matrix fieldJacobian(double t, const Vector& y) const;
  Vector evaluateField(double t, const Vector& y) const;

  Eigen::Index observationDimension() const { return prior->spatialDimension(); }
  Matrix observationNoise() const;
  const StochasticPrior& priorModel() const { return *prior; }
  const InitialValueProblem_t& problem() const { return ivp; }
  const NumericalTolerance_t& tolerance() const { return tol; }
  const Matrix& valueProjection() const { return e0; }
  const Matrix& derivativeProjection() const { return e1; }

protected:
  void checkBelief(const GaussianBelief& belief) const;

  std::shared_ptr<const StochasticPrior> prior;
  InitialValueProblem_t ivp;
  NumericalTolerance_t tol;
  Matrix e0;
  Matrix e1;
};

} // namespace pnode
