#include "pnode/measurement/MeasurementModel.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/core.h>

#include "pnode/core/Errors.hpp"

namespace pnode {

MeasurementModel::MeasurementModel(std::shared_ptr<const StochasticPrior> priorInput,
                                   InitialValueProblem_t problemInput,
                                   NumericalTolerance_t toleranceInput)
    : prior(std::move(priorInput)), ivp(std::move(problemInput)), tol(toleranceInput) {
  if (!prior) {
    throw PnodeError("MeasurementModel: prior is required");
  }
  if (!ivp.field) {
    throw PnodeError("MeasurementModel: vector field is required");
  }
  if (prior->order() < 1) {
    throw DimensionMismatchError(
        fmt::format("MeasurementModel: the ODE residual needs a prior of order >= 1, got {}", prior->order()));
  }
  if (ivp.y0.size() != prior->spatialDimension()) {
    throw DimensionMismatchError(fmt::format("MeasurementModel: initial value of size {} for prior of dimension {}",
                                             ivp.y0.size(),
                                             prior->spatialDimension()));
  }
  if (!(tol.jitter > 0.0)) {
    throw PnodeError(fmt::format("MeasurementModel: jitter must be positive, got {}", tol.jitter));
  }
  e0 = prior->projection(0);
  e1 = prior->projection(1);
}

Vector MeasurementModel::evaluateField(double t, const Vector& y) const {
  Vector value = ivp.field(t, y);
  if (value.size() != y.size()) {
    throw DimensionMismatchError(
        fmt::format("MeasurementModel: vector field returned {} entries for state of size {}", value.size(), y.size()));
  }
  return value;
}

Vector MeasurementModel::residual(double t, const Vector& state) const {
  return e1 * state - evaluateField(t, e0 * state);
}

Matrix MeasurementModel::fieldJacobian(double t, const Vector& y) const {
  const Eigen::Index d = y.size();
  if (ivp.jacobian) {
    Matrix jac = ivp.jacobian(t, y);
    if (jac.rows() != d || jac.cols() != d) {
      throw DimensionMismatchError(
          fmt::format("MeasurementModel: Jacobian is {}x{} for state of size {}", jac.rows(), jac.cols(), d));
    }
    return jac;
  }

  const Vector base = evaluateField(t, y);
  Matrix jac(d, d);
  for (Eigen::Index i = 0; i < d; ++i) {
    const double eps = 1e-7 * std::max(1.0, std::abs(y(i)));
    Vector pert = y;
    pert(i) += eps;
    jac.col(i) = (evaluateField(t, pert) - base) / eps;
  }
  return jac;
}

Matrix MeasurementModel::residualJacobian(double t, const Vector& state) const {
  return e1 - fieldJacobian(t, e0 * state) * e0;
}

Matrix MeasurementModel::observationNoise() const {
  return Matrix::Identity(observationDimension(), observationDimension()) * tol.jitter;
}

void MeasurementModel::checkBelief(const GaussianBelief& belief) const {
  if (belief.dimension() != prior->stateDimension()) {
    throw DimensionMismatchError(fmt::format("{}: belief of dimension {} for prior state dimension {}",
                                             name(),
                                             belief.dimension(),
                                             prior->stateDimension()));
  }
}

} // namespace pnode
