#include "pnode/measurement/TaylorMeasurementModel.hpp"

namespace pnode {

TaylorMeasurementModel::TaylorMeasurementModel(std::shared_ptr<const StochasticPrior> prior,
                                               InitialValueProblem_t problem,
                                               TaylorOrder_e order,
                                               NumericalTolerance_t tolerance)
    : MeasurementModel(std::move(prior), std::move(problem), tolerance), taylorOrder(order) {}

Linearization_t TaylorMeasurementModel::linearize(const GaussianBelief& belief, double t) const {
  checkBelief(belief);
  const Vector& mean = belief.mean();

  Linearization_t out;
  out.predictedObservation = residual(t, mean);
  out.observationMatrix =
      taylorOrder == TaylorOrder_e::kFirstOrder ? residualJacobian(t, mean) : derivativeProjection();
  out.observationNoise = observationNoise();
  return out;
}

std::string TaylorMeasurementModel::name() const {
  return taylorOrder == TaylorOrder_e::kFirstOrder ? "EK1" : "EK0";
}

} // namespace pnode
