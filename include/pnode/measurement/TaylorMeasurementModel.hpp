#pragma once

#include "pnode/measurement/MeasurementModel.hpp"

namespace pnode {

// Linearisation order of the extended Kalman ODE filter.
enum class TaylorOrder_e {
  // EK0: H = E1, the Jacobian of f is ignored.
  kZerothOrder,
  // EK1: H = E1 - J E0 at the predicted mean.
  kFirstOrder
};

class TaylorMeasurementModel : public MeasurementModel {
public:
  TaylorMeasurementModel(std::shared_ptr<const StochasticPrior> prior,
                         InitialValueProblem_t problem,
                         TaylorOrder_e order = TaylorOrder_e::kFirstOrder,
                         NumericalTolerance_t tolerance = {});

  Linearization_t linearize(const GaussianBelief& belief, double t) const override;
  std::string name() const override;

  TaylorOrder_e linearizationOrder() const { return taylorOrder; }

private:
  TaylorOrder_e taylorOrder = TaylorOrder_e::kFirstOrder;
};

} // namespace pnode
