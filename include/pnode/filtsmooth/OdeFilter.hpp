#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "pnode/core/GaussianBelief.hpp"
#include "pnode/core/LinearAlgebra.hpp"
#include "pnode/core/TimeGrid.hpp"
#include "pnode/measurement/MeasurementModel.hpp"
#include "pnode/prior/StochasticPrior.hpp"

namespace pnode {

// How the process-noise diffusion is handled during the forward pass.
enum class DiffusionModel_e {
  // Unit diffusion; a global scale can be fitted afterwards by calibration.
  kConstant,
  // Local quasi-maximum-likelihood diffusion re-estimated at every step.
  kDynamic
};

enum class FilterState_e {
  kUninitialized,
  kPredicting,
  kUpdating,
  kDone
};

struct FilterOptions_t {
  NumericalTolerance_t tolerance;
  DiffusionModel_e diffusionModel = DiffusionModel_e::kConstant;
};

// Snapshot of one grid point of the forward pass.
struct FilterStep_t {
  double time = 0.0;
  GaussianBelief filtered;
  GaussianBelief predicted;
  // Dynamics used to reach this point; unset (hasTransition false) at t_0.
  bool hasTransition = false;
  DiscreteTransition_t transition;
  Matrix gain;
  Vector innovation;
  Matrix innovationFactor;
  double diffusion = 1.0;
  Vector localError;
};

// Residual statistics of one update, consumed by calibration.
struct InnovationRecord_t {
  std::size_t index = 0;
  double time = 0.0;
  Vector innovation;
  Matrix innovationFactor;
};

struct FilterResult_t {
  std::vector<FilterStep_t> steps;
  std::vector<InnovationRecord_t> innovations;
};

// Prior at t_0 conditioned on y(t_0) = y0 and y'(t_0) = f(t_0, y0).
GaussianBelief initialBelief(const MeasurementModel& model);

// Forward pass of the ODE filter: predict with the prior, linearise the
// residual, condition on a zero residual.
class OdeFilter {
public:
  OdeFilter(std::shared_ptr<const StochasticPrior> prior,
            std::shared_ptr<const MeasurementModel> measurementModel,
            FilterOptions_t options = {});
  // Fixed-grid form; the grid is validated before any computation.
  OdeFilter(std::shared_ptr<const StochasticPrior> prior,
            std::shared_ptr<const MeasurementModel> measurementModel,
            const std::vector<double>& grid,
            FilterOptions_t options = {});

  void initialize(double t0, const GaussianBelief& initial);
  // Advances to tNext > current time. Grid points may be produced
  // adaptively by the caller, one at a time. The returned reference points
  // into result() and is invalidated by the next step() or release().
  // Any failure inside the step clears the result and resets the filter to
  // kUninitialized before the exception propagates.
  const FilterStep_t& step(double tNext);
  // Processes the grid given at construction.
  const FilterResult_t& run(const GaussianBelief& initial);
  void finish();
  // Hands the result over; the filter returns to kUninitialized.
  FilterResult_t release();

  FilterState_e state() const { return filterState; }
  const FilterResult_t& result() const { return filterResult; }
  double currentTime() const;

private:
  std::shared_ptr<const StochasticPrior> prior;
  std::shared_ptr<const MeasurementModel> measurementModel;
  FilterOptions_t options;
  TimeGrid grid;
  FilterResult_t filterResult;
  FilterState_e filterState = FilterState_e::kUninitialized;
};

} // namespace pnode
