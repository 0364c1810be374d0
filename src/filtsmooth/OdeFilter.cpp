#include "pnode/filtsmooth/OdeFilter.hpp"

#include <algorithm>
#include <cmath>
#include <exception>

#include <fmt/core.h>

#include "pnode/core/Errors.hpp"
#include "pnode/core/Logger.hpp"

namespace pnode {

namespace {

constexpr std::size_t kLogEvery = 50;

// Local quasi-MLE of the diffusion: |S^-1/2 z|^2 / m under the unit-diffusion prediction.
double estimateLocalDiffusion(const GaussianBelief& predicted,
                              const Linearization_t& linearization,
                              const NumericalTolerance_t& tolerance) {
  const Eigen::Index m = linearization.observationMatrix.rows();
  Matrix stacked(m, predicted.dimension() + m);
  stacked << linearization.observationMatrix * predicted.covarianceFactor(),
      choleskyFactor(linearization.observationNoise);
  const Matrix measurementFactor = triangularize(stacked);
  if (!(minAbsDiagonal(measurementFactor) > tolerance.singularThreshold)) {
    throw SingularCovarianceError("dynamic diffusion: measurement covariance is singular");
  }
  const Vector whitened =
      measurementFactor.triangularView<Eigen::Lower>().solve(linearization.predictedObservation);
  return std::max(whitened.squaredNorm() / static_cast<double>(m), tolerance.jitter);
}

} // namespace

GaussianBelief initialBelief(const MeasurementModel& model) {
  const StochasticPrior& prior = model.priorModel();
  const InitialValueProblem_t& ivp = model.problem();
  const Eigen::Index d = prior.spatialDimension();
  const Eigen::Index n = prior.stateDimension();

  const GaussianBelief stationary = GaussianBelief::fromCovariance(Vector::Zero(n), prior.stationaryCovariance());

  Matrix observationMatrix(2 * d, n);
  observationMatrix << model.valueProjection(), model.derivativeProjection();
  Vector observed(2 * d);
  observed << ivp.y0, model.evaluateField(ivp.t0, ivp.y0);
  const Matrix noise = Matrix::Identity(2 * d, 2 * d) * model.tolerance().jitter;

  GaussianBelief out = stationary.conditionOn(observationMatrix, noise, observed, model.tolerance()).belief;
  if (auto logger = Logger::GetClass("OdeFilter")) {
    logger->debug("initialBelief: {} prior order {} dim {} at t0 {:.6g}", prior.name(), prior.order(), n, ivp.t0);
  }
  return out;
}

OdeFilter::OdeFilter(std::shared_ptr<const StochasticPrior> priorInput,
                     std::shared_ptr<const MeasurementModel> measurementModelInput,
                     FilterOptions_t optionsInput)
    : prior(std::move(priorInput)), measurementModel(std::move(measurementModelInput)), options(optionsInput) {
  if (!prior || !measurementModel) {
    throw PnodeError("OdeFilter: prior and measurement model are required");
  }
  if (measurementModel->priorModel().stateDimension() != prior->stateDimension()) {
    throw DimensionMismatchError(fmt::format("OdeFilter: measurement model built for state dimension {}, prior has {}",
                                             measurementModel->priorModel().stateDimension(),
                                             prior->stateDimension()));
  }
  if (auto logger = Logger::GetClass("OdeFilter")) {
    logger->info("OdeFilter created: prior {} (q = {}, d = {}), measurement {}, {} diffusion",
                 prior->name(),
                 prior->order(),
                 prior->spatialDimension(),
                 measurementModel->name(),
                 options.diffusionModel == DiffusionModel_e::kDynamic ? "dynamic" : "constant");
  }
}

OdeFilter::OdeFilter(std::shared_ptr<const StochasticPrior> priorInput,
                     std::shared_ptr<const MeasurementModel> measurementModelInput,
                     const std::vector<double>& gridInput,
                     FilterOptions_t optionsInput)
    : OdeFilter(std::move(priorInput), std::move(measurementModelInput), optionsInput) {
  grid = TimeGrid(gridInput);
}

double OdeFilter::currentTime() const {
  if (filterResult.steps.empty()) {
    throw PnodeError("OdeFilter: not initialised");
  }
  return filterResult.steps.back().time;
}

void OdeFilter::initialize(double t0, const GaussianBelief& initial) {
  if (!std::isfinite(t0)) {
    throw InvalidStepSizeError(fmt::format("OdeFilter: non-finite t0 = {}", t0));
  }
  if (initial.dimension() != prior->stateDimension()) {
    throw DimensionMismatchError(fmt::format("OdeFilter: initial belief of dimension {}, prior state dimension {}",
                                             initial.dimension(),
                                             prior->stateDimension()));
  }

  filterResult = FilterResult_t{};
  FilterStep_t first;
  first.time = t0;
  first.filtered = initial;
  first.predicted = initial;
  filterResult.steps.push_back(std::move(first));
  filterState = FilterState_e::kPredicting;
}

const FilterStep_t& OdeFilter::step(double tNext) {
  if (filterState != FilterState_e::kPredicting) {
    throw PnodeError("OdeFilter: step() requires an initialised, unfinished filter");
  }
  const std::size_t index = filterResult.steps.size();
  const FilterStep_t& previous = filterResult.steps.back();
  TimeGrid::validateStep(previous.time, tNext);

  const NumericalTolerance_t& tolerance = options.tolerance;
  FilterStep_t next;
  next.time = tNext;
  try {
    DiscreteTransition_t transition = prior->discretize(tNext - previous.time);
    GaussianBelief predicted = previous.filtered.marginalizeFactored(transition.transition, transition.processNoiseFactor);

    filterState = FilterState_e::kUpdating;
    Linearization_t linearization = measurementModel->linearize(predicted, tNext);

    double diffusion = 1.0;
    if (options.diffusionModel == DiffusionModel_e::kDynamic) {
      diffusion = estimateLocalDiffusion(predicted, linearization, tolerance);
      transition.processNoise *= diffusion;
      transition.processNoiseFactor *= std::sqrt(diffusion);
      predicted = previous.filtered.marginalizeFactored(transition.transition, transition.processNoiseFactor);
      linearization = measurementModel->linearize(predicted, tNext);
    }

    const Matrix& observationMatrix = linearization.observationMatrix;
    const Vector observed = observationMatrix * predicted.mean() - linearization.predictedObservation;
    ConditionResult_t update =
        predicted.conditionOn(observationMatrix, linearization.observationNoise, observed, tolerance);
    if (!update.belief.mean().allFinite() || !update.belief.covarianceFactor().allFinite()) {
      throw FilterDivergenceError(index, tNext, "non-finite posterior");
    }

    next.localError = (observationMatrix * transition.processNoiseFactor).rowwise().norm();
    next.filtered = std::move(update.belief);
    next.predicted = std::move(predicted);
    next.hasTransition = true;
    next.transition = std::move(transition);
    next.gain = std::move(update.gain);
    next.innovation = std::move(update.innovation);
    next.innovationFactor = std::move(update.innovationFactor);
    next.diffusion = diffusion;
  } catch (const SingularCovarianceError& ex) {
    filterResult = FilterResult_t{};
    filterState = FilterState_e::kUninitialized;
    if (auto logger = Logger::GetClass("OdeFilter")) {
      logger->error("OdeFilter diverged at step {} t {:.6g}: {}", index, tNext, ex.what());
    }
    throw FilterDivergenceError(index, tNext, ex.what());
  } catch (const FilterDivergenceError& ex) {
    filterResult = FilterResult_t{};
    filterState = FilterState_e::kUninitialized;
    if (auto logger = Logger::GetClass("OdeFilter")) {
      logger->error("{}", ex.what());
    }
    throw;
  } catch (const std::exception& ex) {
    filterResult = FilterResult_t{};
    filterState = FilterState_e::kUninitialized;
    if (auto logger = Logger::GetClass("OdeFilter")) {
      logger->error("OdeFilter step {} t {:.6g} failed: {}", index, tNext, ex.what());
    }
    throw;
  }

  InnovationRecord_t record;
  record.index = index;
  record.time = tNext;
  record.innovation = next.innovation;
  record.innovationFactor = next.innovationFactor;
  filterResult.innovations.push_back(std::move(record));

  if ((index % kLogEvery) == 1) {
    if (auto logger = Logger::GetClass("OdeFilter")) {
      logger->debug("OdeFilter step {} t {:.6g} h {:.3e} |r| {:.3e} local error {:.3e} diffusion {:.3e}",
                    index,
                    tNext,
                    next.transition.step,
                    next.innovation.norm(),
                    next.localError.norm(),
                    next.diffusion);
    }
  }

  filterResult.steps.push_back(std::move(next));
  filterState = FilterState_e::kPredicting;
  return filterResult.steps.back();
}

const FilterResult_t& OdeFilter::run(const GaussianBelief& initial) {
  if (grid.empty()) {
    throw PnodeError("OdeFilter: run() requires a grid given at construction");
  }
  initialize(grid.front(), initial);
  for (std::size_t i = 1; i < grid.size(); ++i) {
    step(grid[i]);
  }
  finish();
  return filterResult;
}

void OdeFilter::finish() {
  if (filterState != FilterState_e::kPredicting) {
    throw PnodeError("OdeFilter: finish() requires an initialised filter");
  }
  filterState = FilterState_e::kDone;
  if (auto logger = Logger::GetClass("OdeFilter")) {
    logger->info("OdeFilter done: {} grid points, t in [{:.6g}, {:.6g}]",
                 filterResult.steps.size(),
                 filterResult.steps.front().time,
                 filterResult.steps.back().time);
  }
}

FilterResult_t OdeFilter::release() {
  if (filterState != FilterState_e::kDone) {
    throw PnodeError("OdeFilter: release() requires a finished filter");
  }
  FilterResult_t out = std::move(filterResult);
  filterResult = FilterResult_t{};
  filterState = FilterState_e::kUninitialized;
  return out;
}

} // namespace pnode
