#include "pnode/pipeline/SolvePipeline.hpp"

#include <algorithm>

#include <fmt/core.h>

#include "pnode/core/Errors.hpp"
#include "pnode/core/Logger.hpp"
#include "pnode/core/TimeGrid.hpp"
#include "pnode/filtsmooth/OdeFilter.hpp"
#include "pnode/filtsmooth/RtsSmoother.hpp"

namespace pnode {

namespace {

const char* calibrationName(CalibrationMode_e mode) {
  switch (mode) {
    case CalibrationMode_e::kNone:
      return "none";
    case CalibrationMode_e::kGlobal:
      return "global";
    case CalibrationMode_e::kPerDimension:
      return "dimension";
  }
  return "unknown";
}

std::vector<TimedBelief_t> filteredBeliefs(const FilterResult_t& result) {
  std::vector<TimedBelief_t> out;
  out.reserve(result.steps.size());
  for (const FilterStep_t& step : result.steps) {
    out.push_back(TimedBelief_t{step.time, step.filtered});
  }
  return out;
}

} // namespace

SolvePipeline::SolvePipeline(SolverConfig_t config) : solverConfig(std::move(config)) {
  // Dynamic diffusion already scales every step; a post-hoc fit would count it twice.
  if (solverConfig.filter.diffusionModel == DiffusionModel_e::kDynamic &&
      solverConfig.calibration != CalibrationMode_e::kNone) {
    if (auto logger = Logger::GetClass("SolvePipeline")) {
      logger->warn("SolvePipeline: {} calibration ignored with dynamic diffusion",
                   calibrationName(solverConfig.calibration));
    }
    solverConfig.calibration = CalibrationMode_e::kNone;
  }
  if (auto logger = Logger::GetClass("SolvePipeline")) {
    logger->info("SolvePipeline created: prior {}({}), measurement {}, smoothing {}, calibration {}",
                 solverConfig.prior.type,
                 solverConfig.prior.order,
                 solverConfig.measurement.type,
                 solverConfig.smoothing,
                 calibrationName(solverConfig.calibration));
  }
}

SolveOutput_t SolvePipeline::run(const InitialValueProblem_t& problem) const {
  return run(problem, TimeGrid::uniform(problem.t0, problem.tmax, solverConfig.step).values());
}

SolveOutput_t SolvePipeline::run(const InitialValueProblem_t& problem, const std::vector<double>& grid) const {
  if (!grid.empty() && grid.front() != problem.t0) {
    throw InvalidStepSizeError(
        fmt::format("SolvePipeline: grid starts at {} but the problem starts at {}", grid.front(), problem.t0));
  }

  const int spatialDimension = static_cast<int>(problem.y0.size());
  std::shared_ptr<const StochasticPrior> prior = createPrior(solverConfig.prior, spatialDimension);
  std::shared_ptr<const MeasurementModel> model =
      createMeasurementModel(solverConfig.measurement, prior, problem, solverConfig.filter.tolerance);

  OdeFilter filter(prior, model, grid, solverConfig.filter);
  filter.run(initialBelief(*model));
  const FilterResult_t result = filter.release();

  std::vector<TimedBelief_t> beliefs;
  if (solverConfig.smoothing) {
    RtsSmoother smoother(solverConfig.filter.tolerance);
    beliefs = smoother.smooth(result);
  } else {
    beliefs = filteredBeliefs(result);
  }

  SolveDiagnostics_t diagnostics;
  diagnostics.calibration =
      estimateDiffusion(result.innovations, solverConfig.calibration, model->observationDimension());
  beliefs = calibrate(beliefs, diagnostics.calibration, *prior);
  diagnostics.steps = result.innovations.size();
  if (!result.innovations.empty()) {
    diagnostics.finalResidualNorm = result.innovations.back().innovation.norm();
  }

  std::vector<double> diffusions;
  diffusions.reserve(result.steps.size());
  for (const FilterStep_t& step : result.steps) {
    diffusions.push_back(step.diffusion);
    if (step.hasTransition) {
      diagnostics.maxLocalError = std::max(diagnostics.maxLocalError, step.localError.maxCoeff());
    }
  }

  OdeSolution solution(prior, std::move(beliefs), solverConfig.smoothing, solverConfig.filter.tolerance);
  solution.setProcessNoiseScaling(std::move(diffusions), stateScales(diagnostics.calibration, *prior));

  if (auto logger = Logger::GetClass("SolvePipeline")) {
    logger->info("SolvePipeline '{}' done: {} steps, sigma^2 {:.3e}, |r_N| {:.3e}, max local error {:.3e}",
                 problem.name,
                 diagnostics.steps,
                 diagnostics.calibration.scale,
                 diagnostics.finalResidualNorm,
                 diagnostics.maxLocalError);
  }
  return SolveOutput_t{std::move(solution), diagnostics};
}

} // namespace pnode
