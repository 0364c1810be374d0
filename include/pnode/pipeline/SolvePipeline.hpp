#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "pnode/filtsmooth/Calibration.hpp"
#include "pnode/filtsmooth/OdeSolution.hpp"
#include "pnode/measurement/OdeProblem.hpp"
#include "pnode/pipeline/SolverFactory.hpp"

namespace pnode {

struct SolveDiagnostics_t {
  CalibrationResult_t calibration;
  // |r| of the last update.
  double finalResidualNorm = 0.0;
  double maxLocalError = 0.0;
  std::size_t steps = 0;
};

struct SolveOutput_t {
  OdeSolution solution;
  SolveDiagnostics_t diagnostics;
};

// Chains initial belief, forward filter, optional smoother and calibration.
class SolvePipeline {
public:
  // With dynamic diffusion the calibration mode is forced to kNone.
  explicit SolvePipeline(SolverConfig_t config);

  // Uniform grid over [t0, tmax] with the configured step.
  SolveOutput_t run(const InitialValueProblem_t& problem) const;
  // The grid must start at problem.t0 and increase strictly.
  SolveOutput_t run(const InitialValueProblem_t& problem, const std::vector<double>& grid) const;

  const SolverConfig_t& config() const { return solverConfig; }

private:
  SolverConfig_t solverConfig;
};

} // namespace pnode
