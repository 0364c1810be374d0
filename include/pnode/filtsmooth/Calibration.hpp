#pragma once

#include <cstddef>
#include <vector>

#include "pnode/filtsmooth/OdeFilter.hpp"
#include "pnode/filtsmooth/RtsSmoother.hpp"
#include "pnode/prior/StochasticPrior.hpp"

namespace pnode {

enum class CalibrationMode_e {
  kNone,
  // One scale for the whole diffusion.
  kGlobal,
  // One scale per ODE component.
  kPerDimension
};

struct CalibrationResult_t {
  CalibrationMode_e mode = CalibrationMode_e::kNone;
  // Global sigma^2 (mean of the per-dimension scales in kPerDimension mode).
  double scale = 1.0;
  // sigma_k^2 per ODE component; all equal to `scale` in kGlobal mode.
  Vector dimensionScales;
  std::size_t sampleCount = 0;
};

// Maximum-likelihood diffusion from the whitened innovations
// chol(S_i)^-1 r_i of the forward pass. Pure function of its input.
CalibrationResult_t estimateDiffusion(const std::vector<InnovationRecord_t>& innovations,
                                      CalibrationMode_e mode,
                                      Eigen::Index observationDimension);

// Per-state standard-deviation multipliers sqrt(sigma_k^2), repeated over
// the q + 1 derivatives of component k.
Vector stateScales(const CalibrationResult_t& calibration, const StochasticPrior& prior);

// Rescales covariances (means unchanged) by a fitted calibration.
std::vector<TimedBelief_t> calibrate(const std::vector<TimedBelief_t>& beliefs,
                                     const CalibrationResult_t& calibration,
                                     const StochasticPrior& prior);

// estimateDiffusion followed by the rescaling above.
std::vector<TimedBelief_t> calibrate(const std::vector<TimedBelief_t>& beliefs,
                                     const std::vector<InnovationRecord_t>& innovations,
                                     const StochasticPrior& prior,
                                     CalibrationMode_e mode = CalibrationMode_e::kGlobal);

} // namespace pnode
