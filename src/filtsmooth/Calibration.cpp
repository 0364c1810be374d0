#include "pnode/filtsmooth/Calibration.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <fmt/core.h>

#include "pnode/core/Errors.hpp"
#include "pnode/core/Logger.hpp"

namespace pnode {

namespace {

// Scales are kept strictly positive so a calibrated covariance never collapses.
constexpr double kMinimumScale = std::numeric_limits<double>::min();

} // namespace

CalibrationResult_t estimateDiffusion(const std::vector<InnovationRecord_t>& innovations,
                                      CalibrationMode_e mode,
                                      Eigen::Index observationDimension) {
  CalibrationResult_t out;
  out.mode = mode;
  out.dimensionScales = Vector::Ones(observationDimension);
  if (mode == CalibrationMode_e::kNone || innovations.empty()) {
    return out;
  }

  double whitenedSum = 0.0;
  Vector perDimensionSum = Vector::Zero(observationDimension);
  for (const InnovationRecord_t& record : innovations) {
    if (record.innovation.size() != observationDimension || record.innovationFactor.rows() != observationDimension ||
        record.innovationFactor.cols() != observationDimension) {
      throw DimensionMismatchError(fmt::format("estimateDiffusion: innovation {} has size {}, expected {}",
                                               record.index,
                                               record.innovation.size(),
                                               observationDimension));
    }
    const Vector whitened = record.innovationFactor.triangularView<Eigen::Lower>().solve(record.innovation);
    whitenedSum += whitened.squaredNorm();

    const Vector variances = record.innovationFactor.rowwise().squaredNorm();
    perDimensionSum += record.innovation.cwiseAbs2().cwiseQuotient(variances);
  }

  const auto count = static_cast<double>(innovations.size());
  out.sampleCount = innovations.size();
  if (mode == CalibrationMode_e::kGlobal) {
    out.scale = std::max(whitenedSum / (count * static_cast<double>(observationDimension)), kMinimumScale);
    out.dimensionScales = Vector::Constant(observationDimension, out.scale);
  } else {
    out.dimensionScales = (perDimensionSum / count).cwiseMax(kMinimumScale);
    out.scale = out.dimensionScales.mean();
  }
  if (!std::isfinite(out.scale) || !out.dimensionScales.allFinite()) {
    throw SingularCovarianceError("estimateDiffusion: non-finite diffusion estimate");
  }

  if (auto logger = Logger::GetClass("Calibration")) {
    logger->debug("estimateDiffusion: {} innovations, sigma^2 {:.6e}", innovations.size(), out.scale);
  }
  return out;
}

Vector stateScales(const CalibrationResult_t& calibration, const StochasticPrior& prior) {
  const int blockSize = prior.order() + 1;
  Vector scales = Vector::Ones(prior.stateDimension());
  if (calibration.mode == CalibrationMode_e::kNone) {
    return scales;
  }
  if (calibration.dimensionScales.size() != prior.spatialDimension()) {
    throw DimensionMismatchError(fmt::format("stateScales: {} dimension scales for spatial dimension {}",
                                             calibration.dimensionScales.size(),
                                             prior.spatialDimension()));
  }
  for (int k = 0; k < prior.spatialDimension(); ++k) {
    scales.segment(k * blockSize, blockSize).setConstant(std::sqrt(calibration.dimensionScales(k)));
  }
  return scales;
}

std::vector<TimedBelief_t> calibrate(const std::vector<TimedBelief_t>& beliefs,
                                     const CalibrationResult_t& calibration,
                                     const StochasticPrior& prior) {
  const Vector scales = stateScales(calibration, prior);
  std::vector<TimedBelief_t> out;
  out.reserve(beliefs.size());
  for (const TimedBelief_t& entry : beliefs) {
    out.push_back(TimedBelief_t{entry.time, entry.belief.scaled(scales)});
  }
  return out;
}

std::vector<TimedBelief_t> calibrate(const std::vector<TimedBelief_t>& beliefs,
                                     const std::vector<InnovationRecord_t>& innovations,
                                     const StochasticPrior& prior,
                                     CalibrationMode_e mode) {
  return calibrate(beliefs, estimateDiffusion(innovations, mode, prior.spatialDimension()), prior);
}

} // namespace pnode
