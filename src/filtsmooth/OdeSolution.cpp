#include "pnode/filtsmooth/OdeSolution.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/core.h>

#include "pnode/core/Errors.hpp"

namespace pnode {

namespace {

std::vector<double> timesOf(const std::vector<TimedBelief_t>& beliefs) {
  std::vector<double> times;
  times.reserve(beliefs.size());
  for (const TimedBelief_t& entry : beliefs) {
    times.push_back(entry.time);
  }
  return times;
}

} // namespace

OdeSolution::OdeSolution(std::shared_ptr<const StochasticPrior> priorInput,
                         std::vector<TimedBelief_t> beliefs,
                         bool smoothedInput,
                         NumericalTolerance_t tolerance)
    : prior(std::move(priorInput)),
      entries(std::move(beliefs)),
      timeGrid(timesOf(entries)),
      smoothed(smoothedInput),
      smoother(tolerance) {
  if (!prior) {
    throw PnodeError("OdeSolution: prior is required");
  }
  for (const TimedBelief_t& entry : entries) {
    if (entry.belief.dimension() != prior->stateDimension()) {
      throw DimensionMismatchError(fmt::format("OdeSolution: belief at t {} has dimension {}, prior expects {}",
                                               entry.time,
                                               entry.belief.dimension(),
                                               prior->stateDimension()));
    }
  }
  diffusions.assign(entries.size(), 1.0);
  noiseScales = Vector::Ones(prior->stateDimension());
}

void OdeSolution::setProcessNoiseScaling(std::vector<double> intervalDiffusions, Vector stateScales) {
  if (intervalDiffusions.size() != entries.size() || stateScales.size() != prior->stateDimension()) {
    throw DimensionMismatchError(fmt::format("OdeSolution: {} diffusions / {} scales for {} points of dimension {}",
                                             intervalDiffusions.size(),
                                             stateScales.size(),
                                             entries.size(),
                                             prior->stateDimension()));
  }
  diffusions = std::move(intervalDiffusions);
  noiseScales = std::move(stateScales);
}

DiscreteTransition_t OdeSolution::scaledTransition(std::size_t interval, double step) const {
  DiscreteTransition_t transition = prior->discretize(step);
  const Vector scales = noiseScales * std::sqrt(diffusions[interval]);
  transition.processNoiseFactor = scales.asDiagonal() * transition.processNoiseFactor;
  transition.processNoise = scales.asDiagonal() * transition.processNoise * scales.asDiagonal();
  return transition;
}

GaussianBelief OdeSolution::interpolate(double t) const {
  if (!std::isfinite(t) || t < timeGrid.front()) {
    throw InvalidStepSizeError(fmt::format("OdeSolution: t = {} outside [{}, inf)", t, timeGrid.front()));
  }
  const std::size_t index = timeGrid.locate(t);
  const TimedBelief_t& left = entries[index];
  if (t == left.time) {
    return left.belief;
  }

  const std::size_t last = entries.size() - 1;
  // The interval (t_i, t_{i+1}] uses the diffusion of step i + 1.
  const std::size_t interval = std::min(index + 1, last);
  const DiscreteTransition_t toT = scaledTransition(interval, t - left.time);
  const GaussianBelief predicted = left.belief.marginalizeFactored(toT.transition, toT.processNoiseFactor);
  if (index == last || !smoothed) {
    return predicted;
  }

  const TimedBelief_t& right = entries[index + 1];
  const DiscreteTransition_t toRight = scaledTransition(interval, right.time - t);
  const GaussianBelief predictedRight = predicted.marginalizeFactored(toRight.transition, toRight.processNoiseFactor);
  return smoother.smoothingStep(predicted, predictedRight, toRight, right.belief);
}

GaussianBelief OdeSolution::solutionBelief(double t) const {
  const GaussianBelief full = interpolate(t);
  const Matrix e0 = prior->projection(0);
  return GaussianBelief(e0 * full.mean(), triangularize(e0 * full.covarianceFactor()));
}

Vector OdeSolution::solutionMean(double t) const {
  return prior->projection(0) * interpolate(t).mean();
}

Vector OdeSolution::solutionStdDev(double t) const {
  return solutionBelief(t).standardDeviation();
}

} // namespace pnode
