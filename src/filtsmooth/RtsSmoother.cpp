#include "pnode/filtsmooth/RtsSmoother.hpp"

#include <fmt/core.h>

#include "pnode/core/Errors.hpp"
#include "pnode/core/Logger.hpp"

namespace pnode {

RtsSmoother::RtsSmoother(NumericalTolerance_t toleranceInput) : tolerance(toleranceInput) {}

std::vector<TimedBelief_t> RtsSmoother::smooth(const FilterResult_t& result) const {
  const std::vector<FilterStep_t>& steps = result.steps;
  std::vector<TimedBelief_t> out(steps.size());
  if (steps.empty()) {
    return out;
  }

  const std::size_t last = steps.size() - 1;
  out[last] = TimedBelief_t{steps[last].time, steps[last].filtered};
  for (std::size_t i = last; i-- > 0;) {
    const FilterStep_t& next = steps[i + 1];
    if (!next.hasTransition) {
      throw PnodeError(fmt::format("RtsSmoother: grid point {} carries no transition", i + 1));
    }
    out[i] = TimedBelief_t{steps[i].time,
                           smoothingStep(steps[i].filtered, next.predicted, next.transition, out[i + 1].belief)};
  }

  if (auto logger = Logger::GetClass("RtsSmoother")) {
    logger->debug("RtsSmoother: smoothed {} grid points", steps.size());
  }
  return out;
}

GaussianBelief RtsSmoother::smoothingStep(const GaussianBelief& filtered,
                                          const GaussianBelief& predicted,
                                          const DiscreteTransition_t& transition,
                                          const GaussianBelief& smoothedNext) const {
  const Eigen::Index n = filtered.dimension();
  const Matrix& a = transition.transition;
  if (a.rows() != n || a.cols() != n || predicted.dimension() != n || smoothedNext.dimension() != n ||
      transition.processNoiseFactor.rows() != n) {
    throw DimensionMismatchError(
        fmt::format("RtsSmoother: inconsistent dimensions (belief {}, transition {}x{}, predicted {}, next {})",
                    n,
                    a.rows(),
                    a.cols(),
                    predicted.dimension(),
                    smoothedNext.dimension()));
  }

  const Matrix& filteredFactor = filtered.covarianceFactor();
  const Matrix crossCov = a * (filteredFactor * filteredFactor.transpose());

  // G^T = P_pred^-1 A P_filt, regularised when the predicted factor is degenerate.
  Matrix predictedFactor = predicted.covarianceFactor();
  if (!(minAbsDiagonal(predictedFactor) > tolerance.singularThreshold)) {
    predictedFactor = choleskyFactor(predicted.covariance() + Matrix::Identity(n, n) * tolerance.jitter);
    if (auto logger = Logger::GetClass("RtsSmoother")) {
      logger->debug("RtsSmoother: degenerate predicted covariance, regularised with jitter {:.3e}", tolerance.jitter);
    }
  }
  const Matrix gain = solveWithFactor(predictedFactor, crossCov, tolerance).transpose();

  const Vector mean = filtered.mean() + gain * (smoothedNext.mean() - predicted.mean());

  // (I - G A) P_f (I - G A)^T + G Q G^T + G P_s' G^T, assembled from factors.
  Matrix stacked(n, 3 * n);
  stacked << (Matrix::Identity(n, n) - gain * a) * filteredFactor, gain * transition.processNoiseFactor,
      gain * smoothedNext.covarianceFactor();
  return GaussianBelief(mean, triangularize(stacked));
}

} // namespace pnode
