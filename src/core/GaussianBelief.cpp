#include "pnode/core/GaussianBelief.hpp"

#include <cmath>

#include <fmt/core.h>

#include "pnode/core/Errors.hpp"

namespace pnode {

GaussianBelief::GaussianBelief(Vector mean, Matrix covarianceFactor)
    : meanValue(std::move(mean)), factor(std::move(covarianceFactor)) {
  if (factor.rows() != factor.cols() || factor.rows() != meanValue.size()) {
    throw DimensionMismatchError(fmt::format("GaussianBelief: mean of size {} with factor {}x{}",
                                             meanValue.size(),
                                             factor.rows(),
                                             factor.cols()));
  }
}

GaussianBelief GaussianBelief::fromCovariance(const Vector& mean, const Matrix& covariance) {
  if (covariance.rows() != mean.size() || covariance.cols() != mean.size()) {
    throw DimensionMismatchError(fmt::format("GaussianBelief: mean of size {} with covariance {}x{}",
                                             mean.size(),
                                             covariance.rows(),
                                             covariance.cols()));
  }
  return GaussianBelief(mean, choleskyFactor(covariance));
}

Matrix GaussianBelief::covariance() const {
  return factor * factor.transpose();
}

Vector GaussianBelief::standardDeviation() const {
  return factor.rowwise().norm();
}

GaussianBelief GaussianBelief::marginalize(const Matrix& transition, const Matrix& processNoise) const {
  if (processNoise.rows() != transition.rows() || processNoise.cols() != transition.rows()) {
    throw DimensionMismatchError(fmt::format("marginalize: transition {}x{} with process noise {}x{}",
                                             transition.rows(),
                                             transition.cols(),
                                             processNoise.rows(),
                                             processNoise.cols()));
  }
  return marginalizeFactored(transition, choleskyFactor(processNoise));
}

GaussianBelief GaussianBelief::marginalizeFactored(const Matrix& transition, const Matrix& processNoiseFactor) const {
  if (transition.cols() != dimension()) {
    throw DimensionMismatchError(fmt::format("marginalize: transition {}x{} applied to belief of dimension {}",
                                             transition.rows(),
                                             transition.cols(),
                                             dimension()));
  }
  if (processNoiseFactor.rows() != transition.rows()) {
    throw DimensionMismatchError(fmt::format("marginalize: process noise factor has {} rows, expected {}",
                                             processNoiseFactor.rows(),
                                             transition.rows()));
  }

  const Eigen::Index n = transition.rows();
  Matrix stacked(n, factor.cols() + processNoiseFactor.cols());
  stacked << transition * factor, processNoiseFactor;
  return GaussianBelief(transition * meanValue, triangularize(stacked));
}

ConditionResult_t GaussianBelief::conditionOn(const Matrix& observationMatrix,
                                              const Matrix& observationNoise,
                                              const Vector& observedValue,
                                              const NumericalTolerance_t& tolerance) const {
  const Eigen::Index n = dimension();
  const Eigen::Index m = observationMatrix.rows();
  if (observationMatrix.cols() != n) {
    throw DimensionMismatchError(fmt::format("conditionOn: observation matrix {}x{} for belief of dimension {}",
                                             m,
                                             observationMatrix.cols(),
                                             n));
  }
  if (observationNoise.rows() != m || observationNoise.cols() != m || observedValue.size() != m) {
    throw DimensionMismatchError(fmt::format("conditionOn: observation noise {}x{} and value of size {} for {} observations",
                                             observationNoise.rows(),
                                             observationNoise.cols(),
                                             observedValue.size(),
                                             m));
  }

  // Pre-array [[sqrt(R), H L], [0, L]] is reduced to [[sqrt(S), 0], [G, L+]].
  Matrix preArray = Matrix::Zero(m + n, m + n);
  preArray.topLeftCorner(m, m) = choleskyFactor(observationNoise);
  preArray.topRightCorner(m, n) = observationMatrix * factor;
  preArray.bottomRightCorner(n, n) = factor;
  const Matrix postArray = triangularize(preArray);

  const Matrix innovationFactor = postArray.topLeftCorner(m, m);
  const Matrix scaledGain = postArray.bottomLeftCorner(n, m);
  const Matrix posteriorFactor = postArray.bottomRightCorner(n, n);

  const double minDiag = minAbsDiagonal(innovationFactor);
  if (m > 0 && !(minDiag > tolerance.singularThreshold)) {
    throw SingularCovarianceError(
        fmt::format("conditionOn: innovation covariance factor diagonal {:.3e} below threshold {:.3e}",
                    minDiag,
                    tolerance.singularThreshold));
  }

  const Vector innovation = observedValue - observationMatrix * meanValue;
  const Vector whitened = innovationFactor.triangularView<Eigen::Lower>().solve(innovation);
  const Matrix gain =
      innovationFactor.transpose().triangularView<Eigen::Upper>().solve(scaledGain.transpose()).transpose();

  ConditionResult_t result;
  result.belief = GaussianBelief(meanValue + scaledGain * whitened, posteriorFactor);
  result.gain = gain;
  result.innovation = innovation;
  result.innovationFactor = innovationFactor;
  return result;
}

GaussianBelief GaussianBelief::scaled(double varianceScale) const {
  if (!(varianceScale >= 0.0) || !std::isfinite(varianceScale)) {
    throw PnodeError(fmt::format("GaussianBelief::scaled: invalid variance scale {}", varianceScale));
  }
  return GaussianBelief(meanValue, factor * std::sqrt(varianceScale));
}

GaussianBelief GaussianBelief::scaled(const Vector& stdScales) const {
  if (stdScales.size() != dimension()) {
    throw DimensionMismatchError(fmt::format("GaussianBelief::scaled: {} scales for dimension {}",
                                             stdScales.size(),
                                             dimension()));
  }
  return GaussianBelief(meanValue, stdScales.asDiagonal() * factor);
}

void to_json(nlohmann::json& node, const GaussianBelief& belief) {
  const Vector& mean = belief.mean();
  const Matrix& factor = belief.covarianceFactor();
  nlohmann::json meanNode = nlohmann::json::array();
  for (Eigen::Index i = 0; i < mean.size(); ++i) {
    meanNode.push_back(mean(i));
  }
  nlohmann::json factorNode = nlohmann::json::array();
  for (Eigen::Index r = 0; r < factor.rows(); ++r) {
    nlohmann::json row = nlohmann::json::array();
    for (Eigen::Index c = 0; c < factor.cols(); ++c) {
      row.push_back(factor(r, c));
    }
    factorNode.push_back(row);
  }
  node = nlohmann::json{{"mean", meanNode}, {"covarianceFactor", factorNode}};
}

void from_json(const nlohmann::json& node, GaussianBelief& belief) {
  const nlohmann::json& meanNode = node.at("mean");
  const nlohmann::json& factorNode = node.at("covarianceFactor");
  if (!meanNode.is_array() || !factorNode.is_array()) {
    throw DimensionMismatchError("GaussianBelief: 'mean' and 'covarianceFactor' must be arrays");
  }

  const auto n = static_cast<Eigen::Index>(meanNode.size());
  Vector mean(n);
  for (Eigen::Index i = 0; i < n; ++i) {
    mean(i) = meanNode[static_cast<std::size_t>(i)].get<double>();
  }
  if (static_cast<Eigen::Index>(factorNode.size()) != n) {
    throw DimensionMismatchError(fmt::format("GaussianBelief: factor has {} rows, mean has {} entries",
                                             factorNode.size(),
                                             n));
  }
  Matrix factor(n, n);
  for (Eigen::Index r = 0; r < n; ++r) {
    const nlohmann::json& row = factorNode[static_cast<std::size_t>(r)];
    if (!row.is_array() || static_cast<Eigen::Index>(row.size()) != n) {
      throw DimensionMismatchError(fmt::format("GaussianBelief: factor row {} is not of length {}", r, n));
    }
    for (Eigen::Index c = 0; c < n; ++c) {
      factor(r, c) = row[static_cast<std::size_t>(c)].get<double>();
    }
  }
  belief = GaussianBelief(std::move(mean), std::move(factor));
}

} // namespace pnode
