#pragma once

#include <nlohmann/json.hpp>

#include "pnode/core/LinearAlgebra.hpp"
#include "pnode/core/Types.hpp"

namespace pnode {

struct ConditionResult_t;

// Multivariate normal belief stored as mean and lower-triangular Cholesky
// factor L, with covariance L L^T.
class GaussianBelief {
public:
  GaussianBelief() = default;
  GaussianBelief(Vector mean, Matrix covarianceFactor);

  static GaussianBelief fromCovariance(const Vector& mean, const Matrix& covariance);

  Eigen::Index dimension() const { return meanValue.size(); }
  const Vector& mean() const { return meanValue; }
  const Matrix& covarianceFactor() const { return factor; }
  Matrix covariance() const;
  Vector standardDeviation() const;

  // Prediction through x' = A x + w, w ~ N(0, Q).
  GaussianBelief marginalize(const Matrix& transition, const Matrix& processNoise) const;
  GaussianBelief marginalizeFactored(const Matrix& transition, const Matrix& processNoiseFactor) const;

  // Kalman update on y = H x + v, v ~ N(0, R).
  ConditionResult_t conditionOn(const Matrix& observationMatrix,
                                const Matrix& observationNoise,
                                const Vector& observedValue,
                                const NumericalTolerance_t& tolerance = {}) const;

  // Same mean, covariance multiplied by varianceScale.
  GaussianBelief scaled(double varianceScale) const;
  // Same mean, covariance D P D with D = diag(stdScales).
  GaussianBelief scaled(const Vector& stdScales) const;

private:
  Vector meanValue;
  Matrix factor;
};

struct ConditionResult_t {
  GaussianBelief belief;
  Matrix gain;
  Vector innovation;
  // Lower Cholesky factor of the innovation covariance H P H^T + R.
  Matrix innovationFactor;
};

void to_json(nlohmann::json& node, const GaussianBelief& belief);
void from_json(const nlohmann::json& node, GaussianBelief& belief);

} // namespace pnode
