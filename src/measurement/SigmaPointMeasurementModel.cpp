#include "pnode/measurement/SigmaPointMeasurementModel.hpp"

#include <cmath>

#include <fmt/core.h>

#include "pnode/core/Errors.hpp"
#include "pnode/core/Logger.hpp"

namespace pnode {

Linearization_t SigmaPointMeasurementModel::linearize(const GaussianBelief& belief, double t) const {
  checkBelief(belief);
  const Eigen::Index n = belief.dimension();
  const Eigen::Index m = observationDimension();
  const Vector& mean = belief.mean();
  const Matrix& factor = belief.covarianceFactor();

  const SigmaPoints_t points = sigmaPoints(n);
  const Eigen::Index count = points.unitPoints.cols();
  const Matrix offsets = factor * points.unitPoints;

  Matrix observations(m, count);
  for (Eigen::Index i = 0; i < count; ++i) {
    observations.col(i) = residual(t, mean + offsets.col(i));
  }
  const Vector predicted = observations * points.meanWeights;
  const Matrix deviations = observations.colwise() - predicted;

  const Matrix weightedDeviations = deviations * points.covarianceWeights.asDiagonal();
  const Matrix observationCov = symmetrize(weightedDeviations * deviations.transpose());
  const Matrix crossCov = offsets * weightedDeviations.transpose();

  // H^T = P^-1 C_xz; a degenerate factor is regularised with the jitter.
  Matrix solveFactor = factor;
  if (!(minAbsDiagonal(factor) > tol.singularThreshold)) {
    solveFactor = choleskyFactor(belief.covariance() + Matrix::Identity(n, n) * tol.jitter);
    if (auto logger = Logger::GetClass("MeasurementModel")) {
      logger->debug("{} linearize t {:.6g}: degenerate covariance factor, regularised with jitter {:.3e}",
                    name(),
                    t,
                    tol.jitter);
    }
  }
  const Matrix observationMatrix = solveWithFactor(solveFactor, crossCov, tol).transpose();

  Linearization_t out;
  out.observationMatrix = observationMatrix;
  out.observationNoise =
      symmetrize(observationCov - observationMatrix * crossCov) + Matrix::Identity(m, m) * tol.jitter;
  out.predictedObservation = predicted;
  return out;
}

UnscentedMeasurementModel::UnscentedMeasurementModel(std::shared_ptr<const StochasticPrior> prior,
                                                     InitialValueProblem_t problem,
                                                     double alphaInput,
                                                     double betaInput,
                                                     double kappaInput,
                                                     NumericalTolerance_t tolerance)
    : SigmaPointMeasurementModel(std::move(prior), std::move(problem), tolerance),
      alpha(alphaInput),
      beta(betaInput),
      kappa(kappaInput) {
  const double n = static_cast<double>(priorModel().stateDimension());
  if (!(alpha > 0.0) || !(alpha * alpha * (n + kappa) > 0.0)) {
    throw PnodeError(fmt::format("UnscentedMeasurementModel: invalid parameters alpha {} kappa {}", alpha, kappa));
  }
}

SigmaPoints_t UnscentedMeasurementModel::sigmaPoints(Eigen::Index dimension) const {
  const double n = static_cast<double>(dimension);
  const double lambda = alpha * alpha * (n + kappa) - n;
  const double scale = std::sqrt(n + lambda);

  SigmaPoints_t out;
  out.unitPoints = Matrix::Zero(dimension, 2 * dimension + 1);
  for (Eigen::Index i = 0; i < dimension; ++i) {
    out.unitPoints(i, i + 1) = scale;
    out.unitPoints(i, i + 1 + dimension) = -scale;
  }
  out.meanWeights = Vector::Constant(2 * dimension + 1, 1.0 / (2.0 * (n + lambda)));
  out.covarianceWeights = out.meanWeights;
  out.meanWeights(0) = lambda / (n + lambda);
  out.covarianceWeights(0) = out.meanWeights(0) + (1.0 - alpha * alpha + beta);
  return out;
}

SigmaPoints_t CubatureMeasurementModel::sigmaPoints(Eigen::Index dimension) const {
  const double n = static_cast<double>(dimension);
  const double scale = std::sqrt(n);

  SigmaPoints_t out;
  out.unitPoints = Matrix::Zero(dimension, 2 * dimension);
  for (Eigen::Index i = 0; i < dimension; ++i) {
    out.unitPoints(i, i) = scale;
    out.unitPoints(i, i + dimension) = -scale;
  }
  out.meanWeights = Vector::Constant(2 * dimension, 1.0 / (2.0 * n));
  out.covarianceWeights = out.meanWeights;
  return out;
}

} // namespace pnode
