#pragma once

#include "pnode/measurement/MeasurementModel.hpp"

namespace pnode {

// Unit sigma points xi_i (columns) with mean and covariance weights; the
// points used are m + L xi_i for a belief N(m, L L^T).
struct SigmaPoints_t {
  Matrix unitPoints;
  Vector meanWeights;
  Vector covarianceWeights;
};

// Statistical linearisation of the ODE residual through deterministic
// sigma points: H = C_xz^T P^-1 and R = S_zz - H C_xz + jitter I.
class SigmaPointMeasurementModel : public MeasurementModel {
public:
  using MeasurementModel::MeasurementModel;

  Linearization_t linearize(const GaussianBelief& belief, double t) const override;

  virtual SigmaPoints_t sigmaPoints(Eigen::Index dimension) const = 0;
};

class UnscentedMeasurementModel final : public SigmaPointMeasurementModel {
public:
  UnscentedMeasurementModel(std::shared_ptr<const StochasticPrior> prior,
                            InitialValueProblem_t problem,
                            double alpha = 1.0,
                            double beta = 2.0,
                            double kappa = 1.0,
                            NumericalTolerance_t tolerance = {});

  SigmaPoints_t sigmaPoints(Eigen::Index dimension) const override;
  std::string name() const override { return "UKF"; }

private:
  double alpha = 1.0;
  double beta = 2.0;
  double kappa = 1.0;
};

// Spherical-radial cubature rule: 2n equally weighted points.
class CubatureMeasurementModel final : public SigmaPointMeasurementModel {
public:
  using SigmaPointMeasurementModel::SigmaPointMeasurementModel;

  SigmaPoints_t sigmaPoints(Eigen::Index dimension) const override;
  std::string name() const override { return "CKF"; }
};

} // namespace pnode
