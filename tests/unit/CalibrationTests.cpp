#include <cmath>
#include <limits>
#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "pnode/core/Errors.hpp"
#include "pnode/core/TimeGrid.hpp"
#include "pnode/filtsmooth/Calibration.hpp"
#include "pnode/filtsmooth/RtsSmoother.hpp"
#include "pnode/measurement/TaylorMeasurementModel.hpp"
#include "pnode/prior/IntegratedWienerProcess.hpp"
#include "pnode/problems/Problems.hpp"

namespace {

pnode::InnovationRecord_t makeRecord(std::size_t index, const pnode::Vector& innovation, const pnode::Matrix& factor) {
  pnode::InnovationRecord_t record;
  record.index = index;
  record.time = 0.1 * static_cast<double>(index);
  record.innovation = innovation;
  record.innovationFactor = factor;
  return record;
}

pnode::FilterResult_t runFilter(double diffusion) {
  const pnode::InitialValueProblem_t problem = pnode::problems::exponentialDecay();
  auto prior = std::make_shared<pnode::IntegratedWienerProcess>(1, 1, diffusion);
  auto model = std::make_shared<pnode::TaylorMeasurementModel>(prior, problem);
  pnode::OdeFilter filter(prior, model, pnode::TimeGrid::uniform(0.0, 1.0, 0.1).values());
  filter.run(pnode::initialBelief(*model));
  return filter.release();
}

} // namespace

TEST(CalibrationTests, GlobalScaleIsMeanWhitenedSquare) {
  std::vector<pnode::InnovationRecord_t> innovations;
  innovations.push_back(makeRecord(1, pnode::Vector::Constant(1, 2.0), pnode::Matrix::Constant(1, 1, 1.0)));
  innovations.push_back(makeRecord(2, pnode::Vector::Constant(1, 1.0), pnode::Matrix::Constant(1, 1, 0.5)));

  const pnode::CalibrationResult_t result =
      pnode::estimateDiffusion(innovations, pnode::CalibrationMode_e::kGlobal, 1);
  EXPECT_DOUBLE_EQ(result.scale, (4.0 + 4.0) / 2.0);
  EXPECT_EQ(result.sampleCount, 2u);
  EXPECT_DOUBLE_EQ(result.dimensionScales(0), result.scale);
}

TEST(CalibrationTests, PerDimensionScales) {
  pnode::Matrix factor = pnode::Matrix::Zero(2, 2);
  factor(0, 0) = 1.0;
  factor(1, 1) = 2.0;
  pnode::Vector first(2);
  first << 1.0, 4.0;
  pnode::Vector second(2);
  second << 3.0, 0.0;
  const std::vector<pnode::InnovationRecord_t> innovations{makeRecord(1, first, factor), makeRecord(2, second, factor)};

  const pnode::CalibrationResult_t result =
      pnode::estimateDiffusion(innovations, pnode::CalibrationMode_e::kPerDimension, 2);
  EXPECT_DOUBLE_EQ(result.dimensionScales(0), (1.0 + 9.0) / 2.0);
  EXPECT_DOUBLE_EQ(result.dimensionScales(1), (4.0 + 0.0) / 2.0);
  EXPECT_DOUBLE_EQ(result.scale, 3.5);
}

TEST(CalibrationTests, NoneAndEmptyLeaveUnitScale) {
  const std::vector<pnode::InnovationRecord_t> innovations{
      makeRecord(1, pnode::Vector::Constant(1, 5.0), pnode::Matrix::Constant(1, 1, 1.0))};
  EXPECT_DOUBLE_EQ(pnode::estimateDiffusion(innovations, pnode::CalibrationMode_e::kNone, 1).scale, 1.0);
  EXPECT_DOUBLE_EQ(pnode::estimateDiffusion({}, pnode::CalibrationMode_e::kGlobal, 1).scale, 1.0);
}

TEST(CalibrationTests, ZeroResidualsKeepScalePositive) {
  const std::vector<pnode::InnovationRecord_t> innovations{
      makeRecord(1, pnode::Vector::Zero(1), pnode::Matrix::Constant(1, 1, 1.0)),
      makeRecord(2, pnode::Vector::Zero(1), pnode::Matrix::Constant(1, 1, 1.0))};
  const pnode::CalibrationResult_t result =
      pnode::estimateDiffusion(innovations, pnode::CalibrationMode_e::kGlobal, 1);
  EXPECT_GT(result.scale, 0.0);
  EXPECT_EQ(result.scale, std::numeric_limits<double>::min());
}

TEST(CalibrationTests, RejectsInnovationOfWrongSize) {
  const std::vector<pnode::InnovationRecord_t> innovations{
      makeRecord(1, pnode::Vector::Zero(2), pnode::Matrix::Identity(2, 2))};
  EXPECT_THROW(pnode::estimateDiffusion(innovations, pnode::CalibrationMode_e::kGlobal, 1),
               pnode::DimensionMismatchError);
}

TEST(CalibrationTests, CalibrateIsPureAndIdempotent) {
  const pnode::FilterResult_t result = runFilter(1.0);
  const auto prior = std::make_shared<pnode::IntegratedWienerProcess>(1, 1);
  const std::vector<pnode::TimedBelief_t> smoothed = pnode::RtsSmoother().smooth(result);

  const std::vector<pnode::TimedBelief_t> once = pnode::calibrate(smoothed, result.innovations, *prior);
  const std::vector<pnode::TimedBelief_t> twice = pnode::calibrate(smoothed, result.innovations, *prior);
  const pnode::CalibrationResult_t first =
      pnode::estimateDiffusion(result.innovations, pnode::CalibrationMode_e::kGlobal, 1);
  const pnode::CalibrationResult_t second =
      pnode::estimateDiffusion(result.innovations, pnode::CalibrationMode_e::kGlobal, 1);

  EXPECT_EQ(first.scale, second.scale);
  ASSERT_EQ(once.size(), smoothed.size());
  for (std::size_t i = 0; i < once.size(); ++i) {
    EXPECT_TRUE(once[i].belief.mean() == twice[i].belief.mean());
    EXPECT_TRUE(once[i].belief.covarianceFactor() == twice[i].belief.covarianceFactor());
    EXPECT_TRUE(once[i].belief.mean() == smoothed[i].belief.mean());
    EXPECT_TRUE(once[i].belief.covariance().isApprox(first.scale * smoothed[i].belief.covariance(), 1e-12));
  }
}

TEST(CalibrationTests, RefitWithCalibratedDiffusionGivesUnitScale) {
  const pnode::FilterResult_t initial = runFilter(1.0);
  const double scale =
      pnode::estimateDiffusion(initial.innovations, pnode::CalibrationMode_e::kGlobal, 1).scale;
  ASSERT_GT(scale, 0.0);

  const pnode::FilterResult_t refit = runFilter(std::sqrt(scale));
  const double refitScale =
      pnode::estimateDiffusion(refit.innovations, pnode::CalibrationMode_e::kGlobal, 1).scale;
  EXPECT_NEAR(refitScale, 1.0, 1e-3);
}

TEST(CalibrationTests, StateScalesRepeatPerComponent) {
  const pnode::IntegratedWienerProcess prior(2, 2);
  pnode::CalibrationResult_t calibration;
  calibration.mode = pnode::CalibrationMode_e::kPerDimension;
  calibration.dimensionScales = pnode::Vector(2);
  calibration.dimensionScales << 4.0, 9.0;

  const pnode::Vector scales = pnode::stateScales(calibration, prior);
  ASSERT_EQ(scales.size(), 6);
  EXPECT_DOUBLE_EQ(scales(0), 2.0);
  EXPECT_DOUBLE_EQ(scales(2), 2.0);
  EXPECT_DOUBLE_EQ(scales(3), 3.0);
  EXPECT_DOUBLE_EQ(scales(5), 3.0);
}
