#include <cmath>
#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "pnode/core/Errors.hpp"
#include "pnode/core/TimeGrid.hpp"
#include "pnode/filtsmooth/OdeSolution.hpp"
#include "pnode/filtsmooth/RtsSmoother.hpp"
#include "pnode/measurement/TaylorMeasurementModel.hpp"
#include "pnode/prior/IntegratedWienerProcess.hpp"
#include "pnode/problems/Problems.hpp"

namespace {

class OdeSolutionTests : public ::testing::Test {
protected:
  void SetUp() override {
    problem = pnode::problems::exponentialDecay();
    prior = std::make_shared<pnode::IntegratedWienerProcess>(2, 1);
    auto model = std::make_shared<pnode::TaylorMeasurementModel>(prior, problem);
    pnode::OdeFilter filter(prior, model, pnode::TimeGrid::uniform(0.0, 1.0, 0.1).values());
    filter.run(pnode::initialBelief(*model));
    result = filter.release();
  }

  pnode::OdeSolution smoothedSolution() const {
    return pnode::OdeSolution(prior, pnode::RtsSmoother().smooth(result), true);
  }

  pnode::OdeSolution filteredSolution() const {
    std::vector<pnode::TimedBelief_t> beliefs;
    for (const pnode::FilterStep_t& step : result.steps) {
      beliefs.push_back(pnode::TimedBelief_t{step.time, step.filtered});
    }
    return pnode::OdeSolution(prior, std::move(beliefs), false);
  }

  pnode::InitialValueProblem_t problem;
  std::shared_ptr<const pnode::StochasticPrior> prior;
  pnode::FilterResult_t result;
};

} // namespace

TEST_F(OdeSolutionTests, GridPointsReturnStoredBeliefs) {
  const pnode::OdeSolution solution = smoothedSolution();
  ASSERT_EQ(solution.size(), 11u);
  EXPECT_TRUE(solution.isSmoothed());
  for (std::size_t i = 0; i < solution.size(); ++i) {
    const pnode::GaussianBelief belief = solution.interpolate(solution.at(i).time);
    EXPECT_TRUE(belief.mean() == solution.at(i).belief.mean());
    EXPECT_TRUE(belief.covarianceFactor() == solution.at(i).belief.covarianceFactor());
  }
}

TEST_F(OdeSolutionTests, InterpolationBetweenGridPointsIsAccurate) {
  const pnode::OdeSolution solution = smoothedSolution();
  for (const double t : {0.05, 0.37, 0.55, 0.91}) {
    const pnode::Vector mean = solution.solutionMean(t);
    ASSERT_EQ(mean.size(), 1);
    EXPECT_NEAR(mean(0), problem.solution(t)(0), 1e-4) << "t " << t;
    EXPECT_GT(solution.solutionStdDev(t)(0), 0.0) << "t " << t;
  }
}

TEST_F(OdeSolutionTests, SmoothedInterpolationIsContinuousAtGridPoints) {
  const pnode::OdeSolution solution = smoothedSolution();
  const double left = solution.at(4).time;
  const double right = solution.at(5).time;
  const pnode::GaussianBelief afterLeft = solution.interpolate(left + 1e-9);
  const pnode::GaussianBelief beforeRight = solution.interpolate(right - 1e-9);
  EXPECT_NEAR(afterLeft.mean()(0), solution.at(4).belief.mean()(0), 1e-7);
  EXPECT_NEAR(beforeRight.mean()(0), solution.at(5).belief.mean()(0), 1e-7);
}

TEST_F(OdeSolutionTests, FilteredSolutionExtrapolatesWithGrowingVariance) {
  const pnode::OdeSolution solution = filteredSolution();
  EXPECT_FALSE(solution.isSmoothed());
  const double atEnd = solution.solutionStdDev(1.0)(0);
  const double beyond = solution.solutionStdDev(1.5)(0);
  const double further = solution.solutionStdDev(3.0)(0);
  EXPECT_GT(beyond, atEnd);
  EXPECT_GT(further, beyond);
}

TEST_F(OdeSolutionTests, RejectsTimesBeforeStart) {
  const pnode::OdeSolution solution = smoothedSolution();
  EXPECT_THROW(solution.interpolate(-0.1), pnode::InvalidStepSizeError);
}

TEST_F(OdeSolutionTests, ProcessNoiseScalingWidensInterpolation) {
  pnode::OdeSolution unscaled = filteredSolution();
  pnode::OdeSolution scaled = filteredSolution();
  scaled.setProcessNoiseScaling(std::vector<double>(scaled.size(), 4.0), pnode::Vector::Ones(prior->stateDimension()));

  const double t = 0.45;
  EXPECT_GT(scaled.solutionStdDev(t)(0), unscaled.solutionStdDev(t)(0));
  EXPECT_TRUE(scaled.solutionMean(t) == unscaled.solutionMean(t));
  EXPECT_THROW(scaled.setProcessNoiseScaling(std::vector<double>(2, 1.0), pnode::Vector::Ones(3)),
               pnode::DimensionMismatchError);
}

TEST_F(OdeSolutionTests, SolutionBeliefProjectsValue) {
  const pnode::OdeSolution solution = smoothedSolution();
  const pnode::GaussianBelief belief = solution.solutionBelief(solution.at(3).time);
  ASSERT_EQ(belief.dimension(), 1);
  EXPECT_DOUBLE_EQ(belief.mean()(0), solution.at(3).belief.mean()(0));
  EXPECT_NEAR(belief.standardDeviation()(0), std::sqrt(solution.at(3).belief.covariance()(0, 0)), 1e-15);
}

TEST(OdeSolutionConstructionTests, RejectsBeliefsOfWrongDimension) {
  const auto prior = std::make_shared<pnode::IntegratedWienerProcess>(1, 1);
  std::vector<pnode::TimedBelief_t> beliefs{
      pnode::TimedBelief_t{0.0, pnode::GaussianBelief(pnode::Vector::Zero(3), pnode::Matrix::Identity(3, 3))}};
  EXPECT_THROW(pnode::OdeSolution(prior, beliefs, false), pnode::DimensionMismatchError);
}
