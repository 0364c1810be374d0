#include <memory>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "pnode/core/Errors.hpp"
#include "pnode/measurement/SigmaPointMeasurementModel.hpp"
#include "pnode/measurement/TaylorMeasurementModel.hpp"
#include "pnode/pipeline/SolverFactory.hpp"
#include "pnode/prior/IntegratedOrnsteinUhlenbeck.hpp"
#include "pnode/prior/IntegratedWienerProcess.hpp"
#include "pnode/prior/MaternProcess.hpp"
#include "pnode/problems/Problems.hpp"

TEST(SolverFactoryTests, CreatesPriors) {
  pnode::PriorConfig_t config;
  config.order = 3;
  auto ibm = pnode::createPrior(config, 2);
  EXPECT_NE(dynamic_cast<pnode::IntegratedWienerProcess*>(ibm.get()), nullptr);
  EXPECT_EQ(ibm->order(), 3);
  EXPECT_EQ(ibm->stateDimension(), 8);

  config.type = "ioup";
  config.driftSpeed = 0.5;
  auto ioup = pnode::createPrior(config, 1);
  auto* ou = dynamic_cast<pnode::IntegratedOrnsteinUhlenbeck*>(ioup.get());
  ASSERT_NE(ou, nullptr);
  EXPECT_DOUBLE_EQ(ou->driftSpeed(), 0.5);

  config.type = "matern";
  config.lengthScale = 2.0;
  auto matern = pnode::createPrior(config, 1);
  auto* mp = dynamic_cast<pnode::MaternProcess*>(matern.get());
  ASSERT_NE(mp, nullptr);
  EXPECT_DOUBLE_EQ(mp->lengthScale(), 2.0);
}

TEST(SolverFactoryTests, UnknownPriorFallsBackToWiener) {
  pnode::PriorConfig_t config;
  config.type = "brownian-bridge";
  auto prior = pnode::createPrior(config, 1);
  EXPECT_NE(dynamic_cast<pnode::IntegratedWienerProcess*>(prior.get()), nullptr);
}

TEST(SolverFactoryTests, CreatesMeasurementModels) {
  const pnode::InitialValueProblem_t problem = pnode::problems::logistic();
  const std::shared_ptr<const pnode::StochasticPrior> prior = pnode::createPrior(pnode::PriorConfig_t{}, 1);
  const pnode::NumericalTolerance_t tolerance;

  pnode::MeasurementConfig_t config;
  for (const char* type : {"ek0", "ek1", "ukf", "ckf", "unknown"}) {
    config.type = type;
    auto model = pnode::createMeasurementModel(config, prior, problem, tolerance);
    ASSERT_NE(model, nullptr) << type;
  }

  config.type = "ek0";
  auto ek0 = pnode::createMeasurementModel(config, prior, problem, tolerance);
  EXPECT_EQ(ek0->name(), "EK0");
  config.type = "ukf";
  EXPECT_NE(dynamic_cast<pnode::UnscentedMeasurementModel*>(
                pnode::createMeasurementModel(config, prior, problem, tolerance).get()),
            nullptr);
  config.type = "ckf";
  EXPECT_NE(dynamic_cast<pnode::CubatureMeasurementModel*>(
                pnode::createMeasurementModel(config, prior, problem, tolerance).get()),
            nullptr);
  config.type = "unknown";
  EXPECT_EQ(pnode::createMeasurementModel(config, prior, problem, tolerance)->name(), "EK1");
}

TEST(SolverFactoryTests, ParsesSolverConfig) {
  const nlohmann::json node = nlohmann::json::parse(R"({
    "prior": {"type": "matern", "order": 1, "lengthScale": 0.5},
    "measurement": {"type": "ukf", "alpha": 0.5},
    "filter": {"step": 0.02, "jitter": 1e-10, "diffusionModel": "dynamic"},
    "smoothing": false,
    "calibration": "dimension"
  })");
  const pnode::SolverConfig_t config = pnode::parseSolverConfig(node);

  EXPECT_EQ(config.prior.type, "matern");
  EXPECT_EQ(config.prior.order, 1);
  EXPECT_DOUBLE_EQ(config.prior.lengthScale, 0.5);
  EXPECT_DOUBLE_EQ(config.prior.diffusion, 1.0);
  EXPECT_EQ(config.measurement.type, "ukf");
  EXPECT_DOUBLE_EQ(config.measurement.alpha, 0.5);
  EXPECT_DOUBLE_EQ(config.measurement.beta, 2.0);
  EXPECT_DOUBLE_EQ(config.step, 0.02);
  EXPECT_DOUBLE_EQ(config.filter.tolerance.jitter, 1e-10);
  EXPECT_DOUBLE_EQ(config.filter.tolerance.singularThreshold, 1e-15);
  EXPECT_EQ(config.filter.diffusionModel, pnode::DiffusionModel_e::kDynamic);
  EXPECT_FALSE(config.smoothing);
  EXPECT_EQ(config.calibration, pnode::CalibrationMode_e::kPerDimension);
}

TEST(SolverFactoryTests, EmptyConfigKeepsDefaults) {
  const pnode::SolverConfig_t config = pnode::parseSolverConfig(nlohmann::json::object());
  EXPECT_EQ(config.prior.type, "ibm");
  EXPECT_EQ(config.prior.order, 2);
  EXPECT_EQ(config.measurement.type, "ek1");
  EXPECT_TRUE(config.smoothing);
  EXPECT_EQ(config.calibration, pnode::CalibrationMode_e::kGlobal);
  EXPECT_EQ(config.filter.diffusionModel, pnode::DiffusionModel_e::kConstant);

  nlohmann::json badTypes;
  badTypes["calibration"] = "sometimes";
  badTypes["prior"] = {{"order", "three"}};
  const pnode::SolverConfig_t fallback = pnode::parseSolverConfig(badTypes);
  EXPECT_EQ(fallback.calibration, pnode::CalibrationMode_e::kGlobal);
  EXPECT_EQ(fallback.prior.order, 2);
}

TEST(SolverFactoryTests, ParsesLoggingConfig) {
  const nlohmann::json node = nlohmann::json::parse(R"({
    "enabled": false,
    "level": "debug",
    "file": {"enabled": true, "path": "out/solver.log", "maxFiles": 7},
    "classLogs": {"enabled": true, "directory": "out/classes"}
  })");
  const pnode::LoggingConfig_t config = pnode::parseLoggingConfig(node);
  EXPECT_FALSE(config.enabled);
  EXPECT_EQ(config.level, spdlog::level::debug);
  EXPECT_TRUE(config.file.enabled);
  EXPECT_EQ(config.file.path, "out/solver.log");
  EXPECT_EQ(config.file.maxFiles, 7u);
  EXPECT_EQ(config.file.maxSizeBytes, static_cast<std::size_t>(5 * 1024 * 1024));
  EXPECT_TRUE(config.classLogs.enabled);
  EXPECT_EQ(config.classLogs.directory, "out/classes");
}

TEST(SolverFactoryTests, ReferenceProblemsByName) {
  for (const std::string& name : pnode::problems::names()) {
    const pnode::InitialValueProblem_t problem = pnode::problems::byName(name);
    EXPECT_EQ(problem.name, name);
    EXPECT_TRUE(static_cast<bool>(problem.field));
    EXPECT_EQ(problem.field(problem.t0, problem.y0).size(), problem.y0.size());
    if (problem.solution) {
      EXPECT_TRUE(problem.solution(problem.t0).isApprox(problem.y0));
    }
  }
  EXPECT_THROW(pnode::problems::byName("vanderpol"), pnode::PnodeError);
}
