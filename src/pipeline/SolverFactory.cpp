#include "pnode/pipeline/SolverFactory.hpp"

#include "pnode/core/Errors.hpp"
#include "pnode/measurement/SigmaPointMeasurementModel.hpp"
#include "pnode/measurement/TaylorMeasurementModel.hpp"
#include "pnode/prior/IntegratedOrnsteinUhlenbeck.hpp"
#include "pnode/prior/IntegratedWienerProcess.hpp"
#include "pnode/prior/MaternProcess.hpp"

namespace pnode {

namespace {

std::string getString(const nlohmann::json& node, const std::string& key, const std::string& fallback) {
  if (!node.is_object()) {
    return fallback;
  }
  auto it = node.find(key);
  if (it == node.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<std::string>();
}

int getInt(const nlohmann::json& node, const std::string& key, int fallback) {
  if (!node.is_object()) {
    return fallback;
  }
  auto it = node.find(key);
  if (it == node.end() || !it->is_number_integer()) {
    return fallback;
  }
  return it->get<int>();
}

double getDouble(const nlohmann::json& node, const std::string& key, double fallback) {
  if (!node.is_object()) {
    return fallback;
  }
  auto it = node.find(key);
  if (it == node.end() || !it->is_number()) {
    return fallback;
  }
  return it->get<double>();
}

bool getBool(const nlohmann::json& node, const std::string& key, bool fallback) {
  if (!node.is_object()) {
    return fallback;
  }
  auto it = node.find(key);
  if (it == node.end() || !it->is_boolean()) {
    return fallback;
  }
  return it->get<bool>();
}

std::size_t getSize(const nlohmann::json& node, const std::string& key, std::size_t fallback) {
  if (!node.is_object()) {
    return fallback;
  }
  auto it = node.find(key);
  if (it == node.end() || !it->is_number_unsigned()) {
    return fallback;
  }
  return it->get<std::size_t>();
}

nlohmann::json child(const nlohmann::json& node, const std::string& key) {
  if (!node.is_object()) {
    return nlohmann::json::object();
  }
  auto it = node.find(key);
  if (it == node.end() || !it->is_object()) {
    return nlohmann::json::object();
  }
  return *it;
}

DiffusionModel_e parseDiffusionModel(const std::string& value, DiffusionModel_e fallback) {
  if (value == "constant") {
    return DiffusionModel_e::kConstant;
  }
  if (value == "dynamic") {
    return DiffusionModel_e::kDynamic;
  }
  if (auto logger = Logger::Get()) {
    logger->warn("SolverFactory: unknown diffusion model '{}', keeping default.", value);
  }
  return fallback;
}

CalibrationMode_e parseCalibrationMode(const std::string& value, CalibrationMode_e fallback) {
  if (value == "none") {
    return CalibrationMode_e::kNone;
  }
  if (value == "global") {
    return CalibrationMode_e::kGlobal;
  }
  if (value == "dimension") {
    return CalibrationMode_e::kPerDimension;
  }
  if (auto logger = Logger::Get()) {
    logger->warn("SolverFactory: unknown calibration mode '{}', keeping default.", value);
  }
  return fallback;
}

} // namespace

PriorConfig_t parsePriorConfig(const nlohmann::json& node) {
  PriorConfig_t config;
  config.type = getString(node, "type", config.type);
  config.order = getInt(node, "order", config.order);
  config.diffusion = getDouble(node, "diffusion", config.diffusion);
  config.initialVariance = getDouble(node, "initialVariance", config.initialVariance);
  config.driftSpeed = getDouble(node, "driftSpeed", config.driftSpeed);
  config.lengthScale = getDouble(node, "lengthScale", config.lengthScale);
  return config;
}

MeasurementConfig_t parseMeasurementConfig(const nlohmann::json& node) {
  MeasurementConfig_t config;
  config.type = getString(node, "type", config.type);
  config.alpha = getDouble(node, "alpha", config.alpha);
  config.beta = getDouble(node, "beta", config.beta);
  config.kappa = getDouble(node, "kappa", config.kappa);
  return config;
}

SolverConfig_t parseSolverConfig(const nlohmann::json& node) {
  SolverConfig_t config;
  config.prior = parsePriorConfig(child(node, "prior"));
  config.measurement = parseMeasurementConfig(child(node, "measurement"));

  const nlohmann::json filterNode = child(node, "filter");
  config.filter.tolerance.jitter = getDouble(filterNode, "jitter", config.filter.tolerance.jitter);
  config.filter.tolerance.singularThreshold =
      getDouble(filterNode, "singularThreshold", config.filter.tolerance.singularThreshold);
  if (filterNode.contains("diffusionModel")) {
    config.filter.diffusionModel =
        parseDiffusionModel(getString(filterNode, "diffusionModel", ""), config.filter.diffusionModel);
  }
  config.step = getDouble(filterNode, "step", config.step);

  config.smoothing = getBool(node, "smoothing", config.smoothing);
  if (node.is_object() && node.contains("calibration")) {
    config.calibration = parseCalibrationMode(getString(node, "calibration", ""), config.calibration);
  }
  return config;
}

LoggingConfig_t parseLoggingConfig(const nlohmann::json& node) {
  LoggingConfig_t config;
  config.enabled = getBool(node, "enabled", config.enabled);
  config.level = Logger::ParseLevel(getString(node, "level", "info"));

  const nlohmann::json fileNode = child(node, "file");
  config.file.enabled = getBool(fileNode, "enabled", config.file.enabled);
  config.file.path = getString(fileNode, "path", config.file.path);
  config.file.maxSizeBytes = getSize(fileNode, "maxSizeBytes", config.file.maxSizeBytes);
  config.file.maxFiles = getSize(fileNode, "maxFiles", config.file.maxFiles);

  const nlohmann::json classNode = child(node, "classLogs");
  config.classLogs.enabled = getBool(classNode, "enabled", config.classLogs.enabled);
  config.classLogs.directory = getString(classNode, "directory", config.classLogs.directory);
  config.classLogs.maxSizeBytes = getSize(classNode, "maxSizeBytes", config.classLogs.maxSizeBytes);
  config.classLogs.maxFiles = getSize(classNode, "maxFiles", config.classLogs.maxFiles);
  return config;
}

std::shared_ptr<StochasticPrior> createPrior(const PriorConfig_t& config, int spatialDimension) {
  if (config.type == "ioup") {
    if (auto logger = Logger::Get()) {
      logger->info("SolverFactory: creating IOUP({}) prior, drift speed {:.3g}.", config.order, config.driftSpeed);
    }
    return std::make_shared<IntegratedOrnsteinUhlenbeck>(
        config.order, spatialDimension, config.driftSpeed, config.diffusion, config.initialVariance);
  }
  if (config.type == "matern") {
    if (auto logger = Logger::Get()) {
      logger->info("SolverFactory: creating Matern({}/2) prior, length scale {:.3g}.",
                   2 * config.order + 1,
                   config.lengthScale);
    }
    return std::make_shared<MaternProcess>(config.order, spatialDimension, config.lengthScale, config.diffusion);
  }
  if (config.type != "ibm") {
    if (auto logger = Logger::Get()) {
      logger->warn("SolverFactory: unknown prior '{}', defaulting to IBM.", config.type);
    }
  } else if (auto logger = Logger::Get()) {
    logger->info("SolverFactory: creating IBM({}) prior.", config.order);
  }
  return std::make_shared<IntegratedWienerProcess>(
      config.order, spatialDimension, config.diffusion, config.initialVariance);
}

std::shared_ptr<MeasurementModel> createMeasurementModel(const MeasurementConfig_t& config,
                                                         const std::shared_ptr<const StochasticPrior>& prior,
                                                         const InitialValueProblem_t& problem,
                                                         const NumericalTolerance_t& tolerance) {
  if (config.type == "ek0") {
    if (auto logger = Logger::Get()) {
      logger->info("SolverFactory: creating EK0 measurement model.");
    }
    return std::make_shared<TaylorMeasurementModel>(prior, problem, TaylorOrder_e::kZerothOrder, tolerance);
  }
  if (config.type == "ukf") {
    if (auto logger = Logger::Get()) {
      logger->info("SolverFactory: creating unscented measurement model.");
    }
    return std::make_shared<UnscentedMeasurementModel>(
        prior, problem, config.alpha, config.beta, config.kappa, tolerance);
  }
  if (config.type == "ckf") {
    if (auto logger = Logger::Get()) {
      logger->info("SolverFactory: creating cubature measurement model.");
    }
    return std::make_shared<CubatureMeasurementModel>(prior, problem, tolerance);
  }
  if (config.type != "ek1") {
    if (auto logger = Logger::Get()) {
      logger->warn("SolverFactory: unknown measurement model '{}', defaulting to EK1.", config.type);
    }
  } else if (auto logger = Logger::Get()) {
    logger->info("SolverFactory: creating EK1 measurement model.");
  }
  return std::make_shared<TaylorMeasurementModel>(prior, problem, TaylorOrder_e::kFirstOrder, tolerance);
}

} // namespace pnode
