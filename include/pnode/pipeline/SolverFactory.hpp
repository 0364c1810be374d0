#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "pnode/core/Logger.hpp"
#include "pnode/filtsmooth/Calibration.hpp"
#include "pnode/filtsmooth/OdeFilter.hpp"
#include "pnode/measurement/MeasurementModel.hpp"
#include "pnode/prior/StochasticPrior.hpp"

namespace pnode {

struct PriorConfig_t {
  // "ibm", "ioup" or "matern".
  std::string type = "ibm";
  int order = 2;
  double diffusion = 1.0;
  double initialVariance = 1.0;
  double driftSpeed = 1.0;
  double lengthScale = 1.0;
};

struct MeasurementConfig_t {
  // "ek0", "ek1", "ukf" or "ckf".
  std::string type = "ek1";
  double alpha = 1.0;
  double beta = 2.0;
  double kappa = 1.0;
};

struct SolverConfig_t {
  PriorConfig_t prior;
  MeasurementConfig_t measurement;
  FilterOptions_t filter;
  bool smoothing = true;
  CalibrationMode_e calibration = CalibrationMode_e::kGlobal;
  double step = 0.1;
};

PriorConfig_t parsePriorConfig(const nlohmann::json& node);
MeasurementConfig_t parseMeasurementConfig(const nlohmann::json& node);
SolverConfig_t parseSolverConfig(const nlohmann::json& node);
LoggingConfig_t parseLoggingConfig(const nlohmann::json& node);

std::shared_ptr<StochasticPrior> createPrior(const PriorConfig_t& config, int spatialDimension);
std::shared_ptr<MeasurementModel> createMeasurementModel(const MeasurementConfig_t& config,
                                                         const std::shared_ptr<const StochasticPrior>& prior,
                                                         const InitialValueProblem_t& problem,
                                                         const NumericalTolerance_t& tolerance);

} // namespace pnode
