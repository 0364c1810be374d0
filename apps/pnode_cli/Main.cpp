#include <fmt/core.h>

#include <cmath>
#include <exception>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "pnode/core/Errors.hpp"
#include "pnode/core/Logger.hpp"
#include "pnode/pipeline/SolvePipeline.hpp"
#include "pnode/pipeline/SolverFactory.hpp"
#include "pnode/problems/Problems.hpp"

namespace {

struct CliOptions_t {
  std::string configPath;
  std::string problem;
  std::string measurement;
  std::string outputPath;
  int order = -1;
  double step = 0.0;
  bool showHelp = false;
};

CliOptions_t parseArgs(int argc, char** argv) {
  CliOptions_t options;
  options.configPath = "config/default.json";
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      options.showHelp = true;
      return options;
    } else if (arg == "--config" && i + 1 < argc) {
      options.configPath = argv[++i];
    } else if (arg == "--problem" && i + 1 < argc) {
      options.problem = argv[++i];
    } else if (arg == "--measurement" && i + 1 < argc) {
      options.measurement = argv[++i];
    } else if (arg == "--order" && i + 1 < argc) {
      options.order = std::stoi(argv[++i]);
    } else if (arg == "--step" && i + 1 < argc) {
      options.step = std::stod(argv[++i]);
    } else if (arg == "--output" && i + 1 < argc) {
      options.outputPath = argv[++i];
    }
  }
  return options;
}

nlohmann::json loadJson(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw pnode::PnodeError("Failed to open config file: " + path);
  }
  nlohmann::json config;
  file >> config;
  return config;
}

void writeBeliefs(const std::string& path, const pnode::OdeSolution& solution) {
  nlohmann::json out = nlohmann::json::array();
  for (const pnode::TimedBelief_t& entry : solution.beliefs()) {
    out.push_back({{"time", entry.time}, {"belief", entry.belief}});
  }
  std::ofstream file(path);
  if (!file.is_open()) {
    throw pnode::PnodeError("Failed to open output file: " + path);
  }
  file << out.dump(2) << '\n';
}

void printTable(const pnode::InitialValueProblem_t& problem, const pnode::OdeSolution& solution, int samples) {
  const double t0 = solution.grid().front();
  const double t1 = solution.grid().back();
  const int count = samples < 2 ? 2 : samples;
  fmt::print("{:>10} {:>4} {:>14} {:>12} {:>12}\n", "t", "k", "mean", "std", "error");
  for (int i = 0; i < count; ++i) {
    const double t = t0 + (t1 - t0) * static_cast<double>(i) / static_cast<double>(count - 1);
    const pnode::Vector mean = solution.solutionMean(t);
    const pnode::Vector stddev = solution.solutionStdDev(t);
    pnode::Vector exact;
    if (problem.solution) {
      exact = problem.solution(t);
    }
    for (Eigen::Index k = 0; k < mean.size(); ++k) {
      if (exact.size() == mean.size()) {
        fmt::print("{:>10.4f} {:>4} {:>14.6e} {:>12.3e} {:>12.3e}\n", t, k, mean(k), stddev(k),
                   std::abs(mean(k) - exact(k)));
      } else {
        fmt::print("{:>10.4f} {:>4} {:>14.6e} {:>12.3e} {:>12}\n", t, k, mean(k), stddev(k), "-");
      }
    }
  }
}

void printUsage() {
  std::string problems;
  for (const std::string& name : pnode::problems::names()) {
    problems += problems.empty() ? name : "|" + name;
  }
  fmt::print("Usage: pnode_cli [--config <path>] [--problem <{}>] [--measurement <ek0|ek1|ukf|ckf>] "
             "[--order <q>] [--step <h>] [--output <beliefs.json>]\n",
             problems);
}

} // namespace

int main(int argc, char** argv) {
  pnode::Logger::Initialize();
  try {
    const CliOptions_t cliOptions = parseArgs(argc, argv);
    if (cliOptions.showHelp) {
      printUsage();
      return 0;
    }

    const nlohmann::json config = loadJson(cliOptions.configPath);
    pnode::Logger::Configure(pnode::parseLoggingConfig(config.value("logging", nlohmann::json::object())));
    if (auto logger = pnode::Logger::Get()) {
      logger->info("pnode_cli using config: {}", cliOptions.configPath);
    }

    pnode::SolverConfig_t solverConfig = pnode::parseSolverConfig(config);
    if (!cliOptions.measurement.empty()) {
      solverConfig.measurement.type = cliOptions.measurement;
    }
    if (cliOptions.order >= 0) {
      solverConfig.prior.order = cliOptions.order;
    }
    if (cliOptions.step > 0.0) {
      solverConfig.step = cliOptions.step;
    }

    std::string problemName = config.value("problem", "logistic");
    if (!cliOptions.problem.empty()) {
      problemName = cliOptions.problem;
    }
    const pnode::InitialValueProblem_t problem = pnode::problems::byName(problemName);

    const pnode::SolvePipeline pipeline(solverConfig);
    const pnode::SolveOutput_t output = pipeline.run(problem);

    const nlohmann::json outputNode = config.value("output", nlohmann::json::object());
    printTable(problem, output.solution, outputNode.value("samples", 11));
    fmt::print("steps {}  sigma^2 {:.3e}  |r_N| {:.3e}  max local error {:.3e}\n",
               output.diagnostics.steps,
               output.diagnostics.calibration.scale,
               output.diagnostics.finalResidualNorm,
               output.diagnostics.maxLocalError);

    if (!cliOptions.outputPath.empty()) {
      writeBeliefs(cliOptions.outputPath, output.solution);
      if (auto logger = pnode::Logger::Get()) {
        logger->info("Beliefs written to {}", cliOptions.outputPath);
      }
    }
  } catch (const std::exception& ex) {
    if (auto logger = pnode::Logger::Get()) {
      logger->error("pnode_cli failed: {}", ex.what());
    } else {
      fmt::print("pnode_cli failed: {}\n", ex.what());
    }
    return 1;
  }

  if (auto logger = pnode::Logger::Get()) {
    logger->info("pnode_cli done");
  } else {
    fmt::print("pnode_cli done\n");
  }
  return 0;
}
