#include "pnode/core/Logger.hpp"

#include <filesystem>
#include <unordered_map>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace pnode {

namespace {

constexpr const char* kLoggerName = "pnode";

LoggingConfig_t gConfig{};
std::shared_ptr<spdlog::logger> gLogger;
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> gClassLoggers;

std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> makeFileSink(const std::filesystem::path& path,
                                                                   std::size_t maxSizeBytes,
                                                                   std::size_t maxFiles) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path.string(), maxSizeBytes, maxFiles);
}

std::shared_ptr<spdlog::logger> registerLogger(const std::string& name, std::vector<spdlog::sink_ptr> sinks) {
  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
  logger->set_level(gConfig.level);
  spdlog::register_logger(logger);
  return logger;
}

void resetLoggers() {
  for (const auto& entry : gClassLoggers) {
    spdlog::drop(entry.first);
  }
  gClassLoggers.clear();
  spdlog::drop(kLoggerName);
  gLogger.reset();
}

void buildLogger() {
  resetLoggers();
  if (!gConfig.enabled) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
  std::string fileSinkError;
  if (gConfig.file.enabled) {
    try {
      sinks.push_back(makeFileSink(gConfig.file.path, gConfig.file.maxSizeBytes, gConfig.file.maxFiles));
    } catch (const spdlog::spdlog_ex& ex) {
      fileSinkError = ex.what();
    }
  }
  gLogger = registerLogger(kLoggerName, std::move(sinks));
  if (!fileSinkError.empty()) {
    gLogger->warn("Logger: file sink '{}' unavailable, console only: {}", gConfig.file.path, fileSinkError);
  }
}

} // namespace

void Logger::Initialize() {
  if (!gLogger && gConfig.enabled) {
    buildLogger();
  }
}

void Logger::Configure(const LoggingConfig_t& config) {
  gConfig = config;
  buildLogger();
}

std::shared_ptr<spdlog::logger> Logger::Get() {
  Initialize();
  return gLogger;
}

// Falls back to the shared logger when class logs are off or the file cannot be opened.
std::shared_ptr<spdlog::logger> Logger::GetClass(const std::string& name) {
  if (!gConfig.enabled || !gConfig.classLogs.enabled) {
    return Get();
  }
  auto it = gClassLoggers.find(name);
  if (it != gClassLoggers.end()) {
    return it->second;
  }
  const std::filesystem::path path = std::filesystem::path(gConfig.classLogs.directory) / (name + ".log");
  try {
    auto logger =
        registerLogger(name, {makeFileSink(path, gConfig.classLogs.maxSizeBytes, gConfig.classLogs.maxFiles)});
    gClassLoggers[name] = logger;
    return logger;
  } catch (const spdlog::spdlog_ex& ex) {
    auto shared = Get();
    if (shared) {
      shared->warn("Logger: class log '{}' unavailable: {}", path.string(), ex.what());
    }
    return shared;
  }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
  gConfig.level = level;
  Initialize();
  if (gLogger) {
    gLogger->set_level(level);
  }
  for (const auto& entry : gClassLoggers) {
    entry.second->set_level(level);
  }
}

spdlog::level::level_enum Logger::ParseLevel(const std::string& value) {
  const spdlog::level::level_enum level = spdlog::level::from_str(value);
  if (level == spdlog::level::off && value != "off") {
    return spdlog::level::info;
  }
  return level;
}

} // namespace pnode
