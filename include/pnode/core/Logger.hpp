#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace pnode {

struct FileSinkConfig_t {
  bool enabled = false;
  std::string path = "logs/pnode.log";
  std::size_t maxSizeBytes = 5 * 1024 * 1024;
  std::size_t maxFiles = 3;
};

struct ClassSinkConfig_t {
  bool enabled = false;
  std::string directory = "logs/classes";
  std::size_t maxSizeBytes = 5 * 1024 * 1024;
  std::size_t maxFiles = 3;
};

// Full logging setup as read from the "logging" config node.
struct LoggingConfig_t {
  bool enabled = true;
  spdlog::level::level_enum level = spdlog::level::info;
  FileSinkConfig_t file;
  ClassSinkConfig_t classLogs;
};

class Logger {
 public:
  static void Initialize();
  // Rebuilds the shared logger and drops every class logger.
  static void Configure(const LoggingConfig_t& config);
  // Null when logging is disabled.
  static std::shared_ptr<spdlog::logger> Get();
  static std::shared_ptr<spdlog::logger> GetClass(const std::string& name);
  static void SetLevel(spdlog::level::level_enum level);
  // spdlog level names; unknown names map to info.
  static spdlog::level::level_enum ParseLevel(const std::string& value);
};

} // namespace pnode
