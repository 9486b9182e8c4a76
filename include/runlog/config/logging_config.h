#pragma once

#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "runlog/config/parse_error.h"
#include "runlog/logging/log_formatter.h"
#include "runlog/logging/log_level.h"
#include "runlog/logging/logger_registry.h"

namespace runlog {
namespace config {

// Environment variable naming a configuration file
constexpr const char* kConfigEnvVar = "RUNLOG_CONFIG";

// Fallback configuration file in the working directory
constexpr const char* kDefaultConfigFile = "runlog.yaml";

struct HandlerConfig {
  enum class Type { Console, File };

  std::string name;
  Type type{Type::Console};
  logging::LogLevel level{logging::LogLevel::Info};
  std::string format{logging::formats::kBasic};
  bool use_stderr{true};  // console only
};

struct JoinConfig {
  std::string logger;
  std::string handler;
};

struct LoggerConfig {
  std::string name;
  std::optional<logging::LogLevel> level;
  std::optional<std::string> base_directory;
  std::vector<HandlerConfig> handlers;
  std::vector<JoinConfig> joins;
};

struct LoggingConfig {
  std::optional<std::string> base_directory;
  std::optional<std::string> run_name;
  std::vector<LoggerConfig> loggers;
};

// Parse a configuration document. Throws ConfigParseError on unknown keys,
// wrong types, bad levels, bad format templates or duplicate names.
LoggingConfig parseLoggingConfig(const YAML::Node& root,
                                 const std::string& source = "");

// Load and parse a YAML file. Throws ConfigParseError if it cannot be read or
// parsed.
LoggingConfig loadLoggingConfigFile(const std::string& path);

// Search order: explicit path, $RUNLOG_CONFIG, ./runlog.yaml.
// Returns an empty string when nothing is found.
std::string findConfigFile(const std::string& explicit_path = "");

// Set the run name, create the loggers in declaration order and attach their
// handlers, then resolve joins.
//
// Joins are checked before anything is created: each must name a handler in
// the handlers list of a logger of the document, or a handler already
// attached to a registered logger. Otherwise NotFoundError is thrown and the
// registry is untouched. A failure while creating handlers (e.g. a file that
// cannot be opened) throws LoggingError and leaves the loggers and handlers
// created so far in place.
void applyLoggingConfig(const LoggingConfig& config,
                        logging::LoggerRegistry& registry);

}  // namespace config
}  // namespace runlog
