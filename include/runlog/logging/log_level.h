#pragma once

#include <cstdint>
#include <string>

namespace runlog {
namespace logging {

// Severity levels, ordered from most to least verbose
enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Warning = 2,
  Error = 3,
  Critical = 4,
  Off = 5
};

// Sink types
enum class SinkType { File, Stdio, Null, External };

// Helper functions
inline const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    case LogLevel::Off: return "OFF";
    default: return "UNKNOWN";
  }
}

inline LogLevel stringToLogLevel(const std::string& str) {
  if (str == "DEBUG" || str == "debug") return LogLevel::Debug;
  if (str == "INFO" || str == "info") return LogLevel::Info;
  if (str == "WARNING" || str == "warning") return LogLevel::Warning;
  if (str == "WARN" || str == "warn") return LogLevel::Warning;
  if (str == "ERROR" || str == "error") return LogLevel::Error;
  if (str == "CRITICAL" || str == "critical") return LogLevel::Critical;
  if (str == "OFF" || str == "off") return LogLevel::Off;
  return LogLevel::Info; // Default
}

// Strict variant of stringToLogLevel for configuration input
inline bool tryParseLogLevel(const std::string& str, LogLevel& out) {
  if (str != "INFO" && str != "info" && stringToLogLevel(str) == LogLevel::Info) {
    return false;
  }
  out = stringToLogLevel(str);
  return true;
}

inline const char* sinkTypeToString(SinkType type) {
  switch (type) {
    case SinkType::File: return "file";
    case SinkType::Stdio: return "console";
    case SinkType::Null: return "null";
    case SinkType::External: return "external";
    default: return "unknown";
  }
}

}  // namespace logging
}  // namespace runlog
