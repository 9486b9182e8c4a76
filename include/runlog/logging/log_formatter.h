#pragma once

#include <string>
#include <vector>

#include "runlog/logging/log_message.h"

namespace runlog {
namespace logging {

// Placeholders understood by PatternFormatter
namespace fields {
constexpr const char* kTimestamp = "{timestamp}";
constexpr const char* kLoggerName = "{logger}";
constexpr const char* kLevel = "{level}";
constexpr const char* kModule = "{module}";
constexpr const char* kFunction = "{function}";
constexpr const char* kLine = "{line}";
constexpr const char* kMessage = "{message}";
}  // namespace fields

// Named format presets
namespace formats {
constexpr const char* kBasic = "{timestamp} - {level} - {message}";
constexpr const char* kLoggerName =
    "{timestamp} - {logger} - {level} - {message}";
constexpr const char* kLoggerNameBrackets =
    "{timestamp} - [{logger}][{level}]: {message}";
constexpr const char* kFuncName = "{timestamp} [{level}][{function}]: {message}";
constexpr const char* kModuleFuncName =
    "{timestamp} [{level}][{module}][{function}]: {message}";
}  // namespace formats

// Resolve a preset name ("basic", "logger_name", "logger_name_brackets",
// "func_name", "module_func_name"). Any other string is returned unchanged
// so that literal templates pass through.
std::string formatForName(const std::string& name);

// Base formatter interface
class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// Formats records according to a template of placeholders and literal text.
// Throws LoggingError when the template contains an unknown placeholder or an
// unbalanced brace.
class PatternFormatter : public Formatter {
 public:
  explicit PatternFormatter(const std::string& pattern = formats::kBasic);

  std::string format(const LogMessage& msg) const override;

  const std::string& pattern() const { return pattern_; }

 private:
  enum class Field {
    Literal,
    Timestamp,
    LoggerName,
    Level,
    Module,
    Function,
    Line,
    Message
  };

  struct Segment {
    Field field;
    std::string text;
  };

  void compile();

  std::string pattern_;
  std::vector<Segment> segments_;
};

// "YYYY-MM-DD HH:MM:SS,mmm" in local time
std::string formatTimestamp(const std::chrono::system_clock::time_point& tp);

}  // namespace logging
}  // namespace runlog
