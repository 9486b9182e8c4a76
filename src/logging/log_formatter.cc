#include "runlog/logging/log_formatter.h"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "runlog/logging/logging_error.h"

namespace runlog {
namespace logging {

std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  oss << ',' << std::setfill('0') << std::setw(3) << ms.count();

  return oss.str();
}

std::string formatForName(const std::string& name) {
  if (name == "basic") return formats::kBasic;
  if (name == "logger_name") return formats::kLoggerName;
  if (name == "logger_name_brackets") return formats::kLoggerNameBrackets;
  if (name == "func_name") return formats::kFuncName;
  if (name == "module_func_name") return formats::kModuleFuncName;
  return name;
}

std::string LogMessage::module() const {
  if (!file) {
    return "";
  }
  std::string path(file);
  size_t slash = path.find_last_of("/\\");
  std::string base =
      (slash == std::string::npos) ? path : path.substr(slash + 1);
  size_t dot = base.find_last_of('.');
  return (dot == std::string::npos || dot == 0) ? base : base.substr(0, dot);
}

PatternFormatter::PatternFormatter(const std::string& pattern)
    : pattern_(pattern) {
  compile();
}

void PatternFormatter::compile() {
  std::string literal;
  size_t i = 0;

  auto flushLiteral = [&]() {
    if (!literal.empty()) {
      segments_.push_back({Field::Literal, literal});
      literal.clear();
    }
  };

  while (i < pattern_.size()) {
    char c = pattern_[i];

    if (c == '{' && i + 1 < pattern_.size() && pattern_[i + 1] == '{') {
      literal += '{';
      i += 2;
      continue;
    }
    if (c == '}' && i + 1 < pattern_.size() && pattern_[i + 1] == '}') {
      literal += '}';
      i += 2;
      continue;
    }
    if (c == '}') {
      throw LoggingError("Unbalanced '}' in format template: " + pattern_);
    }
    if (c != '{') {
      literal += c;
      ++i;
      continue;
    }

    size_t close = pattern_.find('}', i);
    if (close == std::string::npos) {
      throw LoggingError("Unterminated placeholder in format template: " +
                         pattern_);
    }
    std::string token = pattern_.substr(i, close - i + 1);

    Field field;
    if (token == fields::kTimestamp) {
      field = Field::Timestamp;
    } else if (token == fields::kLoggerName) {
      field = Field::LoggerName;
    } else if (token == fields::kLevel) {
      field = Field::Level;
    } else if (token == fields::kModule) {
      field = Field::Module;
    } else if (token == fields::kFunction) {
      field = Field::Function;
    } else if (token == fields::kLine) {
      field = Field::Line;
    } else if (token == fields::kMessage) {
      field = Field::Message;
    } else {
      throw LoggingError("Unknown placeholder " + token +
                         " in format template: " + pattern_);
    }

    flushLiteral();
    segments_.push_back({field, std::string()});
    i = close + 1;
  }

  flushLiteral();
}

std::string PatternFormatter::format(const LogMessage& msg) const {
  std::ostringstream oss;

  for (const auto& segment : segments_) {
    switch (segment.field) {
      case Field::Literal:
        oss << segment.text;
        break;
      case Field::Timestamp:
        oss << formatTimestamp(msg.timestamp);
        break;
      case Field::LoggerName:
        oss << msg.logger_name;
        break;
      case Field::Level:
        oss << logLevelToString(msg.level);
        break;
      case Field::Module: {
        std::string module = msg.module();
        oss << (module.empty() ? "-" : module);
        break;
      }
      case Field::Function:
        oss << (msg.function ? msg.function : "-");
        break;
      case Field::Line:
        oss << msg.line;
        break;
      case Field::Message:
        oss << msg.message;
        break;
    }
  }

  return oss.str();
}

}  // namespace logging
}  // namespace runlog
