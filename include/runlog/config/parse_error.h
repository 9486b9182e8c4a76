/**
 * @file parse_error.h
 * @brief Located errors for logging configuration files
 *
 * ParseContext follows the parser down the document ("loggers[1]",
 * "handlers[0]", "level") so an error names the exact field, and takes the
 * line from the YAML node it complains about.
 */

#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace runlog {
namespace config {

/**
 * @brief A configuration problem with the field path, file and line it was
 * found at. Empty field or file and a line <= 0 mean "unknown".
 */
class ConfigParseError : public std::runtime_error {
 public:
  ConfigParseError(const std::string& message,
                   const std::string& field = "",
                   const std::string& file = "",
                   int line = -1)
      : std::runtime_error(describe(message, field, file, line)),
        message_(message),
        field_(field),
        file_(file),
        line_(line) {}

  const std::string& message() const { return message_; }
  const std::string& field() const { return field_; }
  const std::string& file() const { return file_; }
  int line() const { return line_; }

  bool hasLocation() const { return !file_.empty() && line_ > 0; }

 private:
  // "Configuration parse error in <file>:<line> at field '<field>': <msg>"
  static std::string describe(const std::string& message,
                              const std::string& field,
                              const std::string& file,
                              int line) {
    std::ostringstream oss;
    oss << "Configuration parse error";
    if (!file.empty()) {
      oss << " in " << file;
      if (line > 0) {
        oss << ":" << line;
      }
    }
    if (!field.empty()) {
      oss << " at field '" << field << "'";
    }
    oss << ": " << message;
    return oss.str();
  }

  std::string message_;
  std::string field_;
  std::string file_;
  int line_;
};

/**
 * @brief Tracks where the parser is in the document
 */
class ParseContext {
 public:
  explicit ParseContext(const std::string& source = "") : source_(source) {}

  const std::string& source() const { return source_; }

  /**
   * @brief Dotted path of the current position, e.g.
   * "loggers[1].handlers[0].level"
   */
  std::string path() const {
    std::string result;
    for (const auto& segment : segments_) {
      if (!result.empty() && segment[0] != '[') {
        result += '.';
      }
      result += segment;
    }
    return result;
  }

  ConfigParseError createError(const std::string& message) const {
    return ConfigParseError(message, path(), source_);
  }

  // Uses the node's position for the line number, when yaml-cpp knows it
  ConfigParseError createError(const std::string& message,
                               const YAML::Node& node) const {
    return ConfigParseError(message, path(), source_, lineOf(node));
  }

  static int lineOf(const YAML::Node& node) {
    if (!node.IsDefined()) {
      return -1;
    }
    const YAML::Mark mark = node.Mark();
    return mark.is_null() ? -1 : mark.line + 1;
  }

  /**
   * @brief Enters a mapping key for the lifetime of the scope
   */
  class FieldScope {
   public:
    FieldScope(ParseContext& ctx, const std::string& field) : ctx_(ctx) {
      ctx_.segments_.push_back(field);
    }
    ~FieldScope() { ctx_.segments_.pop_back(); }

    FieldScope(const FieldScope&) = delete;
    FieldScope& operator=(const FieldScope&) = delete;

   private:
    ParseContext& ctx_;
  };

  /**
   * @brief Enters a sequence element, shown as "[index]"
   */
  class IndexScope : public FieldScope {
   public:
    IndexScope(ParseContext& ctx, size_t index)
        : FieldScope(ctx, "[" + std::to_string(index) + "]") {}
  };

 private:
  std::string source_;
  std::vector<std::string> segments_;
};

}  // namespace config
}  // namespace runlog
