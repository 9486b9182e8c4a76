#pragma once

#include <stdexcept>
#include <string>

namespace runlog {
namespace logging {

// Base class for errors raised by the logging layer
class LoggingError : public std::runtime_error {
 public:
  explicit LoggingError(const std::string& message)
      : std::runtime_error(message) {}
};

// A logger or handler that must exist was not found
class NotFoundError : public LoggingError {
 public:
  NotFoundError(const std::string& kind,
                const std::string& name,
                const std::string& owner = "")
      : LoggingError(formatError(kind, name, owner)),
        kind_(kind),
        name_(name),
        owner_(owner) {}

  const std::string& kind() const { return kind_; }
  const std::string& name() const { return name_; }

  // Logger that was searched, for handler lookups
  const std::string& owner() const { return owner_; }

 private:
  static std::string formatError(const std::string& kind,
                                 const std::string& name,
                                 const std::string& owner) {
    std::string msg = kind + " '" + name + "'";
    if (!owner.empty()) {
      msg += " in logger '" + owner + "'";
    }
    return msg + " does not exist";
  }

  std::string kind_;
  std::string name_;
  std::string owner_;
};

}  // namespace logging
}  // namespace runlog
