#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "runlog/logging/logger.h"
#include "runlog/logging/run_id.h"

namespace runlog {
namespace logging {

// Default root for file handlers, relative to the working directory
constexpr const char* kDefaultLogDirectory = "data/logs";

// Owns the loggers of one application (or one test) by name, together with
// the run identifier that namespaces their log files. The registry is an
// ordinary object: construct one and pass it to the code that needs loggers.
//
// Destroying the registry resets it. Loggers that outlive it are detached.
class LoggerRegistry {
 public:
  explicit LoggerRegistry(const std::string& base_directory = kDefaultLogDirectory,
                          Clock clock = nullptr);
  ~LoggerRegistry();

  LoggerRegistry(const LoggerRegistry&) = delete;
  LoggerRegistry& operator=(const LoggerRegistry&) = delete;

  // Get or create logger. A new logger starts at LogLevel::Debug, gets the
  // registry's base directory and makes sure the run id exists.
  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);

  // Same, with a base directory for a newly created logger. Ignored when the
  // logger already exists.
  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name,
                                            const std::string& base_directory);

  // Throws NotFoundError if no logger is registered under name
  std::shared_ptr<Logger> getLogger(const std::string& name) const;

  bool hasLogger(const std::string& name) const;

  // Get all registered loggers
  std::vector<std::string> getLoggerNames() const;

  // Detach the named logger and every handler from it, then forget it.
  // Handlers that no other registered logger still holds are closed; shared
  // ones are flushed and stay open. No-op if absent.
  void deleteLogger(const std::string& name);

  // Regenerate the run id as <YYYY-MM-DD>_<HHMMSS>_<run_name>. Files that
  // are already open keep their paths.
  void setRunName(const std::string& run_name);

  // Generated on first use
  std::string getRunId();

  // Forget the run id; the next use generates a fresh one
  void resetRunId();

  // Detach every logger, close all handlers and reset the run id. Loggers
  // still held by callers keep logging to nothing.
  void reset();

  const std::string& getBaseDirectory() const { return base_directory_; }

  std::chrono::system_clock::time_point now() const { return clock_(); }

 private:
  void ensureRunIdLocked();  // Assumes mutex already locked

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::string run_id_;
  std::string base_directory_;
  Clock clock_;
};

}  // namespace logging
}  // namespace runlog
