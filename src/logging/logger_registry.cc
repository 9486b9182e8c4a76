#include "runlog/logging/logger_registry.h"

#include <map>
#include <set>

#include "runlog/logging/logging_error.h"

namespace runlog {
namespace logging {

LoggerRegistry::LoggerRegistry(const std::string& base_directory, Clock clock)
    : base_directory_(base_directory),
      clock_(clock ? std::move(clock)
                   : [] { return std::chrono::system_clock::now(); }) {}

LoggerRegistry::~LoggerRegistry() { reset(); }

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  return getOrCreateLogger(name, base_directory_);
}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name, const std::string& base_directory) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }

  // Create new logger, capturing every record until told otherwise
  auto logger = std::make_shared<Logger>(*this, name, base_directory, clock_);
  logger->setLevel(LogLevel::Debug);

  // First logger fixes the run id for the whole registry
  ensureRunIdLocked();

  loggers_[name] = logger;
  return logger;
}

std::shared_ptr<Logger> LoggerRegistry::getLogger(
    const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = loggers_.find(name);
  if (it == loggers_.end()) {
    throw NotFoundError("Logger", name);
  }
  return it->second;
}

bool LoggerRegistry::hasLogger(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loggers_.count(name) > 0;
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> names;
  names.reserve(loggers_.size());

  for (const auto& entry : loggers_) {
    names.push_back(entry.first);
  }

  return names;
}

void LoggerRegistry::deleteLogger(const std::string& name) {
  std::map<std::string, std::shared_ptr<LogSink>> detached;
  std::set<const LogSink*> in_use;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loggers_.find(name);
    if (it == loggers_.end()) {
      return;
    }
    detached = it->second->detach();
    loggers_.erase(it);

    for (const auto& entry : loggers_) {
      for (const auto& sink : entry.second->sinkSnapshot()) {
        in_use.insert(sink.get());
      }
    }
  }

  // Joined sinks stay open for the loggers that still write to them
  for (auto& entry : detached) {
    if (in_use.count(entry.second.get()) > 0) {
      entry.second->flush();
    } else {
      entry.second->close();
    }
  }
}

void LoggerRegistry::setRunName(const std::string& run_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  run_id_ = composeGlobalRunId(clock_(), run_name);
}

std::string LoggerRegistry::getRunId() {
  std::lock_guard<std::mutex> lock(mutex_);
  ensureRunIdLocked();
  return run_id_;
}

void LoggerRegistry::resetRunId() {
  std::lock_guard<std::mutex> lock(mutex_);
  run_id_.clear();
}

void LoggerRegistry::reset() {
  std::vector<std::shared_ptr<LogSink>> sinks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : loggers_) {
      for (auto& handler : entry.second->detach()) {
        sinks.push_back(std::move(handler.second));
      }
    }
    loggers_.clear();
    run_id_.clear();
  }

  // Shared sinks appear once per holder
  for (auto& sink : sinks) {
    sink->close();
  }
}

void LoggerRegistry::ensureRunIdLocked() {
  if (run_id_.empty()) {
    run_id_ = composeGlobalRunId(clock_(), "");
  }
}

}  // namespace logging
}  // namespace runlog
