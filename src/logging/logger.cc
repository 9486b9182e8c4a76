#include "runlog/logging/logger.h"

#include <filesystem>
#include <system_error>

#include "runlog/logging/logger_registry.h"
#include "runlog/logging/logging_error.h"

namespace runlog {
namespace logging {

namespace fs = std::filesystem;

namespace {

// Another logger may create the same directory concurrently, so an
// existing directory counts as success.
void createDirectory(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec && !fs::is_directory(dir)) {
    throw LoggingError("Failed to create log directory " + dir.string() +
                       ": " + ec.message());
  }
}

void removeTree(const fs::path& path) {
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    throw LoggingError("Failed to remove " + path.string() + ": " +
                       ec.message());
  }
}

}  // namespace

Logger::Logger(LoggerRegistry& registry,
               const std::string& name,
               const std::string& base_directory,
               Clock clock)
    : registry_(&registry),
      name_(name),
      base_directory_(fs::absolute(base_directory).lexically_normal().string()),
      clock_(clock ? std::move(clock)
                   : [] { return std::chrono::system_clock::now(); }) {
  createDirectory(base_directory_);
}

LogMessage Logger::makeMessage(LogLevel level,
                               const char* file,
                               int line,
                               const char* function) const {
  LogMessage msg;
  msg.level = level;
  msg.logger_name = name_;
  msg.timestamp = clock_();
  msg.file = file;
  msg.line = line;
  msg.function = function;
  return msg;
}

std::vector<std::shared_ptr<LogSink>> Logger::sinkSnapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::shared_ptr<LogSink>> sinks;
  sinks.reserve(handlers_.size());
  for (const auto& entry : handlers_) {
    sinks.push_back(entry.second);
  }
  return sinks;
}

LoggerRegistry& Logger::registry() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!registry_) {
    throw LoggingError("Logger '" + name_ +
                       "' is no longer attached to a registry");
  }
  return *registry_;
}

void Logger::dispatch(const LogMessage& msg) {
  // Sinks serialize their own output
  for (const auto& sink : sinkSnapshot()) {
    if (sink->shouldLog(msg.level)) {
      sink->log(msg);
    }
  }
}

bool Logger::attachHandler(const std::string& handler_name,
                           std::shared_ptr<LogSink> sink) {
  bool duplicate = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(handler_name);
    if (it == handlers_.end()) {
      handlers_.emplace(handler_name, std::move(sink));
    } else if (it->second != sink) {
      duplicate = true;
    }
  }

  if (duplicate) {
    warning("Handler with name {} already exists in logger {}", handler_name,
            name_);
    return false;
  }
  return true;
}

void Logger::addConsoleHandler(const std::string& handler_name,
                               LogLevel level,
                               const std::string& format,
                               StdioSink::Target target) {
  if (hasHandler(handler_name)) {
    warning("Handler with name {} already exists in logger {}", handler_name,
            name_);
    return;
  }

  attachHandler(handler_name,
                SinkFactory::createStdioSink(target == StdioSink::Stderr,
                                             level, format));
}

void Logger::addFileHandler(const std::string& handler_name,
                            LogLevel level,
                            const std::string& format) {
  // Resolve the run id before taking our own lock; the registry lock is
  // always acquired first.
  const std::string run_id = registry().getRunId();

  std::string file_path;
  bool duplicate = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handlers_.count(handler_name) > 0) {
      duplicate = true;
    } else {
      fs::path run_dir = createRunIdDirectoryLocked(run_id);
      file_path = (run_dir / (run_id + "_" + handler_name + ".log")).string();
      handlers_.emplace(handler_name,
                        SinkFactory::createFileSink(file_path, level, format));
    }
  }

  if (duplicate) {
    warning("Handler with name {} already exists in logger {}", handler_name,
            name_);
    return;
  }

  debug("File handler {} added to logger {} with path: {}", handler_name,
        name_, file_path);
}

void Logger::joinHandler(const std::string& logger_name,
                         const std::string& handler_name) {
  auto source = registry().getLogger(logger_name);
  attachHandler(handler_name, source->getHandler(handler_name));
}

void Logger::removeHandler(const std::string& handler_name) {
  std::shared_ptr<LogSink> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(handler_name);
    if (it != handlers_.end()) {
      removed = std::move(it->second);
      handlers_.erase(it);
    }
  }

  if (!removed) {
    warning("removeHandler: handler {} does not exist in logger {}",
            handler_name, name_);
    return;
  }

  // Other loggers may still write to a shared sink, so it stays open
  removed->flush();
}

void Logger::setHandlerLevel(const std::string& handler_name, LogLevel level) {
  std::shared_ptr<LogSink> sink;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(handler_name);
    if (it != handlers_.end()) {
      sink = it->second;
    }
  }

  if (!sink) {
    warning("setHandlerLevel: handler {} does not exist in logger {}",
            handler_name, name_);
    return;
  }
  sink->setLevel(level);
}

bool Logger::hasHandler(const std::string& handler_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.count(handler_name) > 0;
}

std::shared_ptr<LogSink> Logger::getHandler(
    const std::string& handler_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = handlers_.find(handler_name);
  if (it == handlers_.end()) {
    throw NotFoundError("Handler", handler_name, name_);
  }
  return it->second;
}

std::vector<std::string> Logger::getHandlerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> names;
  names.reserve(handlers_.size());
  for (const auto& entry : handlers_) {
    names.push_back(entry.first);
  }
  return names;
}

void Logger::clearTodaysLogs() {
  fs::path date_dir = fs::path(base_directory_) / createDatestamp(clock_());

  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  if (fs::exists(date_dir, ec)) {
    removeTree(date_dir);
  }
}

void Logger::clearAllLogs() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  if (!fs::is_directory(base_directory_, ec)) {
    return;
  }

  // Collect first; removing while iterating invalidates the iterator
  std::vector<fs::path> entries;
  fs::directory_iterator it(base_directory_, ec);
  for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
    entries.push_back(it->path());
  }
  if (ec) {
    throw LoggingError("Failed to list " + base_directory_ + ": " +
                       ec.message());
  }
  for (const auto& path : entries) {
    removeTree(path);
  }
}

std::string Logger::getDateDirectory() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return date_directory_;
}

std::string Logger::getRunDirectory() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return run_directory_;
}

std::string Logger::getRunId() const { return registry().getRunId(); }

bool Logger::isDetached() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registry_ == nullptr;
}

void Logger::flush() {
  for (const auto& sink : sinkSnapshot()) {
    sink->flush();
  }
}

std::string Logger::createRunIdDirectoryLocked(const std::string& run_id) {
  fs::path date_dir = fs::path(base_directory_) / createDatestamp(clock_());
  createDirectory(date_dir);
  date_directory_ = date_dir.string();

  fs::path run_dir = date_dir / run_id;
  createDirectory(run_dir);
  run_directory_ = run_dir.string();

  return run_directory_;
}

std::map<std::string, std::shared_ptr<LogSink>> Logger::detach() {
  std::lock_guard<std::mutex> lock(mutex_);
  registry_ = nullptr;

  std::map<std::string, std::shared_ptr<LogSink>> detached;
  detached.swap(handlers_);
  return detached;
}

}  // namespace logging
}  // namespace runlog
