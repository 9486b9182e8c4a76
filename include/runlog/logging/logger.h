#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "runlog/logging/log_level.h"
#include "runlog/logging/log_message.h"
#include "runlog/logging/log_sink.h"
#include "runlog/logging/run_id.h"

namespace runlog {
namespace logging {

class LoggerRegistry;

// A named logger with a set of named handlers (sinks).
//
// Loggers are obtained through LoggerRegistry::getOrCreateLogger(), which
// guarantees one instance per name. When the registry deletes the logger,
// resets or is destroyed, the logger is detached from it: plain logging keeps
// working, but calls that need the registry (addFileHandler, joinHandler,
// getRunId) throw LoggingError.
//
// A record is produced only if its level passes the logger's own level; each
// attached handler then applies its own threshold.
class Logger : public std::enable_shared_from_this<Logger> {
 public:
  // Level constants for call sites that only include this header
  static constexpr LogLevel kDebug = LogLevel::Debug;
  static constexpr LogLevel kInfo = LogLevel::Info;
  static constexpr LogLevel kWarning = LogLevel::Warning;
  static constexpr LogLevel kWarn = LogLevel::Warning;
  static constexpr LogLevel kError = LogLevel::Error;
  static constexpr LogLevel kCritical = LogLevel::Critical;

  Logger(LoggerRegistry& registry,
         const std::string& name,
         const std::string& base_directory,
         Clock clock);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Core logging methods. Without arguments the message is written
  // verbatim; with arguments it is an fmt format string.
  template <typename... Args>
  void debug(const char* fmt, Args&&... args) {
    log(LogLevel::Debug, nullptr, 0, nullptr, fmt,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const char* fmt, Args&&... args) {
    log(LogLevel::Info, nullptr, 0, nullptr, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warning(const char* fmt, Args&&... args) {
    log(LogLevel::Warning, nullptr, 0, nullptr, fmt,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const char* fmt, Args&&... args) {
    warning(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const char* fmt, Args&&... args) {
    log(LogLevel::Error, nullptr, 0, nullptr, fmt,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void critical(const char* fmt, Args&&... args) {
    log(LogLevel::Critical, nullptr, 0, nullptr, fmt,
        std::forward<Args>(args)...);
  }

  void debug(const std::string& message) { debug(message.c_str()); }
  void info(const std::string& message) { info(message.c_str()); }
  void warning(const std::string& message) { warning(message.c_str()); }
  void warn(const std::string& message) { warning(message.c_str()); }
  void error(const std::string& message) { error(message.c_str()); }
  void critical(const std::string& message) { critical(message.c_str()); }

  // Direct log with location
  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           const char* fmt,
           Args&&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg = makeMessage(level, file, line, function);
    // A null format string yields a record with an empty message
    if (fmt) {
      if constexpr (sizeof...(Args) == 0) {
        msg.message = fmt;
      } else {
        msg.message =
            fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
      }
    }
    dispatch(msg);
  }

  // Handler management. Adding under a name that is already attached, or
  // removing/adjusting a name that is not, logs a warning through this
  // logger and leaves the handlers unchanged.
  void addConsoleHandler(const std::string& handler_name,
                         LogLevel level = LogLevel::Info,
                         const std::string& format = formats::kBasic,
                         StdioSink::Target target = StdioSink::Stderr);

  // Opens <base>/<YYYY-MM-DD>/<run_id>/<run_id>_<handler_name>.log in append
  // mode. Throws LoggingError if the directories or file cannot be created.
  void addFileHandler(const std::string& handler_name = "main",
                      LogLevel level = LogLevel::Info,
                      const std::string& format = formats::kBasic);

  // Attach an existing sink under handler_name. Returns false (after logging
  // a warning) if a different sink is already attached under that name.
  bool attachHandler(const std::string& handler_name,
                     std::shared_ptr<LogSink> sink);

  // Attach the very sink that logger_name has under handler_name.
  // Throws NotFoundError if either does not exist, LoggingError if this
  // logger is detached.
  void joinHandler(const std::string& logger_name,
                   const std::string& handler_name);

  void removeHandler(const std::string& handler_name);
  void setHandlerLevel(const std::string& handler_name, LogLevel level);

  bool hasHandler(const std::string& handler_name) const;

  // Throws NotFoundError if no handler is attached under handler_name
  std::shared_ptr<LogSink> getHandler(const std::string& handler_name) const;

  std::vector<std::string> getHandlerNames() const;

  // Log directory maintenance
  void clearTodaysLogs();
  void clearAllLogs();

  void setLevel(LogLevel level) {
    effective_level_.store(level, std::memory_order_relaxed);
  }

  LogLevel getLevel() const {
    return effective_level_.load(std::memory_order_relaxed);
  }

  bool shouldLog(LogLevel level) const {
    return level != LogLevel::Off &&
           level >= effective_level_.load(std::memory_order_relaxed);
  }

  const std::string& getName() const { return name_; }
  const std::string& getBaseDirectory() const { return base_directory_; }

  // Empty until a file handler has created them
  std::string getDateDirectory() const;
  std::string getRunDirectory() const;

  // Throws LoggingError if this logger is detached
  std::string getRunId() const;

  bool isDetached() const;

  void flush();

 private:
  friend class LoggerRegistry;

  LogMessage makeMessage(LogLevel level,
                         const char* file,
                         int line,
                         const char* function) const;

  void dispatch(const LogMessage& msg);

  std::vector<std::shared_ptr<LogSink>> sinkSnapshot() const;

  // The owning registry; throws LoggingError once detached
  LoggerRegistry& registry() const;

  // Creates <base>/<date>/<run_id>, assumes mutex_ held
  std::string createRunIdDirectoryLocked(const std::string& run_id);

  // Forget the registry and hand back every handler. The registry decides
  // which of them to close.
  std::map<std::string, std::shared_ptr<LogSink>> detach();

  LoggerRegistry* registry_;  // guarded by mutex_, null once detached
  const std::string name_;
  const std::string base_directory_;
  Clock clock_;
  std::atomic<LogLevel> effective_level_{LogLevel::Debug};

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<LogSink>> handlers_;
  std::string date_directory_;
  std::string run_directory_;
};

}  // namespace logging
}  // namespace runlog
