#pragma once

#include <atomic>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include "runlog/logging/log_formatter.h"
#include "runlog/logging/log_message.h"

namespace runlog {
namespace logging {

// Base sink interface. A sink is the handler object that loggers attach under
// a name; one sink may be attached to several loggers at once.
class LogSink {
 public:
  virtual ~LogSink() = default;

  // Core logging
  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;

  // Flush and release the underlying resource. Records arriving afterwards
  // are dropped.
  virtual void close() {
    flush();
    closed_.store(true, std::memory_order_release);
  }

  virtual SinkType type() const = 0;

  // Level threshold, checked by the logger before log() is called
  void setLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
  }

  LogLevel getLevel() const { return level_.load(std::memory_order_relaxed); }

  bool shouldLog(LogLevel level) const {
    return !isClosed() && level != LogLevel::Off && level >= getLevel();
  }

  bool isClosed() const { return closed_.load(std::memory_order_acquire); }

  // Set formatter
  virtual void setFormatter(std::unique_ptr<Formatter> formatter) {
    std::lock_guard<std::mutex> lock(formatter_mutex_);
    formatter_ = std::move(formatter);
  }

 protected:
  std::string formatMessage(const LogMessage& msg) const {
    std::lock_guard<std::mutex> lock(formatter_mutex_);
    return formatter_->format(msg);
  }

  std::atomic<bool> closed_{false};

 private:
  std::atomic<LogLevel> level_{LogLevel::Debug};
  mutable std::mutex formatter_mutex_;
  std::unique_ptr<Formatter> formatter_{std::make_unique<PatternFormatter>()};
};

// Stdio sink (stdout/stderr)
class StdioSink : public LogSink {
 public:
  enum Target { Stdout, Stderr };

  explicit StdioSink(Target target = Stderr) : target_(target) {}

  void log(const LogMessage& msg) override {
    std::string line = formatMessage(msg);
    std::lock_guard<std::mutex> lock(mutex_);
    if (isClosed()) {
      return;
    }
    auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
    stream << line << std::endl;
  }

  void flush() override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
    stream.flush();
  }

  SinkType type() const override { return SinkType::Stdio; }

  Target target() const { return target_; }

 private:
  Target target_;
  std::mutex mutex_;
};

// Append-mode file sink. Every record is flushed to the file as it is
// written, so other readers see complete lines.
class FileSink : public LogSink {
 public:
  // Throws LoggingError if the file cannot be opened
  explicit FileSink(const std::string& filename);
  ~FileSink() override;

  void log(const LogMessage& msg) override;
  void flush() override;
  void close() override;

  SinkType type() const override { return SinkType::File; }

  const std::string& filename() const { return filename_; }

 private:
  std::string filename_;
  std::ofstream file_;
  std::mutex mutex_;
};

// High-performance null sink
class NullSink : public LogSink {
 public:
  void log(const LogMessage&) override {}  // No-op
  void flush() override {}
  SinkType type() const override { return SinkType::Null; }
};

// Forwards formatted records to a callback, for embedding applications
class ExternalSink : public LogSink {
 public:
  using LogCallback =
      std::function<void(LogLevel, const std::string&, const std::string&)>;

  explicit ExternalSink(LogCallback callback) : callback_(callback) {}

  void log(const LogMessage& msg) override {
    if (callback_ && !isClosed()) {
      callback_(msg.level, msg.logger_name, formatMessage(msg));
    }
  }

  void flush() override {}  // External system handles flushing
  SinkType type() const override { return SinkType::External; }

 private:
  LogCallback callback_;
};

// Sink factory for easy creation
class SinkFactory {
 public:
  static std::shared_ptr<FileSink> createFileSink(
      const std::string& filename,
      LogLevel level = LogLevel::Info,
      const std::string& pattern = formats::kBasic);

  static std::shared_ptr<StdioSink> createStdioSink(
      bool use_stderr = true,
      LogLevel level = LogLevel::Info,
      const std::string& pattern = formats::kBasic);

  static std::shared_ptr<NullSink> createNullSink();

  static std::shared_ptr<ExternalSink> createExternalSink(
      ExternalSink::LogCallback callback,
      LogLevel level = LogLevel::Debug,
      const std::string& pattern = formats::kBasic);
};

}  // namespace logging
}  // namespace runlog
