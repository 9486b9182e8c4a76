#include "runlog/logging/log_sink.h"

#include "runlog/logging/logging_error.h"

namespace runlog {
namespace logging {

// StdioSink, NullSink and ExternalSink are implemented inline in the header

// FileSink implementation
FileSink::FileSink(const std::string& filename) : filename_(filename) {
  // Records are UTF-8 already; binary mode writes the bytes unchanged
  file_.open(filename_, std::ios::out | std::ios::app | std::ios::binary);
  if (!file_.is_open()) {
    throw LoggingError("Failed to open log file " + filename_);
  }
}

FileSink::~FileSink() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

void FileSink::log(const LogMessage& msg) {
  std::string formatted = formatMessage(msg);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open()) {
    return;
  }

  file_ << formatted;
  if (formatted.empty() || formatted.back() != '\n') {
    file_ << '\n';
  }
  file_.flush();
}

void FileSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
  }
}

void FileSink::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_.store(true, std::memory_order_release);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

// SinkFactory implementation
std::shared_ptr<FileSink> SinkFactory::createFileSink(
    const std::string& filename, LogLevel level, const std::string& pattern) {
  // Validate the template before the file is created
  auto formatter = std::make_unique<PatternFormatter>(pattern);
  auto sink = std::make_shared<FileSink>(filename);
  sink->setLevel(level);
  sink->setFormatter(std::move(formatter));
  return sink;
}

std::shared_ptr<StdioSink> SinkFactory::createStdioSink(
    bool use_stderr, LogLevel level, const std::string& pattern) {
  auto sink = std::make_shared<StdioSink>(use_stderr ? StdioSink::Stderr
                                                     : StdioSink::Stdout);
  sink->setLevel(level);
  sink->setFormatter(std::make_unique<PatternFormatter>(pattern));
  return sink;
}

std::shared_ptr<NullSink> SinkFactory::createNullSink() {
  return std::make_shared<NullSink>();
}

std::shared_ptr<ExternalSink> SinkFactory::createExternalSink(
    ExternalSink::LogCallback callback,
    LogLevel level,
    const std::string& pattern) {
  auto sink = std::make_shared<ExternalSink>(callback);
  sink->setLevel(level);
  sink->setFormatter(std::make_unique<PatternFormatter>(pattern));
  return sink;
}

}  // namespace logging
}  // namespace runlog
