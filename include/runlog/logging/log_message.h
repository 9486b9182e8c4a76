#pragma once

#include <chrono>
#include <string>
#include <thread>
#include <unistd.h>

#include "runlog/logging/log_level.h"

namespace runlog {
namespace logging {

// A single log record as handed to sinks
struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp;

  // Logger information
  std::string logger_name;

  // Source location, set when logging through the location-aware macros
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  // Process and thread info
  pid_t process_id{0};
  std::thread::id thread_id;

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        process_id(getpid()),
        thread_id(std::this_thread::get_id()) {}

  // Source file name without directory and extension
  std::string module() const;
};

}  // namespace logging
}  // namespace runlog
