#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace runlog {
namespace logging {

// Time source used for run identifiers, directory names and record timestamps
using Clock = std::function<std::chrono::system_clock::time_point()>;

// Current date as YYYY-MM-DD (local time)
std::string createDatestamp(const std::chrono::system_clock::time_point& tp);

// Current time of day as HHMMSS (local time)
std::string createTimestamp(const std::chrono::system_clock::time_point& tp);

// YYYY-MM-DD_HHMMSS
std::string createLogDatetimeStamp(
    const std::chrono::system_clock::time_point& tp);

// YYYY-MM-DD_HHMMSS_<run_name>, or just the datetime stamp when run_name is
// empty
std::string composeGlobalRunId(const std::chrono::system_clock::time_point& tp,
                               const std::string& run_name);

}  // namespace logging
}  // namespace runlog
