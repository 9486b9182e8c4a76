#include "runlog/logging/run_id.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace runlog {
namespace logging {

static std::string formatLocalTime(
    const std::chrono::system_clock::time_point& tp, const char* format) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, format);
  return oss.str();
}

std::string createDatestamp(const std::chrono::system_clock::time_point& tp) {
  return formatLocalTime(tp, "%Y-%m-%d");
}

std::string createTimestamp(const std::chrono::system_clock::time_point& tp) {
  return formatLocalTime(tp, "%H%M%S");
}

std::string createLogDatetimeStamp(
    const std::chrono::system_clock::time_point& tp) {
  return createDatestamp(tp) + "_" + createTimestamp(tp);
}

std::string composeGlobalRunId(const std::chrono::system_clock::time_point& tp,
                               const std::string& run_name) {
  std::string time_id = createLogDatetimeStamp(tp);
  if (run_name.empty()) {
    return time_id;
  }
  return time_id + "_" + run_name;
}

}  // namespace logging
}  // namespace runlog
