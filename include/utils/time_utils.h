#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace TimeUtils {

inline std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::stringstream ss;
  struct tm tm_buf;
  std::tm *tm_ptr = localtime_r(&time_t, &tm_buf);
  if (!tm_ptr) {
    return "";
  }
  ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

// UTC timestamp in ISO-8601 form with millisecond precision, e.g.
// 2024-05-01T12:00:00.123Z. Stored in target databases; sorts lexically.
inline std::string toIso8601Utc(std::chrono::system_clock::time_point tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::stringstream ss;
  struct tm tm_buf;
  if (!gmtime_r(&time_t, &tm_buf)) {
    return "";
  }
  ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
  return ss.str();
}

inline std::string nowIso8601Utc() {
  return toIso8601Utc(std::chrono::system_clock::now());
}

} // namespace TimeUtils

#endif
