#ifndef JSONCHECK_CORE_TIME_UTILS_HPP_
#define JSONCHECK_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace jsoncheck::core {

// UTC timestamp with millisecond precision, e.g. 2024-05-01T12:00:00.250Z.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Wall time of one pipeline stage, measured on the steady clock.
class StageTimer {
public:
  StageTimer() : start_(std::chrono::steady_clock::now()) {}

  void Restart() {
    start_ = std::chrono::steady_clock::now();
  }

  double ElapsedMillis() const {
    const auto elapsed = std::chrono::steady_clock::now() - start_;
    return std::chrono::duration<double, std::milli>(elapsed).count();
  }

private:
  std::chrono::steady_clock::time_point start_;
};

inline std::string FormatMillis(double millis) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << std::setw(8) << millis << " ms";
  return out.str();
}

} // namespace jsoncheck::core

#endif // JSONCHECK_CORE_TIME_UTILS_HPP_
