#include "parley/common/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace parley::common {

std::int64_t to_epoch_ms(const Timestamp value) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
}

Timestamp from_epoch_ms(const std::int64_t millis) {
  return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

std::int64_t unix_seconds(const Timestamp value) {
  return std::chrono::duration_cast<std::chrono::seconds>(value.time_since_epoch()).count();
}

std::string format_rfc3339(const Timestamp value) {
  const auto t = Clock::to_time_t(value);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

} // namespace parley::common
