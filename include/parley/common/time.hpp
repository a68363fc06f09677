#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace parley::common {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

[[nodiscard]] std::int64_t to_epoch_ms(Timestamp value);
[[nodiscard]] Timestamp from_epoch_ms(std::int64_t millis);
[[nodiscard]] std::int64_t unix_seconds(Timestamp value);
[[nodiscard]] std::string format_rfc3339(Timestamp value);

} // namespace parley::common
