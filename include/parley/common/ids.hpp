#pragma once

#include "parley/common/result.hpp"

#include <cstddef>
#include <string>

namespace parley::common {

/// Hex string of `bytes` random bytes from the OpenSSL CSPRNG.
[[nodiscard]] Result<std::string> random_hex(std::size_t bytes);

/// Compares secrets without an early exit on the first mismatch.
[[nodiscard]] bool constant_time_equals(const std::string &a, const std::string &b);

} // namespace parley::common
