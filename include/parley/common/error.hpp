#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace parley::common {

enum class ErrorCode {
  Validation,
  State,
  Stream,
  Timeout,
  Resource,
  ContentRejected,
};

/// Wire name sent to devices in `error.code`.
[[nodiscard]] std::string_view error_code_name(ErrorCode code);
[[nodiscard]] std::optional<ErrorCode> error_code_from_name(std::string_view name);

struct Error {
  ErrorCode code = ErrorCode::Stream;
  std::string message;

  [[nodiscard]] std::string to_string() const;
};

} // namespace parley::common
