#include "parley/common/error.hpp"

#include <array>
#include <utility>

namespace parley::common {

namespace {

constexpr std::array<std::pair<ErrorCode, std::string_view>, 6> kErrorNames = {{
    {ErrorCode::Validation, "validation_error"},
    {ErrorCode::State, "state_error"},
    {ErrorCode::Stream, "stream_error"},
    {ErrorCode::Timeout, "timeout_error"},
    {ErrorCode::Resource, "resource_error"},
    {ErrorCode::ContentRejected, "content_rejected"},
}};

} // namespace

std::string_view error_code_name(const ErrorCode code) {
  for (const auto &[candidate, name] : kErrorNames) {
    if (candidate == code) {
      return name;
    }
  }
  return "stream_error";
}

std::optional<ErrorCode> error_code_from_name(const std::string_view name) {
  for (const auto &[code, candidate] : kErrorNames) {
    if (candidate == name) {
      return code;
    }
  }
  return std::nullopt;
}

std::string Error::to_string() const {
  std::string out(error_code_name(code));
  if (!message.empty()) {
    out += ": " + message;
  }
  return out;
}

} // namespace parley::common
