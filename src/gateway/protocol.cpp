#include "parley/gateway/protocol.hpp"

#include "parley/common/fs.hpp"
#include "parley/common/json_util.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace parley::gateway {

namespace {

using ParseResult = common::Result<ClientMessage>;

std::optional<double> parse_number(const std::string &raw) {
  if (raw.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double value = std::strtod(raw.c_str(), &end);
  if (end == raw.c_str() || *end != '\0' || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

bool valid_encoding(const std::string &value) {
  if (value.empty() || value.size() > 32) {
    return false;
  }
  for (const char ch : value) {
    const auto byte = static_cast<unsigned char>(ch);
    if (!(std::isupper(byte) != 0 || std::isdigit(byte) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

bool valid_language(const std::string &value) {
  if (value.empty() || value.size() > 35) {
    return false;
  }
  for (const char ch : value) {
    const auto byte = static_cast<unsigned char>(ch);
    if (!(std::isalnum(byte) != 0 || ch == '-')) {
      return false;
    }
  }
  return true;
}

} // namespace

std::string_view to_string(const MessageType type) {
  switch (type) {
  case MessageType::ListeningStart:
    return "listening_start";
  case MessageType::ListeningEnd:
    return "listening_end";
  case MessageType::Ping:
    return "ping";
  case MessageType::Pong:
    return "pong";
  case MessageType::SpeakingStart:
    return "speaking_start";
  case MessageType::SpeakingEnd:
    return "speaking_end";
  case MessageType::Error:
    return "error";
  }
  return "error";
}

std::optional<MessageType> parse_message_type(const std::string_view value) {
  for (const auto type : {MessageType::ListeningStart, MessageType::ListeningEnd, MessageType::Ping,
                          MessageType::Pong, MessageType::SpeakingStart, MessageType::SpeakingEnd,
                          MessageType::Error}) {
    if (to_string(type) == value) {
      return type;
    }
  }
  return std::nullopt;
}

bool is_server_only(const MessageType type) {
  return type == MessageType::SpeakingStart || type == MessageType::SpeakingEnd ||
         type == MessageType::Error;
}

ParseResult parse_client_message(const std::string &json) {
  if (!common::json_is_object(common::trim(json))) {
    return ParseResult::failure("message is not a JSON object");
  }
  const auto fields = common::json_parse_flat(json);

  const auto type_it = fields.find("type");
  if (type_it == fields.end()) {
    return ParseResult::failure("missing type field");
  }
  if (common::json_get_string(json, "type").empty()) {
    return ParseResult::failure("type must be a non-empty string");
  }
  const auto type = parse_message_type(type_it->second);
  if (!type.has_value()) {
    return ParseResult::failure("unknown message type: " + type_it->second);
  }
  if (is_server_only(*type)) {
    return ParseResult::failure("message type " + type_it->second + " is sent by the server only");
  }

  ClientMessage message;
  message.type = *type;

  if (fields.count("timestamp") > 0) {
    const auto timestamp = parse_number(common::json_get_number(json, "timestamp"));
    if (!timestamp.has_value() || *timestamp < 0) {
      return ParseResult::failure("timestamp must be a non-negative number");
    }
    message.timestamp = static_cast<std::int64_t>(*timestamp);
  }

  if (message.type != MessageType::ListeningStart) {
    return ParseResult::success(std::move(message));
  }

  if (fields.count("sample_rate") > 0) {
    const auto rate = parse_number(common::json_get_number(json, "sample_rate"));
    if (!rate.has_value() || std::floor(*rate) != *rate || *rate < kMinSampleRate ||
        *rate > kMaxSampleRate) {
      return ParseResult::failure("sample_rate must be an integer between " +
                                  std::to_string(kMinSampleRate) + " and " +
                                  std::to_string(kMaxSampleRate));
    }
    message.listening.sample_rate = static_cast<int>(*rate);
  }

  if (const auto it = fields.find("encoding"); it != fields.end()) {
    const std::string encoding = common::json_get_string(json, "encoding");
    if (!valid_encoding(encoding)) {
      return ParseResult::failure("encoding must match [A-Z0-9_]+");
    }
    message.listening.encoding = encoding;
  }

  if (const auto it = fields.find("language"); it != fields.end()) {
    const std::string language = common::json_get_string(json, "language");
    if (!valid_language(language)) {
      return ParseResult::failure("language must be a language tag such as id-ID");
    }
    message.listening.language = language;
  }

  return ParseResult::success(std::move(message));
}

std::string ServerMessage::to_json() const {
  std::ostringstream out;
  out << "{\"type\":\"" << to_string(type) << "\",\"timestamp\":" << timestamp;
  if (!session_id.empty()) {
    out << ",\"session_id\":\"" << common::json_escape(session_id) << "\"";
  }
  if (status.has_value()) {
    out << ",\"status\":\"" << common::json_escape(*status) << "\"";
  }
  if (audio.has_value()) {
    out << ",\"sample_rate\":" << audio->sample_rate << ",\"encoding\":\""
        << common::json_escape(audio->encoding) << "\",\"language\":\""
        << common::json_escape(audio->language) << "\"";
  }
  if (transcript.has_value()) {
    out << ",\"transcript\":\"" << common::json_escape(*transcript) << "\"";
  }
  if (text.has_value()) {
    out << ",\"text\":\"" << common::json_escape(*text) << "\"";
  }
  if (error.has_value()) {
    out << ",\"code\":\"" << common::error_code_name(error->code) << "\",\"message\":\""
        << common::json_escape(error->message) << "\"";
  }
  out << "}";
  return out.str();
}

ServerMessage error_message(const common::Error &error) {
  return ServerMessage{.type = MessageType::Error, .error = error};
}

} // namespace parley::gateway
