#pragma once

#include "parley/common/error.hpp"
#include "parley/common/result.hpp"
#include "parley/speech/audio.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace parley::gateway {

enum class MessageType {
  ListeningStart,
  ListeningEnd,
  Ping,
  Pong,
  SpeakingStart,
  SpeakingEnd,
  Error,
};

[[nodiscard]] std::string_view to_string(MessageType type);
[[nodiscard]] std::optional<MessageType> parse_message_type(std::string_view value);
/// Types only the server may send.
[[nodiscard]] bool is_server_only(MessageType type);

inline constexpr int kMinSampleRate = 8000;
inline constexpr int kMaxSampleRate = 48000;

struct ListeningStartFields {
  std::optional<int> sample_rate;
  std::optional<std::string> encoding;
  std::optional<std::string> language;
};

struct ClientMessage {
  MessageType type = MessageType::Ping;
  std::int64_t timestamp = 0;
  ListeningStartFields listening;
};

/// Every failure is a validation error on the wire.
[[nodiscard]] common::Result<ClientMessage> parse_client_message(const std::string &json);

struct ServerMessage {
  MessageType type = MessageType::Pong;
  std::int64_t timestamp = 0;
  std::string session_id;
  std::optional<std::string> status;
  std::optional<speech::AudioConfig> audio;
  std::optional<std::string> transcript;
  std::optional<std::string> text;
  std::optional<common::Error> error;

  [[nodiscard]] std::string to_json() const;
};

[[nodiscard]] ServerMessage error_message(const common::Error &error);

} // namespace parley::gateway
