#pragma once

#include "parley/common/http.hpp"
#include "parley/common/result.hpp"
#include "parley/sessions/session.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace parley::conversation {

enum class ChatRole { System, User, Assistant };

[[nodiscard]] std::string_view to_string(ChatRole role);

struct ChatMessage {
  ChatRole role = ChatRole::User;
  std::string content;
};

/// Stateful chat: each successful `send` extends the history with the user
/// message and the reply. A failed `send` leaves the history unchanged.
class IConversationHandle {
public:
  virtual ~IConversationHandle() = default;

  [[nodiscard]] virtual common::Result<std::string> send(const std::string &text) = 0;
  [[nodiscard]] virtual std::vector<ChatMessage> history() const = 0;
};

class IConversationModel {
public:
  virtual ~IConversationModel() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::shared_ptr<IConversationHandle>>
  open(const std::vector<ChatMessage> &history) = 0;
};

/// Seeds a conversation from stored session turns, oldest first.
[[nodiscard]] std::vector<ChatMessage> history_from_turns(const std::vector<sessions::Turn> &turns);

/// Offline model that answers by echoing the user, for development and tests.
class EchoConversationModel final : public IConversationModel {
public:
  [[nodiscard]] std::string_view name() const override { return "echo"; }
  [[nodiscard]] common::Result<std::shared_ptr<IConversationHandle>>
  open(const std::vector<ChatMessage> &history) override;
};

struct CompatibleSettings {
  std::string base_url = "https://api.openai.com/v1";
  std::string api_key;
  std::string model = "gpt-4o-mini";
  double temperature = 0.7;
  std::string system_prompt;
  std::uint32_t max_retries = 2;
  std::uint64_t backoff_ms = 250;
  std::uint64_t timeout_ms = 20'000;
};

/// Any endpoint speaking the OpenAI `/chat/completions` dialect.
class CompatibleConversationModel final : public IConversationModel {
public:
  CompatibleConversationModel(CompatibleSettings settings,
                              std::shared_ptr<common::HttpClient> http);

  [[nodiscard]] std::string_view name() const override { return "compatible"; }
  [[nodiscard]] common::Result<std::shared_ptr<IConversationHandle>>
  open(const std::vector<ChatMessage> &history) override;

private:
  std::shared_ptr<const CompatibleSettings> settings_;
  std::shared_ptr<common::HttpClient> http_;
};

[[nodiscard]] std::string build_chat_request_body(const CompatibleSettings &settings,
                                                  const std::vector<ChatMessage> &messages);
[[nodiscard]] common::Result<std::string> parse_chat_completion(const std::string &response);

} // namespace parley::conversation
