#include "parley/conversation/model.hpp"

namespace parley::conversation {

namespace {

class EchoConversationHandle final : public IConversationHandle {
public:
  explicit EchoConversationHandle(std::vector<ChatMessage> history)
      : history_(std::move(history)) {}

  common::Result<std::string> send(const std::string &text) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t user_turns = 0;
    for (const auto &message : history_) {
      if (message.role == ChatRole::User) {
        ++user_turns;
      }
    }
    std::string reply = user_turns == 0 ? "Halo juga! " : "";
    reply += "Kamu bilang: " + text;
    history_.push_back({ChatRole::User, text});
    history_.push_back({ChatRole::Assistant, reply});
    return common::Result<std::string>::success(std::move(reply));
  }

  std::vector<ChatMessage> history() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<ChatMessage> history_;
};

} // namespace

std::string_view to_string(const ChatRole role) {
  switch (role) {
  case ChatRole::System:
    return "system";
  case ChatRole::User:
    return "user";
  case ChatRole::Assistant:
    return "assistant";
  }
  return "user";
}

std::vector<ChatMessage> history_from_turns(const std::vector<sessions::Turn> &turns) {
  std::vector<ChatMessage> history;
  history.reserve(turns.size());
  for (const auto &turn : turns) {
    history.push_back({turn.role == sessions::TurnRole::User ? ChatRole::User : ChatRole::Assistant,
                       turn.content});
  }
  return history;
}

common::Result<std::shared_ptr<IConversationHandle>>
EchoConversationModel::open(const std::vector<ChatMessage> &history) {
  return common::Result<std::shared_ptr<IConversationHandle>>::success(
      std::make_shared<EchoConversationHandle>(history));
}

} // namespace parley::conversation
