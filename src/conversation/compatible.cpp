#include "parley/conversation/model.hpp"

#include "parley/common/fs.hpp"
#include "parley/common/json_util.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>

namespace parley::conversation {

namespace {

bool is_retryable(const common::HttpResponse &response) {
  return response.transport_failed() || response.status == 429 || response.status >= 500;
}

std::string describe_failure(const common::HttpResponse &response) {
  if (response.timeout) {
    return "request timed out";
  }
  if (response.network_error) {
    return "network error: " + response.network_error_message;
  }
  std::string detail = common::json_get_string(common::json_get_object(response.body, "error"),
                                               "message");
  if (detail.empty()) {
    detail = response.body.substr(0, 200);
  }
  return "HTTP " + std::to_string(response.status) + ": " + detail;
}

class CompatibleConversationHandle final : public IConversationHandle {
public:
  CompatibleConversationHandle(std::shared_ptr<const CompatibleSettings> settings,
                               std::shared_ptr<common::HttpClient> http,
                               std::vector<ChatMessage> history)
      : settings_(std::move(settings)), http_(std::move(http)), history_(std::move(history)) {}

  common::Result<std::string> send(const std::string &text) override {
    std::vector<ChatMessage> messages;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      messages = history_;
    }
    messages.push_back({ChatRole::User, text});

    const std::string url = settings_->base_url + "/chat/completions";
    const common::HttpHeaders headers = {
        {"Content-Type", "application/json"},
        {"Authorization", "Bearer " + settings_->api_key},
    };
    const std::string body = build_chat_request_body(*settings_, messages);

    std::string last_error;
    for (std::uint32_t attempt = 0; attempt <= settings_->max_retries; ++attempt) {
      const auto response = http_->post_json(url, headers, body, settings_->timeout_ms);
      if (!response.transport_failed() && response.status >= 200 && response.status < 300) {
        auto reply = parse_chat_completion(response.body);
        if (!reply.ok()) {
          return reply;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back({ChatRole::User, text});
        history_.push_back({ChatRole::Assistant, reply.value()});
        return reply;
      }

      last_error = describe_failure(response);
      if (!is_retryable(response)) {
        break;
      }
      if (attempt < settings_->max_retries) {
        std::cerr << "[conversation] retrying after " << last_error << "\n";
        std::this_thread::sleep_for(
            std::chrono::milliseconds(settings_->backoff_ms * (1ULL << attempt)));
      }
    }
    return common::Result<std::string>::failure("chat completion failed: " + last_error);
  }

  std::vector<ChatMessage> history() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
  }

private:
  std::shared_ptr<const CompatibleSettings> settings_;
  std::shared_ptr<common::HttpClient> http_;
  mutable std::mutex mutex_;
  std::vector<ChatMessage> history_;
};

} // namespace

CompatibleConversationModel::CompatibleConversationModel(CompatibleSettings settings,
                                                         std::shared_ptr<common::HttpClient> http)
    : http_(std::move(http)) {
  while (!settings.base_url.empty() && settings.base_url.back() == '/') {
    settings.base_url.pop_back();
  }
  settings_ = std::make_shared<const CompatibleSettings>(std::move(settings));
}

common::Result<std::shared_ptr<IConversationHandle>>
CompatibleConversationModel::open(const std::vector<ChatMessage> &history) {
  using HandleResult = common::Result<std::shared_ptr<IConversationHandle>>;
  if (http_ == nullptr) {
    return HandleResult::failure("conversation HTTP client is not configured");
  }
  if (common::trim(settings_->api_key).empty()) {
    return HandleResult::failure("conversation API key is not configured");
  }
  return HandleResult::success(
      std::make_shared<CompatibleConversationHandle>(settings_, http_, history));
}

std::string build_chat_request_body(const CompatibleSettings &settings,
                                    const std::vector<ChatMessage> &messages) {
  std::ostringstream body;
  body << "{\"model\":\"" << common::json_escape(settings.model) << "\","
       << "\"temperature\":" << settings.temperature << ",\"messages\":[";
  bool first = true;
  const auto append = [&](const ChatRole role, const std::string &content) {
    if (!first) {
      body << ",";
    }
    first = false;
    body << "{\"role\":\"" << to_string(role) << "\",\"content\":\""
         << common::json_escape(content) << "\"}";
  };
  if (!common::trim(settings.system_prompt).empty()) {
    append(ChatRole::System, settings.system_prompt);
  }
  for (const auto &message : messages) {
    append(message.role, message.content);
  }
  body << "]}";
  return body.str();
}

common::Result<std::string> parse_chat_completion(const std::string &response) {
  const auto choices = common::json_split_top_level_objects(common::json_get_array(response, "choices"));
  if (choices.empty()) {
    return common::Result<std::string>::failure("chat completion has no choices");
  }
  const std::string message = common::json_get_object(choices.front(), "message");
  if (message.empty()) {
    return common::Result<std::string>::failure("choices[0].message missing");
  }
  const std::string content = common::trim(common::json_get_string(message, "content"));
  if (content.empty()) {
    return common::Result<std::string>::failure("choices[0].message.content is empty");
  }
  return common::Result<std::string>::success(content);
}

} // namespace parley::conversation
