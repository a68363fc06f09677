#pragma once

#include "parley/common/http.hpp"
#include "parley/common/result.hpp"
#include "parley/config/schema.hpp"
#include "parley/conversation/model.hpp"
#include "parley/gateway/hub.hpp"
#include "parley/gateway/websocket.hpp"
#include "parley/pipeline/conversation_pipeline.hpp"
#include "parley/saga/manager.hpp"
#include "parley/sessions/store.hpp"
#include "parley/sessions/sweeper.hpp"
#include "parley/speech/recognizer.hpp"
#include "parley/speech/synthesizer.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

namespace parley::runtime {

/// Loaded configuration plus the factories that turn it into capabilities.
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  [[nodiscard]] common::Result<std::shared_ptr<sessions::ISessionStore>>
  create_session_store() const;
  [[nodiscard]] common::Result<std::shared_ptr<speech::ISpeechRecognizer>>
  create_recognizer() const;
  [[nodiscard]] common::Result<std::shared_ptr<speech::ISpeechSynthesizer>>
  create_synthesizer(std::shared_ptr<common::HttpClient> http) const;
  [[nodiscard]] common::Result<std::shared_ptr<conversation::IConversationModel>>
  create_conversation_model(std::shared_ptr<common::HttpClient> http) const;

private:
  config::Config config_;
};

/// Everything `parley serve` runs: hub, socket server, saga engine, sweeper and
/// the saga event drain.
class VoiceServer {
public:
  explicit VoiceServer(RuntimeContext context);
  ~VoiceServer();

  VoiceServer(const VoiceServer &) = delete;
  VoiceServer &operator=(const VoiceServer &) = delete;

  [[nodiscard]] common::Status start();
  void stop();

  [[nodiscard]] bool is_running() const { return running_.load(); }
  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] const std::shared_ptr<gateway::Hub> &hub() const { return hub_; }
  [[nodiscard]] const std::shared_ptr<sessions::ISessionStore> &store() const { return store_; }

private:
  void drain_events();

  RuntimeContext context_;
  std::shared_ptr<common::HttpClient> http_;
  std::shared_ptr<sessions::ISessionStore> store_;
  std::shared_ptr<saga::SagaEventQueue> events_;
  std::shared_ptr<saga::SagaManager> sagas_;
  std::shared_ptr<pipeline::ConversationPipeline> pipeline_;
  std::shared_ptr<gateway::Hub> hub_;
  std::unique_ptr<gateway::WebSocketServer> server_;
  std::unique_ptr<sessions::SessionSweeper> sweeper_;
  std::thread drain_thread_;
  std::atomic<bool> running_{false};
};

} // namespace parley::runtime
