#include "parley/runtime/app.hpp"

#include "parley/common/fs.hpp"
#include "parley/config/config.hpp"
#include "parley/gateway/device_connection.hpp"
#include "parley/observability/factory.hpp"
#include "parley/observability/global.hpp"
#include "parley/pipeline/content_policy.hpp"
#include "parley/sessions/sqlite_store.hpp"

#include <iostream>

namespace parley::runtime {

namespace {

constexpr std::chrono::milliseconds kDrainWait{200};
constexpr std::chrono::seconds kPruneEvery{60};

} // namespace

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.error());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

common::Result<std::shared_ptr<sessions::ISessionStore>>
RuntimeContext::create_session_store() const {
  using StoreResult = common::Result<std::shared_ptr<sessions::ISessionStore>>;
  const auto &backend = config_.sessions.backend;
  if (backend == "memory") {
    return StoreResult::success(std::make_shared<sessions::MemorySessionStore>());
  }
  if (backend != "sqlite") {
    return StoreResult::failure("unknown sessions backend: " + backend);
  }

  const std::filesystem::path path = common::expand_path(config_.sessions.path);
  if (path.has_parent_path()) {
    auto dir = common::ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return StoreResult::failure(dir.error());
    }
  }
  auto store = std::make_shared<sessions::SqliteSessionStore>(path);
  if (!store->health_check()) {
    return StoreResult::failure("session database unavailable: " + path.string());
  }
  return StoreResult::success(std::move(store));
}

common::Result<std::shared_ptr<speech::ISpeechRecognizer>>
RuntimeContext::create_recognizer() const {
  using RecognizerResult = common::Result<std::shared_ptr<speech::ISpeechRecognizer>>;
  if (config_.speech.recognizer == "scripted") {
    return RecognizerResult::success(std::make_shared<speech::ScriptedSpeechRecognizer>());
  }
  return RecognizerResult::failure("unknown speech recognizer: " + config_.speech.recognizer);
}

common::Result<std::shared_ptr<speech::ISpeechSynthesizer>>
RuntimeContext::create_synthesizer(std::shared_ptr<common::HttpClient> http) const {
  using SynthesizerResult = common::Result<std::shared_ptr<speech::ISpeechSynthesizer>>;
  const auto &name = config_.speech.synthesizer;
  if (name == "tone") {
    return SynthesizerResult::success(std::make_shared<speech::ToneSpeechSynthesizer>());
  }
  if (name != "elevenlabs") {
    return SynthesizerResult::failure("unknown speech synthesizer: " + name);
  }

  const auto &cfg = config_.speech.elevenlabs;
  auto base_url = speech::normalize_elevenlabs_base_url(cfg.base_url);
  if (!base_url.ok()) {
    return SynthesizerResult::failure(base_url.error());
  }
  speech::ElevenLabsSettings settings;
  settings.api_key = cfg.api_key;
  settings.base_url = base_url.value();
  settings.voice_id = cfg.voice_id;
  settings.model_id = cfg.model_id;
  settings.output_format = cfg.output_format;
  settings.chunk_bytes = cfg.chunk_bytes;
  settings.timeout_ms = cfg.timeout_ms;
  return SynthesizerResult::success(
      std::make_shared<speech::ElevenLabsSynthesizer>(std::move(settings), std::move(http)));
}

common::Result<std::shared_ptr<conversation::IConversationModel>>
RuntimeContext::create_conversation_model(std::shared_ptr<common::HttpClient> http) const {
  using ModelResult = common::Result<std::shared_ptr<conversation::IConversationModel>>;
  const auto &cfg = config_.conversation;
  if (cfg.provider == "echo") {
    return ModelResult::success(std::make_shared<conversation::EchoConversationModel>());
  }
  if (cfg.provider != "compatible") {
    return ModelResult::failure("unknown conversation provider: " + cfg.provider);
  }
  conversation::CompatibleSettings settings;
  settings.base_url = cfg.base_url;
  settings.api_key = cfg.api_key;
  settings.model = cfg.model;
  settings.temperature = cfg.temperature;
  settings.system_prompt = cfg.system_prompt;
  settings.max_retries = cfg.max_retries;
  settings.timeout_ms = cfg.timeout_ms;
  return ModelResult::success(std::make_shared<conversation::CompatibleConversationModel>(
      std::move(settings), std::move(http)));
}

VoiceServer::VoiceServer(RuntimeContext context) : context_(std::move(context)) {}

VoiceServer::~VoiceServer() { stop(); }

common::Status VoiceServer::start() {
  if (running_) {
    return common::Status::error("server already running");
  }
  const auto &cfg = context_.config();

  auto validated = config::validate_config(cfg);
  if (!validated.ok()) {
    return common::Status::error(validated.error());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "[config] warning: " << warning << "\n";
  }

  observability::set_global_observer(observability::create_observer(cfg));
  http_ = std::make_shared<common::CurlHttpClient>();

  auto store = context_.create_session_store();
  if (!store.ok()) {
    return common::Status::error(store.error());
  }
  store_ = store.value();
  auto recognizer = context_.create_recognizer();
  if (!recognizer.ok()) {
    return common::Status::error(recognizer.error());
  }
  auto synthesizer = context_.create_synthesizer(http_);
  if (!synthesizer.ok()) {
    return common::Status::error(synthesizer.error());
  }
  auto model = context_.create_conversation_model(http_);
  if (!model.ok()) {
    return common::Status::error(model.error());
  }

  events_ = std::make_shared<saga::SagaEventQueue>(cfg.pipeline.event_queue_capacity);
  sagas_ = std::make_shared<saga::SagaManager>(events_);
  pipeline_ = std::make_shared<pipeline::ConversationPipeline>(
      sagas_, pipeline::PipelineSettings{
                  .deadline = std::chrono::milliseconds(cfg.pipeline.deadline_ms),
                  .wait_timeout = std::chrono::milliseconds(cfg.pipeline.wait_timeout_ms),
                  .poll_interval = std::chrono::milliseconds(cfg.pipeline.poll_interval_ms),
              });
  const auto installed = pipeline_->install(pipeline::PipelineCapabilities{
      .recognizer = recognizer.value(),
      .content_policy = std::make_shared<pipeline::KeywordContentPolicy>(cfg.content.blocked_terms),
      .model = model.value(),
      .synthesizer = synthesizer.value(),
  });
  if (!installed.ok()) {
    return installed;
  }

  hub_ = std::make_shared<gateway::Hub>();
  hub_->start();

  gateway::ConnectionServices services{
      .store = store_,
      .recognizer = recognizer.value(),
      .model = model.value(),
      .pipeline = pipeline_,
      .hub = hub_,
  };
  gateway::ConnectionSettings settings;
  settings.default_audio = speech::AudioConfig{cfg.audio.sample_rate, cfg.audio.encoding,
                                               cfg.audio.language};
  settings.continuation_window = std::chrono::minutes(cfg.sessions.continuation_window_minutes);
  settings.ping_period = std::chrono::seconds(cfg.server.ping_period_secs);
  settings.outbound_capacity = cfg.server.outbound_queue_capacity;
  settings.write_wait = std::chrono::seconds(cfg.server.write_wait_secs);

  gateway::WebSocketOptions options;
  options.host = cfg.server.host;
  options.port = cfg.server.port;
  options.path = cfg.server.path;
  options.max_connections = cfg.server.max_connections;
  options.tls_enabled = cfg.server.tls_enabled;
  options.tls_cert_file = common::expand_path(cfg.server.tls_cert_file);
  options.tls_key_file = common::expand_path(cfg.server.tls_key_file);
  options.max_frame_bytes = cfg.server.max_frame_bytes;
  options.read_timeout = std::chrono::seconds(cfg.server.pong_wait_secs);
  options.write_timeout = std::chrono::seconds(cfg.server.write_wait_secs);
  options.device_tokens = cfg.server.device_tokens;

  server_ = std::make_unique<gateway::WebSocketServer>();
  const auto hub = hub_;
  const auto started = server_->start(
      options,
      [services, settings](std::shared_ptr<gateway::IFrameTransport> transport,
                           const gateway::UpgradeRequest &request) {
        auto connection = std::make_shared<gateway::DeviceConnection>(
            request.device_id, std::move(transport), services, settings);
        connection->run();
      },
      [hub] { return hub->size(); });
  if (!started.ok()) {
    hub_->stop();
    return started;
  }

  sweeper_ = std::make_unique<sessions::SessionSweeper>(
      *store_, sessions::SweeperConfig{
                   .initial_delay = std::chrono::seconds(cfg.sessions.cleanup_initial_delay_secs),
                   .interval = std::chrono::minutes(cfg.sessions.cleanup_interval_minutes),
               });
  sweeper_->start();

  running_ = true;
  drain_thread_ = std::thread([this] { drain_events(); });

  std::cerr << "[runtime] listening on " << cfg.server.host << ":" << server_->port()
            << cfg.server.path << " sessions=" << store_->name()
            << " recognizer=" << recognizer.value()->id()
            << " synthesizer=" << synthesizer.value()->id() << " model=" << model.value()->name()
            << "\n";
  return common::Status::success();
}

void VoiceServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (hub_ != nullptr) {
    hub_->close_all();
  }
  if (server_ != nullptr) {
    server_->stop();
  }
  if (hub_ != nullptr) {
    hub_->stop();
  }
  if (sweeper_ != nullptr) {
    sweeper_->stop();
  }
  if (events_ != nullptr) {
    events_->close();
  }
  if (drain_thread_.joinable()) {
    drain_thread_.join();
  }
  if (auto observer = observability::get_global_observer()) {
    observer->flush();
  }
  std::cerr << "[runtime] stopped\n";
}

std::uint16_t VoiceServer::port() const { return server_ == nullptr ? 0 : server_->port(); }

void VoiceServer::drain_events() {
  const auto retention = std::chrono::minutes(context_.config().pipeline.retention_minutes);
  auto next_prune = std::chrono::steady_clock::now() + kPruneEvery;
  std::uint64_t reported_drops = 0;

  while (running_) {
    if (auto event = events_->pop_for(kDrainWait)) {
      observability::record_saga_event(event->saga_id, event->step_id.value_or(""),
                                       std::string(saga::to_string(event->type)),
                                       event->payload.value_or(""));
    }
    const auto dropped = events_->dropped();
    if (dropped != reported_drops) {
      reported_drops = dropped;
      observability::record_metric(observability::DroppedEventsMetric{dropped});
    }
    if (std::chrono::steady_clock::now() >= next_prune) {
      const auto pruned = sagas_->prune(retention);
      if (pruned > 0) {
        std::cerr << "[runtime] pruned " << pruned << " finished sagas\n";
      }
      next_prune = std::chrono::steady_clock::now() + kPruneEvery;
    }
  }
  for (auto &event : events_->drain()) {
    observability::record_saga_event(event.saga_id, event.step_id.value_or(""),
                                     std::string(saga::to_string(event.type)),
                                     event.payload.value_or(""));
  }
}

} // namespace parley::runtime
