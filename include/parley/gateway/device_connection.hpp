#pragma once

#include "parley/common/error.hpp"
#include "parley/common/result.hpp"
#include "parley/common/time.hpp"
#include "parley/conversation/model.hpp"
#include "parley/gateway/outbound_queue.hpp"
#include "parley/gateway/protocol.hpp"
#include "parley/gateway/transport.hpp"
#include "parley/pipeline/conversation_pipeline.hpp"
#include "parley/sessions/session.hpp"
#include "parley/sessions/store.hpp"
#include "parley/speech/recognizer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace parley::gateway {

class Hub;

enum class ConnectionState { Idle, Listening, Processing, Speaking };

[[nodiscard]] std::string_view to_string(ConnectionState state);

struct ConnectionSettings {
  speech::AudioConfig default_audio;
  std::chrono::minutes continuation_window{30};
  std::chrono::seconds ping_period{54};
  /// How long reply audio may wait for room in the outbound queue.
  std::chrono::seconds write_wait{10};
  std::size_t outbound_capacity = 256;
};

struct ConnectionServices {
  std::shared_ptr<sessions::ISessionStore> store;
  std::shared_ptr<speech::ISpeechRecognizer> recognizer;
  std::shared_ptr<conversation::IConversationModel> model;
  std::shared_ptr<pipeline::ConversationPipeline> pipeline;
  std::shared_ptr<Hub> hub;
};

/// One device's socket and its listen/answer cycle.
///
/// The reader thread (the caller of run()) handles control messages and audio
/// in arrival order. A writer thread drains the outbound queue and pings the
/// device. Each answered utterance gets a detached responder thread. `mutex_`
/// guards the fields below it and is never held across I/O or provider calls.
class DeviceConnection : public std::enable_shared_from_this<DeviceConnection> {
public:
  DeviceConnection(std::string device_id, std::shared_ptr<IFrameTransport> transport,
                   ConnectionServices services, ConnectionSettings settings);
  ~DeviceConnection();

  DeviceConnection(const DeviceConnection &) = delete;
  DeviceConnection &operator=(const DeviceConnection &) = delete;

  /// Registers with the hub, serves the socket until it closes, then tears down.
  void run();
  /// Closes the socket; run() then tears the connection down.
  void close();
  void close_outbound();

  [[nodiscard]] const std::string &device_id() const { return device_id_; }
  [[nodiscard]] ConnectionState state() const;
  [[nodiscard]] bool listening() const { return state() == ConnectionState::Listening; }
  [[nodiscard]] std::optional<sessions::Session> session() const;
  [[nodiscard]] bool closed() const;

private:
  struct Utterance {
    std::shared_ptr<sessions::Session> session;
    std::shared_ptr<conversation::IConversationHandle> conversation;
    speech::AudioConfig audio;
    std::string transcript;
    common::Timestamp started_at;
    common::Timestamp ended_at;
    std::uint64_t frames = 0;
    std::uint64_t bytes = 0;
  };

  struct SessionResolution {
    std::shared_ptr<sessions::Session> session;
    std::optional<common::Error> error;
  };

  void handle_frame(const Frame &frame);
  void handle_text(const std::string &payload);
  void handle_audio(const std::string &payload);
  void on_listening_start(const ListeningStartFields &fields);
  void on_listening_end();
  void respond(Utterance utterance);
  void fail_listening_start(const std::string &session_id, const common::Error &error);

  [[nodiscard]] SessionResolution
  resolve_session(const std::shared_ptr<sessions::Session> &in_memory);

  void writer_loop();
  void teardown();
  void send(ServerMessage message);
  void enqueue(Frame frame);

  const std::string device_id_;
  std::shared_ptr<IFrameTransport> transport_;
  ConnectionServices services_;
  ConnectionSettings settings_;
  OutboundQueue outbound_;
  std::thread writer_;
  std::atomic<bool> torn_down_{false};

  mutable std::mutex mutex_;
  ConnectionState state_ = ConnectionState::Idle;
  bool closed_ = false;
  std::shared_ptr<sessions::Session> session_;
  std::unique_ptr<speech::IStreamingRecognition> recognition_;
  std::shared_ptr<conversation::IConversationHandle> conversation_;
  std::string conversation_session_id_;
  speech::AudioConfig audio_;
  common::Timestamp utterance_started_at_;
  std::uint64_t utterance_frames_ = 0;
  std::uint64_t utterance_bytes_ = 0;
};

} // namespace parley::gateway
