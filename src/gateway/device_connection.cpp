#include "parley/gateway/device_connection.hpp"

#include "parley/common/fs.hpp"
#include "parley/gateway/hub.hpp"
#include "parley/observability/global.hpp"

#include <iostream>

namespace parley::gateway {

namespace {

using common::Error;
using common::ErrorCode;

std::int64_t millis_between(const common::Timestamp from, const common::Timestamp to) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

} // namespace

std::string_view to_string(const ConnectionState state) {
  switch (state) {
  case ConnectionState::Idle:
    return "idle";
  case ConnectionState::Listening:
    return "listening";
  case ConnectionState::Processing:
    return "processing";
  case ConnectionState::Speaking:
    return "speaking";
  }
  return "idle";
}

DeviceConnection::DeviceConnection(std::string device_id,
                                   std::shared_ptr<IFrameTransport> transport,
                                   ConnectionServices services, ConnectionSettings settings)
    : device_id_(std::move(device_id)), transport_(std::move(transport)),
      services_(std::move(services)), settings_(std::move(settings)),
      outbound_(settings_.outbound_capacity) {}

DeviceConnection::~DeviceConnection() {
  outbound_.close();
  if (writer_.joinable()) {
    writer_.join();
  }
}

void DeviceConnection::run() {
  if (services_.hub != nullptr) {
    services_.hub->register_connection(shared_from_this()).wait();
  }
  writer_ = std::thread([this] { writer_loop(); });
  std::cerr << "[gateway] device " << device_id_ << " connected\n";

  while (true) {
    auto frame = transport_->read_frame();
    if (!frame.ok()) {
      if (!closed()) {
        std::cerr << "[gateway] device " << device_id_ << " read ended: " << frame.error()
                  << "\n";
      }
      break;
    }
    if (frame.value().kind == FrameKind::Close) {
      break;
    }
    handle_frame(frame.value());
  }

  teardown();
  std::cerr << "[gateway] device " << device_id_ << " disconnected\n";
}

void DeviceConnection::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  outbound_.close();
  transport_->close();
}

void DeviceConnection::close_outbound() { outbound_.close(); }

ConnectionState DeviceConnection::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::optional<sessions::Session> DeviceConnection::session() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (session_ == nullptr) {
    return std::nullopt;
  }
  return *session_;
}

bool DeviceConnection::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

void DeviceConnection::handle_frame(const Frame &frame) {
  switch (frame.kind) {
  case FrameKind::Text:
    handle_text(frame.payload);
    break;
  case FrameKind::Binary:
    handle_audio(frame.payload);
    break;
  case FrameKind::Ping:
    enqueue(Frame{FrameKind::Pong, frame.payload});
    break;
  case FrameKind::Pong:
  case FrameKind::Close:
    break;
  }
}

void DeviceConnection::handle_text(const std::string &payload) {
  auto parsed = parse_client_message(payload);
  if (!parsed.ok()) {
    send(error_message(Error{ErrorCode::Validation, parsed.error()}));
    return;
  }
  const auto &message = parsed.value();
  switch (message.type) {
  case MessageType::ListeningStart:
    on_listening_start(message.listening);
    break;
  case MessageType::ListeningEnd:
    on_listening_end();
    break;
  case MessageType::Ping:
    send(ServerMessage{.type = MessageType::Pong});
    break;
  default:
    break;
  }
}

void DeviceConnection::handle_audio(const std::string &payload) {
  speech::IStreamingRecognition *recognition = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Listening || recognition_ == nullptr) {
      std::cerr << "[gateway] device " << device_id_ << " dropped " << payload.size()
                << " audio bytes while " << to_string(state_) << "\n";
      return;
    }
    ++utterance_frames_;
    utterance_bytes_ += payload.size();
    // Only this thread replaces recognition_, so the pointer outlives the call below.
    recognition = recognition_.get();
  }

  const auto streamed = recognition->stream(speech::AudioChunk(payload.begin(), payload.end()));
  if (!streamed.ok()) {
    std::cerr << "[gateway] device " << device_id_ << " audio forward failed: "
              << streamed.error() << "\n";
  }
}

void DeviceConnection::on_listening_start(const ListeningStartFields &fields) {
  std::shared_ptr<sessions::Session> in_memory;
  std::shared_ptr<conversation::IConversationHandle> conversation;
  std::string conversation_session_id;
  std::optional<Error> rejected;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Idle) {
      rejected = Error{ErrorCode::State, state_ == ConnectionState::Listening
                                             ? "already listening"
                                             : "reply in progress"};
    } else {
      state_ = ConnectionState::Listening;
      utterance_frames_ = 0;
      utterance_bytes_ = 0;
      utterance_started_at_ = common::Clock::now();
      in_memory = session_;
      conversation = conversation_;
      conversation_session_id = conversation_session_id_;
    }
  }
  if (rejected.has_value()) {
    send(error_message(*rejected));
    return;
  }

  auto resolved = resolve_session(in_memory);
  if (resolved.error.has_value()) {
    fail_listening_start("", *resolved.error);
    return;
  }
  const auto session = resolved.session;

  speech::AudioConfig audio = settings_.default_audio;
  if (!session->metadata().language.empty()) {
    audio.language = session->metadata().language;
  }
  if (fields.sample_rate.has_value()) {
    audio.sample_rate = *fields.sample_rate;
  }
  if (fields.encoding.has_value()) {
    audio.encoding = *fields.encoding;
  }
  if (fields.language.has_value()) {
    audio.language = *fields.language;
  }

  if (services_.recognizer == nullptr) {
    fail_listening_start(session->id(), Error{ErrorCode::Stream, "speech recognizer unavailable"});
    return;
  }
  auto opened = services_.recognizer->open_stream(audio);
  if (!opened.ok()) {
    fail_listening_start(session->id(),
                         Error{ErrorCode::Stream, "could not open recognition: " + opened.error()});
    return;
  }
  auto recognition = opened.take();

  if (conversation == nullptr || conversation_session_id != session->id()) {
    if (services_.model == nullptr) {
      recognition->cancel();
      (void)recognition->end();
      fail_listening_start(session->id(),
                           Error{ErrorCode::Stream, "conversation model unavailable"});
      return;
    }
    auto handle = services_.model->open(conversation::history_from_turns(session->turns()));
    if (!handle.ok()) {
      recognition->cancel();
      (void)recognition->end();
      fail_listening_start(session->id(), Error{ErrorCode::Stream,
                                                "could not open conversation: " + handle.error()});
      return;
    }
    conversation = handle.take();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      recognition->cancel();
      (void)recognition->end();
      return;
    }
    session_ = session;
    recognition_ = std::move(recognition);
    conversation_ = conversation;
    conversation_session_id_ = session->id();
    audio_ = audio;
  }

  std::cerr << "[gateway] device " << device_id_ << " listening session=" << session->id()
            << " rate=" << audio.sample_rate << " encoding=" << audio.encoding
            << " language=" << audio.language << "\n";
  send(ServerMessage{.type = MessageType::ListeningStart,
                     .session_id = session->id(),
                     .status = "ready",
                     .audio = audio});
}

DeviceConnection::SessionResolution
DeviceConnection::resolve_session(const std::shared_ptr<sessions::Session> &in_memory) {
  SessionResolution out;
  if (services_.store == nullptr) {
    out.error = Error{ErrorCode::Resource, "session store unavailable"};
    return out;
  }

  const auto now = common::Clock::now();
  const sessions::ContinuationPolicy policy{settings_.continuation_window};

  auto active = services_.store->get_active(device_id_);
  if (!active.ok()) {
    out.error = Error{ErrorCode::Resource, "session lookup failed: " + active.error()};
    return out;
  }

  if (active.value().has_value()) {
    const auto &stored = *active.value();
    std::shared_ptr<sessions::Session> current =
        (in_memory != nullptr && in_memory->id() == stored.id())
            ? in_memory
            : std::make_shared<sessions::Session>(stored);
    if (policy.can_continue(*current, now)) {
      out.session = current;
      return out;
    }

    sessions::Session lapsed = *current;
    lapsed.terminate(now);
    const auto terminated = services_.store->update(lapsed);
    if (!terminated.ok()) {
      out.error = Error{ErrorCode::Resource, "could not close lapsed session: " + terminated.error()};
      return out;
    }
    std::cerr << "[gateway] device " << device_id_ << " session " << lapsed.id()
              << " lapsed, starting a new one\n";
  }

  auto started = sessions::Session::start(device_id_, settings_.default_audio.language, now);
  if (!started.ok()) {
    out.error = Error{ErrorCode::Resource, started.error()};
    return out;
  }
  const auto created = services_.store->create(started.value());
  if (!created.ok()) {
    out.error = Error{ErrorCode::Resource, "could not create session: " + created.error()};
    return out;
  }
  out.session = std::make_shared<sessions::Session>(started.take());
  return out;
}

void DeviceConnection::fail_listening_start(const std::string &session_id,
                                            const common::Error &error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ConnectionState::Listening) {
      state_ = ConnectionState::Idle;
    }
  }
  std::cerr << "[gateway] device " << device_id_ << " listening_start failed: "
            << error.to_string() << "\n";
  observability::record_error("gateway", "listening_start: " + error.to_string());
  send(ServerMessage{.type = MessageType::ListeningStart,
                     .session_id = session_id,
                     .status = "error",
                     .error = error});
}

void DeviceConnection::on_listening_end() {
  std::unique_ptr<speech::IStreamingRecognition> recognition;
  Utterance utterance;
  bool accepted = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ConnectionState::Listening) {
      state_ = ConnectionState::Processing;
      recognition = std::move(recognition_);
      utterance.session = session_;
      utterance.conversation = conversation_;
      utterance.audio = audio_;
      utterance.started_at = utterance_started_at_;
      utterance.frames = utterance_frames_;
      utterance.bytes = utterance_bytes_;
      utterance.ended_at = common::Clock::now();
      accepted = true;
    }
  }
  if (!accepted) {
    send(error_message(Error{ErrorCode::State, "not listening"}));
    return;
  }

  const auto fail = [&](const std::string &message) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      state_ = ConnectionState::Idle;
    }
    std::cerr << "[gateway] device " << device_id_ << " utterance dropped: " << message << "\n";
    send(error_message(Error{ErrorCode::Stream, message}));
  };

  if (recognition == nullptr) {
    fail("recognition stream is not open");
    return;
  }
  auto transcript = recognition->end();
  if (!transcript.ok()) {
    fail(transcript.error());
    return;
  }
  utterance.transcript = common::trim(transcript.value());
  if (utterance.transcript.empty()) {
    fail("empty transcript");
    return;
  }

  observability::record_utterance(device_id_, utterance.session->id(), utterance.bytes,
                                  utterance.frames,
                                  std::chrono::milliseconds(
                                      millis_between(utterance.started_at, utterance.ended_at)));

  send(ServerMessage{.type = MessageType::ListeningEnd,
                     .session_id = utterance.session->id(),
                     .status = "processing",
                     .transcript = utterance.transcript});

  std::thread([self = shared_from_this(), utterance = std::move(utterance)]() mutable {
    self->respond(std::move(utterance));
  }).detach();
}

void DeviceConnection::respond(Utterance utterance) {
  const std::string session_id = utterance.session->id();
  pipeline::PipelineOutcome outcome;
  if (services_.pipeline == nullptr) {
    outcome.error = Error{ErrorCode::Stream, "pipeline unavailable"};
  } else {
    outcome = services_.pipeline->process(pipeline::UtteranceRequest{
        .device_id = device_id_,
        .session_id = session_id,
        .transcript = utterance.transcript,
        .audio = {},
        .audio_config = utterance.audio,
        .conversation = utterance.conversation,
    });
  }

  if (!outcome.ok()) {
    std::cerr << "[gateway] device " << device_id_ << " pipeline " << outcome.saga_id
              << " failed: " << outcome.error->to_string() << "\n";
    auto message = error_message(*outcome.error);
    message.timestamp = common::unix_seconds(common::Clock::now());
    bool queued = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return;
      }
      conversation_.reset();
      conversation_session_id_.clear();
      queued = outbound_.push(Frame{FrameKind::Text, message.to_json()});
      state_ = ConnectionState::Idle;
    }
    if (!queued && !outbound_.closed()) {
      std::cerr << "[gateway] device " << device_id_ << " outbound queue full, closing\n";
      close();
    }
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      std::cerr << "[gateway] device " << device_id_ << " disconnected, discarding reply "
                << outcome.saga_id << "\n";
      return;
    }
    state_ = ConnectionState::Speaking;
  }

  send(ServerMessage{.type = MessageType::SpeakingStart,
                     .session_id = session_id,
                     .text = outcome.reply_text});
  for (auto &chunk : outcome.reply_audio) {
    const auto deadline = std::chrono::steady_clock::now() + settings_.write_wait;
    if (outbound_.push_wait(Frame{FrameKind::Binary, std::string(chunk.begin(), chunk.end())},
                            deadline)) {
      continue;
    }
    if (!outbound_.closed()) {
      std::cerr << "[gateway] device " << device_id_ << " stalled during reply "
                << outcome.saga_id << ", closing\n";
      close();
    }
    std::cerr << "[gateway] device " << device_id_ << " reply " << outcome.saga_id
              << " not delivered, turns not recorded\n";
    return;
  }

  const auto now = common::Clock::now();
  sessions::Turn user_turn;
  user_turn.timestamp = utterance.started_at;
  user_turn.role = sessions::TurnRole::User;
  user_turn.content = utterance.transcript;
  user_turn.duration_ms = millis_between(utterance.started_at, utterance.ended_at);
  sessions::Turn assistant_turn;
  assistant_turn.timestamp = now;
  assistant_turn.role = sessions::TurnRole::Assistant;
  assistant_turn.content = outcome.reply_text;
  assistant_turn.duration_ms = outcome.elapsed.count();

  std::optional<sessions::Session> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      std::cerr << "[gateway] device " << device_id_ << " disconnected during reply "
                << outcome.saga_id << ", turns not recorded\n";
      return;
    }
    auto &session = *utterance.session;
    const auto appended_user = session.append_turn(user_turn, now);
    const auto appended_reply = session.append_turn(assistant_turn, now);
    if (!appended_user.ok() || !appended_reply.ok()) {
      std::cerr << "[gateway] device " << device_id_ << " could not record turns: "
                << (appended_user.ok() ? appended_reply.error() : appended_user.error()) << "\n";
    }
    snapshot = session;
  }

  if (services_.store != nullptr) {
    const auto persisted = services_.store->update(*snapshot);
    if (!persisted.ok()) {
      std::cerr << "[gateway] device " << device_id_ << " session " << session_id
                << " not persisted: " << persisted.error() << "\n";
      observability::record_error("sessions", "persist " + session_id + ": " + persisted.error());
    }
  }

  ServerMessage done{.type = MessageType::SpeakingEnd, .session_id = session_id};
  done.timestamp = common::unix_seconds(common::Clock::now());
  // Queued while still Speaking, so a later listening_start is answered after it.
  if (!outbound_.push_wait(Frame{FrameKind::Text, done.to_json()},
                           std::chrono::steady_clock::now() + settings_.write_wait)) {
    if (!outbound_.closed()) {
      std::cerr << "[gateway] device " << device_id_ << " stalled before speaking_end, closing\n";
      close();
    }
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = ConnectionState::Idle;
}

void DeviceConnection::writer_loop() {
  auto next_ping = std::chrono::steady_clock::now() + settings_.ping_period;
  while (true) {
    auto popped = outbound_.pop_until(next_ping);
    if (popped.status == OutboundQueue::PopStatus::Closed) {
      break;
    }
    Frame frame;
    if (popped.status == OutboundQueue::PopStatus::Frame) {
      frame = std::move(*popped.frame);
    } else {
      frame = Frame{FrameKind::Ping, ""};
      next_ping = std::chrono::steady_clock::now() + settings_.ping_period;
    }
    const auto written = transport_->write_frame(frame);
    if (!written.ok()) {
      if (!closed()) {
        std::cerr << "[gateway] device " << device_id_ << " write failed: " << written.error()
                  << "\n";
      }
      transport_->close();
      break;
    }
  }
}

void DeviceConnection::teardown() {
  if (torn_down_.exchange(true)) {
    return;
  }
  std::unique_ptr<speech::IStreamingRecognition> recognition;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    recognition = std::move(recognition_);
    conversation_.reset();
    conversation_session_id_.clear();
  }
  if (recognition != nullptr) {
    recognition->cancel();
    (void)recognition->end();
  }
  if (services_.hub != nullptr) {
    services_.hub->unregister_connection(shared_from_this()).wait();
  }
  outbound_.close();
  if (writer_.joinable()) {
    writer_.join();
  }
  transport_->close();
}

void DeviceConnection::send(ServerMessage message) {
  message.timestamp = common::unix_seconds(common::Clock::now());
  enqueue(Frame{FrameKind::Text, message.to_json()});
}

void DeviceConnection::enqueue(Frame frame) {
  if (outbound_.push(std::move(frame))) {
    return;
  }
  if (!outbound_.closed()) {
    std::cerr << "[gateway] device " << device_id_ << " outbound queue full, closing\n";
    close();
  }
}

} // namespace parley::gateway
