#include "parley/pipeline/conversation_pipeline.hpp"

#include "parley/observability/global.hpp"

#include <iostream>

namespace parley::pipeline {

namespace {

std::chrono::milliseconds since(const saga::SteadyClock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(saga::SteadyClock::now() - started);
}

} // namespace

ConversationPipeline::ConversationPipeline(std::shared_ptr<saga::SagaManager> sagas,
                                           PipelineSettings settings)
    : sagas_(std::move(sagas)), settings_(settings) {}

common::Status ConversationPipeline::install(const PipelineCapabilities &capabilities) {
  return sagas_->register_definition(make_conversation_definition(capabilities, settings_.deadline));
}

PipelineOutcome ConversationPipeline::process(const UtteranceRequest &request) {
  const auto started = saga::SteadyClock::now();
  PipelineOutcome outcome;

  saga::SagaData data;
  data[keys::kDeviceId] = request.device_id;
  data[keys::kSessionId] = request.session_id;
  data[keys::kAudioConfig] = request.audio_config;
  if (request.transcript.has_value()) {
    data[keys::kTranscript] = *request.transcript;
  }
  if (!request.audio.empty()) {
    data[keys::kAudio] = request.audio;
  }
  if (request.conversation != nullptr) {
    data[keys::kConversation] = request.conversation;
  }

  auto started_saga = sagas_->start(std::string(kConversationDefinition), std::move(data));
  if (!started_saga.ok()) {
    outcome.error = common::Error{common::ErrorCode::Stream, started_saga.error()};
    outcome.elapsed = since(started);
    observability::record_pipeline_latency(outcome.elapsed, false);
    return outcome;
  }
  outcome.saga_id = started_saga.value();

  const auto instance =
      sagas_->wait(outcome.saga_id, settings_.wait_timeout, settings_.poll_interval);
  outcome.elapsed = since(started);

  if (!instance.has_value() || !instance->terminal()) {
    std::cerr << "[pipeline] gave up waiting for " << outcome.saga_id << "\n";
    outcome.error = common::Error{common::ErrorCode::Timeout, "pipeline did not finish in time"};
  } else if (instance->state == saga::SagaState::Compensated) {
    outcome.error = instance->error.value_or(
        common::Error{common::ErrorCode::Stream, "pipeline failed"});
  } else {
    if (const auto *transcript = saga::data_get<std::string>(instance->data, keys::kTranscript)) {
      outcome.transcript = *transcript;
    }
    if (const auto *reply = saga::data_get<std::string>(instance->data, keys::kReplyText)) {
      outcome.reply_text = *reply;
    }
    if (const auto *audio =
            saga::data_get<std::vector<speech::AudioChunk>>(instance->data, keys::kReplyAudio)) {
      outcome.reply_audio = *audio;
    }
  }

  observability::record_pipeline_latency(outcome.elapsed, outcome.ok());
  return outcome;
}

} // namespace parley::pipeline
