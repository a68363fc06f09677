#include "parley/pipeline/steps.hpp"

#include "parley/common/fs.hpp"

namespace parley::pipeline {

using common::ErrorCode;
using saga::StepResult;

common::Status NoCompensationStep::compensate(saga::SagaData &, const saga::StepContext &) {
  return common::Status::success();
}

TranscribeStep::TranscribeStep(std::shared_ptr<speech::ISpeechRecognizer> recognizer)
    : recognizer_(std::move(recognizer)) {}

StepResult TranscribeStep::execute(saga::SagaData &data, const saga::StepContext &) {
  if (const auto *transcript = saga::data_get<std::string>(data, keys::kTranscript)) {
    std::string text = common::trim(*transcript);
    if (text.empty()) {
      return StepResult::failure(ErrorCode::Stream, "transcript is empty");
    }
    data[keys::kTranscript] = text;
    return StepResult::ok(text);
  }

  const auto *audio = saga::data_get<speech::AudioChunk>(data, keys::kAudio);
  if (audio == nullptr) {
    return StepResult::failure(ErrorCode::Validation, "request has neither transcript nor audio");
  }
  if (recognizer_ == nullptr) {
    return StepResult::failure(ErrorCode::Stream, "speech recognizer is not configured");
  }

  speech::AudioConfig config;
  if (const auto *negotiated = saga::data_get<speech::AudioConfig>(data, keys::kAudioConfig)) {
    config = *negotiated;
  }
  auto transcribed = recognizer_->transcribe(*audio, config);
  if (!transcribed.ok()) {
    return StepResult::failure(ErrorCode::Stream, "transcription failed: " + transcribed.error());
  }
  std::string text = common::trim(transcribed.value());
  if (text.empty()) {
    return StepResult::failure(ErrorCode::Stream, "transcript is empty");
  }
  data[keys::kTranscript] = text;
  return StepResult::ok(text);
}

ValidateContentStep::ValidateContentStep(std::shared_ptr<const IContentPolicy> policy)
    : policy_(std::move(policy)) {}

StepResult ValidateContentStep::execute(saga::SagaData &data, const saga::StepContext &) {
  const auto *transcript = saga::data_get<std::string>(data, keys::kTranscript);
  if (transcript == nullptr) {
    return StepResult::failure(ErrorCode::Validation, "no transcript to validate");
  }
  if (policy_ != nullptr) {
    const auto verdict = policy_->check(*transcript);
    if (!verdict.ok()) {
      data[keys::kContentSafe] = false;
      return StepResult::failure(ErrorCode::ContentRejected, verdict.error());
    }
  }
  data[keys::kContentSafe] = true;
  return StepResult::ok("safe");
}

GenerateReplyStep::GenerateReplyStep(std::shared_ptr<conversation::IConversationModel> model)
    : model_(std::move(model)) {}

StepResult GenerateReplyStep::execute(saga::SagaData &data, const saga::StepContext &context) {
  const auto *transcript = saga::data_get<std::string>(data, keys::kTranscript);
  if (transcript == nullptr) {
    return StepResult::failure(ErrorCode::Validation, "no transcript to answer");
  }

  std::shared_ptr<conversation::IConversationHandle> handle;
  if (const auto *stored = saga::data_get<std::shared_ptr<conversation::IConversationHandle>>(
          data, keys::kConversation)) {
    handle = *stored;
  }
  if (handle == nullptr) {
    if (model_ == nullptr) {
      return StepResult::failure(ErrorCode::Stream, "conversation model is not configured");
    }
    auto opened = model_->open({});
    if (!opened.ok()) {
      return StepResult::failure(ErrorCode::Stream,
                                 "could not open conversation: " + opened.error());
    }
    handle = opened.take();
    data[keys::kConversation] = handle;
  }

  auto reply = handle->send(*transcript);
  if (context.is_cancelled()) {
    return StepResult::failure(ErrorCode::Timeout, "saga deadline exceeded");
  }
  if (!reply.ok()) {
    return StepResult::failure(ErrorCode::Stream, "reply generation failed: " + reply.error());
  }
  std::string text = common::trim(reply.value());
  if (text.empty()) {
    return StepResult::failure(ErrorCode::Stream, "model returned an empty reply");
  }
  data[keys::kReplyText] = text;
  return StepResult::ok(text);
}

SynthesizeStep::SynthesizeStep(std::shared_ptr<speech::ISpeechSynthesizer> synthesizer)
    : synthesizer_(std::move(synthesizer)) {}

StepResult SynthesizeStep::execute(saga::SagaData &data, const saga::StepContext &context) {
  const auto *reply = saga::data_get<std::string>(data, keys::kReplyText);
  if (reply == nullptr) {
    return StepResult::failure(ErrorCode::Validation, "no reply text to synthesize");
  }
  if (synthesizer_ == nullptr) {
    return StepResult::failure(ErrorCode::Stream, "speech synthesizer is not configured");
  }

  speech::SynthesisRequest request;
  request.text = *reply;
  if (const auto *config = saga::data_get<speech::AudioConfig>(data, keys::kAudioConfig)) {
    request.language = config->language;
  }

  auto opened = synthesizer_->synthesize(request);
  if (!opened.ok()) {
    return StepResult::failure(ErrorCode::Stream, "synthesis failed: " + opened.error());
  }
  auto stream = opened.take();

  std::vector<speech::AudioChunk> chunks;
  std::size_t total_bytes = 0;
  while (true) {
    if (context.is_cancelled() || context.past_deadline()) {
      return StepResult::failure(ErrorCode::Timeout, "saga deadline exceeded");
    }
    auto next = stream->next();
    if (!next.ok()) {
      return StepResult::failure(ErrorCode::Stream, "synthesis stream failed: " + next.error());
    }
    if (!next.value().has_value()) {
      break;
    }
    total_bytes += next.value()->size();
    chunks.push_back(std::move(*next.value()));
  }
  if (chunks.empty()) {
    return StepResult::failure(ErrorCode::Stream, "synthesizer produced no audio");
  }

  const std::size_t count = chunks.size();
  data[keys::kReplyAudio] = std::move(chunks);
  return StepResult::ok(std::to_string(count) + " chunks, " + std::to_string(total_bytes) +
                        " bytes");
}

saga::SagaDefinition make_conversation_definition(const PipelineCapabilities &caps,
                                                  const std::chrono::milliseconds deadline) {
  saga::SagaDefinition definition;
  definition.name = std::string(kConversationDefinition);
  definition.deadline = deadline;
  definition.steps = {
      std::make_shared<TranscribeStep>(caps.recognizer),
      std::make_shared<ValidateContentStep>(caps.content_policy),
      std::make_shared<GenerateReplyStep>(caps.model),
      std::make_shared<SynthesizeStep>(caps.synthesizer),
  };
  return definition;
}

} // namespace parley::pipeline
