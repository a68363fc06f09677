#pragma once

#include "parley/conversation/model.hpp"
#include "parley/pipeline/content_policy.hpp"
#include "parley/saga/types.hpp"
#include "parley/speech/recognizer.hpp"
#include "parley/speech/synthesizer.hpp"

#include <chrono>
#include <memory>
#include <string_view>

namespace parley::pipeline {

inline constexpr std::string_view kConversationDefinition = "conversation_processing";

/// Request-record keys and the value type each one holds.
namespace keys {
inline constexpr const char *kDeviceId = "device_id";       // std::string
inline constexpr const char *kSessionId = "session_id";     // std::string
inline constexpr const char *kAudio = "audio";              // speech::AudioChunk
inline constexpr const char *kAudioConfig = "audio_config"; // speech::AudioConfig
inline constexpr const char *kTranscript = "transcript";    // std::string
inline constexpr const char *kContentSafe = "content_safe"; // bool
inline constexpr const char *kReplyText = "reply_text";     // std::string
inline constexpr const char *kReplyAudio = "reply_audio";   // std::vector<speech::AudioChunk>
inline constexpr const char *kConversation =
    "conversation"; // std::shared_ptr<conversation::IConversationHandle>
} // namespace keys

class NoCompensationStep : public saga::IStep {
public:
  [[nodiscard]] common::Status compensate(saga::SagaData &data,
                                          const saga::StepContext &context) override;
};

class TranscribeStep final : public NoCompensationStep {
public:
  explicit TranscribeStep(std::shared_ptr<speech::ISpeechRecognizer> recognizer);

  [[nodiscard]] std::string_view id() const override { return "speech_to_text"; }
  [[nodiscard]] saga::StepResult execute(saga::SagaData &data,
                                         const saga::StepContext &context) override;

private:
  std::shared_ptr<speech::ISpeechRecognizer> recognizer_;
};

class ValidateContentStep final : public NoCompensationStep {
public:
  explicit ValidateContentStep(std::shared_ptr<const IContentPolicy> policy);

  [[nodiscard]] std::string_view id() const override { return "content_validation"; }
  [[nodiscard]] saga::StepResult execute(saga::SagaData &data,
                                         const saga::StepContext &context) override;

private:
  std::shared_ptr<const IContentPolicy> policy_;
};

class GenerateReplyStep final : public NoCompensationStep {
public:
  explicit GenerateReplyStep(std::shared_ptr<conversation::IConversationModel> model);

  [[nodiscard]] std::string_view id() const override { return "llm_processing"; }
  [[nodiscard]] saga::StepResult execute(saga::SagaData &data,
                                         const saga::StepContext &context) override;

private:
  std::shared_ptr<conversation::IConversationModel> model_;
};

/// Collects the whole synthesized stream before succeeding.
class SynthesizeStep final : public NoCompensationStep {
public:
  explicit SynthesizeStep(std::shared_ptr<speech::ISpeechSynthesizer> synthesizer);

  [[nodiscard]] std::string_view id() const override { return "text_to_speech"; }
  [[nodiscard]] saga::StepResult execute(saga::SagaData &data,
                                         const saga::StepContext &context) override;

private:
  std::shared_ptr<speech::ISpeechSynthesizer> synthesizer_;
};

struct PipelineCapabilities {
  std::shared_ptr<speech::ISpeechRecognizer> recognizer;
  std::shared_ptr<const IContentPolicy> content_policy;
  std::shared_ptr<conversation::IConversationModel> model;
  std::shared_ptr<speech::ISpeechSynthesizer> synthesizer;
};

[[nodiscard]] saga::SagaDefinition make_conversation_definition(const PipelineCapabilities &caps,
                                                                std::chrono::milliseconds deadline);

} // namespace parley::pipeline
