#pragma once

#include "parley/common/error.hpp"
#include "parley/common/result.hpp"
#include "parley/conversation/model.hpp"
#include "parley/pipeline/steps.hpp"
#include "parley/saga/manager.hpp"
#include "parley/speech/audio.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parley::pipeline {

/// One utterance to answer. Either `transcript` or `audio` must be set.
struct UtteranceRequest {
  std::string device_id;
  std::string session_id;
  std::optional<std::string> transcript;
  speech::AudioChunk audio;
  speech::AudioConfig audio_config;
  std::shared_ptr<conversation::IConversationHandle> conversation;
};

struct PipelineOutcome {
  std::string saga_id;
  std::string transcript;
  std::string reply_text;
  std::vector<speech::AudioChunk> reply_audio;
  std::chrono::milliseconds elapsed{0};
  std::optional<common::Error> error;

  [[nodiscard]] bool ok() const { return !error.has_value(); }
};

struct PipelineSettings {
  std::chrono::milliseconds deadline{30'000};
  std::chrono::milliseconds wait_timeout{35'000};
  std::chrono::milliseconds poll_interval{50};
};

/// Runs `conversation_processing` sagas and blocks the caller until each one settles.
class ConversationPipeline {
public:
  ConversationPipeline(std::shared_ptr<saga::SagaManager> sagas, PipelineSettings settings);

  /// Registers the four-step definition with the manager.
  [[nodiscard]] common::Status install(const PipelineCapabilities &capabilities);

  [[nodiscard]] PipelineOutcome process(const UtteranceRequest &request);

  [[nodiscard]] const PipelineSettings &settings() const { return settings_; }

private:
  std::shared_ptr<saga::SagaManager> sagas_;
  PipelineSettings settings_;
};

} // namespace parley::pipeline
