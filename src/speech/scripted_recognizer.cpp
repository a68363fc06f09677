#include "parley/speech/recognizer.hpp"

namespace parley::speech {

std::string ScriptedSpeechRecognizer::transcript_for(const std::size_t total_bytes) {
  if (total_bytes > 10'000) {
    return "Halo Arunika, apa kabar? Saya ingin bercerita tentang hari ini.";
  }
  if (total_bytes > 5'000) {
    return "Halo, apa kabar?";
  }
  return "Halo!";
}

common::Result<std::string> ScriptedSpeechRecognizer::transcribe(const AudioChunk &audio,
                                                                 const AudioConfig &config) {
  (void)config;
  if (audio.empty()) {
    return common::Result<std::string>::failure(std::string(kNoAudioReceived));
  }
  return common::Result<std::string>::success(transcript_for(audio.size()));
}

common::Result<std::unique_ptr<IStreamingRecognition>>
ScriptedSpeechRecognizer::open_stream(const AudioConfig &config) {
  if (config.sample_rate <= 0) {
    return common::Result<std::unique_ptr<IStreamingRecognition>>::failure(
        "invalid sample rate: " + std::to_string(config.sample_rate));
  }
  return common::Result<std::unique_ptr<IStreamingRecognition>>::success(
      std::make_unique<ScriptedRecognition>(config));
}

ScriptedRecognition::ScriptedRecognition(AudioConfig config) : config_(std::move(config)) {}

common::Status ScriptedRecognition::stream(const AudioChunk &audio) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (phase_ != Phase::Open) {
    return common::Status::error(std::string(kStreamAlreadyEnded));
  }
  total_bytes_ += audio.size();
  return common::Status::success();
}

common::Result<std::string> ScriptedRecognition::end() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (phase_ == Phase::Ended) {
    return common::Result<std::string>::failure(std::string(kStreamAlreadyEnded));
  }
  const bool cancelled = phase_ == Phase::Cancelled;
  phase_ = Phase::Ended;
  if (cancelled) {
    return common::Result<std::string>::failure("recognition cancelled");
  }
  if (total_bytes_ == 0) {
    return common::Result<std::string>::failure(std::string(kNoAudioReceived));
  }
  return common::Result<std::string>::success(
      ScriptedSpeechRecognizer::transcript_for(total_bytes_));
}

void ScriptedRecognition::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (phase_ == Phase::Open) {
    phase_ = Phase::Cancelled;
  }
}

} // namespace parley::speech
