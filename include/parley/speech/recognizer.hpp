#pragma once

#include "parley/common/result.hpp"
#include "parley/speech/audio.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace parley::speech {

/// One utterance worth of streaming recognition. `end()` yields the transcript
/// once; every later call fails with the same error.
class IStreamingRecognition {
public:
  virtual ~IStreamingRecognition() = default;

  [[nodiscard]] virtual common::Status stream(const AudioChunk &audio) = 0;
  [[nodiscard]] virtual common::Result<std::string> end() = 0;
  /// Abandons the utterance. A following `end()` releases provider resources and fails.
  virtual void cancel() = 0;
};

class ISpeechRecognizer {
public:
  virtual ~ISpeechRecognizer() = default;

  [[nodiscard]] virtual std::string_view id() const = 0;
  [[nodiscard]] virtual common::Result<std::string> transcribe(const AudioChunk &audio,
                                                               const AudioConfig &config) = 0;
  [[nodiscard]] virtual common::Result<std::unique_ptr<IStreamingRecognition>>
  open_stream(const AudioConfig &config) = 0;
};

inline constexpr std::string_view kStreamAlreadyEnded = "recognition stream already ended";
inline constexpr std::string_view kNoAudioReceived = "no audio data received";

/// Offline recognizer for development and tests: the transcript is chosen by how
/// much audio arrived, so a device can exercise the full pipeline without a provider.
class ScriptedSpeechRecognizer final : public ISpeechRecognizer {
public:
  [[nodiscard]] std::string_view id() const override { return "scripted"; }
  [[nodiscard]] common::Result<std::string> transcribe(const AudioChunk &audio,
                                                       const AudioConfig &config) override;
  [[nodiscard]] common::Result<std::unique_ptr<IStreamingRecognition>>
  open_stream(const AudioConfig &config) override;

  [[nodiscard]] static std::string transcript_for(std::size_t total_bytes);
};

class ScriptedRecognition final : public IStreamingRecognition {
public:
  explicit ScriptedRecognition(AudioConfig config);

  [[nodiscard]] common::Status stream(const AudioChunk &audio) override;
  [[nodiscard]] common::Result<std::string> end() override;
  void cancel() override;
  [[nodiscard]] const AudioConfig &config() const { return config_; }

private:
  enum class Phase { Open, Cancelled, Ended };

  AudioConfig config_;
  std::mutex mutex_;
  Phase phase_ = Phase::Open;
  std::size_t total_bytes_ = 0;
};

} // namespace parley::speech
