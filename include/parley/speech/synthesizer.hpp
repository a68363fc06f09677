#pragma once

#include "parley/common/http.hpp"
#include "parley/common/result.hpp"
#include "parley/speech/audio.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace parley::speech {

struct SynthesisRequest {
  std::string text;
  std::string language;
  std::optional<std::string> voice;
};

/// Pull-based chunk stream. `next()` returns nullopt once the stream is exhausted.
class IAudioStream {
public:
  virtual ~IAudioStream() = default;
  [[nodiscard]] virtual common::Result<std::optional<AudioChunk>> next() = 0;
};

class BufferedAudioStream final : public IAudioStream {
public:
  explicit BufferedAudioStream(std::deque<AudioChunk> chunks);
  [[nodiscard]] common::Result<std::optional<AudioChunk>> next() override;

private:
  std::deque<AudioChunk> chunks_;
};

/// Splits a byte stream into fixed-size chunks; the final chunk may be shorter.
class Rechunker {
public:
  explicit Rechunker(std::size_t chunk_bytes);
  void append(std::string_view bytes);
  [[nodiscard]] std::deque<AudioChunk> finish();
  [[nodiscard]] std::size_t total_bytes() const { return total_bytes_; }

private:
  std::size_t chunk_bytes_;
  std::deque<AudioChunk> chunks_;
  AudioChunk pending_;
  std::size_t total_bytes_ = 0;
};

class ISpeechSynthesizer {
public:
  virtual ~ISpeechSynthesizer() = default;

  [[nodiscard]] virtual std::string_view id() const = 0;
  [[nodiscard]] virtual common::Result<std::unique_ptr<IAudioStream>>
  synthesize(const SynthesisRequest &request) = 0;
};

struct ToneSettings {
  int sample_rate = 16000;
  double frequency_hz = 440.0;
  std::size_t chunk_bytes = 3200;
  std::size_t ms_per_word = 250;
};

/// Offline synthesizer producing a LINEAR16 tone whose length follows the text.
class ToneSpeechSynthesizer final : public ISpeechSynthesizer {
public:
  explicit ToneSpeechSynthesizer(ToneSettings settings = {});

  [[nodiscard]] std::string_view id() const override { return "tone"; }
  [[nodiscard]] common::Result<std::unique_ptr<IAudioStream>>
  synthesize(const SynthesisRequest &request) override;

private:
  ToneSettings settings_;
};

struct ElevenLabsVoiceSettings {
  double stability = 0.5;
  double similarity_boost = 0.75;
  double style = 0.0;
  bool use_speaker_boost = true;
};

struct ElevenLabsSettings {
  std::string api_key;
  std::string base_url = "https://api.elevenlabs.io";
  std::string voice_id;
  std::string model_id = "eleven_multilingual_v2";
  std::string output_format = "pcm_16000";
  std::size_t chunk_bytes = 4096;
  std::uint64_t timeout_ms = 20'000;
  ElevenLabsVoiceSettings voice_settings;
};

class ElevenLabsSynthesizer final : public ISpeechSynthesizer {
public:
  ElevenLabsSynthesizer(ElevenLabsSettings settings, std::shared_ptr<common::HttpClient> http);

  [[nodiscard]] std::string_view id() const override { return "elevenlabs"; }
  [[nodiscard]] common::Result<std::unique_ptr<IAudioStream>>
  synthesize(const SynthesisRequest &request) override;

  [[nodiscard]] std::string request_url(const std::string &voice_id) const;
  [[nodiscard]] std::string request_body(const std::string &text) const;

private:
  ElevenLabsSettings settings_;
  std::shared_ptr<common::HttpClient> http_;
};

[[nodiscard]] common::Result<std::string> normalize_elevenlabs_base_url(std::string value);

} // namespace parley::speech
