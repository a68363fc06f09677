#include "parley/speech/synthesizer.hpp"

#include "parley/common/fs.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace parley::speech {

namespace {

constexpr double kTwoPi = 6.283185307179586;
constexpr std::size_t kMinDurationMs = 300;
constexpr std::size_t kMaxDurationMs = 5000;

std::size_t count_words(const std::string &text) {
  std::istringstream stream(text);
  std::string word;
  std::size_t words = 0;
  while (stream >> word) {
    ++words;
  }
  return words;
}

} // namespace

ToneSpeechSynthesizer::ToneSpeechSynthesizer(ToneSettings settings) : settings_(settings) {}

common::Result<std::unique_ptr<IAudioStream>>
ToneSpeechSynthesizer::synthesize(const SynthesisRequest &request) {
  const std::string text = common::trim(request.text);
  if (text.empty()) {
    return common::Result<std::unique_ptr<IAudioStream>>::failure("synthesis text is empty");
  }

  const std::size_t duration_ms =
      std::clamp(count_words(text) * settings_.ms_per_word, kMinDurationMs, kMaxDurationMs);
  const std::size_t samples =
      static_cast<std::size_t>(settings_.sample_rate) * duration_ms / 1000;

  Rechunker rechunker(settings_.chunk_bytes);
  for (std::size_t i = 0; i < samples; ++i) {
    const double phase = kTwoPi * settings_.frequency_hz * static_cast<double>(i) /
                         static_cast<double>(settings_.sample_rate);
    const auto sample = static_cast<std::int16_t>(std::sin(phase) * 6000.0);
    const char bytes[2] = {static_cast<char>(sample & 0xFF),
                           static_cast<char>((sample >> 8) & 0xFF)};
    rechunker.append(std::string_view(bytes, 2));
  }
  return common::Result<std::unique_ptr<IAudioStream>>::success(
      std::make_unique<BufferedAudioStream>(rechunker.finish()));
}

} // namespace parley::speech
