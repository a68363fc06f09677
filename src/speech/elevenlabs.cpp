#include "parley/speech/synthesizer.hpp"

#include "parley/common/fs.hpp"
#include "parley/common/json_util.hpp"

#include <sstream>

namespace parley::speech {

common::Result<std::string> normalize_elevenlabs_base_url(std::string value) {
  value = common::trim(value);
  if (value.empty()) {
    return common::Result<std::string>::success("https://api.elevenlabs.io");
  }
  const std::string lowered = common::to_lower(value);
  if (!common::starts_with(lowered, "http://") && !common::starts_with(lowered, "https://")) {
    return common::Result<std::string>::failure(
        "ElevenLabs base URL must start with http:// or https://");
  }
  while (!value.empty() && value.back() == '/') {
    value.pop_back();
  }
  return common::Result<std::string>::success(std::move(value));
}

ElevenLabsSynthesizer::ElevenLabsSynthesizer(ElevenLabsSettings settings,
                                             std::shared_ptr<common::HttpClient> http)
    : settings_(std::move(settings)), http_(std::move(http)) {
  if (auto base_url = normalize_elevenlabs_base_url(settings_.base_url); base_url.ok()) {
    settings_.base_url = base_url.value();
  }
}

std::string ElevenLabsSynthesizer::request_url(const std::string &voice_id) const {
  std::string url = settings_.base_url + "/v1/text-to-speech/" + voice_id + "/stream";
  if (!settings_.output_format.empty()) {
    url += "?output_format=" + settings_.output_format;
  }
  return url;
}

std::string ElevenLabsSynthesizer::request_body(const std::string &text) const {
  const auto &voice = settings_.voice_settings;
  std::ostringstream body;
  body << "{\"text\":\"" << common::json_escape(text) << "\","
       << "\"model_id\":\"" << common::json_escape(settings_.model_id) << "\","
       << "\"voice_settings\":{"
       << "\"stability\":" << voice.stability << ","
       << "\"similarity_boost\":" << voice.similarity_boost << ","
       << "\"style\":" << voice.style << ","
       << "\"use_speaker_boost\":" << (voice.use_speaker_boost ? "true" : "false") << "}}";
  return body.str();
}

common::Result<std::unique_ptr<IAudioStream>>
ElevenLabsSynthesizer::synthesize(const SynthesisRequest &request) {
  using StreamResult = common::Result<std::unique_ptr<IAudioStream>>;
  const std::string text = common::trim(request.text);
  if (text.empty()) {
    return StreamResult::failure("synthesis text is empty");
  }
  const std::string voice_id = common::trim(request.voice.value_or(settings_.voice_id));
  if (voice_id.empty()) {
    return StreamResult::failure("ElevenLabs voice ID is required");
  }
  if (common::trim(settings_.api_key).empty()) {
    return StreamResult::failure("ElevenLabs API key is not configured");
  }
  if (http_ == nullptr) {
    return StreamResult::failure("ElevenLabs HTTP client is not configured");
  }

  const common::HttpHeaders headers = {
      {"Content-Type", "application/json"},
      {"Accept", "audio/*"},
      {"xi-api-key", settings_.api_key},
  };

  Rechunker rechunker(settings_.chunk_bytes);
  std::string error_body;
  const auto response = http_->post_json_stream(
      request_url(voice_id), headers, request_body(text), settings_.timeout_ms,
      [&](std::string_view bytes) {
        // error responses are JSON, keep a prefix for the message
        if (error_body.size() < 512) {
          error_body.append(bytes.substr(0, 512 - error_body.size()));
        }
        rechunker.append(bytes);
      });

  if (response.transport_failed()) {
    return StreamResult::failure("ElevenLabs request failed: " +
                                 (response.timeout ? std::string("timeout")
                                                   : response.network_error_message));
  }
  if (response.status < 200 || response.status >= 300) {
    return StreamResult::failure("ElevenLabs request failed with HTTP status " +
                                 std::to_string(response.status) + ": " + error_body);
  }
  if (rechunker.total_bytes() == 0) {
    return StreamResult::failure("ElevenLabs returned no audio");
  }
  return StreamResult::success(std::make_unique<BufferedAudioStream>(rechunker.finish()));
}

} // namespace parley::speech
