#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "parley/speech/recognizer.hpp"
#include "parley/speech/synthesizer.hpp"

#include <memory>

namespace {

std::size_t drain(parley::speech::IAudioStream &stream, std::size_t &chunks) {
  std::size_t bytes = 0;
  chunks = 0;
  while (true) {
    auto next = stream.next();
    parley::tests::require(next.ok(), next.error());
    if (!next.value().has_value()) {
      return bytes;
    }
    ++chunks;
    bytes += next.value()->size();
  }
}

} // namespace

void register_speech_tests(std::vector<parley::tests::TestCase> &tests) {
  using parley::tests::require;
  namespace sp = parley::speech;
  namespace t = parley::testing;

  tests.push_back({"speech_scripted_transcript_follows_audio_length", [] {
                     sp::ScriptedSpeechRecognizer recognizer;
                     auto opened = recognizer.open_stream(sp::AudioConfig{});
                     require(opened.ok(), opened.error());
                     auto stream = opened.take();
                     for (int i = 0; i < 4; ++i) {
                       require(stream->stream(sp::AudioChunk(2000, 0x01)).ok(), "stream chunk");
                     }
                     const auto transcript = stream->end();
                     require(transcript.ok(), transcript.error());
                     require(transcript.value() == "Halo, apa kabar?",
                             "unexpected transcript: " + transcript.value());
                   }});

  tests.push_back({"speech_second_end_fails_deterministically", [] {
                     sp::ScriptedSpeechRecognizer recognizer;
                     auto stream = recognizer.open_stream(sp::AudioConfig{}).take();
                     require(stream->stream(sp::AudioChunk(100, 0x02)).ok(), "stream chunk");
                     require(stream->end().ok(), "first end should succeed");
                     const auto second = stream->end();
                     const auto third = stream->end();
                     require(!second.ok() && !third.ok(), "later ends must fail");
                     require(second.error() == sp::kStreamAlreadyEnded, "second end error");
                     require(third.error() == second.error(), "errors must be identical");
                     require(!stream->stream(sp::AudioChunk(1, 0)).ok(), "stream after end");
                   }});

  tests.push_back({"speech_empty_and_cancelled_streams_fail", [] {
                     sp::ScriptedSpeechRecognizer recognizer;
                     auto empty = recognizer.open_stream(sp::AudioConfig{}).take();
                     const auto no_audio = empty->end();
                     require(!no_audio.ok(), "no audio should fail");
                     require(no_audio.error() == sp::kNoAudioReceived, "no audio message");

                     auto cancelled = recognizer.open_stream(sp::AudioConfig{}).take();
                     require(cancelled->stream(sp::AudioChunk(10, 0)).ok(), "stream chunk");
                     cancelled->cancel();
                     require(!cancelled->end().ok(), "cancelled stream should fail");

                     sp::AudioConfig bad;
                     bad.sample_rate = 0;
                     require(!recognizer.open_stream(bad).ok(), "zero sample rate rejected");
                     require(!recognizer.transcribe({}, sp::AudioConfig{}).ok(),
                             "transcribe without audio");
                   }});

  tests.push_back({"speech_rechunker_splits_fixed_sizes", [] {
                     sp::Rechunker rechunker(4);
                     rechunker.append("abc");
                     rechunker.append("defgh");
                     rechunker.append("ij");
                     const auto chunks = rechunker.finish();
                     require(rechunker.total_bytes() == 10, "total bytes");
                     require(chunks.size() == 3, "chunk count");
                     require(chunks[0].size() == 4 && chunks[1].size() == 4, "full chunks");
                     require(chunks[2].size() == 2, "short final chunk");
                     require(chunks[1][0] == 'e', "byte order kept");
                   }});

  tests.push_back({"speech_tone_synthesizer_scales_with_text", [] {
                     sp::ToneSpeechSynthesizer synthesizer;
                     auto short_reply = synthesizer.synthesize({.text = "Halo", .language = "id-ID"});
                     require(short_reply.ok(), short_reply.error());
                     std::size_t chunks = 0;
                     const auto short_bytes = drain(*short_reply.value(), chunks);
                     require(short_bytes == 9600, "300ms of 16kHz LINEAR16");
                     require(chunks == 3, "3200 byte chunks");

                     auto long_reply = synthesizer.synthesize(
                         {.text = "Halo juga, senang sekali bisa bercerita denganmu hari ini",
                          .language = "id-ID"});
                     require(long_reply.ok(), long_reply.error());
                     const auto long_bytes = drain(*long_reply.value(), chunks);
                     require(long_bytes > short_bytes, "longer text should give longer audio");

                     require(!synthesizer.synthesize({.text = "   "}).ok(), "empty text rejected");
                   }});

  tests.push_back({"speech_elevenlabs_streams_and_rechunks", [] {
                     auto http = std::make_shared<t::ScriptedHttpClient>();
                     http->push_json(200, std::string(10'000, 'x'));
                     sp::ElevenLabsSettings settings;
                     settings.api_key = "el-key";
                     settings.base_url = "https://voice.example.com/";
                     settings.voice_id = "voice-1";
                     settings.chunk_bytes = 4096;
                     sp::ElevenLabsSynthesizer synthesizer(settings, http);

                     auto stream = synthesizer.synthesize({.text = "Halo \"teman\"", .language = "id-ID"});
                     require(stream.ok(), stream.error());
                     std::size_t chunks = 0;
                     require(drain(*stream.value(), chunks) == 10'000, "all bytes delivered");
                     require(chunks == 3, "rechunked to 4096");

                     const auto requests = http->requests();
                     require(requests.size() == 1, "one request");
                     require(requests[0].url ==
                                 "https://voice.example.com/v1/text-to-speech/voice-1/stream"
                                 "?output_format=pcm_16000",
                             "url mismatch: " + requests[0].url);
                     require(requests[0].headers.at("xi-api-key") == "el-key", "api key header");
                     require(requests[0].body.find("\"text\":\"Halo \\\"teman\\\"\"") !=
                                 std::string::npos,
                             "text should be escaped");
                   }});

  tests.push_back({"speech_elevenlabs_reports_failures", [] {
                     auto http = std::make_shared<t::ScriptedHttpClient>();
                     http->push_json(401, "{\"detail\":\"invalid api key\"}");
                     parley::common::HttpResponse timeout;
                     timeout.timeout = true;
                     http->push_response(timeout);

                     sp::ElevenLabsSettings settings;
                     settings.api_key = "el-key";
                     settings.voice_id = "voice-1";
                     sp::ElevenLabsSynthesizer synthesizer(settings, http);

                     const auto rejected = synthesizer.synthesize({.text = "halo"});
                     require(!rejected.ok(), "401 should fail");
                     require(rejected.error().find("401") != std::string::npos, "status in error");
                     require(rejected.error().find("invalid api key") != std::string::npos,
                             "body in error");
                     const auto timed_out = synthesizer.synthesize({.text = "halo"});
                     require(!timed_out.ok() && timed_out.error().find("timeout") != std::string::npos,
                             "timeout should fail");

                     sp::ElevenLabsSettings no_key;
                     no_key.voice_id = "voice-1";
                     sp::ElevenLabsSynthesizer unconfigured(no_key, http);
                     require(!unconfigured.synthesize({.text = "halo"}).ok(), "missing key");
                   }});

  tests.push_back({"speech_elevenlabs_base_url_normalization", [] {
                     require(sp::normalize_elevenlabs_base_url("").value() ==
                                 "https://api.elevenlabs.io",
                             "empty uses default");
                     require(sp::normalize_elevenlabs_base_url(" http://x.test// ").value() ==
                                 "http://x.test",
                             "trailing slashes stripped");
                     require(!sp::normalize_elevenlabs_base_url("ftp://x").ok(), "bad scheme");
                   }});
}
