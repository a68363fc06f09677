#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace parley::config {

struct ServerConfig {
  std::string host = "0.0.0.0";
  std::uint16_t port = 8080;
  std::string path = "/ws";
  std::uint32_t max_connections = 256;
  bool tls_enabled = false;
  std::string tls_cert_file;
  std::string tls_key_file;
  std::uint64_t max_frame_bytes = 512 * 1024;
  std::uint32_t ping_period_secs = 54;
  std::uint32_t pong_wait_secs = 60;
  std::uint32_t write_wait_secs = 10;
  std::uint32_t outbound_queue_capacity = 256;
  std::vector<std::string> device_tokens;
};

struct AudioConfig {
  int sample_rate = 48000;
  std::string encoding = "LINEAR16";
  std::string language = "id-ID";
};

struct SessionsConfig {
  std::string backend = "sqlite";
  std::string path = "~/.parley/sessions.db";
  std::uint32_t continuation_window_minutes = 30;
  std::uint32_t cleanup_interval_minutes = 30;
  std::uint32_t cleanup_initial_delay_secs = 60;
};

struct PipelineConfig {
  std::uint64_t deadline_ms = 30'000;
  std::uint64_t wait_timeout_ms = 35'000;
  std::uint64_t poll_interval_ms = 50;
  std::uint32_t event_queue_capacity = 100;
  std::uint32_t retention_minutes = 10;
};

struct ContentConfig {
  std::vector<std::string> blocked_terms;
};

struct ElevenLabsConfig {
  std::string api_key;
  std::string base_url = "https://api.elevenlabs.io";
  std::string voice_id = "21m00Tcm4TlvDq8ikWAM";
  std::string model_id = "eleven_multilingual_v2";
  std::string output_format = "pcm_16000";
  std::uint32_t chunk_bytes = 4096;
  std::uint64_t timeout_ms = 20'000;
};

struct SpeechConfig {
  std::string recognizer = "scripted";
  std::string synthesizer = "tone";
  ElevenLabsConfig elevenlabs;
};

struct ConversationConfig {
  std::string provider = "echo";
  std::string base_url = "https://api.openai.com/v1";
  std::string api_key;
  std::string model = "gpt-4o-mini";
  double temperature = 0.7;
  std::string system_prompt =
      "Kamu adalah Arunika, teman bicara yang ramah untuk anak-anak. Jawab singkat dan hangat.";
  std::uint32_t max_retries = 2;
  std::uint64_t timeout_ms = 20'000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ServerConfig server;
  AudioConfig audio;
  SessionsConfig sessions;
  PipelineConfig pipeline;
  ContentConfig content;
  SpeechConfig speech;
  ConversationConfig conversation;
  ObservabilityConfig observability;
};

} // namespace parley::config
