#include "parley/config/config.hpp"

#include "parley/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace parley::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".parley";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

using Warnings = common::Result<std::vector<std::string>>;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("PARLEY_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    return false;
  }
  for (const char ch : name) {
    if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '_') {
      return false;
    }
  }
  return true;
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!is_valid_env_name(key)) {
      continue;
    }
    // overwrite = 0 keeps variables that are already set
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  if (const char *env_file = std::getenv("PARLEY_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    load_dotenv_file(common::expand_path(env_file));
  }
  if (auto home = common::home_dir(); home.ok()) {
    load_dotenv_file(home.value() / CONFIG_FOLDER / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    load_dotenv_file(cwd / ".env");
  }
}

std::uint16_t to_port(const std::uint64_t value, const std::uint16_t fallback) {
  if (value > std::numeric_limits<std::uint16_t>::max()) {
    return fallback;
  }
  return static_cast<std::uint16_t>(value);
}

std::uint32_t to_u32(const std::uint64_t value, const std::uint32_t fallback) {
  if (value > std::numeric_limits<std::uint32_t>::max()) {
    return fallback;
  }
  return static_cast<std::uint32_t>(value);
}

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

bool is_encoding_token(const std::string &value) {
  if (value.empty()) {
    return false;
  }
  for (const char ch : value) {
    if (std::isupper(static_cast<unsigned char>(ch)) == 0 &&
        std::isdigit(static_cast<unsigned char>(ch)) == 0 && ch != '_') {
      return false;
    }
  }
  return true;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      std::error_code ec;
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_toml(Config &config, const common::TomlDocument &doc) {
  auto &server = config.server;
  server.host = doc.get_string("server.host", server.host);
  server.port = to_port(doc.get_u64("server.port", server.port), server.port);
  server.path = doc.get_string("server.path", server.path);
  server.max_connections =
      to_u32(doc.get_u64("server.max_connections", server.max_connections), server.max_connections);
  server.tls_enabled = doc.get_bool("server.tls_enabled", server.tls_enabled);
  server.tls_cert_file = expand_config_value(doc.get_string("server.tls_cert_file", server.tls_cert_file));
  server.tls_key_file = expand_config_value(doc.get_string("server.tls_key_file", server.tls_key_file));
  server.max_frame_bytes = doc.get_u64("server.max_frame_bytes", server.max_frame_bytes);
  server.ping_period_secs =
      to_u32(doc.get_u64("server.ping_period_secs", server.ping_period_secs), server.ping_period_secs);
  server.pong_wait_secs =
      to_u32(doc.get_u64("server.pong_wait_secs", server.pong_wait_secs), server.pong_wait_secs);
  server.write_wait_secs =
      to_u32(doc.get_u64("server.write_wait_secs", server.write_wait_secs), server.write_wait_secs);
  server.outbound_queue_capacity =
      to_u32(doc.get_u64("server.outbound_queue_capacity", server.outbound_queue_capacity),
             server.outbound_queue_capacity);
  server.device_tokens = doc.get_string_array("server.device_tokens", server.device_tokens);

  auto &audio = config.audio;
  audio.sample_rate = doc.get_int("audio.sample_rate", audio.sample_rate);
  audio.encoding = doc.get_string("audio.encoding", audio.encoding);
  audio.language = doc.get_string("audio.language", audio.language);

  auto &sessions = config.sessions;
  sessions.backend = common::to_lower(doc.get_string("sessions.backend", sessions.backend));
  sessions.path = doc.get_string("sessions.path", sessions.path);
  sessions.continuation_window_minutes =
      to_u32(doc.get_u64("sessions.continuation_window_minutes",
                         sessions.continuation_window_minutes),
             sessions.continuation_window_minutes);
  sessions.cleanup_interval_minutes =
      to_u32(doc.get_u64("sessions.cleanup_interval_minutes", sessions.cleanup_interval_minutes),
             sessions.cleanup_interval_minutes);
  sessions.cleanup_initial_delay_secs =
      to_u32(doc.get_u64("sessions.cleanup_initial_delay_secs",
                         sessions.cleanup_initial_delay_secs),
             sessions.cleanup_initial_delay_secs);

  auto &pipeline = config.pipeline;
  pipeline.deadline_ms = doc.get_u64("pipeline.deadline_ms", pipeline.deadline_ms);
  pipeline.wait_timeout_ms = doc.get_u64("pipeline.wait_timeout_ms", pipeline.wait_timeout_ms);
  pipeline.poll_interval_ms = doc.get_u64("pipeline.poll_interval_ms", pipeline.poll_interval_ms);
  pipeline.event_queue_capacity =
      to_u32(doc.get_u64("pipeline.event_queue_capacity", pipeline.event_queue_capacity),
             pipeline.event_queue_capacity);
  pipeline.retention_minutes =
      to_u32(doc.get_u64("pipeline.retention_minutes", pipeline.retention_minutes),
             pipeline.retention_minutes);

  config.content.blocked_terms =
      doc.get_string_array("content.blocked_terms", config.content.blocked_terms);

  auto &speech = config.speech;
  speech.recognizer = common::to_lower(doc.get_string("speech.recognizer", speech.recognizer));
  speech.synthesizer = common::to_lower(doc.get_string("speech.synthesizer", speech.synthesizer));
  auto &eleven = speech.elevenlabs;
  eleven.api_key = expand_config_value(doc.get_string("speech.elevenlabs.api_key", eleven.api_key));
  eleven.base_url = doc.get_string("speech.elevenlabs.base_url", eleven.base_url);
  eleven.voice_id = doc.get_string("speech.elevenlabs.voice_id", eleven.voice_id);
  eleven.model_id = doc.get_string("speech.elevenlabs.model_id", eleven.model_id);
  eleven.output_format = doc.get_string("speech.elevenlabs.output_format", eleven.output_format);
  eleven.chunk_bytes =
      to_u32(doc.get_u64("speech.elevenlabs.chunk_bytes", eleven.chunk_bytes), eleven.chunk_bytes);
  eleven.timeout_ms = doc.get_u64("speech.elevenlabs.timeout_ms", eleven.timeout_ms);

  auto &conversation = config.conversation;
  conversation.provider =
      common::to_lower(doc.get_string("conversation.provider", conversation.provider));
  conversation.base_url = doc.get_string("conversation.base_url", conversation.base_url);
  conversation.api_key =
      expand_config_value(doc.get_string("conversation.api_key", conversation.api_key));
  conversation.model = doc.get_string("conversation.model", conversation.model);
  conversation.temperature = doc.get_double("conversation.temperature", conversation.temperature);
  conversation.system_prompt =
      doc.get_string("conversation.system_prompt", conversation.system_prompt);
  conversation.max_retries =
      to_u32(doc.get_u64("conversation.max_retries", conversation.max_retries),
             conversation.max_retries);
  conversation.timeout_ms = doc.get_u64("conversation.timeout_ms", conversation.timeout_ms);

  config.observability.backend =
      common::to_lower(doc.get_string("observability.backend", config.observability.backend));
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *host = std::getenv("PARLEY_HOST"); host != nullptr && *host) {
    config.server.host = host;
  }
  if (const char *port = std::getenv("PARLEY_PORT"); port != nullptr && *port) {
    std::uint64_t parsed = 0;
    const std::string text(port);
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec == std::errc() && ptr == text.data() + text.size()) {
      config.server.port = to_port(parsed, config.server.port);
    }
  }
  if (const char *backend = std::getenv("PARLEY_SESSIONS_BACKEND");
      backend != nullptr && *backend) {
    config.sessions.backend = common::to_lower(backend);
  }
  if (const char *key = std::getenv("ELEVENLABS_API_KEY"); key != nullptr && *key) {
    config.speech.elevenlabs.api_key = key;
  }
  if (const char *key = std::getenv("PARLEY_LLM_API_KEY"); key != nullptr && *key) {
    config.conversation.api_key = key;
  }
  if (const char *url = std::getenv("PARLEY_LLM_BASE_URL"); url != nullptr && *url) {
    config.conversation.base_url = url;
  }
}

common::Result<Config> load_config_from(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  const auto parsed = common::parse_toml(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }

  Config config;
  apply_toml(config, parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path = config_path();
  if (!path.ok()) {
    return common::Result<Config>::failure(path.error());
  }
  std::error_code ec;
  if (!std::filesystem::exists(path.value(), ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }
  return load_config_from(path.value());
}

common::Status save_config(const Config &config) {
  const auto path = config_path();
  if (!path.ok()) {
    return common::Status::error(path.error());
  }
  return save_config_to(config, path.value());
}

common::Status save_config_to(const Config &config, const std::filesystem::path &path) {
  if (!path.parent_path().empty()) {
    if (auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
      return common::Status::error(dir.error());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";
  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  const auto q = [](const std::string &value) { return common::quote_toml_string(value); };
  const auto &server = config.server;
  file << "[server]\n";
  file << "host = " << q(server.host) << "\n";
  file << "port = " << server.port << "\n";
  file << "path = " << q(server.path) << "\n";
  file << "max_connections = " << server.max_connections << "\n";
  file << "tls_enabled = " << bool_to_toml(server.tls_enabled) << "\n";
  file << "tls_cert_file = " << q(server.tls_cert_file) << "\n";
  file << "tls_key_file = " << q(server.tls_key_file) << "\n";
  file << "max_frame_bytes = " << server.max_frame_bytes << "\n";
  file << "ping_period_secs = " << server.ping_period_secs << "\n";
  file << "pong_wait_secs = " << server.pong_wait_secs << "\n";
  file << "write_wait_secs = " << server.write_wait_secs << "\n";
  file << "outbound_queue_capacity = " << server.outbound_queue_capacity << "\n";
  file << "device_tokens = " << string_array_to_toml(server.device_tokens) << "\n";

  file << "\n[audio]\n";
  file << "sample_rate = " << config.audio.sample_rate << "\n";
  file << "encoding = " << q(config.audio.encoding) << "\n";
  file << "language = " << q(config.audio.language) << "\n";

  const auto &sessions = config.sessions;
  file << "\n[sessions]\n";
  file << "backend = " << q(sessions.backend) << "\n";
  file << "path = " << q(sessions.path) << "\n";
  file << "continuation_window_minutes = " << sessions.continuation_window_minutes << "\n";
  file << "cleanup_interval_minutes = " << sessions.cleanup_interval_minutes << "\n";
  file << "cleanup_initial_delay_secs = " << sessions.cleanup_initial_delay_secs << "\n";

  const auto &pipeline = config.pipeline;
  file << "\n[pipeline]\n";
  file << "deadline_ms = " << pipeline.deadline_ms << "\n";
  file << "wait_timeout_ms = " << pipeline.wait_timeout_ms << "\n";
  file << "poll_interval_ms = " << pipeline.poll_interval_ms << "\n";
  file << "event_queue_capacity = " << pipeline.event_queue_capacity << "\n";
  file << "retention_minutes = " << pipeline.retention_minutes << "\n";

  file << "\n[content]\n";
  file << "blocked_terms = " << string_array_to_toml(config.content.blocked_terms) << "\n";

  file << "\n[speech]\n";
  file << "recognizer = " << q(config.speech.recognizer) << "\n";
  file << "synthesizer = " << q(config.speech.synthesizer) << "\n";

  const auto &eleven = config.speech.elevenlabs;
  file << "\n[speech.elevenlabs]\n";
  file << "api_key = " << q(eleven.api_key) << "\n";
  file << "base_url = " << q(eleven.base_url) << "\n";
  file << "voice_id = " << q(eleven.voice_id) << "\n";
  file << "model_id = " << q(eleven.model_id) << "\n";
  file << "output_format = " << q(eleven.output_format) << "\n";
  file << "chunk_bytes = " << eleven.chunk_bytes << "\n";
  file << "timeout_ms = " << eleven.timeout_ms << "\n";

  const auto &conversation = config.conversation;
  file << "\n[conversation]\n";
  file << "provider = " << q(conversation.provider) << "\n";
  file << "base_url = " << q(conversation.base_url) << "\n";
  file << "api_key = " << q(conversation.api_key) << "\n";
  file << "model = " << q(conversation.model) << "\n";
  file << "temperature = " << conversation.temperature << "\n";
  file << "system_prompt = " << q(conversation.system_prompt) << "\n";
  file << "max_retries = " << conversation.max_retries << "\n";
  file << "timeout_ms = " << conversation.timeout_ms << "\n";

  file << "\n[observability]\n";
  file << "backend = " << q(config.observability.backend) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  const auto &server = config.server;

  if (server.port == 0) {
    return Warnings::failure("server.port must be 1-65535");
  }
  if (server.path.empty() || server.path.front() != '/') {
    return Warnings::failure("server.path must start with '/': " + server.path);
  }
  if (server.max_frame_bytes == 0) {
    return Warnings::failure("server.max_frame_bytes must be > 0");
  }
  if (server.outbound_queue_capacity == 0) {
    return Warnings::failure("server.outbound_queue_capacity must be > 0");
  }
  if (server.max_connections == 0) {
    return Warnings::failure("server.max_connections must be > 0");
  }
  if (server.ping_period_secs == 0 || server.pong_wait_secs == 0 || server.write_wait_secs == 0) {
    return Warnings::failure("server ping/pong/write timings must be > 0");
  }
  if (server.ping_period_secs >= server.pong_wait_secs) {
    warnings.push_back("server.ping_period_secs should be shorter than server.pong_wait_secs");
  }
  if (server.tls_enabled) {
    if (server.tls_cert_file.empty() || server.tls_key_file.empty()) {
      return Warnings::failure("server TLS requires tls_cert_file and tls_key_file");
    }
    std::error_code ec;
    if (!std::filesystem::exists(server.tls_cert_file, ec)) {
      return Warnings::failure("server.tls_cert_file does not exist: " + server.tls_cert_file);
    }
    if (!std::filesystem::exists(server.tls_key_file, ec)) {
      return Warnings::failure("server.tls_key_file does not exist: " + server.tls_key_file);
    }
  }
  if (server.device_tokens.empty()) {
    warnings.push_back("server.device_tokens is empty: any device id may connect");
  }

  if (config.audio.sample_rate < 8000 || config.audio.sample_rate > 48000) {
    return Warnings::failure("audio.sample_rate must be between 8000 and 48000");
  }
  if (!is_encoding_token(config.audio.encoding)) {
    return Warnings::failure("audio.encoding is invalid: " + config.audio.encoding);
  }
  if (config.audio.language.empty()) {
    return Warnings::failure("audio.language must not be empty");
  }

  const auto &sessions = config.sessions;
  if (sessions.backend != "sqlite" && sessions.backend != "memory") {
    return Warnings::failure("Invalid sessions.backend: " + sessions.backend);
  }
  if (sessions.backend == "sqlite" && sessions.path.empty()) {
    return Warnings::failure("sessions.path is required for the sqlite backend");
  }
  if (sessions.backend == "memory") {
    warnings.push_back("sessions.backend is memory: sessions are lost on restart");
  }
  if (sessions.continuation_window_minutes == 0) {
    return Warnings::failure("sessions.continuation_window_minutes must be > 0");
  }
  if (sessions.cleanup_interval_minutes == 0) {
    return Warnings::failure("sessions.cleanup_interval_minutes must be > 0");
  }

  const auto &pipeline = config.pipeline;
  if (pipeline.deadline_ms == 0 || pipeline.wait_timeout_ms == 0 ||
      pipeline.poll_interval_ms == 0) {
    return Warnings::failure("pipeline deadline, wait timeout and poll interval must be > 0");
  }
  if (pipeline.event_queue_capacity == 0) {
    return Warnings::failure("pipeline.event_queue_capacity must be > 0");
  }
  if (pipeline.wait_timeout_ms < pipeline.deadline_ms) {
    warnings.push_back(
        "pipeline.wait_timeout_ms is shorter than pipeline.deadline_ms: replies may time out "
        "before the saga does");
  }

  const auto &speech = config.speech;
  if (speech.recognizer != "scripted") {
    return Warnings::failure("Invalid speech.recognizer: " + speech.recognizer);
  }
  if (speech.synthesizer != "tone" && speech.synthesizer != "elevenlabs") {
    return Warnings::failure("Invalid speech.synthesizer: " + speech.synthesizer);
  }
  if (speech.synthesizer == "elevenlabs") {
    if (common::trim(speech.elevenlabs.api_key).empty()) {
      return Warnings::failure(
          "speech.elevenlabs.api_key is required (config or ELEVENLABS_API_KEY)");
    }
    if (speech.elevenlabs.chunk_bytes == 0) {
      return Warnings::failure("speech.elevenlabs.chunk_bytes must be > 0");
    }
  }

  const auto &conversation = config.conversation;
  if (conversation.provider != "echo" && conversation.provider != "compatible") {
    return Warnings::failure("Invalid conversation.provider: " + conversation.provider);
  }
  if (conversation.provider == "compatible" && common::trim(conversation.api_key).empty()) {
    return Warnings::failure(
        "conversation.api_key is required for the compatible provider (config or "
        "PARLEY_LLM_API_KEY)");
  }
  if (conversation.temperature < 0.0 || conversation.temperature > 2.0) {
    return Warnings::failure("conversation.temperature must be between 0.0 and 2.0");
  }

  std::stringstream backends(config.observability.backend);
  std::string backend;
  while (std::getline(backends, backend, ',')) {
    backend = common::trim(backend);
    if (backend != "log" && backend != "none" && backend != "noop") {
      return Warnings::failure("Invalid observability.backend: " + config.observability.backend);
    }
  }

  return Warnings::success(std::move(warnings));
}

} // namespace parley::config
