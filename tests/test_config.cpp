#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "parley/common/toml.hpp"
#include "parley/config/config.hpp"

#include <algorithm>
#include <cstdlib>

namespace {

bool has_warning(const std::vector<std::string> &warnings, const std::string &needle) {
  return std::any_of(warnings.begin(), warnings.end(), [&](const std::string &warning) {
    return warning.find(needle) != std::string::npos;
  });
}

} // namespace

void register_config_tests(std::vector<parley::tests::TestCase> &tests) {
  using parley::tests::require;
  namespace cfg = parley::config;
  namespace t = parley::testing;

  tests.push_back({"config_defaults_match_documented_values", [] {
                     const cfg::Config config;
                     require(config.server.path == "/ws", "default path");
                     require(config.audio.sample_rate == 48000, "default sample rate");
                     require(config.audio.encoding == "LINEAR16", "default encoding");
                     require(config.audio.language == "id-ID", "default language");
                     require(config.sessions.continuation_window_minutes == 30,
                             "continuation window");
                     require(config.sessions.cleanup_interval_minutes == 30, "cleanup interval");
                     require(config.pipeline.deadline_ms == 30'000, "pipeline deadline");
                     require(config.pipeline.event_queue_capacity == 100, "event capacity");

                     const auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     require(has_warning(validated.value(), "device_tokens"),
                             "open server should warn");
                   }});

  tests.push_back({"config_apply_toml_overrides_sections", [] {
                     const auto doc = parley::common::parse_toml(R"(
[server]
port = 9100
path = "/toy"
device_tokens = ["toy-1=abc"]

[audio]
sample_rate = 16000
language = "en-US"

[sessions]
backend = "MEMORY"
continuation_window_minutes = 5

[pipeline]
deadline_ms = 1500

[content]
blocked_terms = ["darah", "kata kasar"]

[conversation]
provider = "compatible"
api_key = "sk-test"
temperature = 0.3
)");
                     require(doc.ok(), doc.error());
                     cfg::Config config;
                     cfg::apply_toml(config, doc.value());
                     require(config.server.port == 9100, "port");
                     require(config.server.path == "/toy", "path");
                     require(config.server.device_tokens.size() == 1, "tokens");
                     require(config.audio.sample_rate == 16000, "sample rate");
                     require(config.audio.language == "en-US", "language");
                     require(config.sessions.backend == "memory", "backend lower-cased");
                     require(config.sessions.continuation_window_minutes == 5, "window");
                     require(config.pipeline.deadline_ms == 1500, "deadline");
                     require(config.content.blocked_terms.size() == 2, "blocked terms");
                     require(config.conversation.provider == "compatible", "provider");
                     require(config.conversation.temperature == 0.3, "temperature");

                     const auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     require(has_warning(validated.value(), "pipeline.wait_timeout_ms") == false,
                             "wait timeout is longer than the deadline");
                     require(has_warning(validated.value(), "memory"), "memory backend warns");
                   }});

  tests.push_back({"config_validation_rejects_broken_values", [] {
                     auto config = t::mock_config();
                     config.server.path = "ws";
                     require(!cfg::validate_config(config).ok(), "path without slash");

                     config = t::mock_config();
                     config.audio.sample_rate = 4000;
                     require(!cfg::validate_config(config).ok(), "sample rate below range");

                     config = t::mock_config();
                     config.audio.encoding = "linear16";
                     require(!cfg::validate_config(config).ok(), "lower-case encoding");

                     config = t::mock_config();
                     config.sessions.backend = "redis";
                     require(!cfg::validate_config(config).ok(), "unknown backend");

                     config = t::mock_config();
                     config.conversation.provider = "compatible";
                     config.conversation.api_key.clear();
                     const auto missing_key = cfg::validate_config(config);
                     require(!missing_key.ok(), "compatible needs an api key");
                     require(missing_key.error().find("PARLEY_LLM_API_KEY") != std::string::npos,
                             "error should name the env var");

                     config = t::mock_config();
                     config.speech.synthesizer = "elevenlabs";
                     require(!cfg::validate_config(config).ok(), "elevenlabs needs an api key");

                     config = t::mock_config();
                     config.pipeline.event_queue_capacity = 0;
                     require(!cfg::validate_config(config).ok(), "zero event capacity");

                     config = t::mock_config();
                     config.observability.backend = "log,prometheus";
                     require(!cfg::validate_config(config).ok(), "unknown observer backend");
                   }});

  tests.push_back({"config_load_from_file_and_env_override", [] {
                     t::TempWorkspace workspace;
                     workspace.create_file("config.toml", "[server]\nport = 9200\nhost = \"::1\"\n");

                     ::setenv("PARLEY_PORT", "9300", 1);
                     const auto loaded = cfg::load_config_from(workspace.path() / "config.toml");
                     ::unsetenv("PARLEY_PORT");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().server.host == "::1", "host from file");
                     require(loaded.value().server.port == 9300, "env should override file");

                     workspace.create_file("broken.toml", "[server]\nport\n");
                     const auto broken = cfg::load_config_from(workspace.path() / "broken.toml");
                     require(!broken.ok(), "broken toml should fail");
                     require(broken.error().find("line 2") != std::string::npos,
                             "error should name the line");
                   }});

  tests.push_back({"config_path_override_and_missing_file_defaults", [] {
                     t::TempWorkspace workspace;
                     const auto override_path = workspace.path() / "custom.toml";
                     cfg::set_config_path_override(override_path);
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == override_path, "override path not used");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().server.path == "/ws", "missing file gives defaults");

                     auto config = t::mock_config();
                     config.server.device_tokens = {"toy-9=s3cret"};
                     config.content.blocked_terms = {"kasar"};
                     const auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     const auto reloaded = cfg::load_config();
                     cfg::set_config_path_override(std::nullopt);
                     require(reloaded.ok(), reloaded.error());
                     require(reloaded.value().server.device_tokens.size() == 1 &&
                                 reloaded.value().server.device_tokens[0] == "toy-9=s3cret",
                             "tokens should survive a save");
                     require(reloaded.value().content.blocked_terms.size() == 1,
                             "blocked terms should survive a save");
                     require(reloaded.value().sessions.backend == "memory", "backend saved");
                   }});
}
