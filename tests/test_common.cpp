#include "test_framework.hpp"

#include "parley/common/error.hpp"
#include "parley/common/fs.hpp"
#include "parley/common/ids.hpp"
#include "parley/common/json_util.hpp"
#include "parley/common/time.hpp"
#include "parley/common/toml.hpp"

void register_common_tests(std::vector<parley::tests::TestCase> &tests) {
  using parley::tests::require;
  namespace c = parley::common;

  tests.push_back({"common_error_codes_use_wire_names", [] {
                     require(c::error_code_name(c::ErrorCode::Validation) == "validation_error",
                             "validation name");
                     require(c::error_code_name(c::ErrorCode::State) == "state_error", "state name");
                     require(c::error_code_name(c::ErrorCode::Stream) == "stream_error",
                             "stream name");
                     require(c::error_code_name(c::ErrorCode::Timeout) == "timeout_error",
                             "timeout name");
                     require(c::error_code_name(c::ErrorCode::Resource) == "resource_error",
                             "resource name");
                     require(c::error_code_name(c::ErrorCode::ContentRejected) ==
                                 "content_rejected",
                             "content name");
                     require(c::error_code_from_name("timeout_error") == c::ErrorCode::Timeout,
                             "reverse lookup");
                     require(!c::error_code_from_name("nope").has_value(), "unknown name");

                     const c::Error error{c::ErrorCode::State, "already listening"};
                     require(error.to_string() == "state_error: already listening",
                             "error to_string mismatch");
                   }});

  tests.push_back({"common_json_escape_and_lookup", [] {
                     const std::string escaped = c::json_escape("say \"hi\"\n\\");
                     require(escaped == "say \\\"hi\\\"\\n\\\\", "escape mismatch: " + escaped);

                     const std::string json =
                         R"({"type":"listening_start","sample_rate":16000,"nested":{"a":[1,2]},)"
                         R"("list":[{"x":1},{"y":"}"}],"text":"caf\u00e9"})";
                     require(c::json_is_object(json), "json should be an object");
                     require(c::json_get_string(json, "type") == "listening_start", "type");
                     require(c::json_get_number(json, "sample_rate") == "16000", "sample_rate");
                     require(c::json_get_object(json, "nested") == R"({"a":[1,2]})", "nested");
                     require(c::json_get_string(json, "text") == "caf\xC3\xA9", "unicode escape");
                     require(c::json_get_string(json, "missing").empty(), "missing field");

                     const auto objects =
                         c::json_split_top_level_objects(c::json_get_array(json, "list"));
                     require(objects.size() == 2, "expected two objects");
                     require(c::json_get_string(objects[1], "y") == "}", "brace inside string");

                     const auto flat = c::json_parse_flat(json);
                     require(flat.at("type") == "listening_start", "flat string");
                     require(flat.at("sample_rate") == "16000", "flat number");
                   }});

  tests.push_back({"common_json_is_object_rejects_partial_input", [] {
                     require(!c::json_is_object("{\"type\":\"ping\""), "unterminated object");
                     require(!c::json_is_object("[1,2]"), "array is not an object");
                     require(!c::json_is_object("{} {}"), "trailing data");
                   }});

  tests.push_back({"common_toml_sections_arrays_and_fallbacks", [] {
                     const auto parsed = c::parse_toml(R"(
# comment
[server]
host = "127.0.0.1"   # inline comment
port = 9000
tls_enabled = true
device_tokens = ["toy-a=secret#1", "toy-b=other"]

[speech.elevenlabs]
chunk_bytes = 2048

[conversation]
temperature = 0.25
)");
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.get_string("server.host") == "127.0.0.1", "host");
                     require(doc.get_u64("server.port", 0) == 9000, "port");
                     require(doc.get_bool("server.tls_enabled", false), "bool");
                     const auto tokens = doc.get_string_array("server.device_tokens");
                     require(tokens.size() == 2 && tokens[0] == "toy-a=secret#1",
                             "array with hash inside quotes");
                     require(doc.get_u64("speech.elevenlabs.chunk_bytes", 0) == 2048,
                             "dotted section");
                     require(doc.get_double("conversation.temperature", 1.0) == 0.25, "double");
                     require(doc.get_int("server.missing", 7) == 7, "fallback");
                     require(c::quote_toml_string("a\"b") == "\"a\\\"b\"", "quote");
                   }});

  tests.push_back({"common_string_helpers", [] {
                     require(c::trim("  hi \n") == "hi", "trim");
                     require(c::to_lower("AbC") == "abc", "lower");
                     require(c::to_upper("linear16") == "LINEAR16", "upper");
                     require(c::starts_with("/ws?x", "/ws"), "starts_with");
                   }});

  tests.push_back({"common_random_hex_and_constant_time_equals", [] {
                     const auto a = c::random_hex(16);
                     const auto b = c::random_hex(16);
                     require(a.ok() && b.ok(), "random_hex failed");
                     require(a.value().size() == 32, "hex length");
                     require(a.value() != b.value(), "ids should differ");
                     require(c::constant_time_equals("secret", "secret"), "equal");
                     require(!c::constant_time_equals("secret", "secreT"), "different");
                     require(!c::constant_time_equals("secret", "secrets"), "length differs");
                   }});

  tests.push_back({"common_time_conversions", [] {
                     const auto ts = c::from_epoch_ms(1'700'000'000'123);
                     require(c::to_epoch_ms(ts) == 1'700'000'000'123, "epoch ms roundtrip");
                     require(c::unix_seconds(ts) == 1'700'000'000, "unix seconds");
                     require(c::format_rfc3339(ts) == "2023-11-14T22:13:20Z", "rfc3339");
                   }});
}
