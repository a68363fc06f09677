#pragma once

#include "parley/common/result.hpp"
#include "parley/common/time.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parley::sessions {

inline constexpr std::chrono::hours kSessionTtl{24};
inline constexpr const char *kDefaultLanguage = "id-ID";

enum class SessionStatus { Active, Expired, Terminated };
enum class TurnRole { User, Assistant };

[[nodiscard]] std::string_view to_string(SessionStatus status);
[[nodiscard]] std::string_view to_string(TurnRole role);
[[nodiscard]] common::Result<SessionStatus> parse_session_status(std::string_view value);
[[nodiscard]] common::Result<TurnRole> parse_turn_role(std::string_view value);

struct Turn {
  common::Timestamp timestamp;
  TurnRole role = TurnRole::User;
  std::string content;
  std::int64_t duration_ms = 0;
  std::optional<double> confidence;
  std::optional<std::string> emotion;
};

struct SessionMetadata {
  std::string language = kDefaultLanguage;
  std::map<std::string, std::string> preferences;
};

/// A device's multi-turn conversation. Turns are append-only and every mutation
/// refreshes `last_active_at`, which keeps `expires_at == last_active_at + 24h`.
class Session {
public:
  [[nodiscard]] static common::Result<Session> start(std::string device_id, std::string language,
                                                     common::Timestamp now);
  /// Rebuilds a stored session. Turns are taken as already validated.
  [[nodiscard]] static Session restore(std::string id, std::string device_id,
                                       SessionStatus status, SessionMetadata metadata,
                                       std::vector<Turn> turns, common::Timestamp created_at,
                                       common::Timestamp last_active_at);

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] const std::string &device_id() const { return device_id_; }
  [[nodiscard]] SessionStatus status() const { return status_; }
  [[nodiscard]] bool is_active() const { return status_ == SessionStatus::Active; }
  [[nodiscard]] const std::vector<Turn> &turns() const { return turns_; }
  [[nodiscard]] const SessionMetadata &metadata() const { return metadata_; }
  [[nodiscard]] common::Timestamp created_at() const { return created_at_; }
  [[nodiscard]] common::Timestamp last_active_at() const { return last_active_at_; }
  [[nodiscard]] common::Timestamp expires_at() const { return expires_at_; }
  [[nodiscard]] bool is_expired_at(common::Timestamp now) const { return now >= expires_at_; }

  [[nodiscard]] common::Status append_turn(Turn turn, common::Timestamp now);
  void terminate(common::Timestamp now);
  void expire(common::Timestamp now);
  void set_language(std::string language, common::Timestamp now);
  void set_preference(const std::string &key, std::string value, common::Timestamp now);

private:
  Session() = default;
  void touch(common::Timestamp now);

  std::string id_;
  std::string device_id_;
  SessionStatus status_ = SessionStatus::Active;
  std::vector<Turn> turns_;
  SessionMetadata metadata_;
  common::Timestamp created_at_;
  common::Timestamp last_active_at_;
  common::Timestamp expires_at_;
};

/// Decides whether an active session is still fresh enough to continue.
struct ContinuationPolicy {
  std::chrono::minutes window{30};

  [[nodiscard]] bool can_continue(const Session &session, common::Timestamp now) const;
};

[[nodiscard]] std::string encode_preferences_json(const std::map<std::string, std::string> &prefs);
[[nodiscard]] std::map<std::string, std::string> parse_preferences_json(const std::string &json);

} // namespace parley::sessions
