#include "parley/sessions/session.hpp"

#include "parley/common/ids.hpp"
#include "parley/common/json_util.hpp"

#include <sstream>

namespace parley::sessions {

std::string_view to_string(const SessionStatus status) {
  switch (status) {
  case SessionStatus::Active:
    return "active";
  case SessionStatus::Expired:
    return "expired";
  case SessionStatus::Terminated:
    return "terminated";
  }
  return "active";
}

std::string_view to_string(const TurnRole role) {
  return role == TurnRole::User ? "user" : "assistant";
}

common::Result<SessionStatus> parse_session_status(const std::string_view value) {
  if (value == "active") {
    return common::Result<SessionStatus>::success(SessionStatus::Active);
  }
  if (value == "expired") {
    return common::Result<SessionStatus>::success(SessionStatus::Expired);
  }
  if (value == "terminated") {
    return common::Result<SessionStatus>::success(SessionStatus::Terminated);
  }
  return common::Result<SessionStatus>::failure("unknown session status: " + std::string(value));
}

common::Result<TurnRole> parse_turn_role(const std::string_view value) {
  if (value == "user") {
    return common::Result<TurnRole>::success(TurnRole::User);
  }
  if (value == "assistant") {
    return common::Result<TurnRole>::success(TurnRole::Assistant);
  }
  return common::Result<TurnRole>::failure("unknown turn role: " + std::string(value));
}

common::Result<Session> Session::start(std::string device_id, std::string language,
                                       const common::Timestamp now) {
  if (device_id.empty()) {
    return common::Result<Session>::failure("device id is required");
  }
  auto id = common::random_hex(12);
  if (!id.ok()) {
    return common::Result<Session>::failure("session id generation failed: " + id.error());
  }

  Session session;
  session.id_ = std::move(id.value());
  session.device_id_ = std::move(device_id);
  session.metadata_.language = language.empty() ? kDefaultLanguage : std::move(language);
  session.created_at_ = now;
  session.touch(now);
  return common::Result<Session>::success(std::move(session));
}

Session Session::restore(std::string id, std::string device_id, const SessionStatus status,
                         SessionMetadata metadata, std::vector<Turn> turns,
                         const common::Timestamp created_at,
                         const common::Timestamp last_active_at) {
  Session session;
  session.id_ = std::move(id);
  session.device_id_ = std::move(device_id);
  session.status_ = status;
  session.metadata_ = std::move(metadata);
  session.turns_ = std::move(turns);
  session.created_at_ = created_at;
  session.touch(last_active_at);
  return session;
}

common::Status Session::append_turn(Turn turn, const common::Timestamp now) {
  if (status_ != SessionStatus::Active) {
    return common::Status::error("session " + id_ + " is " + std::string(to_string(status_)));
  }
  if (!turns_.empty() && turn.timestamp < turns_.back().timestamp) {
    return common::Status::error("turn is older than the last turn of session " + id_);
  }
  turns_.push_back(std::move(turn));
  touch(now);
  return common::Status::success();
}

void Session::terminate(const common::Timestamp now) {
  status_ = SessionStatus::Terminated;
  touch(now);
}

void Session::expire(const common::Timestamp now) {
  status_ = SessionStatus::Expired;
  touch(now);
}

void Session::set_language(std::string language, const common::Timestamp now) {
  metadata_.language = std::move(language);
  touch(now);
}

void Session::set_preference(const std::string &key, std::string value,
                             const common::Timestamp now) {
  metadata_.preferences[key] = std::move(value);
  touch(now);
}

void Session::touch(const common::Timestamp now) {
  last_active_at_ = now;
  expires_at_ = now + kSessionTtl;
}

bool ContinuationPolicy::can_continue(const Session &session, const common::Timestamp now) const {
  if (!session.is_active() || session.is_expired_at(now)) {
    return false;
  }
  return now - session.last_active_at() <= window;
}

std::string encode_preferences_json(const std::map<std::string, std::string> &prefs) {
  std::ostringstream out;
  out << '{';
  bool first = true;
  for (const auto &[key, value] : prefs) {
    if (!first) {
      out << ',';
    }
    first = false;
    out << '"' << common::json_escape(key) << "\":\"" << common::json_escape(value) << '"';
  }
  out << '}';
  return out.str();
}

std::map<std::string, std::string> parse_preferences_json(const std::string &json) {
  const auto flat = common::json_parse_flat(json);
  return std::map<std::string, std::string>(flat.begin(), flat.end());
}

} // namespace parley::sessions
