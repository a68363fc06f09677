#include "parley/sessions/store.hpp"

#include <algorithm>

namespace parley::sessions {

bool MemorySessionStore::has_other_active(const Session &session) const {
  for (const auto &[id, stored] : sessions_) {
    if (id != session.id() && stored.device_id() == session.device_id() && stored.is_active()) {
      return true;
    }
  }
  return false;
}

common::Result<std::optional<Session>> MemorySessionStore::get(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return common::Result<std::optional<Session>>::success(std::nullopt);
  }
  return common::Result<std::optional<Session>>::success(it->second);
}

common::Result<std::optional<Session>>
MemorySessionStore::get_active(const std::string &device_id) {
  const auto now = common::Clock::now();
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[id, session] : sessions_) {
    if (session.device_id() == device_id && session.is_active() && !session.is_expired_at(now)) {
      return common::Result<std::optional<Session>>::success(session);
    }
  }
  return common::Result<std::optional<Session>>::success(std::nullopt);
}

common::Status MemorySessionStore::create(const Session &session) {
  const auto now = common::Clock::now();
  std::lock_guard<std::mutex> lock(mutex_);
  if (sessions_.contains(session.id())) {
    return common::Status::error("session already exists: " + session.id());
  }
  // a lapsed active session would otherwise block the device until the next sweep
  for (auto &[id, stored] : sessions_) {
    if (stored.device_id() == session.device_id() && stored.is_active() &&
        stored.is_expired_at(now)) {
      stored.expire(now);
    }
  }
  if (session.is_active() && has_other_active(session)) {
    return common::Status::error("device " + session.device_id() + " already has an active session");
  }
  sessions_.emplace(session.id(), session);
  return common::Status::success();
}

common::Status MemorySessionStore::update(const Session &session) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session.id());
  if (it == sessions_.end()) {
    return common::Status::error("session not found: " + session.id());
  }
  if (session.is_active() && has_other_active(session)) {
    return common::Status::error("device " + session.device_id() + " already has an active session");
  }
  if (session.turns().size() < it->second.turns().size()) {
    return common::Status::error("update would drop stored turns of session " + session.id());
  }
  it->second = session;
  return common::Status::success();
}

common::Status MemorySessionStore::add_turn(const std::string &session_id, const Turn &turn) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return common::Status::error("session not found: " + session_id);
  }
  return it->second.append_turn(turn, common::Clock::now());
}

common::Result<std::size_t> MemorySessionStore::expire_sessions(const common::Timestamp now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t expired = 0;
  for (auto &[id, session] : sessions_) {
    if (session.is_active() && session.is_expired_at(now)) {
      session.expire(now);
      ++expired;
    }
  }
  return common::Result<std::size_t>::success(expired);
}

common::Result<std::vector<Session>>
MemorySessionStore::list_for_device(const std::string &device_id) {
  std::vector<Session> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, session] : sessions_) {
      if (session.device_id() == device_id) {
        out.push_back(session);
      }
    }
  }
  std::sort(out.begin(), out.end(), [](const Session &a, const Session &b) {
    return a.created_at() > b.created_at();
  });
  return common::Result<std::vector<Session>>::success(std::move(out));
}

} // namespace parley::sessions
