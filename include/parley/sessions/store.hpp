#pragma once

#include "parley/common/result.hpp"
#include "parley/sessions/session.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace parley::sessions {

/// Persistence for sessions. Implementations guarantee at most one active,
/// unexpired session per device: `create` and `update` fail rather than break it.
class ISessionStore {
public:
  virtual ~ISessionStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::optional<Session>>
  get(const std::string &session_id) = 0;
  /// The device's active session whose `expires_at` is still in the future.
  [[nodiscard]] virtual common::Result<std::optional<Session>>
  get_active(const std::string &device_id) = 0;
  [[nodiscard]] virtual common::Status create(const Session &session) = 0;
  /// Replaces the stored copy. Turns already stored are never rewritten.
  [[nodiscard]] virtual common::Status update(const Session &session) = 0;
  [[nodiscard]] virtual common::Status add_turn(const std::string &session_id,
                                                const Turn &turn) = 0;
  /// Marks active sessions past `expires_at` as expired and returns how many changed.
  [[nodiscard]] virtual common::Result<std::size_t> expire_sessions(common::Timestamp now) = 0;
  /// Newest first.
  [[nodiscard]] virtual common::Result<std::vector<Session>>
  list_for_device(const std::string &device_id) = 0;
};

class MemorySessionStore final : public ISessionStore {
public:
  [[nodiscard]] std::string_view name() const override { return "memory"; }
  [[nodiscard]] common::Result<std::optional<Session>>
  get(const std::string &session_id) override;
  [[nodiscard]] common::Result<std::optional<Session>>
  get_active(const std::string &device_id) override;
  [[nodiscard]] common::Status create(const Session &session) override;
  [[nodiscard]] common::Status update(const Session &session) override;
  [[nodiscard]] common::Status add_turn(const std::string &session_id, const Turn &turn) override;
  [[nodiscard]] common::Result<std::size_t> expire_sessions(common::Timestamp now) override;
  [[nodiscard]] common::Result<std::vector<Session>>
  list_for_device(const std::string &device_id) override;

private:
  [[nodiscard]] bool has_other_active(const Session &session) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Session> sessions_;
};

} // namespace parley::sessions
