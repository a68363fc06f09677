#pragma once

#include "parley/sessions/store.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace parley::sessions {

/// SQLite-backed store. A partial unique index on active sessions enforces the
/// one-active-session-per-device rule in the database itself.
class SqliteSessionStore final : public ISessionStore {
public:
  explicit SqliteSessionStore(std::filesystem::path db_path);
  ~SqliteSessionStore() override;

  SqliteSessionStore(const SqliteSessionStore &) = delete;
  SqliteSessionStore &operator=(const SqliteSessionStore &) = delete;

  [[nodiscard]] std::string_view name() const override { return "sqlite"; }
  [[nodiscard]] bool health_check();

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
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status insert_turns(const Session &session, std::size_t from);
  [[nodiscard]] common::Status write_session(const Session &session);
  [[nodiscard]] common::Result<std::vector<Turn>> load_turns(const std::string &session_id);
  [[nodiscard]] common::Result<std::vector<Session>> query_sessions(const char *sql,
                                                                    const std::string &key,
                                                                    std::int64_t now_ms);
  [[nodiscard]] common::Result<std::optional<Session>> get_locked(const std::string &session_id);

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace parley::sessions
