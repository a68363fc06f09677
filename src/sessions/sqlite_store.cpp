#include "parley/sessions/sqlite_store.hpp"

#include <iostream>

namespace parley::sessions {

namespace {

constexpr const char *kSessionColumns =
    "id, device_id, status, language, preferences, created_at, last_active_at";

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : reinterpret_cast<const char *>(text);
}

void bind_text(sqlite3_stmt *stmt, const int index, const std::string &value) {
  sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

// Rolls back on destruction unless commit() succeeded.
class Transaction {
public:
  explicit Transaction(sqlite3 *db) : db_(db) {
    begun_ = exec_sql(db_, "BEGIN IMMEDIATE;");
  }
  ~Transaction() {
    if (begun_.ok() && !committed_) {
      (void)exec_sql(db_, "ROLLBACK;");
    }
  }
  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  [[nodiscard]] const common::Status &begun() const { return begun_; }
  [[nodiscard]] common::Status commit() {
    auto status = exec_sql(db_, "COMMIT;");
    committed_ = status.ok();
    return status;
  }

private:
  sqlite3 *db_;
  common::Status begun_ = common::Status::success();
  bool committed_ = false;
};

} // namespace

SqliteSessionStore::SqliteSessionStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (!db_path_.parent_path().empty()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    std::cerr << "[sessions] failed to open " << db_path_.string() << ": "
              << (db_ != nullptr ? sqlite3_errmsg(db_) : "out of memory") << "\n";
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  sqlite3_busy_timeout(db_, 5000);

  if (auto status = init_schema(); !status.ok()) {
    std::cerr << "[sessions] schema init failed: " << status.error() << "\n";
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteSessionStore::~SqliteSessionStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

bool SqliteSessionStore::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  return db_ != nullptr && exec_sql(db_, "SELECT 1;").ok();
}

common::Status SqliteSessionStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }
  status = exec_sql(db_, "PRAGMA foreign_keys=ON;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS sessions (
  id TEXT PRIMARY KEY,
  device_id TEXT NOT NULL,
  status TEXT NOT NULL,
  language TEXT NOT NULL,
  preferences TEXT NOT NULL DEFAULT '{}',
  created_at INTEGER NOT NULL,
  last_active_at INTEGER NOT NULL,
  expires_at INTEGER NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE UNIQUE INDEX IF NOT EXISTS sessions_one_active
  ON sessions(device_id) WHERE status = 'active';
CREATE INDEX IF NOT EXISTS sessions_by_expiry ON sessions(status, expires_at);
)");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS turns (
  session_id TEXT NOT NULL REFERENCES sessions(id) ON DELETE CASCADE,
  seq INTEGER NOT NULL,
  timestamp INTEGER NOT NULL,
  role TEXT NOT NULL,
  content TEXT NOT NULL,
  duration_ms INTEGER NOT NULL DEFAULT 0,
  confidence REAL,
  emotion TEXT,
  PRIMARY KEY (session_id, seq)
);
)");
}

common::Result<std::vector<Turn>> SqliteSessionStore::load_turns(const std::string &session_id) {
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT timestamp, role, content, duration_ms, confidence, emotion FROM turns "
                    "WHERE session_id = ?1 ORDER BY seq ASC";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<Turn>>::failure(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, session_id);

  std::vector<Turn> turns;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    Turn turn;
    turn.timestamp = common::from_epoch_ms(sqlite3_column_int64(stmt, 0));
    auto role = parse_turn_role(column_text(stmt, 1));
    if (!role.ok()) {
      sqlite3_finalize(stmt);
      return common::Result<std::vector<Turn>>::failure(role.error());
    }
    turn.role = role.value();
    turn.content = column_text(stmt, 2);
    turn.duration_ms = sqlite3_column_int64(stmt, 3);
    if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
      turn.confidence = sqlite3_column_double(stmt, 4);
    }
    if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
      turn.emotion = column_text(stmt, 5);
    }
    turns.push_back(std::move(turn));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<Turn>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<Turn>>::success(std::move(turns));
}

common::Result<std::vector<Session>>
SqliteSessionStore::query_sessions(const char *sql, const std::string &key,
                                   const std::int64_t now_ms) {
  using SessionList = common::Result<std::vector<Session>>;
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return SessionList::failure(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, key);
  if (sqlite3_bind_parameter_count(stmt) >= 2) {
    sqlite3_bind_int64(stmt, 2, now_ms);
  }

  struct Row {
    std::string id;
    std::string device_id;
    std::string status;
    SessionMetadata metadata;
    std::int64_t created_at = 0;
    std::int64_t last_active_at = 0;
  };
  std::vector<Row> rows;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    Row row;
    row.id = column_text(stmt, 0);
    row.device_id = column_text(stmt, 1);
    row.status = column_text(stmt, 2);
    row.metadata.language = column_text(stmt, 3);
    row.metadata.preferences = parse_preferences_json(column_text(stmt, 4));
    row.created_at = sqlite3_column_int64(stmt, 5);
    row.last_active_at = sqlite3_column_int64(stmt, 6);
    rows.push_back(std::move(row));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return SessionList::failure(sqlite3_errmsg(db_));
  }

  std::vector<Session> sessions;
  sessions.reserve(rows.size());
  for (auto &row : rows) {
    auto status = parse_session_status(row.status);
    if (!status.ok()) {
      return SessionList::failure(status.error());
    }
    auto turns = load_turns(row.id);
    if (!turns.ok()) {
      return SessionList::failure(turns.error());
    }
    sessions.push_back(Session::restore(std::move(row.id), std::move(row.device_id),
                                        status.value(), std::move(row.metadata),
                                        std::move(turns.value()),
                                        common::from_epoch_ms(row.created_at),
                                        common::from_epoch_ms(row.last_active_at)));
  }
  return SessionList::success(std::move(sessions));
}

common::Result<std::optional<Session>>
SqliteSessionStore::get_locked(const std::string &session_id) {
  const std::string sql = std::string("SELECT ") + kSessionColumns + " FROM sessions WHERE id = ?1";
  auto found = query_sessions(sql.c_str(), session_id, 0);
  if (!found.ok()) {
    return common::Result<std::optional<Session>>::failure(found.error());
  }
  if (found.value().empty()) {
    return common::Result<std::optional<Session>>::success(std::nullopt);
  }
  return common::Result<std::optional<Session>>::success(std::move(found.value().front()));
}

common::Result<std::optional<Session>> SqliteSessionStore::get(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::optional<Session>>::failure("database is not initialized");
  }
  return get_locked(session_id);
}

common::Result<std::optional<Session>>
SqliteSessionStore::get_active(const std::string &device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::optional<Session>>::failure("database is not initialized");
  }
  const std::string sql = std::string("SELECT ") + kSessionColumns +
                          " FROM sessions WHERE device_id = ?1 AND status = 'active' AND "
                          "expires_at > ?2 LIMIT 1";
  auto found = query_sessions(sql.c_str(), device_id, common::to_epoch_ms(common::Clock::now()));
  if (!found.ok()) {
    return common::Result<std::optional<Session>>::failure(found.error());
  }
  if (found.value().empty()) {
    return common::Result<std::optional<Session>>::success(std::nullopt);
  }
  return common::Result<std::optional<Session>>::success(std::move(found.value().front()));
}

common::Status SqliteSessionStore::insert_turns(const Session &session, const std::size_t from) {
  const auto &turns = session.turns();
  if (from >= turns.size()) {
    return common::Status::success();
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT OR IGNORE INTO turns(session_id, seq, timestamp, role, content, "
                    "duration_ms, confidence, emotion) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  for (std::size_t seq = from; seq < turns.size(); ++seq) {
    const auto &turn = turns[seq];
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    bind_text(stmt, 1, session.id());
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(seq));
    sqlite3_bind_int64(stmt, 3, common::to_epoch_ms(turn.timestamp));
    bind_text(stmt, 4, std::string(to_string(turn.role)));
    bind_text(stmt, 5, turn.content);
    sqlite3_bind_int64(stmt, 6, turn.duration_ms);
    if (turn.confidence.has_value()) {
      sqlite3_bind_double(stmt, 7, *turn.confidence);
    } else {
      sqlite3_bind_null(stmt, 7);
    }
    if (turn.emotion.has_value()) {
      bind_text(stmt, 8, *turn.emotion);
    } else {
      sqlite3_bind_null(stmt, 8);
    }
    if (sqlite3_step(stmt) != SQLITE_DONE) {
      const std::string error = sqlite3_errmsg(db_);
      sqlite3_finalize(stmt);
      return common::Status::error(error);
    }
  }
  sqlite3_finalize(stmt);
  return common::Status::success();
}

common::Status SqliteSessionStore::write_session(const Session &session) {
  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "INSERT INTO sessions(id, device_id, status, language, preferences, created_at, "
      "last_active_at, expires_at) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8) "
      "ON CONFLICT(id) DO UPDATE SET status = excluded.status, language = excluded.language, "
      "preferences = excluded.preferences, last_active_at = excluded.last_active_at, "
      "expires_at = excluded.expires_at";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  bind_text(stmt, 1, session.id());
  bind_text(stmt, 2, session.device_id());
  bind_text(stmt, 3, std::string(to_string(session.status())));
  bind_text(stmt, 4, session.metadata().language);
  bind_text(stmt, 5, encode_preferences_json(session.metadata().preferences));
  sqlite3_bind_int64(stmt, 6, common::to_epoch_ms(session.created_at()));
  sqlite3_bind_int64(stmt, 7, common::to_epoch_ms(session.last_active_at()));
  sqlite3_bind_int64(stmt, 8, common::to_epoch_ms(session.expires_at()));

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc == SQLITE_CONSTRAINT) {
    return common::Status::error("device " + session.device_id() +
                                 " already has an active session");
  }
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Status SqliteSessionStore::create(const Session &session) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }
  Transaction tx(db_);
  if (!tx.begun().ok()) {
    return tx.begun();
  }

  auto existing = get_locked(session.id());
  if (!existing.ok()) {
    return common::Status::error(existing.error());
  }
  if (existing.value().has_value()) {
    return common::Status::error("session already exists: " + session.id());
  }

  // a lapsed active session would otherwise block the device until the next sweep
  sqlite3_stmt *stmt = nullptr;
  const char *expire_sql =
      "UPDATE sessions SET status = 'expired', last_active_at = ?2, expires_at = ?3 "
      "WHERE device_id = ?1 AND status = 'active' AND expires_at <= ?2";
  if (sqlite3_prepare_v2(db_, expire_sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  const auto now = common::Clock::now();
  bind_text(stmt, 1, session.device_id());
  sqlite3_bind_int64(stmt, 2, common::to_epoch_ms(now));
  sqlite3_bind_int64(stmt, 3, common::to_epoch_ms(now + kSessionTtl));
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  if (auto status = write_session(session); !status.ok()) {
    return status;
  }
  if (auto status = insert_turns(session, 0); !status.ok()) {
    return status;
  }
  return tx.commit();
}

common::Status SqliteSessionStore::update(const Session &session) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }
  Transaction tx(db_);
  if (!tx.begun().ok()) {
    return tx.begun();
  }

  auto existing = get_locked(session.id());
  if (!existing.ok()) {
    return common::Status::error(existing.error());
  }
  if (!existing.value().has_value()) {
    return common::Status::error("session not found: " + session.id());
  }
  const std::size_t stored_turns = existing.value()->turns().size();
  if (session.turns().size() < stored_turns) {
    return common::Status::error("update would drop stored turns of session " + session.id());
  }

  if (auto status = write_session(session); !status.ok()) {
    return status;
  }
  if (auto status = insert_turns(session, stored_turns); !status.ok()) {
    return status;
  }
  return tx.commit();
}

common::Status SqliteSessionStore::add_turn(const std::string &session_id, const Turn &turn) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }
  Transaction tx(db_);
  if (!tx.begun().ok()) {
    return tx.begun();
  }

  auto existing = get_locked(session_id);
  if (!existing.ok()) {
    return common::Status::error(existing.error());
  }
  if (!existing.value().has_value()) {
    return common::Status::error("session not found: " + session_id);
  }
  Session session = std::move(*existing.value());
  const std::size_t stored_turns = session.turns().size();
  if (auto status = session.append_turn(turn, common::Clock::now()); !status.ok()) {
    return status;
  }
  if (auto status = write_session(session); !status.ok()) {
    return status;
  }
  if (auto status = insert_turns(session, stored_turns); !status.ok()) {
    return status;
  }
  return tx.commit();
}

common::Result<std::size_t> SqliteSessionStore::expire_sessions(const common::Timestamp now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure("database is not initialized");
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "UPDATE sessions SET status = 'expired', last_active_at = ?1, expires_at = ?2 "
                    "WHERE status = 'active' AND expires_at <= ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, common::to_epoch_ms(now));
  sqlite3_bind_int64(stmt, 2, common::to_epoch_ms(now + kSessionTtl));
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::size_t>::success(static_cast<std::size_t>(sqlite3_changes(db_)));
}

common::Result<std::vector<Session>>
SqliteSessionStore::list_for_device(const std::string &device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<Session>>::failure("database is not initialized");
  }
  const std::string sql = std::string("SELECT ") + kSessionColumns +
                          " FROM sessions WHERE device_id = ?1 ORDER BY created_at DESC";
  return query_sessions(sql.c_str(), device_id, 0);
}

} // namespace parley::sessions
