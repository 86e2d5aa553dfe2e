// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "session_store.hpp"

#include <sqlite3.h>

#include <mutex>

#include "upload_errors.hpp"

#define TESSERA_LOG_COMPONENT "session_store"
#include <tessera_log_macros.hpp>

namespace tessera {
namespace uploader {

using logging::kv;

namespace {

int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochMillis(int64_t ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

std::string columnText(sqlite3_stmt* stmt, int col) {
  const unsigned char* text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char*>(text) : "";
}

/**
 * Prepared statement that finalizes itself
 */
class Statement {
public:
  Statement(sqlite3* db, const char* sql)
      : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw StorageError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
    }
  }

  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void bind(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT));
  }

  void bind(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)));
  }

  /**
   * @return true when a row is available, false when done
   */
  bool step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    throw StorageError(std::string("SQLite step failed: ") + sqlite3_errmsg(db_));
  }

  sqlite3_stmt* get() const { return stmt_; }

private:
  void check(int rc) {
    if (rc != SQLITE_OK) {
      throw StorageError(std::string("SQLite bind failed: ") + sqlite3_errmsg(db_));
    }
  }

  sqlite3* db_;
  sqlite3_stmt* stmt_ = nullptr;
};

void execOrThrow(sqlite3* db, const char* sql, const char* what) {
  char* err_msg = nullptr;
  int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    throw StorageError(std::string(what) + ": " + error);
  }
}

/**
 * Transaction rolled back unless committed
 *
 * Writers take the lock up front (IMMEDIATE). Readers use a deferred
 * transaction, which pins one WAL snapshot for all of their statements.
 */
class Transaction {
public:
  enum class Mode { READ, WRITE };

  explicit Transaction(sqlite3* db, Mode mode = Mode::WRITE)
      : db_(db) {
    execOrThrow(
      db_, mode == Mode::WRITE ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;",
      "Failed to begin transaction"
    );
  }

  ~Transaction() {
    if (!committed_) {
      char* err_msg = nullptr;
      if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err_msg) != SQLITE_OK) {
        TESSERA_LOG_ERROR("Rollback failed" << kv("error", err_msg ? err_msg : "unknown"));
      }
      sqlite3_free(err_msg);
    }
  }

  void commit() {
    execOrThrow(db_, "COMMIT;", "Failed to commit transaction");
    committed_ = true;
  }

private:
  sqlite3* db_;
  bool committed_ = false;
};

constexpr const char* kSelectSession = R"(
  SELECT upload_id, project_id, destination_key, file_name, file_size, mime_type, chunk_size,
         next_part_number, status, progress, last_error, started_at, last_activity
  FROM upload_sessions
)";

}  // namespace

class SessionStore::Impl {
public:
  std::string db_path;
  size_t max_idle_connections = 4;
  std::mutex pool_mutex;
  std::vector<sqlite3*> idle;

  ~Impl() {
    for (auto* db : idle) {
      sqlite3_close(db);
    }
  }

  sqlite3* openConnection() {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(
      db_path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
      nullptr
    );
    if (rc != SQLITE_OK) {
      std::string error = db ? sqlite3_errmsg(db) : "out of memory";
      sqlite3_close(db);
      throw StorageError("Cannot open SQLite database: " + db_path + " (" + error + ")");
    }

    try {
      execOrThrow(db, "PRAGMA busy_timeout=5000;", "Failed to set busy timeout");
      execOrThrow(db, "PRAGMA foreign_keys=ON;", "Failed to enable foreign keys");
      execOrThrow(db, "PRAGMA synchronous=NORMAL;", "Failed to set synchronous mode");
    } catch (const StorageError&) {
      sqlite3_close(db);
      throw;
    }
    return db;
  }

  /**
   * Connection borrowed from the pool for the duration of one call
   */
  class Lease {
  public:
    explicit Lease(Impl& impl)
        : impl_(impl)
        , db_(impl.acquire()) {}

    ~Lease() { impl_.release(db_); }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    sqlite3* get() const { return db_; }

  private:
    Impl& impl_;
    sqlite3* db_;
  };

  sqlite3* acquire() {
    {
      std::lock_guard<std::mutex> lock(pool_mutex);
      if (!idle.empty()) {
        sqlite3* db = idle.back();
        idle.pop_back();
        return db;
      }
    }
    return openConnection();
  }

  void release(sqlite3* db) {
    {
      std::lock_guard<std::mutex> lock(pool_mutex);
      if (idle.size() < max_idle_connections) {
        idle.push_back(db);
        return;
      }
    }
    sqlite3_close(db);
  }

  void initDatabase() {
    sqlite3* db = openConnection();
    try {
      // WAL is persistent in the database file, one connection is enough
      execOrThrow(db, "PRAGMA journal_mode=WAL;", "Failed to enable WAL mode");

      const char* create_sql = R"(
        CREATE TABLE IF NOT EXISTS upload_sessions (
          upload_id TEXT PRIMARY KEY,
          project_id TEXT NOT NULL,
          destination_key TEXT NOT NULL DEFAULT '',
          file_name TEXT NOT NULL,
          file_size INTEGER NOT NULL,
          mime_type TEXT,
          chunk_size INTEGER NOT NULL,
          next_part_number INTEGER NOT NULL DEFAULT 1,
          status TEXT NOT NULL CHECK(status IN
            ('uploading', 'paused', 'completed', 'failed', 'cancelled')),
          progress INTEGER NOT NULL DEFAULT 0,
          last_error TEXT,
          started_at INTEGER NOT NULL,
          last_activity INTEGER NOT NULL
        );
        CREATE TABLE IF NOT EXISTS upload_parts (
          upload_id TEXT NOT NULL REFERENCES upload_sessions(upload_id) ON DELETE CASCADE,
          part_number INTEGER NOT NULL CHECK(part_number > 0),
          etag TEXT NOT NULL,
          size INTEGER NOT NULL,
          PRIMARY KEY (upload_id, part_number)
        );
        CREATE INDEX IF NOT EXISTS idx_sessions_project ON upload_sessions(project_id);
        CREATE INDEX IF NOT EXISTS idx_sessions_status ON upload_sessions(status);
        CREATE INDEX IF NOT EXISTS idx_sessions_activity ON upload_sessions(last_activity);
      )";
      execOrThrow(db, create_sql, "Failed to create tables");
    } catch (const StorageError&) {
      sqlite3_close(db);
      throw;
    }
    release(db);
  }

  // Columns in kSelectSession order
  static UploadSession parseSession(sqlite3_stmt* stmt) {
    UploadSession session;
    session.upload_id = columnText(stmt, 0);
    session.project_id = columnText(stmt, 1);
    session.destination_key = columnText(stmt, 2);
    session.file_name = columnText(stmt, 3);
    session.file_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
    session.mime_type = columnText(stmt, 5);
    session.chunk_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
    session.next_part_number = sqlite3_column_int(stmt, 7);
    auto status = uploadStatusFromString(columnText(stmt, 8));
    if (!status) {
      throw StorageError("Corrupt status for upload " + session.upload_id);
    }
    session.status = *status;
    session.progress = sqlite3_column_int(stmt, 9);
    session.last_error = columnText(stmt, 10);
    session.started_at = fromEpochMillis(sqlite3_column_int64(stmt, 11));
    session.last_activity = fromEpochMillis(sqlite3_column_int64(stmt, 12));
    return session;
  }

  static void loadParts(sqlite3* db, UploadSession& session) {
    Statement stmt(
      db,
      "SELECT part_number, etag, size FROM upload_parts WHERE upload_id = ? ORDER BY part_number"
    );
    stmt.bind(1, session.upload_id);
    while (stmt.step()) {
      UploadedChunk chunk;
      chunk.part_number = sqlite3_column_int(stmt.get(), 0);
      chunk.etag = columnText(stmt.get(), 1);
      chunk.size = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 2));
      session.parts.push_back(std::move(chunk));
    }
  }

  // Runs a session SELECT and loads parts of every row from the same snapshot
  static std::vector<UploadSession> querySessions(
    sqlite3* db, const std::string& sql, const std::vector<std::string>& params
  ) {
    Transaction txn(db, Transaction::Mode::READ);
    std::vector<UploadSession> sessions;
    {
      Statement stmt(db, sql.c_str());
      for (size_t i = 0; i < params.size(); ++i) {
        stmt.bind(static_cast<int>(i + 1), params[i]);
      }
      while (stmt.step()) {
        sessions.push_back(parseSession(stmt.get()));
      }
    }
    for (auto& session : sessions) {
      loadParts(db, session);
    }
    txn.commit();
    return sessions;
  }
};

SessionStore::SessionStore(const std::string& db_path, size_t max_idle_connections)
    : impl_(std::make_unique<Impl>()) {
  impl_->db_path = db_path;
  impl_->max_idle_connections = std::max<size_t>(1, max_idle_connections);
  impl_->initDatabase();
  TESSERA_LOG_DEBUG("Session store opened" << kv("path", db_path));
}

SessionStore::~SessionStore() = default;

void SessionStore::put(const UploadSession& session) {
  if (session.upload_id.empty()) {
    throw StorageError("Cannot store a session without upload_id");
  }

  Impl::Lease lease(*impl_);
  sqlite3* db = lease.get();
  Transaction txn(db);

  {
    Statement stmt(db, R"(
      INSERT INTO upload_sessions
        (upload_id, project_id, destination_key, file_name, file_size, mime_type, chunk_size,
         next_part_number, status, progress, last_error, started_at, last_activity)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
      ON CONFLICT(upload_id) DO UPDATE SET
        project_id = excluded.project_id,
        destination_key = excluded.destination_key,
        file_name = excluded.file_name,
        file_size = excluded.file_size,
        mime_type = excluded.mime_type,
        chunk_size = excluded.chunk_size,
        next_part_number = excluded.next_part_number,
        status = excluded.status,
        progress = excluded.progress,
        last_error = excluded.last_error,
        started_at = excluded.started_at,
        last_activity = excluded.last_activity
    )");
    stmt.bind(1, session.upload_id);
    stmt.bind(2, session.project_id);
    stmt.bind(3, session.destination_key);
    stmt.bind(4, session.file_name);
    stmt.bind(5, static_cast<int64_t>(session.file_size));
    stmt.bind(6, session.mime_type);
    stmt.bind(7, static_cast<int64_t>(session.chunk_size));
    stmt.bind(8, static_cast<int64_t>(session.next_part_number));
    stmt.bind(9, uploadStatusToString(session.status));
    stmt.bind(10, static_cast<int64_t>(session.progress));
    stmt.bind(11, session.last_error);
    stmt.bind(12, toEpochMillis(session.started_at));
    stmt.bind(13, toEpochMillis(session.last_activity));
    stmt.step();
  }

  {
    Statement stmt(db, "DELETE FROM upload_parts WHERE upload_id = ?");
    stmt.bind(1, session.upload_id);
    stmt.step();
  }

  for (const auto& part : normalizeParts(session.parts)) {
    Statement stmt(
      db, "INSERT INTO upload_parts (upload_id, part_number, etag, size) VALUES (?, ?, ?, ?)"
    );
    stmt.bind(1, session.upload_id);
    stmt.bind(2, static_cast<int64_t>(part.part_number));
    stmt.bind(3, part.etag);
    stmt.bind(4, static_cast<int64_t>(part.size));
    stmt.step();
  }

  txn.commit();
}

std::optional<UploadSession> SessionStore::get(const std::string& upload_id) {
  Impl::Lease lease(*impl_);
  auto sessions = Impl::querySessions(
    lease.get(), std::string(kSelectSession) + " WHERE upload_id = ?", {upload_id}
  );
  if (sessions.empty()) {
    return std::nullopt;
  }
  return std::move(sessions.front());
}

std::optional<UploadSession> SessionStore::findByProjectId(const std::string& project_id) {
  Impl::Lease lease(*impl_);
  auto sessions = Impl::querySessions(
    lease.get(),
    std::string(kSelectSession) +
      " WHERE project_id = ? ORDER BY last_activity DESC, upload_id DESC LIMIT 1",
    {project_id}
  );
  if (sessions.empty()) {
    return std::nullopt;
  }
  return std::move(sessions.front());
}

std::vector<UploadSession> SessionStore::listByStatus(UploadStatus status) {
  Impl::Lease lease(*impl_);
  return Impl::querySessions(
    lease.get(), std::string(kSelectSession) + " WHERE status = ? ORDER BY started_at",
    {uploadStatusToString(status)}
  );
}

bool SessionStore::remove(const std::string& upload_id) {
  Impl::Lease lease(*impl_);
  sqlite3* db = lease.get();

  Statement stmt(db, "DELETE FROM upload_sessions WHERE upload_id = ?");
  stmt.bind(1, upload_id);
  stmt.step();
  return sqlite3_changes(db) > 0;
}

std::vector<UploadSession> SessionStore::listAll() {
  Impl::Lease lease(*impl_);
  return Impl::querySessions(lease.get(), std::string(kSelectSession) + " ORDER BY started_at", {});
}

size_t SessionStore::reapOlderThan(std::chrono::milliseconds max_age) {
  auto cutoff = toEpochMillis(std::chrono::system_clock::now() - max_age);

  Impl::Lease lease(*impl_);
  sqlite3* db = lease.get();

  Statement stmt(db, "DELETE FROM upload_sessions WHERE last_activity < ?");
  stmt.bind(1, cutoff);
  stmt.step();
  return static_cast<size_t>(sqlite3_changes(db));
}

size_t SessionStore::clearAll() {
  Impl::Lease lease(*impl_);
  sqlite3* db = lease.get();

  Statement stmt(db, "DELETE FROM upload_sessions");
  stmt.step();
  return static_cast<size_t>(sqlite3_changes(db));
}

size_t SessionStore::countByStatus(UploadStatus status) {
  Impl::Lease lease(*impl_);

  Statement stmt(lease.get(), "SELECT COUNT(*) FROM upload_sessions WHERE status = ?");
  stmt.bind(1, uploadStatusToString(status));
  if (!stmt.step()) {
    return 0;
  }
  return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

StoreInfo SessionStore::info() {
  Impl::Lease lease(*impl_);

  Statement stmt(lease.get(), "SELECT COUNT(*), COALESCE(SUM(file_size), 0) FROM upload_sessions");
  StoreInfo result;
  if (stmt.step()) {
    result.total_sessions = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
    result.total_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 1));
  }
  return result;
}

const std::string& SessionStore::dbPath() const {
  return impl_->db_path;
}

}  // namespace uploader
}  // namespace tessera
