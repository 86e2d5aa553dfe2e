// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_SESSION_STORE_HPP
#define TESSERA_SESSION_STORE_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "upload_session.hpp"

namespace tessera {
namespace uploader {

/**
 * Aggregate numbers about the store
 */
struct StoreInfo {
  size_t total_sessions = 0;
  uint64_t total_bytes = 0;  // Sum of file sizes of all stored sessions
};

/**
 * SQLite-based upload session store
 *
 * Passive persistence for UploadSession records: one row per upload id plus one
 * row per recorded part. Uses WAL mode so a crash never loses a committed part.
 *
 * Thread-safety: all methods are thread-safe. Each call leases its own SQLite
 * connection from a small pool, so calls for different uploads do not queue
 * behind one another in this class. Writes to the same upload are atomic
 * (a single IMMEDIATE transaction per put/remove).
 *
 * Every failure is raised as StorageError.
 */
class SessionStore {
public:
  /**
   * Open (and create if needed) the database at db_path
   *
   * @param db_path Path to SQLite database file
   * @param max_idle_connections Connections kept open between calls
   * @throws StorageError if the database cannot be opened or migrated
   */
  explicit SessionStore(const std::string& db_path, size_t max_idle_connections = 4);
  ~SessionStore();

  // Non-copyable, non-movable
  SessionStore(const SessionStore&) = delete;
  SessionStore& operator=(const SessionStore&) = delete;
  SessionStore(SessionStore&&) = delete;
  SessionStore& operator=(SessionStore&&) = delete;

  /**
   * Insert or replace a session and its complete part list
   */
  void put(const UploadSession& session);

  std::optional<UploadSession> get(const std::string& upload_id);

  /**
   * Most recently active session for a project, if any
   */
  std::optional<UploadSession> findByProjectId(const std::string& project_id);

  std::vector<UploadSession> listByStatus(UploadStatus status);

  /**
   * Delete a session and its parts
   *
   * @return true if a record was removed
   */
  bool remove(const std::string& upload_id);

  std::vector<UploadSession> listAll();

  /**
   * Delete sessions whose last_activity is older than now - max_age
   *
   * @return Number of sessions deleted
   */
  size_t reapOlderThan(std::chrono::milliseconds max_age);

  /**
   * Delete every session
   *
   * @return Number of sessions deleted
   */
  size_t clearAll();

  size_t countByStatus(UploadStatus status);

  StoreInfo info();

  const std::string& dbPath() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace uploader
}  // namespace tessera

#endif  // TESSERA_SESSION_STORE_HPP
