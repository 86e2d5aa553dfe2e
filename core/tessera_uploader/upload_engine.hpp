// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_UPLOAD_ENGINE_HPP
#define TESSERA_UPLOAD_ENGINE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "cancellation_token.hpp"
#include "chunk_scheduler.hpp"
#include "event_channel.hpp"
#include "session_store.hpp"
#include "transfer_client.hpp"
#include "upload_errors.hpp"
#include "upload_session.hpp"
#include "uploader_interfaces.hpp"

namespace tessera {
namespace uploader {

/**
 * A local file offered for upload
 */
struct FileSource {
  std::string path;       // Local path read by the scheduler
  std::string name;       // Display name sent to the backend
  uint64_t size = 0;      // 0 means "take the size from disk"
  std::string mime_type;
};

struct StartRequest {
  FileSource file;
  std::string project_id;
  std::string destination_key;
  std::optional<TransferInitiation> existing_transfer;  // Skips initiation when set
};

struct ResumeWithFileRequest {
  FileSource file;
  std::string project_id;
  std::string destination_key;
  std::string upload_id;
};

/**
 * Outcome of an engine command. Commands never throw.
 */
struct CommandResult {
  bool success = false;
  std::string upload_id;
  std::string message;
  ErrorCode code = ErrorCode::NONE;

  static CommandResult Success(const std::string& upload_id, const std::string& message) {
    return CommandResult{true, upload_id, message, ErrorCode::NONE};
  }

  static CommandResult Failure(
    ErrorCode code, const std::string& message, const std::string& upload_id = ""
  ) {
    return CommandResult{false, upload_id, message, code};
  }

  std::string codeString() const { return errorCodeToString(code); }
};

struct UploadEngineConfig {
  SchedulerConfig scheduler;
  uint64_t default_chunk_size = 8ULL * 1024 * 1024;
  std::chrono::milliseconds cleanup_interval{std::chrono::minutes(5)};
  std::chrono::milliseconds max_session_age{std::chrono::hours(24)};
  double interrupted_completion_threshold = 0.95;  // Fraction of bytes recorded
};

/**
 * Resumable multipart upload engine
 *
 * Owns the lifecycle of every upload session: start, pause, resume from memory,
 * resume after a restart (with or without the original file), cancel. Each
 * running upload has exactly one background driver thread, which runs the
 * ChunkScheduler and finalizes the transfer once every part is recorded.
 *
 * Every recorded part is persisted before the next progress event, so a crash
 * loses at most the parts that were in flight.
 *
 * Thread-safety: all public methods are thread-safe. Events are delivered on the
 * EventChannel dispatcher thread; handlers may call back into the engine.
 *
 * Lock order: uploads_mutex_ before ActiveUpload::mutex.
 */
class UploadEngine {
public:
  /**
   * @param fs Filesystem seam, FileSystemImpl when null
   * @param files File stream seam, FileStreamFactoryImpl when null
   */
  UploadEngine(
    const UploadEngineConfig& config, std::shared_ptr<TransferClient> client,
    std::shared_ptr<SessionStore> store, std::shared_ptr<EventChannel> events,
    std::shared_ptr<IFileSystem> fs = nullptr, std::shared_ptr<IFileStreamFactory> files = nullptr
  );

  /**
   * Destructor - calls shutdown()
   */
  ~UploadEngine();

  // Non-copyable, non-movable
  UploadEngine(const UploadEngine&) = delete;
  UploadEngine& operator=(const UploadEngine&) = delete;
  UploadEngine(UploadEngine&&) = delete;
  UploadEngine& operator=(UploadEngine&&) = delete;

  /**
   * Reap stale records and start the periodic sweeper
   */
  void start();

  /**
   * Stop the sweeper, interrupt every running transfer and wait for background work
   *
   * Persisted status is left untouched, so interrupted uploads can be resumed
   * after a restart. Commands issued afterwards are rejected.
   */
  void shutdown();

  bool isShutDown() const { return shutting_down_.load(); }

  // ---------------------------------------------------------------------------
  // Commands
  // ---------------------------------------------------------------------------

  /**
   * Initiate (unless existing_transfer is supplied) and launch a new upload
   */
  CommandResult startUpload(const StartRequest& request);

  /**
   * Valid from uploading only. Does not wait for in-flight parts to unwind.
   */
  CommandResult pause(const std::string& upload_id);

  /**
   * Valid from paused with the session resident in memory
   */
  CommandResult resume(const std::string& upload_id);

  /**
   * Resume after a restart with the original file re-supplied
   *
   * The file must match the persisted name and size. Parts are reconciled with
   * the backend listing and fresh URLs are fetched before relaunching.
   */
  CommandResult resumeWithFile(const ResumeWithFileRequest& request);

  /**
   * Resume after a restart without the original file
   *
   * Finalizes directly when enough bytes are recorded, otherwise fails the
   * session and reports that the original file is required.
   */
  CommandResult resumeInterrupted(const std::string& project_id);

  /**
   * Valid from any non-terminal state, including persisted-only sessions
   */
  CommandResult cancel(const std::string& upload_id);

  /**
   * Drop a failed session from memory and storage
   */
  CommandResult acknowledgeFailure(const std::string& upload_id);

  // ---------------------------------------------------------------------------
  // Queries
  // ---------------------------------------------------------------------------

  /**
   * In-memory session, falling back to the store
   */
  std::optional<UploadSession> getSession(const std::string& upload_id);

  /**
   * In-memory sessions that are uploading or paused
   */
  std::vector<UploadSession> listActiveUploads();

  /**
   * Every stored session
   */
  std::vector<UploadSession> listPersistedSessions();

  /**
   * Block until no driver runs for the upload
   *
   * @return false on timeout
   */
  bool waitForIdle(const std::string& upload_id, std::chrono::milliseconds timeout);

  const UploadEngineConfig& config() const { return config_; }

private:
  /**
   * In-memory state of one upload
   */
  struct ActiveUpload {
    std::mutex mutex;
    std::condition_variable idle_cv;  // Signalled when driver_running clears
    UploadSession session;
    FileSource file;
    std::vector<std::string> part_urls;
    std::shared_ptr<CancellationSource> cancel_source;
    bool driver_running = false;
    bool completing = false;  // completeTransfer in flight
    std::chrono::steady_clock::time_point run_started;
    uint64_t run_start_bytes = 0;
  };

  class ResumeSlot;

  std::shared_ptr<ActiveUpload> findUpload(const std::string& upload_id);
  std::shared_ptr<ActiveUpload> findActiveForProject(const std::string& project_id);
  void eraseUpload(const std::string& upload_id);

  CommandResult doStartUpload(const StartRequest& request);
  CommandResult doPause(const std::string& upload_id);
  CommandResult doResume(const std::string& upload_id);
  CommandResult doResumeWithFile(const ResumeWithFileRequest& request);
  CommandResult doResumeInterrupted(const std::string& project_id);
  CommandResult doCancel(const std::string& upload_id);
  CommandResult doAcknowledgeFailure(const std::string& upload_id);

  /**
   * Converts exceptions escaping a command into a failed CommandResult
   */
  CommandResult runCommand(const char* name, const std::function<CommandResult()>& command);

  /**
   * Size of the file on disk, checked against the caller's size when given
   *
   * @throws ValidationError if the file is missing or sizes differ
   */
  uint64_t resolveFileSize(const FileSource& file);

  /**
   * Must be called with up->mutex held
   */
  void launchDriver(const std::shared_ptr<ActiveUpload>& up);

  void driveUpload(std::shared_ptr<ActiveUpload> up, CancellationToken token);

  void onPartCompleted(const std::shared_ptr<ActiveUpload>& up, const UploadedChunk& chunk);

  /**
   * Finalize with ascending parts, then delete the record and emit COMPLETE
   *
   * @return true if the transfer was finalized
   */
  bool completeUpload(
    const std::shared_ptr<ActiveUpload>& up, const CancellationToken& token,
    const std::string& step, std::string& error
  );

  void failUpload(
    const std::shared_ptr<ActiveUpload>& up, ErrorCode code, const std::string& message,
    bool retryable
  );

  /**
   * Run fn on a tracked background thread that shutdown() waits for
   */
  void runBackground(std::function<void()> fn);

  void persist(const UploadSession& session);
  void removeRecord(const std::string& upload_id);

  /**
   * Must be called with up.mutex held
   */
  UploadEvent makeEvent(const ActiveUpload& up, UploadEventType type, const std::string& step) const;

  void sweeperLoop();

  UploadEngineConfig config_;
  std::shared_ptr<TransferClient> client_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<EventChannel> events_;
  std::shared_ptr<IFileSystem> fs_;
  std::shared_ptr<IFileStreamFactory> files_;
  ChunkScheduler scheduler_;

  std::mutex uploads_mutex_;
  std::map<std::string, std::shared_ptr<ActiveUpload>> uploads_;

  std::mutex resume_mutex_;
  std::set<std::string> resuming_projects_;

  // Parent of every run's cancellation source
  CancellationSource shutdown_source_;
  std::atomic<bool> shutting_down_{false};

  std::mutex background_mutex_;
  std::condition_variable background_cv_;
  int background_tasks_ = 0;

  std::mutex sweeper_mutex_;
  std::condition_variable sweeper_cv_;
  std::thread sweeper_thread_;
  bool sweeper_running_ = false;
};

}  // namespace uploader
}  // namespace tessera

#endif  // TESSERA_UPLOAD_ENGINE_HPP
