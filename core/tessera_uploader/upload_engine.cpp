// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "upload_state_machine.hpp"
#include "uploader_impl.hpp"

#define TESSERA_LOG_COMPONENT "upload_engine"
#include <tessera_log_macros.hpp>

namespace tessera {
namespace uploader {

using logging::kv;

namespace {

const char* const kOriginalFileRequired =
  "Cannot resume upload after restart - original file required. Please restart the upload.";
const char* const kFileMismatch =
  "Selected file does not match the original upload (name/size mismatch).";

bool isActiveStatus(UploadStatus status) {
  return status == UploadStatus::UPLOADING || status == UploadStatus::PAUSED;
}

/**
 * Apply a state machine transition or raise InvalidStateError
 */
void transitionOrThrow(UploadSession& session, UploadStatus to) {
  std::string error;
  if (!UploadStateMachine::transition(session, to, error)) {
    throw InvalidStateError(error);
  }
}

}  // namespace

/**
 * Holds the per-project resume slot for the lifetime of one resume command
 */
class UploadEngine::ResumeSlot {
public:
  ResumeSlot(UploadEngine& engine, const std::string& project_id)
      : engine_(engine)
      , project_id_(project_id) {
    std::lock_guard<std::mutex> lock(engine_.resume_mutex_);
    acquired_ = engine_.resuming_projects_.insert(project_id_).second;
  }

  ~ResumeSlot() {
    if (acquired_) {
      std::lock_guard<std::mutex> lock(engine_.resume_mutex_);
      engine_.resuming_projects_.erase(project_id_);
    }
  }

  ResumeSlot(const ResumeSlot&) = delete;
  ResumeSlot& operator=(const ResumeSlot&) = delete;

  bool acquired() const { return acquired_; }

private:
  UploadEngine& engine_;
  std::string project_id_;
  bool acquired_ = false;
};

UploadEngine::UploadEngine(
  const UploadEngineConfig& config, std::shared_ptr<TransferClient> client,
  std::shared_ptr<SessionStore> store, std::shared_ptr<EventChannel> events,
  std::shared_ptr<IFileSystem> fs, std::shared_ptr<IFileStreamFactory> files
)
    : config_(config)
    , client_(std::move(client))
    , store_(std::move(store))
    , events_(std::move(events))
    , fs_(fs ? std::move(fs) : std::make_shared<FileSystemImpl>())
    , files_(files ? std::move(files) : std::make_shared<FileStreamFactoryImpl>())
    , scheduler_(client_, files_, config_.scheduler) {
  if (!client_ || !store_ || !events_) {
    throw std::invalid_argument("UploadEngine requires a transfer client, store and event channel");
  }
  if (config_.default_chunk_size == 0) {
    throw std::invalid_argument("default_chunk_size must be greater than zero");
  }
}

UploadEngine::~UploadEngine() {
  shutdown();
}

// =============================================================================
// Lifecycle
// =============================================================================

void UploadEngine::start() {
  if (shutting_down_.load()) {
    TESSERA_LOG_WARN("start() called after shutdown");
    return;
  }

  {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    if (sweeper_running_) {
      return;
    }
    sweeper_running_ = true;
  }

  try {
    size_t reaped = store_->reapOlderThan(config_.max_session_age);
    if (reaped > 0) {
      TESSERA_LOG_INFO("Reaped stale upload sessions" << kv("count", reaped));
    }
  } catch (const StorageError& e) {
    TESSERA_LOG_WARN("Initial session reap failed" << kv("error", e.what()));
  }

  sweeper_thread_ = std::thread(&UploadEngine::sweeperLoop, this);
  TESSERA_LOG_INFO(
    "Upload engine started" << kv("max_concurrent_chunks", config_.scheduler.max_concurrent_chunks)
                            << kv("cleanup_interval_ms", config_.cleanup_interval.count())
  );
}

void UploadEngine::shutdown() {
  if (shutting_down_.exchange(true)) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    sweeper_running_ = false;
  }
  sweeper_cv_.notify_all();
  if (sweeper_thread_.joinable()) {
    sweeper_thread_.join();
  }

  // Drivers see a cancelled run and leave persisted status alone
  shutdown_source_.cancel();

  std::unique_lock<std::mutex> lock(background_mutex_);
  background_cv_.wait(lock, [this] { return background_tasks_ == 0; });

  TESSERA_LOG_INFO("Upload engine shut down");
}

void UploadEngine::sweeperLoop() {
  std::unique_lock<std::mutex> lock(sweeper_mutex_);
  while (sweeper_running_) {
    sweeper_cv_.wait_for(lock, config_.cleanup_interval, [this] { return !sweeper_running_; });
    if (!sweeper_running_) {
      break;
    }

    lock.unlock();
    try {
      size_t reaped = store_->reapOlderThan(config_.max_session_age);
      if (reaped > 0) {
        TESSERA_LOG_INFO("Reaped stale upload sessions" << kv("count", reaped));
      }
    } catch (const StorageError& e) {
      TESSERA_LOG_WARN("Session reap failed" << kv("error", e.what()));
    }
    lock.lock();
  }
}

void UploadEngine::runBackground(std::function<void()> fn) {
  {
    std::lock_guard<std::mutex> lock(background_mutex_);
    ++background_tasks_;
  }

  std::thread([this, fn = std::move(fn)]() {
    fn();
    std::lock_guard<std::mutex> lock(background_mutex_);
    --background_tasks_;
    background_cv_.notify_all();
  }).detach();
}

// =============================================================================
// Helpers
// =============================================================================

std::shared_ptr<UploadEngine::ActiveUpload> UploadEngine::findUpload(const std::string& upload_id) {
  std::lock_guard<std::mutex> lock(uploads_mutex_);
  auto it = uploads_.find(upload_id);
  return it == uploads_.end() ? nullptr : it->second;
}

std::shared_ptr<UploadEngine::ActiveUpload> UploadEngine::findActiveForProject(
  const std::string& project_id
) {
  std::lock_guard<std::mutex> lock(uploads_mutex_);
  for (const auto& entry : uploads_) {
    std::lock_guard<std::mutex> up_lock(entry.second->mutex);
    if (entry.second->session.project_id == project_id &&
        isActiveStatus(entry.second->session.status)) {
      return entry.second;
    }
  }
  return nullptr;
}

void UploadEngine::eraseUpload(const std::string& upload_id) {
  std::lock_guard<std::mutex> lock(uploads_mutex_);
  uploads_.erase(upload_id);
}

void UploadEngine::persist(const UploadSession& session) {
  try {
    store_->put(session);
  } catch (const StorageError& e) {
    // A transfer keeps going without persistence; only resume after restart suffers
    TESSERA_LOG_WARN(
      "Failed to persist upload session" << kv("upload_id", session.upload_id)
                                         << kv("error", e.what())
    );
  }
}

void UploadEngine::removeRecord(const std::string& upload_id) {
  try {
    store_->remove(upload_id);
  } catch (const StorageError& e) {
    TESSERA_LOG_WARN(
      "Failed to delete upload session" << kv("upload_id", upload_id) << kv("error", e.what())
    );
  }
}

UploadEvent UploadEngine::makeEvent(
  const ActiveUpload& up, UploadEventType type, const std::string& step
) const {
  UploadEvent event;
  event.type = type;
  event.project_id = up.session.project_id;
  event.upload_id = up.session.upload_id;
  event.progress = up.session.progress;
  event.uploaded_bytes = up.session.uploadedBytes();
  event.total_bytes = up.session.file_size;
  event.current_chunk = static_cast<int>(up.session.parts.size());
  event.total_chunks = static_cast<int>(up.session.totalParts());
  event.step = step;
  return event;
}

uint64_t UploadEngine::resolveFileSize(const FileSource& file) {
  if (file.path.empty() || !fs_->is_regular_file(file.path)) {
    throw ValidationError("Source file not found: " + file.path);
  }

  uint64_t size = 0;
  try {
    size = fs_->file_size(file.path);
  } catch (const std::exception& e) {
    throw ValidationError("Cannot read size of " + file.path + ": " + e.what());
  }

  if (file.size != 0 && file.size != size) {
    throw ValidationError(
      "Source file size changed: expected " + std::to_string(file.size) + " bytes, found " +
      std::to_string(size)
    );
  }
  return size;
}

CommandResult UploadEngine::runCommand(
  const char* name, const std::function<CommandResult()>& command
) {
  if (shutting_down_.load()) {
    return CommandResult::Failure(ErrorCode::INVALID_STATE, "Upload engine is shut down");
  }

  try {
    return command();
  } catch (const UploadError& e) {
    std::string message = sanitizeErrorMessage(e.what());
    TESSERA_LOG_WARN(
      "Command rejected" << kv("command", name) << kv("code", errorCodeToString(e.code()))
                         << kv("error", message)
    );
    return CommandResult::Failure(e.code(), message);
  } catch (const std::exception& e) {
    std::string message = sanitizeErrorMessage(e.what());
    TESSERA_LOG_ERROR("Command failed" << kv("command", name) << kv("error", message));
    return CommandResult::Failure(ErrorCode::NONE, message);
  }
}

// =============================================================================
// Driver
// =============================================================================

void UploadEngine::launchDriver(const std::shared_ptr<ActiveUpload>& up) {
  up->cancel_source = std::make_shared<CancellationSource>(shutdown_source_.token());
  up->driver_running = true;
  up->run_started = std::chrono::steady_clock::now();
  up->run_start_bytes = up->session.uploadedBytes();

  CancellationToken token = up->cancel_source->token();
  runBackground([this, up, token]() { driveUpload(up, token); });
}

void UploadEngine::driveUpload(std::shared_ptr<ActiveUpload> up, CancellationToken token) {
  TransferPlan plan;
  std::string project_id;
  std::string upload_id;
  {
    std::lock_guard<std::mutex> lock(up->mutex);
    project_id = up->session.project_id;
    upload_id = up->session.upload_id;
    plan.file_path = up->file.path;
    plan.file_size = up->session.file_size;
    plan.chunk_size = up->session.chunk_size;
    plan.part_urls = up->part_urls;
    for (const auto& part : up->session.parts) {
      plan.completed_parts.insert(part.part_number);
    }
  }

  TESSERA_LOG_SCOPED_UPLOAD(project_id, upload_id);

  try {
    SchedulerResult result =
      scheduler_.run(plan, token, [this, &up](const UploadedChunk& chunk) {
        onPartCompleted(up, chunk);
      });

    switch (result.outcome) {
      case SchedulerOutcome::CANCELLED:
        // Pause, cancel and shutdown already updated the session
        TESSERA_LOG_DEBUG("Driver stopped by cancellation" << kv("uploaded", result.parts_uploaded));
        break;
      case SchedulerOutcome::FAILED:
        failUpload(up, result.error_code, result.message, result.retryable);
        break;
      case SchedulerOutcome::COMPLETED: {
        std::string error;
        completeUpload(up, token, "Upload completed successfully!", error);
        break;
      }
    }
  } catch (const std::exception& e) {
    failUpload(up, ErrorCode::PART_UPLOAD, e.what(), false);
  }

  {
    std::lock_guard<std::mutex> lock(up->mutex);
    up->driver_running = false;
  }
  up->idle_cv.notify_all();
}

void UploadEngine::onPartCompleted(
  const std::shared_ptr<ActiveUpload>& up, const UploadedChunk& chunk
) {
  UploadEvent event;
  {
    std::lock_guard<std::mutex> lock(up->mutex);
    if (UploadStateMachine::isTerminal(up->session.status)) {
      // Cancelled or failed meanwhile: the record must not be resurrected
      return;
    }

    up->session.recordPart(chunk);
    up->session.touch();
    persist(up->session);

    if (up->session.status != UploadStatus::UPLOADING) {
      return;
    }

    int total = static_cast<int>(up->session.totalParts());
    int recorded = static_cast<int>(up->session.parts.size());
    event = makeEvent(
      *up, UploadEventType::PROGRESS,
      "Uploading chunk " + std::to_string(recorded) + "/" + std::to_string(total)
    );

    double elapsed = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - up->run_started
    )
                       .count();
    uint64_t run_bytes = event.uploaded_bytes - std::min(event.uploaded_bytes, up->run_start_bytes);
    if (elapsed > 0.0 && run_bytes > 0) {
      event.speed_bytes_per_sec = static_cast<double>(run_bytes) / elapsed;
      uint64_t remaining = event.total_bytes - std::min(event.total_bytes, event.uploaded_bytes);
      event.eta_seconds = static_cast<double>(remaining) / event.speed_bytes_per_sec;
    }
  }

  TESSERA_LOG_INFO_THROTTLE(
    1.0, "Upload progress" << kv("progress", event.progress) << kv("step", event.step)
  );
  events_->publish(std::move(event));
}

bool UploadEngine::completeUpload(
  const std::shared_ptr<ActiveUpload>& up, const CancellationToken& token,
  const std::string& step, std::string& error
) {
  std::string destination_key;
  std::string upload_id;
  std::string project_id;
  std::vector<UploadedChunk> parts;
  {
    std::lock_guard<std::mutex> lock(up->mutex);
    if (!isActiveStatus(up->session.status) || up->completing || token.isCancelled()) {
      error = "Upload is no longer active";
      return false;
    }
    up->completing = true;
    destination_key = up->session.destination_key;
    upload_id = up->session.upload_id;
    project_id = up->session.project_id;
    // Ascending order is enforced here, at consumption
    parts = normalizeParts(up->session.parts);
  }

  std::string final_key;
  try {
    final_key = client_->completeTransfer(destination_key, upload_id, parts);
  } catch (const std::exception& e) {
    error = e.what();
    {
      std::lock_guard<std::mutex> lock(up->mutex);
      up->completing = false;
    }
    failUpload(up, ErrorCode::COMPLETION, error, false);
    return false;
  }

  client_->notifyProjectComplete(project_id);

  UploadEvent event;
  {
    std::lock_guard<std::mutex> lock(up->mutex);
    up->completing = false;
    transitionOrThrow(up->session, UploadStatus::COMPLETED);
    up->session.progress = 100;
    removeRecord(upload_id);
    event = makeEvent(*up, UploadEventType::COMPLETE, step);
    event.final_key = final_key;
  }
  eraseUpload(upload_id);

  TESSERA_LOG_INFO("Upload completed" << kv("upload_id", upload_id) << kv("parts", parts.size()));
  events_->publish(std::move(event));
  return true;
}

void UploadEngine::failUpload(
  const std::shared_ptr<ActiveUpload>& up, ErrorCode code, const std::string& message,
  bool retryable
) {
  std::string clean = sanitizeErrorMessage(message);
  UploadEvent event;
  {
    std::lock_guard<std::mutex> lock(up->mutex);
    std::string error;
    if (!UploadStateMachine::transition(up->session, UploadStatus::FAILED, error)) {
      TESSERA_LOG_DEBUG("Failure ignored" << kv("reason", error) << kv("error", clean));
      return;
    }
    up->session.last_error = clean;
    persist(up->session);

    event = makeEvent(*up, UploadEventType::ERROR, "Upload failed");
    event.error = clean;
    event.error_code = errorCodeToString(code);
    event.retryable = retryable;
  }

  TESSERA_LOG_ERROR(
    "Upload failed" << kv("upload_id", event.upload_id) << kv("code", event.error_code)
                    << kv("error", clean)
  );
  events_->publish(std::move(event));
}

// =============================================================================
// Commands
// =============================================================================

CommandResult UploadEngine::startUpload(const StartRequest& request) {
  return runCommand("start", [&]() { return doStartUpload(request); });
}

CommandResult UploadEngine::pause(const std::string& upload_id) {
  return runCommand("pause", [&]() { return doPause(upload_id); });
}

CommandResult UploadEngine::resume(const std::string& upload_id) {
  return runCommand("resume", [&]() { return doResume(upload_id); });
}

CommandResult UploadEngine::resumeWithFile(const ResumeWithFileRequest& request) {
  return runCommand("resume_with_file", [&]() { return doResumeWithFile(request); });
}

CommandResult UploadEngine::resumeInterrupted(const std::string& project_id) {
  return runCommand("resume_interrupted", [&]() { return doResumeInterrupted(project_id); });
}

CommandResult UploadEngine::cancel(const std::string& upload_id) {
  return runCommand("cancel", [&]() { return doCancel(upload_id); });
}

CommandResult UploadEngine::acknowledgeFailure(const std::string& upload_id) {
  return runCommand("acknowledge_failure", [&]() { return doAcknowledgeFailure(upload_id); });
}

CommandResult UploadEngine::doStartUpload(const StartRequest& request) {
  if (request.project_id.empty()) {
    throw ValidationError("project_id is required");
  }
  if (request.file.name.empty()) {
    throw ValidationError("file name is required");
  }
  uint64_t file_size = resolveFileSize(request.file);

  if (findActiveForProject(request.project_id)) {
    throw InvalidStateError("Upload already active for project " + request.project_id);
  }

  auto now = std::chrono::system_clock::now();
  UploadSession session;
  session.project_id = request.project_id;
  session.destination_key = request.destination_key;
  session.file_name = request.file.name;
  session.file_size = file_size;
  session.mime_type = request.file.mime_type;
  session.chunk_size = calculateOptimalChunkSize(file_size, config_.default_chunk_size);
  session.status = UploadStatus::UPLOADING;
  session.started_at = now;
  session.last_activity = now;

  std::vector<std::string> part_urls;
  if (request.existing_transfer) {
    const TransferInitiation& existing = *request.existing_transfer;
    if (existing.upload_id.empty() || existing.part_urls.empty()) {
      throw ValidationError("Existing transfer requires an upload id and part URLs");
    }
    session.upload_id = existing.upload_id;
    if (!existing.destination_key.empty()) {
      session.destination_key = existing.destination_key;
    }
    if (existing.chunk_size > 0) {
      session.chunk_size = existing.chunk_size;
    }
    part_urls = existing.part_urls;
  } else {
    // Placeholder record, so an initiation failure still leaves a trace
    session.upload_id = makePendingUploadId(request.project_id);
    persist(session);
    std::string placeholder_id = session.upload_id;

    TESSERA_LOG_SCOPED_UPLOAD(request.project_id, placeholder_id);
    auto fail_initiation = [&](ErrorCode code, const std::string& message, bool retryable) {
      auto up = std::make_shared<ActiveUpload>();
      up->session = session;
      up->file = request.file;
      {
        std::lock_guard<std::mutex> lock(uploads_mutex_);
        uploads_[placeholder_id] = up;
      }
      failUpload(up, code, message, retryable);
      return CommandResult::Failure(code, sanitizeErrorMessage(message), placeholder_id);
    };

    TransferInitiation initiation;
    try {
      InitiateRequest init;
      init.file_name = request.file.name;
      init.file_size = file_size;
      init.project_id = request.project_id;
      init.mime_type = request.file.mime_type;
      initiation = client_->initiateTransfer(init);
    } catch (const UploadError& e) {
      ErrorCode code = e.code() == ErrorCode::CANCELLED ? ErrorCode::CANCELLED
                                                         : ErrorCode::INITIATION;
      return fail_initiation(code, e.what(), e.retryable());
    } catch (const std::exception& e) {
      return fail_initiation(
        ErrorCode::INITIATION, std::string("Failed to initiate upload: ") + e.what(), false
      );
    }

    removeRecord(placeholder_id);
    session.upload_id = initiation.upload_id;
    if (!initiation.destination_key.empty()) {
      session.destination_key = initiation.destination_key;
    }
    if (initiation.chunk_size > 0) {
      session.chunk_size = initiation.chunk_size;
    }
    part_urls = std::move(initiation.part_urls);
  }

  auto up = std::make_shared<ActiveUpload>();
  up->session = session;
  up->file = request.file;
  up->file.size = file_size;
  up->part_urls = std::move(part_urls);

  {
    std::lock_guard<std::mutex> lock(uploads_mutex_);
    if (uploads_.count(session.upload_id) > 0) {
      throw InvalidStateError("Upload " + session.upload_id + " is already tracked");
    }
    uploads_[session.upload_id] = up;
  }

  UploadEvent event;
  {
    std::lock_guard<std::mutex> lock(up->mutex);
    persist(up->session);
    event = makeEvent(*up, UploadEventType::PROGRESS, "Starting upload...");
    launchDriver(up);
  }
  events_->publish(std::move(event));

  TESSERA_LOG_INFO(
    "Upload started" << kv("project_id", session.project_id) << kv("upload_id", session.upload_id)
                     << kv("file_size", session.file_size) << kv("chunk_size", session.chunk_size)
                     << kv("parts", session.totalParts())
  );
  return CommandResult::Success(session.upload_id, "Upload started");
}

CommandResult UploadEngine::doPause(const std::string& upload_id) {
  auto up = findUpload(upload_id);
  if (!up) {
    throw InvalidStateError("Upload not found: " + upload_id);
  }

  UploadEvent event;
  {
    std::lock_guard<std::mutex> lock(up->mutex);
    if (up->completing) {
      throw InvalidStateError("Upload is being finalized");
    }
    if (up->session.status != UploadStatus::UPLOADING) {
      throw InvalidStateError(
        "Cannot pause upload in state " + uploadStatusToString(up->session.status)
      );
    }
    transitionOrThrow(up->session, UploadStatus::PAUSED);
    if (up->cancel_source) {
      up->cancel_source->cancel();
    }
    persist(up->session);
    event = makeEvent(*up, UploadEventType::PAUSED, "Upload paused");
  }

  TESSERA_LOG_INFO("Upload paused" << kv("upload_id", upload_id) << kv("progress", event.progress));
  events_->publish(std::move(event));
  return CommandResult::Success(upload_id, "Upload paused");
}

CommandResult UploadEngine::doResume(const std::string& upload_id) {
  auto up = findUpload(upload_id);
  if (!up) {
    throw InvalidStateError("Upload not found in memory: " + upload_id);
  }

  std::string project_id;
  {
    std::lock_guard<std::mutex> lock(up->mutex);
    project_id = up->session.project_id;
  }

  ResumeSlot slot(*this, project_id);
  if (!slot.acquired()) {
    throw UploadError(ErrorCode::RESUME_IN_PROGRESS, "Resume already in progress");
  }

  UploadEvent event;
  {
    std::unique_lock<std::mutex> lock(up->mutex);
    if (up->session.status != UploadStatus::PAUSED) {
      throw InvalidStateError(
        "Cannot resume upload in state " + uploadStatusToString(up->session.status)
      );
    }

    // The previous run must unwind before a new one starts
    up->idle_cv.wait(lock, [&up] { return !up->driver_running; });
    if (up->session.status != UploadStatus::PAUSED) {
      throw InvalidStateError(
        "Cannot resume upload in state " + uploadStatusToString(up->session.status)
      );
    }

    transitionOrThrow(up->session, UploadStatus::UPLOADING);
    persist(up->session);
    event = makeEvent(*up, UploadEventType::PROGRESS, "Upload resumed");
    launchDriver(up);
  }

  TESSERA_LOG_INFO("Upload resumed" << kv("upload_id", upload_id) << kv("progress", event.progress));
  events_->publish(std::move(event));
  return CommandResult::Success(upload_id, "Upload resumed");
}

CommandResult UploadEngine::doResumeWithFile(const ResumeWithFileRequest& request) {
  if (request.upload_id.empty() || request.project_id.empty()) {
    throw ValidationError("upload_id and project_id are required");
  }

  ResumeSlot slot(*this, request.project_id);
  if (!slot.acquired()) {
    throw UploadError(ErrorCode::RESUME_IN_PROGRESS, "Resume already in progress");
  }

  TESSERA_LOG_SCOPED_UPLOAD(request.project_id, request.upload_id);

  // Snapshot of the session to resume: memory first, then the store
  auto existing = findUpload(request.upload_id);
  UploadSession session;
  bool known = false;
  if (existing) {
    std::lock_guard<std::mutex> lock(existing->mutex);
    if (existing->completing || existing->session.status == UploadStatus::UPLOADING) {
      throw InvalidStateError("Upload already in progress");
    }
    if (existing->session.status != UploadStatus::PAUSED) {
      throw InvalidStateError(
        "Cannot resume upload in state " + uploadStatusToString(existing->session.status)
      );
    }
    session = existing->session;
    known = true;
  } else {
    auto stored = store_->get(request.upload_id);
    if (stored) {
      if (!isActiveStatus(stored->status)) {
        throw InvalidStateError(
          "Cannot resume upload in state " + uploadStatusToString(stored->status)
        );
      }
      session = *stored;
      known = true;
    }
  }

  if (known) {
    // Checked before anything touches the disk or the network
    if (request.file.name != session.file_name ||
        (request.file.size != 0 && request.file.size != session.file_size)) {
      throw ValidationError(kFileMismatch);
    }
  }

  uint64_t file_size = 0;
  try {
    file_size = resolveFileSize(request.file);
  } catch (const ValidationError& e) {
    throw ValidationError(known ? std::string(kFileMismatch) + " " + e.what() : e.what());
  }
  if (known && file_size != session.file_size) {
    throw ValidationError(kFileMismatch);
  }

  if (!known) {
    auto now = std::chrono::system_clock::now();
    session.project_id = request.project_id;
    session.upload_id = request.upload_id;
    session.destination_key = request.destination_key;
    session.file_name = request.file.name;
    session.file_size = file_size;
    session.mime_type = request.file.mime_type;
    session.chunk_size = 0;
    session.status = UploadStatus::PAUSED;
    session.started_at = now;
    session.last_activity = now;
  }
  if (!request.destination_key.empty() && session.destination_key.empty()) {
    session.destination_key = request.destination_key;
  }

  std::vector<UploadedChunk> remote_parts =
    client_->listUploadedParts(session.destination_key, session.upload_id);
  TransferInitiation details = client_->getUploadDetails(session.project_id, session.destination_key);

  if (!details.upload_id.empty() && details.upload_id != session.upload_id) {
    throw ResumeError("Upload details refer to a different upload");
  }
  if (session.chunk_size == 0) {
    session.chunk_size = details.chunk_size > 0
                           ? details.chunk_size
                           : calculateOptimalChunkSize(file_size, config_.default_chunk_size);
  } else if (details.chunk_size > 0 && details.chunk_size != session.chunk_size) {
    TESSERA_LOG_WARN(
      "Backend chunk size differs from the session, keeping the session's"
      << kv("session", session.chunk_size) << kv("backend", details.chunk_size)
    );
  }

  uint64_t remote_bytes = 0;
  for (const auto& part : remote_parts) {
    remote_bytes += part.size;
  }
  if (remote_bytes > session.file_size) {
    throw ResumeError("Backend reports more bytes than the file holds");
  }

  FileSource file = request.file;
  file.size = file_size;

  std::shared_ptr<ActiveUpload> up = existing;
  if (!up) {
    up = std::make_shared<ActiveUpload>();
    up->session = session;
    std::lock_guard<std::mutex> lock(uploads_mutex_);
    if (uploads_.count(session.upload_id) > 0) {
      throw InvalidStateError("Upload already in progress");
    }
    uploads_[session.upload_id] = up;
  }

  UploadEvent event;
  {
    std::unique_lock<std::mutex> lock(up->mutex);
    up->idle_cv.wait(lock, [&up] { return !up->driver_running; });
    if (!isActiveStatus(up->session.status)) {
      throw InvalidStateError(
        "Cannot resume upload in state " + uploadStatusToString(up->session.status)
      );
    }

    up->session.destination_key = session.destination_key;
    up->session.chunk_size = session.chunk_size;
    up->session.replaceParts(std::move(remote_parts));
    if (up->session.status == UploadStatus::PAUSED) {
      transitionOrThrow(up->session, UploadStatus::UPLOADING);
    } else {
      up->session.touch();
    }
    up->file = file;
    up->part_urls = std::move(details.part_urls);
    persist(up->session);

    event = makeEvent(*up, UploadEventType::PROGRESS, "Resuming upload");
    launchDriver(up);
  }

  TESSERA_LOG_INFO(
    "Upload resumed with file" << kv("recorded_parts", event.current_chunk)
                               << kv("total_parts", event.total_chunks)
                               << kv("progress", event.progress)
  );
  events_->publish(std::move(event));
  return CommandResult::Success(request.upload_id, "Upload resumed");
}

CommandResult UploadEngine::doResumeInterrupted(const std::string& project_id) {
  if (project_id.empty()) {
    throw ValidationError("project_id is required");
  }

  ResumeSlot slot(*this, project_id);
  if (!slot.acquired()) {
    throw UploadError(ErrorCode::RESUME_IN_PROGRESS, "Resume already in progress");
  }

  if (findActiveForProject(project_id)) {
    throw InvalidStateError("Upload already active");
  }

  auto stored = store_->findByProjectId(project_id);
  if (!stored || !isActiveStatus(stored->status)) {
    throw ResumeError("No upload to resume");
  }

  UploadSession session = *stored;
  session.refreshProgress();
  TESSERA_LOG_SCOPED_UPLOAD(project_id, session.upload_id);

  double ratio = 0.0;
  if (session.file_size > 0) {
    ratio = static_cast<double>(session.uploadedBytes()) / static_cast<double>(session.file_size);
  } else if (!session.parts.empty()) {
    ratio = 1.0;
  }

  auto up = std::make_shared<ActiveUpload>();
  up->session = session;
  {
    std::lock_guard<std::mutex> lock(uploads_mutex_);
    if (uploads_.count(session.upload_id) > 0) {
      throw InvalidStateError("Upload already active");
    }
    uploads_[session.upload_id] = up;
  }

  if (!session.parts.empty() && ratio >= config_.interrupted_completion_threshold) {
    TESSERA_LOG_INFO(
      "Finalizing interrupted upload from recorded parts" << kv("ratio", ratio)
                                                          << kv("parts", session.parts.size())
    );
    std::string error;
    if (!completeUpload(
          up, CancellationToken{}, "Upload completed successfully after resumption!", error
        )) {
      return CommandResult::Failure(
        ErrorCode::COMPLETION, sanitizeErrorMessage(error), session.upload_id
      );
    }
    return CommandResult::Success(session.upload_id, "Upload completed");
  }

  UploadEvent event;
  {
    std::lock_guard<std::mutex> lock(up->mutex);
    transitionOrThrow(up->session, UploadStatus::FAILED);
    up->session.last_error = kOriginalFileRequired;
    removeRecord(session.upload_id);
    event = makeEvent(*up, UploadEventType::ERROR, "Upload failed");
    event.error = kOriginalFileRequired;
    event.error_code = errorCodeToString(ErrorCode::RESUME);
  }
  eraseUpload(session.upload_id);

  TESSERA_LOG_WARN("Interrupted upload cannot be resumed" << kv("ratio", ratio));
  events_->publish(std::move(event));
  return CommandResult::Failure(ErrorCode::RESUME, kOriginalFileRequired, session.upload_id);
}

CommandResult UploadEngine::doCancel(const std::string& upload_id) {
  std::string destination_key;
  UploadEvent event;

  auto up = findUpload(upload_id);
  if (up) {
    std::lock_guard<std::mutex> lock(up->mutex);
    if (up->completing) {
      throw InvalidStateError("Upload is being finalized");
    }
    transitionOrThrow(up->session, UploadStatus::CANCELLED);
    if (up->cancel_source) {
      up->cancel_source->cancel();
    }
    removeRecord(upload_id);
    destination_key = up->session.destination_key;
    event = makeEvent(*up, UploadEventType::CANCELLED, "Upload cancelled");
  } else {
    auto stored = store_->get(upload_id);
    if (!stored) {
      throw InvalidStateError("Upload not found: " + upload_id);
    }
    transitionOrThrow(*stored, UploadStatus::CANCELLED);
    store_->remove(upload_id);
    destination_key = stored->destination_key;

    event.type = UploadEventType::CANCELLED;
    event.project_id = stored->project_id;
    event.upload_id = upload_id;
    event.progress = stored->progress;
    event.uploaded_bytes = stored->uploadedBytes();
    event.total_bytes = stored->file_size;
    event.step = "Upload cancelled";
  }
  if (up) {
    eraseUpload(upload_id);
  }

  if (!isPendingUploadId(upload_id) && !destination_key.empty()) {
    auto client = client_;
    runBackground([client, destination_key, upload_id]() {
      try {
        client->abortTransfer(destination_key, upload_id);
      } catch (const std::exception& e) {
        TESSERA_LOG_WARN(
          "Abort after cancel failed" << kv("upload_id", upload_id)
                                      << kv("error", sanitizeErrorMessage(e.what()))
        );
      }
    });
  }

  TESSERA_LOG_INFO("Upload cancelled" << kv("upload_id", upload_id));
  events_->publish(std::move(event));
  return CommandResult::Success(upload_id, "Upload cancelled");
}

CommandResult UploadEngine::doAcknowledgeFailure(const std::string& upload_id) {
  auto up = findUpload(upload_id);
  if (up) {
    std::lock_guard<std::mutex> lock(up->mutex);
    if (up->session.status != UploadStatus::FAILED) {
      throw InvalidStateError(
        "Cannot acknowledge upload in state " + uploadStatusToString(up->session.status)
      );
    }
  } else {
    auto stored = store_->get(upload_id);
    if (!stored) {
      throw InvalidStateError("Upload not found: " + upload_id);
    }
    if (stored->status != UploadStatus::FAILED) {
      throw InvalidStateError(
        "Cannot acknowledge upload in state " + uploadStatusToString(stored->status)
      );
    }
  }

  if (up) {
    eraseUpload(upload_id);
  }
  store_->remove(upload_id);
  return CommandResult::Success(upload_id, "Failure acknowledged");
}

// =============================================================================
// Queries
// =============================================================================

std::optional<UploadSession> UploadEngine::getSession(const std::string& upload_id) {
  auto up = findUpload(upload_id);
  if (up) {
    std::lock_guard<std::mutex> lock(up->mutex);
    return up->session;
  }

  try {
    return store_->get(upload_id);
  } catch (const StorageError& e) {
    TESSERA_LOG_WARN("Session lookup failed" << kv("upload_id", upload_id) << kv("error", e.what()));
    return std::nullopt;
  }
}

std::vector<UploadSession> UploadEngine::listActiveUploads() {
  std::vector<std::shared_ptr<ActiveUpload>> snapshot;
  {
    std::lock_guard<std::mutex> lock(uploads_mutex_);
    for (const auto& entry : uploads_) {
      snapshot.push_back(entry.second);
    }
  }

  std::vector<UploadSession> result;
  for (const auto& up : snapshot) {
    std::lock_guard<std::mutex> lock(up->mutex);
    if (isActiveStatus(up->session.status)) {
      result.push_back(up->session);
    }
  }
  return result;
}

std::vector<UploadSession> UploadEngine::listPersistedSessions() {
  try {
    return store_->listAll();
  } catch (const StorageError& e) {
    TESSERA_LOG_WARN("Listing stored sessions failed" << kv("error", e.what()));
    return {};
  }
}

bool UploadEngine::waitForIdle(const std::string& upload_id, std::chrono::milliseconds timeout) {
  auto up = findUpload(upload_id);
  if (!up) {
    return true;
  }
  std::unique_lock<std::mutex> lock(up->mutex);
  return up->idle_cv.wait_for(lock, timeout, [&up] { return !up->driver_running; });
}

}  // namespace uploader
}  // namespace tessera
