// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_CHUNK_SCHEDULER_HPP
#define TESSERA_CHUNK_SCHEDULER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "cancellation_token.hpp"
#include "retry_handler.hpp"
#include "transfer_client.hpp"
#include "upload_errors.hpp"
#include "upload_session.hpp"
#include "uploader_interfaces.hpp"

namespace tessera {
namespace uploader {

/**
 * Byte range of one part
 */
struct PartRange {
  int part_number = 0;  // 1-based
  uint64_t offset = 0;
  uint64_t size = 0;
};

/**
 * Split a file into ceil(file_size / chunk_size) contiguous ranges
 *
 * The last range is shorter when file_size is not a multiple of chunk_size.
 * A zero-byte file yields a single empty part.
 *
 * @throws ValidationError if chunk_size is 0
 */
std::vector<PartRange> partitionFile(uint64_t file_size, uint64_t chunk_size);

/**
 * Read [offset, offset + size) of a file into a new buffer
 *
 * @throws ValidationError if the file cannot be opened or is shorter than requested
 */
std::string readFileRange(
  IFileStreamFactory& factory, const std::string& path, uint64_t offset, uint64_t size
);

struct SchedulerConfig {
  int max_concurrent_chunks = 3;
  RetryConfig retry;
  std::chrono::milliseconds part_timeout{120000};
};

/**
 * Everything one scheduler run needs to know about a transfer
 */
struct TransferPlan {
  std::string file_path;
  uint64_t file_size = 0;
  uint64_t chunk_size = 0;
  std::vector<std::string> part_urls;  // part_urls[i] belongs to part i + 1
  std::set<int> completed_parts;       // Skipped by the run
};

enum class SchedulerOutcome {
  COMPLETED,  // Every part is recorded
  CANCELLED,  // The caller's token fired
  FAILED      // A part failed permanently or the plan is invalid
};

struct SchedulerResult {
  SchedulerOutcome outcome = SchedulerOutcome::COMPLETED;
  ErrorCode error_code = ErrorCode::NONE;
  std::string message;
  int failed_part = 0;
  int http_status = 0;
  bool retryable = false;     // Whether the last underlying error was transient
  size_t parts_uploaded = 0;  // Parts uploaded by this run
};

/**
 * Invoked once per uploaded part, from the worker thread that uploaded it
 */
using PartCompletedCallback = std::function<void(const UploadedChunk&)>;

/**
 * Drives bounded-concurrency upload of a file's parts
 *
 * Workers pull the next pending part from a shared index; each attempt reads its
 * own buffer from disk. Transient failures are retried with exponential backoff.
 * The first permanent failure cancels every other in-flight request of the run.
 *
 * The scheduler never persists anything and never finalizes the transfer; it
 * reports each part through the callback and returns an outcome.
 *
 * Thread-safety: run() may be called concurrently for different plans.
 */
class ChunkScheduler {
public:
  ChunkScheduler(
    std::shared_ptr<TransferClient> client, std::shared_ptr<IFileStreamFactory> files,
    const SchedulerConfig& config = {}
  );

  /**
   * Upload every part of the plan not yet completed
   *
   * Blocks until all workers have stopped.
   *
   * @param plan Transfer to run
   * @param token Caller's cancellation signal (pause, cancel, shutdown)
   * @param on_part Called for every uploaded part
   */
  SchedulerResult run(
    const TransferPlan& plan, const CancellationToken& token, const PartCompletedCallback& on_part
  );

  const SchedulerConfig& config() const { return config_; }

private:
  /**
   * Upload one part, retrying transient failures
   *
   * @throws CancellationError if token fires
   * @throws UploadError after the final failed attempt
   */
  UploadedChunk uploadWithRetry(
    const PartRange& range, const std::string& url, const std::string& file_path,
    const CancellationToken& token
  );

  std::shared_ptr<TransferClient> client_;
  std::shared_ptr<IFileStreamFactory> files_;
  SchedulerConfig config_;
  RetryHandler retry_;
};

}  // namespace uploader
}  // namespace tessera

#endif  // TESSERA_CHUNK_SCHEDULER_HPP
