// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunk_scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <thread>

#define TESSERA_LOG_COMPONENT "chunk_scheduler"
#include <tessera_log_macros.hpp>

namespace tessera {
namespace uploader {

using logging::kv;

std::vector<PartRange> partitionFile(uint64_t file_size, uint64_t chunk_size) {
  if (chunk_size == 0) {
    throw ValidationError("Chunk size must be greater than zero");
  }

  std::vector<PartRange> ranges;
  if (file_size == 0) {
    ranges.push_back(PartRange{1, 0, 0});
    return ranges;
  }

  ranges.reserve(static_cast<size_t>((file_size + chunk_size - 1) / chunk_size));
  int part_number = 1;
  for (uint64_t offset = 0; offset < file_size; offset += chunk_size) {
    ranges.push_back(PartRange{part_number++, offset, std::min(chunk_size, file_size - offset)});
  }
  return ranges;
}

std::string readFileRange(
  IFileStreamFactory& factory, const std::string& path, uint64_t offset, uint64_t size
) {
  std::string buffer(static_cast<size_t>(size), '\0');
  if (size == 0) {
    return buffer;
  }

  auto stream = factory.open_for_read(path);
  if (!stream) {
    throw ValidationError("Cannot open source file: " + path);
  }

  stream->seekg(static_cast<std::streamoff>(offset));
  stream->read(&buffer[0], static_cast<std::streamsize>(size));
  if (stream->fail() || static_cast<uint64_t>(stream->gcount()) != size) {
    throw ValidationError(
      "Source file is shorter than expected: read " + std::to_string(stream->gcount()) + " of " +
      std::to_string(size) + " bytes at offset " + std::to_string(offset)
    );
  }
  return buffer;
}

ChunkScheduler::ChunkScheduler(
  std::shared_ptr<TransferClient> client, std::shared_ptr<IFileStreamFactory> files,
  const SchedulerConfig& config
)
    : client_(std::move(client))
    , files_(std::move(files))
    , config_(config)
    , retry_(config.retry) {}

SchedulerResult ChunkScheduler::run(
  const TransferPlan& plan, const CancellationToken& token, const PartCompletedCallback& on_part
) {
  SchedulerResult result;

  std::vector<PartRange> ranges;
  try {
    ranges = partitionFile(plan.file_size, plan.chunk_size);
  } catch (const ValidationError& e) {
    result.outcome = SchedulerOutcome::FAILED;
    result.error_code = e.code();
    result.message = e.what();
    return result;
  }

  if (plan.part_urls.size() < ranges.size()) {
    result.outcome = SchedulerOutcome::FAILED;
    result.error_code = ErrorCode::VALIDATION;
    result.message = "Expected " + std::to_string(ranges.size()) + " part URLs, got " +
                     std::to_string(plan.part_urls.size());
    TESSERA_LOG_ERROR("Invalid transfer plan" << kv("error", result.message));
    return result;
  }

  std::vector<PartRange> pending;
  for (const auto& range : ranges) {
    if (plan.completed_parts.count(range.part_number) == 0) {
      pending.push_back(range);
    }
  }

  if (pending.empty()) {
    TESSERA_LOG_DEBUG("Nothing to upload" << kv("parts", ranges.size()));
    return result;
  }

  if (token.isCancelled()) {
    result.outcome = SchedulerOutcome::CANCELLED;
    result.error_code = ErrorCode::CANCELLED;
    result.message = "Upload cancelled";
    return result;
  }

  // Child source: a permanent failure stops the other workers without
  // touching the caller's token
  CancellationSource abort_run(token);
  CancellationToken run_token = abort_run.token();

  std::atomic<size_t> next_index{0};
  std::atomic<size_t> uploaded{0};
  std::mutex failure_mutex;
  std::optional<SchedulerResult> failure;

  auto record_failure = [&](ErrorCode code, const std::string& message, int part, int status,
                            bool retryable) {
    {
      std::lock_guard<std::mutex> lock(failure_mutex);
      if (!failure) {
        SchedulerResult f;
        f.outcome = SchedulerOutcome::FAILED;
        f.error_code = code;
        f.message = message;
        f.failed_part = part;
        f.http_status = status;
        f.retryable = retryable;
        failure = f;
      }
    }
    abort_run.cancel();
  };

  auto worker = [&]() {
    while (!run_token.isCancelled()) {
      size_t index = next_index.fetch_add(1);
      if (index >= pending.size()) {
        break;
      }
      const PartRange& range = pending[index];
      const std::string& url = plan.part_urls[static_cast<size_t>(range.part_number - 1)];

      try {
        UploadedChunk chunk = uploadWithRetry(range, url, plan.file_path, run_token);
        if (on_part) {
          on_part(chunk);
        }
        uploaded.fetch_add(1);
      } catch (const CancellationError&) {
        break;
      } catch (const UploadError& e) {
        record_failure(e.code(), e.what(), range.part_number, e.httpStatus(), e.retryable());
        break;
      } catch (const std::exception& e) {
        record_failure(ErrorCode::PART_UPLOAD, e.what(), range.part_number, 0, false);
        break;
      }
    }
  };

  size_t num_workers = std::min(
    static_cast<size_t>(std::max(1, config_.max_concurrent_chunks)), pending.size()
  );
  TESSERA_LOG_DEBUG(
    "Scheduler run started" << kv("pending", pending.size()) << kv("total", ranges.size())
                            << kv("workers", num_workers)
  );

  std::vector<std::thread> workers;
  workers.reserve(num_workers);
  for (size_t i = 0; i < num_workers; ++i) {
    workers.emplace_back(worker);
  }
  for (auto& w : workers) {
    if (w.joinable()) {
      w.join();
    }
  }

  result.parts_uploaded = uploaded.load();

  // User cancellation wins over failures caused by the cancellation itself
  if (token.isCancelled()) {
    result.outcome = SchedulerOutcome::CANCELLED;
    result.error_code = ErrorCode::CANCELLED;
    result.message = "Upload cancelled";
    return result;
  }

  if (failure) {
    size_t parts_uploaded = result.parts_uploaded;
    result = *failure;
    result.parts_uploaded = parts_uploaded;
    TESSERA_LOG_ERROR(
      "Scheduler run failed" << kv("part", result.failed_part)
                             << kv("error", sanitizeErrorMessage(result.message))
    );
    return result;
  }

  if (result.parts_uploaded != pending.size()) {
    result.outcome = SchedulerOutcome::FAILED;
    result.error_code = ErrorCode::PART_UPLOAD;
    result.message = "Scheduler stopped with " +
                     std::to_string(pending.size() - result.parts_uploaded) +
                     " part(s) not uploaded";
    return result;
  }

  TESSERA_LOG_DEBUG("Scheduler run completed" << kv("uploaded", result.parts_uploaded));
  return result;
}

UploadedChunk ChunkScheduler::uploadWithRetry(
  const PartRange& range, const std::string& url, const std::string& file_path,
  const CancellationToken& token
) {
  for (int attempt = 1;; ++attempt) {
    if (token.isCancelled()) {
      throw CancellationError();
    }

    try {
      // Buffer lives for this attempt only
      std::string data = readFileRange(*files_, file_path, range.offset, range.size);
      PartUploadResult uploaded = client_->uploadPart(url, data, config_.part_timeout, token);

      TESSERA_LOG_DEBUG(
        "Part uploaded" << kv("part", range.part_number) << kv("bytes", uploaded.bytes_sent)
                        << kv("attempt", attempt)
      );
      return UploadedChunk{range.part_number, uploaded.etag, uploaded.bytes_sent};
    } catch (const CancellationError&) {
      throw;
    } catch (const UploadError& e) {
      // An aborted request often surfaces as a network error
      if (token.isCancelled()) {
        throw CancellationError();
      }

      if (!e.retryable() || !retry_.shouldRetry(attempt)) {
        ErrorCode code = e.code();
        if (code == ErrorCode::NETWORK || code == ErrorCode::TIMEOUT) {
          code = ErrorCode::PART_UPLOAD;
        }
        throw UploadError(
          code,
          "Failed to upload chunk " + std::to_string(range.part_number) + " after " +
            std::to_string(attempt) + " attempt(s): " + e.what(),
          e.retryable(), e.httpStatus(), range.part_number
        );
      }

      auto delay = retry_.getDelay(attempt);
      TESSERA_LOG_WARN(
        "Part upload failed, retrying" << kv("part", range.part_number) << kv("attempt", attempt)
                                       << kv("status", e.httpStatus())
                                       << kv("delay_ms", delay.count())
                                       << kv("error", sanitizeErrorMessage(e.what()))
      );
      if (token.waitFor(delay)) {
        throw CancellationError();
      }
    }
  }
}

}  // namespace uploader
}  // namespace tessera
