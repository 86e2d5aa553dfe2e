// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_UPLOAD_SESSION_HPP
#define TESSERA_UPLOAD_SESSION_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tessera {
namespace uploader {

/**
 * Upload session status
 */
enum class UploadStatus {
  UPLOADING,  // Parts are being transferred
  PAUSED,     // Stopped by the caller, resumable
  COMPLETED,  // Finalized by the backend
  FAILED,     // Terminal for this attempt, kept for diagnostics
  CANCELLED   // Aborted by the caller
};

/**
 * Convert UploadStatus to string for storage and events
 */
inline std::string uploadStatusToString(UploadStatus status) {
  switch (status) {
    case UploadStatus::UPLOADING:
      return "uploading";
    case UploadStatus::PAUSED:
      return "paused";
    case UploadStatus::COMPLETED:
      return "completed";
    case UploadStatus::FAILED:
      return "failed";
    case UploadStatus::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}

/**
 * Parse UploadStatus from string
 *
 * @return nullopt for unknown strings
 */
inline std::optional<UploadStatus> uploadStatusFromString(const std::string& str) {
  if (str == "uploading") return UploadStatus::UPLOADING;
  if (str == "paused") return UploadStatus::PAUSED;
  if (str == "completed") return UploadStatus::COMPLETED;
  if (str == "failed") return UploadStatus::FAILED;
  if (str == "cancelled") return UploadStatus::CANCELLED;
  return std::nullopt;
}

/**
 * A part acknowledged by the remote side
 */
struct UploadedChunk {
  int part_number = 0;  // 1-based
  std::string etag;     // Opaque, quotes stripped
  uint64_t size = 0;    // Bytes actually sent

  bool operator==(const UploadedChunk& other) const {
    return part_number == other.part_number && etag == other.etag && size == other.size;
  }
};

/**
 * Durable state of one multipart upload
 */
struct UploadSession {
  std::string project_id;
  std::string upload_id;        // Placeholder ("pending-...") until initiation succeeds
  std::string destination_key;  // Remote object key
  std::vector<UploadedChunk> parts;
  int next_part_number = 1;     // Hint only; parts is authoritative
  UploadStatus status = UploadStatus::UPLOADING;
  int progress = 0;             // 0-100
  std::chrono::system_clock::time_point started_at;
  std::chrono::system_clock::time_point last_activity;
  uint64_t file_size = 0;
  std::string file_name;
  std::string mime_type;
  uint64_t chunk_size = 0;
  std::string last_error;

  /**
   * Sum of recorded part sizes
   */
  uint64_t uploadedBytes() const;

  /**
   * Number of parts the file splits into with this session's chunk size
   */
  size_t totalParts() const;

  /**
   * Record a part, replacing any earlier record with the same number.
   * Keeps parts sorted and recomputes progress and next_part_number.
   */
  void recordPart(const UploadedChunk& chunk);

  /**
   * Replace all parts (e.g. from a remote listing), normalizing order and duplicates
   */
  void replaceParts(std::vector<UploadedChunk> chunks);

  bool hasPart(int part_number) const;

  /**
   * Recompute progress from recorded parts
   */
  void refreshProgress();

  void touch() { last_activity = std::chrono::system_clock::now(); }
};

/**
 * Percentage of file_size covered by uploaded_bytes, clamped to 0-100.
 * A zero-byte file counts as complete once anything was recorded.
 */
int computeProgress(uint64_t uploaded_bytes, uint64_t file_size, bool any_part_recorded);

/**
 * Sort ascending by part number, keeping the last record for duplicate numbers
 */
std::vector<UploadedChunk> normalizeParts(std::vector<UploadedChunk> chunks);

/**
 * Placeholder upload id used before the backend assigns one
 */
std::string makePendingUploadId(const std::string& project_id);

bool isPendingUploadId(const std::string& upload_id);

/**
 * Chunk size heuristic: 32 MiB above 1 GiB, 16 MiB above 100 MiB, else the default
 */
uint64_t calculateOptimalChunkSize(uint64_t file_size, uint64_t default_chunk_size);

}  // namespace uploader
}  // namespace tessera

#endif  // TESSERA_UPLOAD_SESSION_HPP
