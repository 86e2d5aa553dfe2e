// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_session.hpp"

#include <algorithm>
#include <atomic>
#include <map>

namespace tessera {
namespace uploader {

namespace {
constexpr const char* kPendingPrefix = "pending-";
constexpr uint64_t kMiB = 1024ULL * 1024ULL;
}  // namespace

uint64_t UploadSession::uploadedBytes() const {
  uint64_t total = 0;
  for (const auto& part : parts) {
    total += part.size;
  }
  return total;
}

size_t UploadSession::totalParts() const {
  if (chunk_size == 0) {
    return 0;
  }
  if (file_size == 0) {
    return 1;
  }
  return static_cast<size_t>((file_size + chunk_size - 1) / chunk_size);
}

void UploadSession::recordPart(const UploadedChunk& chunk) {
  auto it = std::lower_bound(
    parts.begin(), parts.end(), chunk.part_number,
    [](const UploadedChunk& p, int number) { return p.part_number < number; }
  );
  if (it != parts.end() && it->part_number == chunk.part_number) {
    *it = chunk;
  } else {
    parts.insert(it, chunk);
  }
  next_part_number = std::max(next_part_number, chunk.part_number + 1);
  refreshProgress();
}

void UploadSession::replaceParts(std::vector<UploadedChunk> chunks) {
  parts = normalizeParts(std::move(chunks));
  next_part_number = parts.empty() ? 1 : parts.back().part_number + 1;
  refreshProgress();
}

bool UploadSession::hasPart(int part_number) const {
  return std::binary_search(
    parts.begin(), parts.end(), UploadedChunk{part_number, "", 0},
    [](const UploadedChunk& a, const UploadedChunk& b) { return a.part_number < b.part_number; }
  );
}

void UploadSession::refreshProgress() {
  progress = computeProgress(uploadedBytes(), file_size, !parts.empty());
}

int computeProgress(uint64_t uploaded_bytes, uint64_t file_size, bool any_part_recorded) {
  if (file_size == 0) {
    return any_part_recorded ? 100 : 0;
  }
  if (uploaded_bytes >= file_size) {
    return 100;
  }
  // Floor, so 100 is reported only once every byte is recorded
  return static_cast<int>((uploaded_bytes * 100) / file_size);
}

std::vector<UploadedChunk> normalizeParts(std::vector<UploadedChunk> chunks) {
  std::map<int, UploadedChunk> by_number;
  for (auto& chunk : chunks) {
    if (chunk.part_number <= 0) {
      continue;
    }
    by_number[chunk.part_number] = std::move(chunk);
  }

  std::vector<UploadedChunk> result;
  result.reserve(by_number.size());
  for (auto& entry : by_number) {
    result.push_back(std::move(entry.second));
  }
  return result;
}

std::string makePendingUploadId(const std::string& project_id) {
  static std::atomic<uint64_t> counter{0};
  auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch()
  )
                  .count();
  return std::string(kPendingPrefix) + project_id + "-" + std::to_string(now_ms) + "-" +
         std::to_string(++counter);
}

bool isPendingUploadId(const std::string& upload_id) {
  return upload_id.rfind(kPendingPrefix, 0) == 0;
}

uint64_t calculateOptimalChunkSize(uint64_t file_size, uint64_t default_chunk_size) {
  if (file_size > 1024 * kMiB) {
    return 32 * kMiB;
  }
  if (file_size > 100 * kMiB) {
    return 16 * kMiB;
  }
  return default_chunk_size;
}

}  // namespace uploader
}  // namespace tessera
