// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_UPLOAD_ERRORS_HPP
#define TESSERA_UPLOAD_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace tessera {
namespace uploader {

/**
 * Error classification shared by exceptions, command results and error events.
 */
enum class ErrorCode {
  NONE,
  NETWORK,             // Connection-level failure (resolve, connect, reset)
  TIMEOUT,             // Request exceeded its deadline
  CANCELLED,           // Cooperative cancellation, not a failure
  INITIATION,          // Backend refused to open a transfer
  PART_UPLOAD,         // A part could not be uploaded
  COMPLETION,          // Backend refused to finalize
  ABORT,               // Backend refused to abort
  VALIDATION,          // Bad input (file mismatch, malformed plan)
  STORAGE,             // Local persistence failure
  RESUME,              // Resumption impossible or reconciliation failed
  INVALID_STATE,       // Command not valid in the session's current state
  RESUME_IN_PROGRESS,  // A concurrent resume for the same project is running
};

inline std::string errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::NONE:
      return "";
    case ErrorCode::NETWORK:
      return "NETWORK_ERROR";
    case ErrorCode::TIMEOUT:
      return "TIMEOUT";
    case ErrorCode::CANCELLED:
      return "UPLOAD_CANCELLED";
    case ErrorCode::INITIATION:
      return "UPLOAD_INIT_FAILED";
    case ErrorCode::PART_UPLOAD:
      return "CHUNK_UPLOAD_FAILED";
    case ErrorCode::COMPLETION:
      return "UPLOAD_COMPLETE_FAILED";
    case ErrorCode::ABORT:
      return "UPLOAD_CANCEL_FAILED";
    case ErrorCode::VALIDATION:
      return "VALIDATION_ERROR";
    case ErrorCode::STORAGE:
      return "STORAGE_ERROR";
    case ErrorCode::RESUME:
      return "RESUME_FAILED";
    case ErrorCode::INVALID_STATE:
      return "INVALID_STATE";
    case ErrorCode::RESUME_IN_PROGRESS:
      return "RESUME_IN_PROGRESS";
  }
  return "UNKNOWN";
}

/**
 * Base class of every error raised inside the uploader.
 */
class UploadError : public std::runtime_error {
public:
  UploadError(
    ErrorCode code, const std::string& message, bool retryable = false, int http_status = 0,
    int part_number = 0
  )
      : std::runtime_error(message)
      , code_(code)
      , retryable_(retryable)
      , http_status_(http_status)
      , part_number_(part_number) {}

  ErrorCode code() const { return code_; }
  bool retryable() const { return retryable_; }

  // HTTP status that caused the error, 0 when no response was received
  int httpStatus() const { return http_status_; }

  // Part the error refers to, 0 when not part-specific
  int partNumber() const { return part_number_; }

private:
  ErrorCode code_;
  bool retryable_;
  int http_status_;
  int part_number_;
};

class NetworkError : public UploadError {
public:
  explicit NetworkError(const std::string& message)
      : UploadError(ErrorCode::NETWORK, message, true) {}
};

class TimeoutError : public UploadError {
public:
  explicit TimeoutError(const std::string& message)
      : UploadError(ErrorCode::TIMEOUT, message, true) {}
};

/**
 * Raised when a cancellation token fires. Control flow, never retried.
 */
class CancellationError : public UploadError {
public:
  explicit CancellationError(const std::string& message = "Upload cancelled")
      : UploadError(ErrorCode::CANCELLED, message, false) {}
};

class InitiationError : public UploadError {
public:
  explicit InitiationError(const std::string& message, int http_status = 0)
      : UploadError(ErrorCode::INITIATION, message, false, http_status) {}
};

class PartUploadError : public UploadError {
public:
  PartUploadError(
    const std::string& message, bool retryable, int http_status = 0, int part_number = 0
  )
      : UploadError(ErrorCode::PART_UPLOAD, message, retryable, http_status, part_number) {}
};

class CompletionError : public UploadError {
public:
  explicit CompletionError(const std::string& message, int http_status = 0)
      : UploadError(ErrorCode::COMPLETION, message, false, http_status) {}
};

class AbortError : public UploadError {
public:
  explicit AbortError(const std::string& message, int http_status = 0)
      : UploadError(ErrorCode::ABORT, message, false, http_status) {}
};

class ValidationError : public UploadError {
public:
  explicit ValidationError(const std::string& message)
      : UploadError(ErrorCode::VALIDATION, message, false) {}
};

class StorageError : public UploadError {
public:
  explicit StorageError(const std::string& message)
      : UploadError(ErrorCode::STORAGE, message, false) {}
};

class ResumeError : public UploadError {
public:
  explicit ResumeError(const std::string& message, int http_status = 0)
      : UploadError(ErrorCode::RESUME, message, false, http_status) {}
};

class InvalidStateError : public UploadError {
public:
  explicit InvalidStateError(const std::string& message)
      : UploadError(ErrorCode::INVALID_STATE, message, false) {}
};

/**
 * Whether an HTTP status is worth retrying: 5xx and 429.
 * Any other non-2xx status is permanent.
 */
inline bool isRetryableHttpStatus(int status) {
  return status == 429 || (status >= 500 && status < 600);
}

/**
 * Remove URLs and signed query parameters from a message before it leaves the engine.
 */
std::string sanitizeErrorMessage(const std::string& message);

}  // namespace uploader
}  // namespace tessera

#endif  // TESSERA_UPLOAD_ERRORS_HPP
