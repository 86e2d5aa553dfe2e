// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_TRANSFER_CLIENT_HPP
#define TESSERA_TRANSFER_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "cancellation_token.hpp"
#include "http_client.hpp"
#include "upload_session.hpp"

namespace tessera {
namespace uploader {

struct InitiateRequest {
  std::string file_name;
  uint64_t file_size = 0;
  std::string project_id;
  std::string mime_type;
};

/**
 * An open multipart transfer as returned by the backend
 */
struct TransferInitiation {
  std::string upload_id;
  std::string destination_key;
  std::vector<std::string> part_urls;  // part_urls[i] is the pre-signed URL of part i + 1
  uint64_t chunk_size = 0;             // 0 when the backend does not dictate one
};

struct PartUploadResult {
  std::string etag;
  uint64_t bytes_sent = 0;
};

/**
 * Wire-level operations against the upload coordination backend
 *
 * Implementations are called concurrently from scheduler workers and must be
 * thread-safe. Errors are raised as UploadError subclasses.
 */
class TransferClient {
public:
  virtual ~TransferClient() = default;

  /**
   * Open a multipart transfer
   * @throws InitiationError on non-2xx status or malformed response
   */
  virtual TransferInitiation initiateTransfer(const InitiateRequest& request) = 0;

  /**
   * Fresh pre-signed URLs for an existing transfer
   * @throws ResumeError if the backend has no such transfer
   */
  virtual TransferInitiation getUploadDetails(
    const std::string& project_id, const std::string& destination_key
  ) = 0;

  /**
   * PUT one part to its pre-signed URL
   *
   * @throws PartUploadError for HTTP failures (retryable for 5xx and 429)
   * @throws NetworkError, TimeoutError, CancellationError from the transport
   */
  virtual PartUploadResult uploadPart(
    const std::string& url, const std::string& data, std::chrono::milliseconds timeout,
    const CancellationToken& token
  ) = 0;

  /**
   * Parts the backend already holds, sorted ascending
   * @throws ResumeError on failure
   */
  virtual std::vector<UploadedChunk> listUploadedParts(
    const std::string& destination_key, const std::string& upload_id
  ) = 0;

  /**
   * Finalize the transfer. Parts are sent exactly as given.
   *
   * @return Final object key
   * @throws CompletionError on failure
   */
  virtual std::string completeTransfer(
    const std::string& destination_key, const std::string& upload_id,
    const std::vector<UploadedChunk>& parts
  ) = 0;

  /**
   * Best effort abort. Never throws.
   */
  virtual bool abortTransfer(const std::string& destination_key, const std::string& upload_id) = 0;

  /**
   * Best effort project completion notification. Never throws.
   */
  virtual bool notifyProjectComplete(const std::string& project_id) = 0;
};

struct TransferClientConfig {
  std::string api_base_url;          // e.g. https://api.example.com/api/upload
  std::string auth_token;            // Bearer token, empty for none
  std::string project_complete_url;  // Empty disables notifyProjectComplete
  std::chrono::milliseconds request_timeout{30000};  // Control-plane calls
};

/**
 * TransferClient speaking the JSON backend protocol over an HttpClient
 *
 * Control-plane calls POST camelCase JSON to {api_base_url}/<operation> and
 * accept either the {"success", "message", "data"} envelope or a bare object.
 */
class HttpTransferClient : public TransferClient {
public:
  HttpTransferClient(const TransferClientConfig& config, std::shared_ptr<HttpClient> http);

  TransferInitiation initiateTransfer(const InitiateRequest& request) override;

  TransferInitiation getUploadDetails(
    const std::string& project_id, const std::string& destination_key
  ) override;

  PartUploadResult uploadPart(
    const std::string& url, const std::string& data, std::chrono::milliseconds timeout,
    const CancellationToken& token
  ) override;

  std::vector<UploadedChunk> listUploadedParts(
    const std::string& destination_key, const std::string& upload_id
  ) override;

  std::string completeTransfer(
    const std::string& destination_key, const std::string& upload_id,
    const std::vector<UploadedChunk>& parts
  ) override;

  bool abortTransfer(const std::string& destination_key, const std::string& upload_id) override;

  bool notifyProjectComplete(const std::string& project_id) override;

  const TransferClientConfig& config() const { return config_; }

private:
  /**
   * POST a JSON body, returning the raw response
   */
  HttpResponse postJson(const std::string& url, const std::string& body);

  std::string endpoint(const char* operation) const;

  TransferClientConfig config_;
  std::shared_ptr<HttpClient> http_;
};

/**
 * Remove surrounding double quotes from an ETag value
 */
std::string stripEtagQuotes(const std::string& etag);

}  // namespace uploader
}  // namespace tessera

#endif  // TESSERA_TRANSFER_CLIENT_HPP
