// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_client.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

#include "upload_errors.hpp"

#define TESSERA_LOG_COMPONENT "transfer_client"
#include <tessera_log_macros.hpp>

namespace tessera {
namespace uploader {

using json = nlohmann::json;
using logging::kv;

namespace {

/**
 * A 2xx response whose payload does not have the expected shape
 */
class MalformedResponse : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

std::string stringField(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return "";
  }
  return it->get<std::string>();
}

/**
 * Unwrap the backend envelope of a response
 *
 * @param payload Receives "data" of the envelope, or the whole body when unwrapped
 * @param error Receives the reason on failure
 * @return true for a 2xx response whose envelope does not report failure
 */
bool extractPayload(const HttpResponse& res, json& payload, std::string& error) {
  json body = json::parse(res.body, nullptr, false);

  if (!res.ok()) {
    error = "Server returned status " + std::to_string(res.status_code);
    if (!body.is_discarded() && body.is_object()) {
      std::string message = stringField(body, "message");
      if (message.empty()) {
        message = stringField(body, "error");
      }
      if (!message.empty()) {
        error += ": " + message;
      }
    }
    return false;
  }

  if (body.is_discarded() || !body.is_object()) {
    error = "Malformed response body";
    return false;
  }

  auto success = body.find("success");
  if (success != body.end() && success->is_boolean() && !success->get<bool>()) {
    error = stringField(body, "message");
    if (error.empty()) {
      error = "Request rejected by server";
    }
    return false;
  }

  auto data = body.find("data");
  payload = (data != body.end() && !data->is_null()) ? *data : body;
  return true;
}

/**
 * Read {uploadId, key|s3Key, presignedUrls[], chunkSize} from a payload
 *
 * @throws MalformedResponse on type mismatches
 */
TransferInitiation parseInitiation(const json& payload, const std::string& fallback_key) {
  if (!payload.is_object()) {
    throw MalformedResponse("response data is not an object");
  }

  TransferInitiation result;
  result.upload_id = stringField(payload, "uploadId");
  result.destination_key = stringField(payload, "key");
  if (result.destination_key.empty()) {
    result.destination_key = stringField(payload, "s3Key");
  }
  if (result.destination_key.empty()) {
    result.destination_key = fallback_key;
  }

  auto urls = payload.find("presignedUrls");
  if (urls != payload.end() && urls->is_array()) {
    for (const auto& url : *urls) {
      if (!url.is_string()) {
        throw MalformedResponse("presignedUrls contains a non-string entry");
      }
      result.part_urls.push_back(url.get<std::string>());
    }
  }

  auto chunk = payload.find("chunkSize");
  if (chunk != payload.end() && chunk->is_number_unsigned()) {
    result.chunk_size = chunk->get<uint64_t>();
  }
  return result;
}

std::vector<UploadedChunk> parseParts(const json& payload) {
  const json* parts = &payload;
  if (payload.is_object()) {
    auto it = payload.find("parts");
    if (it == payload.end() || it->is_null()) {
      return {};
    }
    parts = &(*it);
  }
  if (!parts->is_array()) {
    throw MalformedResponse("parts is not an array");
  }

  std::vector<UploadedChunk> result;
  try {
    for (const auto& item : *parts) {
      UploadedChunk chunk;
      chunk.part_number = item.at("partNumber").get<int>();
      chunk.etag = stripEtagQuotes(item.at("etag").get<std::string>());
      auto size = item.find("size");
      if (size != item.end() && size->is_number_unsigned()) {
        chunk.size = size->get<uint64_t>();
      }
      result.push_back(std::move(chunk));
    }
  } catch (const json::exception& e) {
    throw MalformedResponse(e.what());
  }
  return normalizeParts(std::move(result));
}

// File names are arbitrary bytes on Linux; invalid UTF-8 becomes U+FFFD
std::string toJsonText(const json& body) {
  return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace

std::string stripEtagQuotes(const std::string& etag) {
  std::string result = etag;
  // Weak validators keep their W/ prefix out of the stored value
  if (result.rfind("W/", 0) == 0) {
    result = result.substr(2);
  }
  if (result.size() >= 2 && result.front() == '"' && result.back() == '"') {
    result = result.substr(1, result.size() - 2);
  }
  return result;
}

HttpTransferClient::HttpTransferClient(
  const TransferClientConfig& config, std::shared_ptr<HttpClient> http
)
    : config_(config)
    , http_(std::move(http)) {
  while (!config_.api_base_url.empty() && config_.api_base_url.back() == '/') {
    config_.api_base_url.pop_back();
  }
}

std::string HttpTransferClient::endpoint(const char* operation) const {
  return config_.api_base_url + "/" + operation;
}

HttpResponse HttpTransferClient::postJson(const std::string& url, const std::string& body) {
  HttpRequest req;
  req.method = "POST";
  req.url = url;
  req.headers["Content-Type"] = "application/json";
  if (!config_.auth_token.empty()) {
    req.headers["Authorization"] = "Bearer " + config_.auth_token;
  }
  req.body = body;
  return http_->send(req, config_.request_timeout, CancellationToken{});
}

TransferInitiation HttpTransferClient::initiateTransfer(const InitiateRequest& request) {
  json body = {
    {"fileName", request.file_name},
    {"fileSize", request.file_size},
    {"projectId", request.project_id},
    {"mimeType", request.mime_type},
  };

  HttpResponse res;
  try {
    res = postJson(endpoint("initiate"), toJsonText(body));
  } catch (const UploadError& e) {
    throw InitiationError(std::string("Failed to initiate upload: ") + e.what());
  }

  json payload;
  std::string error;
  if (!extractPayload(res, payload, error)) {
    throw InitiationError("Failed to initiate upload: " + error, res.status_code);
  }

  TransferInitiation result;
  try {
    result = parseInitiation(payload, "");
  } catch (const MalformedResponse& e) {
    throw InitiationError(std::string("Malformed initiate response: ") + e.what(), res.status_code);
  }

  if (result.upload_id.empty() || result.destination_key.empty() || result.part_urls.empty()) {
    throw InitiationError("Initiate response is missing uploadId, key or presignedUrls");
  }

  TESSERA_LOG_INFO(
    "Transfer initiated" << kv("project_id", request.project_id)
                         << kv("upload_id", result.upload_id)
                         << kv("parts", result.part_urls.size())
                         << kv("chunk_size", result.chunk_size)
  );
  return result;
}

TransferInitiation HttpTransferClient::getUploadDetails(
  const std::string& project_id, const std::string& destination_key
) {
  json body = {{"projectId", project_id}, {"key", destination_key}};

  HttpResponse res;
  try {
    res = postJson(endpoint("get-upload-details"), toJsonText(body));
  } catch (const UploadError& e) {
    throw ResumeError(std::string("Failed to get upload details: ") + e.what());
  }

  json payload;
  std::string error;
  if (!extractPayload(res, payload, error)) {
    throw ResumeError("Failed to get upload details: " + error, res.status_code);
  }

  TransferInitiation result;
  try {
    result = parseInitiation(payload, destination_key);
  } catch (const MalformedResponse& e) {
    throw ResumeError(std::string("Malformed upload details: ") + e.what(), res.status_code);
  }
  if (result.part_urls.empty()) {
    throw ResumeError("Upload details contain no presigned URLs", res.status_code);
  }
  return result;
}

PartUploadResult HttpTransferClient::uploadPart(
  const std::string& url, const std::string& data, std::chrono::milliseconds timeout,
  const CancellationToken& token
) {
  HttpRequest req;
  req.method = "PUT";
  req.url = url;
  req.headers["Content-Type"] = "application/octet-stream";
  req.body = data;

  HttpResponse res = http_->send(req, timeout, token);

  if (!res.ok()) {
    bool retryable = isRetryableHttpStatus(res.status_code);
    throw PartUploadError(
      "Part upload failed with status " + std::to_string(res.status_code), retryable,
      res.status_code
    );
  }

  std::string etag = stripEtagQuotes(res.header("ETag"));
  if (etag.empty()) {
    throw PartUploadError("Part upload response has no ETag header", false, res.status_code);
  }

  PartUploadResult result;
  result.etag = std::move(etag);
  result.bytes_sent = data.size();
  return result;
}

std::vector<UploadedChunk> HttpTransferClient::listUploadedParts(
  const std::string& destination_key, const std::string& upload_id
) {
  json body = {{"key", destination_key}, {"uploadId", upload_id}};

  HttpResponse res;
  try {
    res = postJson(endpoint("list-parts"), toJsonText(body));
  } catch (const UploadError& e) {
    throw ResumeError(std::string("Failed to list uploaded parts: ") + e.what());
  }

  json payload;
  std::string error;
  if (!extractPayload(res, payload, error)) {
    throw ResumeError("Failed to list uploaded parts: " + error, res.status_code);
  }

  try {
    return parseParts(payload);
  } catch (const MalformedResponse& e) {
    throw ResumeError(std::string("Malformed parts listing: ") + e.what(), res.status_code);
  }
}

std::string HttpTransferClient::completeTransfer(
  const std::string& destination_key, const std::string& upload_id,
  const std::vector<UploadedChunk>& parts
) {
  json part_list = json::array();
  for (const auto& part : parts) {
    part_list.push_back({{"partNumber", part.part_number}, {"etag", part.etag}, {"size", part.size}});
  }
  json body = {{"key", destination_key}, {"uploadId", upload_id}, {"parts", part_list}};

  HttpResponse res;
  try {
    res = postJson(endpoint("complete"), toJsonText(body));
  } catch (const UploadError& e) {
    throw CompletionError(std::string("Failed to complete upload: ") + e.what());
  }

  json payload;
  std::string error;
  if (!extractPayload(res, payload, error)) {
    throw CompletionError("Failed to complete upload: " + error, res.status_code);
  }

  std::string final_key = payload.is_object() ? stringField(payload, "key") : "";
  if (final_key.empty()) {
    final_key = destination_key;
  }

  TESSERA_LOG_INFO(
    "Transfer completed" << kv("upload_id", upload_id) << kv("parts", parts.size())
  );
  return final_key;
}

bool HttpTransferClient::abortTransfer(
  const std::string& destination_key, const std::string& upload_id
) {
  json body = {{"key", destination_key}, {"uploadId", upload_id}};

  try {
    HttpResponse res = postJson(endpoint("abort"), toJsonText(body));
    json payload;
    std::string error;
    if (!extractPayload(res, payload, error)) {
      TESSERA_LOG_WARN("Abort rejected" << kv("upload_id", upload_id) << kv("error", error));
      return false;
    }
  } catch (const std::exception& e) {
    TESSERA_LOG_WARN(
      "Abort failed" << kv("upload_id", upload_id)
                     << kv("error", sanitizeErrorMessage(e.what()))
    );
    return false;
  }

  TESSERA_LOG_INFO("Transfer aborted" << kv("upload_id", upload_id));
  return true;
}

bool HttpTransferClient::notifyProjectComplete(const std::string& project_id) {
  if (config_.project_complete_url.empty()) {
    return true;
  }

  json body = {{"projectId", project_id}};
  try {
    HttpResponse res = postJson(config_.project_complete_url, toJsonText(body));
    if (!res.ok()) {
      TESSERA_LOG_WARN(
        "Project completion notification rejected" << kv("project_id", project_id)
                                                   << kv("status", res.status_code)
      );
      return false;
    }
  } catch (const std::exception& e) {
    TESSERA_LOG_WARN(
      "Project completion notification failed" << kv("project_id", project_id)
                                               << kv("error", sanitizeErrorMessage(e.what()))
    );
    return false;
  }
  return true;
}

}  // namespace uploader
}  // namespace tessera
