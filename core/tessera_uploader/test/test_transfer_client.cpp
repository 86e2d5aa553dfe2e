// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for HttpTransferClient against a mocked HttpClient
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "transfer_client.hpp"
#include "upload_errors.hpp"
#include "uploader_mocks.hpp"

using namespace tessera::uploader;
using namespace tessera::uploader::test;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;
using json = nlohmann::json;

class TransferClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    http_ = std::make_shared<MockHttpClient>();
    TransferClientConfig config;
    config.api_base_url = "https://api.example.com/api/upload/";
    config.auth_token = "secret-token";
    config.project_complete_url = "https://api.example.com/api/projects/complete";
    client_ = std::make_unique<HttpTransferClient>(config, http_);
  }

  std::shared_ptr<MockHttpClient> http_;
  std::unique_ptr<HttpTransferClient> client_;
};

// ============================================================================
// initiateTransfer
// ============================================================================

TEST_F(TransferClientTest, InitiateParsesEnvelope) {
  HttpRequest sent;
  EXPECT_CALL(*http_, send(_, _, _))
    .WillOnce(DoAll(
      SaveArg<0>(&sent),
      Return(makeResponse(
        200,
        R"({"success":true,"data":{"uploadId":"up-1","key":"projects/p1/a.bin",)"
        R"("presignedUrls":["u1","u2"],"chunkSize":4096}})"
      ))
    ));

  InitiateRequest request;
  request.file_name = "a.bin";
  request.file_size = 8000;
  request.project_id = "p1";
  request.mime_type = "application/octet-stream";
  auto result = client_->initiateTransfer(request);

  EXPECT_EQ(result.upload_id, "up-1");
  EXPECT_EQ(result.destination_key, "projects/p1/a.bin");
  EXPECT_EQ(result.part_urls, (std::vector<std::string>{"u1", "u2"}));
  EXPECT_EQ(result.chunk_size, 4096u);

  EXPECT_EQ(sent.method, "POST");
  EXPECT_EQ(sent.url, "https://api.example.com/api/upload/initiate");
  EXPECT_EQ(sent.headers["Authorization"], "Bearer secret-token");
  EXPECT_EQ(sent.headers["Content-Type"], "application/json");

  auto body = json::parse(sent.body);
  EXPECT_EQ(body["fileName"], "a.bin");
  EXPECT_EQ(body["fileSize"], 8000);
  EXPECT_EQ(body["projectId"], "p1");
  EXPECT_EQ(body["mimeType"], "application/octet-stream");
}

TEST_F(TransferClientTest, InitiateAcceptsBareObjectAndS3Key) {
  EXPECT_CALL(*http_, send(_, _, _))
    .WillOnce(Return(makeResponse(
      200, R"({"uploadId":"up-2","s3Key":"k/b.bin","presignedUrls":["u1"]})"
    )));

  auto result = client_->initiateTransfer(InitiateRequest{"b.bin", 10, "p1", ""});
  EXPECT_EQ(result.upload_id, "up-2");
  EXPECT_EQ(result.destination_key, "k/b.bin");
  EXPECT_EQ(result.chunk_size, 0u);
}

TEST_F(TransferClientTest, InitiateServerErrorCarriesMessage) {
  EXPECT_CALL(*http_, send(_, _, _))
    .WillOnce(Return(makeResponse(403, R"({"message":"Project is locked"})")));

  try {
    client_->initiateTransfer(InitiateRequest{"a.bin", 10, "p1", ""});
    FAIL() << "Expected InitiationError";
  } catch (const InitiationError& e) {
    EXPECT_EQ(e.code(), ErrorCode::INITIATION);
    EXPECT_EQ(e.httpStatus(), 403);
    EXPECT_NE(std::string(e.what()).find("Project is locked"), std::string::npos);
  }
}

TEST_F(TransferClientTest, InitiateEnvelopeFailure) {
  EXPECT_CALL(*http_, send(_, _, _))
    .WillOnce(Return(makeResponse(200, R"({"success":false,"message":"Quota exceeded"})")));

  EXPECT_THROW(
    client_->initiateTransfer(InitiateRequest{"a.bin", 10, "p1", ""}), InitiationError
  );
}

TEST_F(TransferClientTest, InitiateMissingFields) {
  EXPECT_CALL(*http_, send(_, _, _))
    .WillOnce(Return(makeResponse(200, R"({"uploadId":"up-1","key":"k"})")));

  EXPECT_THROW(
    client_->initiateTransfer(InitiateRequest{"a.bin", 10, "p1", ""}), InitiationError
  );
}

TEST_F(TransferClientTest, InitiateMalformedBody) {
  EXPECT_CALL(*http_, send(_, _, _)).WillOnce(Return(makeResponse(200, "<html>oops</html>")));

  EXPECT_THROW(
    client_->initiateTransfer(InitiateRequest{"a.bin", 10, "p1", ""}), InitiationError
  );
}

TEST_F(TransferClientTest, InitiateReplacesInvalidUtf8InFileName) {
  HttpRequest sent;
  EXPECT_CALL(*http_, send(_, _, _))
    .WillOnce(DoAll(
      SaveArg<0>(&sent),
      Return(makeResponse(200, R"({"uploadId":"up-3","key":"k/c.bin","presignedUrls":["u1"]})"))
    ));

  // Linux file names are bytes, not necessarily UTF-8
  auto result = client_->initiateTransfer(InitiateRequest{"bad\xff\xfename.bin", 10, "p1", ""});
  EXPECT_EQ(result.upload_id, "up-3");

  auto body = json::parse(sent.body);
  EXPECT_EQ(body["fileName"], "bad\xef\xbf\xbd\xef\xbf\xbdname.bin");
}

TEST_F(TransferClientTest, InitiateTransportErrorIsWrapped) {
  EXPECT_CALL(*http_, send(_, _, _)).WillOnce(Throw(NetworkError("connection refused")));

  try {
    client_->initiateTransfer(InitiateRequest{"a.bin", 10, "p1", ""});
    FAIL() << "Expected InitiationError";
  } catch (const InitiationError& e) {
    EXPECT_NE(std::string(e.what()).find("connection refused"), std::string::npos);
  }
}

// ============================================================================
// uploadPart
// ============================================================================

TEST_F(TransferClientTest, UploadPartReturnsUnquotedEtag) {
  HttpRequest sent;
  std::chrono::milliseconds timeout{0};
  EXPECT_CALL(*http_, send(_, _, _))
    .WillOnce(DoAll(
      SaveArg<0>(&sent), SaveArg<1>(&timeout), Return(makeResponse(200, "", "\"abc123\""))
    ));

  auto result = client_->uploadPart(
    "https://s3/part-1?X-Amz-Signature=x", "payload", std::chrono::milliseconds(1500),
    CancellationToken{}
  );

  EXPECT_EQ(result.etag, "abc123");
  EXPECT_EQ(result.bytes_sent, 7u);
  EXPECT_EQ(sent.method, "PUT");
  EXPECT_EQ(sent.body, "payload");
  EXPECT_EQ(timeout.count(), 1500);
  // Pre-signed URLs carry their own credentials
  EXPECT_EQ(sent.headers.count("Authorization"), 0u);
}

TEST_F(TransferClientTest, UploadPartServerErrorIsRetryable) {
  EXPECT_CALL(*http_, send(_, _, _)).WillOnce(Return(makeResponse(503, "")));

  try {
    client_->uploadPart("https://s3/p", "x", std::chrono::milliseconds(100), CancellationToken{});
    FAIL() << "Expected PartUploadError";
  } catch (const PartUploadError& e) {
    EXPECT_TRUE(e.retryable());
    EXPECT_EQ(e.httpStatus(), 503);
  }
}

TEST_F(TransferClientTest, UploadPartForbiddenIsPermanent) {
  EXPECT_CALL(*http_, send(_, _, _)).WillOnce(Return(makeResponse(403, "")));

  try {
    client_->uploadPart("https://s3/p", "x", std::chrono::milliseconds(100), CancellationToken{});
    FAIL() << "Expected PartUploadError";
  } catch (const PartUploadError& e) {
    EXPECT_FALSE(e.retryable());
  }
}

TEST_F(TransferClientTest, UploadPartMissingEtag) {
  EXPECT_CALL(*http_, send(_, _, _)).WillOnce(Return(makeResponse(200, "")));

  EXPECT_THROW(
    client_->uploadPart("https://s3/p", "x", std::chrono::milliseconds(100), CancellationToken{}),
    PartUploadError
  );
}

TEST_F(TransferClientTest, UploadPartPropagatesTransportErrors) {
  EXPECT_CALL(*http_, send(_, _, _)).WillOnce(Throw(TimeoutError("Request timed out during read")));

  EXPECT_THROW(
    client_->uploadPart("https://s3/p", "x", std::chrono::milliseconds(100), CancellationToken{}),
    TimeoutError
  );
}

// ============================================================================
// listUploadedParts / getUploadDetails
// ============================================================================

TEST_F(TransferClientTest, ListPartsNormalizes) {
  HttpRequest sent;
  EXPECT_CALL(*http_, send(_, _, _))
    .WillOnce(DoAll(
      SaveArg<0>(&sent),
      Return(makeResponse(
        200,
        R"({"success":true,"data":{"parts":[)"
        R"({"partNumber":3,"etag":"\"e3\"","size":10},)"
        R"({"partNumber":1,"etag":"e1","size":20},)"
        R"({"partNumber":3,"etag":"e3b","size":10}]}})"
      ))
    ));

  auto parts = client_->listUploadedParts("k/a.bin", "up-1");

  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0], (UploadedChunk{1, "e1", 20}));
  EXPECT_EQ(parts[1], (UploadedChunk{3, "e3b", 10}));

  EXPECT_EQ(sent.url, "https://api.example.com/api/upload/list-parts");
  auto body = json::parse(sent.body);
  EXPECT_EQ(body["key"], "k/a.bin");
  EXPECT_EQ(body["uploadId"], "up-1");
}

TEST_F(TransferClientTest, ListPartsEmpty) {
  EXPECT_CALL(*http_, send(_, _, _))
    .WillOnce(Return(makeResponse(200, R"({"success":true,"data":{"parts":[]}})")));

  EXPECT_TRUE(client_->listUploadedParts("k", "up-1").empty());
}

TEST_F(TransferClientTest, ListPartsMalformed) {
  EXPECT_CALL(*http_, send(_, _, _))
    .WillOnce(Return(makeResponse(200, R"({"parts":[{"partNumber":"one"}]})")));

  EXPECT_THROW(client_->listUploadedParts("k", "up-1"), ResumeError);
}

TEST_F(TransferClientTest, GetUploadDetailsFallsBackToKey) {
  EXPECT_CALL(*http_, send(_, _, _))
    .WillOnce(Return(makeResponse(
      200, R"({"success":true,"data":{"uploadId":"up-1","presignedUrls":["u1","u2"]}})"
    )));

  auto details = client_->getUploadDetails("p1", "k/a.bin");
  EXPECT_EQ(details.upload_id, "up-1");
  EXPECT_EQ(details.destination_key, "k/a.bin");
  EXPECT_EQ(details.part_urls.size(), 2u);
}

TEST_F(TransferClientTest, GetUploadDetailsWithoutUrls) {
  EXPECT_CALL(*http_, send(_, _, _))
    .WillOnce(Return(makeResponse(200, R"({"uploadId":"up-1","presignedUrls":[]})")));

  EXPECT_THROW(client_->getUploadDetails("p1", "k"), ResumeError);
}

// ============================================================================
// completeTransfer / abortTransfer / notifyProjectComplete
// ============================================================================

TEST_F(TransferClientTest, CompleteSendsPartsInOrderGiven) {
  HttpRequest sent;
  EXPECT_CALL(*http_, send(_, _, _))
    .WillOnce(DoAll(
      SaveArg<0>(&sent), Return(makeResponse(200, R"({"success":true,"data":{"key":"final/a"}})"))
    ));

  std::vector<UploadedChunk> parts = {{1, "e1", 4096}, {2, "e2", 4096}, {3, "e3", 1808}};
  EXPECT_EQ(client_->completeTransfer("k/a", "up-1", parts), "final/a");

  auto body = json::parse(sent.body);
  EXPECT_EQ(body["key"], "k/a");
  EXPECT_EQ(body["uploadId"], "up-1");
  ASSERT_EQ(body["parts"].size(), 3u);
  EXPECT_EQ(body["parts"][0]["partNumber"], 1);
  EXPECT_EQ(body["parts"][2]["etag"], "e3");
  EXPECT_EQ(body["parts"][2]["size"], 1808);
}

TEST_F(TransferClientTest, CompleteWithoutKeyUsesDestination) {
  EXPECT_CALL(*http_, send(_, _, _)).WillOnce(Return(makeResponse(200, R"({"success":true})")));

  EXPECT_EQ(client_->completeTransfer("k/a", "up-1", {{1, "e1", 1}}), "k/a");
}

TEST_F(TransferClientTest, CompleteFailure) {
  EXPECT_CALL(*http_, send(_, _, _))
    .WillOnce(Return(makeResponse(400, R"({"error":"InvalidPart"})")));

  try {
    client_->completeTransfer("k/a", "up-1", {{1, "e1", 1}});
    FAIL() << "Expected CompletionError";
  } catch (const CompletionError& e) {
    EXPECT_NE(std::string(e.what()).find("InvalidPart"), std::string::npos);
  }
}

TEST_F(TransferClientTest, AbortReportsOutcome) {
  EXPECT_CALL(*http_, send(_, _, _))
    .WillOnce(Return(makeResponse(200, R"({"success":true})")))
    .WillOnce(Return(makeResponse(500, "")))
    .WillOnce(Throw(NetworkError("reset")));

  EXPECT_TRUE(client_->abortTransfer("k", "up-1"));
  EXPECT_FALSE(client_->abortTransfer("k", "up-1"));
  EXPECT_FALSE(client_->abortTransfer("k", "up-1"));
}

TEST_F(TransferClientTest, NotifyProjectComplete) {
  HttpRequest sent;
  EXPECT_CALL(*http_, send(_, _, _))
    .WillOnce(DoAll(SaveArg<0>(&sent), Return(makeResponse(200, "{}"))))
    .WillOnce(Throw(NetworkError("reset")));

  EXPECT_TRUE(client_->notifyProjectComplete("p1"));
  EXPECT_EQ(sent.url, "https://api.example.com/api/projects/complete");
  EXPECT_EQ(json::parse(sent.body)["projectId"], "p1");

  EXPECT_FALSE(client_->notifyProjectComplete("p1"));
}

TEST(TransferClientNoNotifyTest, NotifyDisabledWithoutUrl) {
  auto http = std::make_shared<MockHttpClient>();
  EXPECT_CALL(*http, send(_, _, _)).Times(0);

  TransferClientConfig config;
  config.api_base_url = "https://api.example.com";
  HttpTransferClient client(config, http);
  EXPECT_TRUE(client.notifyProjectComplete("p1"));
}

TEST(StripEtagQuotesTest, Variants) {
  EXPECT_EQ(stripEtagQuotes("\"abc\""), "abc");
  EXPECT_EQ(stripEtagQuotes("abc"), "abc");
  EXPECT_EQ(stripEtagQuotes("W/\"abc\""), "abc");
  EXPECT_EQ(stripEtagQuotes("\""), "\"");
  EXPECT_EQ(stripEtagQuotes(""), "");
}
