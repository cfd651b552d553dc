// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for RemoteUploadClient with a mocked HTTP transport
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include <nlohmann/json.hpp>

#include <string>

#include "http_transport.hpp"
#include "remote_upload_client.hpp"
#include "upload_error.hpp"
#include "uploader_mocks.hpp"

using namespace capsule::uploader;
using namespace capsule::uploader::test;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SaveArg;

namespace {

const char* kBase = "https://api.example.com";

std::string multipart(const std::string& suffix) {
  return std::string(kBase) + RemoteUploadClient::kMultipartPath + suffix;
}

bool hasApiKey(const HttpHeaders& headers, const std::string& key) {
  for (const auto& header : headers) {
    if (header.first == "X-API-Key" && header.second == key) {
      return true;
    }
  }
  return false;
}

InitUploadRequest sampleRequest() {
  InitUploadRequest request;
  request.filename = "0123456789abcdef.tar";
  request.total_size_bytes = 42000000;
  request.video_filename = "recording.mp4";
  request.control_filename = "inputs.csv";
  request.video_duration_seconds = 125.5;
  request.uploader_hwid = "hw-1";
  request.upload_timestamp = "2026-01-01T00:00:00Z";
  return request;
}

}  // namespace

class RemoteUploadClientTest : public ::testing::Test {
protected:
  MockHttpTransport transport_;
  // Trailing slashes on the base URL are ignored
  RemoteUploadClient client_{std::string(kBase) + "//", "secret-key", transport_};
};

// ============================================================================
// init
// ============================================================================

TEST_F(RemoteUploadClientTest, InitPostsRequestAndParsesSession) {
  std::string body;
  HttpHeaders headers;
  EXPECT_CALL(transport_, post_json(multipart("/init"), _, _))
    .WillOnce(DoAll(
      SaveArg<1>(&body), SaveArg<2>(&headers),
      Return(makeResponse(
        200,
        R"({"upload_id":"up-1","content_id":"c-1","total_chunks":6,)"
        R"("chunk_size_bytes":8388608,"expires_at":1700003600})"
      ))
    ));

  auto request = sampleRequest();
  request.tags = {"fps"};
  auto session = client_.init_upload(request);

  EXPECT_EQ(client_.base_url(), kBase);
  EXPECT_TRUE(hasApiKey(headers, "secret-key"));
  EXPECT_EQ(session.upload_id, "up-1");
  EXPECT_EQ(session.content_id, "c-1");
  EXPECT_EQ(session.total_chunks, 6u);
  EXPECT_EQ(session.chunk_size_bytes, 8388608u);
  EXPECT_EQ(session.expires_at, 1700003600);

  auto sent = nlohmann::json::parse(body);
  EXPECT_EQ(sent["filename"], "0123456789abcdef.tar");
  EXPECT_EQ(sent["content_type"], "application/x-tar");
  EXPECT_EQ(sent["total_size_bytes"], 42000000);
  EXPECT_EQ(sent["uploader_hwid"], "hw-1");
  EXPECT_EQ(sent["video_width"], 1280);
  EXPECT_EQ(sent["tags"], nlohmann::json::array({"fps"}));
  EXPECT_FALSE(sent.contains("chunk_size_bytes"));
  EXPECT_FALSE(sent.contains("video_codec"));
}

TEST_F(RemoteUploadClientTest, InitErrorIncludesStatusAndDetail) {
  EXPECT_CALL(transport_, post_json(_, _, _))
    .WillOnce(Return(makeResponse(500, R"({"detail":"database unavailable"})")));

  try {
    client_.init_upload(sampleRequest());
    FAIL() << "expected UploadError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), UploadErrorKind::API_APPLICATION);
    EXPECT_FALSE(e.is_network_error());
    EXPECT_EQ(
      std::string(e.what()),
      "Multipart upload initialization failed (500: database unavailable)"
    );
  }
}

TEST_F(RemoteUploadClientTest, InitErrorWithoutDetail) {
  EXPECT_CALL(transport_, post_json(_, _, _)).WillOnce(Return(makeResponse(503, "<html>")));

  try {
    client_.init_upload(sampleRequest());
    FAIL() << "expected UploadError";
  } catch (const UploadError& e) {
    EXPECT_NE(std::string(e.what()).find("(503: unknown error)"), std::string::npos);
  }
}

TEST_F(RemoteUploadClientTest, TransportFailureIsNetworkError) {
  EXPECT_CALL(transport_, post_json(_, _, _))
    .WillOnce(Return(makeNetworkFailure("Connection timed out")));

  try {
    client_.init_upload(sampleRequest());
    FAIL() << "expected UploadError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), UploadErrorKind::API_NETWORK);
    EXPECT_TRUE(e.is_network_error());
    EXPECT_NE(std::string(e.what()).find("Connection timed out"), std::string::npos);
  }
}

TEST_F(RemoteUploadClientTest, MalformedBodyIsSerializationError) {
  EXPECT_CALL(transport_, post_json(_, _, _))
    .WillOnce(Return(makeResponse(200, R"({"upload_id":"up-1"})")));

  try {
    client_.init_upload(sampleRequest());
    FAIL() << "expected UploadError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), UploadErrorKind::SERIALIZATION);
  }
}

TEST_F(RemoteUploadClientTest, EmptySessionIsRejected) {
  EXPECT_CALL(transport_, post_json(_, _, _))
    .WillOnce(Return(makeResponse(
      200,
      R"({"upload_id":"up-1","content_id":"c-1","total_chunks":0,)"
      R"("chunk_size_bytes":8388608,"expires_at":1700003600})"
    )));

  EXPECT_THROW(client_.init_upload(sampleRequest()), UploadError);
}

// ============================================================================
// chunk
// ============================================================================

TEST_F(RemoteUploadClientTest, ChunkUrlRequest) {
  std::string body;
  EXPECT_CALL(transport_, post_json(multipart("/chunk"), _, _))
    .WillOnce(DoAll(
      SaveArg<1>(&body),
      Return(makeResponse(
        200,
        R"({"upload_url":"https://storage.example.com/p4","chunk_number":4,)"
        R"("expires_at":1700003600})"
      ))
    ));

  auto url = client_.request_chunk_url("up-1", 4, "abcd");
  EXPECT_EQ(url.upload_url, "https://storage.example.com/p4");
  EXPECT_EQ(url.chunk_number, 4u);

  auto sent = nlohmann::json::parse(body);
  EXPECT_EQ(sent["upload_id"], "up-1");
  EXPECT_EQ(sent["chunk_number"], 4);
  EXPECT_EQ(sent["chunk_hash"], "abcd");
}

// ============================================================================
// complete
// ============================================================================

TEST_F(RemoteUploadClientTest, CompleteSendsEtags) {
  std::string body;
  EXPECT_CALL(transport_, post_json(multipart("/complete"), _, _))
    .WillOnce(DoAll(
      SaveArg<1>(&body),
      Return(makeResponse(
        200, R"({"success":true,"content_id":"c-1","object_key":"k/c-1.tar","verified":true})"
      ))
    ));

  auto result = client_.complete_upload("up-1", {{1, "e1"}, {2, "e2"}});
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.content_id, "c-1");
  EXPECT_EQ(result.object_key, "k/c-1.tar");
  ASSERT_TRUE(result.verified.has_value());
  EXPECT_TRUE(*result.verified);

  auto sent = nlohmann::json::parse(body);
  EXPECT_EQ(sent["upload_id"], "up-1");
  ASSERT_EQ(sent["chunk_etags"].size(), 2u);
  EXPECT_EQ(sent["chunk_etags"][1]["chunk_number"], 2);
  EXPECT_EQ(sent["chunk_etags"][1]["etag"], "e2");
}

TEST_F(RemoteUploadClientTest, CompleteUnprocessableIsServerInvalidation) {
  EXPECT_CALL(transport_, post_json(_, _, _))
    .WillOnce(Return(makeResponse(422, R"({"detail":"video too short"})")));

  try {
    client_.complete_upload("up-1", {{1, "e1"}});
    FAIL() << "expected UploadError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), UploadErrorKind::SERVER_INVALIDATION);
    EXPECT_EQ(std::string(e.what()), "video too short");
  }
}

TEST_F(RemoteUploadClientTest, CompleteInvalidatedFlag) {
  EXPECT_CALL(transport_, post_json(_, _, _))
    .WillOnce(Return(makeResponse(
      200, R"({"success":false,"invalidated":true,"message":"duplicate content"})"
    )));

  try {
    client_.complete_upload("up-1", {{1, "e1"}});
    FAIL() << "expected UploadError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), UploadErrorKind::SERVER_INVALIDATION);
    EXPECT_EQ(std::string(e.what()), "duplicate content");
  }
}

TEST_F(RemoteUploadClientTest, CompleteNullInvalidatedIsNotInvalidation) {
  EXPECT_CALL(transport_, post_json(_, _, _))
    .WillOnce(Return(makeResponse(
      200,
      R"({"success":true,"content_id":"c1","object_key":"k","message":"ok","invalidated":null})"
    )));

  auto result = client_.complete_upload("up-1", {{1, "e1"}});
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.content_id, "c1");
  EXPECT_EQ(result.object_key, "k");
}

TEST_F(RemoteUploadClientTest, CompleteNonBooleanSuccessIsSerializationError) {
  EXPECT_CALL(transport_, post_json(_, _, _))
    .WillOnce(Return(makeResponse(200, R"({"success":"yes","content_id":"c1"})")));

  try {
    client_.complete_upload("up-1", {{1, "e1"}});
    FAIL() << "expected UploadError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), UploadErrorKind::SERIALIZATION);
  }
}

TEST_F(RemoteUploadClientTest, CompleteReportsUnsuccessfulResult) {
  EXPECT_CALL(transport_, post_json(_, _, _))
    .WillOnce(Return(makeResponse(200, R"({"success":false,"message":"parts missing"})")));

  auto result = client_.complete_upload("up-1", {{1, "e1"}});
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.message, "parts missing");
  EXPECT_FALSE(result.verified.has_value());
}

// ============================================================================
// abort
// ============================================================================

TEST_F(RemoteUploadClientTest, AbortUsesDelete) {
  HttpHeaders headers;
  EXPECT_CALL(transport_, delete_request(multipart("/abort/up-1"), _))
    .WillOnce(DoAll(SaveArg<1>(&headers), Return(makeResponse(204))));

  client_.abort_upload("up-1");
  EXPECT_TRUE(hasApiKey(headers, "secret-key"));
}

TEST_F(RemoteUploadClientTest, BestEffortAbortSwallowsFailure) {
  EXPECT_CALL(transport_, delete_request(_, _))
    .WillOnce(Return(makeResponse(500)))
    .WillOnce(Return(makeNetworkFailure()));

  EXPECT_THROW(client_.abort_upload("up-1"), UploadError);
  EXPECT_NO_THROW(abort_upload_best_effort(client_, "up-1"));
}

// ============================================================================
// URL parsing of the Beast transport
// ============================================================================

TEST(BeastHttpTransportTest, ParseUrl) {
  std::string host, port, target;
  bool ssl = false;

  ASSERT_TRUE(BeastHttpTransport::parse_url(
    "https://storage.example.com/bucket/key?X-Sig=1", host, port, target, ssl
  ));
  EXPECT_TRUE(ssl);
  EXPECT_EQ(host, "storage.example.com");
  EXPECT_EQ(port, "443");
  EXPECT_EQ(target, "/bucket/key?X-Sig=1");

  ASSERT_TRUE(BeastHttpTransport::parse_url("http://localhost:8080", host, port, target, ssl));
  EXPECT_FALSE(ssl);
  EXPECT_EQ(port, "8080");
  EXPECT_EQ(target, "/");

  EXPECT_FALSE(BeastHttpTransport::parse_url("ftp://example.com/x", host, port, target, ssl));
}

TEST(BeastHttpTransportTest, NetworkFailureClassification) {
  namespace http = boost::beast::http;

  EXPECT_TRUE(BeastHttpTransport::is_network_failure(boost::asio::error::connection_refused));
  EXPECT_TRUE(BeastHttpTransport::is_network_failure(boost::asio::error::host_not_found));
  EXPECT_TRUE(BeastHttpTransport::is_network_failure(boost::asio::error::connection_reset));
  EXPECT_TRUE(BeastHttpTransport::is_network_failure(boost::beast::error::timeout));
  EXPECT_TRUE(BeastHttpTransport::is_network_failure(http::error::end_of_stream));

  EXPECT_FALSE(BeastHttpTransport::is_network_failure(http::error::body_limit));
  EXPECT_FALSE(BeastHttpTransport::is_network_failure(http::error::bad_version));
  EXPECT_FALSE(BeastHttpTransport::is_network_failure(http::error::header_limit));
}
