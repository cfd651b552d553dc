// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for ChunkUploader using mocked remote client and transport
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "chunk_uploader.hpp"
#include "upload_error.hpp"
#include "uploader_mocks.hpp"

using namespace capsule::uploader;
using namespace capsule::uploader::test;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

class ChunkUploaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    data_.assign(1000, 'c');
    payload_.chunk_number = 2;
    payload_.total_chunks = 6;
    payload_.data = data_.data();
    payload_.size = data_.size();
    payload_.sha256 = "hash-2";

    ON_CALL(client_, request_chunk_url(_, _, _))
      .WillByDefault(Invoke([](const std::string&, uint64_t chunk, const std::string&) {
        ChunkUrlResponse url;
        url.upload_url = "https://storage.example.com/part-" + std::to_string(chunk);
        url.chunk_number = chunk;
        url.expires_at = 1700003600;
        return url;
      }));
  }

  ChunkUploader makeUploader() {
    return ChunkUploader(client_, transport_, RetryConfig(), [this](std::chrono::milliseconds d) {
      sleeps_.push_back(d.count());
    });
  }

  // PUT that reports the whole body as sent before answering
  static auto sendAllThen(HttpResponse response) {
    return [response](const std::string&, const char*, size_t size, const std::string&,
                      const ByteProgressCallback& on_progress) {
      if (on_progress) {
        on_progress(size / 2);
        on_progress(size);
      }
      return response;
    };
  }

  testing::NiceMock<MockRemoteUploadClient> client_;
  MockHttpTransport transport_;
  std::string data_;
  ChunkPayload payload_;
  std::vector<int64_t> sleeps_;
};

TEST_F(ChunkUploaderTest, SucceedsFirstAttempt) {
  EXPECT_CALL(client_, request_chunk_url("up-1", 2u, "hash-2")).Times(1);
  EXPECT_CALL(
    transport_, put("https://storage.example.com/part-2", _, 1000u, "application/octet-stream", _)
  )
    .WillOnce(Invoke(sendAllThen(makeEtagResponse("etag-2"))));

  std::vector<ProgressData> updates;
  ProgressSender progress(
    [&updates](const ProgressData& d) {
      updates.push_back(d);
    },
    6000, 1000
  );

  auto uploader = makeUploader();
  auto record = uploader.uploadChunk("up-1", payload_, progress);

  EXPECT_EQ(record.chunk_number, 2u);
  EXPECT_EQ(record.etag, "etag-2");
  EXPECT_EQ(progress.bytes_uploaded(), 2000u);
  ASSERT_FALSE(updates.empty());
  EXPECT_EQ(updates.back().bytes_uploaded, 2000u);
  EXPECT_TRUE(sleeps_.empty());
}

TEST_F(ChunkUploaderTest, RetriesServerErrorsWithoutDoubleCounting) {
  EXPECT_CALL(client_, request_chunk_url(_, _, _)).Times(5);
  EXPECT_CALL(transport_, put(_, _, _, _, _))
    .WillOnce(Invoke(sendAllThen(makeResponse(500))))
    .WillOnce(Invoke(sendAllThen(makeResponse(500))))
    .WillOnce(Invoke(sendAllThen(makeResponse(500))))
    .WillOnce(Invoke(sendAllThen(makeResponse(500))))
    .WillOnce(Invoke(sendAllThen(makeEtagResponse("etag-2"))));

  ProgressSender progress(nullptr, 6000, 1000);
  auto uploader = makeUploader();
  auto record = uploader.uploadChunk("up-1", payload_, progress);

  EXPECT_EQ(record.etag, "etag-2");
  EXPECT_EQ(progress.bytes_uploaded(), 2000u);
  EXPECT_EQ(sleeps_, (std::vector<int64_t>{500, 1000, 1500, 2000}));
}

TEST_F(ChunkUploaderTest, MissingEtagExhaustsAttempts) {
  EXPECT_CALL(transport_, put(_, _, _, _, _))
    .Times(5)
    .WillRepeatedly(Invoke(sendAllThen(makeResponse(200))));

  ProgressSender progress(nullptr, 6000, 1000);
  auto uploader = makeUploader();

  try {
    uploader.uploadChunk("up-1", payload_, progress);
    FAIL() << "expected UploadError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), UploadErrorKind::CHUNK_UPLOAD_FAILED);
    EXPECT_EQ(e.chunk_number(), 2u);
    EXPECT_EQ(e.total_chunks(), 6u);
    EXPECT_EQ(e.attempts(), 5);
    EXPECT_FALSE(e.is_network_error());
    EXPECT_NE(std::string(e.what()).find("No ETag header found"), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("chunk 2/6 after 5 attempts"), std::string::npos);
  }
  // Partial bytes of the failed chunk are rolled back
  EXPECT_EQ(progress.bytes_uploaded(), 1000u);
  EXPECT_EQ(sleeps_.size(), 4u);
}

TEST_F(ChunkUploaderTest, NetworkFlagIsCarried) {
  EXPECT_CALL(transport_, put(_, _, _, _, _)).WillRepeatedly(Return(makeNetworkFailure()));

  ProgressSender progress(nullptr, 6000, 1000);
  auto uploader = makeUploader();

  try {
    uploader.uploadChunk("up-1", payload_, progress);
    FAIL() << "expected UploadError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), UploadErrorKind::CHUNK_UPLOAD_FAILED);
    EXPECT_TRUE(e.is_network_error());
  }
}

TEST_F(ChunkUploaderTest, ChunkUrlFailureIsRetried) {
  EXPECT_CALL(client_, request_chunk_url(_, _, _))
    .WillOnce(Invoke([](const std::string&, uint64_t, const std::string&) -> ChunkUrlResponse {
      throw UploadError::api("Upload multipart chunk request failed: timeout", true);
    }))
    .WillOnce(Invoke([](const std::string&, uint64_t chunk, const std::string&) {
      ChunkUrlResponse url;
      url.upload_url = "https://storage.example.com/retry";
      url.chunk_number = chunk;
      return url;
    }));
  EXPECT_CALL(transport_, put("https://storage.example.com/retry", _, _, _, _))
    .WillOnce(Invoke(sendAllThen(makeEtagResponse("etag-r"))));

  ProgressSender progress(nullptr, 6000, 1000);
  auto uploader = makeUploader();
  EXPECT_EQ(uploader.uploadChunk("up-1", payload_, progress).etag, "etag-r");
  EXPECT_EQ(sleeps_, (std::vector<int64_t>{500}));
}

TEST(ChunkUploaderEtagTest, NormalizeStripsQuotes) {
  EXPECT_EQ(ChunkUploader::normalizeEtag("\"abc123\""), "abc123");
  EXPECT_EQ(ChunkUploader::normalizeEtag("abc123"), "abc123");
  EXPECT_EQ(ChunkUploader::normalizeEtag("\"\""), "");
  EXPECT_EQ(ChunkUploader::normalizeEtag(""), "");
}
