// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for UploadProgressStore
 */

#include <gtest/gtest.h>

#include <filesystem>

#include "test_helpers.hpp"
#include "upload_error.hpp"
#include "upload_progress_store.hpp"

namespace fs = std::filesystem;
using namespace capsule::uploader;
using namespace capsule::uploader::test;

class UploadProgressStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    folder_ = createTempDir("capsule_progress_");
  }

  void TearDown() override {
    fs::remove_all(folder_);
  }

  UploadProgressState makeState() {
    UploadProgressState state;
    state.tar_path = folder_ + "/0123456789abcdef.tar";
    state.session.upload_id = "up-1";
    state.session.content_id = "content-1";
    state.session.total_chunks = 6;
    state.session.chunk_size_bytes = 8 * 1024 * 1024;
    state.session.expires_at = 1700003600;
    return state;
  }

  std::string folder_;
};

TEST_F(UploadProgressStoreTest, NextChunkNumberStartsAtOne) {
  auto state = makeState();
  EXPECT_EQ(state.next_chunk_number(), 1u);
  EXPECT_EQ(state.bytes_already_uploaded(), 0u);

  state.chunk_etags = {{1, "a"}, {2, "b"}, {3, "c"}};
  EXPECT_EQ(next_chunk_number(state), 4u);
  EXPECT_EQ(state.bytes_already_uploaded(), 3u * 8 * 1024 * 1024);
}

TEST_F(UploadProgressStoreTest, ExpirationBoundary) {
  auto state = makeState();
  EXPECT_FALSE(state.is_expired(1700003599));
  EXPECT_TRUE(state.is_expired(1700003600));
  EXPECT_EQ(state.seconds_until_expiration(1700002600), 1000);
}

TEST_F(UploadProgressStoreTest, SaveWritesHeaderAndChunkLines) {
  auto state = makeState();
  state.chunk_etags = {{1, "etag-1"}};
  UploadProgressStore::save(folder_, state);

  auto lines = readLines(UploadProgressStore::path_for(folder_));
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_NE(lines[0].find("\"upload_id\":\"up-1\""), std::string::npos);
  EXPECT_EQ(lines[0].find("chunk_etags"), std::string::npos);
  EXPECT_NE(lines[1].find("\"chunk_number\":1"), std::string::npos);
  EXPECT_FALSE(fs::exists(UploadProgressStore::path_for(folder_) + ".tmp"));
}

TEST_F(UploadProgressStoreTest, SaveAppendLoad) {
  auto state = makeState();
  UploadProgressStore::save(folder_, state);
  UploadProgressStore::append_chunk(folder_, {1, "e1"});
  UploadProgressStore::append_chunk(folder_, {2, "e2"});
  UploadProgressStore::append_chunk(folder_, {3, "e3"});

  auto loaded = UploadProgressStore::load(UploadProgressStore::path_for(folder_));
  EXPECT_EQ(loaded.tar_path, state.tar_path);
  EXPECT_EQ(loaded.session.upload_id, "up-1");
  EXPECT_EQ(loaded.session.content_id, "content-1");
  EXPECT_EQ(loaded.session.total_chunks, 6u);
  EXPECT_EQ(loaded.session.chunk_size_bytes, 8u * 1024 * 1024);
  EXPECT_EQ(loaded.session.expires_at, 1700003600);
  ASSERT_EQ(loaded.chunk_etags.size(), 3u);
  EXPECT_EQ(loaded.chunk_etags[2], (ChunkRecord{3, "e3"}));
  EXPECT_EQ(loaded.next_chunk_number(), 4u);
}

TEST_F(UploadProgressStoreTest, LoadKeepsFirstDuplicateAndSorts) {
  std::string path = UploadProgressStore::path_for(folder_);
  writeFile(
    path,
    "{\"upload_id\":\"u\",\"content_id\":\"c\",\"tar_path\":\"/t.tar\",\"total_chunks\":4,"
    "\"chunk_size_bytes\":10,\"expires_at\":100}\n"
    "{\"chunk_number\":2,\"etag\":\"first\"}\n"
    "\n"
    "{\"chunk_number\":1,\"etag\":\"one\"}\n"
    "{\"chunk_number\":2,\"etag\":\"second\"}\n"
  );

  auto loaded = UploadProgressStore::load(path);
  ASSERT_EQ(loaded.chunk_etags.size(), 2u);
  EXPECT_EQ(loaded.chunk_etags[0], (ChunkRecord{1, "one"}));
  EXPECT_EQ(loaded.chunk_etags[1], (ChunkRecord{2, "first"}));
}

TEST_F(UploadProgressStoreTest, LegacyLayoutIsMigrated) {
  std::string path = UploadProgressStore::path_for(folder_);
  writeFile(
    path,
    "{\"upload_id\":\"u\",\"content_id\":\"c\",\"tar_path\":\"/t.tar\",\"total_chunks\":4,"
    "\"chunk_size_bytes\":10,\"expires_at\":100,"
    "\"chunk_etags\":[{\"chunk_number\":1,\"etag\":\"a\"},{\"chunk_number\":2,\"etag\":\"b\"}]}\n"
  );

  auto loaded = UploadProgressStore::load(path);
  EXPECT_EQ(loaded.chunk_etags.size(), 2u);
  EXPECT_EQ(loaded.next_chunk_number(), 3u);
  EXPECT_EQ(loaded.bytes_already_uploaded(), 20u);

  auto lines = readLines(path);
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0].find("chunk_etags"), std::string::npos);

  auto reloaded = UploadProgressStore::load(path);
  EXPECT_EQ(reloaded.chunk_etags, loaded.chunk_etags);
  EXPECT_EQ(reloaded.next_chunk_number(), 3u);
}

TEST_F(UploadProgressStoreTest, CorruptFileThrowsSerialization) {
  std::string path = UploadProgressStore::path_for(folder_);
  writeFile(path, "{not json\n");
  try {
    UploadProgressStore::load(path);
    FAIL() << "expected UploadError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), UploadErrorKind::SERIALIZATION);
  }
}

TEST_F(UploadProgressStoreTest, EmptyFileThrowsSerialization) {
  std::string path = UploadProgressStore::path_for(folder_);
  writeFile(path, "");
  try {
    UploadProgressStore::load(path);
    FAIL() << "expected UploadError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), UploadErrorKind::SERIALIZATION);
  }
}

TEST_F(UploadProgressStoreTest, MissingFileThrowsIo) {
  try {
    UploadProgressStore::load(folder_ + "/nope");
    FAIL() << "expected UploadError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), UploadErrorKind::IO);
  }
}

TEST_F(UploadProgressStoreTest, AppendWithoutHeaderThrows) {
  EXPECT_THROW(UploadProgressStore::append_chunk(folder_, {1, "e"}), UploadError);
}

TEST_F(UploadProgressStoreTest, RemoveIsIdempotent) {
  UploadProgressStore::save(folder_, makeState());
  EXPECT_TRUE(UploadProgressStore::remove(folder_));
  EXPECT_FALSE(fs::exists(UploadProgressStore::path_for(folder_)));
  EXPECT_TRUE(UploadProgressStore::remove(folder_));
}
