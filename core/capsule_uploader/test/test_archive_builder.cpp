// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for ArchiveBuilder and the hardware id reader
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <regex>
#include <string>

#include "archive_builder.hpp"
#include "hardware_id.hpp"
#include "recording_types.hpp"
#include "test_helpers.hpp"
#include "upload_error.hpp"
#include "uploader_mocks.hpp"

namespace fs = std::filesystem;
using namespace capsule::uploader;
using namespace capsule::uploader::test;
using ::testing::_;
using ::testing::Return;

class ArchiveBuilderTest : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = createTempDir("capsule_archive_");
    folder_ = createRecordingFolder(root_, "1700000000", 1000);
    artifact_.video_path = folder_ + "/" + kVideoFileName;
    artifact_.inputs_path = folder_ + "/" + kInputsFileName;
    artifact_.metadata_path = folder_ + "/" + kMetadataFileName;
  }

  void TearDown() override {
    fs::remove_all(root_);
  }

  std::string root_;
  std::string folder_;
  RecordingArtifact artifact_;
};

TEST_F(ArchiveBuilderTest, RandomNameIsSixteenHex) {
  const std::regex pattern("^[0-9a-f]{16}\\.tar$");
  auto first = ArchiveBuilder::random_archive_name();
  auto second = ArchiveBuilder::random_archive_name();
  EXPECT_TRUE(std::regex_match(first, pattern)) << first;
  EXPECT_NE(first, second);
}

TEST_F(ArchiveBuilderTest, BuildWritesUstarLayout) {
  auto archive = ArchiveBuilder::build(folder_, artifact_);
  EXPECT_EQ(fs::path(archive).parent_path(), fs::path(folder_));
  ASSERT_TRUE(fs::exists(archive));

  const std::string data = readFile(archive);
  ASSERT_EQ(data.size() % ArchiveBuilder::kBlockSize, 0u);

  // First entry: header, 1000 bytes of video padded to 1024
  EXPECT_EQ(data.substr(0, 13), "recording.mp4");
  EXPECT_EQ(data.substr(257, 5), "ustar");
  EXPECT_EQ(data[262], '\0');
  EXPECT_EQ(data.substr(263, 2), "00");
  EXPECT_EQ(std::strtoull(data.substr(124, 11).c_str(), nullptr, 8), 1000u);
  EXPECT_EQ(data.substr(512, 1000), std::string(1000, 'v'));
  EXPECT_EQ(data.substr(1512, 24), std::string(24, '\0'));

  // Second entry starts right after the padded video data
  EXPECT_EQ(data.substr(1536, 10), "inputs.csv");

  // Archive ends with two zero blocks
  EXPECT_EQ(data.substr(data.size() - 1024), std::string(1024, '\0'));
}

TEST_F(ArchiveBuilderTest, HeaderChecksumMatches) {
  auto archive = ArchiveBuilder::build(folder_, artifact_);
  const std::string data = readFile(archive);

  std::string header = data.substr(0, 512);
  const unsigned long stored = std::strtoul(header.substr(148, 6).c_str(), nullptr, 8);
  for (size_t i = 148; i < 156; ++i) {
    header[i] = ' ';
  }
  unsigned long sum = 0;
  for (unsigned char c : header) {
    sum += c;
  }
  EXPECT_EQ(stored, sum);
}

TEST_F(ArchiveBuilderTest, MissingInputLeavesNoArchive) {
  fs::remove(artifact_.inputs_path);
  const std::string target = folder_ + "/partial.tar";

  EXPECT_THROW(
    ArchiveBuilder::write_archive(
      target, {artifact_.video_path, artifact_.inputs_path, artifact_.metadata_path}
    ),
    UploadError
  );
  EXPECT_FALSE(fs::exists(target));
}

// ============================================================================
// Hardware id
// ============================================================================

TEST(HardwareIdTest, FirstNonEmptyCandidateWins) {
  MockFileSystem mock_fs;
  EXPECT_CALL(mock_fs, read_file("/a")).WillOnce(Return(std::nullopt));
  EXPECT_CALL(mock_fs, read_file("/b")).WillOnce(Return(std::optional<std::string>(" \n")));
  EXPECT_CALL(mock_fs, read_file("/c"))
    .WillOnce(Return(std::optional<std::string>("4c4c4544004a\n")));

  EXPECT_EQ(read_hardware_id(mock_fs, {"/a", "/b", "/c"}), "4c4c4544004a");
}

TEST(HardwareIdTest, NoCandidateThrows) {
  MockFileSystem mock_fs;
  EXPECT_CALL(mock_fs, read_file(_)).WillRepeatedly(Return(std::nullopt));

  try {
    read_hardware_id(mock_fs, {"/a", "/b"});
    FAIL() << "expected UploadError";
  } catch (const UploadError& e) {
    EXPECT_EQ(e.kind(), UploadErrorKind::VALIDATION);
  }
}
