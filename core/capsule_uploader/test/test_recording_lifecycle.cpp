// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for RecordingLifecycle on real temporary folders
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <variant>

#include "recording_lifecycle.hpp"
#include "test_helpers.hpp"
#include "upload_error.hpp"
#include "upload_progress_store.hpp"
#include "uploader_impl.hpp"
#include "uploader_mocks.hpp"

namespace fs = std::filesystem;
using namespace capsule::uploader;
using namespace capsule::uploader::test;
using ::testing::_;
using ::testing::Throw;

class RecordingLifecycleTest : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = createTempDir("capsule_lifecycle_");
  }

  void TearDown() override {
    fs::remove_all(root_);
  }

  // Folder with a saved progress file and a fake archive
  std::string createPausedFolder(const std::string& name) {
    auto folder = createRecordingFolder(root_, name);
    UploadProgressState state;
    state.tar_path = folder + "/00000000000000aa.tar";
    state.session.upload_id = "up-" + name;
    state.session.content_id = "content-" + name;
    state.session.total_chunks = 2;
    state.session.chunk_size_bytes = 4096;
    state.session.expires_at = 1700003600;
    state.chunk_etags = {{1, "e1"}};
    writeFile(state.tar_path, std::string(5000, 't'));
    UploadProgressStore::save(folder, state);
    return folder;
  }

  PausedRecording loadPaused(const std::string& folder) {
    auto state = lifecycle_.from_path(folder);
    EXPECT_TRUE(state.has_value());
    EXPECT_TRUE(std::holds_alternative<PausedRecording>(*state));
    return std::get<PausedRecording>(*state);
  }

  std::string root_;
  FileSystemImpl fs_;
  RecordingLifecycle lifecycle_{fs_};
  testing::NiceMock<MockRemoteUploadClient> client_;
};

// ============================================================================
// Scanning
// ============================================================================

TEST_F(RecordingLifecycleTest, NotADirectory) {
  EXPECT_FALSE(lifecycle_.from_path(root_ + "/missing").has_value());
  writeFile(root_ + "/file.txt", "x");
  EXPECT_FALSE(lifecycle_.from_path(root_ + "/file.txt").has_value());
}

TEST_F(RecordingLifecycleTest, PlainFolderIsUnuploaded) {
  auto folder = createRecordingFolder(root_, "1700000000", 100);
  auto state = lifecycle_.from_path(folder);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(recordingStatus(*state), RecordingStatus::UNUPLOADED);

  const auto& info = recordingInfo(*state);
  EXPECT_EQ(info.folder_name, "1700000000");
  ASSERT_TRUE(info.timestamp.has_value());
  EXPECT_EQ(*info.timestamp, 1700000000);
  EXPECT_GT(info.folder_size, 100u);

  const auto& unuploaded = std::get<UnuploadedRecording>(*state);
  ASSERT_TRUE(unuploaded.metadata.has_value());
  EXPECT_EQ(unuploaded.metadata->game_exe, "game.exe");
}

TEST_F(RecordingLifecycleTest, UploadedMarkerWins) {
  auto folder = createPausedFolder("1700000000");
  writeFile(folder + "/" + kInvalidMarker, "Missing inputs.csv\n");
  writeFile(folder + "/" + kUploadedMarker, "content-9\n");

  auto state = lifecycle_.from_path(folder);
  ASSERT_TRUE(state.has_value());
  ASSERT_EQ(recordingStatus(*state), RecordingStatus::UPLOADED);
  EXPECT_EQ(std::get<UploadedRecording>(*state).content_id, "content-9");
}

TEST_F(RecordingLifecycleTest, InvalidBeatsProgress) {
  auto folder = createPausedFolder("1700000000");
  writeFile(folder + "/" + kServerInvalidMarker, "video too short\n");

  auto state = lifecycle_.from_path(folder);
  ASSERT_TRUE(state.has_value());
  ASSERT_EQ(recordingStatus(*state), RecordingStatus::INVALID);
  const auto& invalid = std::get<InvalidRecording>(*state);
  EXPECT_TRUE(invalid.by_server);
  EXPECT_EQ(invalid.reasons, std::vector<std::string>{"video too short"});
}

TEST_F(RecordingLifecycleTest, ProgressMakesPaused) {
  auto folder = createPausedFolder("1700000000");
  auto paused = loadPaused(folder);
  EXPECT_EQ(paused.progress.session.upload_id, "up-1700000000");
  EXPECT_EQ(paused.progress.next_chunk_number(), 2u);
}

TEST_F(RecordingLifecycleTest, CorruptProgressFallsBackToUnuploaded) {
  auto folder = createRecordingFolder(root_, "1700000000");
  writeFile(UploadProgressStore::path_for(folder), "{not json\n");

  auto state = lifecycle_.from_path(folder);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(recordingStatus(*state), RecordingStatus::UNUPLOADED);
}

TEST_F(RecordingLifecycleTest, ScanOrdersNewestFirst) {
  createRecordingFolder(root_, "1700000100");
  createRecordingFolder(root_, "notes");
  createPausedFolder("1700000300");
  createRecordingFolder(root_, "1700000200");
  writeFile(root_ + "/stray.txt", "x");

  auto recordings = lifecycle_.scan_directory(root_);
  ASSERT_EQ(recordings.size(), 4u);
  EXPECT_EQ(recordingInfo(recordings[0]).folder_name, "1700000300");
  EXPECT_EQ(recordingStatus(recordings[0]), RecordingStatus::PAUSED);
  EXPECT_EQ(recordingInfo(recordings[1]).folder_name, "1700000200");
  EXPECT_EQ(recordingInfo(recordings[2]).folder_name, "1700000100");
  EXPECT_EQ(recordingInfo(recordings[3]).folder_name, "notes");
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(RecordingLifecycleTest, ValidArtifacts) {
  auto folder = createRecordingFolder(root_, "1700000000", 2048);
  auto validation = lifecycle_.validate_artifacts(folder);
  ASSERT_TRUE(validation.ok());
  EXPECT_GT(validation.artifact->total_bytes, 2048u);
  EXPECT_DOUBLE_EQ(validation.artifact->duration_seconds, 125.5);
}

TEST_F(RecordingLifecycleTest, ValidationCollectsReasons) {
  auto folder = createRecordingFolder(root_, "1700000000");
  fs::remove(folder + "/" + kInputsFileName);
  writeFile(folder + "/" + kVideoFileName, "");
  writeFile(folder + "/" + kMetadataFileName, sampleMetadataJson(0.0));

  auto validation = lifecycle_.validate_artifacts(folder);
  EXPECT_FALSE(validation.ok());
  EXPECT_FALSE(validation.artifact.has_value());
  EXPECT_THAT(
    validation.reasons,
    ::testing::UnorderedElementsAre(
      "recording.mp4 is empty", "Missing inputs.csv", "Recording duration is not positive"
    )
  );
}

TEST_F(RecordingLifecycleTest, UnreadableMetadataIsReported) {
  auto folder = createRecordingFolder(root_, "1700000000");
  writeFile(folder + "/" + kMetadataFileName, "{broken");

  auto validation = lifecycle_.validate_artifacts(folder);
  ASSERT_EQ(validation.reasons.size(), 1u);
  EXPECT_EQ(validation.reasons[0].rfind("Unreadable metadata.json: ", 0), 0u);
}

// ============================================================================
// Mutations
// ============================================================================

TEST_F(RecordingLifecycleTest, MarkUploadedRemovesArtifacts) {
  auto folder = createPausedFolder("1700000000");
  auto paused = loadPaused(folder);

  auto uploaded = lifecycle_.mark_uploaded(paused, "content-final");
  EXPECT_EQ(uploaded.content_id, "content-final");
  EXPECT_FALSE(fs::exists(UploadProgressStore::path_for(folder)));
  EXPECT_FALSE(fs::exists(paused.progress.tar_path));
  EXPECT_TRUE(fs::exists(folder + "/" + kVideoFileName));

  auto state = lifecycle_.from_path(folder);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(recordingStatus(*state), RecordingStatus::UPLOADED);
}

TEST_F(RecordingLifecycleTest, MarkInvalidWritesReasons) {
  auto folder = createRecordingFolder(root_, "1700000000");
  auto info = lifecycle_.read_info(folder);

  auto invalid = lifecycle_.mark_invalid(info, std::nullopt, {"Missing inputs.csv", "x is empty"});
  EXPECT_FALSE(invalid.by_server);
  EXPECT_EQ(readFile(folder + "/" + kInvalidMarker), "Missing inputs.csv\nx is empty\n");

  auto state = lifecycle_.from_path(folder);
  ASSERT_TRUE(state.has_value());
  ASSERT_EQ(recordingStatus(*state), RecordingStatus::INVALID);
  EXPECT_EQ(std::get<InvalidRecording>(*state).reasons.size(), 2u);
}

TEST_F(RecordingLifecycleTest, MarkServerInvalidRemovesArtifacts) {
  auto folder = createPausedFolder("1700000000");
  auto paused = loadPaused(folder);

  auto invalid = lifecycle_.mark_server_invalid(paused, "duplicate content");
  EXPECT_TRUE(invalid.by_server);
  EXPECT_TRUE(fs::exists(folder + "/" + kServerInvalidMarker));
  EXPECT_FALSE(fs::exists(UploadProgressStore::path_for(folder)));
  EXPECT_FALSE(fs::exists(paused.progress.tar_path));
}

TEST_F(RecordingLifecycleTest, AbortAndCleanupToleratesAbortFailure) {
  auto folder = createPausedFolder("1700000000");
  auto paused = loadPaused(folder);

  EXPECT_CALL(client_, abort_upload("up-1700000000"))
    .WillOnce(Throw(UploadError::api("Abort multipart upload request failed: down", true)));

  lifecycle_.abort_and_cleanup(client_, paused);
  EXPECT_FALSE(fs::exists(UploadProgressStore::path_for(folder)));
  EXPECT_FALSE(fs::exists(paused.progress.tar_path));

  auto state = lifecycle_.from_path(folder);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(recordingStatus(*state), RecordingStatus::UNUPLOADED);
}

TEST_F(RecordingLifecycleTest, DeletePausedAbortsSession) {
  auto folder = createPausedFolder("1700000000");
  auto state = lifecycle_.from_path(folder);
  ASSERT_TRUE(state.has_value());

  EXPECT_CALL(client_, abort_upload("up-1700000000")).Times(1);
  EXPECT_TRUE(lifecycle_.delete_recording(*state, client_));
  EXPECT_FALSE(fs::exists(folder));
}

TEST_F(RecordingLifecycleTest, DeleteUnuploadedDoesNotAbort) {
  auto folder = createRecordingFolder(root_, "1700000000");
  auto state = lifecycle_.from_path(folder);
  ASSERT_TRUE(state.has_value());

  EXPECT_CALL(client_, abort_upload(_)).Times(0);
  EXPECT_TRUE(lifecycle_.delete_recording(*state, client_));
  EXPECT_FALSE(fs::exists(folder));
}
