/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

#include "snaplake/clone_orchestrator.h"

#include <format>
#include <memory>
#include <stop_token>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "snaplake/arrow/arrow_fs_file_io.h"
#include "snaplake/catalog/warehouse_catalog.h"
#include "snaplake/history_index.h"
#include "snaplake/liveness_tracker.h"
#include "snaplake/locator.h"
#include "snaplake/snapshot_store.h"
#include "snaplake/test/matchers.h"
#include "snaplake/test/mock_io.h"
#include "snaplake/test/test_common.h"

namespace snaplake {

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::NiceMock;
using ::testing::Return;

class CloneOrchestratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    file_io_ = arrow::MakeMockFileIO();
    mock_io_ = std::make_shared<NiceMock<MockFileIO>>();
    mock_io_->DelegateTo(file_io_);

    store_ = std::make_shared<SnapshotStore>(mock_io_, "/warehouse");
    ASSERT_THAT(store_->Open(), IsOk());
    history_ = std::make_shared<HistoryIndex>(mock_io_, "/warehouse");
    tracker_ = std::make_shared<LivenessTracker>(store_);
    catalog_ =
        std::make_shared<WarehouseCatalog>(mock_io_, "/warehouse", history_, tracker_);
    ASSERT_THAT(catalog_->Open(), IsOk());
    orchestrator_ =
        std::make_unique<CloneOrchestrator>(catalog_, store_, history_, tracker_);

    ASSERT_THAT(file_io_->WriteFile(kDataFile, "data"), IsOk());
    auto snapshot_id = store_->Put(SnapshotManifest{
        .parent_snapshot_id = std::nullopt,
        .schema = IntSchema(),
        .data_files = {DataFile{
            .location = kDataFile, .record_count = 1, .file_size_in_bytes = 4}}});
    ASSERT_THAT(snapshot_id, IsOk());
    snapshot_id_ = *snapshot_id;
  }

  TableDefinition Definition(const std::string& name, Schema schema = IntSchema()) {
    auto options = TableOptions::Make(
        {{"snapshot_loc", Locator::For(*snapshot_id_)}, {"comment", "copy"}});
    EXPECT_THAT(options, IsOk());
    return TableDefinition{.identifier = {.database = "default", .name = name},
                           .schema = std::move(schema),
                           .options = *options};
  }

  /// \brief Nothing of a clone of `name` may be left behind.
  void ExpectNoTrace(const std::string& name) {
    TableIdentifier identifier{.database = "default", .name = name};
    EXPECT_FALSE(catalog_->TableExists(identifier));
    EXPECT_THAT(catalog_->ReserveName(identifier), IsOk());
    EXPECT_THAT(history_->ListTableIds(), HasValue(IsEmpty()));
    EXPECT_THAT(file_io_->ListFiles("/warehouse/_intent"), HasValue(IsEmpty()));
    EXPECT_EQ(tracker_->ReferenceCount(*snapshot_id_), 0);
    EXPECT_TRUE(store_->Contains(*snapshot_id_));
  }

  static constexpr const char* kDataFile = "/warehouse/source/_b/0.parquet";
  std::shared_ptr<FileIO> file_io_;
  std::shared_ptr<NiceMock<MockFileIO>> mock_io_;
  std::shared_ptr<SnapshotStore> store_;
  std::shared_ptr<HistoryIndex> history_;
  std::shared_ptr<LivenessTracker> tracker_;
  std::shared_ptr<WarehouseCatalog> catalog_;
  std::unique_ptr<CloneOrchestrator> orchestrator_;
  std::optional<SnapshotId> snapshot_id_;
};

TEST_F(CloneOrchestratorTest, CloneSharesSnapshot) {
  SNAPLAKE_UNWRAP_OR_FAIL(auto table_id,
                          orchestrator_->Clone(Definition("t1"), *snapshot_id_));

  SNAPLAKE_UNWRAP_OR_FAIL(auto entry,
                          catalog_->GetEntry({.database = "default", .name = "t1"}));
  const auto& metadata = entry->metadata;
  EXPECT_EQ(metadata.table_id, table_id);
  EXPECT_TRUE(metadata.is_clone());
  EXPECT_EQ(metadata.source_snapshot_id, *snapshot_id_);
  EXPECT_EQ(metadata.source_locator, Locator::For(*snapshot_id_));
  EXPECT_EQ(metadata.location, catalog_->TableLocation(table_id));
  EXPECT_FALSE(metadata.options.contains("snapshot_loc"));
  EXPECT_EQ(metadata.options.at("comment"), "copy");

  auto entries = history_->Entries(table_id);
  ASSERT_EQ(entries.size(), 1);
  EXPECT_EQ(entries[0].sequence_number, 0);
  EXPECT_EQ(entries[0].snapshot_id, *snapshot_id_);
  EXPECT_EQ(tracker_->ReferenceCount(*snapshot_id_), 1);
  EXPECT_THAT(file_io_->ListFiles("/warehouse/_intent"), HasValue(IsEmpty()));
  // No data was copied.
  EXPECT_THAT(file_io_->ListDirs(catalog_->TableLocation(table_id)),
              HasValue(IsEmpty()));
}

TEST_F(CloneOrchestratorTest, ClonesAreIndependent) {
  SNAPLAKE_UNWRAP_OR_FAIL(auto first,
                          orchestrator_->Clone(Definition("t1"), *snapshot_id_));
  SNAPLAKE_UNWRAP_OR_FAIL(auto second,
                          orchestrator_->Clone(Definition("t2"), *snapshot_id_));
  EXPECT_NE(first, second);
  EXPECT_EQ(tracker_->ReferenceCount(*snapshot_id_), 2);
  EXPECT_EQ(store_->List().size(), 1);
}

TEST_F(CloneOrchestratorTest, NameCollision) {
  ASSERT_THAT(orchestrator_->Clone(Definition("t1"), *snapshot_id_), IsOk());
  auto result = orchestrator_->Clone(Definition("t1"), *snapshot_id_);
  EXPECT_THAT(result, IsError(ErrorKind::kTableNameCollision));
  EXPECT_EQ(tracker_->ReferenceCount(*snapshot_id_), 1);
  EXPECT_THAT(history_->ListTableIds(), HasValue(::testing::SizeIs(1)));
}

TEST_F(CloneOrchestratorTest, UnknownSnapshot) {
  auto result = orchestrator_->Clone(Definition("t1"), SnapshotId::Generate());
  EXPECT_THAT(result, IsError(ErrorKind::kSnapshotNotFound));
  ExpectNoTrace("t1");
}

TEST_F(CloneOrchestratorTest, MissingDataFile) {
  ASSERT_THAT(file_io_->DeleteFile(kDataFile), IsOk());
  auto result = orchestrator_->Clone(Definition("t1"), *snapshot_id_);
  EXPECT_THAT(result, IsError(ErrorKind::kCorruptSnapshotReference));
  EXPECT_THAT(result, HasErrorMessage("missing data file"));
  ExpectNoTrace("t1");
}

TEST_F(CloneOrchestratorTest, SchemaMismatch) {
  auto result =
      orchestrator_->Clone(Definition("t1", IntSchema("other")), *snapshot_id_);
  EXPECT_THAT(result, IsError(ErrorKind::kInvalidSchema));
  ExpectNoTrace("t1");
}

TEST_F(CloneOrchestratorTest, FailedCommitRollsBack) {
  EXPECT_CALL(*mock_io_, RenameFile(_, _)).Times(AnyNumber());
  EXPECT_CALL(*mock_io_, RenameFile(_, HasSubstr("/_meta/")))
      .WillOnce(Return(IOError("injected")));

  auto result = orchestrator_->Clone(Definition("t1"), *snapshot_id_);
  EXPECT_THAT(result, IsError(ErrorKind::kIOError));
  EXPECT_THAT(file_io_->ListFiles("/warehouse/_meta"), HasValue(IsEmpty()));
  ExpectNoTrace("t1");
}

TEST_F(CloneOrchestratorTest, FailedHistoryAppendRollsBack) {
  EXPECT_CALL(*mock_io_, RenameFile(_, _)).Times(AnyNumber());
  EXPECT_CALL(*mock_io_, RenameFile(_, HasSubstr("/_history/")))
      .WillOnce(Return(IOError("injected")));

  EXPECT_THAT(orchestrator_->Clone(Definition("t1"), *snapshot_id_),
              IsError(ErrorKind::kIOError));
  ExpectNoTrace("t1");
}

TEST_F(CloneOrchestratorTest, CancelledBeforeStart) {
  std::stop_source stop_source;
  stop_source.request_stop();
  auto result =
      orchestrator_->Clone(Definition("t1"), *snapshot_id_, stop_source.get_token());
  EXPECT_THAT(result, IsError(ErrorKind::kOperationCancelled));
  ExpectNoTrace("t1");
}

TEST_F(CloneOrchestratorTest, CancelledMidway) {
  std::stop_source stop_source;
  EXPECT_CALL(*mock_io_, WriteFile(_, _)).Times(AnyNumber());
  EXPECT_CALL(*mock_io_, WriteFile(HasSubstr("/_intent/"), _))
      .WillOnce([&](const std::string& location, std::string_view content) {
        stop_source.request_stop();
        return file_io_->WriteFile(location, content);
      });

  auto result =
      orchestrator_->Clone(Definition("t1"), *snapshot_id_, stop_source.get_token());
  EXPECT_THAT(result, IsError(ErrorKind::kOperationCancelled));
  EXPECT_THAT(result, HasErrorMessage("before appending history"));
  ExpectNoTrace("t1");
}

}  // namespace snaplake
