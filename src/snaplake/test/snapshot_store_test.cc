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

#include "snaplake/snapshot_store.h"

#include <cctype>
#include <format>
#include <memory>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "snaplake/arrow/arrow_fs_file_io.h"
#include "snaplake/test/matchers.h"
#include "snaplake/test/mock_io.h"
#include "snaplake/test/test_common.h"

namespace snaplake {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

class SnapshotStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    file_io_ = arrow::MakeMockFileIO();
    store_ = std::make_shared<SnapshotStore>(file_io_, kRoot);
    ASSERT_THAT(store_->Open(), IsOk());
  }

  SnapshotManifest MakeManifest(std::optional<SnapshotId> parent = std::nullopt) {
    return SnapshotManifest{
        .parent_snapshot_id = parent,
        .schema = IntSchema(),
        .data_files = {DataFile{.location = "/warehouse/t/_b/1.parquet",
                                .record_count = 1,
                                .file_size_in_bytes = 321}}};
  }

  static constexpr std::string_view kRoot = "/warehouse";
  std::shared_ptr<FileIO> file_io_;
  std::shared_ptr<SnapshotStore> store_;
};

TEST_F(SnapshotStoreTest, PutAndGet) {
  SNAPLAKE_UNWRAP_OR_FAIL(auto snapshot_id, store_->Put(MakeManifest()));
  EXPECT_TRUE(store_->Contains(snapshot_id));
  EXPECT_THAT(file_io_->FileExists(store_->ManifestLocation(snapshot_id)),
              HasValue(::testing::Eq(true)));

  SNAPLAKE_UNWRAP_OR_FAIL(auto snapshot, store_->Get(snapshot_id));
  EXPECT_EQ(snapshot->snapshot_id, snapshot_id);
  EXPECT_EQ(snapshot->parent_snapshot_id, std::nullopt);
  EXPECT_EQ(snapshot->schema, IntSchema());
  EXPECT_EQ(snapshot->data_files, MakeManifest().data_files);
  EXPECT_EQ(snapshot->summary.total_records, 1);
  EXPECT_EQ(snapshot->summary.total_file_size, 321);
  EXPECT_EQ(snapshot->summary.total_data_files, 1);
}

TEST_F(SnapshotStoreTest, ManifestLocation) {
  auto snapshot_id = SnapshotId::Generate();
  EXPECT_EQ(store_->ManifestLocation(snapshot_id),
            std::format("/warehouse/_ss/{}", snapshot_id.ToString()));
}

TEST_F(SnapshotStoreTest, IdsFollowCreationOrder) {
  SNAPLAKE_UNWRAP_OR_FAIL(auto first, store_->Put(MakeManifest()));
  SNAPLAKE_UNWRAP_OR_FAIL(auto second, store_->Put(MakeManifest(first)));
  EXPECT_LT(first, second);
  EXPECT_THAT(store_->List(), ::testing::ElementsAre(first, second));

  SNAPLAKE_UNWRAP_OR_FAIL(auto snapshot, store_->Get(second));
  EXPECT_EQ(snapshot->parent_snapshot_id, first);
}

TEST_F(SnapshotStoreTest, GetUnknownSnapshot) {
  auto result = store_->Get(SnapshotId::Generate());
  EXPECT_THAT(result, IsError(ErrorKind::kSnapshotNotFound));
  EXPECT_THAT(result, HasErrorMessage("does not exist"));
}

TEST_F(SnapshotStoreTest, ReopenReadsManifests) {
  SNAPLAKE_UNWRAP_OR_FAIL(auto snapshot_id, store_->Put(MakeManifest()));
  SNAPLAKE_UNWRAP_OR_FAIL(auto original, store_->Get(snapshot_id));

  SnapshotStore reopened(file_io_, std::string(kRoot));
  ASSERT_THAT(reopened.Open(), IsOk());
  EXPECT_THAT(reopened.List(), ::testing::ElementsAre(snapshot_id));
  SNAPLAKE_UNWRAP_OR_FAIL(auto loaded, reopened.Get(snapshot_id));
  EXPECT_EQ(*loaded, *original);
}

TEST_F(SnapshotStoreTest, OpenCleansDirectory) {
  auto snapshot_id = SnapshotId::Generate();
  auto temp_location = std::format("/warehouse/_ss/{}.tmp", snapshot_id.ToString());
  ASSERT_THAT(file_io_->WriteFile(temp_location, "{"), IsOk());
  ASSERT_THAT(file_io_->WriteFile("/warehouse/_ss/README", "not a manifest"), IsOk());
  auto upper = snapshot_id.ToString();
  for (auto& c : upper) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  ASSERT_THAT(file_io_->WriteFile("/warehouse/_ss/" + upper, "{}"), IsOk());

  ASSERT_THAT(store_->Open(), IsOk());
  EXPECT_TRUE(store_->List().empty());
  EXPECT_THAT(file_io_->FileExists(temp_location), HasValue(::testing::Eq(false)));
  EXPECT_THAT(file_io_->FileExists("/warehouse/_ss/README"),
              HasValue(::testing::Eq(true)));
}

TEST_F(SnapshotStoreTest, CorruptManifest) {
  SNAPLAKE_UNWRAP_OR_FAIL(auto snapshot_id, store_->Put(MakeManifest()));
  ASSERT_THAT(file_io_->WriteFile(store_->ManifestLocation(snapshot_id), "{\"snap"),
              IsOk());

  SnapshotStore reopened(file_io_, std::string(kRoot));
  ASSERT_THAT(reopened.Open(), IsOk());
  auto result = reopened.Get(snapshot_id);
  EXPECT_THAT(result, IsError(ErrorKind::kCorruptSnapshotReference));
  EXPECT_THAT(result, HasErrorMessage("is corrupt"));
}

TEST_F(SnapshotStoreTest, MissingManifest) {
  SNAPLAKE_UNWRAP_OR_FAIL(auto snapshot_id, store_->Put(MakeManifest()));
  SnapshotStore reopened(file_io_, std::string(kRoot));
  ASSERT_THAT(reopened.Open(), IsOk());
  ASSERT_THAT(file_io_->DeleteFile(store_->ManifestLocation(snapshot_id)), IsOk());

  EXPECT_THAT(reopened.Get(snapshot_id), IsError(ErrorKind::kCorruptSnapshotReference));
}

TEST_F(SnapshotStoreTest, ManifestWithForeignId) {
  SNAPLAKE_UNWRAP_OR_FAIL(auto snapshot_id, store_->Put(MakeManifest()));
  SNAPLAKE_UNWRAP_OR_FAIL(auto content,
                          file_io_->ReadFile(store_->ManifestLocation(snapshot_id),
                                             std::nullopt));
  auto other_id = SnapshotId::Generate();
  ASSERT_THAT(file_io_->WriteFile(store_->ManifestLocation(other_id), content), IsOk());

  SnapshotStore reopened(file_io_, std::string(kRoot));
  ASSERT_THAT(reopened.Open(), IsOk());
  EXPECT_THAT(reopened.Get(other_id), IsError(ErrorKind::kCorruptSnapshotReference));
  EXPECT_THAT(reopened.Get(snapshot_id), IsOk());
}

TEST_F(SnapshotStoreTest, Delete) {
  SNAPLAKE_UNWRAP_OR_FAIL(auto snapshot_id, store_->Put(MakeManifest()));
  EXPECT_THAT(store_->Delete(snapshot_id), IsOk());
  EXPECT_FALSE(store_->Contains(snapshot_id));
  EXPECT_THAT(store_->Get(snapshot_id), IsError(ErrorKind::kSnapshotNotFound));
  EXPECT_THAT(store_->Delete(snapshot_id), IsError(ErrorKind::kSnapshotNotFound));
  EXPECT_THAT(file_io_->FileExists(store_->ManifestLocation(snapshot_id)),
              HasValue(::testing::Eq(false)));
}

TEST_F(SnapshotStoreTest, FailedPublishLeavesNoSnapshot) {
  auto mock_io = std::make_shared<NiceMock<MockFileIO>>();
  mock_io->DelegateTo(file_io_);
  EXPECT_CALL(*mock_io, RenameFile(_, _)).WillOnce(Return(IOError("disk full")));

  SnapshotStore store(mock_io, std::string(kRoot));
  ASSERT_THAT(store.Open(), IsOk());
  auto result = store.Put(MakeManifest());
  EXPECT_THAT(result, IsError(ErrorKind::kIOError));
  EXPECT_TRUE(store.List().empty());
  EXPECT_THAT(file_io_->ListFiles("/warehouse/_ss"),
              HasValue(::testing::IsEmpty()));
}

}  // namespace snaplake
