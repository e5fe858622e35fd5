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

#include "snaplake/parquet/parquet_io.h"

#include <memory>
#include <string>

#include <arrow/api.h>
#include <arrow/util/compression.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "snaplake/arrow/arrow_fs_file_io.h"
#include "snaplake/arrow/arrow_schema_internal.h"
#include "snaplake/test/matchers.h"
#include "snaplake/test/test_common.h"

namespace snaplake {

using ::testing::ElementsAre;

class ParquetIoTest : public ::testing::Test {
 protected:
  void SetUp() override { file_io_ = arrow::MakeMockFileIO(); }

  static constexpr std::string_view kLocation = "/warehouse/t/_b/data.parquet";
  std::shared_ptr<FileIO> file_io_;
};

TEST_F(ParquetIoTest, WriteAndRead) {
  auto table = MakeIntTable({3, std::nullopt, 1, 7});
  SNAPLAKE_UNWRAP_OR_FAIL(
      auto data_file,
      parquet::WriteDataFile(*file_io_, std::string(kLocation), IntSchema(), *table));

  EXPECT_EQ(data_file.location, kLocation);
  EXPECT_EQ(data_file.record_count, 4);
  EXPECT_GT(data_file.file_size_in_bytes, 0);
  SNAPLAKE_UNWRAP_OR_FAIL(auto content,
                          file_io_->ReadFile(std::string(kLocation), std::nullopt));
  EXPECT_EQ(static_cast<int64_t>(content.size()), data_file.file_size_in_bytes);

  SNAPLAKE_UNWRAP_OR_FAIL(auto read,
                          parquet::ReadDataFile(*file_io_, data_file, IntSchema()));
  EXPECT_EQ(read->num_rows(), 4);
  EXPECT_EQ(read->column(0)->null_count(), 1);
  EXPECT_THAT(IntValues(*read), ElementsAre(3, 1, 7));
  EXPECT_TRUE(read->schema()->Equals(*arrow::ToArrowSchema(IntSchema())));
}

TEST_F(ParquetIoTest, ColumnStats) {
  auto table = MakeIntTable({3, std::nullopt, -1, 7});
  auto stats = parquet::ComputeColumnStats(IntSchema(), *table);
  ASSERT_EQ(stats.size(), 1);
  EXPECT_EQ(stats[0],
            (ColumnStats{.column = "c", .null_count = 1, .min = -1, .max = 7}));

  auto all_null = MakeIntTable({std::nullopt});
  stats = parquet::ComputeColumnStats(IntSchema(), *all_null);
  EXPECT_EQ(stats[0], (ColumnStats{.column = "c", .null_count = 1}));
}

TEST_F(ParquetIoTest, MixedColumns) {
  Schema schema({Column{.name = "id", .type = ColumnType::kInt64, .nullable = false},
                 Column{.name = "name", .type = ColumnType::kString}});
  ::arrow::Int64Builder ids;
  ::arrow::StringBuilder names;
  ASSERT_TRUE(ids.Append(10).ok());
  ASSERT_TRUE(ids.Append(20).ok());
  ASSERT_TRUE(names.Append("a").ok());
  ASSERT_TRUE(names.AppendNull().ok());
  std::shared_ptr<::arrow::Array> id_array;
  std::shared_ptr<::arrow::Array> name_array;
  ASSERT_TRUE(ids.Finish(&id_array).ok());
  ASSERT_TRUE(names.Finish(&name_array).ok());
  auto table = ::arrow::Table::Make(
      ::arrow::schema({::arrow::field("id", ::arrow::int64()),
                       ::arrow::field("name", ::arrow::utf8())}),
      {id_array, name_array});

  SNAPLAKE_UNWRAP_OR_FAIL(
      auto data_file,
      parquet::WriteDataFile(*file_io_, std::string(kLocation), schema, *table));
  ASSERT_EQ(data_file.column_stats.size(), 2);
  EXPECT_EQ(data_file.column_stats[0],
            (ColumnStats{.column = "id", .null_count = 0, .min = 10, .max = 20}));
  EXPECT_EQ(data_file.column_stats[1], (ColumnStats{.column = "name", .null_count = 1}));

  SNAPLAKE_UNWRAP_OR_FAIL(auto read, parquet::ReadDataFile(*file_io_, data_file, schema));
  EXPECT_EQ(read->num_rows(), 2);
  // The declared nullability wins over the input's Arrow schema.
  EXPECT_FALSE(read->schema()->field(0)->nullable());
}

TEST_F(ParquetIoTest, RejectsMismatchedTable) {
  auto table = MakeIntTable({1}, "other");
  auto result = parquet::WriteDataFile(*file_io_, std::string(kLocation), IntSchema(),
                                       *table);
  EXPECT_THAT(result, IsError(ErrorKind::kInvalidSchema));
  EXPECT_THAT(result, HasErrorMessage("must be named 'c'"));
  EXPECT_THAT(file_io_->FileExists(std::string(kLocation)),
              HasValue(::testing::Eq(false)));
}

TEST_F(ParquetIoTest, RejectsNullsInRequiredColumn) {
  Schema schema({Column{.name = "c", .type = ColumnType::kInt32, .nullable = false}});
  auto table = MakeIntTable({1, std::nullopt});
  auto result = parquet::WriteDataFile(*file_io_, std::string(kLocation), schema, *table);
  EXPECT_THAT(result, IsError(ErrorKind::kInvalidSchema));
  EXPECT_THAT(result, HasErrorMessage("is not nullable"));
}

TEST_F(ParquetIoTest, MissingFile) {
  DataFile data_file{.location = std::string(kLocation), .record_count = 1};
  auto result = parquet::ReadDataFile(*file_io_, data_file, IntSchema());
  EXPECT_THAT(result, IsError(ErrorKind::kCorruptSnapshotReference));
  EXPECT_THAT(result, HasErrorMessage("is missing"));
}

TEST_F(ParquetIoTest, GarbageFile) {
  ASSERT_THAT(file_io_->WriteFile(std::string(kLocation), "definitely not parquet"),
              IsOk());
  DataFile data_file{.location = std::string(kLocation), .record_count = 1};
  EXPECT_THAT(parquet::ReadDataFile(*file_io_, data_file, IntSchema()),
              IsError(ErrorKind::kCorruptSnapshotReference));
}

TEST_F(ParquetIoTest, RecordCountMismatch) {
  SNAPLAKE_UNWRAP_OR_FAIL(auto data_file,
                          parquet::WriteDataFile(*file_io_, std::string(kLocation),
                                                 IntSchema(), *MakeIntTable({1, 2})));
  data_file.record_count = 3;
  auto result = parquet::ReadDataFile(*file_io_, data_file, IntSchema());
  EXPECT_THAT(result, IsError(ErrorKind::kCorruptSnapshotReference));
  EXPECT_THAT(result, HasErrorMessage("manifest lists 3"));
}

TEST_F(ParquetIoTest, SchemaMismatchOnRead) {
  SNAPLAKE_UNWRAP_OR_FAIL(auto data_file,
                          parquet::WriteDataFile(*file_io_, std::string(kLocation),
                                                 IntSchema(), *MakeIntTable({1})));
  EXPECT_THAT(parquet::ReadDataFile(*file_io_, data_file, IntSchema("d")),
              IsError(ErrorKind::kCorruptSnapshotReference));
}

TEST_F(ParquetIoTest, WriterOptions) {
  if (!::arrow::util::Codec::IsAvailable(::arrow::Compression::SNAPPY)) {
    GTEST_SKIP() << "Arrow was built without snappy";
  }
  parquet::WriterOptions options{.compression = "snappy", .row_group_rows = 2};
  auto table = MakeIntTable({1, 2, 3, 4, 5});
  SNAPLAKE_UNWRAP_OR_FAIL(auto data_file,
                          parquet::WriteDataFile(*file_io_, std::string(kLocation),
                                                 IntSchema(), *table, options));
  SNAPLAKE_UNWRAP_OR_FAIL(auto read,
                          parquet::ReadDataFile(*file_io_, data_file, IntSchema()));
  EXPECT_THAT(IntValues(*read), ElementsAre(1, 2, 3, 4, 5));

  options.compression = "lz5";
  EXPECT_THAT(parquet::WriteDataFile(*file_io_, "/warehouse/t/_b/other.parquet",
                                     IntSchema(), *table, options),
              IsError(ErrorKind::kInvalidArgument));
}

}  // namespace snaplake
