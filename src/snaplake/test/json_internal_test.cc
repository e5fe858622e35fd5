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

#include "snaplake/json_internal.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "snaplake/history_index.h"
#include "snaplake/snapshot.h"
#include "snaplake/table_metadata.h"
#include "snaplake/test/matchers.h"
#include "snaplake/util/json_util_internal.h"
#include "snaplake/util/timepoint.h"

namespace snaplake {

namespace {

constexpr std::string_view kSnapshotIdText = "0190a6f8-c2d1-7abc-8def-0123456789ab";
constexpr std::string_view kParentIdText = "0190a6f8-c2d0-7000-8000-000000000001";
constexpr std::string_view kTableIdText = "0190a6f8-c000-7000-8000-00000000000a";

SnapshotId MustParseSnapshotId(std::string_view text) {
  return SnapshotId::FromString(text).value();
}

TableId MustParseTableId(std::string_view text) {
  return TableId::FromString(text).value();
}

}  // namespace

TEST(JsonInternalTest, Schema) {
  Schema schema({Column{.name = "c", .type = ColumnType::kInt32},
                 Column{.name = "s", .type = ColumnType::kString, .nullable = false}});
  auto json = ToJson(schema);
  auto expected = nlohmann::json::parse(R"({"columns": [
      {"name": "c", "type": "int", "nullable": true},
      {"name": "s", "type": "string", "nullable": false}]})");
  EXPECT_EQ(json, expected);
  EXPECT_THAT(SchemaFromJson(json), HasValue(::testing::Eq(schema)));
}

TEST(JsonInternalTest, SchemaNullableDefaultsToTrue) {
  auto json = nlohmann::json::parse(R"({"columns": [{"name": "c", "type": "bigint"}]})");
  EXPECT_THAT(SchemaFromJson(json),
              HasValue(::testing::Eq(
                  Schema({Column{.name = "c", .type = ColumnType::kInt64}}))));
}

TEST(JsonInternalTest, SchemaInvalid) {
  EXPECT_THAT(SchemaFromJson(nlohmann::json::parse(R"({"columns": 1})")),
              IsError(ErrorKind::kJsonParseError));
  auto unknown_type =
      nlohmann::json::parse(R"({"columns": [{"name": "c", "type": "x"}]})");
  EXPECT_THAT(SchemaFromJson(unknown_type), IsError(ErrorKind::kInvalidSchema));
}

TEST(JsonInternalTest, Snapshot) {
  auto json = nlohmann::json::parse(R"({
      "snapshot-id": "0190a6f8-c2d1-7abc-8def-0123456789ab",
      "parent-snapshot-id": "0190a6f8-c2d0-7000-8000-000000000001",
      "timestamp-ms": 1720000000000,
      "schema": {"columns": [{"name": "c", "type": "int", "nullable": true}]},
      "data-files": [
        {"location": "/wh/t/_b/1.parquet", "record-count": 1, "file-size-in-bytes": 100,
         "column-stats": [{"column": "c", "null-count": 0, "min": 1, "max": 1}]},
        {"location": "/wh/t/_b/2.parquet", "record-count": 2, "file-size-in-bytes": 50}
      ],
      "summary": {"total-records": 999, "total-files-size": 0, "total-data-files": 0}
  })");
  auto snapshot = SnapshotFromJson(json);
  ASSERT_THAT(snapshot, IsOk());
  EXPECT_EQ(snapshot->snapshot_id, MustParseSnapshotId(kSnapshotIdText));
  EXPECT_EQ(snapshot->parent_snapshot_id, MustParseSnapshotId(kParentIdText));
  EXPECT_EQ(snapshot->timestamp_ms, TimePointMsFromUnixMs(1720000000000));
  ASSERT_EQ(snapshot->data_files.size(), 2);
  EXPECT_EQ(snapshot->data_files[0].column_stats,
            (std::vector<ColumnStats>{
                ColumnStats{.column = "c", .null_count = 0, .min = 1, .max = 1}}));
  EXPECT_TRUE(snapshot->data_files[1].column_stats.empty());
  // The stored summary is ignored in favor of the data files.
  EXPECT_EQ(snapshot->summary, (SnapshotSummary{.total_records = 3,
                                                .total_file_size = 150,
                                                .total_data_files = 2}));

  auto reparsed = SnapshotFromJson(ToJson(*snapshot));
  EXPECT_THAT(reparsed, HasValue(::testing::Eq(snapshot.value())));
}

TEST(JsonInternalTest, SnapshotWithoutParent) {
  Snapshot snapshot{.snapshot_id = MustParseSnapshotId(kSnapshotIdText),
                    .timestamp_ms = TimePointMsFromUnixMs(1720000000000),
                    .schema = Schema({Column{.name = "c", .type = ColumnType::kInt32}})};
  auto json = ToJson(snapshot);
  EXPECT_FALSE(json.contains("parent-snapshot-id"));
  EXPECT_EQ(json["data-files"], nlohmann::json::array());
  EXPECT_THAT(SnapshotFromJson(json), HasValue(::testing::Eq(snapshot)));
}

TEST(JsonInternalTest, SnapshotInvalidId) {
  auto json = nlohmann::json::parse(R"({
      "snapshot-id": "S0",
      "timestamp-ms": 1,
      "schema": {"columns": [{"name": "c", "type": "int"}]},
      "data-files": []
  })");
  EXPECT_THAT(SnapshotFromJson(json), HasErrorMessage("Invalid snapshot id 'S0'"));
}

TEST(JsonInternalTest, HistoryEntry) {
  HistoryEntry entry{.table_id = MustParseTableId(kTableIdText),
                     .snapshot_id = MustParseSnapshotId(kSnapshotIdText),
                     .sequence_number = 3,
                     .timestamp_ms = TimePointMsFromUnixMs(1720000000123)};
  auto json = ToJson(entry);
  EXPECT_EQ(json["sequence-number"], 3);
  EXPECT_EQ(json["table-id"], std::string(kTableIdText));
  EXPECT_THAT(HistoryEntryFromJson(json), HasValue(::testing::Eq(entry)));

  json.erase("sequence-number");
  EXPECT_THAT(HistoryEntryFromJson(json), HasErrorMessage("Missing 'sequence-number'"));
}

TEST(JsonInternalTest, TableMetadata) {
  TableMetadata metadata{
      .table_id = MustParseTableId(kTableIdText),
      .identifier = TableIdentifier{.database = "default", .name = "t_clone1"},
      .location = "/wh/0190a6f8-c000-7000-8000-00000000000a",
      .schema = Schema({Column{.name = "c", .type = ColumnType::kInt32}}),
      .options = {{"comment", "clone"}},
      .created_at = TimePointMsFromUnixMs(1720000000000),
      .source_snapshot_id = MustParseSnapshotId(kSnapshotIdText),
      .source_locator = "_ss/0190a6f8-c2d1-7abc-8def-0123456789ab"};
  auto json = ToJson(metadata);
  EXPECT_EQ(json["format-version"], 1);
  EXPECT_EQ(json["table-name"], "t_clone1");
  EXPECT_THAT(TableMetadataFromJson(json), HasValue(::testing::Eq(metadata)));
}

TEST(JsonInternalTest, TableMetadataWithoutSource) {
  TableMetadata metadata{
      .table_id = MustParseTableId(kTableIdText),
      .identifier = TableIdentifier{.database = "default", .name = "t"},
      .location = "/wh/t",
      .schema = Schema({Column{.name = "c", .type = ColumnType::kInt32}}),
      .created_at = TimePointMsFromUnixMs(1720000000000)};
  auto json = ToJson(metadata);
  EXPECT_FALSE(json.contains("source-snapshot-id"));
  auto parsed = TableMetadataFromJson(json);
  ASSERT_THAT(parsed, IsOk());
  EXPECT_FALSE(parsed->is_clone());
  EXPECT_EQ(parsed.value(), metadata);
}

TEST(JsonInternalTest, TableMetadataUnsupportedVersion) {
  TableMetadata metadata{
      .table_id = MustParseTableId(kTableIdText),
      .identifier = TableIdentifier{.database = "default", .name = "t"},
      .location = "/wh/t",
      .schema = Schema({Column{.name = "c", .type = ColumnType::kInt32}}),
      .created_at = TimePointMsFromUnixMs(0)};
  auto json = ToJson(metadata);
  json["format-version"] = 2;
  EXPECT_THAT(TableMetadataFromJson(json),
              HasErrorMessage("unsupported table format version 2"));
}

TEST(JsonInternalTest, TableIntentAndDatabase) {
  TableIntent intent{.table_id = MustParseTableId(kTableIdText),
                     .identifier = TableIdentifier{.database = "db", .name = "t"},
                     .snapshot_id = MustParseSnapshotId(kSnapshotIdText),
                     .created_at = TimePointMsFromUnixMs(42)};
  EXPECT_THAT(TableIntentFromJson(ToJson(intent)), HasValue(::testing::Eq(intent)));

  DatabaseMetadata database{.name = "db", .created_at = TimePointMsFromUnixMs(42)};
  EXPECT_THAT(DatabaseMetadataFromJson(ToJson(database)),
              HasValue(::testing::Eq(database)));
}

TEST(JsonInternalTest, ParseJson) {
  EXPECT_THAT(ParseJson("{\"a\": 1}"), IsOk());
  EXPECT_THAT(ParseJson("{\"a\": "), IsError(ErrorKind::kJsonParseError));
}

}  // namespace snaplake
