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

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "snaplake/util/json_util_internal.h"
#include "snaplake/util/macros.h"

namespace snaplake {

namespace {

// Schema constants
constexpr std::string_view kColumns = "columns";
constexpr std::string_view kName = "name";
constexpr std::string_view kType = "type";
constexpr std::string_view kNullable = "nullable";

// Data file constants
constexpr std::string_view kLocation = "location";
constexpr std::string_view kRecordCount = "record-count";
constexpr std::string_view kFileSizeInBytes = "file-size-in-bytes";
constexpr std::string_view kColumnStats = "column-stats";
constexpr std::string_view kColumn = "column";
constexpr std::string_view kNullCount = "null-count";
constexpr std::string_view kMin = "min";
constexpr std::string_view kMax = "max";

// Snapshot constants
constexpr std::string_view kSnapshotId = "snapshot-id";
constexpr std::string_view kParentSnapshotId = "parent-snapshot-id";
constexpr std::string_view kTimestampMs = "timestamp-ms";
constexpr std::string_view kSchema = "schema";
constexpr std::string_view kDataFiles = "data-files";
constexpr std::string_view kSummary = "summary";
constexpr std::string_view kTotalRecords = "total-records";
constexpr std::string_view kTotalFileSize = "total-files-size";
constexpr std::string_view kTotalDataFiles = "total-data-files";

// History constants
constexpr std::string_view kTableId = "table-id";
constexpr std::string_view kSequenceNumber = "sequence-number";

// Table metadata constants
constexpr std::string_view kFormatVersion = "format-version";
constexpr std::string_view kDatabase = "database";
constexpr std::string_view kTableName = "table-name";
constexpr std::string_view kOptions = "options";
constexpr std::string_view kCreatedAtMs = "created-at-ms";
constexpr std::string_view kSourceSnapshotId = "source-snapshot-id";
constexpr std::string_view kSourceLocator = "source-locator";

Result<SnapshotId> SnapshotIdFromJson(const nlohmann::json& json, std::string_view key) {
  SNAPLAKE_ASSIGN_OR_RAISE(auto str, GetJsonValue<std::string>(json, key));
  auto id = SnapshotId::FromString(str);
  if (!id.has_value()) {
    return JsonParseError("Invalid snapshot id '{}' in '{}'", str, key);
  }
  return *id;
}

Result<TableId> TableIdFromJson(const nlohmann::json& json, std::string_view key) {
  SNAPLAKE_ASSIGN_OR_RAISE(auto str, GetJsonValue<std::string>(json, key));
  auto id = TableId::FromString(str);
  if (!id.has_value()) {
    return JsonParseError("Invalid table id '{}' in '{}'", str, key);
  }
  return *id;
}

Result<TimePointMs> TimePointFromJson(const nlohmann::json& json, std::string_view key) {
  SNAPLAKE_ASSIGN_OR_RAISE(auto unix_ms, GetJsonValue<int64_t>(json, key));
  return TimePointMsFromUnixMs(unix_ms);
}

Result<TableIdentifier> IdentifierFromJson(const nlohmann::json& json) {
  TableIdentifier identifier;
  SNAPLAKE_ASSIGN_OR_RAISE(identifier.database,
                           GetJsonValue<std::string>(json, kDatabase));
  SNAPLAKE_ASSIGN_OR_RAISE(identifier.name, GetJsonValue<std::string>(json, kTableName));
  return identifier;
}

}  // namespace

nlohmann::json ToJson(const Schema& schema) {
  nlohmann::json columns = nlohmann::json::array();
  for (const auto& column : schema.columns()) {
    nlohmann::json json;
    json[kName] = column.name;
    json[kType] = ColumnTypeToString(column.type);
    json[kNullable] = column.nullable;
    columns.push_back(std::move(json));
  }
  nlohmann::json json;
  json[kColumns] = std::move(columns);
  return json;
}

Result<Schema> SchemaFromJson(const nlohmann::json& json) {
  SNAPLAKE_ASSIGN_OR_RAISE(auto columns_json,
                           GetJsonValue<nlohmann::json>(json, kColumns));
  if (!columns_json.is_array()) {
    return JsonParseError("Cannot parse schema columns from non-array: {}",
                          SafeDumpJson(columns_json));
  }
  std::vector<Column> columns;
  for (const auto& column_json : columns_json) {
    SNAPLAKE_ASSIGN_OR_RAISE(auto name, GetJsonValue<std::string>(column_json, kName));
    SNAPLAKE_ASSIGN_OR_RAISE(auto type_str,
                             GetJsonValue<std::string>(column_json, kType));
    SNAPLAKE_ASSIGN_OR_RAISE(auto type, ColumnTypeFromString(type_str));
    SNAPLAKE_ASSIGN_OR_RAISE(auto nullable,
                             GetJsonValueOrDefault<bool>(column_json, kNullable, true));
    columns.push_back(
        Column{.name = std::move(name), .type = type, .nullable = nullable});
  }
  return Schema::Make(std::move(columns));
}

nlohmann::json ToJson(const ColumnStats& stats) {
  nlohmann::json json;
  json[kColumn] = stats.column;
  json[kNullCount] = stats.null_count;
  SetOptionalField(json, kMin, stats.min);
  SetOptionalField(json, kMax, stats.max);
  return json;
}

Result<ColumnStats> ColumnStatsFromJson(const nlohmann::json& json) {
  ColumnStats stats;
  SNAPLAKE_ASSIGN_OR_RAISE(stats.column, GetJsonValue<std::string>(json, kColumn));
  SNAPLAKE_ASSIGN_OR_RAISE(stats.null_count,
                           GetJsonValueOrDefault<int64_t>(json, kNullCount));
  SNAPLAKE_ASSIGN_OR_RAISE(stats.min, GetJsonValueOptional<int64_t>(json, kMin));
  SNAPLAKE_ASSIGN_OR_RAISE(stats.max, GetJsonValueOptional<int64_t>(json, kMax));
  return stats;
}

nlohmann::json ToJson(const DataFile& data_file) {
  nlohmann::json json;
  json[kLocation] = data_file.location;
  json[kRecordCount] = data_file.record_count;
  json[kFileSizeInBytes] = data_file.file_size_in_bytes;
  if (!data_file.column_stats.empty()) {
    json[kColumnStats] = ToJsonList(data_file.column_stats);
  }
  return json;
}

Result<DataFile> DataFileFromJson(const nlohmann::json& json) {
  DataFile data_file;
  SNAPLAKE_ASSIGN_OR_RAISE(data_file.location,
                           GetJsonValue<std::string>(json, kLocation));
  SNAPLAKE_ASSIGN_OR_RAISE(data_file.record_count,
                           GetJsonValue<int64_t>(json, kRecordCount));
  SNAPLAKE_ASSIGN_OR_RAISE(data_file.file_size_in_bytes,
                           GetJsonValue<int64_t>(json, kFileSizeInBytes));
  SNAPLAKE_ASSIGN_OR_RAISE(
      data_file.column_stats,
      FromJsonList<ColumnStats>(json, kColumnStats, ColumnStatsFromJson));
  return data_file;
}

nlohmann::json ToJson(const Snapshot& snapshot) {
  nlohmann::json json;
  json[kSnapshotId] = snapshot.snapshot_id.ToString();
  if (snapshot.parent_snapshot_id.has_value()) {
    json[kParentSnapshotId] = snapshot.parent_snapshot_id->ToString();
  }
  json[kTimestampMs] = UnixMsFromTimePointMs(snapshot.timestamp_ms);
  json[kSchema] = ToJson(snapshot.schema);
  json[kDataFiles] = ToJsonList(snapshot.data_files);

  nlohmann::json summary;
  summary[kTotalRecords] = snapshot.summary.total_records;
  summary[kTotalFileSize] = snapshot.summary.total_file_size;
  summary[kTotalDataFiles] = snapshot.summary.total_data_files;
  json[kSummary] = std::move(summary);
  return json;
}

Result<Snapshot> SnapshotFromJson(const nlohmann::json& json) {
  SNAPLAKE_ASSIGN_OR_RAISE(auto snapshot_id, SnapshotIdFromJson(json, kSnapshotId));
  std::optional<SnapshotId> parent_snapshot_id;
  if (json.contains(kParentSnapshotId) && !json.at(kParentSnapshotId).is_null()) {
    SNAPLAKE_ASSIGN_OR_RAISE(parent_snapshot_id,
                             SnapshotIdFromJson(json, kParentSnapshotId));
  }
  SNAPLAKE_ASSIGN_OR_RAISE(auto timestamp_ms, TimePointFromJson(json, kTimestampMs));
  SNAPLAKE_ASSIGN_OR_RAISE(auto schema_json, GetJsonValue<nlohmann::json>(json, kSchema));
  SNAPLAKE_ASSIGN_OR_RAISE(auto schema, SchemaFromJson(schema_json));
  SNAPLAKE_ASSIGN_OR_RAISE(auto data_files,
                           FromJsonList<DataFile>(json, kDataFiles, DataFileFromJson));

  auto summary = SnapshotSummary::Of(data_files);
  return Snapshot{.snapshot_id = snapshot_id,
                  .parent_snapshot_id = parent_snapshot_id,
                  .timestamp_ms = timestamp_ms,
                  .schema = std::move(schema),
                  .data_files = std::move(data_files),
                  .summary = summary};
}

nlohmann::json ToJson(const HistoryEntry& entry) {
  nlohmann::json json;
  json[kTableId] = entry.table_id.ToString();
  json[kSnapshotId] = entry.snapshot_id.ToString();
  json[kSequenceNumber] = entry.sequence_number;
  json[kTimestampMs] = UnixMsFromTimePointMs(entry.timestamp_ms);
  return json;
}

Result<HistoryEntry> HistoryEntryFromJson(const nlohmann::json& json) {
  SNAPLAKE_ASSIGN_OR_RAISE(auto table_id, TableIdFromJson(json, kTableId));
  SNAPLAKE_ASSIGN_OR_RAISE(auto snapshot_id, SnapshotIdFromJson(json, kSnapshotId));
  SNAPLAKE_ASSIGN_OR_RAISE(auto sequence_number,
                           GetJsonValue<int64_t>(json, kSequenceNumber));
  SNAPLAKE_ASSIGN_OR_RAISE(auto timestamp_ms, TimePointFromJson(json, kTimestampMs));
  return HistoryEntry{.table_id = table_id,
                      .snapshot_id = snapshot_id,
                      .sequence_number = sequence_number,
                      .timestamp_ms = timestamp_ms};
}

nlohmann::json ToJson(const TableMetadata& metadata) {
  nlohmann::json json;
  json[kFormatVersion] = metadata.format_version;
  json[kTableId] = metadata.table_id.ToString();
  json[kDatabase] = metadata.identifier.database;
  json[kTableName] = metadata.identifier.name;
  json[kLocation] = metadata.location;
  json[kSchema] = ToJson(metadata.schema);
  json[kOptions] = metadata.options;
  json[kCreatedAtMs] = UnixMsFromTimePointMs(metadata.created_at);
  if (metadata.source_snapshot_id.has_value()) {
    json[kSourceSnapshotId] = metadata.source_snapshot_id->ToString();
  }
  SetOptionalField(json, kSourceLocator, metadata.source_locator);
  return json;
}

Result<TableMetadata> TableMetadataFromJson(const nlohmann::json& json) {
  SNAPLAKE_ASSIGN_OR_RAISE(auto format_version,
                           GetJsonValue<int8_t>(json, kFormatVersion));
  if (format_version > TableMetadata::kFormatVersion) {
    return JsonParseError("Cannot read unsupported table format version {}",
                          format_version);
  }
  SNAPLAKE_ASSIGN_OR_RAISE(auto table_id, TableIdFromJson(json, kTableId));
  SNAPLAKE_ASSIGN_OR_RAISE(auto identifier, IdentifierFromJson(json));
  SNAPLAKE_ASSIGN_OR_RAISE(auto location, GetJsonValue<std::string>(json, kLocation));
  SNAPLAKE_ASSIGN_OR_RAISE(auto schema_json, GetJsonValue<nlohmann::json>(json, kSchema));
  SNAPLAKE_ASSIGN_OR_RAISE(auto schema, SchemaFromJson(schema_json));
  SNAPLAKE_ASSIGN_OR_RAISE(
      auto options,
      (GetJsonValueOrDefault<std::unordered_map<std::string, std::string>>(json,
                                                                           kOptions)));
  SNAPLAKE_ASSIGN_OR_RAISE(auto created_at, TimePointFromJson(json, kCreatedAtMs));
  std::optional<SnapshotId> source_snapshot_id;
  if (json.contains(kSourceSnapshotId)) {
    SNAPLAKE_ASSIGN_OR_RAISE(source_snapshot_id,
                             SnapshotIdFromJson(json, kSourceSnapshotId));
  }
  SNAPLAKE_ASSIGN_OR_RAISE(auto source_locator,
                           GetJsonValueOptional<std::string>(json, kSourceLocator));
  return TableMetadata{.format_version = format_version,
                       .table_id = table_id,
                       .identifier = std::move(identifier),
                       .location = std::move(location),
                       .schema = std::move(schema),
                       .options = std::move(options),
                       .created_at = created_at,
                       .source_snapshot_id = source_snapshot_id,
                       .source_locator = std::move(source_locator)};
}

nlohmann::json ToJson(const TableIntent& intent) {
  nlohmann::json json;
  json[kTableId] = intent.table_id.ToString();
  json[kDatabase] = intent.identifier.database;
  json[kTableName] = intent.identifier.name;
  json[kSnapshotId] = intent.snapshot_id.ToString();
  json[kCreatedAtMs] = UnixMsFromTimePointMs(intent.created_at);
  return json;
}

Result<TableIntent> TableIntentFromJson(const nlohmann::json& json) {
  SNAPLAKE_ASSIGN_OR_RAISE(auto table_id, TableIdFromJson(json, kTableId));
  SNAPLAKE_ASSIGN_OR_RAISE(auto identifier, IdentifierFromJson(json));
  SNAPLAKE_ASSIGN_OR_RAISE(auto snapshot_id, SnapshotIdFromJson(json, kSnapshotId));
  SNAPLAKE_ASSIGN_OR_RAISE(auto created_at, TimePointFromJson(json, kCreatedAtMs));
  return TableIntent{.table_id = table_id,
                     .identifier = std::move(identifier),
                     .snapshot_id = snapshot_id,
                     .created_at = created_at};
}

nlohmann::json ToJson(const DatabaseMetadata& database) {
  nlohmann::json json;
  json[kName] = database.name;
  json[kCreatedAtMs] = UnixMsFromTimePointMs(database.created_at);
  return json;
}

Result<DatabaseMetadata> DatabaseMetadataFromJson(const nlohmann::json& json) {
  SNAPLAKE_ASSIGN_OR_RAISE(auto name, GetJsonValue<std::string>(json, kName));
  SNAPLAKE_ASSIGN_OR_RAISE(auto created_at, TimePointFromJson(json, kCreatedAtMs));
  return DatabaseMetadata{.name = std::move(name), .created_at = created_at};
}

}  // namespace snaplake
