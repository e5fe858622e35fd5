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

#pragma once

/// \file snaplake/json_internal.h
/// \brief JSON encoding of every durable record.

#include <nlohmann/json_fwd.hpp>

#include "snaplake/history_index.h"
#include "snaplake/result.h"
#include "snaplake/schema.h"
#include "snaplake/snaplake_export.h"
#include "snaplake/snapshot.h"
#include "snaplake/table_metadata.h"

namespace snaplake {

/// \brief Serializes a `Schema` as a list of `{"name", "type", "nullable"}` objects.
SNAPLAKE_EXPORT nlohmann::json ToJson(const Schema& schema);

/// \brief Deserializes a `Schema`, validating column names.
SNAPLAKE_EXPORT Result<Schema> SchemaFromJson(const nlohmann::json& json);

SNAPLAKE_EXPORT nlohmann::json ToJson(const ColumnStats& stats);
SNAPLAKE_EXPORT Result<ColumnStats> ColumnStatsFromJson(const nlohmann::json& json);

SNAPLAKE_EXPORT nlohmann::json ToJson(const DataFile& data_file);
SNAPLAKE_EXPORT Result<DataFile> DataFileFromJson(const nlohmann::json& json);

/// \brief Serializes a `Snapshot` manifest.
///
/// The summary is written for inspection only; it is recomputed from the data
/// files when the manifest is read back.
SNAPLAKE_EXPORT nlohmann::json ToJson(const Snapshot& snapshot);

/// \brief Deserializes a `Snapshot` manifest.
SNAPLAKE_EXPORT Result<Snapshot> SnapshotFromJson(const nlohmann::json& json);

SNAPLAKE_EXPORT nlohmann::json ToJson(const HistoryEntry& entry);
SNAPLAKE_EXPORT Result<HistoryEntry> HistoryEntryFromJson(const nlohmann::json& json);

SNAPLAKE_EXPORT nlohmann::json ToJson(const TableMetadata& metadata);
SNAPLAKE_EXPORT Result<TableMetadata> TableMetadataFromJson(const nlohmann::json& json);

SNAPLAKE_EXPORT nlohmann::json ToJson(const TableIntent& intent);
SNAPLAKE_EXPORT Result<TableIntent> TableIntentFromJson(const nlohmann::json& json);

SNAPLAKE_EXPORT nlohmann::json ToJson(const DatabaseMetadata& database);
SNAPLAKE_EXPORT Result<DatabaseMetadata> DatabaseMetadataFromJson(
    const nlohmann::json& json);

}  // namespace snaplake
