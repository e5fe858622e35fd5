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

#include "snaplake/table.h"

#include <algorithm>
#include <format>
#include <mutex>
#include <utility>

#include <arrow/table.h>

#include "snaplake/arrow/arrow_error_transform_internal.h"
#include "snaplake/arrow/arrow_schema_internal.h"
#include "snaplake/exception.h"
#include "snaplake/parquet/parquet_io.h"
#include "snaplake/util/formatter.h"  // IWYU pragma: keep
#include "snaplake/util/logging.h"
#include "snaplake/util/macros.h"
#include "snaplake/util/uuid.h"

namespace snaplake {

namespace {

constexpr std::string_view kDataDir = "_b";

Result<parquet::WriterOptions> MakeWriterOptions(const TableOptions& options) {
  try {
    return parquet::WriterOptions{
        .compression = options.Get(TableOptions::kParquetCompression),
        .row_group_rows = options.Get(TableOptions::kParquetRowGroupRows)};
  } catch (const SnaplakeError& e) {
    return InvalidArgument("Invalid writer option: {}", e.what());
  }
}

}  // namespace

Table::Table(std::shared_ptr<TableEntry> entry, std::shared_ptr<SnapshotStore> store,
             std::shared_ptr<HistoryIndex> history,
             std::shared_ptr<LivenessTracker> tracker)
    : entry_(std::move(entry)),
      store_(std::move(store)),
      history_(std::move(history)),
      tracker_(std::move(tracker)) {}

std::optional<SnapshotId> Table::current_snapshot_id() const {
  auto latest = history_->Latest(table_id());
  if (!latest.has_value()) {
    return std::nullopt;
  }
  return latest->snapshot_id;
}

std::vector<HistoryEntry> Table::history() const { return history_->Entries(table_id()); }

Table::State Table::state() const {
  if (entry_->dropped.load()) {
    return State::kDropped;
  }
  int64_t inherited = metadata().is_clone() ? 1 : 0;
  return history_->Size(table_id()) > inherited ? State::kActive : State::kCreated;
}

Status Table::CheckNotDropped() const {
  if (entry_->dropped.load()) {
    return NoSuchTable("Table {} has been dropped", name().ToString());
  }
  return {};
}

Result<SnapshotId> Table::Append(const ::arrow::Table& data) {
  std::lock_guard lock(entry_->commit_mutex);
  SNAPLAKE_RETURN_UNEXPECTED(CheckNotDropped());
  SNAPLAKE_RETURN_UNEXPECTED(arrow::ValidateArrowTable(schema(), data));
  SNAPLAKE_ASSIGN_OR_RAISE(auto writer_options, MakeWriterOptions(options()));

  SnapshotManifest manifest{.schema = schema()};
  int64_t expected_sequence = 0;
  auto latest = history_->Latest(table_id());
  if (latest.has_value()) {
    SNAPLAKE_ASSIGN_OR_RAISE(
        auto parent, store_->GetReferenced(latest->snapshot_id, name().ToString()));
    manifest.parent_snapshot_id = parent->snapshot_id;
    manifest.data_files = parent->data_files;
    expected_sequence = latest->sequence_number + 1;
  } else if (latest.error().kind != ErrorKind::kNoHistory) {
    return std::unexpected(latest.error());
  }

  auto data_location = std::format("{}/{}/{}.parquet", location(), kDataDir,
                                   Uuid::GenerateMonotonicV7().ToString());
  SNAPLAKE_ASSIGN_OR_RAISE(
      auto data_file, parquet::WriteDataFile(*store_->io(), data_location, schema(),
                                             data, writer_options));
  manifest.data_files.push_back(std::move(data_file));

  SNAPLAKE_ASSIGN_OR_RAISE(auto snapshot_id,
                           tracker_->PutAndAcquire(table_id(), manifest));
  auto sequence = history_->Append(table_id(), snapshot_id, expected_sequence);
  if (!sequence.has_value()) {
    // The unreferenced snapshot and its new file are left to the sweep.
    if (auto status = tracker_->Release(table_id(), snapshot_id); !status) {
      Logger()->warn("Failed to release snapshot {} of {}: {}", snapshot_id.ToString(),
                     name().ToString(), status.error().message);
    }
    return std::unexpected(sequence.error());
  }
  Logger()->debug("Committed snapshot {} to {} at sequence {}", snapshot_id.ToString(),
                  name().ToString(), sequence.value());
  return snapshot_id;
}

Result<std::shared_ptr<::arrow::Table>> Table::Scan() const {
  SNAPLAKE_RETURN_UNEXPECTED(CheckNotDropped());
  auto current = current_snapshot_id();
  if (!current.has_value()) {
    SNAPLAKE_ARROW_ASSIGN_OR_RETURN(
        auto empty, ::arrow::Table::MakeEmpty(arrow::ToArrowSchema(schema())));
    return empty;
  }
  return ReadSnapshot(*current);
}

Result<std::shared_ptr<::arrow::Table>> Table::Scan(const SnapshotId& snapshot_id) const {
  SNAPLAKE_RETURN_UNEXPECTED(CheckNotDropped());
  auto entries = history();
  if (std::ranges::none_of(entries, [&](const HistoryEntry& entry) {
        return entry.snapshot_id == snapshot_id;
      })) {
    return SnapshotNotFound("Snapshot {} is not in the history of {}", snapshot_id,
                            name().ToString());
  }
  return ReadSnapshot(snapshot_id);
}

Result<std::shared_ptr<::arrow::Table>> Table::Scan(
    const HistoryPredicate& predicate) const {
  SNAPLAKE_RETURN_UNEXPECTED(CheckNotDropped());
  SNAPLAKE_ASSIGN_OR_RAISE(auto entry, history_->At(table_id(), predicate));
  return ReadSnapshot(entry.snapshot_id);
}

Result<std::shared_ptr<::arrow::Table>> Table::ReadSnapshot(
    const SnapshotId& snapshot_id) const {
  SNAPLAKE_ASSIGN_OR_RAISE(auto snapshot,
                           store_->GetReferenced(snapshot_id, name().ToString()));
  if (snapshot->data_files.empty()) {
    SNAPLAKE_ARROW_ASSIGN_OR_RETURN(
        auto empty, ::arrow::Table::MakeEmpty(arrow::ToArrowSchema(snapshot->schema)));
    return empty;
  }
  std::vector<std::shared_ptr<::arrow::Table>> tables;
  tables.reserve(snapshot->data_files.size());
  for (const auto& data_file : snapshot->data_files) {
    SNAPLAKE_ASSIGN_OR_RAISE(
        auto table, parquet::ReadDataFile(*store_->io(), data_file, snapshot->schema));
    tables.push_back(std::move(table));
  }
  SNAPLAKE_ARROW_ASSIGN_OR_RETURN(auto result, ::arrow::ConcatenateTables(tables));
  return result;
}

std::string_view ToString(Table::State state) {
  switch (state) {
    case Table::State::kCreated:
      return "created";
    case Table::State::kActive:
      return "active";
    case Table::State::kDropped:
      return "dropped";
  }
  std::unreachable();
}

}  // namespace snaplake
