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

/// \file snaplake/table.h
/// Handle to a registered table.

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <arrow/type_fwd.h>

#include "snaplake/catalog/warehouse_catalog.h"
#include "snaplake/history_index.h"
#include "snaplake/liveness_tracker.h"
#include "snaplake/result.h"
#include "snaplake/schema.h"
#include "snaplake/snaplake_export.h"
#include "snaplake/snapshot.h"
#include "snaplake/snapshot_store.h"
#include "snaplake/table_identifier.h"
#include "snaplake/table_metadata.h"
#include "snaplake/table_options.h"

namespace snaplake {

/// \brief Represents a snaplake table
///
/// A handle stays usable after the table is dropped; state() then reports
/// kDropped and Append and Scan fail with NoSuchTable.
class SNAPLAKE_EXPORT Table {
 public:
  /// \brief Lifecycle of a table.
  enum class State : uint8_t {
    /// Created, empty or holding only the snapshot it was cloned from.
    kCreated,
    /// At least one snapshot of its own was committed.
    kActive,
    kDropped,
  };

  /// \brief Construct a table handle.
  /// \param[in] entry The catalog entry of the table.
  /// \param[in] store The snapshot store of the warehouse.
  /// \param[in] history The history index of the warehouse.
  /// \param[in] tracker The liveness tracker of the warehouse.
  Table(std::shared_ptr<TableEntry> entry, std::shared_ptr<SnapshotStore> store,
        std::shared_ptr<HistoryIndex> history, std::shared_ptr<LivenessTracker> tracker);

  /// \brief Return the identifier of this table
  const TableIdentifier& name() const { return entry_->metadata.identifier; }

  /// \brief Return the id of this table
  const TableId& table_id() const { return entry_->metadata.table_id; }

  const TableMetadata& metadata() const { return entry_->metadata; }

  const Schema& schema() const { return entry_->metadata.schema; }

  /// \brief Return the table's base location
  std::string_view location() const { return entry_->metadata.location; }

  TableOptions options() const { return TableOptions::FromMap(entry_->metadata.options); }

  /// \brief Return the id of the current snapshot, if the table has one
  std::optional<SnapshotId> current_snapshot_id() const;

  /// \brief Return the snapshot history of this table, oldest first
  std::vector<HistoryEntry> history() const;

  State state() const;

  /// \brief Commit `data` as a new snapshot.
  ///
  /// The data is written to one Parquet file under `<location>/_b/`. The new
  /// snapshot lists the files of the current snapshot plus the new one.
  ///
  /// \return the new snapshot id, InvalidSchema if `data` does not fit the
  /// table schema, NoSuchTable if the table was dropped.
  Result<SnapshotId> Append(const ::arrow::Table& data);

  /// \brief Read the current snapshot.
  ///
  /// A table without snapshots reads as an empty table with the table schema.
  /// A snapshot in the history whose manifest is gone is
  /// CorruptSnapshotReference.
  Result<std::shared_ptr<::arrow::Table>> Scan() const;

  /// \brief Read a snapshot from this table's history.
  ///
  /// \return SnapshotNotFound if the snapshot is not in the history.
  Result<std::shared_ptr<::arrow::Table>> Scan(const SnapshotId& snapshot_id) const;

  /// \brief Read the snapshot selected by a time-travel predicate.
  Result<std::shared_ptr<::arrow::Table>> Scan(const HistoryPredicate& predicate) const;

 private:
  Status CheckNotDropped() const;
  Result<std::shared_ptr<::arrow::Table>> ReadSnapshot(
      const SnapshotId& snapshot_id) const;

  std::shared_ptr<TableEntry> entry_;
  std::shared_ptr<SnapshotStore> store_;
  std::shared_ptr<HistoryIndex> history_;
  std::shared_ptr<LivenessTracker> tracker_;
};

SNAPLAKE_EXPORT std::string_view ToString(Table::State state);

}  // namespace snaplake
