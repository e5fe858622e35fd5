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

/// \file snaplake/history_index.h
/// Append-only, per-table ledger of snapshot transitions.

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <variant>
#include <vector>

#include "snaplake/file_io.h"
#include "snaplake/result.h"
#include "snaplake/snaplake_export.h"
#include "snaplake/snapshot.h"
#include "snaplake/table_identifier.h"
#include "snaplake/util/timepoint.h"

namespace snaplake {

/// \brief One transition of a table's current snapshot.
struct SNAPLAKE_EXPORT HistoryEntry {
  TableId table_id;
  SnapshotId snapshot_id;
  /// Position in the ledger, starting at 0 without gaps.
  int64_t sequence_number;
  TimePointMs timestamp_ms;

  friend bool operator==(const HistoryEntry& lhs, const HistoryEntry& rhs) = default;
};

/// \brief Select the most recent entry at or before a point in time.
struct SNAPLAKE_EXPORT AsOfTime {
  TimePointMs timestamp;
};

/// \brief Select the entry with the given sequence number.
struct SNAPLAKE_EXPORT AtSequence {
  int64_t sequence_number;
};

/// \brief Predicate for time-travel lookups into the history.
using HistoryPredicate = std::variant<AsOfTime, AtSequence>;

/// \brief Durable append-only ledgers, one per table.
///
/// Each entry is persisted as its own JSON file
/// `<root>/_history/<table id>/<sequence>.json` (written to a temporary file and
/// renamed into place) before the in-memory ledger advances, so a successful
/// Append is durable. Appends to one table are serialized; appends to distinct
/// tables do not block each other. Readers never observe a partial append.
class SNAPLAKE_EXPORT HistoryIndex {
 public:
  static constexpr std::string_view kHistoryDir = "_history";

  /// \brief Create a history index rooted at the warehouse location.
  HistoryIndex(std::shared_ptr<FileIO> io, std::string root);

  /// \brief Append a snapshot to the table's ledger.
  ///
  /// \return the sequence number assigned to the entry.
  Result<int64_t> Append(const TableId& table_id, const SnapshotId& snapshot_id);

  /// \brief Append a snapshot, failing with HistoryAppendConflict unless the
  /// assigned sequence number would be `expected_sequence`.
  Result<int64_t> Append(const TableId& table_id, const SnapshotId& snapshot_id,
                         int64_t expected_sequence);

  /// \brief The most recent entry, or NoHistory when the ledger is empty.
  Result<HistoryEntry> Latest(const TableId& table_id) const;

  /// \brief Time-travel lookup. NotFound when no entry matches.
  Result<HistoryEntry> At(const TableId& table_id,
                          const HistoryPredicate& predicate) const;

  /// \brief All entries of a table, in sequence order.
  std::vector<HistoryEntry> Entries(const TableId& table_id) const;

  /// \brief Number of entries of a table.
  int64_t Size(const TableId& table_id) const;

  /// \brief Whether the table's ledger has been loaded or appended to.
  bool Contains(const TableId& table_id) const;

  /// \brief Load a table's ledger from storage, replacing any in-memory state.
  ///
  /// Fails with InvalidHistory when the persisted sequence numbers are not
  /// gapless from 0 or an entry belongs to another table.
  Status Load(const TableId& table_id);

  /// \brief Delete a table's ledger, in memory and on storage.
  Status Purge(const TableId& table_id);

  /// \brief Ids of all tables with a ledger on storage.
  Result<std::vector<TableId>> ListTableIds() const;

 private:
  struct Ledger {
    mutable std::shared_mutex mutex;
    std::vector<HistoryEntry> entries;
  };

  std::shared_ptr<Ledger> GetLedger(const TableId& table_id) const;
  std::shared_ptr<Ledger> GetOrCreateLedger(const TableId& table_id);

  Result<int64_t> AppendImpl(const TableId& table_id, const SnapshotId& snapshot_id,
                             std::optional<int64_t> expected_sequence);

  std::string LedgerDir(const TableId& table_id) const;
  std::string EntryLocation(const TableId& table_id, int64_t sequence_number) const;

  std::shared_ptr<FileIO> io_;
  std::string root_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<TableId, std::shared_ptr<Ledger>> ledgers_;
};

}  // namespace snaplake
