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

#include "snaplake/history_index.h"

#include <algorithm>
#include <mutex>

#include <nlohmann/json.hpp>

#include "snaplake/json_internal.h"
#include "snaplake/util/formatter.h"  // IWYU pragma: keep
#include "snaplake/util/json_util_internal.h"
#include "snaplake/util/logging.h"
#include "snaplake/util/macros.h"

namespace snaplake {

namespace {

constexpr std::string_view kEntrySuffix = ".json";
constexpr std::string_view kTempSuffix = ".tmp";

// Entry files are named by zero-padded sequence number so that they sort in
// ledger order.
std::string EntryFileName(int64_t sequence_number) {
  return std::format("{:020}{}", sequence_number, kEntrySuffix);
}

}  // namespace

HistoryIndex::HistoryIndex(std::shared_ptr<FileIO> io, std::string root)
    : io_(std::move(io)), root_(std::move(root)) {}

std::string HistoryIndex::LedgerDir(const TableId& table_id) const {
  return std::format("{}/{}/{}", root_, kHistoryDir, table_id);
}

std::string HistoryIndex::EntryLocation(const TableId& table_id,
                                        int64_t sequence_number) const {
  return std::format("{}/{}", LedgerDir(table_id), EntryFileName(sequence_number));
}

std::shared_ptr<HistoryIndex::Ledger> HistoryIndex::GetLedger(
    const TableId& table_id) const {
  std::shared_lock lock(mutex_);
  auto it = ledgers_.find(table_id);
  return it == ledgers_.end() ? nullptr : it->second;
}

std::shared_ptr<HistoryIndex::Ledger> HistoryIndex::GetOrCreateLedger(
    const TableId& table_id) {
  if (auto ledger = GetLedger(table_id)) {
    return ledger;
  }
  std::unique_lock lock(mutex_);
  return ledgers_.try_emplace(table_id, std::make_shared<Ledger>()).first->second;
}

Result<int64_t> HistoryIndex::Append(const TableId& table_id,
                                     const SnapshotId& snapshot_id) {
  return AppendImpl(table_id, snapshot_id, std::nullopt);
}

Result<int64_t> HistoryIndex::Append(const TableId& table_id,
                                     const SnapshotId& snapshot_id,
                                     int64_t expected_sequence) {
  return AppendImpl(table_id, snapshot_id, expected_sequence);
}

Result<int64_t> HistoryIndex::AppendImpl(const TableId& table_id,
                                         const SnapshotId& snapshot_id,
                                         std::optional<int64_t> expected_sequence) {
  auto ledger = GetOrCreateLedger(table_id);
  std::unique_lock lock(ledger->mutex);

  auto sequence_number = static_cast<int64_t>(ledger->entries.size());
  if (expected_sequence.has_value() && *expected_sequence != sequence_number) {
    return HistoryAppendConflict(
        "Cannot append snapshot {} to table {} at sequence {}: next sequence is {}",
        snapshot_id, table_id, *expected_sequence, sequence_number);
  }

  HistoryEntry entry{.table_id = table_id,
                     .snapshot_id = snapshot_id,
                     .sequence_number = sequence_number,
                     .timestamp_ms = CurrentTimePointMs()};
  // Keep the ledger's timestamps non-decreasing even if the wall clock steps back.
  if (!ledger->entries.empty() &&
      entry.timestamp_ms < ledger->entries.back().timestamp_ms) {
    entry.timestamp_ms = ledger->entries.back().timestamp_ms;
  }

  auto location = EntryLocation(table_id, sequence_number);
  auto temp_location = std::format("{}{}", location, kTempSuffix);
  SNAPLAKE_RETURN_UNEXPECTED(
      io_->WriteFile(temp_location, SafeDumpJson(ToJson(entry))));
  if (auto status = io_->RenameFile(temp_location, location); !status) {
    if (auto cleanup = io_->DeleteFile(temp_location); !cleanup) {
      Logger()->warn("Failed to delete unpublished history entry {}: {}", temp_location,
                     cleanup.error().message);
    }
    return std::unexpected<Error>(status.error());
  }

  ledger->entries.push_back(entry);
  Logger()->debug("Appended snapshot {} to table {} at sequence {}",
                  snapshot_id.ToString(), table_id.ToString(), sequence_number);
  return sequence_number;
}

Result<HistoryEntry> HistoryIndex::Latest(const TableId& table_id) const {
  auto ledger = GetLedger(table_id);
  if (ledger == nullptr) {
    return NoHistory("Table {} has no history", table_id);
  }
  std::shared_lock lock(ledger->mutex);
  if (ledger->entries.empty()) {
    return NoHistory("Table {} has no history", table_id);
  }
  return ledger->entries.back();
}

Result<HistoryEntry> HistoryIndex::At(const TableId& table_id,
                                      const HistoryPredicate& predicate) const {
  auto ledger = GetLedger(table_id);
  if (ledger == nullptr) {
    return NoHistory("Table {} has no history", table_id);
  }
  std::shared_lock lock(ledger->mutex);
  const auto& entries = ledger->entries;

  if (const auto* at_sequence = std::get_if<AtSequence>(&predicate)) {
    auto sequence_number = at_sequence->sequence_number;
    if (sequence_number < 0 || sequence_number >= static_cast<int64_t>(entries.size())) {
      return NotFound("Table {} has no history entry with sequence {}", table_id,
                      sequence_number);
    }
    return entries[sequence_number];
  }

  const auto& as_of = std::get<AsOfTime>(predicate);
  // Timestamps are non-decreasing along the ledger.
  auto it = std::ranges::upper_bound(entries, as_of.timestamp, std::less<>{},
                                     &HistoryEntry::timestamp_ms);
  if (it == entries.begin()) {
    return NotFound("Table {} has no history entry at or before {}", table_id,
                    FormatTimePointMs(as_of.timestamp));
  }
  return *std::prev(it);
}

std::vector<HistoryEntry> HistoryIndex::Entries(const TableId& table_id) const {
  auto ledger = GetLedger(table_id);
  if (ledger == nullptr) {
    return {};
  }
  std::shared_lock lock(ledger->mutex);
  return ledger->entries;
}

int64_t HistoryIndex::Size(const TableId& table_id) const {
  auto ledger = GetLedger(table_id);
  if (ledger == nullptr) {
    return 0;
  }
  std::shared_lock lock(ledger->mutex);
  return static_cast<int64_t>(ledger->entries.size());
}

bool HistoryIndex::Contains(const TableId& table_id) const {
  return GetLedger(table_id) != nullptr;
}

Status HistoryIndex::Load(const TableId& table_id) {
  auto dir = LedgerDir(table_id);
  SNAPLAKE_ASSIGN_OR_RAISE(auto names, io_->ListFiles(dir));

  std::vector<HistoryEntry> entries;
  for (const auto& name : names) {
    if (!name.ends_with(kEntrySuffix)) {
      continue;
    }
    auto location = std::format("{}/{}", dir, name);
    SNAPLAKE_ASSIGN_OR_RAISE(auto content, io_->ReadFile(location, std::nullopt));
    auto entry = ParseJson(content).and_then(HistoryEntryFromJson);
    if (!entry.has_value()) {
      return InvalidHistory("Cannot read history entry {}: {}", location, entry.error());
    }
    if (entry->table_id != table_id) {
      return InvalidHistory("History entry {} belongs to table {}", location,
                            entry->table_id);
    }
    entries.push_back(std::move(entry.value()));
  }

  std::ranges::sort(entries, {}, &HistoryEntry::sequence_number);
  for (size_t i = 0; i < entries.size(); ++i) {
    if (entries[i].sequence_number != static_cast<int64_t>(i)) {
      return InvalidHistory("History of table {} has a gap: expected sequence {}, got {}",
                            table_id, i, entries[i].sequence_number);
    }
  }

  auto ledger = GetOrCreateLedger(table_id);
  std::unique_lock lock(ledger->mutex);
  ledger->entries = std::move(entries);
  return {};
}

Status HistoryIndex::Purge(const TableId& table_id) {
  auto ledger = GetLedger(table_id);
  if (ledger != nullptr) {
    // Wait for an in-flight append before the files disappear underneath it.
    std::unique_lock ledger_lock(ledger->mutex);
    SNAPLAKE_RETURN_UNEXPECTED(io_->DeleteDir(LedgerDir(table_id)));
    ledger->entries.clear();
  } else {
    SNAPLAKE_RETURN_UNEXPECTED(io_->DeleteDir(LedgerDir(table_id)));
  }
  std::unique_lock lock(mutex_);
  ledgers_.erase(table_id);
  return {};
}

Result<std::vector<TableId>> HistoryIndex::ListTableIds() const {
  SNAPLAKE_ASSIGN_OR_RAISE(auto names,
                           io_->ListDirs(std::format("{}/{}", root_, kHistoryDir)));
  std::vector<TableId> table_ids;
  for (const auto& name : names) {
    auto table_id = TableId::FromString(name);
    if (!table_id.has_value()) {
      Logger()->warn("Ignoring unexpected directory {} in history directory", name);
      continue;
    }
    table_ids.push_back(*table_id);
  }
  return table_ids;
}

}  // namespace snaplake
