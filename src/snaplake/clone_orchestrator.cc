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

#include <string_view>

#include "snaplake/locator.h"
#include "snaplake/util/formatter.h"  // IWYU pragma: keep
#include "snaplake/util/logging.h"
#include "snaplake/util/macros.h"

namespace snaplake {

namespace {

Status CheckCancelled(const std::stop_token& stop_token,
                      const TableIdentifier& identifier, std::string_view step) {
  if (stop_token.stop_requested()) {
    return OperationCancelled("Clone of {} cancelled before {}", identifier.ToString(),
                              step);
  }
  return {};
}

// Undoes the steps of an unfinished clone, most recent first.
class CloneRollback {
 public:
  CloneRollback(const TableIdentifier& identifier, WarehouseCatalog& catalog,
                HistoryIndex& history, LivenessTracker& tracker)
      : identifier_(identifier),
        catalog_(catalog),
        history_(history),
        tracker_(tracker) {}

  CloneRollback(const CloneRollback&) = delete;
  CloneRollback& operator=(const CloneRollback&) = delete;

  ~CloneRollback() {
    if (committed_ || !table_id_.has_value()) {
      return;
    }
    Logger()->warn("Rolling back clone of {} ({})", identifier_.ToString(),
                   table_id_->ToString());
    if (edge_.has_value()) {
      if (auto status = tracker_.Release(*table_id_, *edge_); !status) {
        Logger()->warn("Rollback failed to release snapshot {}: {}", edge_->ToString(),
                       status.error().message);
      }
    }
    if (history_written_) {
      if (auto status = history_.Purge(*table_id_); !status) {
        Logger()->warn("Rollback failed to purge history of {}: {}",
                       table_id_->ToString(), status.error().message);
      }
    }
    // Without a successful purge the intent must stay for recovery to retry.
    if (intent_written_ && purged_or_unwritten()) {
      if (auto status = catalog_.DeleteIntent(*table_id_); !status) {
        Logger()->warn("Rollback failed to delete intent of {}: {}",
                       table_id_->ToString(), status.error().message);
      }
    }
  }

  void IntentWritten(const TableId& table_id) {
    table_id_ = table_id;
    intent_written_ = true;
  }
  // Set before the append so that a partially persisted entry is purged too.
  void HistoryAppending() { history_written_ = true; }
  void EdgeAcquired(const SnapshotId& snapshot_id) { edge_ = snapshot_id; }
  void Commit() { committed_ = true; }

 private:
  bool purged_or_unwritten() const {
    return !history_written_ || !history_.Contains(*table_id_);
  }

  const TableIdentifier& identifier_;
  WarehouseCatalog& catalog_;
  HistoryIndex& history_;
  LivenessTracker& tracker_;
  std::optional<TableId> table_id_;
  std::optional<SnapshotId> edge_;
  bool intent_written_ = false;
  bool history_written_ = false;
  bool committed_ = false;
};

}  // namespace

CloneOrchestrator::CloneOrchestrator(std::shared_ptr<WarehouseCatalog> catalog,
                                     std::shared_ptr<SnapshotStore> store,
                                     std::shared_ptr<HistoryIndex> history,
                                     std::shared_ptr<LivenessTracker> tracker)
    : catalog_(std::move(catalog)),
      store_(std::move(store)),
      history_(std::move(history)),
      tracker_(std::move(tracker)) {}

Status CloneOrchestrator::CheckDataFiles(const Snapshot& snapshot) const {
  for (const auto& data_file : snapshot.data_files) {
    SNAPLAKE_ASSIGN_OR_RAISE(auto exists, store_->io()->FileExists(data_file.location));
    if (!exists) {
      Logger()->error("Snapshot {} references missing data file {}",
                      snapshot.snapshot_id.ToString(), data_file.location);
      return CorruptSnapshotReference("Snapshot {} references missing data file {}",
                                      snapshot.snapshot_id, data_file.location);
    }
  }
  return {};
}

Result<TableId> CloneOrchestrator::Clone(const TableDefinition& definition,
                                         const SnapshotId& snapshot_id,
                                         std::stop_token stop_token) {
  const auto& identifier = definition.identifier;
  Logger()->debug("Cloning snapshot {} into {}", snapshot_id.ToString(),
                  identifier.ToString());

  // Declared before the rollback so the name is released after everything else.
  SNAPLAKE_ASSIGN_OR_RAISE(auto reservation, catalog_->ReserveName(identifier));
  CloneRollback rollback(identifier, *catalog_, *history_, *tracker_);

  SNAPLAKE_RETURN_UNEXPECTED(CheckCancelled(stop_token, identifier, "loading snapshot"));
  SNAPLAKE_ASSIGN_OR_RAISE(auto snapshot, store_->Get(snapshot_id));
  SNAPLAKE_RETURN_UNEXPECTED(CheckDataFiles(*snapshot));
  if (definition.schema != snapshot->schema) {
    return InvalidSchema("Schema {} of {} does not match schema {} of snapshot {}",
                         definition.schema, identifier.ToString(), snapshot->schema,
                         snapshot_id);
  }

  SNAPLAKE_RETURN_UNEXPECTED(CheckCancelled(stop_token, identifier, "writing intent"));
  auto table_id = TableId::Generate();
  auto created_at = CurrentTimePointMs();
  SNAPLAKE_RETURN_UNEXPECTED(catalog_->WriteIntent(TableIntent{
      .table_id = table_id,
      .identifier = identifier,
      .snapshot_id = snapshot_id,
      .created_at = created_at}));
  rollback.IntentWritten(table_id);

  SNAPLAKE_RETURN_UNEXPECTED(CheckCancelled(stop_token, identifier, "appending history"));
  rollback.HistoryAppending();
  SNAPLAKE_RETURN_UNEXPECTED(
      history_->Append(table_id, snapshot_id, /*expected_sequence=*/0));

  SNAPLAKE_RETURN_UNEXPECTED(
      CheckCancelled(stop_token, identifier, "acquiring snapshot reference"));
  SNAPLAKE_RETURN_UNEXPECTED(tracker_->Acquire(table_id, snapshot_id));
  rollback.EdgeAcquired(snapshot_id);

  SNAPLAKE_RETURN_UNEXPECTED(CheckCancelled(stop_token, identifier, "commit"));
  auto options = definition.options.configs();
  auto source_locator = definition.options.Get(TableOptions::kSnapshotLocation);
  options.erase(TableOptions::kSnapshotLocation.key());
  TableMetadata metadata{
      .table_id = table_id,
      .identifier = identifier,
      .location = catalog_->TableLocation(table_id),
      .schema = definition.schema,
      .options = std::move(options),
      .created_at = created_at,
      .source_snapshot_id = snapshot_id,
      .source_locator = source_locator.empty() ? Locator::For(snapshot_id)
                                               : std::move(source_locator)};
  SNAPLAKE_RETURN_UNEXPECTED(
      catalog_->CommitTable(std::move(reservation), std::move(metadata)));
  rollback.Commit();

  if (auto status = catalog_->DeleteIntent(table_id); !status) {
    // The table is committed; recovery removes the stale intent.
    Logger()->warn("Failed to delete intent of committed table {}: {}",
                   table_id.ToString(), status.error().message);
  }
  Logger()->info("Cloned snapshot {} into {} ({})", snapshot_id.ToString(),
                 identifier.ToString(), table_id.ToString());
  return table_id;
}

}  // namespace snaplake
