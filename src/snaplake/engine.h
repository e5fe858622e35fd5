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

/// \file snaplake/engine.h
/// Statement-level entry point: databases, tables, clones and history.

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include "snaplake/catalog/warehouse_catalog.h"
#include "snaplake/clone_orchestrator.h"
#include "snaplake/engine_config.h"
#include "snaplake/file_io.h"
#include "snaplake/history_index.h"
#include "snaplake/liveness_tracker.h"
#include "snaplake/locator.h"
#include "snaplake/result.h"
#include "snaplake/schema.h"
#include "snaplake/snaplake_export.h"
#include "snaplake/snapshot.h"
#include "snaplake/snapshot_store.h"
#include "snaplake/table.h"
#include "snaplake/table_identifier.h"
#include "snaplake/util/timepoint.h"

namespace snaplake {

/// \brief A `CREATE TABLE` statement.
struct SNAPLAKE_EXPORT CreateTableRequest {
  /// An empty database selects the configured default database.
  TableIdentifier identifier;
  Schema schema;
  /// Options in statement order, keys as written.
  std::vector<std::pair<std::string, std::string>> options;
  bool if_not_exists = false;
};

/// \brief One row of a table's snapshot history.
struct SNAPLAKE_EXPORT HistoryRecord {
  SnapshotId snapshot_id;
  /// Locator of the snapshot, usable as `snapshot_loc`.
  std::string snapshot_location;
  std::optional<SnapshotId> prev_snapshot_id;
  int64_t sequence_number;
  TimePointMs timestamp;
  int64_t data_file_count;
  int64_t row_count;
  int64_t bytes;
};

/// \brief A warehouse opened for use.
///
/// All operations are safe to call concurrently.
class SNAPLAKE_EXPORT Engine {
 public:
  /// \brief Open the warehouse named by `config` and recover pending operations.
  static Result<std::unique_ptr<Engine>> Open(const EngineConfig& config,
                                              std::shared_ptr<FileIO> io);

  ~Engine();

  /// \brief Stop accepting operations. Later calls fail with NotAllowed.
  Status Close();

  Status CreateDatabase(const std::string& name, bool if_not_exists = false);

  /// \brief Drop a database together with all of its tables.
  Status DropDatabase(const std::string& name, bool if_exists = false);

  Result<std::vector<std::string>> ListDatabases() const;

  Result<std::vector<std::string>> ListTables(const std::string& database) const;

  /// \brief Create a table, or clone one when the `snapshot_loc` option is set.
  ///
  /// \param request the statement; option keys are case-insensitive
  /// \param stop_token cancels a clone between its steps
  /// \return the id of the new table, or of the existing one when
  /// `if_not_exists` is set and the name is taken.
  Result<TableId> CreateTable(const CreateTableRequest& request,
                              std::stop_token stop_token = {});

  Result<std::shared_ptr<Table>> LoadTable(const TableIdentifier& identifier) const;

  /// \brief Drop a table and release its snapshot references.
  ///
  /// Snapshots and data files shared with other tables are unaffected; space is
  /// reclaimed by Sweep.
  Status DropTable(const TableIdentifier& identifier, bool if_exists = false);

  /// \brief Snapshot history of a table, most recent first.
  Result<std::vector<HistoryRecord>> History(const std::string& database,
                                             const std::string& table) const;

  /// \brief Reclaim unreferenced snapshots older than the configured minimum age.
  Result<SweepReport> Sweep();

  /// \brief Reclaim unreferenced snapshots created before `older_than`.
  Result<SweepReport> Sweep(TimePointMs older_than);

  const EngineConfig& config() const { return config_; }

  const std::shared_ptr<SnapshotStore>& snapshot_store() const { return store_; }

  const std::shared_ptr<HistoryIndex>& history_index() const { return history_; }

  const std::shared_ptr<LivenessTracker>& liveness_tracker() const { return tracker_; }

  const std::shared_ptr<WarehouseCatalog>& catalog() const { return catalog_; }

 private:
  Engine(EngineConfig config, std::shared_ptr<FileIO> io, std::string default_database,
         int64_t min_snapshot_age_ms, std::shared_ptr<SnapshotStore> store,
         std::shared_ptr<HistoryIndex> history, std::shared_ptr<LivenessTracker> tracker,
         std::shared_ptr<WarehouseCatalog> catalog);

  Status CheckOpen() const;
  TableIdentifier Qualify(const TableIdentifier& identifier) const;
  Result<TableId> CloneTable(const TableIdentifier& identifier, const Schema& schema,
                             const TableOptions& options, std::stop_token stop_token);
  Result<TableId> CreateEmptyTable(const TableIdentifier& identifier,
                                   const Schema& schema, const TableOptions& options);

  EngineConfig config_;
  std::shared_ptr<FileIO> io_;
  std::string default_database_;
  int64_t min_snapshot_age_ms_;
  std::shared_ptr<SnapshotStore> store_;
  std::shared_ptr<HistoryIndex> history_;
  std::shared_ptr<LivenessTracker> tracker_;
  std::shared_ptr<WarehouseCatalog> catalog_;
  LocatorResolver resolver_;
  CloneOrchestrator orchestrator_;
  std::atomic<bool> closed_{false};
};

}  // namespace snaplake
