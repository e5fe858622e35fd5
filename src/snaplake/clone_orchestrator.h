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

/// \file snaplake/clone_orchestrator.h
/// Creation of shallow clones pinned to an existing snapshot.

#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "snaplake/catalog/warehouse_catalog.h"
#include "snaplake/history_index.h"
#include "snaplake/liveness_tracker.h"
#include "snaplake/result.h"
#include "snaplake/schema.h"
#include "snaplake/snaplake_export.h"
#include "snaplake/snapshot.h"
#include "snaplake/snapshot_store.h"
#include "snaplake/table_identifier.h"
#include "snaplake/table_options.h"

namespace snaplake {

/// \brief Definition of a table to create.
struct SNAPLAKE_EXPORT TableDefinition {
  TableIdentifier identifier;
  Schema schema;
  TableOptions options;
};

/// \brief Materializes a new table whose initial state is an existing snapshot.
///
/// A clone shares the snapshot's data files; nothing is copied, so the cost is
/// proportional to the manifest, not to the data. The steps are:
///
///  1. reserve the table name
///  2. load the snapshot, check its data files exist and its schema matches
///  3. allocate a TableId and write an intent record
///  4. append the snapshot to the new table's history at sequence 0
///  5. acquire the reference edge
///  6. commit the table metadata, which makes the table visible
///  7. delete the intent record
///
/// No lock is held across the steps. A failure or cancellation before step 6
/// undoes the steps already taken, so no table, ledger, edge or intent
/// survives. A crash before step 6 leaves an intent record that the catalog
/// resolves when it opens.
class SNAPLAKE_EXPORT CloneOrchestrator {
 public:
  CloneOrchestrator(std::shared_ptr<WarehouseCatalog> catalog,
                    std::shared_ptr<SnapshotStore> store,
                    std::shared_ptr<HistoryIndex> history,
                    std::shared_ptr<LivenessTracker> tracker);

  /// \brief Create `definition` as a clone of `snapshot_id`.
  ///
  /// \param definition the new table; its options are stored as table metadata
  /// \param snapshot_id a snapshot id, usually obtained from LocatorResolver
  /// \param stop_token checked between steps; a requested stop fails the clone
  /// with OperationCancelled
  /// \return the new table's id, or TableNameCollision, NoSuchDatabase,
  /// SnapshotNotFound, CorruptSnapshotReference, InvalidSchema,
  /// HistoryAppendConflict, OperationCancelled or an IO error.
  Result<TableId> Clone(const TableDefinition& definition, const SnapshotId& snapshot_id,
                        std::stop_token stop_token = {});

 private:
  Status CheckDataFiles(const Snapshot& snapshot) const;

  std::shared_ptr<WarehouseCatalog> catalog_;
  std::shared_ptr<SnapshotStore> store_;
  std::shared_ptr<HistoryIndex> history_;
  std::shared_ptr<LivenessTracker> tracker_;
};

}  // namespace snaplake
