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

/// \file snaplake/liveness_tracker.h
/// Reference edges from tables to snapshots, and reclamation of unreferenced
/// snapshots.

#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "snaplake/file_io.h"
#include "snaplake/result.h"
#include "snaplake/snaplake_export.h"
#include "snaplake/snapshot.h"
#include "snaplake/snapshot_store.h"
#include "snaplake/table_identifier.h"
#include "snaplake/util/timepoint.h"

namespace snaplake {

/// \brief Which snapshots are kept alive besides directly referenced ones.
enum class RetentionPolicy : uint8_t {
  /// A snapshot is retained only while some table holds an edge to it.
  kReferenceCounted,
  /// A snapshot is also retained while it is an ancestor, through parent links,
  /// of a referenced snapshot.
  kLineageAware,
};

/// \brief Configuration spelling of a policy: "reference" or "lineage".
SNAPLAKE_EXPORT std::string_view RetentionPolicyToString(RetentionPolicy policy);

SNAPLAKE_EXPORT Result<RetentionPolicy> RetentionPolicyFromString(std::string_view str);

/// \brief Outcome of a reclamation sweep.
struct SNAPLAKE_EXPORT SweepReport {
  /// Snapshots whose manifests were deleted, in creation order.
  std::vector<SnapshotId> reclaimed_snapshots;
  /// Data files deleted because no remaining snapshot lists them.
  std::vector<std::string> deleted_files;
  /// Number of snapshots left in the store.
  int64_t retained_snapshots = 0;
};

/// \brief Tracks which tables reference which snapshots.
///
/// Edges are not owning: a snapshot's lifetime is governed by the store, and
/// the tracker only decides when a snapshot may be reclaimed. Reclamation is
/// never implicit; it happens in Sweep.
///
/// Edges live in memory. The catalog rebuilds them from the history of every
/// live table when it opens.
class SNAPLAKE_EXPORT LivenessTracker {
 public:
  explicit LivenessTracker(std::shared_ptr<SnapshotStore> store,
                           RetentionPolicy policy = RetentionPolicy::kReferenceCounted);

  /// \brief Record that a table references a snapshot.
  ///
  /// \return SnapshotNotFound if the snapshot is not in the store (e.g. it was
  /// swept), AlreadyExists if the edge is already recorded.
  Status Acquire(const TableId& table_id, const SnapshotId& snapshot_id);

  /// \brief Publish a manifest and record that the table references it.
  ///
  /// Both happen under the tracker lock, so a concurrent Sweep never sees the
  /// new snapshot without its edge.
  Result<SnapshotId> PutAndAcquire(const TableId& table_id,
                                   const SnapshotManifest& manifest);

  /// \brief Remove one edge. ReferenceNotHeld if the edge does not exist.
  Status Release(const TableId& table_id, const SnapshotId& snapshot_id);

  /// \brief Remove every edge of a table.
  ///
  /// \return the number of released edges; 0 when the table holds none.
  Result<size_t> ReleaseAll(const TableId& table_id);

  /// \brief Number of tables referencing the snapshot.
  size_t ReferenceCount(const SnapshotId& snapshot_id) const;

  /// \brief Snapshots referenced by a table, in creation order.
  std::vector<SnapshotId> ReferencedSnapshots(const TableId& table_id) const;

  /// \brief Whether the snapshot could be reclaimed now under the policy.
  ///
  /// \return SnapshotNotFound if the snapshot is not in the store.
  Result<bool> IsReclaimable(const SnapshotId& snapshot_id) const;

  /// \brief Delete reclaimable snapshots created before `older_than`, and every
  /// data file of theirs that no remaining snapshot lists.
  ///
  /// The tracker lock is held for the whole sweep, so an Acquire either happens
  /// before the sweep (and protects its snapshot) or after it (and fails with
  /// SnapshotNotFound if its snapshot was reclaimed).
  Result<SweepReport> Sweep(FileIO& io, TimePointMs older_than);

  RetentionPolicy policy() const { return policy_; }

 private:
  Status AcquireLocked(const TableId& table_id, const SnapshotId& snapshot_id);
  Result<std::unordered_set<SnapshotId>> RetainedSnapshots() const;

  std::shared_ptr<SnapshotStore> store_;
  const RetentionPolicy policy_;
  mutable std::mutex mutex_;
  std::unordered_map<TableId, std::set<SnapshotId>> edges_;
  std::unordered_map<SnapshotId, size_t> reference_counts_;
};

}  // namespace snaplake
