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

#include "snaplake/liveness_tracker.h"

#include <algorithm>

#include "snaplake/exception.h"
#include "snaplake/util/formatter.h"  // IWYU pragma: keep
#include "snaplake/util/logging.h"
#include "snaplake/util/macros.h"
#include "snaplake/util/string_util.h"

namespace snaplake {

std::string_view RetentionPolicyToString(RetentionPolicy policy) {
  switch (policy) {
    case RetentionPolicy::kReferenceCounted:
      return "reference";
    case RetentionPolicy::kLineageAware:
      return "lineage";
  }
  return "unknown";
}

Result<RetentionPolicy> RetentionPolicyFromString(std::string_view str) {
  if (StringUtils::EqualsIgnoreCase(str, "reference")) {
    return RetentionPolicy::kReferenceCounted;
  }
  if (StringUtils::EqualsIgnoreCase(str, "lineage")) {
    return RetentionPolicy::kLineageAware;
  }
  return InvalidArgument(
      "Unknown retention policy '{}', expected 'reference' or 'lineage'", str);
}

LivenessTracker::LivenessTracker(std::shared_ptr<SnapshotStore> store,
                                 RetentionPolicy policy)
    : store_(std::move(store)), policy_(policy) {}

Status LivenessTracker::Acquire(const TableId& table_id, const SnapshotId& snapshot_id) {
  std::lock_guard lock(mutex_);
  return AcquireLocked(table_id, snapshot_id);
}

Result<SnapshotId> LivenessTracker::PutAndAcquire(const TableId& table_id,
                                                  const SnapshotManifest& manifest) {
  std::lock_guard lock(mutex_);
  SNAPLAKE_ASSIGN_OR_RAISE(auto snapshot_id, store_->Put(manifest));
  SNAPLAKE_RETURN_UNEXPECTED(AcquireLocked(table_id, snapshot_id));
  return snapshot_id;
}

Status LivenessTracker::AcquireLocked(const TableId& table_id,
                                      const SnapshotId& snapshot_id) {
  if (!store_->Contains(snapshot_id)) {
    return SnapshotNotFound("Cannot reference snapshot {}: it does not exist",
                            snapshot_id);
  }
  if (!edges_[table_id].insert(snapshot_id).second) {
    return AlreadyExists("Table {} already references snapshot {}", table_id,
                         snapshot_id);
  }
  ++reference_counts_[snapshot_id];
  Logger()->debug("Table {} acquired snapshot {}", table_id.ToString(),
                  snapshot_id.ToString());
  return {};
}

Status LivenessTracker::Release(const TableId& table_id, const SnapshotId& snapshot_id) {
  std::lock_guard lock(mutex_);
  auto it = edges_.find(table_id);
  if (it == edges_.end() || it->second.erase(snapshot_id) == 0) {
    return ReferenceNotHeld("Table {} does not reference snapshot {}", table_id,
                            snapshot_id);
  }
  if (it->second.empty()) {
    edges_.erase(it);
  }
  if (--reference_counts_[snapshot_id] == 0) {
    reference_counts_.erase(snapshot_id);
  }
  Logger()->debug("Table {} released snapshot {}", table_id.ToString(),
                  snapshot_id.ToString());
  return {};
}

Result<size_t> LivenessTracker::ReleaseAll(const TableId& table_id) {
  std::lock_guard lock(mutex_);
  auto it = edges_.find(table_id);
  if (it == edges_.end()) {
    return 0;
  }
  size_t released = it->second.size();
  for (const auto& snapshot_id : it->second) {
    auto count = reference_counts_.find(snapshot_id);
    SNAPLAKE_CHECK_OR_DIE(count != reference_counts_.end() && count->second > 0,
                          "Reference count of snapshot {} is out of sync",
                          snapshot_id.ToString());
    if (--count->second == 0) {
      reference_counts_.erase(count);
    }
  }
  edges_.erase(it);
  Logger()->debug("Table {} released {} snapshots", table_id.ToString(), released);
  return released;
}

size_t LivenessTracker::ReferenceCount(const SnapshotId& snapshot_id) const {
  std::lock_guard lock(mutex_);
  auto it = reference_counts_.find(snapshot_id);
  return it == reference_counts_.end() ? 0 : it->second;
}

std::vector<SnapshotId> LivenessTracker::ReferencedSnapshots(
    const TableId& table_id) const {
  std::lock_guard lock(mutex_);
  auto it = edges_.find(table_id);
  if (it == edges_.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

Result<std::unordered_set<SnapshotId>> LivenessTracker::RetainedSnapshots() const {
  std::unordered_set<SnapshotId> retained;
  for (const auto& [snapshot_id, _] : reference_counts_) {
    retained.insert(snapshot_id);
  }
  if (policy_ != RetentionPolicy::kLineageAware) {
    return retained;
  }

  std::vector<SnapshotId> pending(retained.begin(), retained.end());
  while (!pending.empty()) {
    auto snapshot_id = pending.back();
    pending.pop_back();
    auto snapshot = store_->Get(snapshot_id);
    if (!snapshot.has_value()) {
      if (snapshot.error().kind == ErrorKind::kSnapshotNotFound) {
        // The lineage was already cut by an earlier sweep.
        continue;
      }
      return std::unexpected<Error>(snapshot.error());
    }
    const auto& parent = (*snapshot)->parent_snapshot_id;
    if (parent.has_value() && retained.insert(*parent).second) {
      pending.push_back(*parent);
    }
  }
  return retained;
}

Result<bool> LivenessTracker::IsReclaimable(const SnapshotId& snapshot_id) const {
  std::lock_guard lock(mutex_);
  if (!store_->Contains(snapshot_id)) {
    return SnapshotNotFound("Snapshot {} does not exist", snapshot_id);
  }
  if (reference_counts_.contains(snapshot_id)) {
    return false;
  }
  SNAPLAKE_ASSIGN_OR_RAISE(auto retained, RetainedSnapshots());
  return !retained.contains(snapshot_id);
}

Result<SweepReport> LivenessTracker::Sweep(FileIO& io, TimePointMs older_than) {
  std::lock_guard lock(mutex_);
  SNAPLAKE_ASSIGN_OR_RAISE(auto retained, RetainedSnapshots());

  std::vector<SnapshotId> candidates;
  std::vector<SnapshotId> survivors;
  for (const auto& snapshot_id : store_->List()) {
    if (!retained.contains(snapshot_id) && snapshot_id.timestamp() < older_than) {
      candidates.push_back(snapshot_id);
    } else {
      survivors.push_back(snapshot_id);
    }
  }

  // Files listed by any surviving snapshot stay, whichever table wrote them.
  std::unordered_set<std::string> live_files;
  for (const auto& snapshot_id : survivors) {
    SNAPLAKE_ASSIGN_OR_RAISE(auto snapshot, store_->Get(snapshot_id));
    for (const auto& data_file : snapshot->data_files) {
      live_files.insert(data_file.location);
    }
  }

  SweepReport report;
  std::unordered_set<std::string> deleted;
  for (const auto& snapshot_id : candidates) {
    auto snapshot = store_->Get(snapshot_id);
    if (!snapshot.has_value()) {
      Logger()->error("Skipping snapshot {} during sweep: {}", snapshot_id.ToString(),
                      snapshot.error().message);
      continue;
    }
    for (const auto& data_file : (*snapshot)->data_files) {
      const auto& location = data_file.location;
      if (live_files.contains(location) || deleted.contains(location)) {
        continue;
      }
      SNAPLAKE_ASSIGN_OR_RAISE(auto exists, io.FileExists(location));
      if (exists) {
        SNAPLAKE_RETURN_UNEXPECTED(io.DeleteFile(location));
      }
      deleted.insert(location);
      report.deleted_files.push_back(location);
    }
    SNAPLAKE_RETURN_UNEXPECTED(store_->Delete(snapshot_id));
    report.reclaimed_snapshots.push_back(snapshot_id);
  }
  report.retained_snapshots = static_cast<int64_t>(survivors.size());

  Logger()->info("Sweep reclaimed {} snapshots and {} data files, {} snapshots retained",
                 report.reclaimed_snapshots.size(), report.deleted_files.size(),
                 report.retained_snapshots);
  return report;
}

}  // namespace snaplake
