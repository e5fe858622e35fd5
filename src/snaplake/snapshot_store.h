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

/// \file snaplake/snapshot_store.h
/// Durable storage of immutable snapshot manifests.

#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "snaplake/file_io.h"
#include "snaplake/result.h"
#include "snaplake/snaplake_export.h"
#include "snaplake/snapshot.h"

namespace snaplake {

/// \brief Stores snapshot manifests as JSON files under `<root>/_ss/<id>`.
///
/// Snapshots are never modified after Put returns. A manifest is written to a
/// temporary file and renamed into place, so readers either see the complete
/// manifest or nothing. Parsed snapshots are cached; since they are immutable
/// the cache never needs invalidation except on Delete.
class SNAPLAKE_EXPORT SnapshotStore {
 public:
  static constexpr std::string_view kSnapshotDir = "_ss";

  SnapshotStore(std::shared_ptr<FileIO> io, std::string root);

  /// \brief Index the manifests already present on storage.
  Status Open();

  /// \brief Persist a new snapshot and return its freshly generated id.
  ///
  /// Every call produces a distinct id, even for identical manifests.
  Result<SnapshotId> Put(const SnapshotManifest& manifest);

  /// \brief Fetch a snapshot.
  ///
  /// \return SnapshotNotFound if no manifest exists for the id,
  /// CorruptSnapshotReference if the manifest cannot be read back.
  Result<std::shared_ptr<const Snapshot>> Get(const SnapshotId& snapshot_id) const;

  /// \brief Fetch a snapshot that a table's history refers to.
  ///
  /// Such a snapshot must exist, so a missing manifest is reported as
  /// CorruptSnapshotReference rather than SnapshotNotFound.
  Result<std::shared_ptr<const Snapshot>> GetReferenced(
      const SnapshotId& snapshot_id, std::string_view referrer) const;

  /// \brief Whether a manifest exists for the id.
  bool Contains(const SnapshotId& snapshot_id) const;

  /// \brief Ids of all stored snapshots, in creation order.
  std::vector<SnapshotId> List() const;

  /// \brief Remove a manifest. Only the reclamation sweep calls this.
  Status Delete(const SnapshotId& snapshot_id);

  /// \brief Storage location of the manifest of a snapshot.
  std::string ManifestLocation(const SnapshotId& snapshot_id) const;

  const std::shared_ptr<FileIO>& io() const { return io_; }

 private:
  std::shared_ptr<FileIO> io_;
  std::string root_;
  mutable std::shared_mutex mutex_;
  std::set<SnapshotId> ids_;
  mutable std::unordered_map<SnapshotId, std::shared_ptr<const Snapshot>> cache_;
};

}  // namespace snaplake
