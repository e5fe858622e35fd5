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

#include "snaplake/snapshot_store.h"

#include <mutex>

#include <nlohmann/json.hpp>

#include "snaplake/json_internal.h"
#include "snaplake/util/formatter.h"  // IWYU pragma: keep
#include "snaplake/util/json_util_internal.h"
#include "snaplake/util/logging.h"
#include "snaplake/util/macros.h"

namespace snaplake {

namespace {

constexpr std::string_view kTempSuffix = ".tmp";

}  // namespace

SnapshotStore::SnapshotStore(std::shared_ptr<FileIO> io, std::string root)
    : io_(std::move(io)), root_(std::move(root)) {}

std::string SnapshotStore::ManifestLocation(const SnapshotId& snapshot_id) const {
  return std::format("{}/{}/{}", root_, kSnapshotDir, snapshot_id.ToString());
}

Status SnapshotStore::Open() {
  SNAPLAKE_ASSIGN_OR_RAISE(auto names,
                           io_->ListFiles(std::format("{}/{}", root_, kSnapshotDir)));
  std::unique_lock lock(mutex_);
  ids_.clear();
  cache_.clear();
  for (const auto& name : names) {
    if (name.ends_with(kTempSuffix)) {
      // Left behind by a Put that never reached its rename.
      auto location = std::format("{}/{}/{}", root_, kSnapshotDir, name);
      if (auto status = io_->DeleteFile(location); !status) {
        Logger()->warn("Failed to delete unpublished manifest {}: {}", location,
                       status.error().message);
      }
      continue;
    }
    if (!SnapshotId::IsCanonical(name)) {
      Logger()->warn("Ignoring unexpected file {} in snapshot directory", name);
      continue;
    }
    SNAPLAKE_ASSIGN_OR_RAISE(auto snapshot_id, SnapshotId::FromString(name));
    ids_.insert(snapshot_id);
  }
  Logger()->debug("Indexed {} snapshots under {}/{}", ids_.size(), root_, kSnapshotDir);
  return {};
}

Result<SnapshotId> SnapshotStore::Put(const SnapshotManifest& manifest) {
  auto snapshot = std::make_shared<Snapshot>(
      Snapshot{.snapshot_id = SnapshotId::Generate(),
               .parent_snapshot_id = manifest.parent_snapshot_id,
               .timestamp_ms = CurrentTimePointMs(),
               .schema = manifest.schema,
               .data_files = manifest.data_files,
               .summary = SnapshotSummary::Of(manifest.data_files)});

  auto location = ManifestLocation(snapshot->snapshot_id);
  auto temp_location = std::format("{}{}", location, kTempSuffix);
  SNAPLAKE_RETURN_UNEXPECTED(
      io_->WriteFile(temp_location, SafeDumpJson(ToJson(*snapshot))));
  if (auto status = io_->RenameFile(temp_location, location); !status) {
    if (auto cleanup = io_->DeleteFile(temp_location); !cleanup) {
      Logger()->warn("Failed to delete unpublished manifest {}: {}", temp_location,
                     cleanup.error().message);
    }
    return std::unexpected<Error>(status.error());
  }

  std::unique_lock lock(mutex_);
  ids_.insert(snapshot->snapshot_id);
  cache_.emplace(snapshot->snapshot_id, snapshot);
  Logger()->debug("Stored snapshot {} with {} data files",
                  snapshot->snapshot_id.ToString(), snapshot->data_files.size());
  return snapshot->snapshot_id;
}

Result<std::shared_ptr<const Snapshot>> SnapshotStore::Get(
    const SnapshotId& snapshot_id) const {
  {
    std::shared_lock lock(mutex_);
    if (!ids_.contains(snapshot_id)) {
      return SnapshotNotFound("Snapshot {} does not exist", snapshot_id);
    }
    if (auto it = cache_.find(snapshot_id); it != cache_.end()) {
      return it->second;
    }
  }

  auto location = ManifestLocation(snapshot_id);
  auto content = io_->ReadFile(location, std::nullopt);
  if (!content.has_value()) {
    Logger()->error("Cannot read manifest of snapshot {}: {}", snapshot_id.ToString(),
                    content.error().message);
    return CorruptSnapshotReference("Cannot read manifest of snapshot {}: {}",
                                    snapshot_id, content.error());
  }
  auto snapshot = ParseJson(*content).and_then(SnapshotFromJson);
  if (!snapshot.has_value()) {
    Logger()->error("Manifest of snapshot {} is corrupt: {}", snapshot_id.ToString(),
                    snapshot.error().message);
    return CorruptSnapshotReference("Manifest of snapshot {} is corrupt: {}",
                                    snapshot_id, snapshot.error());
  }
  if (snapshot->snapshot_id != snapshot_id) {
    Logger()->error("Manifest {} contains snapshot {}", location,
                    snapshot->snapshot_id.ToString());
    return CorruptSnapshotReference("Manifest {} contains snapshot {}", location,
                                    snapshot->snapshot_id);
  }

  auto shared = std::make_shared<const Snapshot>(std::move(snapshot.value()));
  std::unique_lock lock(mutex_);
  // A concurrent reader may have populated the cache first.
  return cache_.try_emplace(snapshot_id, std::move(shared)).first->second;
}

Result<std::shared_ptr<const Snapshot>> SnapshotStore::GetReferenced(
    const SnapshotId& snapshot_id, std::string_view referrer) const {
  auto snapshot = Get(snapshot_id);
  if (!snapshot.has_value() && snapshot.error().kind == ErrorKind::kSnapshotNotFound) {
    Logger()->error("Snapshot {} referenced by {} is missing", snapshot_id.ToString(),
                    referrer);
    return CorruptSnapshotReference("Snapshot {} referenced by {} is missing",
                                    snapshot_id, referrer);
  }
  return snapshot;
}

bool SnapshotStore::Contains(const SnapshotId& snapshot_id) const {
  std::shared_lock lock(mutex_);
  return ids_.contains(snapshot_id);
}

std::vector<SnapshotId> SnapshotStore::List() const {
  std::shared_lock lock(mutex_);
  return {ids_.begin(), ids_.end()};
}

Status SnapshotStore::Delete(const SnapshotId& snapshot_id) {
  {
    std::shared_lock lock(mutex_);
    if (!ids_.contains(snapshot_id)) {
      return SnapshotNotFound("Snapshot {} does not exist", snapshot_id);
    }
  }
  SNAPLAKE_RETURN_UNEXPECTED(io_->DeleteFile(ManifestLocation(snapshot_id)));
  std::unique_lock lock(mutex_);
  ids_.erase(snapshot_id);
  cache_.erase(snapshot_id);
  return {};
}

}  // namespace snaplake
