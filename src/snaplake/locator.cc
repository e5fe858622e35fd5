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

#include "snaplake/locator.h"

#include <algorithm>
#include <format>

#include "snaplake/util/formatter.h"  // IWYU pragma: keep
#include "snaplake/util/logging.h"
#include "snaplake/util/macros.h"
#include "snaplake/util/uuid.h"

namespace snaplake {

std::string Locator::ToString() const { return std::format("{}/{}", kPrefix, id_text); }

std::string Locator::For(const SnapshotId& snapshot_id) {
  return std::format("{}/{}", kPrefix, snapshot_id);
}

Result<Locator> ParseLocator(std::string_view token) {
  if (std::ranges::count(token, '/') != 1) {
    return MalformedLocator("Locator '{}' must have the form {}/<snapshot id>", token,
                            Locator::kPrefix);
  }
  auto slash = token.find('/');
  auto prefix = token.substr(0, slash);
  auto id_text = token.substr(slash + 1);
  if (prefix != Locator::kPrefix) {
    return MalformedLocator("Locator '{}' has unknown prefix '{}', expected '{}'", token,
                            prefix, Locator::kPrefix);
  }
  if (id_text.size() != Uuid::kHyphenatedLength) {
    return MalformedLocator("Locator '{}' does not embed a snapshot id", token);
  }
  auto snapshot_id = SnapshotId::FromString(id_text);
  if (!snapshot_id.has_value()) {
    return MalformedLocator("Locator '{}' does not embed a snapshot id: {}", token,
                            snapshot_id.error());
  }
  return Locator{.id_text = std::string(id_text), .snapshot_id = *snapshot_id};
}

LocatorResolver::LocatorResolver(std::shared_ptr<const SnapshotStore> store)
    : store_(std::move(store)) {}

Result<SnapshotId> LocatorResolver::Resolve(std::string_view token) const {
  SNAPLAKE_ASSIGN_OR_RAISE(auto locator, ParseLocator(token));
  if (!locator.is_canonical()) {
    // Ids are stored in canonical lower-case form; any other spelling names
    // nothing.
    return SnapshotNotFound("Snapshot {} does not exist", locator.id_text);
  }
  SNAPLAKE_ASSIGN_OR_RAISE(auto snapshot, store_->Get(locator.snapshot_id));
  Logger()->debug("Resolved locator {} to snapshot {}", token,
                  snapshot->snapshot_id.ToString());
  return snapshot->snapshot_id;
}

Result<SnapshotId> LocatorResolver::Resolve(const TableOptions& options) const {
  if (!options.HasSnapshotLocation()) {
    return InvalidArgument("Table options do not contain '{}'",
                           TableOptions::kSnapshotLocation.key());
  }
  return Resolve(options.Get(TableOptions::kSnapshotLocation));
}

}  // namespace snaplake
