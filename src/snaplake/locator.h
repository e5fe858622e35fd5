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

/// \file snaplake/locator.h
/// Locator tokens `_ss/<SnapshotId>` naming a stored snapshot.

#include <memory>
#include <string>
#include <string_view>

#include "snaplake/result.h"
#include "snaplake/snaplake_export.h"
#include "snaplake/snapshot.h"
#include "snaplake/snapshot_store.h"
#include "snaplake/table_options.h"

namespace snaplake {

/// \brief A structurally valid locator.
struct SNAPLAKE_EXPORT Locator {
  /// \brief Namespace token of snapshot locators, matched byte for byte.
  static constexpr std::string_view kPrefix = "_ss";

  /// \brief The identifier text as written, case preserved.
  std::string id_text;
  /// \brief The identifier parsed from id_text.
  SnapshotId snapshot_id;

  /// \brief Whether id_text is the canonical spelling of snapshot_id. Only
  /// canonical locators can name a stored snapshot.
  bool is_canonical() const { return id_text == snapshot_id.ToString(); }

  std::string ToString() const;

  /// \brief The canonical locator of a snapshot.
  static std::string For(const SnapshotId& snapshot_id);
};

/// \brief Parse a locator token.
///
/// The token must contain exactly one '/', the part before it must be `_ss`
/// and the part after it a 36-character hyphenated UUID. Anything else is
/// MalformedLocator. Parsing does not consult storage.
SNAPLAKE_EXPORT Result<Locator> ParseLocator(std::string_view token);

/// \brief Turns locator tokens into ids of snapshots that exist.
///
/// Resolution has no side effects: resolving the same token again yields the
/// same id for as long as the snapshot exists.
class SNAPLAKE_EXPORT LocatorResolver {
 public:
  explicit LocatorResolver(std::shared_ptr<const SnapshotStore> store);

  /// \brief Resolve a raw token.
  ///
  /// \return MalformedLocator for a structurally invalid token, SnapshotNotFound
  /// when no stored snapshot has this exact id, CorruptSnapshotReference when
  /// the snapshot's manifest cannot be read.
  Result<SnapshotId> Resolve(std::string_view token) const;

  /// \brief Resolve the `snapshot_loc` option. InvalidArgument if it is absent.
  Result<SnapshotId> Resolve(const TableOptions& options) const;

 private:
  std::shared_ptr<const SnapshotStore> store_;
};

}  // namespace snaplake
