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

/// \file snaplake/table_metadata.h
/// Durable records kept by the warehouse catalog.

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include "snaplake/schema.h"
#include "snaplake/snaplake_export.h"
#include "snaplake/snapshot.h"
#include "snaplake/table_identifier.h"
#include "snaplake/util/timepoint.h"

namespace snaplake {

/// \brief Immutable metadata of a table, written once when the table is created.
///
/// The current snapshot is not part of the metadata: it is the latest entry of
/// the table's history ledger.
struct SNAPLAKE_EXPORT TableMetadata {
  static constexpr int8_t kFormatVersion = 1;

  int8_t format_version = kFormatVersion;
  TableId table_id;
  TableIdentifier identifier;
  /// Base location under which the table writes its data files.
  std::string location;
  Schema schema;
  /// Table options with lower-cased keys.
  std::unordered_map<std::string, std::string> options;
  TimePointMs created_at;
  /// For clones, the snapshot the table was created from.
  std::optional<SnapshotId> source_snapshot_id;
  /// For clones, the locator token as written by the user.
  std::optional<std::string> source_locator;

  bool is_clone() const { return source_snapshot_id.has_value(); }

  friend bool operator==(const TableMetadata& lhs, const TableMetadata& rhs) = default;
};

/// \brief Record written before a clone starts mutating shared state and removed
/// once the table is committed. A leftover intent tells recovery which
/// half-built ledger to discard.
struct SNAPLAKE_EXPORT TableIntent {
  TableId table_id;
  TableIdentifier identifier;
  SnapshotId snapshot_id;
  TimePointMs created_at;

  friend bool operator==(const TableIntent& lhs, const TableIntent& rhs) = default;
};

/// \brief Metadata of a database.
struct SNAPLAKE_EXPORT DatabaseMetadata {
  std::string name;
  TimePointMs created_at;

  friend bool operator==(const DatabaseMetadata& lhs,
                         const DatabaseMetadata& rhs) = default;
};

}  // namespace snaplake
