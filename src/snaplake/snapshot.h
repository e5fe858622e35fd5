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

/// \file snaplake/snapshot.h
/// Immutable snapshot manifests and their identifiers.

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "snaplake/result.h"
#include "snaplake/schema.h"
#include "snaplake/snaplake_export.h"
#include "snaplake/util/formattable.h"
#include "snaplake/util/timepoint.h"
#include "snaplake/util/uuid.h"

namespace snaplake {

/// \brief Identifier of an immutable snapshot.
///
/// A SnapshotId is a UUID version 7. Ids generated by one process are strictly
/// increasing, so comparing two ids compares their creation order. The textual
/// form is the canonical lower-case hyphenated UUID.
class SNAPLAKE_EXPORT SnapshotId : public util::Formattable {
 public:
  explicit SnapshotId(Uuid uuid) : uuid_(uuid) {}

  /// \brief Generate a fresh id, greater than every id generated before it.
  static SnapshotId Generate();

  /// \brief Parse an id from its hyphenated form. Hex digits of either case are
  /// accepted; use IsCanonical to check the stored spelling.
  static Result<SnapshotId> FromString(std::string_view str);

  /// \brief Whether the string is the canonical spelling of some id.
  static bool IsCanonical(std::string_view str);

  const Uuid& uuid() const { return uuid_; }

  /// \brief Creation time embedded in the id.
  TimePointMs timestamp() const;

  std::string ToString() const override { return uuid_.ToString(); }

  friend bool operator==(const SnapshotId& lhs, const SnapshotId& rhs) {
    return lhs.uuid_ == rhs.uuid_;
  }
  friend std::strong_ordering operator<=>(const SnapshotId& lhs,
                                          const SnapshotId& rhs) {
    return lhs.uuid_ <=> rhs.uuid_;
  }

 private:
  Uuid uuid_;
};

/// \brief Per-column statistics of a data file.
struct SNAPLAKE_EXPORT ColumnStats {
  std::string column;
  int64_t null_count = 0;
  /// Only tracked for integer columns.
  std::optional<int64_t> min;
  std::optional<int64_t> max;

  friend bool operator==(const ColumnStats& lhs, const ColumnStats& rhs) = default;
};

/// \brief An immutable data file referenced by one or more snapshots.
struct SNAPLAKE_EXPORT DataFile {
  /// Full location of the file, as understood by FileIO.
  std::string location;
  int64_t record_count = 0;
  int64_t file_size_in_bytes = 0;
  std::vector<ColumnStats> column_stats;

  friend bool operator==(const DataFile& lhs, const DataFile& rhs) = default;
};

/// \brief Aggregates over the data files of a snapshot.
struct SNAPLAKE_EXPORT SnapshotSummary {
  int64_t total_records = 0;
  int64_t total_file_size = 0;
  int64_t total_data_files = 0;

  /// \brief Compute the summary of a list of data files.
  static SnapshotSummary Of(const std::vector<DataFile>& data_files);

  friend bool operator==(const SnapshotSummary& lhs,
                         const SnapshotSummary& rhs) = default;
};

/// \brief Content of a snapshot before it is stored.
struct SNAPLAKE_EXPORT SnapshotManifest {
  std::optional<SnapshotId> parent_snapshot_id;
  /// Schema the data files were written with.
  Schema schema;
  /// Complete list of live data files, in order.
  std::vector<DataFile> data_files;
};

/// \brief A stored, immutable snapshot of a table's data.
struct SNAPLAKE_EXPORT Snapshot {
  SnapshotId snapshot_id;
  std::optional<SnapshotId> parent_snapshot_id;
  TimePointMs timestamp_ms;
  Schema schema;
  std::vector<DataFile> data_files;
  SnapshotSummary summary;

  friend bool operator==(const Snapshot& lhs, const Snapshot& rhs) = default;
};

}  // namespace snaplake

template <>
struct std::hash<snaplake::SnapshotId> {
  size_t operator()(const snaplake::SnapshotId& id) const noexcept {
    auto bytes = id.uuid().bytes();
    return std::hash<std::string_view>{}(
        std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
  }
};
