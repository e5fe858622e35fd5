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

/// \file snaplake/table_options.h
/// Options attached to a table by `CREATE TABLE ... <key>='<value>'`.

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "snaplake/result.h"
#include "snaplake/snaplake_export.h"
#include "snaplake/util/config.h"

namespace snaplake {

/// \brief Normalized table options.
///
/// Option keys are case-insensitive in statements. They are folded to lower case
/// exactly once, in Make, so that every later lookup uses the canonical key.
/// Values keep their case.
class SNAPLAKE_EXPORT TableOptions : public ConfigBase<TableOptions> {
 public:
  template <typename T>
  using Entry = const ConfigBase<TableOptions>::Entry<T>;

  /// \brief Locator of the snapshot a new table is cloned from, e.g.
  /// `_ss/0190a6f8-...`. Only meaningful at creation time.
  inline static Entry<std::string> kSnapshotLocation{"snapshot_loc", ""};

  /// \brief Free-form comment.
  inline static Entry<std::string> kComment{"comment", ""};

  /// \brief Compression codec of Parquet data files, by Arrow codec name.
  inline static Entry<std::string> kParquetCompression{"write.parquet.compression-codec",
                                                       "uncompressed"};

  /// \brief Maximum number of rows per Parquet row group.
  inline static Entry<int64_t> kParquetRowGroupRows{"write.parquet.row-group-rows",
                                                    int64_t{64 * 1024}};

  /// \brief Build options from statement key/value pairs.
  ///
  /// Keys differing only in case name the same option. Repeating an option is
  /// allowed when every occurrence carries the same value; otherwise the result
  /// is InvalidArgument. Empty keys are rejected.
  static Result<TableOptions> Make(
      const std::vector<std::pair<std::string, std::string>>& options);

  /// \brief Restore options that were normalized before, e.g. from table metadata.
  static TableOptions FromMap(
      const std::unordered_map<std::string, std::string>& options);

  /// \brief Whether this table is to be created as a clone.
  bool HasSnapshotLocation() const { return Contains(kSnapshotLocation); }
};

}  // namespace snaplake
