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

/// \file snaplake/parquet/parquet_io.h
/// Reading and writing table data files in Parquet format.

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <arrow/type_fwd.h>

#include "snaplake/file_io.h"
#include "snaplake/result.h"
#include "snaplake/schema.h"
#include "snaplake/snaplake_export.h"
#include "snaplake/snapshot.h"

namespace snaplake::parquet {

/// \brief Options of the Parquet data file writer.
struct SNAPLAKE_EXPORT WriterOptions {
  /// Arrow compression codec name, e.g. "uncompressed", "snappy" or "zstd".
  std::string compression = "uncompressed";
  /// Maximum number of rows per row group.
  int64_t row_group_rows = 64 * 1024;
};

/// \brief Write an Arrow table as one Parquet data file.
///
/// The file is encoded in memory and handed to FileIO in one write, so the
/// data file is complete before any snapshot can list it. The table must
/// satisfy `schema` (see arrow::ValidateArrowTable).
///
/// \return the data file with its record count, size and column statistics.
SNAPLAKE_EXPORT Result<DataFile> WriteDataFile(FileIO& io, const std::string& location,
                                               const Schema& schema,
                                               const ::arrow::Table& table,
                                               const WriterOptions& options = {});

/// \brief Read a data file into an Arrow table with the given schema.
///
/// A missing or unreadable file is CorruptSnapshotReference: data files are
/// only read through snapshots that list them.
SNAPLAKE_EXPORT Result<std::shared_ptr<::arrow::Table>> ReadDataFile(
    FileIO& io, const DataFile& data_file, const Schema& schema);

/// \brief Null counts for every column and min/max for integer columns.
SNAPLAKE_EXPORT std::vector<ColumnStats> ComputeColumnStats(
    const Schema& schema, const ::arrow::Table& table);

}  // namespace snaplake::parquet
