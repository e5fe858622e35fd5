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

#include "snaplake/parquet/parquet_io.h"

#include <algorithm>
#include <optional>
#include <string_view>

#include <arrow/array.h>
#include <arrow/buffer.h>
#include <arrow/io/memory.h>
#include <arrow/table.h>
#include <arrow/util/compression.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/schema.h>
#include <parquet/arrow/writer.h>
#include <parquet/exception.h>
#include <parquet/file_reader.h>
#include <parquet/file_writer.h>
#include <parquet/properties.h>

#include "snaplake/arrow/arrow_error_transform_internal.h"
#include "snaplake/arrow/arrow_schema_internal.h"
#include "snaplake/util/formatter.h"  // IWYU pragma: keep
#include "snaplake/util/logging.h"
#include "snaplake/util/macros.h"

namespace snaplake::parquet {

namespace {

template <typename ArrayType>
void UpdateMinMax(const ::arrow::ChunkedArray& column, ColumnStats& stats) {
  for (const auto& chunk : column.chunks()) {
    const auto& array = static_cast<const ArrayType&>(*chunk);
    for (int64_t i = 0; i < array.length(); ++i) {
      if (array.IsNull(i)) {
        continue;
      }
      auto value = static_cast<int64_t>(array.Value(i));
      stats.min = stats.min.has_value() ? std::min(*stats.min, value) : value;
      stats.max = stats.max.has_value() ? std::max(*stats.max, value) : value;
    }
  }
}

Result<std::string> EncodeParquet(const Schema& schema, const ::arrow::Table& table,
                                  const WriterOptions& options) {
  auto* pool = ::arrow::default_memory_pool();
  auto arrow_schema = arrow::ToArrowSchema(schema);
  // Rebind the columns to the table schema so that nullability is recorded as
  // declared rather than as the caller's Arrow schema says.
  auto bound = ::arrow::Table::Make(arrow_schema, table.columns(), table.num_rows());

  SNAPLAKE_ARROW_ASSIGN_OR_RETURN(
      auto compression, ::arrow::util::Codec::GetCompressionType(options.compression));
  ::parquet::WriterProperties::Builder builder;
  builder.memory_pool(pool)->compression(compression)->max_row_group_length(
      options.row_group_rows);
  auto writer_properties = builder.build();
  auto arrow_writer_properties =
      ::parquet::ArrowWriterProperties::Builder().store_schema()->build();

  SNAPLAKE_ARROW_ASSIGN_OR_RETURN(auto sink, ::arrow::io::BufferOutputStream::Create());
  try {
    std::shared_ptr<::parquet::SchemaDescriptor> schema_descriptor;
    SNAPLAKE_ARROW_RETURN_NOT_OK(
        ::parquet::arrow::ToParquetSchema(arrow_schema.get(), *writer_properties,
                                          *arrow_writer_properties, &schema_descriptor));
    auto schema_node = std::static_pointer_cast<::parquet::schema::GroupNode>(
        schema_descriptor->schema_root());

    auto file_writer = ::parquet::ParquetFileWriter::Open(sink, std::move(schema_node),
                                                          std::move(writer_properties));
    std::unique_ptr<::parquet::arrow::FileWriter> writer;
    SNAPLAKE_ARROW_RETURN_NOT_OK(::parquet::arrow::FileWriter::Make(
        pool, std::move(file_writer), arrow_schema, std::move(arrow_writer_properties),
        &writer));
    SNAPLAKE_ARROW_RETURN_NOT_OK(writer->WriteTable(*bound, options.row_group_rows));
    SNAPLAKE_ARROW_RETURN_NOT_OK(writer->Close());
  } catch (const ::parquet::ParquetException& ex) {
    return IOError("Failed to encode Parquet data: {}", ex.what());
  }

  SNAPLAKE_ARROW_ASSIGN_OR_RETURN(auto buffer, sink->Finish());
  return buffer->ToString();
}

}  // namespace

std::vector<ColumnStats> ComputeColumnStats(const Schema& schema,
                                            const ::arrow::Table& table) {
  std::vector<ColumnStats> column_stats;
  column_stats.reserve(schema.size());
  for (size_t i = 0; i < schema.size(); ++i) {
    const auto& column = schema.columns()[i];
    const auto& data = *table.column(static_cast<int>(i));
    ColumnStats stats{.column = column.name, .null_count = data.null_count()};
    if (column.type == ColumnType::kInt32) {
      UpdateMinMax<::arrow::Int32Array>(data, stats);
    } else if (column.type == ColumnType::kInt64) {
      UpdateMinMax<::arrow::Int64Array>(data, stats);
    }
    column_stats.push_back(std::move(stats));
  }
  return column_stats;
}

Result<DataFile> WriteDataFile(FileIO& io, const std::string& location,
                               const Schema& schema, const ::arrow::Table& table,
                               const WriterOptions& options) {
  SNAPLAKE_RETURN_UNEXPECTED(arrow::ValidateArrowTable(schema, table));
  SNAPLAKE_ASSIGN_OR_RAISE(auto content, EncodeParquet(schema, table, options));
  SNAPLAKE_RETURN_UNEXPECTED(io.WriteFile(location, content));
  Logger()->debug("Wrote data file {} with {} rows", location, table.num_rows());
  return DataFile{.location = location,
                  .record_count = table.num_rows(),
                  .file_size_in_bytes = static_cast<int64_t>(content.size()),
                  .column_stats = ComputeColumnStats(schema, table)};
}

Result<std::shared_ptr<::arrow::Table>> ReadDataFile(FileIO& io,
                                                     const DataFile& data_file,
                                                     const Schema& schema) {
  const auto& location = data_file.location;
  SNAPLAKE_ASSIGN_OR_RAISE(auto exists, io.FileExists(location));
  if (!exists) {
    Logger()->error("Data file {} is missing", location);
    return CorruptSnapshotReference("Data file {} is missing", location);
  }
  SNAPLAKE_ASSIGN_OR_RAISE(auto content, io.ReadFile(location, std::nullopt));

  auto* pool = ::arrow::default_memory_pool();
  auto input = std::make_shared<::arrow::io::BufferReader>(
      ::arrow::Buffer::FromString(std::move(content)));
  ::parquet::ReaderProperties reader_properties(pool);
  ::parquet::ArrowReaderProperties arrow_reader_properties;

  std::shared_ptr<::arrow::Table> table;
  try {
    auto file_reader = ::parquet::ParquetFileReader::Open(input, reader_properties);
    std::unique_ptr<::parquet::arrow::FileReader> reader;
    SNAPLAKE_ARROW_RETURN_NOT_OK(::parquet::arrow::FileReader::Make(
        pool, std::move(file_reader), arrow_reader_properties, &reader));
    SNAPLAKE_ARROW_RETURN_NOT_OK(reader->ReadTable(&table));
  } catch (const ::parquet::ParquetException& ex) {
    Logger()->error("Data file {} is not valid Parquet: {}", location, ex.what());
    return CorruptSnapshotReference("Data file {} is not valid Parquet: {}", location,
                                    ex.what());
  }

  if (auto status = arrow::ValidateArrowTable(schema, *table); !status) {
    Logger()->error("Data file {} does not match the table schema: {}", location,
                    status.error().message);
    return CorruptSnapshotReference("Data file {} does not match the table schema: {}",
                                    location, status.error());
  }
  if (table->num_rows() != data_file.record_count) {
    Logger()->error("Data file {} has {} rows, manifest lists {}", location,
                    table->num_rows(), data_file.record_count);
    return CorruptSnapshotReference("Data file {} has {} rows, manifest lists {}",
                                    location, table->num_rows(), data_file.record_count);
  }
  return ::arrow::Table::Make(arrow::ToArrowSchema(schema), table->columns(),
                              table->num_rows());
}

}  // namespace snaplake::parquet
