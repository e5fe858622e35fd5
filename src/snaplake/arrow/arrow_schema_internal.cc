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

#include "snaplake/arrow/arrow_schema_internal.h"

#include <arrow/table.h>
#include <arrow/type.h>

namespace snaplake::arrow {

std::shared_ptr<::arrow::DataType> ToArrowType(ColumnType type) {
  switch (type) {
    case ColumnType::kBoolean:
      return ::arrow::boolean();
    case ColumnType::kInt32:
      return ::arrow::int32();
    case ColumnType::kInt64:
      return ::arrow::int64();
    case ColumnType::kFloat64:
      return ::arrow::float64();
    case ColumnType::kString:
      return ::arrow::utf8();
  }
  return ::arrow::null();
}

std::shared_ptr<::arrow::Schema> ToArrowSchema(const Schema& schema) {
  ::arrow::FieldVector fields;
  fields.reserve(schema.size());
  for (const auto& column : schema.columns()) {
    fields.push_back(
        ::arrow::field(column.name, ToArrowType(column.type), column.nullable));
  }
  return ::arrow::schema(std::move(fields));
}

Status ValidateArrowTable(const Schema& schema, const ::arrow::Table& table) {
  const auto& arrow_schema = *table.schema();
  if (arrow_schema.num_fields() != static_cast<int>(schema.size())) {
    return InvalidSchema("Expected {} columns {}, got {} columns", schema.size(),
                         schema.ToString(), arrow_schema.num_fields());
  }
  for (int i = 0; i < arrow_schema.num_fields(); ++i) {
    const auto& column = schema.columns()[i];
    const auto& field = *arrow_schema.field(i);
    if (field.name() != column.name) {
      return InvalidSchema("Column {} must be named '{}', got '{}'", i, column.name,
                           field.name());
    }
    if (!field.type()->Equals(*ToArrowType(column.type))) {
      return InvalidSchema("Column '{}' must have type {}, got {}", column.name,
                           ColumnTypeToString(column.type), field.type()->ToString());
    }
    if (!column.nullable && table.column(i)->null_count() > 0) {
      return InvalidSchema("Column '{}' is not nullable but contains {} nulls",
                           column.name, table.column(i)->null_count());
    }
  }
  return {};
}

}  // namespace snaplake::arrow
