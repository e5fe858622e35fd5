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

#include "snaplake/schema.h"

#include <format>
#include <iterator>
#include <unordered_set>

#include "snaplake/util/string_util.h"

namespace snaplake {

std::string_view ColumnTypeToString(ColumnType type) {
  switch (type) {
    case ColumnType::kBoolean:
      return "boolean";
    case ColumnType::kInt32:
      return "int";
    case ColumnType::kInt64:
      return "bigint";
    case ColumnType::kFloat64:
      return "double";
    case ColumnType::kString:
      return "string";
  }
  return "unknown";
}

Result<ColumnType> ColumnTypeFromString(std::string_view str) {
  auto lower = StringUtils::ToLower(str);
  if (lower == "boolean" || lower == "bool") {
    return ColumnType::kBoolean;
  }
  if (lower == "int" || lower == "int32" || lower == "integer") {
    return ColumnType::kInt32;
  }
  if (lower == "bigint" || lower == "int64") {
    return ColumnType::kInt64;
  }
  if (lower == "double" || lower == "float64") {
    return ColumnType::kFloat64;
  }
  if (lower == "string" || lower == "varchar") {
    return ColumnType::kString;
  }
  return InvalidSchema("Unknown column type '{}'", str);
}

Schema::Schema(std::vector<Column> columns) : columns_(std::move(columns)) {}

Result<Schema> Schema::Make(std::vector<Column> columns) {
  if (columns.empty()) {
    return InvalidSchema("Schema must have at least one column");
  }
  std::unordered_set<std::string> names;
  for (const auto& column : columns) {
    if (column.name.empty()) {
      return InvalidSchema("Column name must not be empty");
    }
    if (!names.insert(column.name).second) {
      return InvalidSchema("Duplicate column name '{}'", column.name);
    }
  }
  return Schema(std::move(columns));
}

std::optional<size_t> Schema::FindColumn(std::string_view name) const {
  for (size_t i = 0; i < columns_.size(); ++i) {
    if (columns_[i].name == name) {
      return i;
    }
  }
  return std::nullopt;
}

std::string Schema::ToString() const {
  std::string repr = "(";
  for (size_t i = 0; i < columns_.size(); ++i) {
    const auto& column = columns_[i];
    if (i > 0) {
      repr += ", ";
    }
    std::format_to(std::back_inserter(repr), "{} {}{}", column.name,
                   ColumnTypeToString(column.type), column.nullable ? "" : " not null");
  }
  repr += ")";
  return repr;
}

}  // namespace snaplake
