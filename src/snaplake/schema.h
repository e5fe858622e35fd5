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

/// \file snaplake/schema.h
/// Schemas for snaplake tables: a flat, ordered list of typed columns.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "snaplake/result.h"
#include "snaplake/snaplake_export.h"
#include "snaplake/util/formattable.h"

namespace snaplake {

/// \brief Primitive column types supported by tables.
enum class ColumnType : uint8_t {
  kBoolean,
  kInt32,
  kInt64,
  kFloat64,
  kString,
};

/// \brief SQL spelling of a column type, e.g. "int" or "bigint".
SNAPLAKE_EXPORT std::string_view ColumnTypeToString(ColumnType type);

/// \brief Parse a column type from its SQL spelling, ignoring case.
SNAPLAKE_EXPORT Result<ColumnType> ColumnTypeFromString(std::string_view str);

/// \brief A named, typed column.
struct SNAPLAKE_EXPORT Column {
  std::string name;
  ColumnType type;
  bool nullable = true;

  friend bool operator==(const Column& lhs, const Column& rhs) = default;
};

/// \brief A schema for a Table.
class SNAPLAKE_EXPORT Schema : public util::Formattable {
 public:
  explicit Schema(std::vector<Column> columns);

  /// \brief Create a schema, rejecting empty schemas and duplicate column names.
  static Result<Schema> Make(std::vector<Column> columns);

  const std::vector<Column>& columns() const { return columns_; }

  size_t size() const { return columns_.size(); }

  /// \brief Position of the column with the given name.
  std::optional<size_t> FindColumn(std::string_view name) const;

  std::string ToString() const override;

  friend bool operator==(const Schema& lhs, const Schema& rhs) {
    return lhs.columns_ == rhs.columns_;
  }

 private:
  std::vector<Column> columns_;
};

}  // namespace snaplake
