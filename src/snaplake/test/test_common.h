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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <arrow/api.h>
#include <gtest/gtest.h>

#include "snaplake/schema.h"

namespace snaplake {

/// \brief Schema with a single nullable int column, `(c int)`.
inline Schema IntSchema(const std::string& column = "c") {
  return Schema({Column{.name = column, .type = ColumnType::kInt32}});
}

/// \brief Build a one-column int32 Arrow table; nullopt values become nulls.
inline std::shared_ptr<::arrow::Table> MakeIntTable(
    const std::vector<std::optional<int32_t>>& values, const std::string& column = "c",
    bool nullable = true) {
  ::arrow::Int32Builder builder;
  for (const auto& value : values) {
    auto status = value.has_value() ? builder.Append(*value) : builder.AppendNull();
    EXPECT_TRUE(status.ok()) << status.ToString();
  }
  std::shared_ptr<::arrow::Array> array;
  auto status = builder.Finish(&array);
  EXPECT_TRUE(status.ok()) << status.ToString();
  auto schema = ::arrow::schema({::arrow::field(column, ::arrow::int32(), nullable)});
  return ::arrow::Table::Make(std::move(schema), {array});
}

/// \brief Values of an int32 column, in row order; nulls are skipped.
inline std::vector<int32_t> IntValues(const ::arrow::Table& table, int column = 0) {
  std::vector<int32_t> values;
  for (const auto& chunk : table.column(column)->chunks()) {
    const auto& array = static_cast<const ::arrow::Int32Array&>(*chunk);
    for (int64_t i = 0; i < array.length(); ++i) {
      if (array.IsValid(i)) {
        values.push_back(array.Value(i));
      }
    }
  }
  return values;
}

}  // namespace snaplake
