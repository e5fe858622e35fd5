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

/// \file snaplake/table_identifier.h
/// Names and internal identifiers of tables.

#include <compare>
#include <functional>
#include <string>
#include <string_view>

#include "snaplake/result.h"
#include "snaplake/snaplake_export.h"
#include "snaplake/util/formattable.h"
#include "snaplake/util/uuid.h"

namespace snaplake {

/// \brief Identifies a table in the warehouse catalog by database and name.
struct SNAPLAKE_EXPORT TableIdentifier {
  std::string database;
  std::string name;

  /// \brief Validates the TableIdentifier.
  Status Validate() const {
    if (database.empty()) {
      return InvalidArgument("Invalid table identifier: missing database name");
    }
    if (name.empty()) {
      return InvalidArgument("Invalid table identifier: missing table name");
    }
    if (name.find('/') != std::string::npos || database.find('/') != std::string::npos) {
      return InvalidArgument("Invalid table identifier '{}.{}': '/' is not allowed",
                             database, name);
    }
    return {};
  }

  std::string ToString() const { return database + "." + name; }

  friend bool operator==(const TableIdentifier& lhs,
                         const TableIdentifier& rhs) = default;
};

/// \brief Internal identifier of a table, allocated when the table is created.
///
/// Unlike the name, the id is never reused: dropping a table and creating one
/// with the same name yields a different TableId.
class SNAPLAKE_EXPORT TableId : public util::Formattable {
 public:
  explicit TableId(Uuid uuid) : uuid_(uuid) {}

  static TableId Generate() { return TableId(Uuid::GenerateMonotonicV7()); }

  static Result<TableId> FromString(std::string_view str) {
    auto uuid = Uuid::FromString(str);
    if (!uuid.has_value()) {
      return std::unexpected<Error>(uuid.error());
    }
    return TableId(*uuid);
  }

  const Uuid& uuid() const { return uuid_; }

  std::string ToString() const override { return uuid_.ToString(); }

  friend bool operator==(const TableId& lhs, const TableId& rhs) {
    return lhs.uuid_ == rhs.uuid_;
  }
  friend std::strong_ordering operator<=>(const TableId& lhs, const TableId& rhs) {
    return lhs.uuid_ <=> rhs.uuid_;
  }

 private:
  Uuid uuid_;
};

}  // namespace snaplake

template <>
struct std::hash<snaplake::TableId> {
  size_t operator()(const snaplake::TableId& id) const noexcept {
    auto bytes = id.uuid().bytes();
    return std::hash<std::string_view>{}(
        std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
  }
};
