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

#include <memory>

#include <arrow/type_fwd.h>

#include "snaplake/result.h"
#include "snaplake/schema.h"
#include "snaplake/snaplake_export.h"

namespace snaplake::arrow {

/// \brief Arrow type of a column type.
SNAPLAKE_EXPORT std::shared_ptr<::arrow::DataType> ToArrowType(ColumnType type);

/// \brief Arrow schema of a table schema, preserving column order and nullability.
SNAPLAKE_EXPORT std::shared_ptr<::arrow::Schema> ToArrowSchema(const Schema& schema);

/// \brief Check that Arrow data can be stored in a table with the given schema.
///
/// Column names, order and types must match exactly. Arrow's nullable flag is
/// not compared; instead a non-nullable column must not contain nulls.
/// Violations are InvalidSchema.
SNAPLAKE_EXPORT Status ValidateArrowTable(const Schema& schema,
                                          const ::arrow::Table& table);

}  // namespace snaplake::arrow
