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

#include "snaplake/table_options.h"

#include "snaplake/util/string_util.h"

namespace snaplake {

Result<TableOptions> TableOptions::Make(
    const std::vector<std::pair<std::string, std::string>>& options) {
  TableOptions table_options;
  for (const auto& [key, value] : options) {
    if (StringUtils::IsBlank(key)) {
      return InvalidArgument("Table option key must not be empty");
    }
    auto normalized = StringUtils::ToLower(key);
    auto [it, inserted] = table_options.configs_.try_emplace(normalized, value);
    if (!inserted && it->second != value) {
      return InvalidArgument("Conflicting values for table option '{}': '{}' and '{}'",
                             normalized, it->second, value);
    }
  }
  return table_options;
}

TableOptions TableOptions::FromMap(
    const std::unordered_map<std::string, std::string>& options) {
  TableOptions table_options;
  for (const auto& [key, value] : options) {
    table_options.configs_[StringUtils::ToLower(key)] = value;
  }
  return table_options;
}

}  // namespace snaplake
