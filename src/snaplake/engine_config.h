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

/// \file snaplake/engine_config.h
/// Configuration of an Engine.

#include <cstdint>
#include <string>
#include <unordered_map>

#include "snaplake/snaplake_export.h"
#include "snaplake/util/config.h"

namespace snaplake {

/// \brief Engine configuration as typed key-value entries.
class SNAPLAKE_EXPORT EngineConfig : public ConfigBase<EngineConfig> {
 public:
  template <typename T>
  using Entry = const ConfigBase<EngineConfig>::Entry<T>;

  /// \brief Root location of the warehouse. Required.
  inline static Entry<std::string> kWarehouse{"warehouse", ""};

  /// \brief Database used for identifiers without one.
  inline static Entry<std::string> kDefaultDatabase{"default-database", "default"};

  /// \brief Retention policy of the liveness tracker: "reference" or "lineage".
  inline static Entry<std::string> kRetentionPolicy{"gc.retention-policy", "reference"};

  /// \brief Unreferenced snapshots younger than this are kept by Engine::Sweep().
  inline static Entry<int64_t> kMinSnapshotAgeMs{"gc.min-snapshot-age-ms", int64_t{0}};

  /// \brief Level of the library logger.
  inline static Entry<std::string> kLogLevel{"log.level", "info"};

  static EngineConfig FromMap(
      const std::unordered_map<std::string, std::string>& configs) {
    EngineConfig config;
    for (const auto& [key, value] : configs) {
      config.configs_[key] = value;
    }
    return config;
  }
};

}  // namespace snaplake
