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

#include "snaplake/snapshot.h"

#include "snaplake/util/macros.h"

namespace snaplake {

SnapshotId SnapshotId::Generate() { return SnapshotId(Uuid::GenerateMonotonicV7()); }

Result<SnapshotId> SnapshotId::FromString(std::string_view str) {
  SNAPLAKE_ASSIGN_OR_RAISE(auto uuid, Uuid::FromString(str));
  return SnapshotId(uuid);
}

bool SnapshotId::IsCanonical(std::string_view str) {
  auto id = FromString(str);
  return id.has_value() && id->ToString() == str;
}

TimePointMs SnapshotId::timestamp() const {
  return TimePointMsFromUnixMs(static_cast<int64_t>(uuid_.unix_ts_ms()));
}

SnapshotSummary SnapshotSummary::Of(const std::vector<DataFile>& data_files) {
  SnapshotSummary summary;
  for (const auto& file : data_files) {
    summary.total_records += file.record_count;
    summary.total_file_size += file.file_size_in_bytes;
  }
  summary.total_data_files = static_cast<int64_t>(data_files.size());
  return summary;
}

}  // namespace snaplake
