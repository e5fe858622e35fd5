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

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "snaplake/result.h"
#include "snaplake/snaplake_export.h"

namespace snaplake {

/// \brief Pluggable module for reading, writing, renaming and deleting files.
///
/// Every durable artifact of the engine goes through this interface: snapshot
/// manifests, history entries, intent records, table metadata and Parquet data
/// files.
///
/// Note that WriteFile is not atomic. Callers that must never expose a
/// partially written file write to a temporary location and RenameFile it into
/// place.
class SNAPLAKE_EXPORT FileIO {
 public:
  FileIO() = default;
  virtual ~FileIO() = default;

  /// \brief Read the content of the file at the given location.
  ///
  /// \param file_location The location of the file to read.
  /// \param length The number of bytes to read. Some object storage need to specify
  /// the length to read, e.g. S3 `GetObject` has a Range parameter.
  /// \return The content of the file if the read succeeded, an error code if the read
  /// failed.
  virtual Result<std::string> ReadFile(const std::string& file_location,
                                       std::optional<size_t> length) {
    return NotImplemented("ReadFile not implemented");
  }

  /// \brief Write the given content to the file at the given location, replacing
  /// any existing file. Missing parent directories are created.
  virtual Status WriteFile(const std::string& file_location, std::string_view content) {
    return NotImplemented("WriteFile not implemented");
  }

  /// \brief Delete a file at the given location.
  virtual Status DeleteFile(const std::string& file_location) {
    return NotImplemented("DeleteFile not implemented");
  }

  /// \brief Atomically move a file, replacing the destination if it exists.
  virtual Status RenameFile(const std::string& src, const std::string& dest) {
    return NotImplemented("RenameFile not implemented");
  }

  /// \brief Check whether a regular file exists at the given location.
  virtual Result<bool> FileExists(const std::string& file_location) {
    return NotImplemented("FileExists not implemented");
  }

  /// \brief List the names (not full paths) of the regular files directly under
  /// a directory. A missing directory yields an empty list.
  virtual Result<std::vector<std::string>> ListFiles(const std::string& dir_location) {
    return NotImplemented("ListFiles not implemented");
  }

  /// \brief List the names of the subdirectories directly under a directory. A
  /// missing directory yields an empty list.
  virtual Result<std::vector<std::string>> ListDirs(const std::string& dir_location) {
    return NotImplemented("ListDirs not implemented");
  }

  /// \brief Recursively delete a directory and its contents. Deleting a missing
  /// directory succeeds.
  virtual Status DeleteDir(const std::string& dir_location) {
    return NotImplemented("DeleteDir not implemented");
  }
};

}  // namespace snaplake
