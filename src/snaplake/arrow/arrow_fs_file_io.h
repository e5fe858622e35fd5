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

#include <arrow/filesystem/filesystem.h>

#include "snaplake/file_io.h"
#include "snaplake/snaplake_export.h"

namespace snaplake::arrow {

/// \brief A concrete implementation of FileIO for Arrow file system.
class SNAPLAKE_EXPORT ArrowFileSystemFileIO : public FileIO {
 public:
  explicit ArrowFileSystemFileIO(std::shared_ptr<::arrow::fs::FileSystem> arrow_fs)
      : arrow_fs_(std::move(arrow_fs)) {}

  ~ArrowFileSystemFileIO() override = default;

  Result<std::string> ReadFile(const std::string& file_location,
                               std::optional<size_t> length) override;

  Status WriteFile(const std::string& file_location, std::string_view content) override;

  Status DeleteFile(const std::string& file_location) override;

  Status RenameFile(const std::string& src, const std::string& dest) override;

  Result<bool> FileExists(const std::string& file_location) override;

  Result<std::vector<std::string>> ListFiles(const std::string& dir_location) override;

  Result<std::vector<std::string>> ListDirs(const std::string& dir_location) override;

  Status DeleteDir(const std::string& dir_location) override;

  /// \brief Get the Arrow file system.
  const std::shared_ptr<::arrow::fs::FileSystem>& fs() const { return arrow_fs_; }

 private:
  Status CreateParentDir(const std::string& file_location);

  Result<std::vector<std::string>> ListEntries(const std::string& dir_location,
                                               ::arrow::fs::FileType type);

  std::shared_ptr<::arrow::fs::FileSystem> arrow_fs_;
};

/// \brief Make an in-memory FileIO backed by arrow::fs::internal::MockFileSystem.
SNAPLAKE_EXPORT std::shared_ptr<FileIO> MakeMockFileIO();

/// \brief Make a local FileIO backed by arrow::fs::LocalFileSystem.
SNAPLAKE_EXPORT std::shared_ptr<FileIO> MakeLocalFileIO();

}  // namespace snaplake::arrow
