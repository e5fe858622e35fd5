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

#include "snaplake/arrow/arrow_fs_file_io.h"

#include <algorithm>
#include <chrono>

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/mockfs.h>
#include <arrow/io/interfaces.h>

#include "snaplake/arrow/arrow_error_transform_internal.h"
#include "snaplake/util/macros.h"

namespace snaplake::arrow {

Result<std::string> ArrowFileSystemFileIO::ReadFile(const std::string& file_location,
                                                    std::optional<size_t> length) {
  ::arrow::fs::FileInfo file_info(file_location);
  if (length.has_value()) {
    file_info.set_size(length.value());
  }
  std::string content;
  SNAPLAKE_ARROW_ASSIGN_OR_RETURN(auto file, arrow_fs_->OpenInputFile(file_info));
  SNAPLAKE_ARROW_ASSIGN_OR_RETURN(auto file_size, file->GetSize());

  content.resize(file_size);
  size_t remain = file_size;
  size_t offset = 0;
  while (remain > 0) {
    size_t read_length = std::min(remain, static_cast<size_t>(1024 * 1024));
    SNAPLAKE_ARROW_ASSIGN_OR_RETURN(
        auto read_bytes,
        file->Read(read_length, reinterpret_cast<uint8_t*>(&content[offset])));
    if (read_bytes == 0) {
      return IOError("Unexpected end of file {} at offset {}", file_location, offset);
    }
    remain -= read_bytes;
    offset += read_bytes;
  }

  return content;
}

Status ArrowFileSystemFileIO::WriteFile(const std::string& file_location,
                                        std::string_view content) {
  SNAPLAKE_RETURN_UNEXPECTED(CreateParentDir(file_location));
  SNAPLAKE_ARROW_ASSIGN_OR_RETURN(auto file, arrow_fs_->OpenOutputStream(file_location));
  SNAPLAKE_ARROW_RETURN_NOT_OK(file->Write(content.data(), content.size()));
  SNAPLAKE_ARROW_RETURN_NOT_OK(file->Flush());
  SNAPLAKE_ARROW_RETURN_NOT_OK(file->Close());
  return {};
}

Status ArrowFileSystemFileIO::DeleteFile(const std::string& file_location) {
  SNAPLAKE_ARROW_RETURN_NOT_OK(arrow_fs_->DeleteFile(file_location));
  return {};
}

Status ArrowFileSystemFileIO::RenameFile(const std::string& src,
                                         const std::string& dest) {
  SNAPLAKE_RETURN_UNEXPECTED(CreateParentDir(dest));
  SNAPLAKE_ARROW_RETURN_NOT_OK(arrow_fs_->Move(src, dest));
  return {};
}

Result<bool> ArrowFileSystemFileIO::FileExists(const std::string& file_location) {
  SNAPLAKE_ARROW_ASSIGN_OR_RETURN(auto info, arrow_fs_->GetFileInfo(file_location));
  return info.type() == ::arrow::fs::FileType::File;
}

Result<std::vector<std::string>> ArrowFileSystemFileIO::ListFiles(
    const std::string& dir_location) {
  return ListEntries(dir_location, ::arrow::fs::FileType::File);
}

Result<std::vector<std::string>> ArrowFileSystemFileIO::ListDirs(
    const std::string& dir_location) {
  return ListEntries(dir_location, ::arrow::fs::FileType::Directory);
}

Status ArrowFileSystemFileIO::DeleteDir(const std::string& dir_location) {
  SNAPLAKE_ARROW_ASSIGN_OR_RETURN(auto info, arrow_fs_->GetFileInfo(dir_location));
  if (info.type() == ::arrow::fs::FileType::NotFound) {
    return {};
  }
  SNAPLAKE_ARROW_RETURN_NOT_OK(arrow_fs_->DeleteDir(dir_location));
  return {};
}

Status ArrowFileSystemFileIO::CreateParentDir(const std::string& file_location) {
  auto pos = file_location.find_last_of('/');
  if (pos == std::string::npos || pos == 0) {
    return {};
  }
  SNAPLAKE_ARROW_RETURN_NOT_OK(
      arrow_fs_->CreateDir(file_location.substr(0, pos), /*recursive=*/true));
  return {};
}

Result<std::vector<std::string>> ArrowFileSystemFileIO::ListEntries(
    const std::string& dir_location, ::arrow::fs::FileType type) {
  ::arrow::fs::FileSelector selector;
  selector.base_dir = dir_location;
  selector.allow_not_found = true;
  selector.recursive = false;
  SNAPLAKE_ARROW_ASSIGN_OR_RETURN(auto infos, arrow_fs_->GetFileInfo(selector));

  std::vector<std::string> names;
  for (const auto& info : infos) {
    if (info.type() == type) {
      names.push_back(info.base_name());
    }
  }
  std::ranges::sort(names);
  return names;
}

std::shared_ptr<FileIO> MakeMockFileIO() {
  return std::make_shared<ArrowFileSystemFileIO>(
      std::make_shared<::arrow::fs::internal::MockFileSystem>(
          std::chrono::system_clock::now()));
}

std::shared_ptr<FileIO> MakeLocalFileIO() {
  return std::make_shared<ArrowFileSystemFileIO>(
      std::make_shared<::arrow::fs::LocalFileSystem>());
}

}  // namespace snaplake::arrow
