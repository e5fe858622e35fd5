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
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "snaplake/file_io.h"

namespace snaplake {

class MockFileIO : public FileIO {
 public:
  MockFileIO() = default;
  ~MockFileIO() override = default;

  MOCK_METHOD((Result<std::string>), ReadFile,
              (const std::string&, std::optional<size_t>), (override));

  MOCK_METHOD(Status, WriteFile, (const std::string&, std::string_view), (override));

  MOCK_METHOD(Status, DeleteFile, (const std::string&), (override));

  MOCK_METHOD(Status, RenameFile, (const std::string&, const std::string&), (override));

  MOCK_METHOD((Result<bool>), FileExists, (const std::string&), (override));

  MOCK_METHOD((Result<std::vector<std::string>>), ListFiles, (const std::string&),
              (override));

  MOCK_METHOD((Result<std::vector<std::string>>), ListDirs, (const std::string&),
              (override));

  MOCK_METHOD(Status, DeleteDir, (const std::string&), (override));

  /// \brief Forward every call to `io` unless the test overrides it.
  void DelegateTo(std::shared_ptr<FileIO> io) {
    delegate_ = std::move(io);
    ON_CALL(*this, ReadFile)
        .WillByDefault([this](const std::string& location, std::optional<size_t> length) {
          return delegate_->ReadFile(location, length);
        });
    ON_CALL(*this, WriteFile)
        .WillByDefault([this](const std::string& location, std::string_view content) {
          return delegate_->WriteFile(location, content);
        });
    ON_CALL(*this, DeleteFile).WillByDefault([this](const std::string& location) {
      return delegate_->DeleteFile(location);
    });
    ON_CALL(*this, RenameFile)
        .WillByDefault([this](const std::string& src, const std::string& dest) {
          return delegate_->RenameFile(src, dest);
        });
    ON_CALL(*this, FileExists).WillByDefault([this](const std::string& location) {
      return delegate_->FileExists(location);
    });
    ON_CALL(*this, ListFiles).WillByDefault([this](const std::string& location) {
      return delegate_->ListFiles(location);
    });
    ON_CALL(*this, ListDirs).WillByDefault([this](const std::string& location) {
      return delegate_->ListDirs(location);
    });
    ON_CALL(*this, DeleteDir).WillByDefault([this](const std::string& location) {
      return delegate_->DeleteDir(location);
    });
  }

  const std::shared_ptr<FileIO>& delegate() const { return delegate_; }

 private:
  std::shared_ptr<FileIO> delegate_;
};

}  // namespace snaplake
