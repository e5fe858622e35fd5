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

/// \file snaplake/exception.h
/// Common exception types for snaplake.  Note that this library primarily uses
/// return values for error handling, not exceptions.  Some operations,
/// however, will throw exceptions in contexts where no other option is
/// available (e.g. parsing a configuration value).  In those cases, an
/// exception type from here will be used.

#include <format>
#include <stdexcept>

#include "snaplake/snaplake_export.h"

namespace snaplake {

/// \brief Base exception class for exceptions thrown by the snaplake library.
class SNAPLAKE_EXPORT SnaplakeError : public std::runtime_error {
 public:
  explicit SnaplakeError(const std::string& what) : std::runtime_error(what) {}
};

#define SNAPLAKE_CHECK_OR_DIE(condition, ...)                  \
  do {                                                         \
    if (!(condition)) [[unlikely]] {                           \
      throw snaplake::SnaplakeError(std::format(__VA_ARGS__)); \
    }                                                          \
  } while (0)

}  // namespace snaplake
