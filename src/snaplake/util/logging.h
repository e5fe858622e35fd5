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

/// \file snaplake/util/logging.h
/// \brief Library-wide logger.

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "snaplake/result.h"
#include "snaplake/snaplake_export.h"

namespace snaplake {

/// \brief Name under which the library logger is registered with spdlog.
constexpr std::string_view kLoggerName = "snaplake";

/// \brief The logger used by every component of the library.
///
/// Created on first use with a colored stderr sink unless the application has
/// already registered a logger named "snaplake".
SNAPLAKE_EXPORT std::shared_ptr<spdlog::logger> Logger();

/// \brief Set the library log level from its name ("trace", "debug", "info",
/// "warn", "error", "critical" or "off").
SNAPLAKE_EXPORT Status SetLogLevel(std::string_view level);

}  // namespace snaplake
