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

#include "snaplake/util/logging.h"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace snaplake {

std::shared_ptr<spdlog::logger> Logger() {
  static std::once_flag flag;
  static std::shared_ptr<spdlog::logger> logger;
  std::call_once(flag, [] {
    logger = spdlog::get(std::string(kLoggerName));
    if (logger == nullptr) {
      logger = spdlog::stderr_color_mt(std::string(kLoggerName));
    }
  });
  return logger;
}

Status SetLogLevel(std::string_view level) {
  auto parsed = spdlog::level::from_str(std::string(level));
  // from_str falls back to "off" for unknown names
  if (parsed == spdlog::level::off && level != "off") {
    return InvalidArgument("Unknown log level '{}'", level);
  }
  Logger()->set_level(parsed);
  return {};
}

}  // namespace snaplake
