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

/// \file snaplake/util/formatter.h
/// std::formatter specializations for Formattable objects and for Error.
/// Kept apart from snaplake/util/formattable.h so that widely included
/// headers do not pull in <format>.

#include <concepts>
#include <format>
#include <string_view>

#include "snaplake/result.h"
#include "snaplake/util/formattable.h"

/// \brief Make all classes deriving from snaplake::util::Formattable
///   formattable with std::format.
template <std::derived_from<snaplake::util::Formattable> Derived>
struct std::formatter<Derived> : std::formatter<std::string_view> {
  template <class FormatContext>
  auto format(const snaplake::util::Formattable& obj, FormatContext& ctx) const {
    return std::formatter<string_view>::format(obj.ToString(), ctx);
  }
};

/// \brief Format an Error as "<kind>: <message>", e.g. when wrapping the cause
///   of a failure into another error message.
template <>
struct std::formatter<snaplake::Error> : std::formatter<std::string_view> {
  template <class FormatContext>
  auto format(const snaplake::Error& error, FormatContext& ctx) const {
    return std::formatter<string_view>::format(
        std::format("{}: {}", snaplake::ErrorKindToString(error.kind), error.message),
        ctx);
  }
};
