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

#include <array>
#include <compare>
#include <cstdint>
#include <span>
#include <string_view>

#include "snaplake/result.h"
#include "snaplake/snaplake_export.h"
#include "snaplake/util/formattable.h"

/// \file snaplake/util/uuid.h
/// \brief UUID (Universally Unique Identifier) representation.

namespace snaplake {

class SNAPLAKE_EXPORT Uuid : public util::Formattable {
 public:
  Uuid() = delete;
  constexpr static size_t kLength = 16;
  constexpr static size_t kHyphenatedLength = 36;

  explicit Uuid(std::array<uint8_t, kLength> data);

  /// \brief Generate UUID version 7 per RFC 9562, with the given timestamp and a
  /// 12-bit counter placed in the rand_a field.
  ///
  /// \param unix_ts_ms number of milliseconds since start of the UNIX epoch
  /// \param counter value for rand_a, only the low 12 bits are used
  static Uuid GenerateV7(uint64_t unix_ts_ms, uint16_t counter);

  /// \brief Generate a UUID version 7 that is strictly greater than every UUID
  /// previously returned by this function in the process.
  ///
  /// Uses RFC 9562 method 1 (fixed-length dedicated counter bits): within one
  /// millisecond the 12-bit rand_a counter is incremented, and on overflow the
  /// timestamp is advanced by one millisecond.
  static Uuid GenerateMonotonicV7();

  /// \brief Create a UUID from a string in standard format.
  static Result<Uuid> FromString(std::string_view str);

  /// \brief Get the raw bytes of the UUID.
  std::span<const uint8_t> bytes() const { return data_; }

  /// \brief Unix timestamp in milliseconds embedded in a version 7 UUID.
  uint64_t unix_ts_ms() const;

  /// \brief Convert the UUID to a string in standard (lower-case, hyphenated) format.
  std::string ToString() const override;

  friend bool operator==(const Uuid& lhs, const Uuid& rhs) {
    return lhs.data_ == rhs.data_;
  }

  friend std::strong_ordering operator<=>(const Uuid& lhs, const Uuid& rhs) {
    return lhs.data_ <=> rhs.data_;
  }

 private:
  std::array<uint8_t, kLength> data_;
};

}  // namespace snaplake
