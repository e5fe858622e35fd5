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

#include "snaplake/util/uuid.h"

#include <chrono>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <random>
#include <string>

#include "snaplake/result.h"
#include "snaplake/util/formatter.h"  // IWYU pragma: keep
#include "snaplake/util/macros.h"

namespace snaplake {

namespace {

constexpr std::array<uint8_t, 256> BuildHexTable() {
  std::array<uint8_t, 256> buf{};
  for (int32_t i = 0; i < 256; i++) {
    if (i >= '0' && i <= '9') {
      buf[i] = static_cast<uint8_t>(i - '0');
    } else if (i >= 'a' && i <= 'f') {
      buf[i] = static_cast<uint8_t>(i - 'a' + 10);
    } else if (i >= 'A' && i <= 'F') {
      buf[i] = static_cast<uint8_t>(i - 'A' + 10);
    } else {
      buf[i] = 0xFF;
    }
  }
  return buf;
}

constexpr auto kHexTable = BuildHexTable();

// Parse a UUID string with dashes, e.g. "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"
Result<Uuid> ParseHyphenated(std::string_view s) {
  SNAPLAKE_DCHECK(s.size() == Uuid::kHyphenatedLength, "s must be 36 characters long");

  if (!(s[8] == '-' && s[13] == '-' && s[18] == '-' && s[23] == '-')) [[unlikely]] {
    return InvalidArgument("Invalid UUID string: {}", s);
  }

  constexpr std::array<size_t, 8> positions = {0, 4, 9, 14, 19, 24, 28, 32};
  std::array<uint8_t, 16> uuid{};

  for (size_t j = 0; j < 8; j++) {
    size_t i = positions[j];
    uint8_t h1 = kHexTable[static_cast<uint8_t>(s[i])];
    uint8_t h2 = kHexTable[static_cast<uint8_t>(s[i + 1])];
    uint8_t h3 = kHexTable[static_cast<uint8_t>(s[i + 2])];
    uint8_t h4 = kHexTable[static_cast<uint8_t>(s[i + 3])];

    if ((h1 | h2 | h3 | h4) == 0xFF) [[unlikely]] {
      return InvalidArgument("Invalid UUID string: {}", s);
    }

    uuid[j * 2] = static_cast<uint8_t>((h1 << 4) | h2);
    uuid[j * 2 + 1] = static_cast<uint8_t>((h3 << 4) | h4);
  }

  return Uuid(uuid);
}

std::mt19937_64& RandomEngine() {
  static std::random_device rd;
  static std::mt19937_64 gen(rd());
  return gen;
}

std::mutex& RandomMutex() {
  static std::mutex mutex;
  return mutex;
}

uint64_t NextRandom() {
  std::lock_guard lock(RandomMutex());
  return RandomEngine()();
}

}  // namespace

Uuid::Uuid(std::array<uint8_t, kLength> data) : data_(data) {}

Uuid Uuid::GenerateV7(uint64_t unix_ts_ms, uint16_t counter) {
  std::array<uint8_t, 16> uuid = {};

  // Set the timestamp (in milliseconds since Unix epoch)
  uuid[0] = (unix_ts_ms >> 40) & 0xFF;
  uuid[1] = (unix_ts_ms >> 32) & 0xFF;
  uuid[2] = (unix_ts_ms >> 24) & 0xFF;
  uuid[3] = (unix_ts_ms >> 16) & 0xFF;
  uuid[4] = (unix_ts_ms >> 8) & 0xFF;
  uuid[5] = unix_ts_ms & 0xFF;

  // rand_a carries the counter, rand_b stays random
  uuid[6] = static_cast<uint8_t>(0x70 | ((counter >> 8) & 0x0F));
  uuid[7] = static_cast<uint8_t>(counter & 0xFF);

  uint64_t rand_b = NextRandom();
  std::memcpy(uuid.data() + 8, &rand_b, 8);
  // set variant field, top two bits are 1, 0
  uuid[8] = (uuid[8] & 0x3F) | 0x80;

  return Uuid(uuid);
}

Uuid Uuid::GenerateMonotonicV7() {
  static std::mutex mutex;
  static uint64_t last_ts_ms = 0;
  static uint16_t counter = 0;
  constexpr uint16_t kMaxCounter = 0x0FFF;

  auto now_ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());

  std::lock_guard lock(mutex);
  if (now_ms > last_ts_ms) {
    last_ts_ms = now_ms;
    counter = 0;
  } else if (counter < kMaxCounter) {
    ++counter;
  } else {
    ++last_ts_ms;
    counter = 0;
  }
  return GenerateV7(last_ts_ms, counter);
}

Result<Uuid> Uuid::FromString(std::string_view str) {
  if (str.size() != kHyphenatedLength) {
    return InvalidArgument("Invalid UUID string: {}", str);
  }
  return ParseHyphenated(str);
}

uint64_t Uuid::unix_ts_ms() const {
  uint64_t ts = 0;
  for (size_t i = 0; i < 6; ++i) {
    ts = (ts << 8) | data_[i];
  }
  return ts;
}

std::string Uuid::ToString() const {
  return std::format(
      "{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}{:02x}"
      "{:02x}{:02x}{:02x}",
      data_[0], data_[1], data_[2], data_[3], data_[4], data_[5], data_[6], data_[7],
      data_[8], data_[9], data_[10], data_[11], data_[12], data_[13], data_[14],
      data_[15]);
}

}  // namespace snaplake
