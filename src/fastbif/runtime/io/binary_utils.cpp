// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "fastbif/runtime/io/binary_utils.h"

#include <cstdint>
#include <cstring>
#include <span>

namespace fastbif {
namespace runtime {
namespace io {

uint16_t LoadLeUInt16(std::span<const uint8_t> data, size_t offset) {
  return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
}

uint32_t LoadLeUInt32(std::span<const uint8_t> data, size_t offset) {
  // Little-endian byte order
  return static_cast<uint32_t>(data[offset]) |
         (static_cast<uint32_t>(data[offset + 1]) << 8) |
         (static_cast<uint32_t>(data[offset + 2]) << 16) |
         (static_cast<uint32_t>(data[offset + 3]) << 24);
}

float LoadLeFloat32(std::span<const uint8_t> data, size_t offset) {
  static_assert(sizeof(float) == sizeof(uint32_t),
                "IEEE-754 single precision float expected");
  const uint32_t bits = LoadLeUInt32(data, offset);
  float value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

}  // namespace io
}  // namespace runtime
}  // namespace fastbif
