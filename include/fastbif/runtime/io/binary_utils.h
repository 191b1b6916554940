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

#ifndef AIFO_FASTBIF_INCLUDE_FASTBIF_RUNTIME_IO_BINARY_UTILS_H_
#define AIFO_FASTBIF_INCLUDE_FASTBIF_RUNTIME_IO_BINARY_UTILS_H_

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * @file binary_utils.h
 * @brief Little-endian scalar decoding helpers
 *
 * All BIF6 fields are stored little-endian regardless of host byte order.
 * These helpers decode from a byte buffer at a given offset; callers are
 * responsible for checking that the buffer is long enough.
 */

namespace fastbif {
namespace runtime {
namespace io {

/// @brief Decode a little-endian 16-bit unsigned integer
/// @param data Source bytes
/// @param offset Byte offset of the field (offset + 2 <= data.size())
uint16_t LoadLeUInt16(std::span<const uint8_t> data, size_t offset);

/// @brief Decode a little-endian 32-bit unsigned integer
/// @param data Source bytes
/// @param offset Byte offset of the field (offset + 4 <= data.size())
uint32_t LoadLeUInt32(std::span<const uint8_t> data, size_t offset);

/// @brief Decode a little-endian IEEE-754 single precision float
/// @param data Source bytes
/// @param offset Byte offset of the field (offset + 4 <= data.size())
float LoadLeFloat32(std::span<const uint8_t> data, size_t offset);

}  // namespace io
}  // namespace runtime

// Import into fastbif namespace for convenience
using runtime::io::LoadLeFloat32;
using runtime::io::LoadLeUInt16;
using runtime::io::LoadLeUInt32;

}  // namespace fastbif

#endif  // AIFO_FASTBIF_INCLUDE_FASTBIF_RUNTIME_IO_BINARY_UTILS_H_
