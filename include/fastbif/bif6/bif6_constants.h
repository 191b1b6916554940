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

#ifndef AIFO_FASTBIF_INCLUDE_FASTBIF_BIF6_BIF6_CONSTANTS_H_
#define AIFO_FASTBIF_INCLUDE_FASTBIF_BIF6_BIF6_CONSTANTS_H_

#include <array>
#include <cstddef>
#include <cstdint>

/// @file bif6_constants.h
/// @brief Layout constants of the BIF6 file format
///
/// File layout, all fields little-endian, no padding:
/// - header: magic[6], interval_count u16, width u16, height u16
/// - per interval: id u32, mz_lower f32, mz_middle f32, mz_upper f32,
///   then width * height u32 pixels in row-major order (stride = width)

namespace fastbif {
namespace bif6 {
namespace constants {

/// @brief Magic bytes at the start of every BIF6 file ("\0\0BIF6")
inline constexpr std::array<uint8_t, 6> kMagic = {0x00, 0x00, 'B',
                                                  'I',  'F',  '6'};

/// @brief Size of the magic field in bytes
inline constexpr size_t kMagicSize = kMagic.size();

/// @brief Size of the file header in bytes
inline constexpr size_t kHeaderSize = kMagicSize + 3 * sizeof(uint16_t);

/// @brief Header field offsets
inline constexpr size_t kIntervalCountOffset = 6;
inline constexpr size_t kWidthOffset = 8;
inline constexpr size_t kHeightOffset = 10;

/// @brief Size of the per-interval record header (id + three m/z floats)
inline constexpr size_t kRecordHeaderSize =
    sizeof(uint32_t) + 3 * sizeof(float);

/// @brief Record header field offsets
inline constexpr size_t kIdOffset = 0;
inline constexpr size_t kMzLowerOffset = 4;
inline constexpr size_t kMzMiddleOffset = 8;
inline constexpr size_t kMzUpperOffset = 12;

/// @brief Size of a single pixel in bytes
inline constexpr size_t kPixelSize = sizeof(uint32_t);

static_assert(kHeaderSize == 12, "BIF6 header is 12 bytes");
static_assert(kRecordHeaderSize == 16, "BIF6 record header is 16 bytes");

}  // namespace constants
}  // namespace bif6
}  // namespace fastbif

#endif  // AIFO_FASTBIF_INCLUDE_FASTBIF_BIF6_BIF6_CONSTANTS_H_
