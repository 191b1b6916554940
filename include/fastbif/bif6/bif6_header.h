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

#ifndef AIFO_FASTBIF_INCLUDE_FASTBIF_BIF6_BIF6_HEADER_H_
#define AIFO_FASTBIF_INCLUDE_FASTBIF_BIF6_BIF6_HEADER_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "absl/status/statusor.h"
#include "fastbif/bif6/bif6_constants.h"
#include "fastbif/core/intensity_image.h"

namespace fastbif {
namespace bif6 {

/// @brief Fixed BIF6 file header
///
/// Parsed once when a file is opened and never modified afterwards.
struct FileHeader {
  std::array<uint8_t, constants::kMagicSize> magic;  ///< Always kMagic
  uint16_t interval_count;  ///< Declared number of interval records
  uint16_t width;           ///< Pixels per image row
  uint16_t height;          ///< Image rows

  /// @brief Image dimensions shared by every interval
  /// @return [width, height]
  [[nodiscard]] ImageDimensions ImageSize() const noexcept {
    return {width, height};
  }

  /// @brief Size of one interval's pixel payload in bytes
  [[nodiscard]] size_t PayloadSize() const noexcept {
    return static_cast<size_t>(width) * height * constants::kPixelSize;
  }

  /// @brief Size of one complete interval record in bytes
  [[nodiscard]] size_t RecordSize() const noexcept {
    return constants::kRecordHeaderSize + PayloadSize();
  }
};

/// @brief Parse and validate the BIF6 file header
///
/// @param bytes Bytes read from the start of the file; at most kHeaderSize
///        are inspected
/// @return Parsed header or error
/// @retval absl::DataLossError (kTruncatedHeader) if fewer than kHeaderSize
///         bytes are given
/// @retval absl::InvalidArgumentError (kBadMagic) if the magic does not match
absl::StatusOr<FileHeader> ParseHeader(std::span<const uint8_t> bytes);

}  // namespace bif6
}  // namespace fastbif

#endif  // AIFO_FASTBIF_INCLUDE_FASTBIF_BIF6_BIF6_HEADER_H_
