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

#ifndef AIFO_FASTBIF_INCLUDE_FASTBIF_CORE_INTENSITY_IMAGE_H_
#define AIFO_FASTBIF_INCLUDE_FASTBIF_CORE_INTENSITY_IMAGE_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"

namespace fastbif {
namespace core {

/// @brief Image dimensions
using ImageDimensions = std::array<uint32_t, 2>;  // [width, height]

/// @brief Two-dimensional array of 32-bit ion intensities
///
/// The array has shape (width, height) and is indexed image[x][y]. This is
/// the transpose of the (height, width) row-major order in which BIF6 stores
/// pixels on disk. Storage is contiguous per x, so image[x] is a column of
/// `height` values.
class IntensityImage {
 public:
  /// @brief Default constructor for an empty 0 x 0 image
  IntensityImage() = default;

  /// @brief Build the (width, height) image from physical pixel bytes
  ///
  /// @param width Number of pixels per stored row
  /// @param height Number of stored rows
  /// @param row_major_bytes width * height little-endian uint32 values,
  ///        physical element y * width + x becomes image[x][y]
  /// @return Transposed image or error
  /// @retval absl::InvalidArgumentError if the byte count does not match
  static absl::StatusOr<IntensityImage> FromRowMajor(
      uint32_t width, uint32_t height,
      std::span<const uint8_t> row_major_bytes);

  /// @brief Get image shape
  /// @return [width, height]
  [[nodiscard]] ImageDimensions Shape() const noexcept {
    return {width_, height_};
  }

  [[nodiscard]] uint32_t GetWidth() const noexcept { return width_; }

  [[nodiscard]] uint32_t GetHeight() const noexcept { return height_; }

  [[nodiscard]] bool Empty() const noexcept { return data_.empty(); }

  /// @brief Total number of pixels
  [[nodiscard]] size_t Size() const noexcept { return data_.size(); }

  /// @brief Column x of the image, height values long
  ///
  /// Enables image[x][y] indexing. x is only checked in debug builds and
  /// y not at all; use At() for checked access.
  std::span<const uint32_t> operator[](uint32_t x) const;

  /// @brief Bounds-checked pixel access
  /// @param x Column coordinate in [0, width)
  /// @param y Row coordinate in [0, height)
  /// @throws std::out_of_range if coordinates are outside the image
  [[nodiscard]] uint32_t At(uint32_t x, uint32_t y) const;

  /// @brief Sum of all intensities
  [[nodiscard]] uint64_t Sum() const noexcept;

  /// @brief Largest intensity, 0 for an empty image
  [[nodiscard]] uint32_t Max() const noexcept;

  /// @brief Raw storage in (width, height) order, index x * height + y
  [[nodiscard]] const std::vector<uint32_t>& GetData() const noexcept {
    return data_;
  }

  bool operator==(const IntensityImage& other) const = default;

 private:
  IntensityImage(uint32_t width, uint32_t height, std::vector<uint32_t> data)
      : width_(width), height_(height), data_(std::move(data)) {}

  uint32_t width_ = 0;
  uint32_t height_ = 0;
  std::vector<uint32_t> data_;
};

}  // namespace core

using core::ImageDimensions;
using core::IntensityImage;

}  // namespace fastbif

#endif  // AIFO_FASTBIF_INCLUDE_FASTBIF_CORE_INTENSITY_IMAGE_H_
