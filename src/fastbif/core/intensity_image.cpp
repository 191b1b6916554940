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

#include "fastbif/core/intensity_image.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

#include "absl/log/check.h"
#include "absl/strings/str_format.h"
#include "fastbif/runtime/io/binary_utils.h"
#include "fastbif/status/status_macros.h"

namespace fastbif {
namespace core {

absl::StatusOr<IntensityImage> IntensityImage::FromRowMajor(
    uint32_t width, uint32_t height,
    std::span<const uint8_t> row_major_bytes) {
  const size_t pixel_count = static_cast<size_t>(width) * height;
  if (row_major_bytes.size() != pixel_count * sizeof(uint32_t)) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Expected %zu bytes for a %u x %u image, got %zu",
                        pixel_count * sizeof(uint32_t), width, height,
                        row_major_bytes.size()));
  }

  // Physical (height, width) -> logical (width, height)
  std::vector<uint32_t> data(pixel_count);
  for (uint32_t y = 0; y < height; ++y) {
    const size_t row_offset = static_cast<size_t>(y) * width;
    for (uint32_t x = 0; x < width; ++x) {
      data[static_cast<size_t>(x) * height + y] =
          LoadLeUInt32(row_major_bytes, (row_offset + x) * sizeof(uint32_t));
    }
  }

  return IntensityImage(width, height, std::move(data));
}

std::span<const uint32_t> IntensityImage::operator[](uint32_t x) const {
  DCHECK_LT(x, width_);
  return {data_.data() + static_cast<size_t>(x) * height_, height_};
}

uint32_t IntensityImage::At(uint32_t x, uint32_t y) const {
  if (x >= width_ || y >= height_) {
    throw std::out_of_range(absl::StrFormat(
        "Pixel (%u, %u) outside %u x %u image", x, y, width_, height_));
  }
  return data_[static_cast<size_t>(x) * height_ + y];
}

uint64_t IntensityImage::Sum() const noexcept {
  return std::accumulate(data_.begin(), data_.end(), uint64_t{0});
}

uint32_t IntensityImage::Max() const noexcept {
  if (data_.empty()) {
    return 0;
  }
  return *std::max_element(data_.begin(), data_.end());
}

}  // namespace core
}  // namespace fastbif
