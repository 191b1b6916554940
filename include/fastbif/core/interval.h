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

#ifndef AIFO_FASTBIF_INCLUDE_FASTBIF_CORE_INTERVAL_H_
#define AIFO_FASTBIF_INCLUDE_FASTBIF_CORE_INTERVAL_H_

#include <cstdint>
#include <utility>

#include "fastbif/core/intensity_image.h"

/**
 * @file interval.h
 * @brief Decoded m/z interval
 *
 * An interval pairs an m/z sub-range with the ion image recorded over it.
 * Values are produced by Bif6Reader::Next() and are fully owned by the
 * caller; they share no state with the reader.
 */

namespace fastbif {
namespace core {

/// @brief One decoded BIF6 interval record
///
/// Immutable after construction. The m/z bounds are passed through as stored;
/// lower <= middle <= upper is not enforced.
class Interval {
 public:
  Interval(uint32_t id, float mz_lower, float mz_middle, float mz_upper,
           IntensityImage image)
      : id_(id),
        mz_lower_(mz_lower),
        mz_middle_(mz_middle),
        mz_upper_(mz_upper),
        image_(std::move(image)) {}

  /// @brief Identifier of the interval, nominally unique within a file
  [[nodiscard]] uint32_t GetId() const noexcept { return id_; }

  /// @brief Lower bound of the m/z range
  [[nodiscard]] float GetMzLower() const noexcept { return mz_lower_; }

  /// @brief Middle of the m/z range
  [[nodiscard]] float GetMzMiddle() const noexcept { return mz_middle_; }

  /// @brief Upper bound of the m/z range
  [[nodiscard]] float GetMzUpper() const noexcept { return mz_upper_; }

  /// @brief Intensity image, shape (width, height), indexed image[x][y]
  [[nodiscard]] const IntensityImage& GetImage() const noexcept {
    return image_;
  }

  /// @brief Whether this is the total-ion-count image
  ///
  /// The TIC image is conventionally the first interval of a file and carries
  /// id 0.
  [[nodiscard]] bool IsTicImage() const noexcept { return id_ == 0; }

 private:
  uint32_t id_;
  float mz_lower_;
  float mz_middle_;
  float mz_upper_;
  IntensityImage image_;
};

}  // namespace core

using core::Interval;

}  // namespace fastbif

#endif  // AIFO_FASTBIF_INCLUDE_FASTBIF_CORE_INTERVAL_H_
