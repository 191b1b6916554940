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

#ifndef AIFO_FASTBIF_INCLUDE_FASTBIF_FASTBIF_H_
#define AIFO_FASTBIF_INCLUDE_FASTBIF_FASTBIF_H_

/**
 * @file fastbif.h
 * @brief Main header for the FastBIF library
 *
 * FastBIF reads BIF6 mass-spectrometry-imaging files: a sequence of m/z
 * intervals, each with an ion intensity image.
 *
 * - **Core**: value types (IntensityImage, Interval)
 * - **Runtime**: byte source and little-endian decoding
 * - **BIF6**: header parsing and the sequential interval reader
 */

// ============================================================================
// Core Domain Models
// ============================================================================

#include "fastbif/core/intensity_image.h"
#include "fastbif/core/interval.h"

// ============================================================================
// Runtime Services
// ============================================================================

#include "fastbif/runtime/io/binary_utils.h"
#include "fastbif/runtime/io/file_reader.h"

// ============================================================================
// BIF6 Format
// ============================================================================

#include "fastbif/bif6/bif6_constants.h"
#include "fastbif/bif6/bif6_errors.h"
#include "fastbif/bif6/bif6_header.h"
#include "fastbif/bif6/bif6_reader.h"

#endif  // AIFO_FASTBIF_INCLUDE_FASTBIF_FASTBIF_H_
