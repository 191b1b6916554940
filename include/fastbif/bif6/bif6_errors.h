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

#ifndef AIFO_FASTBIF_INCLUDE_FASTBIF_BIF6_BIF6_ERRORS_H_
#define AIFO_FASTBIF_INCLUDE_FASTBIF_BIF6_BIF6_ERRORS_H_

#include <string_view>

#include "absl/status/status.h"

/// @file bif6_errors.h
/// @brief Named BIF6 failure kinds carried on absl::Status
///
/// The kind is attached as a status payload so that it survives the trace
/// frames added while an error propagates. Callers use GetErrorKind() to tell
/// a corrupt file apart from a truncated one or from an I/O failure.

namespace fastbif {
namespace bif6 {

/// @brief Failure kinds of a BIF6 session
enum class ErrorKind {
  kNone,               ///< OK status, or a status not raised by the decoder
  kBadMagic,           ///< First 6 bytes are not "\0\0BIF6"
  kTruncatedHeader,    ///< Fewer than 12 bytes available at open
  kTruncatedInterval,  ///< A record read started but could not complete
  kIoError,            ///< Underlying byte source failure
};

/// @brief Payload type URL under which the kind is stored
inline constexpr std::string_view kErrorKindPayloadUrl =
    "type.googleapis.com/fastbif.bif6.ErrorKind";

/// @brief Get string representation of an error kind
constexpr const char* GetName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "None";
    case ErrorKind::kBadMagic:
      return "BadMagic";
    case ErrorKind::kTruncatedHeader:
      return "TruncatedHeader";
    case ErrorKind::kTruncatedInterval:
      return "TruncatedInterval";
    case ErrorKind::kIoError:
      return "IoError";
  }
  return "unknown";
}

/// @brief Tag a status with an error kind
/// @param status Non-OK status; an OK status is returned unchanged
/// @param kind Kind to attach
/// @return The status carrying the kind payload
absl::Status WithErrorKind(absl::Status status, ErrorKind kind);

/// @brief Build a status of the given code tagged with an error kind
absl::Status MakeError(ErrorKind kind, absl::StatusCode code,
                       std::string_view message);

/// @brief Read back the error kind of a status
/// @return The attached kind, kNone for OK or untagged statuses
ErrorKind GetErrorKind(const absl::Status& status);

}  // namespace bif6
}  // namespace fastbif

#endif  // AIFO_FASTBIF_INCLUDE_FASTBIF_BIF6_BIF6_ERRORS_H_
