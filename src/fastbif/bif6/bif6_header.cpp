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

#include "fastbif/bif6/bif6_header.h"

#include <algorithm>
#include <string_view>

#include "absl/strings/escaping.h"
#include "absl/strings/str_format.h"
#include "fastbif/bif6/bif6_errors.h"
#include "fastbif/runtime/io/binary_utils.h"
#include "fastbif/status/status_macros.h"

namespace fastbif {
namespace bif6 {

absl::StatusOr<FileHeader> ParseHeader(std::span<const uint8_t> bytes) {
  if (bytes.size() < constants::kHeaderSize) {
    return TRACE_STATUS(MakeError(
        ErrorKind::kTruncatedHeader, absl::StatusCode::kDataLoss,
        absl::StrFormat("Invalid BIF6 header: got %zu of %zu bytes. Not a "
                        "BIF6 file?",
                        bytes.size(), constants::kHeaderSize)));
  }

  const auto magic = bytes.first(constants::kMagicSize);
  if (!std::equal(magic.begin(), magic.end(), constants::kMagic.begin())) {
    const std::string_view found(reinterpret_cast<const char*>(magic.data()),
                                 magic.size());
    return TRACE_STATUS(MakeError(
        ErrorKind::kBadMagic, absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Invalid BIF6 magic \"%s\". Not a BIF6 file?",
                        absl::CHexEscape(found))));
  }

  FileHeader header{};
  std::copy(magic.begin(), magic.end(), header.magic.begin());
  header.interval_count = LoadLeUInt16(bytes, constants::kIntervalCountOffset);
  header.width = LoadLeUInt16(bytes, constants::kWidthOffset);
  header.height = LoadLeUInt16(bytes, constants::kHeightOffset);
  return header;
}

}  // namespace bif6
}  // namespace fastbif
