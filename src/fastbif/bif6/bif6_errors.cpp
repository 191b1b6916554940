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

#include "fastbif/bif6/bif6_errors.h"

#include <array>
#include <optional>
#include <string>
#include <utility>

#include "absl/strings/cord.h"

namespace fastbif {
namespace bif6 {

namespace {

constexpr std::array<ErrorKind, 4> kTaggedKinds = {
    ErrorKind::kBadMagic, ErrorKind::kTruncatedHeader,
    ErrorKind::kTruncatedInterval, ErrorKind::kIoError};

}  // namespace

absl::Status WithErrorKind(absl::Status status, ErrorKind kind) {
  if (status.ok() || kind == ErrorKind::kNone) {
    return status;
  }
  status.SetPayload(kErrorKindPayloadUrl,
                    absl::Cord(std::string_view(GetName(kind))));
  return status;
}

absl::Status MakeError(ErrorKind kind, absl::StatusCode code,
                       std::string_view message) {
  return WithErrorKind(absl::Status(code, message), kind);
}

ErrorKind GetErrorKind(const absl::Status& status) {
  if (status.ok()) {
    return ErrorKind::kNone;
  }
  const std::optional<absl::Cord> payload =
      status.GetPayload(kErrorKindPayloadUrl);
  if (!payload.has_value()) {
    return ErrorKind::kNone;
  }
  const std::string name(*payload);
  for (ErrorKind kind : kTaggedKinds) {
    if (name == GetName(kind)) {
      return kind;
    }
  }
  return ErrorKind::kNone;
}

}  // namespace bif6
}  // namespace fastbif
