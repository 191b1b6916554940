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

#include "fastbif/bif6/bif6_reader.h"

#include <span>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "fastbif/bif6/bif6_constants.h"
#include "fastbif/bif6/bif6_errors.h"
#include "fastbif/runtime/io/binary_utils.h"
#include "fastbif/status/status_macros.h"

namespace fastbif {
namespace bif6 {

absl::StatusOr<Bif6Reader> Bif6Reader::Open(const fs::path& path) {
  auto file_or = FileReader::Open(path);
  if (!file_or.ok()) {
    return TRACE_STATUS(WithErrorKind(file_or.status(), ErrorKind::kIoError));
  }

  Bif6Reader reader;
  ASSIGN_OR_RETURN_MOVE(
      reader, Open(std::move(file_or).value()),
      absl::StrFormat("Cannot read BIF6 file: %s", path.string()));
  reader.path_ = path;
  return reader;
}

absl::StatusOr<Bif6Reader> Bif6Reader::Open(FileReader file) {
  auto bytes_or = file.ReadBytesUpTo(constants::kHeaderSize);
  if (!bytes_or.ok()) {
    return TRACE_STATUS(WithErrorKind(bytes_or.status(), ErrorKind::kIoError));
  }

  FileHeader header{};
  ASSIGN_OR_RETURN(header, ParseHeader(*bytes_or));

  return Bif6Reader(std::move(file), header);
}

Bif6Reader::Bif6Reader(FileReader file, FileHeader header)
    : file_(std::move(file)), header_(header), state_(State::kOpened) {}

absl::StatusOr<std::optional<Interval>> Bif6Reader::Next() {
  switch (state_) {
    case State::kExhausted:
      return std::optional<Interval>();
    case State::kFailed:
      return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                         "BIF6 session has already failed");
    case State::kClosed:
      return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                         "BIF6 session is closed");
    case State::kOpened:
    case State::kStreaming:
      break;
  }

  // Record header first, so an empty or cut-off stream is detected before
  // any pixel storage is requested
  auto record_header_or = file_.ReadBytesUpTo(constants::kRecordHeaderSize);
  if (!record_header_or.ok()) {
    return Fail(TRACE_STATUS(
        WithErrorKind(record_header_or.status(), ErrorKind::kIoError)));
  }
  const std::vector<uint8_t>& record_header = *record_header_or;

  if (record_header.empty()) {
    absl::Status close_status = file_.Close();
    if (!close_status.ok()) {
      return Fail(
          TRACE_STATUS(WithErrorKind(close_status, ErrorKind::kIoError)));
    }
    state_ = State::kExhausted;
    exhausted_ = true;
    if (intervals_read_ != header_.interval_count) {
      LOG(WARNING) << "BIF6 header declares " << header_.interval_count
                   << " intervals but the stream held " << intervals_read_;
    }
    return std::optional<Interval>();
  }

  const size_t record_size = header_.RecordSize();
  if (record_header.size() != constants::kRecordHeaderSize) {
    return Fail(TruncatedInterval(record_header.size(), record_size));
  }

  const size_t payload_size = header_.PayloadSize();
  auto payload_or = file_.ReadBytesUpTo(payload_size);
  if (!payload_or.ok()) {
    return Fail(
        TRACE_STATUS(WithErrorKind(payload_or.status(), ErrorKind::kIoError)));
  }
  const std::vector<uint8_t>& payload = *payload_or;
  if (payload.size() != payload_size) {
    return Fail(TruncatedInterval(
        constants::kRecordHeaderSize + payload.size(), record_size));
  }

  const std::span<const uint8_t> fields(record_header);
  const uint32_t id = LoadLeUInt32(fields, constants::kIdOffset);
  const float mz_lower = LoadLeFloat32(fields, constants::kMzLowerOffset);
  const float mz_middle = LoadLeFloat32(fields, constants::kMzMiddleOffset);
  const float mz_upper = LoadLeFloat32(fields, constants::kMzUpperOffset);

  auto image_or =
      IntensityImage::FromRowMajor(header_.width, header_.height, payload);
  if (!image_or.ok()) {
    return Fail(TRACE_STATUS(image_or.status()));
  }

  state_ = State::kStreaming;
  ++intervals_read_;
  return std::optional<Interval>(Interval(
      id, mz_lower, mz_middle, mz_upper, std::move(image_or).value()));
}

absl::Status Bif6Reader::Close() {
  state_ = State::kClosed;
  RETURN_IF_ERROR(WithErrorKind(file_.Close(), ErrorKind::kIoError),
                  "Failed to release BIF6 source");
  return absl::OkStatus();
}

absl::Status Bif6Reader::TruncatedInterval(size_t got, size_t expected) const {
  return TRACE_STATUS(MakeError(
      ErrorKind::kTruncatedInterval, absl::StatusCode::kDataLoss,
      absl::StrFormat("Incomplete BIF6 interval %zu: got %zu of %zu bytes",
                      intervals_read_, got, expected)));
}

absl::Status Bif6Reader::Fail(absl::Status status) {
  state_ = State::kFailed;
  LOG(WARNING) << "BIF6 session ended after " << intervals_read_
               << " intervals: "
               << ::fastbif::status::StripStackTrace(status.message());

  absl::Status close_status = file_.Close();
  if (!close_status.ok()) {
    LOG(WARNING) << "Failed to release BIF6 source: "
                 << ::fastbif::status::StripStackTrace(close_status.message());
  }
  return status;
}

absl::StatusOr<Bif6Reader> ParseBif6(const fs::path& path) {
  return Bif6Reader::Open(path);
}

absl::StatusOr<std::vector<Interval>> ReadAllIntervals(const fs::path& path) {
  Bif6Reader reader;
  ASSIGN_OR_RETURN_MOVE(reader, Bif6Reader::Open(path));

  std::vector<Interval> intervals;
  intervals.reserve(reader.GetIntervalCount());
  while (true) {
    std::optional<Interval> interval;
    ASSIGN_OR_RETURN_MOVE(
        interval, reader.Next(),
        absl::StrFormat("Failed to read interval %zu of %s",
                        reader.GetIntervalsRead(), path.string()));
    if (!interval.has_value()) {
      break;
    }
    intervals.push_back(std::move(*interval));
  }
  return intervals;
}

}  // namespace bif6
}  // namespace fastbif
