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

#ifndef AIFO_FASTBIF_INCLUDE_FASTBIF_BIF6_BIF6_READER_H_
#define AIFO_FASTBIF_INCLUDE_FASTBIF_BIF6_BIF6_READER_H_

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fastbif/bif6/bif6_header.h"
#include "fastbif/core/intensity_image.h"
#include "fastbif/core/interval.h"
#include "fastbif/runtime/io/file_reader.h"

/// @file bif6_reader.h
/// @brief Sequential decoder for BIF6 mass-spectrometry-imaging files
///
/// A BIF6 file is a 12-byte header followed by back-to-back interval records
/// of identical size. The reader validates the header on open and then hands
/// out one Interval per Next() call until the stream is exhausted. There is
/// no seeking and no restart.

namespace fs = std::filesystem;

namespace fastbif {
namespace bif6 {

/// @brief Decoder session over a single BIF6 byte source
///
/// Session states:
///   kOpened -> (kStreaming)* -> kExhausted | kFailed -> kClosed
/// kClosed is reachable from every state. The byte source is released on a
/// clean end of stream, on a decode failure, on Close() and on destruction.
///
/// Usage:
/// ```cpp
/// ASSIGN_OR_RETURN_MOVE(auto reader, Bif6Reader::Open(path));
/// while (true) {
///   std::optional<Interval> interval;
///   ASSIGN_OR_RETURN_MOVE(interval, reader.Next());
///   if (!interval) break;
///   Consume(interval->GetImage()[x][y]);
/// }
/// ```
class Bif6Reader {
 public:
  /// @brief Session state
  enum class State {
    kOpened,     ///< Header validated, no interval produced yet
    kStreaming,  ///< At least one interval produced
    kExhausted,  ///< Clean end of stream reached
    kFailed,     ///< A decode or I/O error ended the session
    kClosed,     ///< Closed by the caller
  };

  /// @brief Default constructor (creates closed reader)
  Bif6Reader() = default;

  /// @brief Open a BIF6 file and validate its header
  ///
  /// @param path Path to the .bif6 file
  /// @return Reader positioned at the first interval record, or error
  /// @retval absl::NotFoundError (kIoError) if the file cannot be opened
  /// @retval absl::DataLossError (kTruncatedHeader) if the file is shorter
  ///         than the header
  /// @retval absl::InvalidArgumentError (kBadMagic) on a magic mismatch
  static absl::StatusOr<Bif6Reader> Open(const fs::path& path);

  /// @brief Start a session on an already open byte source
  ///
  /// The reader takes exclusive ownership of the source. Reading starts at
  /// the current position of the source.
  ///
  /// @param file Open byte source
  /// @return Reader positioned at the first interval record, or error
  static absl::StatusOr<Bif6Reader> Open(FileReader file);

  Bif6Reader(Bif6Reader&& other) noexcept = default;
  Bif6Reader& operator=(Bif6Reader&& other) noexcept = default;
  ~Bif6Reader() = default;

  Bif6Reader(const Bif6Reader&) = delete;
  Bif6Reader& operator=(const Bif6Reader&) = delete;

  /// @brief Path the session was opened from, empty for adopted sources
  [[nodiscard]] const fs::path& GetPath() const noexcept { return path_; }

  /// @brief Parsed file header
  [[nodiscard]] const FileHeader& GetHeader() const noexcept {
    return header_;
  }

  /// @brief Number of intervals declared by the header
  ///
  /// This is not cross-checked against the records actually present.
  [[nodiscard]] uint16_t GetIntervalCount() const noexcept {
    return header_.interval_count;
  }

  /// @brief Dimensions of every interval image
  /// @return [width, height]
  [[nodiscard]] ImageDimensions GetImageSize() const noexcept {
    return header_.ImageSize();
  }

  [[nodiscard]] State GetState() const noexcept { return state_; }

  /// @brief Number of intervals produced so far
  [[nodiscard]] size_t GetIntervalsRead() const noexcept {
    return intervals_read_;
  }

  /// @brief Whether the exhausted stream held a different number of intervals
  ///        than the header declared
  ///
  /// Always false before the end of the stream has been reached.
  [[nodiscard]] bool HasIntervalCountMismatch() const noexcept {
    return exhausted_ && intervals_read_ != header_.interval_count;
  }

  /// @brief Decode the next interval
  ///
  /// @return The next interval, std::nullopt at the end of the stream, or
  ///         error. After the end of the stream every call returns
  ///         std::nullopt again.
  /// @retval absl::DataLossError (kTruncatedInterval) if a record is cut short
  /// @retval absl::InternalError (kIoError) if the source fails
  /// @retval absl::FailedPreconditionError after a failure or Close()
  absl::StatusOr<std::optional<Interval>> Next();

  /// @brief Release the byte source. Calling Close() again is a no-op.
  /// @return OkStatus or error (kIoError) if releasing the source fails
  absl::Status Close();

 private:
  Bif6Reader(FileReader file, FileHeader header);

  /// @brief Move to kFailed, release the source and pass the error on
  absl::Status Fail(absl::Status status);

  /// @brief kTruncatedInterval error for a record cut off after `got` bytes
  absl::Status TruncatedInterval(size_t got, size_t expected) const;

  FileReader file_;              ///< Byte source (RAII)
  fs::path path_;                ///< Source path, if opened by path
  FileHeader header_{};          ///< Parsed header
  State state_ = State::kClosed;
  size_t intervals_read_ = 0;
  bool exhausted_ = false;       ///< End of stream was reached cleanly
};

/// @brief Get string representation of a session state
constexpr const char* GetName(Bif6Reader::State state) {
  switch (state) {
    case Bif6Reader::State::kOpened:
      return "Opened";
    case Bif6Reader::State::kStreaming:
      return "Streaming";
    case Bif6Reader::State::kExhausted:
      return "Exhausted";
    case Bif6Reader::State::kFailed:
      return "Failed";
    case Bif6Reader::State::kClosed:
      return "Closed";
  }
  return "unknown";
}

/// @brief Open a BIF6 file
///
/// Same as Bif6Reader::Open(path).
absl::StatusOr<Bif6Reader> ParseBif6(const fs::path& path);

/// @brief Decode every interval of a BIF6 file
///
/// @param path Path to the .bif6 file
/// @return All intervals in file order, or the first error encountered
absl::StatusOr<std::vector<Interval>> ReadAllIntervals(const fs::path& path);

}  // namespace bif6

using bif6::Bif6Reader;
using bif6::ParseBif6;
using bif6::ReadAllIntervals;

}  // namespace fastbif

#endif  // AIFO_FASTBIF_INCLUDE_FASTBIF_BIF6_BIF6_READER_H_
