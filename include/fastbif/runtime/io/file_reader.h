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

#ifndef AIFO_FASTBIF_INCLUDE_FASTBIF_RUNTIME_IO_FILE_READER_H_
#define AIFO_FASTBIF_INCLUDE_FASTBIF_RUNTIME_IO_FILE_READER_H_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace fs = std::filesystem;

namespace fastbif {
namespace runtime {
namespace io {

/// @brief RAII wrapper for a sequential FILE* byte source
///
/// Owns the handle exclusively and releases it on destruction or on an
/// explicit Close(). Reads are forward-only; the cursor is the FILE* position.
///
/// Example usage:
/// ```cpp
/// ASSIGN_OR_RETURN_MOVE(auto reader, FileReader::Open(path));
/// ASSIGN_OR_RETURN(size_t got, reader.ReadUpTo(buffer, sizeof(buffer)));
/// ```
class FileReader {
 public:
  /// @brief Largest single buffer growth step of ReadBytesUpTo
  static constexpr size_t kReadChunkSize = size_t{1} << 20;

  /// @brief Default constructor (creates closed reader)
  FileReader() : file_(nullptr, fclose) {}

  /// @brief Open a file for binary reading
  /// @param path Path to file
  /// @return FileReader instance or error
  /// @retval absl::NotFoundError if file cannot be opened
  static absl::StatusOr<FileReader> Open(const fs::path& path);

  /// @brief Take ownership of an already open stream handle
  /// @param file Open FILE pointer, closed when the reader is closed
  /// @return FileReader instance or error
  /// @retval absl::InvalidArgumentError if file is null
  static absl::StatusOr<FileReader> Adopt(FILE* file);

  FileReader(FileReader&& other) noexcept = default;
  FileReader& operator=(FileReader&& other) noexcept = default;
  ~FileReader() = default;

  FileReader(const FileReader&) = delete;
  FileReader& operator=(const FileReader&) = delete;

  /// @brief Whether the reader still holds a handle
  [[nodiscard]] bool IsOpen() const noexcept { return file_ != nullptr; }

  /// @brief Read as many bytes as are available, up to size
  ///
  /// Stops early only at end of file. A short count is therefore not an error
  /// here; callers decide what a short read means for their format.
  ///
  /// @param buffer Buffer to read into
  /// @param size Maximum number of bytes to read
  /// @return Number of bytes actually read or error
  /// @retval absl::FailedPreconditionError if the reader is closed
  /// @retval absl::InternalError if the underlying stream reports an error
  absl::StatusOr<size_t> ReadUpTo(void* buffer, size_t size) const;

  /// @brief Read up to size bytes into a vector
  ///
  /// The buffer grows in steps of at most kReadChunkSize, so a large size
  /// against a short stream costs only what the stream actually holds.
  ///
  /// @param size Maximum number of bytes to read
  /// @return Bytes read, shorter than size only at end of file
  absl::StatusOr<std::vector<uint8_t>> ReadBytesUpTo(size_t size) const;

  /// @brief Get current file position
  /// @return Current position or error
  absl::StatusOr<int64_t> Tell() const;

  /// @brief Release the handle. Closing a closed reader is a no-op.
  /// @return OkStatus or error if fclose fails
  absl::Status Close();

 private:
  explicit FileReader(FILE* file) : file_(file, fclose) {}

  std::unique_ptr<FILE, decltype(&fclose)> file_;
};

}  // namespace io
}  // namespace runtime

// Import into fastbif namespace for convenience
using runtime::io::FileReader;

}  // namespace fastbif

#endif  // AIFO_FASTBIF_INCLUDE_FASTBIF_RUNTIME_IO_FILE_READER_H_
