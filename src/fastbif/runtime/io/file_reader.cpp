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

#include "fastbif/runtime/io/file_reader.h"

#include <algorithm>

#include "absl/strings/str_format.h"
#include "fastbif/status/status_macros.h"

namespace fastbif {
namespace runtime {
namespace io {

absl::StatusOr<FileReader> FileReader::Open(const fs::path& path) {
  FILE* file = fopen(path.string().c_str(), "rb");
  if (!file) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       absl::StrFormat("Cannot open file: %s", path.string()));
  }
  return FileReader(file);
}

absl::StatusOr<FileReader> FileReader::Adopt(FILE* file) {
  if (!file) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Cannot adopt a null stream handle");
  }
  return FileReader(file);
}

absl::StatusOr<size_t> FileReader::ReadUpTo(void* buffer, size_t size) const {
  if (!file_) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "Read from a closed file");
  }

  auto* out = static_cast<uint8_t*>(buffer);
  size_t total = 0;
  while (total < size) {
    const size_t got = fread(out + total, 1, size - total, file_.get());
    total += got;
    if (got == 0) {
      break;
    }
  }

  if (ferror(file_.get()) != 0) {
    return MAKE_STATUS(
        absl::StatusCode::kInternal,
        absl::StrFormat("Stream error after reading %zu of %zu bytes", total,
                        size));
  }
  return total;
}

absl::StatusOr<std::vector<uint8_t>> FileReader::ReadBytesUpTo(
    size_t size) const {
  std::vector<uint8_t> buffer;
  while (buffer.size() < size) {
    const size_t offset = buffer.size();
    const size_t want = std::min(kReadChunkSize, size - offset);
    buffer.resize(offset + want);

    size_t got = 0;
    ASSIGN_OR_RETURN(got, ReadUpTo(buffer.data() + offset, want),
                     "Failed to read into buffer");
    buffer.resize(offset + got);
    if (got < want) {
      break;
    }
  }
  return buffer;
}

absl::StatusOr<int64_t> FileReader::Tell() const {
  if (!file_) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "Tell on a closed file");
  }
  const int64_t pos = ftell(file_.get());
  if (pos < 0) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Failed to get file position");
  }
  return pos;
}

absl::Status FileReader::Close() {
  FILE* file = file_.release();
  if (file == nullptr) {
    return absl::OkStatus();
  }
  if (fclose(file) != 0) {
    return MAKE_STATUS(absl::StatusCode::kInternal, "Failed to close file");
  }
  return absl::OkStatus();
}

}  // namespace io
}  // namespace runtime
}  // namespace fastbif
