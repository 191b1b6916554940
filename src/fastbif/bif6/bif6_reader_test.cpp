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

#include <fcntl.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fastbif/bif6/bif6_errors.h"
#include "fastbif/runtime/io/file_reader.h"

namespace fastbif {
namespace bif6 {
namespace {

void AppendU16(std::vector<uint8_t>& out, uint16_t value) {
  out.push_back(static_cast<uint8_t>(value & 0xFF));
  out.push_back(static_cast<uint8_t>(value >> 8));
}

void AppendU32(std::vector<uint8_t>& out, uint32_t value) {
  for (int shift = 0; shift < 32; shift += 8) {
    out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
  }
}

void AppendF32(std::vector<uint8_t>& out, float value) {
  uint32_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  AppendU32(out, bits);
}

std::vector<uint8_t> MakeHeader(uint16_t interval_count, uint16_t width,
                                uint16_t height) {
  std::vector<uint8_t> out = {0x00, 0x00, 'B', 'I', 'F', '6'};
  AppendU16(out, interval_count);
  AppendU16(out, width);
  AppendU16(out, height);
  return out;
}

/// Appends one record; pixels are given in stored (row-major) order
void AppendRecord(std::vector<uint8_t>& out, uint32_t id, float lower,
                  float middle, float upper,
                  const std::vector<uint32_t>& row_major_pixels) {
  AppendU32(out, id);
  AppendF32(out, lower);
  AppendF32(out, middle);
  AppendF32(out, upper);
  for (uint32_t pixel : row_major_pixels) {
    AppendU32(out, pixel);
  }
}

}  // namespace

class Bif6ReaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    test_dir_ = std::filesystem::temp_directory_path() / "bif6_reader_test" /
                info->name();
    std::filesystem::create_directories(test_dir_);
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir_)) {
      std::filesystem::remove_all(test_dir_);
    }
  }

  std::filesystem::path WriteFile(const std::string& name,
                                  const std::vector<uint8_t>& bytes) {
    const auto path = test_dir_ / name;
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    return path;
  }

  /// Opens path through an adopted handle and reports its descriptor
  absl::StatusOr<Bif6Reader> OpenAdopted(const std::filesystem::path& path,
                                         int* fd) {
    FILE* handle = std::fopen(path.string().c_str(), "rb");
    if (handle == nullptr) {
      return absl::NotFoundError(path.string());
    }
    *fd = fileno(handle);
    auto file_or = FileReader::Adopt(handle);
    if (!file_or.ok()) {
      return file_or.status();
    }
    return Bif6Reader::Open(std::move(file_or).value());
  }

  static bool IsReleased(int fd) {
    errno = 0;
    return fcntl(fd, F_GETFD) == -1 && errno == EBADF;
  }

  std::filesystem::path test_dir_;
};

// Header declares two 2 x 1 intervals, the file holds one
TEST_F(Bif6ReaderTest, DecodesReferenceRecord) {
  const std::vector<uint8_t> bytes = {
      0x00, 0x00, 0x42, 0x49, 0x46, 0x36, 0x02, 0x00, 0x02, 0x00, 0x01, 0x00,
      0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x80, 0x3F, 0x00, 0x00, 0x00, 0x40,
      0x00, 0x00, 0x40, 0x40, 0x01, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00};
  const auto path = WriteFile("reference.bif6", bytes);

  auto reader_or = Bif6Reader::Open(path);
  ASSERT_TRUE(reader_or.ok()) << reader_or.status();
  Bif6Reader& reader = *reader_or;

  EXPECT_EQ(reader.GetIntervalCount(), 2);
  EXPECT_EQ(reader.GetImageSize(), (ImageDimensions{2, 1}));
  EXPECT_EQ(reader.GetState(), Bif6Reader::State::kOpened);
  EXPECT_EQ(reader.GetPath(), path);

  auto first_or = reader.Next();
  ASSERT_TRUE(first_or.ok()) << first_or.status();
  ASSERT_TRUE(first_or->has_value());
  const Interval& interval = **first_or;

  EXPECT_EQ(interval.GetId(), 1u);
  EXPECT_FLOAT_EQ(interval.GetMzLower(), 1.0f);
  EXPECT_FLOAT_EQ(interval.GetMzMiddle(), 2.0f);
  EXPECT_FLOAT_EQ(interval.GetMzUpper(), 3.0f);
  EXPECT_FALSE(interval.IsTicImage());

  const IntensityImage& image = interval.GetImage();
  EXPECT_EQ(image.Shape(), (ImageDimensions{2, 1}));
  EXPECT_EQ(image[0][0], 1u);
  EXPECT_EQ(image[1][0], 2u);
  EXPECT_EQ(reader.GetState(), Bif6Reader::State::kStreaming);

  auto end_or = reader.Next();
  ASSERT_TRUE(end_or.ok()) << end_or.status();
  EXPECT_FALSE(end_or->has_value());
  EXPECT_EQ(reader.GetState(), Bif6Reader::State::kExhausted);
  EXPECT_EQ(reader.GetIntervalsRead(), 1u);
  EXPECT_TRUE(reader.HasIntervalCountMismatch());
}

TEST_F(Bif6ReaderTest, EmptyFileProducesNoIntervals) {
  const auto path = WriteFile("empty.bif6", MakeHeader(0, 4, 4));

  auto reader_or = Bif6Reader::Open(path);
  ASSERT_TRUE(reader_or.ok()) << reader_or.status();

  auto next_or = reader_or->Next();
  ASSERT_TRUE(next_or.ok()) << next_or.status();
  EXPECT_FALSE(next_or->has_value());
  EXPECT_EQ(reader_or->GetIntervalsRead(), 0u);
  EXPECT_FALSE(reader_or->HasIntervalCountMismatch());
}

TEST_F(Bif6ReaderTest, ImageIsTransposeOfStoredRows) {
  constexpr uint16_t kWidth = 3;
  constexpr uint16_t kHeight = 2;

  std::vector<uint32_t> pixels;
  for (uint32_t y = 0; y < kHeight; ++y) {
    for (uint32_t x = 0; x < kWidth; ++x) {
      pixels.push_back(100 * y + x);
    }
  }

  auto bytes = MakeHeader(1, kWidth, kHeight);
  AppendRecord(bytes, 0, 100.0f, 100.5f, 101.0f, pixels);
  const auto path = WriteFile("transpose.bif6", bytes);

  auto reader_or = Bif6Reader::Open(path);
  ASSERT_TRUE(reader_or.ok()) << reader_or.status();
  auto interval_or = reader_or->Next();
  ASSERT_TRUE(interval_or.ok()) << interval_or.status();
  ASSERT_TRUE(interval_or->has_value());

  const IntensityImage& image = (*interval_or)->GetImage();
  ASSERT_EQ(image.Shape(), reader_or->GetImageSize());
  for (uint32_t x = 0; x < kWidth; ++x) {
    ASSERT_EQ(image[x].size(), kHeight);
    for (uint32_t y = 0; y < kHeight; ++y) {
      EXPECT_EQ(image[x][y], 100 * y + x) << "x=" << x << " y=" << y;
      EXPECT_EQ(image.At(x, y), 100 * y + x);
    }
  }
  EXPECT_TRUE((*interval_or)->IsTicImage());
}

TEST_F(Bif6ReaderTest, ReadsIntervalsInFileOrder) {
  auto bytes = MakeHeader(3, 2, 2);
  AppendRecord(bytes, 0, 0.0f, 0.0f, 0.0f, {10, 20, 30, 40});
  AppendRecord(bytes, 7, 200.25f, 200.5f, 200.75f, {1, 1, 1, 1});
  AppendRecord(bytes, 8, 300.0f, 300.5f, 301.0f, {0, 0, 0, 9});
  const auto path = WriteFile("three.bif6", bytes);

  auto reader_or = Bif6Reader::Open(path);
  ASSERT_TRUE(reader_or.ok()) << reader_or.status();

  std::vector<uint32_t> ids;
  std::vector<float> middles;
  while (true) {
    auto next_or = reader_or->Next();
    ASSERT_TRUE(next_or.ok()) << next_or.status();
    if (!next_or->has_value()) {
      break;
    }
    ids.push_back((*next_or)->GetId());
    middles.push_back((*next_or)->GetMzMiddle());
    EXPECT_EQ((*next_or)->GetImage().Shape(), (ImageDimensions{2, 2}));
  }

  EXPECT_EQ(ids, (std::vector<uint32_t>{0, 7, 8}));
  ASSERT_EQ(middles.size(), 3u);
  EXPECT_FLOAT_EQ(middles[1], 200.5f);
  EXPECT_FALSE(reader_or->HasIntervalCountMismatch());
}

TEST_F(Bif6ReaderTest, MzBoundsArePassedThroughUnchecked) {
  auto bytes = MakeHeader(1, 1, 1);
  AppendRecord(bytes, 3, 500.0f, 100.0f, 300.0f, {5});
  const auto path = WriteFile("unordered.bif6", bytes);

  auto intervals_or = ReadAllIntervals(path);
  ASSERT_TRUE(intervals_or.ok()) << intervals_or.status();
  ASSERT_EQ(intervals_or->size(), 1u);
  const Interval& interval = intervals_or->front();
  EXPECT_FLOAT_EQ(interval.GetMzLower(), 500.0f);
  EXPECT_FLOAT_EQ(interval.GetMzMiddle(), 100.0f);
  EXPECT_FLOAT_EQ(interval.GetMzUpper(), 300.0f);
}

TEST_F(Bif6ReaderTest, TruncatedRecordFails) {
  // 2 x 2 image needs 16 payload bytes, only 8 follow the record header
  auto bytes = MakeHeader(1, 2, 2);
  AppendRecord(bytes, 1, 1.0f, 2.0f, 3.0f, {1, 2});
  const auto path = WriteFile("truncated.bif6", bytes);

  auto reader_or = Bif6Reader::Open(path);
  ASSERT_TRUE(reader_or.ok()) << reader_or.status();

  auto next_or = reader_or->Next();
  ASSERT_FALSE(next_or.ok());
  EXPECT_EQ(next_or.status().code(), absl::StatusCode::kDataLoss);
  EXPECT_EQ(GetErrorKind(next_or.status()), ErrorKind::kTruncatedInterval);
  EXPECT_EQ(reader_or->GetState(), Bif6Reader::State::kFailed);
  EXPECT_EQ(reader_or->GetIntervalsRead(), 0u);

  // The failed session never reads again
  auto again_or = reader_or->Next();
  ASSERT_FALSE(again_or.ok());
  EXPECT_EQ(again_or.status().code(), absl::StatusCode::kFailedPrecondition);
}

TEST_F(Bif6ReaderTest, TruncationAfterCompleteRecordFails) {
  auto bytes = MakeHeader(2, 1, 1);
  AppendRecord(bytes, 0, 1.0f, 1.5f, 2.0f, {42});
  bytes.push_back(0x01);
  const auto path = WriteFile("tail.bif6", bytes);

  auto reader_or = Bif6Reader::Open(path);
  ASSERT_TRUE(reader_or.ok()) << reader_or.status();

  auto first_or = reader_or->Next();
  ASSERT_TRUE(first_or.ok()) << first_or.status();
  ASSERT_TRUE(first_or->has_value());
  EXPECT_EQ((*first_or)->GetImage()[0][0], 42u);

  auto second_or = reader_or->Next();
  ASSERT_FALSE(second_or.ok());
  EXPECT_EQ(GetErrorKind(second_or.status()), ErrorKind::kTruncatedInterval);
}

TEST_F(Bif6ReaderTest, ReadAllIntervalsPropagatesErrorKind) {
  auto bytes = MakeHeader(1, 2, 2);
  AppendRecord(bytes, 1, 1.0f, 2.0f, 3.0f, {1});
  const auto path = WriteFile("truncated_all.bif6", bytes);

  auto intervals_or = ReadAllIntervals(path);
  ASSERT_FALSE(intervals_or.ok());
  EXPECT_EQ(GetErrorKind(intervals_or.status()),
            ErrorKind::kTruncatedInterval);
  EXPECT_NE(intervals_or.status().message().find("\n  at "),
            std::string::npos);
}

TEST_F(Bif6ReaderTest, ShortHeaderFails) {
  const auto empty_path = WriteFile("empty_file.bif6", {});
  auto empty_or = Bif6Reader::Open(empty_path);
  ASSERT_FALSE(empty_or.ok());
  EXPECT_EQ(GetErrorKind(empty_or.status()), ErrorKind::kTruncatedHeader);

  auto header = MakeHeader(1, 1, 1);
  header.pop_back();
  const auto short_path = WriteFile("short.bif6", header);
  auto short_or = Bif6Reader::Open(short_path);
  ASSERT_FALSE(short_or.ok());
  EXPECT_EQ(short_or.status().code(), absl::StatusCode::kDataLoss);
  EXPECT_EQ(GetErrorKind(short_or.status()), ErrorKind::kTruncatedHeader);
}

TEST_F(Bif6ReaderTest, AnyMagicCorruptionFails) {
  for (size_t i = 0; i < 6; ++i) {
    auto bytes = MakeHeader(0, 1, 1);
    bytes[i] ^= 0xFF;
    const auto path = WriteFile("corrupt_" + std::to_string(i) + ".bif6",
                                bytes);

    auto reader_or = Bif6Reader::Open(path);
    ASSERT_FALSE(reader_or.ok()) << "byte " << i;
    EXPECT_EQ(reader_or.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(GetErrorKind(reader_or.status()), ErrorKind::kBadMagic)
        << "byte " << i;
  }
}

TEST_F(Bif6ReaderTest, MissingFileIsIoError) {
  auto reader_or = Bif6Reader::Open(test_dir_ / "does_not_exist.bif6");
  ASSERT_FALSE(reader_or.ok());
  EXPECT_EQ(reader_or.status().code(), absl::StatusCode::kNotFound);
  EXPECT_EQ(GetErrorKind(reader_or.status()), ErrorKind::kIoError);
}

TEST_F(Bif6ReaderTest, ExhaustedSessionDoesNotRestart) {
  auto bytes = MakeHeader(1, 1, 1);
  AppendRecord(bytes, 0, 1.0f, 1.0f, 1.0f, {1});
  const auto path = WriteFile("once.bif6", bytes);

  auto reader_or = Bif6Reader::Open(path);
  ASSERT_TRUE(reader_or.ok()) << reader_or.status();

  auto first_or = reader_or->Next();
  ASSERT_TRUE(first_or.ok());
  ASSERT_TRUE(first_or->has_value());

  for (int i = 0; i < 3; ++i) {
    auto next_or = reader_or->Next();
    ASSERT_TRUE(next_or.ok()) << next_or.status();
    EXPECT_FALSE(next_or->has_value());
  }
  EXPECT_EQ(reader_or->GetIntervalsRead(), 1u);
  EXPECT_EQ(reader_or->GetState(), Bif6Reader::State::kExhausted);

  EXPECT_TRUE(reader_or->Close().ok());
  EXPECT_EQ(reader_or->GetState(), Bif6Reader::State::kClosed);
}

TEST_F(Bif6ReaderTest, CloseIsIdempotentAndStopsReading) {
  auto bytes = MakeHeader(1, 1, 1);
  AppendRecord(bytes, 0, 1.0f, 1.0f, 1.0f, {1});
  const auto path = WriteFile("close.bif6", bytes);

  auto reader_or = Bif6Reader::Open(path);
  ASSERT_TRUE(reader_or.ok()) << reader_or.status();

  EXPECT_TRUE(reader_or->Close().ok());
  EXPECT_TRUE(reader_or->Close().ok());
  EXPECT_EQ(reader_or->GetState(), Bif6Reader::State::kClosed);

  auto next_or = reader_or->Next();
  ASSERT_FALSE(next_or.ok());
  EXPECT_EQ(next_or.status().code(), absl::StatusCode::kFailedPrecondition);
}

TEST_F(Bif6ReaderTest, ReadsFromAdoptedHandle) {
  auto bytes = MakeHeader(1, 2, 1);
  AppendRecord(bytes, 5, 10.0f, 11.0f, 12.0f, {7, 9});
  const auto path = WriteFile("adopted.bif6", bytes);

  FILE* handle = std::fopen(path.string().c_str(), "rb");
  ASSERT_NE(handle, nullptr);
  auto file_or = FileReader::Adopt(handle);
  ASSERT_TRUE(file_or.ok()) << file_or.status();

  auto reader_or = Bif6Reader::Open(std::move(file_or).value());
  ASSERT_TRUE(reader_or.ok()) << reader_or.status();
  EXPECT_TRUE(reader_or->GetPath().empty());

  auto interval_or = reader_or->Next();
  ASSERT_TRUE(interval_or.ok()) << interval_or.status();
  ASSERT_TRUE(interval_or->has_value());
  EXPECT_EQ((*interval_or)->GetId(), 5u);
  EXPECT_EQ((*interval_or)->GetImage()[1][0], 9u);
}

TEST_F(Bif6ReaderTest, ZeroWidthImagesDecode) {
  auto bytes = MakeHeader(2, 0, 3);
  AppendRecord(bytes, 0, 1.0f, 2.0f, 3.0f, {});
  AppendRecord(bytes, 1, 4.0f, 5.0f, 6.0f, {});
  const auto path = WriteFile("zero_width.bif6", bytes);

  auto intervals_or = ReadAllIntervals(path);
  ASSERT_TRUE(intervals_or.ok()) << intervals_or.status();
  ASSERT_EQ(intervals_or->size(), 2u);
  EXPECT_EQ((*intervals_or)[1].GetImage().Shape(), (ImageDimensions{0, 3}));
  EXPECT_TRUE((*intervals_or)[1].GetImage().Empty());
}

TEST_F(Bif6ReaderTest, ParseBif6OpensFile) {
  const auto path = WriteFile("alias.bif6", MakeHeader(4, 8, 16));

  auto reader_or = ParseBif6(path);
  ASSERT_TRUE(reader_or.ok()) << reader_or.status();
  EXPECT_EQ(reader_or->GetIntervalCount(), 4);
  EXPECT_EQ(reader_or->GetHeader().RecordSize(), 16u + 8u * 16u * 4u);
}

TEST_F(Bif6ReaderTest, HugeDeclaredImageWithShortRecordFails) {
  // 65535 x 65535 pixels would need about 17 GB per record
  auto bytes = MakeHeader(1, 65535, 65535);
  AppendU32(bytes, 1);
  const auto path = WriteFile("huge_short_header.bif6", bytes);

  auto reader_or = Bif6Reader::Open(path);
  ASSERT_TRUE(reader_or.ok()) << reader_or.status();

  auto next_or = reader_or->Next();
  ASSERT_FALSE(next_or.ok());
  EXPECT_EQ(GetErrorKind(next_or.status()), ErrorKind::kTruncatedInterval);
  EXPECT_EQ(reader_or->GetState(), Bif6Reader::State::kFailed);
}

TEST_F(Bif6ReaderTest, HugeDeclaredImageWithShortPayloadFails) {
  auto bytes = MakeHeader(1, 65535, 65535);
  AppendRecord(bytes, 1, 1.0f, 2.0f, 3.0f, {7});
  const auto path = WriteFile("huge_short_payload.bif6", bytes);

  auto reader_or = Bif6Reader::Open(path);
  ASSERT_TRUE(reader_or.ok()) << reader_or.status();

  auto next_or = reader_or->Next();
  ASSERT_FALSE(next_or.ok());
  EXPECT_EQ(next_or.status().code(), absl::StatusCode::kDataLoss);
  EXPECT_EQ(GetErrorKind(next_or.status()), ErrorKind::kTruncatedInterval);
}

TEST_F(Bif6ReaderTest, EndOfStreamReleasesSource) {
  auto bytes = MakeHeader(1, 1, 1);
  AppendRecord(bytes, 0, 1.0f, 2.0f, 3.0f, {5});
  const auto path = WriteFile("release_end.bif6", bytes);

  int fd = -1;
  auto reader_or = OpenAdopted(path, &fd);
  ASSERT_TRUE(reader_or.ok()) << reader_or.status();
  ASSERT_GE(fd, 0);

  auto first_or = reader_or->Next();
  ASSERT_TRUE(first_or.ok()) << first_or.status();
  ASSERT_TRUE(first_or->has_value());
  EXPECT_FALSE(IsReleased(fd));

  auto end_or = reader_or->Next();
  ASSERT_TRUE(end_or.ok()) << end_or.status();
  EXPECT_FALSE(end_or->has_value());
  EXPECT_EQ(reader_or->GetState(), Bif6Reader::State::kExhausted);
  EXPECT_TRUE(IsReleased(fd));
}

TEST_F(Bif6ReaderTest, TruncatedIntervalReleasesSource) {
  auto bytes = MakeHeader(1, 2, 2);
  AppendRecord(bytes, 1, 1.0f, 2.0f, 3.0f, {1, 2});
  const auto path = WriteFile("release_truncated.bif6", bytes);

  int fd = -1;
  auto reader_or = OpenAdopted(path, &fd);
  ASSERT_TRUE(reader_or.ok()) << reader_or.status();
  ASSERT_GE(fd, 0);

  auto next_or = reader_or->Next();
  ASSERT_FALSE(next_or.ok());
  EXPECT_EQ(GetErrorKind(next_or.status()), ErrorKind::kTruncatedInterval);
  EXPECT_TRUE(IsReleased(fd));
}

TEST_F(Bif6ReaderTest, CloseReleasesSource) {
  auto bytes = MakeHeader(1, 1, 1);
  AppendRecord(bytes, 0, 1.0f, 2.0f, 3.0f, {5});
  const auto path = WriteFile("release_close.bif6", bytes);

  int fd = -1;
  auto reader_or = OpenAdopted(path, &fd);
  ASSERT_TRUE(reader_or.ok()) << reader_or.status();
  ASSERT_GE(fd, 0);
  EXPECT_FALSE(IsReleased(fd));

  EXPECT_TRUE(reader_or->Close().ok());
  EXPECT_TRUE(IsReleased(fd));
  EXPECT_FALSE(reader_or->HasIntervalCountMismatch());
}

}  // namespace bif6
}  // namespace fastbif
