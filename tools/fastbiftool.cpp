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

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/initialize.h"
#include "fastbif/fastbif.h"

// Common flags
ABSL_FLAG(std::string, input, "", "Path to the BIF6 file");

// Info command flags
ABSL_FLAG(bool, verbose, false, "List every interval, not only the header");

// Dump command flags
ABSL_FLAG(int, interval, 0, "Zero-based position of the interval to dump");

namespace {

void PrintSeparator(char c = '=') {
  std::cout << std::string(80, c) << '\n';
}

void PrintHeader(const std::string& title) {
  std::cout << '\n';
  PrintSeparator('=');
  std::cout << " " << title << '\n';
  PrintSeparator('=');
}

void PrintKeyValue(const std::string& key, const std::string& value,
                   int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << value << '\n';
}

void PrintKeyValue(const std::string& key, size_t value, int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << value << '\n';
}

void PrintFileInfo(const fastbif::Bif6Reader& reader) {
  PrintHeader("BIF6 File");

  PrintKeyValue("Path", reader.GetPath().string());
  PrintKeyValue("Declared Intervals",
                static_cast<size_t>(reader.GetIntervalCount()));

  const auto size = reader.GetImageSize();
  PrintKeyValue("Image Size",
                std::to_string(size[0]) + " x " + std::to_string(size[1]));
  PrintKeyValue("Record Size (bytes)", reader.GetHeader().RecordSize());
}

void PrintIntervalLine(size_t index, const fastbif::Interval& interval) {
  std::cout << std::right << std::setw(6) << index << std::setw(10)
            << interval.GetId() << std::fixed << std::setprecision(4)
            << std::setw(14) << interval.GetMzLower() << std::setw(14)
            << interval.GetMzMiddle() << std::setw(14)
            << interval.GetMzUpper() << std::setw(5)
            << (interval.IsTicImage() ? "TIC" : "") << std::setw(16)
            << interval.GetImage().Sum() << std::setw(12)
            << interval.GetImage().Max() << '\n';
}

int InfoCommand(const std::string& input_file, bool verbose) {
  std::cout << "Opening BIF6 file: " << input_file << '\n';
  auto reader_or = fastbif::Bif6Reader::Open(input_file);

  if (!reader_or.ok()) {
    std::cerr << "\nError: Failed to open BIF6 file ("
              << fastbif::bif6::GetName(
                     fastbif::bif6::GetErrorKind(reader_or.status()))
              << ")\n";
    std::cerr << "Status: " << reader_or.status() << '\n';
    return 1;
  }

  auto& reader = *reader_or;
  PrintFileInfo(reader);

  if (verbose) {
    PrintHeader("Intervals");
    std::cout << std::right << std::setw(6) << "#" << std::setw(10) << "id"
              << std::setw(14) << "mz_lower" << std::setw(14) << "mz_middle"
              << std::setw(14) << "mz_upper" << std::setw(5) << ""
              << std::setw(16) << "sum" << std::setw(12) << "max" << '\n';
    PrintSeparator('-');
  }

  while (true) {
    auto interval_or = reader.Next();
    if (!interval_or.ok()) {
      std::cerr << "\nError: Failed to read interval "
                << reader.GetIntervalsRead() << " ("
                << fastbif::bif6::GetName(
                       fastbif::bif6::GetErrorKind(interval_or.status()))
                << ")\n";
      std::cerr << "Status: " << interval_or.status() << '\n';
      return 1;
    }
    if (!interval_or->has_value()) {
      break;
    }
    if (verbose) {
      PrintIntervalLine(reader.GetIntervalsRead() - 1, **interval_or);
    }
  }

  std::cout << '\n';
  PrintKeyValue("Intervals Read", reader.GetIntervalsRead());
  if (reader.HasIntervalCountMismatch()) {
    std::cout << "Warning: header declares " << reader.GetIntervalCount()
              << " intervals, file holds " << reader.GetIntervalsRead()
              << '\n';
  }
  PrintSeparator('=');
  return 0;
}

int DumpCommand(const std::string& input_file, int position) {
  if (position < 0) {
    std::cerr << "Error: --interval must not be negative\n";
    return 1;
  }

  auto reader_or = fastbif::Bif6Reader::Open(input_file);
  if (!reader_or.ok()) {
    std::cerr << "Error: Failed to open BIF6 file\n";
    std::cerr << "Status: " << reader_or.status() << '\n';
    return 1;
  }
  auto& reader = *reader_or;

  std::optional<fastbif::Interval> interval;
  for (int i = 0; i <= position; ++i) {
    auto interval_or = reader.Next();
    if (!interval_or.ok()) {
      std::cerr << "Error: Failed to read interval " << i << '\n';
      std::cerr << "Status: " << interval_or.status() << '\n';
      return 1;
    }
    if (!interval_or->has_value()) {
      std::cerr << "Error: File holds only " << i << " intervals\n";
      return 1;
    }
    interval = std::move(*interval_or);
  }

  const auto& image = interval->GetImage();
  std::cout << "Interval " << position << " (id " << interval->GetId()
            << ", m/z " << interval->GetMzLower() << " - "
            << interval->GetMzUpper() << "), " << image.GetWidth() << " x "
            << image.GetHeight() << " pixels\n";

  // Print in stored orientation: one line per row y
  for (uint32_t y = 0; y < image.GetHeight(); ++y) {
    for (uint32_t x = 0; x < image.GetWidth(); ++x) {
      std::cout << (x == 0 ? "" : " ") << image[x][y];
    }
    std::cout << '\n';
  }

  auto close_status = reader.Close();
  if (!close_status.ok()) {
    std::cerr << "Status: " << close_status << '\n';
    return 1;
  }
  return 0;
}

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
  std::cerr << "Commands:\n";
  std::cerr << "  info     Show header and interval summary\n";
  std::cerr << "  dump     Print the pixels of a single interval\n";
  std::cerr << "\n";
  std::cerr << "Common options:\n";
  std::cerr << "  --input=<path>       Path to BIF6 file (required)\n";
  std::cerr << "\n";
  std::cerr << "Info command options:\n";
  std::cerr << "  --verbose            List every interval\n";
  std::cerr << "\n";
  std::cerr << "Dump command options:\n";
  std::cerr << "  --interval=<n>       Interval position (default: 0)\n";
  std::cerr << "\n";
  std::cerr << "Examples:\n";
  std::cerr << "  " << program_name << " info --input=sample.bif6 --verbose\n";
  std::cerr << "  " << program_name
            << " dump --input=sample.bif6 --interval=3\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  std::string command = argv[1];

  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  std::string input_file = absl::GetFlag(FLAGS_input);

  if (input_file.empty()) {
    std::cerr << "Error: --input flag is required\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  if (command == "info") {
    return InfoCommand(input_file, absl::GetFlag(FLAGS_verbose));
  } else if (command == "dump") {
    return DumpCommand(input_file, absl::GetFlag(FLAGS_interval));
  } else {
    std::cerr << "Error: Unknown command '" << command << "'\n\n";
    PrintUsage(argv[0]);
    return 1;
  }
}
