#pragma once

#include "cursorhist/transcript/format.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace cursorhist::transcript {

/// Aggregate metrics of one transcript. Token counts are estimates: one token
/// per four characters of text, truncated.
struct ScanResult {
  std::string summary;
  std::uint64_t messages = 0;
  std::uint64_t tool_calls = 0;
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
};

/// Derives summary, message count, tool-call count and token estimates in a
/// single pass. An unknown format yields an empty result.
[[nodiscard]] ScanResult scan(const std::string &content, TranscriptFormat format);

/// Reads `path` and scans it using the format implied by its extension.
/// Unreadable files and unknown extensions yield an empty result.
[[nodiscard]] ScanResult scan_file(const std::filesystem::path &path);

} // namespace cursorhist::transcript
