#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cursorhist::index {

/// One transcript as written to the session index.
struct SessionRecord {
  std::string id;
  std::string workspace;
  std::string folder;
  std::string format;
  std::int64_t modified = 0;
  std::string date;
  std::uint64_t size = 0;
  std::uint64_t messages = 0;
  std::uint64_t tool_calls = 0;
  std::string summary;
  std::string transcript_path;
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
  std::uint64_t total_tokens = 0;
  std::string model;
  std::uint64_t code_edits = 0;
};

/// Pretty-printed JSON array (two-space indent), records in the given order.
[[nodiscard]] std::string encode_sessions_json(const std::vector<SessionRecord> &sessions);

} // namespace cursorhist::index
