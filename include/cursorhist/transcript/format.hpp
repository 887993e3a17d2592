#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace cursorhist::transcript {

/// Wire format of a transcript file, decided once from its extension.
enum class TranscriptFormat {
  Unknown,
  Jsonl, // one JSON record per line
  Text,  // "user:" / "assistant:" markers with <user_query> tags
};

[[nodiscard]] TranscriptFormat format_from_extension(std::string_view extension);
[[nodiscard]] TranscriptFormat format_from_path(const std::filesystem::path &path);
[[nodiscard]] std::string format_name(TranscriptFormat format);

} // namespace cursorhist::transcript
