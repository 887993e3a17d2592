#pragma once

#include "cursorhist/transcript/format.hpp"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>

namespace cursorhist::transcript {

constexpr std::size_t PREVIEW_MAX_LINE_LEN = 150;

/// Writes a conversation excerpt of at most `limit` lines to `out`, one per
/// text message or tool call, followed by "  ... (truncated)" when further
/// input was left unrendered.
void render(const std::string &content, TranscriptFormat format, std::size_t limit,
            std::ostream &out);

/// Reads `path` and renders it. Writes nothing when the file cannot be read or
/// its extension is not a transcript format.
void preview_file(const std::filesystem::path &path, std::size_t limit, std::ostream &out);

} // namespace cursorhist::transcript
