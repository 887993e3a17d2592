#pragma once

#include "cursorhist/common/result.hpp"
#include <filesystem>
#include <string>

namespace cursorhist::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Extension of `path` without the leading dot ("archive.tar.gz" -> "gz").
[[nodiscard]] std::string file_extension(const std::filesystem::path &path);

/// Reads a whole file as text. Invalid UTF-8 is replaced with U+FFFD and
/// "\r\n" / "\r" line endings are normalised to "\n".
[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);

} // namespace cursorhist::common
