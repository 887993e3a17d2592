#pragma once

#include <cstddef>
#include <string>

namespace cursorhist::common {

/// Replaces every byte that does not start a well-formed UTF-8 sequence with U+FFFD.
[[nodiscard]] std::string sanitize_utf8(const std::string &input);

/// Decodes the well-formed UTF-8 sequence at `pos` into `code_point` and returns its byte
/// length. Returns 0 and leaves `code_point` untouched when the sequence is malformed.
std::size_t decode_utf8(const std::string &input, std::size_t pos, char32_t &code_point);

/// True for the Unicode White_Space code points that str-style splitting treats as
/// separators (ASCII whitespace, the information separators U+001C..U+001F, NEL, NBSP,
/// the U+2000 block spaces, line and paragraph separators, ideographic space).
[[nodiscard]] bool is_unicode_space(char32_t code_point);

/// Strips leading and trailing Unicode whitespace.
[[nodiscard]] std::string trim_unicode(const std::string &input);

/// Appends the UTF-8 encoding of `code_point` to `out`.
void append_utf8(std::string &out, char32_t code_point);

/// Number of code points in a well-formed UTF-8 string.
[[nodiscard]] std::size_t utf8_length(const std::string &text);

/// First `max_code_points` code points of `text`.
[[nodiscard]] std::string utf8_truncate(const std::string &text, std::size_t max_code_points);

/// Removes every `<...>` tag (at least one character between the brackets).
[[nodiscard]] std::string strip_tags(const std::string &text);

/// Joins the Unicode-whitespace-separated words of `text` with single spaces.
[[nodiscard]] std::string collapse_whitespace(const std::string &text);

/// strip_tags followed by collapse_whitespace.
[[nodiscard]] std::string clean_text(const std::string &text);

} // namespace cursorhist::common
