#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cursorhist::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape the body of a JSON string literal, including \uXXXX and surrogate pairs.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// True when `text` holds exactly one syntactically valid JSON value.
[[nodiscard]] bool json_is_valid(const std::string &text);

/// Top-level members of a JSON object, each value kept as its raw JSON token
/// (strings keep their quotes, objects and arrays their brackets).
using JsonRawMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonRawMap json_parse_object_raw(const std::string &json);

/// Decoded value of a raw JSON string token, or nullopt when `raw` is not a string.
[[nodiscard]] std::optional<std::string> json_string_value(const std::string &raw);

/// Split a JSON array into its top-level object elements; other elements are skipped.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace cursorhist::common
