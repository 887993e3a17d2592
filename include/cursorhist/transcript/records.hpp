#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cursorhist::transcript {

constexpr std::size_t MAX_SUMMARY_LEN = 200;
constexpr std::size_t CHARS_PER_TOKEN = 4;

inline constexpr const char *ROLE_USER = "user";
inline constexpr const char *ROLE_ASSISTANT = "assistant";

struct ContentPart {
  enum class Kind {
    Text,
    ToolUse,
    Other,
  };

  Kind kind = Kind::Other;
  std::string text;
};

/// One line of a .jsonl transcript: {"role": ..., "message": {"content": [...]}}.
struct JsonlRecord {
  std::optional<std::string> role;
  std::vector<ContentPart> parts;
};

/// Parses one trimmed, non-empty .jsonl line. Returns nullopt when the line is
/// not valid JSON or not a JSON object. Missing or mistyped "message" and
/// "content" members yield a record without parts.
[[nodiscard]] std::optional<JsonlRecord> parse_jsonl_record(const std::string &line);

enum class TextLineKind {
  Blank,
  RoleMarker, // "user:" or "assistant:"
  ToolCall,   // "[Tool call] ..."
  ToolResult, // "[Tool result] ..."
  QueryTag,   // "<user_query>" or "</user_query>"
  Content,
};

struct TextLine {
  TextLineKind kind = TextLineKind::Blank;
  std::string trimmed;
  /// Set for RoleMarker lines.
  std::string role;
};

[[nodiscard]] TextLine classify_text_line(const std::string &line);

/// Inner text of the first <user_query>...</user_query> pair, if any.
[[nodiscard]] std::optional<std::string> find_user_query(const std::string &content);

/// Tag-stripped, whitespace-collapsed text cut to `max_len` code points.
[[nodiscard]] std::string excerpt(const std::string &text, std::size_t max_len);

} // namespace cursorhist::transcript
