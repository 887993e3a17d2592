#include "cursorhist/transcript/records.hpp"

#include "cursorhist/common/fs.hpp"
#include "cursorhist/common/json_util.hpp"
#include "cursorhist/common/text.hpp"

namespace cursorhist::transcript {

namespace {

constexpr const char *USER_QUERY_OPEN = "<user_query>";
constexpr const char *USER_QUERY_CLOSE = "</user_query>";
constexpr const char *TOOL_CALL_MARKER = "[Tool call]";
constexpr const char *TOOL_RESULT_MARKER = "[Tool result]";

ContentPart parse_content_part(const std::string &object_json) {
  const auto fields = common::json_parse_object_raw(object_json);
  ContentPart part;

  const auto type_it = fields.find("type");
  if (type_it == fields.end()) {
    return part;
  }
  const auto type = common::json_string_value(type_it->second);
  if (type == "tool_use") {
    part.kind = ContentPart::Kind::ToolUse;
  } else if (type == "text") {
    part.kind = ContentPart::Kind::Text;
    if (const auto text_it = fields.find("text"); text_it != fields.end()) {
      part.text = common::json_string_value(text_it->second).value_or("");
    }
  }
  return part;
}

} // namespace

std::optional<JsonlRecord> parse_jsonl_record(const std::string &line) {
  if (!common::json_is_valid(line)) {
    return std::nullopt;
  }
  const std::string trimmed = common::trim_unicode(line);
  if (trimmed.empty() || trimmed.front() != '{') {
    return std::nullopt;
  }

  const auto fields = common::json_parse_object_raw(trimmed);
  JsonlRecord record;
  if (const auto role_it = fields.find("role"); role_it != fields.end()) {
    record.role = common::json_string_value(role_it->second);
  }

  const auto message_it = fields.find("message");
  if (message_it == fields.end()) {
    return record;
  }
  const auto message = common::json_parse_object_raw(message_it->second);
  const auto content_it = message.find("content");
  if (content_it == message.end() || content_it->second.empty() ||
      content_it->second.front() != '[') {
    return record;
  }

  for (const auto &object_json : common::json_split_top_level_objects(content_it->second)) {
    record.parts.push_back(parse_content_part(object_json));
  }
  return record;
}

TextLine classify_text_line(const std::string &line) {
  TextLine out;
  out.trimmed = common::trim_unicode(line);
  const std::string &t = out.trimmed;

  if (t.empty()) {
    out.kind = TextLineKind::Blank;
  } else if (t == std::string(ROLE_USER) + ":" || t == std::string(ROLE_ASSISTANT) + ":") {
    out.kind = TextLineKind::RoleMarker;
    out.role = t.substr(0, t.size() - 1);
  } else if (common::starts_with(t, TOOL_CALL_MARKER)) {
    out.kind = TextLineKind::ToolCall;
  } else if (common::starts_with(t, TOOL_RESULT_MARKER)) {
    out.kind = TextLineKind::ToolResult;
  } else if (common::starts_with(t, USER_QUERY_OPEN) || common::starts_with(t, USER_QUERY_CLOSE)) {
    out.kind = TextLineKind::QueryTag;
  } else {
    out.kind = TextLineKind::Content;
  }
  return out;
}

std::optional<std::string> find_user_query(const std::string &content) {
  const std::string open = USER_QUERY_OPEN;
  const std::string close = USER_QUERY_CLOSE;
  const auto start = content.find(open);
  if (start == std::string::npos) {
    return std::nullopt;
  }
  const auto body = start + open.size();
  const auto end = content.find(close, body);
  if (end == std::string::npos) {
    return std::nullopt;
  }
  return content.substr(body, end - body);
}

std::string excerpt(const std::string &text, const std::size_t max_len) {
  return common::utf8_truncate(common::clean_text(text), max_len);
}

} // namespace cursorhist::transcript
