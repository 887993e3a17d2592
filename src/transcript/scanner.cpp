#include "cursorhist/transcript/scanner.hpp"

#include "cursorhist/common/fs.hpp"
#include "cursorhist/common/text.hpp"
#include "cursorhist/transcript/records.hpp"

#include <sstream>

namespace cursorhist::transcript {

namespace {

class ScanAccumulator {
public:
  void count_message() { ++messages_; }
  void count_tool_call() { ++tool_calls_; }

  void add_chars(const std::string &role, const std::string &text) {
    if (role == ROLE_USER) {
      input_chars_ += common::utf8_length(text);
    } else {
      output_chars_ += common::utf8_length(text);
    }
  }

  [[nodiscard]] bool has_summary() const { return !summary_.empty(); }
  void set_summary(std::string summary) { summary_ = std::move(summary); }

  [[nodiscard]] ScanResult finish() && {
    ScanResult result;
    result.summary = std::move(summary_);
    result.messages = messages_;
    result.tool_calls = tool_calls_;
    result.input_tokens = input_chars_ / CHARS_PER_TOKEN;
    result.output_tokens = output_chars_ / CHARS_PER_TOKEN;
    return result;
  }

private:
  std::string summary_;
  std::uint64_t messages_ = 0;
  std::uint64_t tool_calls_ = 0;
  std::uint64_t input_chars_ = 0;
  std::uint64_t output_chars_ = 0;
};

void scan_jsonl(const std::string &content, ScanAccumulator &acc) {
  std::istringstream stream(content);
  std::string raw;
  while (std::getline(stream, raw)) {
    const std::string line = common::trim_unicode(raw);
    if (line.empty()) {
      continue;
    }

    // Counted before inspection so malformed records still register as messages.
    acc.count_message();
    const auto record = parse_jsonl_record(line);
    if (!record.has_value()) {
      continue;
    }

    const std::string role = record->role.value_or("");
    for (const auto &part : record->parts) {
      if (part.kind == ContentPart::Kind::ToolUse) {
        acc.count_tool_call();
        continue;
      }
      if (part.kind != ContentPart::Kind::Text) {
        continue;
      }
      acc.add_chars(role, part.text);
      if (!acc.has_summary() && role == ROLE_USER && !part.text.empty()) {
        acc.set_summary(excerpt(part.text, MAX_SUMMARY_LEN));
      }
    }
  }
}

void scan_text(const std::string &content, ScanAccumulator &acc) {
  if (const auto query = find_user_query(content); query.has_value()) {
    acc.set_summary(excerpt(*query, MAX_SUMMARY_LEN));
  }

  std::optional<std::string> role;
  std::istringstream stream(content);
  std::string line;
  while (std::getline(stream, line)) {
    const TextLine classified = classify_text_line(line);

    if (classified.kind == TextLineKind::RoleMarker) {
      role = classified.role;
      acc.count_message();
      continue;
    }
    if (classified.kind == TextLineKind::ToolCall) {
      acc.count_tool_call();
      continue;
    }
    if (!role.has_value()) {
      continue;
    }

    acc.add_chars(*role, line);
    if (!acc.has_summary() && *role == ROLE_USER && !classified.trimmed.empty() &&
        classified.trimmed.front() != '<') {
      acc.set_summary(excerpt(classified.trimmed, MAX_SUMMARY_LEN));
    }
  }
}

} // namespace

ScanResult scan(const std::string &content, const TranscriptFormat format) {
  ScanAccumulator acc;
  switch (format) {
  case TranscriptFormat::Jsonl:
    scan_jsonl(content, acc);
    break;
  case TranscriptFormat::Text:
    scan_text(content, acc);
    break;
  case TranscriptFormat::Unknown:
    break;
  }
  return std::move(acc).finish();
}

ScanResult scan_file(const std::filesystem::path &path) {
  const auto format = format_from_path(path);
  if (format == TranscriptFormat::Unknown) {
    return {};
  }
  const auto content = common::read_text_file(path);
  if (!content.ok()) {
    return {};
  }
  return scan(content.value(), format);
}

} // namespace cursorhist::transcript
