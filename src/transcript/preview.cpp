#include "cursorhist/transcript/preview.hpp"

#include "cursorhist/common/fs.hpp"
#include "cursorhist/common/text.hpp"
#include "cursorhist/transcript/records.hpp"

#include <ostream>
#include <sstream>

namespace cursorhist::transcript {

namespace {

constexpr const char *MARKER_USER = "▶";
constexpr const char *MARKER_ASSISTANT = "◀";
constexpr const char *MARKER_TOOL = "\U0001f527";
constexpr const char *TRUNCATED_LINE = "  ... (truncated)";

// Emits lines until the limit is reached, then reports whether anything was cut.
class PreviewWriter {
public:
  PreviewWriter(std::size_t limit, std::ostream &out) : limit_(limit), out_(out) {}

  [[nodiscard]] bool full() const { return emitted_ >= limit_; }

  void message(const std::string &role, const std::string &text) {
    const char *marker = role == ROLE_USER ? MARKER_USER : MARKER_ASSISTANT;
    emit(std::string("  ") + marker + " [" + role + "] " + excerpt(text, PREVIEW_MAX_LINE_LEN));
  }

  void plain(const std::string &text) { emit("  " + excerpt(text, PREVIEW_MAX_LINE_LEN)); }

  void tool_call(const std::string &line) {
    emit(std::string("  ") + MARKER_TOOL + " " +
         common::utf8_truncate(line, PREVIEW_MAX_LINE_LEN));
  }

  void truncated() { out_ << TRUNCATED_LINE << "\n"; }

private:
  void emit(const std::string &line) {
    out_ << line << "\n";
    ++emitted_;
  }

  std::size_t limit_;
  std::ostream &out_;
  std::size_t emitted_ = 0;
};

void render_jsonl(const std::string &content, PreviewWriter &writer) {
  std::istringstream stream(content);
  std::string raw;
  while (std::getline(stream, raw)) {
    const std::string line = common::trim_unicode(raw);
    if (line.empty()) {
      continue;
    }
    if (writer.full()) {
      writer.truncated();
      return;
    }

    const auto record = parse_jsonl_record(line);
    if (!record.has_value()) {
      continue;
    }
    for (const auto &part : record->parts) {
      if (part.kind == ContentPart::Kind::Text) {
        writer.message(record->role.value_or("?"), part.text);
        break;
      }
    }
  }
}

void render_text(const std::string &content, PreviewWriter &writer) {
  std::optional<std::string> role;
  std::istringstream stream(content);
  std::string line;
  while (std::getline(stream, line)) {
    const TextLine classified = classify_text_line(line);
    if (classified.kind == TextLineKind::Blank) {
      continue;
    }
    if (writer.full()) {
      writer.truncated();
      return;
    }

    switch (classified.kind) {
    case TextLineKind::RoleMarker:
      role = classified.role;
      break;
    case TextLineKind::ToolCall:
      writer.tool_call(classified.trimmed);
      break;
    case TextLineKind::Content:
      if (excerpt(classified.trimmed, PREVIEW_MAX_LINE_LEN).empty()) {
        break;
      }
      if (role.has_value()) {
        writer.message(*role, classified.trimmed);
      } else {
        writer.plain(classified.trimmed);
      }
      break;
    case TextLineKind::Blank:
    case TextLineKind::ToolResult:
    case TextLineKind::QueryTag:
      break;
    }
  }
}

} // namespace

void render(const std::string &content, const TranscriptFormat format, const std::size_t limit,
            std::ostream &out) {
  PreviewWriter writer(limit, out);
  switch (format) {
  case TranscriptFormat::Jsonl:
    render_jsonl(content, writer);
    break;
  case TranscriptFormat::Text:
    render_text(content, writer);
    break;
  case TranscriptFormat::Unknown:
    break;
  }
}

void preview_file(const std::filesystem::path &path, const std::size_t limit, std::ostream &out) {
  const auto format = format_from_path(path);
  if (format == TranscriptFormat::Unknown) {
    return;
  }
  const auto content = common::read_text_file(path);
  if (!content.ok()) {
    return;
  }
  render(content.value(), format, limit, out);
}

} // namespace cursorhist::transcript
