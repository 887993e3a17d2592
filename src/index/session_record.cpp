#include "cursorhist/index/session_record.hpp"

#include "cursorhist/common/json_util.hpp"

#include <sstream>

namespace cursorhist::index {

namespace {

void write_string(std::ostringstream &out, const char *key, const std::string &value,
                  bool last = false) {
  out << "    \"" << key << "\": \"" << common::json_escape(value) << "\"" << (last ? "\n" : ",\n");
}

template <typename Number>
void write_number(std::ostringstream &out, const char *key, Number value, bool last = false) {
  out << "    \"" << key << "\": " << value << (last ? "\n" : ",\n");
}

} // namespace

std::string encode_sessions_json(const std::vector<SessionRecord> &sessions) {
  if (sessions.empty()) {
    return "[]";
  }

  std::ostringstream out;
  out << "[\n";
  for (std::size_t i = 0; i < sessions.size(); ++i) {
    const auto &s = sessions[i];
    out << "  {\n";
    write_string(out, "id", s.id);
    write_string(out, "workspace", s.workspace);
    write_string(out, "folder", s.folder);
    write_string(out, "format", s.format);
    write_number(out, "modified", s.modified);
    write_string(out, "date", s.date);
    write_number(out, "size", s.size);
    write_number(out, "messages", s.messages);
    write_number(out, "tool_calls", s.tool_calls);
    write_string(out, "summary", s.summary);
    write_string(out, "transcript_path", s.transcript_path);
    write_number(out, "input_tokens", s.input_tokens);
    write_number(out, "output_tokens", s.output_tokens);
    write_number(out, "total_tokens", s.total_tokens);
    write_string(out, "model", s.model);
    write_number(out, "code_edits", s.code_edits, true);
    out << "  }" << (i + 1 < sessions.size() ? ",\n" : "\n");
  }
  out << "]";
  return out.str();
}

} // namespace cursorhist::index
