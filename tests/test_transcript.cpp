#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cursorhist/common/text.hpp"
#include "cursorhist/transcript/format.hpp"
#include "cursorhist/transcript/records.hpp"
#include "cursorhist/transcript/scanner.hpp"

#include <string>

namespace {

namespace tr = cursorhist::transcript;
using cursorhist::testing::jsonl_text;

constexpr const char *TOOL_USE_LINE =
    R"({"role":"assistant","message":{"content":[{"type":"tool_use","name":"read_file","input":{"path":"a.txt"}},{"type":"text","text":"done"}]}})";

} // namespace

void register_transcript_tests(std::vector<cursorhist::tests::TestCase> &tests) {
  using cursorhist::tests::require;

  tests.push_back({"transcript_format_from_extension", [] {
                     require(tr::format_from_path("a/b/session.jsonl") == tr::TranscriptFormat::Jsonl,
                             "jsonl");
                     require(tr::format_from_path("session.txt") == tr::TranscriptFormat::Text, "txt");
                     require(tr::format_from_path("notes.md") == tr::TranscriptFormat::Unknown, "md");
                     require(tr::format_from_path("README") == tr::TranscriptFormat::Unknown,
                             "no extension");
                     require(tr::format_name(tr::TranscriptFormat::Jsonl) == "jsonl", "name");
                     require(tr::format_name(tr::TranscriptFormat::Text) == "txt", "name");
                   }});

  tests.push_back({"transcript_jsonl_basic_conversation", [] {
                     const std::string content = jsonl_text("user", "hello world") + "\n" +
                                                 jsonl_text("assistant", "hi there, how can I help?") +
                                                 "\n";
                     const auto result = tr::scan(content, tr::TranscriptFormat::Jsonl);
                     require(result.messages == 2, "messages");
                     require(result.tool_calls == 0, "tool calls");
                     require(result.summary == "hello world", "summary: " + result.summary);
                     require(result.input_tokens == 2, "input tokens");
                     require(result.output_tokens == 6, "output tokens");
                   }});

  tests.push_back({"transcript_jsonl_counts_tool_use_parts", [] {
                     const std::string content = jsonl_text("user", "read it") + "\n" +
                                                 TOOL_USE_LINE + "\n" + TOOL_USE_LINE + "\n";
                     const auto result = tr::scan(content, tr::TranscriptFormat::Jsonl);
                     require(result.messages == 3, "messages");
                     require(result.tool_calls == 2, "tool calls");
                     require(result.output_tokens == 2, "tool_use parts carry no text");
                   }});

  tests.push_back({"transcript_jsonl_malformed_lines_still_count", [] {
                     const std::string content = "not json at all\n\n   \n" +
                                                 std::string(R"({"role":"user"})") + "\n" +
                                                 R"({"role":"user","message":{"content":"plain"}})" +
                                                 "\n[1,2,3]\n";
                     const auto result = tr::scan(content, tr::TranscriptFormat::Jsonl);
                     require(result.messages == 4, "every non-empty line is a message");
                     require(result.tool_calls == 0, "tool calls");
                     require(result.summary.empty(), "no text parts, no summary");
                     require(result.input_tokens == 0 && result.output_tokens == 0, "no tokens");
                   }});

  tests.push_back({"transcript_jsonl_summary_is_first_user_text", [] {
                     const std::string content = jsonl_text("assistant", "welcome") + "\n" +
                                                 jsonl_text("user", "") + "\n" +
                                                 jsonl_text("user", "<user_query>fix   the\nbug</user_query>") +
                                                 "\n" + jsonl_text("user", "second question") + "\n";
                     const auto result = tr::scan(content, tr::TranscriptFormat::Jsonl);
                     require(result.summary == "fix the bug", "summary: " + result.summary);
                   }});

  tests.push_back({"transcript_summary_is_bounded", [] {
                     std::string long_text;
                     for (int i = 0; i < 300; ++i) {
                       long_text += "\xC3\xA9"; // é
                     }
                     const auto result =
                         tr::scan(jsonl_text("user", long_text), tr::TranscriptFormat::Jsonl);
                     require(cursorhist::common::utf8_length(result.summary) == 200,
                             "summary should be cut to 200 code points");
                     require(result.input_tokens == 75, "tokens count code points, not bytes");
                   }});

  tests.push_back({"transcript_text_format_counts", [] {
                     const std::string content = "user:\n"
                                                 "<user_query>\n"
                                                 "How do I sort a list?\n"
                                                 "</user_query>\n"
                                                 "assistant:\n"
                                                 "Use sorted().\n"
                                                 "[Tool call] run_terminal\n"
                                                 "[Tool result] ok\n";
                     const auto result = tr::scan(content, tr::TranscriptFormat::Text);
                     require(result.messages == 2, "messages");
                     require(result.tool_calls == 1, "tool calls");
                     require(result.summary == "How do I sort a list?", "summary: " + result.summary);
                     require(result.input_tokens == 11, "input tokens");
                     require(result.output_tokens == 7, "output tokens");
                   }});

  tests.push_back({"transcript_text_user_query_beats_earlier_user_line", [] {
                     const auto result = tr::scan("user:\nfirst line\n<user_query>real ask</user_query>\n",
                                                  tr::TranscriptFormat::Text);
                     require(result.summary == "real ask", "summary: " + result.summary);
                     require(result.messages == 1, "messages");
                   }});

  tests.push_back({"transcript_text_tool_call_before_any_role", [] {
                     const auto result = tr::scan("[Tool call] list_dir\nuser:\nhi\n",
                                                  tr::TranscriptFormat::Text);
                     require(result.tool_calls == 1, "tool call outside a role still counts");
                     require(result.messages == 1, "messages");
                     require(result.summary == "hi", "summary");
                   }});

  tests.push_back({"transcript_unicode_whitespace", [] {
                     const std::string nbsp = "\xC2\xA0";
                     const std::string content =
                         nbsp + nbsp + "\n" +
                         jsonl_text("user", "hello" + nbsp + nbsp + "world\xE3\x80\x80x") + "\n" +
                         "\xE3\x80\x80\n";
                     const auto result = tr::scan(content, tr::TranscriptFormat::Jsonl);
                     require(result.messages == 1, "whitespace-only lines are blank");
                     require(result.summary == "hello world x", "summary: " + result.summary);

                     const auto text = tr::scan("user:\n" + nbsp + "spaced" + nbsp + nbsp + "out\n",
                                                tr::TranscriptFormat::Text);
                     require(text.summary == "spaced out", "text summary: " + text.summary);
                   }});

  tests.push_back({"transcript_jsonl_non_finite_numbers", [] {
                     const auto result = tr::scan(
                         R"({"role":"user","x":NaN,"message":{"content":[{"type":"tool_use"}]}})" "\n"
                         R"({"role":"assistant","y":-Infinity,"message":{"content":[{"type":"text","text":"ok"}]}})"
                         "\n",
                         tr::TranscriptFormat::Jsonl);
                     require(result.messages == 2, "messages");
                     require(result.tool_calls == 1, "NaN does not invalidate the record");
                   }});

  tests.push_back({"transcript_text_fallback_summary_is_tag_free", [] {
                     const std::string content = "user:\n<ctx>skip</ctx>\nplease <b>help</b>   me\n"
                                                 "assistant:\nsure\n";
                     const auto result = tr::scan(content, tr::TranscriptFormat::Text);
                     require(result.summary == "please help me", "summary: " + result.summary);
                     require(result.summary.find('<') == std::string::npos, "no tag fragments");
                   }});

  tests.push_back({"transcript_text_ignores_lines_before_first_role", [] {
                     const auto result =
                         tr::scan("preamble text\nmore\nuser:\nhi\n", tr::TranscriptFormat::Text);
                     require(result.messages == 1, "messages");
                     require(result.summary == "hi", "summary");
                     require(result.input_tokens == 0, "2 chars is below one token");
                   }});

  tests.push_back({"transcript_unknown_format_is_empty", [] {
                     const auto result = tr::scan(jsonl_text("user", "hello world"),
                                                  tr::TranscriptFormat::Unknown);
                     require(result.messages == 0 && result.summary.empty(), "empty result");
                   }});

  tests.push_back({"transcript_scan_file_normalises_input", [] {
                     cursorhist::testing::TempWorkspace ws;
                     const auto path = ws.create_file(
                         "s.jsonl", jsonl_text("user", "hello world") + "\r\n" +
                                        jsonl_text("assistant", "caf\xE9 ok") + "\r\n");
                     const auto result = tr::scan_file(path);
                     require(result.messages == 2, "CRLF lines");
                     require(result.summary == "hello world", "summary");

                     const auto missing = tr::scan_file(ws.path() / "missing.jsonl");
                     require(missing.messages == 0, "missing file yields empty result");

                     const auto other = ws.create_file("notes.md", "user:\nhi\n");
                     require(tr::scan_file(other).messages == 0, "unknown extension");
                   }});

  tests.push_back({"transcript_classify_text_lines", [] {
                     require(tr::classify_text_line("  user:  ").kind == tr::TextLineKind::RoleMarker,
                             "role marker");
                     require(tr::classify_text_line("assistant:").role == "assistant", "role");
                     require(tr::classify_text_line("user: hi").kind == tr::TextLineKind::Content,
                             "marker must stand alone");
                     require(tr::classify_text_line("[Tool call] x").kind == tr::TextLineKind::ToolCall,
                             "tool call");
                     require(tr::classify_text_line("[Tool result] x").kind ==
                                 tr::TextLineKind::ToolResult,
                             "tool result");
                     require(tr::classify_text_line("</user_query>").kind == tr::TextLineKind::QueryTag,
                             "query tag");
                     require(tr::classify_text_line("   ").kind == tr::TextLineKind::Blank, "blank");
                   }});
}
