#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cursorhist/index/indexer.hpp"
#include "cursorhist/observability/global.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <variant>

#include <sys/stat.h>

namespace {

namespace ix = cursorhist::index;
using cursorhist::testing::FakeFilesystem;
using cursorhist::testing::jsonl_text;
using cursorhist::testing::TempWorkspace;

constexpr const char *PROJECT = "Users-jane-doe-my-api";

std::string read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void age_file(const std::filesystem::path &path, std::chrono::hours age) {
  std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - age);
}

// projects/<PROJECT>/agent-transcripts/{older.jsonl,newer.txt,notes.md} plus noise.
std::filesystem::path make_projects(const TempWorkspace &ws) {
  const std::string transcripts = std::string("projects/") + PROJECT + "/agent-transcripts/";
  const auto older =
      ws.create_file(transcripts + "older.jsonl",
                     jsonl_text("user", "hello world") + "\n" +
                         jsonl_text("assistant", "hi there, how can I help?") + "\n");
  const auto newer = ws.create_file(transcripts + "newer.txt",
                                    "user:\n<user_query>rename the module</user_query>\n"
                                    "assistant:\n[Tool call] edit_file\n");
  ws.create_file(transcripts + "notes.md", "ignored");
  ws.create_file("projects/stray-file.txt", "not a project");
  ws.create_file("projects/no-transcripts/readme.txt", "no agent-transcripts here");
  std::filesystem::create_directories(ws.path() / transcripts / "nested.jsonl");

  age_file(older, std::chrono::hours(48));
  age_file(newer, std::chrono::hours(1));
  return ws.path() / "projects";
}

ix::Indexer make_indexer(const FakeFilesystem &fs, cursorhist::attribution::AttributionMap map = {}) {
  return ix::Indexer(std::move(map), cursorhist::paths::PathResolver(fs.oracle()));
}

} // namespace

void register_indexer_tests(std::vector<cursorhist::tests::TestCase> &tests) {
  using cursorhist::tests::require;

  tests.push_back({"indexer_collects_transcripts_newest_first", [] {
                     TempWorkspace ws;
                     const auto projects = make_projects(ws);
                     FakeFilesystem fs;
                     fs.add("/Users/jane.doe/my-api");
                     auto indexer = make_indexer(fs);

                     const auto collected = indexer.collect(projects);
                     require(collected.ok(), collected.error());
                     const auto &sessions = collected.value();
                     require(sessions.size() == 2, "only .jsonl and .txt files are sessions");
                     require(sessions[0].id == "newer", "newest first");
                     require(sessions[1].id == "older", "oldest last");
                     require(sessions[0].modified > sessions[1].modified, "sorted by mtime");

                     const auto &older = sessions[1];
                     require(older.format == "jsonl", "format");
                     require(older.folder == PROJECT, "folder");
                     require(older.workspace == "/Users/jane.doe/my-api", "workspace: " + older.workspace);
                     require(older.messages == 2, "messages");
                     require(older.summary == "hello world", "summary");
                     require(older.total_tokens == older.input_tokens + older.output_tokens,
                             "total tokens");
                     require(older.size == std::filesystem::file_size(older.transcript_path), "size");
                     require(older.date.size() == 16 && older.date[4] == '-' && older.date[13] == ':',
                             "date format: " + older.date);

                     const auto &newer = sessions[0];
                     require(newer.format == "txt", "format");
                     require(newer.tool_calls == 1, "tool calls");
                     require(newer.summary == "rename the module", "summary: " + newer.summary);
                   }});

  tests.push_back({"indexer_merges_attribution_by_session_id", [] {
                     TempWorkspace ws;
                     const auto projects = make_projects(ws);
                     FakeFilesystem fs;
                     cursorhist::attribution::AttributionMap map;
                     map["older"] = {.model = "gpt-5", .edits = 3};
                     map["unrelated"] = {.model = "claude-4", .edits = 9};
                     auto indexer = make_indexer(fs, map);

                     const auto collected = indexer.collect(projects);
                     require(collected.ok(), collected.error());
                     for (const auto &session : collected.value()) {
                       if (session.id == "older") {
                         require(session.model == "gpt-5", "model merged");
                         require(session.code_edits == 3, "edits merged");
                       } else {
                         require(session.model.empty(), "no attribution expected");
                         require(session.code_edits == 0, "no edits expected");
                       }
                     }
                   }});

  tests.push_back({"indexer_writes_owner_only_index", [] {
                     TempWorkspace ws;
                     const auto projects = make_projects(ws);
                     const auto cache = ws.path() / "cache" / "deep" / "sessions.json";
                     FakeFilesystem fs;
                     auto indexer = make_indexer(fs);

                     const auto built = indexer.build(projects, cache);
                     require(built.ok(), built.error());
                     require(built.value() == 2, "session count");

                     struct stat info {};
                     require(::stat(cache.c_str(), &info) == 0, "index should exist");
                     require((info.st_mode & 0777) == 0600, "index should be owner-only");
                     require(!std::filesystem::exists(cache.string() + ".tmp"), "temp file removed");

                     const auto json = read_file(cache);
                     require(json.rfind("[\n  {\n    \"id\": \"newer\",\n", 0) == 0,
                             "pretty-printed newest record first");
                     require(json.find("\"total_tokens\": ") != std::string::npos, "total tokens");
                     require(json.find("\"code_edits\": 0\n  }") != std::string::npos, "last field");
                     require(json.back() == ']', "array should be closed");
                   }});

  tests.push_back({"indexer_empty_projects_writes_empty_array", [] {
                     TempWorkspace ws;
                     std::filesystem::create_directories(ws.path() / "projects");
                     const auto cache = ws.path() / "sessions.json";
                     FakeFilesystem fs;
                     auto indexer = make_indexer(fs);

                     const auto built = indexer.build(ws.path() / "projects", cache);
                     require(built.ok(), built.error());
                     require(built.value() == 0, "no sessions");
                     require(read_file(cache) == "[]", "empty array expected");
                   }});

  tests.push_back({"indexer_missing_projects_dir_fails", [] {
                     TempWorkspace ws;
                     const auto built = ix::build_index(ws.path() / "missing", ws.path() / "s.json", {});
                     require(!built.ok(), "missing projects directory should fail");
                     require(built.error().find("Projects directory not found") != std::string::npos,
                             built.error());
                     require(!std::filesystem::exists(ws.path() / "s.json"), "nothing written");
                   }});

  tests.push_back({"indexer_reports_progress_to_observer", [] {
                     TempWorkspace ws;
                     const auto projects = make_projects(ws);
                     auto recorder = std::make_unique<cursorhist::testing::RecordingObserver>();
                     auto *recording = recorder.get();
                     cursorhist::observability::set_global_observer(std::move(recorder));

                     FakeFilesystem fs;
                     auto indexer = make_indexer(fs);
                     const auto built = indexer.build(projects, ws.path() / "sessions.json");

                     bool saw_start = false;
                     std::uint64_t ended_with = 0;
                     std::size_t scanned = 0;
                     for (const auto &event : recording->events) {
                       if (std::holds_alternative<cursorhist::observability::IndexStartEvent>(event)) {
                         saw_start = true;
                       } else if (const auto *end =
                                      std::get_if<cursorhist::observability::IndexEndEvent>(&event)) {
                         ended_with = end->sessions;
                       } else if (std::holds_alternative<
                                      cursorhist::observability::TranscriptScannedEvent>(event)) {
                         ++scanned;
                       }
                     }
                     const bool saw_metric = !recording->metrics.empty();
                     cursorhist::observability::set_global_observer(nullptr);

                     require(built.ok(), built.error());
                     require(saw_start, "index start event expected");
                     require(ended_with == 2, "index end event should carry the session count");
                     require(scanned == 2, "one scan event per transcript");
                     require(saw_metric, "metrics expected");
                   }});

  tests.push_back({"indexer_encodes_special_characters", [] {
                     ix::SessionRecord record;
                     record.id = "s";
                     record.summary = "say \"hi\"\tnow\\";
                     const auto json = ix::encode_sessions_json({record});
                     require(json.find(R"("summary": "say \"hi\"\tnow\\")") != std::string::npos,
                             json);
                     require(ix::encode_sessions_json({}) == "[]", "empty array");
                   }});
}
