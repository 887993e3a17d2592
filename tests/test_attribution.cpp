#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cursorhist/attribution/tracking_db.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

namespace {

void exec_sql(sqlite3 *db, const std::string &sql) {
  char *error = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
    const std::string message = error != nullptr ? error : "sqlite error";
    sqlite3_free(error);
    throw std::runtime_error(message);
  }
}

void create_tracking_db(const std::filesystem::path &path, const std::string &inserts) {
  sqlite3 *db = nullptr;
  if (sqlite3_open(path.string().c_str(), &db) != SQLITE_OK) {
    sqlite3_close(db);
    throw std::runtime_error("cannot create " + path.string());
  }
  try {
    exec_sql(db, "CREATE TABLE ai_code_hashes (hash TEXT PRIMARY KEY, conversationId TEXT, "
                 "model TEXT, createdAt INTEGER)");
    exec_sql(db, inserts);
  } catch (...) {
    sqlite3_close(db);
    throw;
  }
  sqlite3_close(db);
}

} // namespace

void register_attribution_tests(std::vector<cursorhist::tests::TestCase> &tests) {
  using cursorhist::tests::require;
  namespace at = cursorhist::attribution;

  tests.push_back({"attribution_missing_db_is_empty", [] {
                     cursorhist::testing::TempWorkspace ws;
                     const auto loaded = at::load_attribution_map(ws.path() / "absent.db");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().empty(), "expected no attribution");
                   }});

  tests.push_back({"attribution_top_model_wins_and_edits_sum", [] {
                     cursorhist::testing::TempWorkspace ws;
                     const auto db_path = ws.path() / "tracking.db";
                     create_tracking_db(db_path, R"(
INSERT INTO ai_code_hashes VALUES ('h1', 's1', 'gpt-5', 1);
INSERT INTO ai_code_hashes VALUES ('h2', 's1', 'gpt-5', 2);
INSERT INTO ai_code_hashes VALUES ('h3', 's1', 'gpt-5', 3);
INSERT INTO ai_code_hashes VALUES ('h4', 's1', 'claude-4', 4);
INSERT INTO ai_code_hashes VALUES ('h5', 's2', 'claude-4', 5);
INSERT INTO ai_code_hashes VALUES ('h6', 's2', 'claude-4', 6);
INSERT INTO ai_code_hashes VALUES ('h7', NULL, 'gpt-5', 7);
)");
                     const auto loaded = at::load_attribution_map(db_path);
                     require(loaded.ok(), loaded.error());
                     const auto &map = loaded.value();
                     require(map.size() == 2, "rows without a session are ignored");
                     require(map.at("s1").model == "gpt-5", "largest model should win");
                     require(map.at("s1").edits == 4, "edits should be summed across models");
                     require(map.at("s2").model == "claude-4", "single model");
                     require(map.at("s2").edits == 2, "edit count");
                   }});

  tests.push_back({"attribution_missing_table_fails", [] {
                     cursorhist::testing::TempWorkspace ws;
                     const auto db_path = ws.path() / "empty.db";
                     sqlite3 *db = nullptr;
                     require(sqlite3_open(db_path.string().c_str(), &db) == SQLITE_OK, "open");
                     exec_sql(db, "CREATE TABLE unrelated (id INTEGER)");
                     sqlite3_close(db);

                     const auto loaded = at::load_attribution_map(db_path);
                     require(!loaded.ok(), "query against a foreign schema should fail");
                     require(!loaded.error().empty(), "error message expected");
                   }});

  tests.push_back({"attribution_corrupt_file_fails", [] {
                     cursorhist::testing::TempWorkspace ws;
                     const auto path = ws.create_file("bad.db", std::string(4096, 'z'));
                     const auto loaded = at::load_attribution_map(path);
                     require(!loaded.ok(), "non-database file should fail");
                   }});
}
