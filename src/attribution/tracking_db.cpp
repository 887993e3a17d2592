#include "cursorhist/attribution/tracking_db.hpp"

#include <sqlite3.h>

namespace cursorhist::attribution {

namespace {

constexpr int BUSY_TIMEOUT_MS = 2000;

constexpr const char *ATTRIBUTION_QUERY = R"(
SELECT conversationId, model, COUNT(*) AS edits
FROM ai_code_hashes
WHERE conversationId IS NOT NULL
GROUP BY conversationId, model
ORDER BY edits DESC
)";

std::string column_text(sqlite3_stmt *stmt, int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : std::string(reinterpret_cast<const char *>(text));
}

class ReadOnlyDatabase {
public:
  explicit ReadOnlyDatabase(const std::filesystem::path &path) {
    rc_ = sqlite3_open_v2(path.string().c_str(), &db_, SQLITE_OPEN_READONLY, nullptr);
    if (rc_ == SQLITE_OK) {
      sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);
    }
  }
  ~ReadOnlyDatabase() {
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
  }

  ReadOnlyDatabase(const ReadOnlyDatabase &) = delete;
  ReadOnlyDatabase &operator=(const ReadOnlyDatabase &) = delete;

  [[nodiscard]] bool ok() const { return rc_ == SQLITE_OK; }
  [[nodiscard]] sqlite3 *get() const { return db_; }
  [[nodiscard]] std::string error() const {
    return db_ == nullptr ? std::string("out of memory") : std::string(sqlite3_errmsg(db_));
  }

private:
  sqlite3 *db_ = nullptr;
  int rc_ = SQLITE_ERROR;
};

} // namespace

common::Result<AttributionMap> load_attribution_map(const std::filesystem::path &db_path) {
  std::error_code ec;
  if (!std::filesystem::exists(db_path, ec)) {
    return common::Result<AttributionMap>::success({});
  }

  ReadOnlyDatabase db(db_path);
  if (!db.ok()) {
    return common::Result<AttributionMap>::failure("failed to open " + db_path.string() + ": " +
                                                   db.error());
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db.get(), ATTRIBUTION_QUERY, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<AttributionMap>::failure(db.error());
  }

  AttributionMap result;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    const std::string session_id = column_text(stmt, 0);
    const auto edits = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 2));

    // Rows arrive largest first, so the first model seen for a session wins.
    auto [it, inserted] = result.try_emplace(session_id);
    if (inserted) {
      it->second.model = column_text(stmt, 1);
      it->second.edits = edits;
    } else {
      it->second.edits += edits;
    }
  }
  sqlite3_finalize(stmt);

  if (rc != SQLITE_DONE) {
    return common::Result<AttributionMap>::failure(db.error());
  }
  return common::Result<AttributionMap>::success(std::move(result));
}

} // namespace cursorhist::attribution
