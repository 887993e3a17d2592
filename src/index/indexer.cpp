#include "cursorhist/index/indexer.hpp"

#include "cursorhist/common/fs.hpp"
#include "cursorhist/observability/global.hpp"
#include "cursorhist/transcript/format.hpp"
#include "cursorhist/transcript/scanner.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

#include <sys/stat.h>
#include <sys/types.h>

namespace cursorhist::index {

namespace {

std::vector<std::filesystem::path> sorted_entries(const std::filesystem::path &dir) {
  std::vector<std::filesystem::path> entries;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    entries.push_back(it->path());
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto &a, const auto &b) { return a.filename() < b.filename(); });
  return entries;
}

// Restricts permissions of files created while in scope to the owner.
class ScopedUmask {
public:
  explicit ScopedUmask(const mode_t mask) : previous_(::umask(mask)) {}
  ~ScopedUmask() { ::umask(previous_); }

  ScopedUmask(const ScopedUmask &) = delete;
  ScopedUmask &operator=(const ScopedUmask &) = delete;

private:
  mode_t previous_;
};

} // namespace

std::string format_local_date(const std::int64_t unix_seconds) {
  const auto t = static_cast<std::time_t>(unix_seconds);
  std::tm local_tm{};
#ifdef _WIN32
  localtime_s(&local_tm, &t);
#else
  localtime_r(&t, &local_tm);
#endif
  std::ostringstream out;
  out << std::put_time(&local_tm, "%Y-%m-%d %H:%M");
  return out.str();
}

Indexer::Indexer(attribution::AttributionMap attribution, paths::PathResolver resolver)
    : attribution_(std::move(attribution)), resolver_(std::move(resolver)) {}

common::Result<std::vector<SessionRecord>>
Indexer::collect(const std::filesystem::path &projects_dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(projects_dir, ec)) {
    return common::Result<std::vector<SessionRecord>>::failure(
        "Projects directory not found: " + projects_dir.string());
  }

  std::vector<SessionRecord> sessions;
  for (const auto &project_dir : sorted_entries(projects_dir)) {
    collect_project(project_dir, sessions);
  }

  std::stable_sort(sessions.begin(), sessions.end(),
                   [](const SessionRecord &a, const SessionRecord &b) {
                     return a.modified > b.modified;
                   });
  return common::Result<std::vector<SessionRecord>>::success(std::move(sessions));
}

void Indexer::collect_project(const std::filesystem::path &project_dir,
                              std::vector<SessionRecord> &out) {
  std::error_code ec;
  const auto transcripts_dir = project_dir / TRANSCRIPTS_DIR_NAME;
  if (!std::filesystem::is_directory(transcripts_dir, ec)) {
    return;
  }

  const std::string folder = project_dir.filename().string();
  const std::string workspace = resolver_.decode(folder);
  observability::record_project_resolved(folder, workspace);

  for (const auto &transcript : sorted_entries(transcripts_dir)) {
    if (transcript::format_from_path(transcript) == transcript::TranscriptFormat::Unknown ||
        !std::filesystem::is_regular_file(transcript, ec)) {
      continue;
    }
    if (auto record = make_record(transcript, folder, workspace); record.has_value()) {
      out.push_back(std::move(*record));
    }
  }
}

std::optional<SessionRecord> Indexer::make_record(const std::filesystem::path &transcript,
                                                  const std::string &folder,
                                                  const std::string &workspace) const {
  struct stat info {};
  if (::stat(transcript.c_str(), &info) != 0) {
    observability::record_error("index", "cannot stat " + transcript.string());
    return std::nullopt;
  }

  const auto format = transcript::format_from_path(transcript);
  const auto scanned = transcript::scan_file(transcript);
  observability::record_transcript_scanned(transcript.string(), scanned.messages,
                                           scanned.tool_calls);

  SessionRecord record{
      .id = transcript.stem().string(),
      .workspace = workspace,
      .folder = folder,
      .format = transcript::format_name(format),
      .modified = static_cast<std::int64_t>(info.st_mtime),
      .date = format_local_date(static_cast<std::int64_t>(info.st_mtime)),
      .size = static_cast<std::uint64_t>(info.st_size),
      .messages = scanned.messages,
      .tool_calls = scanned.tool_calls,
      .summary = scanned.summary,
      .transcript_path = transcript.string(),
      .input_tokens = scanned.input_tokens,
      .output_tokens = scanned.output_tokens,
      .total_tokens = scanned.input_tokens + scanned.output_tokens,
  };

  if (const auto it = attribution_.find(record.id); it != attribution_.end()) {
    record.model = it->second.model;
    record.code_edits = it->second.edits;
  }
  return record;
}

common::Result<std::size_t> Indexer::build(const std::filesystem::path &projects_dir,
                                           const std::filesystem::path &cache_file) {
  const auto started = std::chrono::steady_clock::now();
  observability::record_index_start(projects_dir.string());

  auto sessions = collect(projects_dir);
  if (!sessions.ok()) {
    observability::record_error("index", sessions.error());
    return common::Result<std::size_t>::failure(sessions.error());
  }

  const auto written = write_index(sessions.value(), cache_file);
  if (!written.ok()) {
    observability::record_error("index", written.error());
    return common::Result<std::size_t>::failure(written.error());
  }

  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
  for (const auto &session : sessions.value()) {
    input_tokens += session.input_tokens;
    output_tokens += session.output_tokens;
  }
  const auto count = sessions.value().size();
  observability::record_metric(
      observability::SessionsIndexedMetric{.count = static_cast<std::uint64_t>(count)});
  observability::record_metric(observability::TokensEstimatedMetric{
      .input_tokens = input_tokens, .output_tokens = output_tokens});
  observability::record_index_end(
      count, std::chrono::duration_cast<std::chrono::milliseconds>(
                 std::chrono::steady_clock::now() - started));
  return common::Result<std::size_t>::success(count);
}

common::Result<std::size_t> build_index(const std::filesystem::path &projects_dir,
                                        const std::filesystem::path &cache_file,
                                        attribution::AttributionMap attribution,
                                        const paths::PathResolverOptions options) {
  Indexer indexer(std::move(attribution), paths::PathResolver(paths::filesystem_oracle(), options));
  return indexer.build(projects_dir, cache_file);
}

common::Status write_index(const std::vector<SessionRecord> &sessions,
                           const std::filesystem::path &cache_file) {
  if (cache_file.empty()) {
    return common::Status::error("cache file path is empty");
  }

  const ScopedUmask owner_only(077);

  if (cache_file.has_parent_path()) {
    const auto dir = common::ensure_dir(cache_file.parent_path());
    if (!dir.ok()) {
      return common::Status::error(dir.error());
    }
  }

  const auto temp_path = cache_file.string() + ".tmp";
  std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return common::Status::error("failed to open " + temp_path);
  }
  out << encode_sessions_json(sessions);
  out.close();
  if (!out) {
    return common::Status::error("failed to write " + temp_path);
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, cache_file, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    return common::Status::error("failed to replace " + cache_file.string());
  }
  return common::Status::success();
}

} // namespace cursorhist::index
