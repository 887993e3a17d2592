#pragma once

#include "cursorhist/attribution/tracking_db.hpp"
#include "cursorhist/common/result.hpp"
#include "cursorhist/index/session_record.hpp"
#include "cursorhist/paths/path_resolver.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace cursorhist::index {

inline constexpr const char *TRANSCRIPTS_DIR_NAME = "agent-transcripts";

/// Walks a Cursor projects directory and produces one SessionRecord per
/// transcript found under `<project>/agent-transcripts/`.
class Indexer {
public:
  Indexer(attribution::AttributionMap attribution, paths::PathResolver resolver);

  /// Records sorted by modification time, newest first. Fails only when
  /// `projects_dir` is not a directory.
  [[nodiscard]] common::Result<std::vector<SessionRecord>>
  collect(const std::filesystem::path &projects_dir);

  /// collect() followed by write_index(). Returns the number of sessions written.
  [[nodiscard]] common::Result<std::size_t> build(const std::filesystem::path &projects_dir,
                                                  const std::filesystem::path &cache_file);

private:
  void collect_project(const std::filesystem::path &project_dir,
                       std::vector<SessionRecord> &out);
  [[nodiscard]] std::optional<SessionRecord>
  make_record(const std::filesystem::path &transcript, const std::string &folder,
              const std::string &workspace) const;

  attribution::AttributionMap attribution_;
  paths::PathResolver resolver_;
};

/// Indexes `projects_dir` into `cache_file` with a fresh filesystem-backed resolver.
[[nodiscard]] common::Result<std::size_t>
build_index(const std::filesystem::path &projects_dir, const std::filesystem::path &cache_file,
            attribution::AttributionMap attribution, paths::PathResolverOptions options = {});

/// Writes the index atomically with owner-only permissions, creating parent
/// directories as needed.
[[nodiscard]] common::Status write_index(const std::vector<SessionRecord> &sessions,
                                         const std::filesystem::path &cache_file);

/// "%Y-%m-%d %H:%M" in local time.
[[nodiscard]] std::string format_local_date(std::int64_t unix_seconds);

} // namespace cursorhist::index
