#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cursorhist::paths {

/// Answers whether an absolute path exists.
using ExistenceOracle = std::function<bool(const std::string &path)>;

[[nodiscard]] ExistenceOracle filesystem_oracle();

struct PathResolverOptions {
  /// Treat a leading single-letter segment as a drive letter without asking the oracle.
#if defined(_WIN32)
  bool windows_drives = true;
#else
  bool windows_drives = false;
#endif
};

/// Reconstructs a workspace path from a Cursor project folder name.
///
/// Cursor replaces both '/' and '.' with '-' when naming project folders, so
/// "Users-jane-doe-my-api" may stand for "/Users/jane.doe/my-api". Every '-'
/// is tried as a literal dash, a dot and a path separator; a separator is only
/// explored when the directory it closes exists. Candidates that exist on disk
/// win, otherwise the separator, dot and dash readings are preferred in that
/// order, so the result is deterministic when nothing exists.
///
/// Existence answers are memoized for the lifetime of the resolver; the memo is
/// not synchronized, so a resolver must not be shared between threads.
class PathResolver {
public:
  explicit PathResolver(ExistenceOracle oracle = filesystem_oracle(),
                        PathResolverOptions options = {});

  [[nodiscard]] std::string decode(const std::string &folder_name);

  void reset_cache();
  [[nodiscard]] std::size_t cache_size() const { return exists_cache_.size(); }
  /// Number of times the oracle itself was consulted (cache misses).
  [[nodiscard]] std::size_t oracle_calls() const { return oracle_calls_; }

private:
  struct DriveSplit {
    std::string root;
    std::size_t first_segment = 0;
  };

  [[nodiscard]] bool exists(const std::string &path);
  [[nodiscard]] DriveSplit detect_drive(const std::vector<std::string> &parts);
  [[nodiscard]] std::string solve(const std::vector<std::string> &parts, std::size_t index,
                                  const std::string &segment, const std::string &prefix);

  ExistenceOracle oracle_;
  PathResolverOptions options_;
  std::unordered_map<std::string, bool> exists_cache_;
  std::size_t oracle_calls_ = 0;
};

} // namespace cursorhist::paths
