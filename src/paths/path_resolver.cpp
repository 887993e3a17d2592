#include "cursorhist/paths/path_resolver.hpp"

#include "cursorhist/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace cursorhist::paths {

namespace {

constexpr char ENCODED_SEPARATOR = '-';
constexpr const char *RESERVED_ROOT_PREFIX = "var-";

std::vector<std::string> split_encoded(const std::string &name) {
  std::vector<std::string> parts;
  std::string current;
  for (const char ch : name) {
    if (ch == ENCODED_SEPARATOR) {
      parts.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  parts.push_back(std::move(current));
  return parts;
}

} // namespace

ExistenceOracle filesystem_oracle() {
  return [](const std::string &path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
  };
}

PathResolver::PathResolver(ExistenceOracle oracle, PathResolverOptions options)
    : oracle_(std::move(oracle)), options_(options) {}

void PathResolver::reset_cache() {
  exists_cache_.clear();
  oracle_calls_ = 0;
}

bool PathResolver::exists(const std::string &path) {
  if (const auto it = exists_cache_.find(path); it != exists_cache_.end()) {
    return it->second;
  }
  ++oracle_calls_;
  const bool found = oracle_ ? oracle_(path) : false;
  exists_cache_.emplace(path, found);
  return found;
}

PathResolver::DriveSplit PathResolver::detect_drive(const std::vector<std::string> &parts) {
  if (parts.size() < 2 || parts[0].size() != 1 ||
      std::isalpha(static_cast<unsigned char>(parts[0][0])) == 0) {
    return {};
  }

  std::string drive(1, static_cast<char>(std::toupper(static_cast<unsigned char>(parts[0][0]))));
  drive += ":/";
  if (options_.windows_drives || exists(drive) || exists("/" + parts[0])) {
    return {.root = std::move(drive), .first_segment = 1};
  }
  return {};
}

std::string PathResolver::decode(const std::string &folder_name) {
  if (common::starts_with(folder_name, RESERVED_ROOT_PREFIX)) {
    std::string path = folder_name;
    std::replace(path.begin(), path.end(), ENCODED_SEPARATOR, '/');
    return "/" + path;
  }

  const auto parts = split_encoded(folder_name);
  if (parts.size() == 1) {
    return "/" + parts[0];
  }

  const auto drive = detect_drive(parts);
  const std::string root = drive.root.empty() ? "/" : drive.root;
  if (drive.first_segment >= parts.size()) {
    return root;
  }
  return solve(parts, drive.first_segment + 1, parts[drive.first_segment], root);
}

// `prefix` is the confirmed directory chain so far and always ends with '/';
// `segment` is the open component the next part may still join.
std::string PathResolver::solve(const std::vector<std::string> &parts, const std::size_t index,
                                const std::string &segment, const std::string &prefix) {
  if (index == parts.size()) {
    return prefix + segment;
  }

  const std::string &part = parts[index];
  const std::string as_dash = solve(parts, index + 1, segment + "-" + part, prefix);
  const std::string as_dot = solve(parts, index + 1, segment + "." + part, prefix);

  std::optional<std::string> as_separator;
  const std::string closed = prefix + segment;
  if (exists(closed)) {
    as_separator = solve(parts, index + 1, part, closed + "/");
  }

  if (as_separator.has_value() && exists(*as_separator)) {
    return *as_separator;
  }
  if (exists(as_dot)) {
    return as_dot;
  }
  if (exists(as_dash)) {
    return as_dash;
  }
  return as_separator.value_or(as_dot);
}

} // namespace cursorhist::paths
