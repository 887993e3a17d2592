#include "cursorhist/config/config.hpp"

#include "cursorhist/common/fs.hpp"
#include "cursorhist/common/toml.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace cursorhist::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".cursor-history";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *CACHE_FILENAME = "sessions.json";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("CURSOR_HISTORY_CONFIG_PATH");
      env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

void expand_paths(Config &config) {
  config.projects_dir = expand_config_value(config.projects_dir);
  config.cache_file = expand_config_value(config.cache_file);
  config.attribution.db_path = expand_config_value(config.attribution.db_path);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *projects = std::getenv("CURSOR_PROJECTS_DIR");
      projects != nullptr && *projects) {
    config.projects_dir = common::expand_path(projects);
  }

  // The cache variable names a directory; the index file lives inside it.
  if (const char *cache_dir = std::getenv("CURSOR_HISTORY_CACHE");
      cache_dir != nullptr && *cache_dir) {
    config.cache_file =
        (std::filesystem::path(common::expand_path(cache_dir)) / CACHE_FILENAME).string();
  }

  if (const char *db = std::getenv("CURSOR_HISTORY_TRACKING_DB"); db != nullptr && *db) {
    config.attribution.db_path = common::expand_path(db);
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.projects_dir = doc.get_string("projects_dir", config.projects_dir);
  config.cache_file = doc.get_string("cache_file", config.cache_file);

  config.attribution.db_path = doc.get_string("attribution.db_path", config.attribution.db_path);
  config.attribution.enabled = doc.get_bool("attribution.enabled", config.attribution.enabled);

  config.preview.limit = doc.get_int("preview.limit", config.preview.limit);

  config.paths.windows_drives = doc.get_bool("paths.windows_drives", config.paths.windows_drives);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.verbose =
      doc.get_bool("observability.verbose", config.observability.verbose);

  expand_paths(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    expand_paths(config);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }

  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.preview.limit <= 0) {
    return common::Result<std::vector<std::string>>::failure(
        "preview.limit must be a positive integer");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (!backend.empty() && backend != "log" && backend != "none" && backend != "noop") {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.backend: " +
                                                              config.observability.backend);
  }

  if (common::trim(config.cache_file).empty()) {
    return common::Result<std::vector<std::string>>::failure("cache_file must not be empty");
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(config.projects_dir, ec)) {
    warnings.push_back("projects_dir does not exist: " + config.projects_dir);
  }

  if (config.attribution.enabled && !std::filesystem::exists(config.attribution.db_path, ec)) {
    warnings.push_back("attribution database not found: " + config.attribution.db_path);
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace cursorhist::config
