#include "cursorhist/cli/commands.hpp"

#include "cursorhist/attribution/tracking_db.hpp"
#include "cursorhist/common/fs.hpp"
#include "cursorhist/config/config.hpp"
#include "cursorhist/index/indexer.hpp"
#include "cursorhist/observability/factory.hpp"
#include "cursorhist/observability/global.hpp"
#include "cursorhist/transcript/preview.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace cursorhist::cli {

namespace {

constexpr const char *PROGRAM_NAME = "cursor-history-index";

std::string version_string() {
#ifdef CURSORHIST_VERSION
  std::string version = CURSORHIST_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef CURSORHIST_GIT_COMMIT
  const std::string commit = CURSORHIST_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return std::string(PROGRAM_NAME) + " " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

// Loads, validates and installs the observer. Warnings go to stderr when requested.
common::Result<config::Config> prepare_config(const bool report_warnings) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  const auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    return common::Result<config::Config>::failure(warnings.error());
  }
  for (const auto &warning : warnings.value()) {
    if (!report_warnings) {
      break;
    }
    std::cerr << "[WARN] " << warning << "\n";
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  return cfg;
}

bool parse_positive(const std::string &text, std::size_t &out) {
  if (text.empty()) {
    return false;
  }
  std::size_t value = 0;
  for (const char ch : text) {
    if (ch < '0' || ch > '9') {
      return false;
    }
    value = value * 10 + static_cast<std::size_t>(ch - '0');
    if (value > 1000000) {
      return false;
    }
  }
  if (value == 0) {
    return false;
  }
  out = value;
  return true;
}

attribution::AttributionMap load_attribution(const config::Config &cfg) {
  if (!cfg.attribution.enabled) {
    return {};
  }
  auto loaded = attribution::load_attribution_map(cfg.attribution.db_path);
  if (!loaded.ok()) {
    observability::record_error("attribution", loaded.error());
    return {};
  }
  return std::move(loaded.value());
}

int run_index(const std::vector<std::string> &args) {
  if (args.size() > 2) {
    std::cerr << "usage: " << PROGRAM_NAME << " index [projects_dir] [cache_file]\n";
    return 1;
  }
  auto cfg = prepare_config(args.empty());
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  const std::filesystem::path projects_dir =
      args.size() > 0 ? common::expand_path(args[0]) : cfg.value().projects_dir;
  const std::filesystem::path cache_file =
      args.size() > 1 ? common::expand_path(args[1]) : cfg.value().cache_file;

  const auto indexed =
      index::build_index(projects_dir, cache_file, load_attribution(cfg.value()),
                         paths::PathResolverOptions{.windows_drives =
                                                        cfg.value().paths.windows_drives});
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  if (!indexed.ok()) {
    std::cerr << indexed.error() << "\n";
    return 1;
  }
  std::cerr << "Indexed " << indexed.value() << " sessions.\n";
  return 0;
}

int run_preview(const std::vector<std::string> &args) {
  if (args.empty() || args.size() > 2) {
    std::cerr << "usage: " << PROGRAM_NAME << " preview <transcript> [limit]\n";
    return 1;
  }
  auto cfg = prepare_config(false);
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  std::size_t limit = static_cast<std::size_t>(cfg.value().preview.limit);
  if (args.size() > 1 && !parse_positive(args[1], limit)) {
    std::cerr << "invalid preview limit: " << args[1] << "\n";
    return 1;
  }
  transcript::preview_file(common::expand_path(args[0]), limit, std::cout);
  return 0;
}

} // namespace

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  cursor-history" << RESET << DIM
            << "  Index and preview Cursor agent sessions." << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << PROGRAM_NAME << " [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  COMMANDS" << RESET << "\n";
  std::cout << "  " << GREEN << "index" << RESET << " [projects_dir] [cache_file]" << DIM
            << "  Write the session index" << RESET << "\n";
  std::cout << "  " << GREEN << "preview" << RESET << " <transcript> [limit]" << DIM
            << "        Print a conversation excerpt" << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM
            << "                            Show the config file location" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM
            << "                                Show version" << RESET << "\n";
  std::cout << "\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "index") {
    return run_index(args);
  }
  if (subcommand == "preview" || subcommand == "--preview") {
    return run_preview(args);
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace cursorhist::cli
