#pragma once

#include <string>

namespace cursorhist::config {

struct AttributionConfig {
  std::string db_path = "~/.cursor/ai-tracking/ai-code-tracking.db";
  bool enabled = true;
};

struct PreviewConfig {
  int limit = 20;
};

struct PathsConfig {
#if defined(_WIN32)
  bool windows_drives = true;
#else
  bool windows_drives = false;
#endif
};

struct ObservabilityConfig {
  std::string backend = "log";
  /// Also emit DEBUG lines (per project and per transcript).
  bool verbose = false;
};

struct Config {
  std::string projects_dir = "~/.cursor/projects";
  std::string cache_file = "~/.cache/cursor-history/sessions.json";
  AttributionConfig attribution;
  PreviewConfig preview;
  PathsConfig paths;
  ObservabilityConfig observability;
};

} // namespace cursorhist::config
