#include "bench_common.hpp"

#include "cursorhist/index/indexer.hpp"

#include <filesystem>
#include <fstream>
#include <random>

namespace {

std::filesystem::path make_temp_dir() {
  static std::mt19937_64 rng{std::random_device{}()};
  const auto base = std::filesystem::temp_directory_path() /
                    ("cursorhist-index-bench-" + std::to_string(rng()));
  std::filesystem::create_directories(base);
  return base;
}

void populate(const std::filesystem::path &projects, int project_count, int sessions_each) {
  for (int p = 0; p < project_count; ++p) {
    const auto dir = projects / ("home-dev-project" + std::to_string(p)) / "agent-transcripts";
    std::filesystem::create_directories(dir);
    for (int s = 0; s < sessions_each; ++s) {
      std::ofstream out(dir / ("session-" + std::to_string(s) + ".jsonl"));
      for (int line = 0; line < 50; ++line) {
        out << R"({"role":"user","message":{"content":[{"type":"text","text":"question )" << line
            << R"("}]}})" << "\n";
      }
    }
  }
}

} // namespace

void run_index_benchmark() {
  std::cout << "\n=== Indexing ===\n";

  const auto base = make_temp_dir();
  populate(base / "projects", 10, 20);

  cursorhist::bench::run_bench("build_index_200_sessions", 20, [&] {
    const auto built =
        cursorhist::index::build_index(base / "projects", base / "cache" / "sessions.json", {});
    if (!built.ok()) {
      std::cerr << built.error() << "\n";
    }
  });

  std::error_code ec;
  std::filesystem::remove_all(base, ec);
}
