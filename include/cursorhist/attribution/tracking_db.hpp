#pragma once

#include "cursorhist/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace cursorhist::attribution {

struct Attribution {
  std::string model;
  std::uint64_t edits = 0;
};

/// Session id -> model with the most code edits, plus the edit total across models.
using AttributionMap = std::unordered_map<std::string, Attribution>;

/// Reads Cursor's AI tracking database (ai_code_hashes table) read-only.
/// A missing database yields an empty map; a database that cannot be opened or
/// queried yields a failure.
[[nodiscard]] common::Result<AttributionMap>
load_attribution_map(const std::filesystem::path &db_path);

} // namespace cursorhist::attribution
