#pragma once

#include "mfg/derivation.h"

#include <chrono>
#include <filesystem>

namespace mfg {

struct MorphConfig {
  std::chrono::milliseconds debounce{50};
  DerivationTables tables = default_derivation_tables();
};

// Reads a .json or .yaml/.yml file with an optional "morph" root node. Fields
// missing from the file keep their defaults.
MorphConfig load_morph_config(const std::filesystem::path& path);

} // namespace mfg
