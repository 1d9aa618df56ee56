#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mfg {

enum class MorphCategory { Waist, Hips, Arms, Hand, Chest, Neck, Head, Legs, Torso, Base, Face, Other };

constexpr int kNeutralMorphValue = 50;

struct MorphAttribute {
  int morph_id = 0;
  std::string label_name;
  std::string morph_name;
  MorphCategory category = MorphCategory::Other;
  int value = kNeutralMorphValue;  // percent of [min, max]
  double min = 0.0;
  double max = 1.0;
};

bool operator==(const MorphAttribute& a, const MorphAttribute& b);
bool operator!=(const MorphAttribute& a, const MorphAttribute& b);

using MorphCatalog = std::vector<MorphAttribute>;

const char* to_string(MorphCategory category);
std::optional<MorphCategory> parse_morph_category(std::string_view name);

bool parse_morph_catalog(const std::string& json_text, MorphCatalog& out, std::string& error);
bool load_morph_catalog(const std::filesystem::path& path, MorphCatalog& out, std::string& error);
nlohmann::json morph_catalog_to_json(const MorphCatalog& catalog);
bool save_morph_catalog(const std::filesystem::path& path, const MorphCatalog& catalog, std::string& error);

// Returns every value to neutral. Entries are never removed.
void reset_morph_catalog(MorphCatalog& catalog);

MorphAttribute* find_morph(MorphCatalog& catalog, int morph_id);
const MorphAttribute* find_morph(const MorphCatalog& catalog, int morph_id);

} // namespace mfg
