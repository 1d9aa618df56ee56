#include "mfg/morph_catalog.h"

#include "mfg/log.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>

namespace mfg {

namespace {
using json = nlohmann::json;

constexpr std::array<std::pair<MorphCategory, const char*>, 12> kCategoryNames = {{
    {MorphCategory::Waist, "Waist"},
    {MorphCategory::Hips, "Hips"},
    {MorphCategory::Arms, "Arms"},
    {MorphCategory::Hand, "Hand"},
    {MorphCategory::Chest, "Chest"},
    {MorphCategory::Neck, "Neck"},
    {MorphCategory::Head, "Head"},
    {MorphCategory::Legs, "Legs"},
    {MorphCategory::Torso, "Torso"},
    {MorphCategory::Base, "Base"},
    {MorphCategory::Face, "Face"},
    {MorphCategory::Other, "Other"},
}};

bool read_attribute(const json& node, size_t index, MorphAttribute& out, std::string& error) {
  if (!node.is_object()) {
    error = "catalog entry " + std::to_string(index) + " is not an object";
    return false;
  }
  if (!node.contains("morphId") || !node["morphId"].is_number_integer()) {
    error = "catalog entry " + std::to_string(index) + " has no integer morphId";
    return false;
  }
  out = {};
  out.morph_id = node["morphId"].get<int>();
  out.label_name = node.value("labelName", "");
  out.morph_name = node.value("morphName", "");
  const auto category_name = node.value("category", "Other");
  const auto category = parse_morph_category(category_name);
  if (!category) {
    log::warn("unknown morph category '" + category_name + "' for morph " + std::to_string(out.morph_id));
  }
  out.category = category.value_or(MorphCategory::Other);
  if (node.contains("value") && node["value"].is_number()) {
    out.value = static_cast<int>(std::clamp(std::floor(node["value"].get<double>() + 0.5), 0.0, 100.0));
  }
  out.min = node.value("min", 0.0);
  out.max = node.value("max", 1.0);
  return true;
}
} // namespace

bool operator==(const MorphAttribute& a, const MorphAttribute& b) {
  return a.morph_id == b.morph_id && a.label_name == b.label_name && a.morph_name == b.morph_name &&
         a.category == b.category && a.value == b.value && a.min == b.min && a.max == b.max;
}

bool operator!=(const MorphAttribute& a, const MorphAttribute& b) {
  return !(a == b);
}

const char* to_string(MorphCategory category) {
  for (const auto& entry : kCategoryNames) {
    if (entry.first == category) return entry.second;
  }
  return "Other";
}

std::optional<MorphCategory> parse_morph_category(std::string_view name) {
  for (const auto& entry : kCategoryNames) {
    if (name == entry.second) return entry.first;
  }
  return std::nullopt;
}

bool parse_morph_catalog(const std::string& json_text, MorphCatalog& out, std::string& error) {
  const auto doc = json::parse(json_text, nullptr, false);
  if (doc.is_discarded()) {
    error = "invalid json";
    return false;
  }
  const auto& list = doc.is_object() && doc.contains("morphs") ? doc["morphs"] : doc;
  if (!list.is_array()) {
    error = "catalog is not an array";
    return false;
  }

  MorphCatalog catalog;
  catalog.reserve(list.size());
  for (size_t i = 0; i < list.size(); ++i) {
    MorphAttribute attr;
    if (!read_attribute(list[i], i, attr, error)) {
      return false;
    }
    catalog.push_back(std::move(attr));
  }
  out = std::move(catalog);
  return true;
}

bool load_morph_catalog(const std::filesystem::path& path, MorphCatalog& out, std::string& error) {
  std::ifstream in(path);
  if (!in) {
    error = "cannot open " + path.string();
    log::warn("morph catalog not found: " + path.string());
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (!parse_morph_catalog(ss.str(), out, error)) {
    log::warn("morph catalog invalid: " + path.string() + ": " + error);
    return false;
  }
  log::info("loaded " + std::to_string(out.size()) + " morphs from " + path.string());
  return true;
}

json morph_catalog_to_json(const MorphCatalog& catalog) {
  json list = json::array();
  for (const auto& attr : catalog) {
    json node;
    node["morphId"] = attr.morph_id;
    node["labelName"] = attr.label_name;
    node["morphName"] = attr.morph_name;
    node["category"] = to_string(attr.category);
    node["value"] = attr.value;
    node["min"] = attr.min;
    node["max"] = attr.max;
    list.push_back(std::move(node));
  }
  return list;
}

bool save_morph_catalog(const std::filesystem::path& path, const MorphCatalog& catalog, std::string& error) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if (!out) {
    error = "cannot write " + path.string();
    return false;
  }
  out << morph_catalog_to_json(catalog).dump(2) << "\n";
  return true;
}

void reset_morph_catalog(MorphCatalog& catalog) {
  for (auto& attr : catalog) {
    attr.value = kNeutralMorphValue;
  }
}

MorphAttribute* find_morph(MorphCatalog& catalog, int morph_id) {
  auto it = std::find_if(catalog.begin(), catalog.end(),
                         [morph_id](const MorphAttribute& m) { return m.morph_id == morph_id; });
  return it == catalog.end() ? nullptr : &*it;
}

const MorphAttribute* find_morph(const MorphCatalog& catalog, int morph_id) {
  auto it = std::find_if(catalog.begin(), catalog.end(),
                         [morph_id](const MorphAttribute& m) { return m.morph_id == morph_id; });
  return it == catalog.end() ? nullptr : &*it;
}

} // namespace mfg
