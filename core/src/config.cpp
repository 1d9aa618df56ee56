#include "mfg/config.h"

#include "mfg/log.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <vector>

#if MFG_ENABLE_DATA_JSON
#include <nlohmann/json.hpp>
#endif

#if MFG_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace mfg {

namespace {
struct DescriptorFields {
  std::optional<double> base_ratio;
  std::optional<double> spread;
  std::optional<double> min;
  std::optional<double> max;
};

struct ConfigFields {
  std::optional<int> debounce_ms;
  std::optional<double> male_bias;
  std::optional<double> female_bias;
  std::optional<double> jitter_amplitude;
  std::map<std::string, double> athletic_levels;
  std::map<std::string, DescriptorFields> descriptors;
  std::map<MorphCategory, std::vector<WeightTerm>> category_weights;
};

bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

void add_weight_term(ConfigFields& fields, const std::string& category_name, const std::string& signal_name,
                     double weight) {
  const auto category = parse_morph_category(category_name);
  if (!category) {
    log::warn("config: unknown morph category '" + category_name + "'");
    return;
  }
  const auto signal = parse_signal(signal_name);
  if (!signal) {
    log::warn("config: unknown signal '" + signal_name + "' in " + category_name);
    return;
  }
  fields.category_weights[*category].push_back({*signal, weight});
}

void apply_descriptor(DerivationTables& tables, const std::string& key, const DescriptorFields& fields) {
  auto it = std::find_if(tables.descriptors.begin(), tables.descriptors.end(),
                         [&key](const auto& entry) { return entry.first == key; });
  if (it == tables.descriptors.end()) {
    tables.descriptors.push_back({key, MeasurementDescriptor{{key}, std::nullopt, std::nullopt, std::nullopt}});
    it = std::prev(tables.descriptors.end());
  }
  auto& descriptor = it->second;
  if (fields.base_ratio) descriptor.base_ratio = fields.base_ratio;
  if (fields.spread) descriptor.spread = fields.spread;
  if (fields.min || fields.max) {
    AbsoluteRange range = descriptor.range.value_or(AbsoluteRange{});
    if (fields.min) range.min = *fields.min;
    if (fields.max) range.max = *fields.max;
    if (!(range.max > range.min)) {
      log::warn("config: degenerate range for '" + key + "'; measurement will not normalize absolutely");
    }
    descriptor.range = range;
  }
}

void apply_fields(MorphConfig& cfg, const ConfigFields& fields) {
  if (fields.debounce_ms.has_value() && fields.debounce_ms.value() >= 0) {
    cfg.debounce = std::chrono::milliseconds(fields.debounce_ms.value());
  }
  if (fields.male_bias.has_value()) cfg.tables.male_bias = fields.male_bias.value();
  if (fields.female_bias.has_value()) cfg.tables.female_bias = fields.female_bias.value();
  if (fields.jitter_amplitude.has_value()) cfg.tables.jitter_amplitude = fields.jitter_amplitude.value();
  for (const auto& kv : fields.athletic_levels) {
    cfg.tables.athletic_levels[kv.first] = kv.second;
  }
  for (const auto& kv : fields.descriptors) {
    apply_descriptor(cfg.tables, kv.first, kv.second);
  }
  for (const auto& kv : fields.category_weights) {
    cfg.tables.category_weights[kv.first] = kv.second;
  }
}

#if MFG_ENABLE_DATA_JSON
std::optional<double> json_number(const nlohmann::json& node, const char* key) {
  if (node.contains(key) && node[key].is_number()) return node[key].get<double>();
  return std::nullopt;
}

ConfigFields read_json_fields(const nlohmann::json& root) {
  ConfigFields fields;
  if (root.contains("debounce_ms") && root["debounce_ms"].is_number_integer()) {
    fields.debounce_ms = root["debounce_ms"].get<int>();
  }
  if (root.contains("gender_bias") && root["gender_bias"].is_object()) {
    fields.male_bias = json_number(root["gender_bias"], "male");
    fields.female_bias = json_number(root["gender_bias"], "female");
  }
  fields.jitter_amplitude = json_number(root, "jitter_amplitude");
  if (root.contains("athletic_levels") && root["athletic_levels"].is_object()) {
    for (auto it = root["athletic_levels"].begin(); it != root["athletic_levels"].end(); ++it) {
      if (it.value().is_number()) fields.athletic_levels[it.key()] = it.value().get<double>();
    }
  }
  if (root.contains("descriptors") && root["descriptors"].is_object()) {
    for (auto it = root["descriptors"].begin(); it != root["descriptors"].end(); ++it) {
      if (!it.value().is_object()) continue;
      DescriptorFields d;
      d.base_ratio = json_number(it.value(), "base_ratio");
      d.spread = json_number(it.value(), "spread");
      d.min = json_number(it.value(), "min");
      d.max = json_number(it.value(), "max");
      fields.descriptors[it.key()] = d;
    }
  }
  if (root.contains("category_weights") && root["category_weights"].is_object()) {
    for (auto it = root["category_weights"].begin(); it != root["category_weights"].end(); ++it) {
      if (!it.value().is_array()) continue;
      for (const auto& term : it.value()) {
        if (term.is_array() && term.size() == 2 && term[0].is_string() && term[1].is_number()) {
          add_weight_term(fields, it.key(), term[0].get<std::string>(), term[1].get<double>());
        }
      }
    }
  }
  return fields;
}
#endif

#if MFG_ENABLE_DATA_YAML
std::optional<double> yaml_number(const YAML::Node& node, const char* key) {
  if (node[key]) return node[key].as<double>();
  return std::nullopt;
}

ConfigFields read_yaml_fields(const YAML::Node& root) {
  ConfigFields fields;
  if (root["debounce_ms"]) fields.debounce_ms = root["debounce_ms"].as<int>();
  if (root["gender_bias"]) {
    fields.male_bias = yaml_number(root["gender_bias"], "male");
    fields.female_bias = yaml_number(root["gender_bias"], "female");
  }
  fields.jitter_amplitude = yaml_number(root, "jitter_amplitude");
  if (root["athletic_levels"]) {
    for (const auto& pair : root["athletic_levels"]) {
      fields.athletic_levels[pair.first.as<std::string>()] = pair.second.as<double>();
    }
  }
  if (root["descriptors"]) {
    for (const auto& pair : root["descriptors"]) {
      DescriptorFields d;
      d.base_ratio = yaml_number(pair.second, "base_ratio");
      d.spread = yaml_number(pair.second, "spread");
      d.min = yaml_number(pair.second, "min");
      d.max = yaml_number(pair.second, "max");
      fields.descriptors[pair.first.as<std::string>()] = d;
    }
  }
  if (root["category_weights"]) {
    for (const auto& pair : root["category_weights"]) {
      const auto category = pair.first.as<std::string>();
      for (const auto& term : pair.second) {
        if (term.IsSequence() && term.size() == 2) {
          add_weight_term(fields, category, term[0].as<std::string>(), term[1].as<double>());
        }
      }
    }
  }
  return fields;
}
#endif
} // namespace

MorphConfig load_morph_config(const std::filesystem::path& path) {
  MorphConfig cfg;

  if (!file_exists(path)) {
    log::warn(std::string("config not found: ") + path.string());
    return cfg;
  }

  const auto ext = path.extension().string();
  if (ext == ".json") {
#if MFG_ENABLE_DATA_JSON
    std::ifstream in(path);
    const auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      log::warn("config is not valid JSON: " + path.string());
      return cfg;
    }
    const auto& root = j.contains("morph") ? j["morph"] : j;
    apply_fields(cfg, read_json_fields(root));
    log::info("config loaded: " + path.string());
#else
    log::warn("JSON config requested but JSON support is disabled.");
#endif
    return cfg;
  }

  if (ext == ".yaml" || ext == ".yml") {
#if MFG_ENABLE_DATA_YAML
    try {
      YAML::Node doc = YAML::LoadFile(path.string());
      YAML::Node root = doc["morph"] ? doc["morph"] : doc;
      apply_fields(cfg, read_yaml_fields(root));
      log::info("config loaded: " + path.string());
    } catch (const YAML::Exception& e) {
      log::warn("config is not valid YAML: " + path.string() + ": " + e.what());
      return MorphConfig{};
    }
#else
    log::warn("YAML config requested but YAML support is disabled.");
#endif
    return cfg;
  }

  log::warn("Unknown config extension; using defaults.");
  return cfg;
}

} // namespace mfg
