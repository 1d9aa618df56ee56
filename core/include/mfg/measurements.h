#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mfg {

// Raw measurement record as delivered by the collector layer. Insertion order is
// kept so the first spelling of a key inside one record wins.
using MeasurementRecord = nlohmann::ordered_json;

// Canonical key -> finite value (cm or kg).
using MeasurementMap = std::map<std::string, double>;

struct QuickModeSettings {
  std::optional<std::string> body_shape;
  std::optional<std::string> athletic_level;
  MeasurementRecord measurements = MeasurementRecord::object();
};

struct MeasurementSources {
  std::optional<MeasurementRecord> basic;
  std::optional<MeasurementRecord> body;
  std::optional<QuickModeSettings> quick_mode;
};

// Folds diacritics, drops non-alphanumerics, lowercases and applies the alias
// table. Returns nullopt when nothing is left.
std::optional<std::string> normalize_measurement_key(std::string_view raw_key);

// Numbers pass if finite; strings are trimmed and parsed with ',' or '.' as the
// decimal separator. Anything else yields nullopt.
std::optional<double> coerce_measurement_value(const nlohmann::ordered_json& raw);

// Merges basic, body and quick-mode measurements in that order; the first
// writer of a canonical key wins.
MeasurementMap collect_measurements(const MeasurementSources& sources);

std::optional<double> find_measurement(const MeasurementMap& map, const std::string& key);

// Reads {"basic": {...}, "body": {...}, "quick_mode": {...}} from JSON text.
bool parse_measurement_sources(const std::string& json_text, MeasurementSources& out, std::string& error);

} // namespace mfg
