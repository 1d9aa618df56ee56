#include "mfg/measurements.h"

#include "mfg/log.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <unordered_map>

namespace mfg {

namespace {
using ojson = nlohmann::ordered_json;

// Base letters for U+00C0..U+00FF and U+0100..U+017F after canonical
// decomposition. '-' marks letters without a decomposition; they are dropped.
constexpr std::string_view kLatin1Fold =
    "AAAAAA-CEEEEIIII-NOOOOO--UUUUY--"
    "aaaaaa-ceeeeiiii-nooooo--uuuuy-y";
constexpr std::string_view kLatinExtAFold =
    "AaAaAa" "CcCcCcCc" "Dd" "--" "EeEeEeEeEe" "GgGgGgGg" "Hh" "--"
    "IiIiIiIiI-" "--" "Jj" "Kk-" "LlLlLlLl--" "NnNnNnn--" "OoOoOo--"
    "RrRrRr" "SsSsSsSs" "TtTt--" "UuUuUuUuUuUu" "WwYyY" "ZzZzZzs";

static_assert(kLatin1Fold.size() == 64, "latin-1 fold table");
static_assert(kLatinExtAFold.size() == 128, "latin extended-a fold table");

const std::unordered_map<std::string, std::string>& alias_table() {
  static const std::unordered_map<std::string, std::string> kAliases = {
      {"bustcircumference", "chest"},
      {"chestcircumference", "chest"},
      {"waistscircumference", "waist"},
      {"waistcircumference", "waist"},
      {"hipcircumference", "lowhip"},
      {"lowhipcircumference", "lowhip"},
      {"highhipcircumference", "highhip"},
      {"underbust", "underchest"},
  };
  return kAliases;
}

// Decodes one UTF-8 sequence starting at text[i]; advances i. Malformed input
// yields 0xFFFD.
uint32_t next_code_point(std::string_view text, size_t& i) {
  const auto lead = static_cast<unsigned char>(text[i++]);
  if (lead < 0x80) return lead;
  int extra = 0;
  uint32_t cp = 0;
  if ((lead & 0xE0) == 0xC0) {
    extra = 1;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    extra = 2;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    extra = 3;
    cp = lead & 0x07;
  } else {
    return 0xFFFD;
  }
  for (int n = 0; n < extra; ++n) {
    if (i >= text.size()) return 0xFFFD;
    const auto c = static_cast<unsigned char>(text[i]);
    if ((c & 0xC0) != 0x80) return 0xFFFD;
    cp = (cp << 6) | (c & 0x3F);
    ++i;
  }
  return cp;
}

void append_folded(uint32_t cp, std::string& out) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
    return;
  }
  if (cp == 0x132) {
    out += "IJ";
    return;
  }
  if (cp == 0x133) {
    out += "ij";
    return;
  }
  char base = '-';
  if (cp >= 0xC0 && cp <= 0xFF) {
    base = kLatin1Fold[cp - 0xC0];
  } else if (cp >= 0x100 && cp <= 0x17F) {
    base = kLatinExtAFold[cp - 0x100];
  }
  if (base != '-') {
    out.push_back(base);
  }
}

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  return text;
}

std::optional<double> parse_number_text(std::string_view text) {
  text = trim(text);
  if (!text.empty() && text.front() == '+') text.remove_prefix(1);
  if (text.empty()) return std::nullopt;

  std::string buffer(text);
  size_t separators = 0;
  for (auto& c : buffer) {
    if (c == ',') {
      c = '.';
      ++separators;
    }
  }
  if (separators > 1) return std::nullopt;

  double value = 0.0;
  const char* begin = buffer.data();
  const char* end = buffer.data() + buffer.size();
  const auto result = std::from_chars(begin, end, value, std::chars_format::general);
  if (result.ec != std::errc() || result.ptr != end) return std::nullopt;
  if (!std::isfinite(value)) return std::nullopt;
  return value;
}

void ingest_record(const MeasurementRecord& record, const char* source_name, MeasurementMap& map) {
  if (!record.is_object()) {
    if (!record.is_null()) {
      log::warn(std::string("measurement source is not an object: ") + source_name);
    }
    return;
  }
  for (auto it = record.begin(); it != record.end(); ++it) {
    const auto key = normalize_measurement_key(it.key());
    if (!key) continue;
    if (map.count(*key)) continue;
    const auto value = coerce_measurement_value(it.value());
    if (!value) {
      if (!it.value().is_null()) {
        log::warn(std::string("dropping non-numeric measurement ") + source_name + "." + it.key() + ": " +
                  it.value().dump());
      }
      continue;
    }
    map.emplace(*key, *value);
  }
}
} // namespace

std::optional<std::string> normalize_measurement_key(std::string_view raw_key) {
  std::string folded;
  folded.reserve(raw_key.size());
  size_t i = 0;
  while (i < raw_key.size()) {
    append_folded(next_code_point(raw_key, i), folded);
  }

  std::string normalized;
  normalized.reserve(folded.size());
  for (unsigned char c : folded) {
    if (std::isalnum(c)) {
      normalized.push_back(static_cast<char>(std::tolower(c)));
    }
  }
  if (normalized.empty()) return std::nullopt;

  const auto& aliases = alias_table();
  auto it = aliases.find(normalized);
  if (it != aliases.end()) return it->second;
  return normalized;
}

std::optional<double> coerce_measurement_value(const ojson& raw) {
  if (raw.is_number()) {
    const double value = raw.get<double>();
    if (!std::isfinite(value)) return std::nullopt;
    return value;
  }
  if (raw.is_string()) {
    return parse_number_text(raw.get_ref<const std::string&>());
  }
  return std::nullopt;
}

MeasurementMap collect_measurements(const MeasurementSources& sources) {
  MeasurementMap map;
  if (sources.basic) ingest_record(*sources.basic, "basic", map);
  if (sources.body) ingest_record(*sources.body, "body", map);
  if (sources.quick_mode) ingest_record(sources.quick_mode->measurements, "quick_mode", map);
  return map;
}

std::optional<double> find_measurement(const MeasurementMap& map, const std::string& key) {
  auto it = map.find(key);
  if (it == map.end()) return std::nullopt;
  return it->second;
}

bool parse_measurement_sources(const std::string& json_text, MeasurementSources& out, std::string& error) {
  if (json_text.empty()) {
    error = "empty json";
    return false;
  }
  const auto doc = ojson::parse(json_text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    error = "invalid json";
    return false;
  }

  out = {};
  if (doc.contains("basic")) out.basic = doc["basic"];
  if (doc.contains("body")) out.body = doc["body"];
  if (doc.contains("quick_mode") && doc["quick_mode"].is_object()) {
    const auto& qm = doc["quick_mode"];
    QuickModeSettings settings;
    if (qm.contains("body_shape") && qm["body_shape"].is_string()) {
      settings.body_shape = qm["body_shape"].get<std::string>();
    }
    if (qm.contains("athletic_level") && qm["athletic_level"].is_string()) {
      settings.athletic_level = qm["athletic_level"].get<std::string>();
    }
    if (qm.contains("measurements")) {
      settings.measurements = qm["measurements"];
    }
    out.quick_mode = std::move(settings);
  }
  return true;
}

} // namespace mfg
