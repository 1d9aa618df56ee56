#include "mfg/anthro.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <utility>

namespace mfg {

namespace {
double round1(double value) {
  return std::floor(value * 10.0 + 0.5) / 10.0;
}

double athletic_muscle_delta(AthleticLevel level) {
  switch (level) {
    case AthleticLevel::Low: return -1.0;
    case AthleticLevel::High: return 1.5;
    case AthleticLevel::Medium: break;
  }
  return 0.0;
}

// Waist-to-height ratio around 0.48 maps onto a +/-1.5 cm softness term that
// widens or narrows the soft volumes.
double softness_delta(std::optional<double> waist, std::optional<double> height) {
  if (!waist || !height || *waist == 0.0 || *height == 0.0) return 0.0;
  const double whtr = *waist / *height;
  return std::clamp((whtr - 0.48) * 20.0, -1.5, 1.5);
}

struct RatioEntry {
  const char* key;
  double ratio;
  bool girth;
};

constexpr std::array<RatioEntry, 21> kHeightRatios = {{
    {"shoulder", 0.235, false},
    {"chest", 0.51, true},
    {"underchest", 0.49, true},
    {"waist", 0.44, true},
    {"highHip", 0.46, true},
    {"lowHip", 0.50, true},
    {"inseam", 0.45, false},
    {"highThigh", 0.30, true},
    {"midThigh", 0.265, true},
    {"knee", 0.185, true},
    {"calf", 0.167, true},
    {"ankle", 0.102, true},
    {"footLength", 0.152, false},
    {"footBreadth", 0.062, true},
    {"bicep", 0.165, true},
    {"forearm", 0.139, true},
    {"wrist", 0.092, true},
    {"shoulderToWrist", 0.31, false},
    {"handLength", 0.108, false},
    {"handBreadth", 0.047, true},
    {"neck", 0.175, true},
}};

std::string lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}
} // namespace

std::optional<Sex> parse_sex(std::string_view name) {
  const auto key = lower(name);
  if (key == "male" || key == "m") return Sex::Male;
  if (key == "female" || key == "f") return Sex::Female;
  return std::nullopt;
}

std::optional<AthleticLevel> parse_athletic_level(std::string_view name) {
  const auto key = lower(name);
  if (key == "low") return AthleticLevel::Low;
  if (key == "medium") return AthleticLevel::Medium;
  if (key == "high") return AthleticLevel::High;
  return std::nullopt;
}

EstimatedMeasurements estimate_missing_measurements(Sex sex,
                                                    const KnownMeasurements& known,
                                                    AthleticLevel athletic) {
  const bool male = sex == Sex::Male;
  const double muscle = athletic_muscle_delta(athletic);
  const double soft = softness_delta(known.waist, known.height);

  EstimatedMeasurements out;

  if (known.height) {
    const double h = *known.height;
    out["inseam"] = (male ? 0.45 : 0.44) * h;
    out["shoulderToWrist"] = 0.31 * h;
    out["handLength"] = 0.108 * h;
    out["handBreadth"] = 0.44 * out["handLength"];
    out["footLength"] = 0.152 * h;
    out["footBreadth"] = 0.41 * out["footLength"];
  }

  if (known.low_hip) {
    const double hip = *known.low_hip;
    out["highHip"] = 0.92 * hip + soft;
    const double high_thigh = (male ? 0.60 : 0.58) * hip + soft;
    out["highThigh"] = high_thigh;
    out["midThigh"] = 0.90 * high_thigh + soft * 0.5;
    out["knee"] = 0.70 * out["midThigh"] + soft * 0.2;
    out["calf"] = 0.90 * out["knee"] + muscle;
    out["ankle"] = 0.60 * out["calf"] - soft * 0.2;
  }

  if (known.chest) {
    const double chest = *known.chest;
    out["neck"] = (male ? 0.34 : 0.31) * chest + muscle * 0.5;
    out["shoulder"] = (male ? 0.46 : 0.42) * chest + muscle * 0.5;
    const double bicep = (male ? 0.32 : 0.29) * chest + muscle;
    out["bicep"] = bicep;
    out["forearm"] = 0.85 * bicep + muscle * 0.5;
    out["wrist"] = 0.65 * out["forearm"] - soft * 0.2;
    if (!known.underchest) {
      out["underchest"] = male ? chest - 3.0 : chest - 7.0;
    }
  }

  if (known.height) {
    const double base = male ? 56.0 : 54.0;
    const double ref = male ? 170.0 : 165.0;
    out["head"] = base + 0.1 * (*known.height - ref);
  }

  for (auto& kv : out) {
    kv.second = round1(kv.second);
  }
  return out;
}

EstimatedMeasurements derive_missing_measurements(const EstimatedMeasurements& input,
                                                  std::optional<double> height,
                                                  std::optional<double> weight) {
  EstimatedMeasurements out;
  for (const auto& kv : input) {
    if (std::isfinite(kv.second)) out.emplace(kv.first, kv.second);
  }
  if (!height || !std::isfinite(*height) || *height == 0.0) return out;

  const double h = *height;
  double bmi_adjust = 0.0;
  if (weight && std::isfinite(*weight) && *weight != 0.0) {
    const double meters = h / 100.0;
    bmi_adjust = std::clamp((*weight / (meters * meters) - 22.0) * 0.007, -0.05, 0.07);
  }

  for (const auto& entry : kHeightRatios) {
    if (out.count(entry.key)) continue;
    double value = h * entry.ratio;
    if (entry.girth) value *= 1.0 + bmi_adjust;
    out[entry.key] = round1(value);
  }
  return out;
}

MeasurementRecord to_measurement_record(const EstimatedMeasurements& values) {
  MeasurementRecord record = MeasurementRecord::object();
  for (const auto& kv : values) {
    record[kv.first] = kv.second;
  }
  return record;
}

} // namespace mfg
