#include "mfg/derivation.h"

#include "mfg/log.h"
#include "mfg/override_policy.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>

namespace mfg {

namespace {
std::string to_lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

// JavaScript-style rounding (half up), kept so existing avatars derive the same
// slider values.
double round_half_up(double value) {
  return std::floor(value + 0.5);
}

bool label_matches(const std::string& label, const std::vector<std::string>& keywords) {
  return std::any_of(keywords.begin(), keywords.end(),
                     [&label](const std::string& k) { return label.find(k) != std::string::npos; });
}

std::optional<double> resolve_target(const std::vector<TargetRef>& chain,
                                     MorphCategory category,
                                     const DerivationContext& ctx) {
  for (const auto& ref : chain) {
    switch (ref.kind) {
      case TargetRef::Kind::Metric: {
        auto it = ctx.category_metrics.find(category);
        if (it == ctx.category_metrics.end()) break;
        if (auto v = it->second.get(ref.metric)) return v;
        break;
      }
      case TargetRef::Kind::Signal:
        return ctx.signals[ref.signal];
      case TargetRef::Kind::CategoryBase: {
        auto it = ctx.category_base.find(category);
        if (it != ctx.category_base.end()) return it->second;
        break;
      }
    }
  }
  return std::nullopt;
}

double gender_bias(Gender gender, const DerivationTables& tables) {
  switch (gender) {
    case Gender::Male: return tables.male_bias;
    case Gender::Female: return tables.female_bias;
    case Gender::Unspecified: break;
  }
  return 0.0;
}

std::optional<double> lookup(const std::map<std::string, std::optional<double>>& normalized, const char* key) {
  auto it = normalized.find(key);
  if (it == normalized.end()) return std::nullopt;
  return it->second;
}

std::optional<double> first_of(std::initializer_list<std::optional<double>> values) {
  for (const auto& v : values) {
    if (v) return v;
  }
  return std::nullopt;
}
} // namespace

std::optional<double> resolve_body_shape(const std::optional<std::string>& selector) {
  if (!selector || selector->empty()) return std::nullopt;
  const std::string lowered = to_lower(*selector);
  const auto pos = lowered.find("shape_");
  if (pos == std::string::npos || pos + 6 >= lowered.size()) return std::nullopt;
  const char digit = lowered[pos + 6];
  if (!std::isdigit(static_cast<unsigned char>(digit))) return std::nullopt;
  const int index = digit - '0';
  if (index < 1) return std::nullopt;
  return clamp01((index - 1) / 4.0);
}

std::optional<double> resolve_athletic_level(const std::optional<std::string>& level,
                                             const DerivationTables& tables) {
  if (!level || level->empty()) return std::nullopt;
  auto it = tables.athletic_levels.find(to_lower(*level));
  if (it == tables.athletic_levels.end()) return std::nullopt;
  return it->second;
}

std::map<std::string, std::optional<double>> normalize_measurements(const MeasurementMap& measurements,
                                                                    std::optional<double> height,
                                                                    const DerivationTables& tables) {
  std::map<std::string, std::optional<double>> out;
  for (const auto& [name, descriptor] : tables.descriptors) {
    std::optional<double> normalized;
    for (const auto& key : descriptor.keys) {
      const auto raw = find_measurement(measurements, key);
      if (!raw) continue;
      normalized = normalize_ratio(*raw, height, descriptor.base_ratio, descriptor.spread, descriptor.range);
      if (normalized) break;
    }
    out[name] = normalized;
  }
  return out;
}

DerivationContext build_derivation_context(const MeasurementMap& measurements,
                                           const MeasurementSources& sources,
                                           const DerivationTables& tables) {
  using S = Signal;
  DerivationContext ctx;
  auto& sig = ctx.signals;

  const auto height = find_measurement(measurements, "height");
  const auto weight = find_measurement(measurements, "weight");

  sig[S::Height] = normalize_range(height, tables.height_range.min, tables.height_range.max).value_or(0.5);
  sig[S::Weight] = normalize_range(weight, tables.weight_range.min, tables.weight_range.max).value_or(0.5);

  std::optional<double> bmi;
  if (height && weight && *height > 0.0 && *weight > 0.0) {
    const double meters = *height / 100.0;
    bmi = *weight / (meters * meters);
  }
  sig[S::Mass] = normalize_range(bmi, tables.bmi_range.min, tables.bmi_range.max).value_or(sig[S::Weight]);
  sig[S::Lean] = 1.0 - sig[S::Mass];

  const std::optional<std::string> shape_selector =
      sources.quick_mode ? sources.quick_mode->body_shape : std::nullopt;
  const std::optional<std::string> athletic_selector =
      sources.quick_mode ? sources.quick_mode->athletic_level : std::nullopt;

  std::optional<double> shape = resolve_body_shape(shape_selector);
  if (!shape) {
    const auto raw_hip = first_of({find_measurement(measurements, "lowhip"), find_measurement(measurements, "hip")});
    const auto raw_waist = find_measurement(measurements, "waist");
    if (raw_hip && raw_waist) {
      shape = normalize_range(*raw_hip - *raw_waist, tables.hip_waist_spread_range.min,
                              tables.hip_waist_spread_range.max);
    }
  }
  sig[S::Shape] = shape.value_or(sig[S::Mass]);
  sig[S::Athletic] =
      resolve_athletic_level(athletic_selector, tables).value_or(clamp01(sig[S::Lean] * 0.6 + 0.2));

  const auto n = normalize_measurements(measurements, height, tables);
  const double height_n = sig[S::Height];
  const double lean = sig[S::Lean];
  const double mass = sig[S::Mass];

  sig[S::Chest] = lookup(n, "chest").value_or(0.5);
  sig[S::Underchest] = lookup(n, "underchest").value_or(sig[S::Chest]);
  sig[S::Waist] = lookup(n, "waist").value_or(0.5);
  sig[S::Hip] = lookup(n, "lowhip").value_or(sig[S::Waist]);
  sig[S::HighHip] = lookup(n, "highhip").value_or(sig[S::Hip]);
  sig[S::Shoulder] = lookup(n, "shoulder").value_or(sig[S::Chest]);
  sig[S::ArmGirth] = first_of({lookup(n, "bicep"), lookup(n, "forearm"), lookup(n, "wrist")}).value_or(0.5);
  sig[S::Forearm] = lookup(n, "forearm").value_or(sig[S::ArmGirth]);
  sig[S::Wrist] = lookup(n, "wrist").value_or(sig[S::ArmGirth]);
  sig[S::ArmLength] = lookup(n, "shouldertowrist").value_or(clamp01(height_n * 0.7 + lean * 0.1));
  sig[S::HandLength] = lookup(n, "handlength").value_or(sig[S::ArmLength]);
  sig[S::HandWidth] = lookup(n, "handbreadth").value_or(sig[S::HandLength]);
  sig[S::LegLength] = lookup(n, "inseam").value_or(clamp01(height_n * 0.8));
  sig[S::Thigh] = first_of({lookup(n, "highthigh"), lookup(n, "midthigh")}).value_or(sig[S::Hip]);
  sig[S::MidThigh] = lookup(n, "midthigh").value_or(sig[S::Thigh]);
  sig[S::Knee] = lookup(n, "knee").value_or(sig[S::MidThigh]);
  sig[S::Calf] = lookup(n, "calf").value_or(sig[S::Knee]);
  sig[S::Ankle] = lookup(n, "ankle").value_or(sig[S::Calf]);
  sig[S::FootLength] = lookup(n, "footlength").value_or(sig[S::LegLength]);
  sig[S::FootWidth] = lookup(n, "footbreadth").value_or(sig[S::FootLength]);
  sig[S::Neck] = lookup(n, "neck").value_or(sig[S::Shoulder]);
  sig[S::Head] = lookup(n, "head").value_or(clamp01(0.5 + (0.5 - height_n) * 0.2));

  const double chest = sig[S::Chest];
  const double waist = sig[S::Waist];
  const double hip = sig[S::Hip];
  const double body_shape = sig[S::Shape];
  sig[S::TorsoWidth] = clamp01((chest * 2.0 + waist + hip) / 4.0);
  sig[S::TorsoLength] = clamp01(height_n * 0.55 + (1.0 - sig[S::LegLength]) * 0.45);
  sig[S::BellyProminence] = clamp01(waist * 0.6 + mass * 0.3 + body_shape * 0.2);
  sig[S::GluteProminence] = clamp01(hip * 0.6 + body_shape * 0.3 + mass * 0.2);
  sig[S::UpperVsLower] = clamp01(0.5 + (chest - hip) * 0.4);
  sig[S::InnerVsOuter] = clamp01(0.5 + (hip - waist) * 0.4);
  sig[S::FrontVsBack] = clamp01(0.5 + (sig[S::BellyProminence] - lean) * 0.4);

  for (const auto& [category, terms] : tables.category_weights) {
    ctx.category_base[category] = combine_weighted(0.5, terms, sig);
  }
  for (const auto& [category, sources_for_fields] : tables.category_metrics) {
    CategoryMetrics metrics;
    for (const auto& [field, signal] : sources_for_fields) {
      metrics.set(field, sig[signal]);
    }
    ctx.category_metrics[category] = metrics;
  }
  return ctx;
}

double combine_weighted(double base, const std::vector<WeightTerm>& terms, const BodySignals& signals) {
  double result = base;
  for (const auto& term : terms) {
    result += (signals[term.signal] - 0.5) * term.weight;
  }
  return clamp01(result);
}

double adjust_intensity(std::string_view label,
                        MorphCategory category,
                        const DerivationContext& ctx,
                        const DerivationTables& tables,
                        Gender gender) {
  auto base_it = ctx.category_base.find(category);
  double intensity = (base_it != ctx.category_base.end() ? base_it->second : 0.5) + gender_bias(gender, tables);

  const std::string lowered = to_lower(label);
  for (const auto& rule : tables.rules) {
    if (!label_matches(lowered, rule.keywords)) continue;
    const auto target = resolve_target(rule.target, category, ctx);
    if (!target) continue;
    const double pull = rule.invert ? 1.0 - *target : *target;
    intensity = clamp01(intensity + (pull - 0.5) * rule.weight);
  }
  return intensity;
}

uint64_t jitter_seed(int morph_id, double mass, double shape) {
  const int64_t seed = static_cast<int64_t>(morph_id) * 13 +
                       static_cast<int64_t>(round_half_up(mass * 100.0)) * 7 +
                       static_cast<int64_t>(round_half_up(shape * 100.0)) * 17;
  return static_cast<uint64_t>(seed);
}

double seeded_unit(uint64_t seed) {
  // splitmix64 finalizer; the top 53 bits become a double in [0, 1).
  uint64_t z = seed + 0x9E3779B97F4A7C15ULL;
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  z ^= z >> 31;
  return static_cast<double>(z >> 11) * (1.0 / 9007199254740992.0);
}

int derive_morph_value(const MorphAttribute& attr,
                       const DerivationContext& ctx,
                       const DerivationTables& tables,
                       Gender gender) {
  double intensity = adjust_intensity(attr.label_name, attr.category, ctx, tables, gender);

  const double noise = seeded_unit(jitter_seed(attr.morph_id, ctx.signals[Signal::Mass], ctx.signals[Signal::Shape]));
  intensity = clamp01(intensity + (noise - 0.5) * tables.jitter_amplitude);

  const int slider = static_cast<int>(round_half_up(intensity * 100.0));
  return std::clamp(slider, 0, 100);
}

MorphCatalog derive_morph_targets(const MorphCatalog& catalog,
                                  const MeasurementSources& sources,
                                  const DeriveOptions& options,
                                  const DerivationTables& tables) {
  if (catalog.empty()) return {};

  const auto measurements = collect_measurements(sources);
  if (measurements.empty()) {
    log::debug("derive: no measurements, catalog unchanged");
    return catalog;
  }

  const auto ctx = build_derivation_context(measurements, sources, tables);

  MorphCatalog out;
  out.reserve(catalog.size());
  size_t preserved = 0;
  for (const auto& attr : catalog) {
    if (is_manually_set(attr)) {
      ++preserved;
      out.push_back(attr);
      continue;
    }
    out.push_back(apply_derived_value(attr, derive_morph_value(attr, ctx, tables, options.gender)));
  }

  log::info("derive: " + std::to_string(out.size() - preserved) + " morphs derived, " +
            std::to_string(preserved) + " user edits kept (" + std::to_string(measurements.size()) +
            " measurements, gender " + to_string(options.gender) + ")");
  return out;
}

} // namespace mfg
