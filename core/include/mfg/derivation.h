#pragma once

#include "mfg/measurements.h"
#include "mfg/morph_catalog.h"
#include "mfg/normalize.h"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mfg {

enum class Gender { Unspecified, Male, Female };

const char* to_string(Gender gender);
Gender parse_gender(std::string_view name);

// Normalized [0, 1] body signals computed once per derivation pass.
enum class Signal {
  Height,
  Weight,
  Mass,
  Lean,
  Shape,
  Athletic,
  Shoulder,
  Chest,
  Underchest,
  Waist,
  Hip,
  HighHip,
  ArmGirth,
  Forearm,
  Wrist,
  ArmLength,
  HandLength,
  HandWidth,
  LegLength,
  Thigh,
  MidThigh,
  Knee,
  Calf,
  Ankle,
  FootLength,
  FootWidth,
  Neck,
  Head,
  TorsoWidth,
  TorsoLength,
  BellyProminence,
  GluteProminence,
  UpperVsLower,
  InnerVsOuter,
  FrontVsBack,
  Count
};

constexpr size_t kSignalCount = static_cast<size_t>(Signal::Count);

const char* to_string(Signal signal);
std::optional<Signal> parse_signal(std::string_view name);

enum class MetricField { Width, Height, Length, Depth, Girth, Mass, Tone, Upper, Lower, Inner, Outer, Front, Back, Count };

constexpr size_t kMetricFieldCount = static_cast<size_t>(MetricField::Count);

const char* to_string(MetricField field);
std::optional<MetricField> parse_metric_field(std::string_view name);

struct BodySignals {
  std::array<double, kSignalCount> values{};

  double operator[](Signal s) const { return values[static_cast<size_t>(s)]; }
  double& operator[](Signal s) { return values[static_cast<size_t>(s)]; }
};

struct CategoryMetrics {
  std::array<std::optional<double>, kMetricFieldCount> fields{};

  std::optional<double> get(MetricField f) const { return fields[static_cast<size_t>(f)]; }
  void set(MetricField f, double v) { fields[static_cast<size_t>(f)] = v; }
};

struct MeasurementDescriptor {
  std::vector<std::string> keys;
  std::optional<double> base_ratio;
  std::optional<double> spread;
  std::optional<AbsoluteRange> range;
};

struct WeightTerm {
  Signal signal = Signal::Mass;
  double weight = 0.0;
};

// One source in a target fallback chain: a category metric, a body signal, or
// the category's base intensity.
struct TargetRef {
  enum class Kind { Metric, Signal, CategoryBase };
  Kind kind = Kind::CategoryBase;
  MetricField metric = MetricField::Width;
  Signal signal = Signal::Mass;

  static TargetRef of(MetricField f) { return {Kind::Metric, f, Signal::Mass}; }
  static TargetRef of(Signal s) { return {Kind::Signal, MetricField::Width, s}; }
  static TargetRef category_base() { return {Kind::CategoryBase, MetricField::Width, Signal::Mass}; }
};

// Matches when any keyword is a substring of the lower-cased label, then pulls
// the intensity toward the first available target:
//   intensity = clamp01(intensity + (target - 0.5) * weight)
// with target replaced by 1 - target when invert is set.
struct AdjustmentRule {
  std::vector<std::string> keywords;
  std::vector<TargetRef> target;
  double weight = 0.0;
  bool invert = false;
};

struct DerivationTables {
  AbsoluteRange height_range{150.0, 200.0};
  AbsoluteRange weight_range{45.0, 120.0};
  AbsoluteRange bmi_range{19.0, 32.0};
  AbsoluteRange hip_waist_spread_range{-10.0, 25.0};
  std::map<std::string, double> athletic_levels;
  std::vector<std::pair<std::string, MeasurementDescriptor>> descriptors;
  std::map<MorphCategory, std::vector<WeightTerm>> category_weights;
  std::map<MorphCategory, std::vector<std::pair<MetricField, Signal>>> category_metrics;
  std::vector<AdjustmentRule> rules;
  double male_bias = 0.02;
  double female_bias = -0.01;
  double jitter_amplitude = 0.08;
};

const DerivationTables& default_derivation_tables();

struct DeriveOptions {
  Gender gender = Gender::Unspecified;
};

struct DerivationContext {
  BodySignals signals;
  std::map<MorphCategory, double> category_base;
  std::map<MorphCategory, CategoryMetrics> category_metrics;
};

std::optional<double> resolve_body_shape(const std::optional<std::string>& selector);
std::optional<double> resolve_athletic_level(const std::optional<std::string>& level,
                                             const DerivationTables& tables);

std::map<std::string, std::optional<double>> normalize_measurements(const MeasurementMap& measurements,
                                                                    std::optional<double> height,
                                                                    const DerivationTables& tables);

DerivationContext build_derivation_context(const MeasurementMap& measurements,
                                           const MeasurementSources& sources,
                                           const DerivationTables& tables);

double combine_weighted(double base, const std::vector<WeightTerm>& terms, const BodySignals& signals);

// Keyword and positional pipeline for one parameter, before jitter.
double adjust_intensity(std::string_view label,
                        MorphCategory category,
                        const DerivationContext& ctx,
                        const DerivationTables& tables,
                        Gender gender);

uint64_t jitter_seed(int morph_id, double mass, double shape);
double seeded_unit(uint64_t seed);

int derive_morph_value(const MorphAttribute& attr,
                       const DerivationContext& ctx,
                       const DerivationTables& tables,
                       Gender gender);

MorphCatalog derive_morph_targets(const MorphCatalog& catalog,
                                  const MeasurementSources& sources,
                                  const DeriveOptions& options = {},
                                  const DerivationTables& tables = default_derivation_tables());

} // namespace mfg
