#include "mfg/derivation.h"

namespace mfg {

namespace {
constexpr const char* kSignalNames[kSignalCount] = {
    "height",      "weight",       "mass",        "lean",        "shape",
    "athletic",    "shoulder",     "chest",       "underchest",  "waist",
    "hip",         "high_hip",     "arm_girth",   "forearm",     "wrist",
    "arm_length",  "hand_length",  "hand_width",  "leg_length",  "thigh",
    "mid_thigh",   "knee",         "calf",        "ankle",       "foot_length",
    "foot_width",  "neck",         "head",        "torso_width", "torso_length",
    "belly_prominence", "glute_prominence", "upper_vs_lower", "inner_vs_outer", "front_vs_back",
};

constexpr const char* kMetricNames[kMetricFieldCount] = {
    "width", "height", "length", "depth", "girth", "mass", "tone",
    "upper", "lower", "inner", "outer", "front", "back",
};

MeasurementDescriptor ratio(std::vector<std::string> keys, double base, double spread, double min, double max) {
  return {std::move(keys), base, spread, AbsoluteRange{min, max}};
}

MeasurementDescriptor absolute(std::vector<std::string> keys, double min, double max) {
  return {std::move(keys), std::nullopt, std::nullopt, AbsoluteRange{min, max}};
}

AdjustmentRule rule(std::vector<std::string> keywords, std::vector<TargetRef> target, double weight,
                    bool invert = false) {
  return {std::move(keywords), std::move(target), weight, invert};
}

DerivationTables build_defaults() {
  using M = MetricField;
  using S = Signal;
  const auto m = [](MetricField f) { return TargetRef::of(f); };
  const auto s = [](Signal sig) { return TargetRef::of(sig); };
  const auto base = TargetRef::category_base();

  DerivationTables t;
  t.athletic_levels = {{"low", 0.35}, {"medium", 0.5}, {"high", 0.7}};

  t.descriptors = {
      {"height", absolute({"height"}, 150, 200)},
      {"weight", absolute({"weight"}, 45, 120)},
      {"shoulder", ratio({"shoulder"}, 0.235, 0.25, 35, 52)},
      {"chest", ratio({"chest"}, 0.51, 0.25, 75, 125)},
      {"underchest", ratio({"underchest"}, 0.49, 0.25, 70, 115)},
      {"waist", ratio({"waist"}, 0.44, 0.35, 60, 115)},
      {"highhip", ratio({"highhip"}, 0.46, 0.25, 70, 120)},
      {"lowhip", ratio({"lowhip", "hip"}, 0.5, 0.25, 80, 125)},
      {"inseam", ratio({"inseam"}, 0.45, 0.2, 65, 95)},
      {"highthigh", ratio({"highthigh"}, 0.3, 0.3, 45, 75)},
      {"midthigh", ratio({"midthigh"}, 0.265, 0.3, 40, 70)},
      {"knee", ratio({"knee"}, 0.185, 0.3, 32, 55)},
      {"calf", ratio({"calf"}, 0.167, 0.3, 28, 50)},
      {"ankle", ratio({"ankle"}, 0.102, 0.3, 18, 30)},
      {"bicep", ratio({"bicep"}, 0.165, 0.35, 25, 45)},
      {"forearm", ratio({"forearm"}, 0.139, 0.35, 22, 40)},
      {"wrist", ratio({"wrist"}, 0.092, 0.35, 15, 25)},
      {"shouldertowrist", ratio({"shouldertowrist"}, 0.31, 0.2, 40, 60)},
      {"handlength", ratio({"handlength"}, 0.108, 0.25, 16, 23)},
      {"handbreadth", ratio({"handbreadth"}, 0.047, 0.35, 7, 11)},
      {"footlength", ratio({"footlength"}, 0.152, 0.2, 21, 29)},
      {"footbreadth", ratio({"footbreadth"}, 0.062, 0.3, 8, 12)},
      {"neck", ratio({"neck"}, 0.175, 0.3, 28, 45)},
      {"head", ratio({"head"}, 0.145, 0.2, 53, 62)},
  };

  t.category_weights = {
      {MorphCategory::Waist, {{S::Waist, 0.7}, {S::BellyProminence, 0.4}, {S::Mass, 0.3}, {S::Athletic, -0.2}}},
      {MorphCategory::Hips, {{S::Hip, 0.6}, {S::GluteProminence, 0.4}, {S::Shape, 0.3}, {S::Mass, 0.2}}},
      {MorphCategory::Arms, {{S::ArmGirth, 0.55}, {S::Athletic, 0.35}, {S::Mass, 0.2}, {S::ArmLength, 0.1}}},
      {MorphCategory::Hand, {{S::HandLength, 0.5}, {S::HandWidth, 0.4}, {S::Athletic, 0.1}}},
      {MorphCategory::Chest,
       {{S::Chest, 0.6}, {S::Underchest, 0.2}, {S::Mass, 0.25}, {S::Athletic, 0.25}, {S::Shape, 0.15}}},
      {MorphCategory::Neck, {{S::Neck, 0.6}, {S::Mass, 0.25}, {S::Athletic, 0.2}}},
      {MorphCategory::Head, {{S::Head, 0.7}, {S::Height, 0.2}, {S::Shape, 0.1}}},
      {MorphCategory::Legs,
       {{S::LegLength, 0.4}, {S::Thigh, 0.35}, {S::Calf, 0.25}, {S::Mass, 0.2}, {S::Athletic, 0.25}}},
      {MorphCategory::Torso,
       {{S::TorsoWidth, 0.4}, {S::Chest, 0.3}, {S::Waist, 0.2}, {S::Shape, 0.2}, {S::Mass, 0.2}}},
      {MorphCategory::Base, {{S::Height, 0.3}, {S::Mass, 0.35}, {S::Shape, 0.25}, {S::Athletic, 0.15}}},
  };

  t.category_metrics = {
      {MorphCategory::Waist,
       {{M::Width, S::Waist}, {M::Depth, S::BellyProminence}, {M::Girth, S::Waist}, {M::Mass, S::Mass},
        {M::Tone, S::Lean}, {M::Upper, S::Chest}, {M::Lower, S::Hip}, {M::Inner, S::Waist}, {M::Outer, S::Hip},
        {M::Front, S::BellyProminence}, {M::Back, S::Lean}, {M::Height, S::TorsoLength}}},
      {MorphCategory::Hips,
       {{M::Width, S::Hip}, {M::Depth, S::GluteProminence}, {M::Girth, S::Hip}, {M::Mass, S::Mass},
        {M::Tone, S::Lean}, {M::Upper, S::HighHip}, {M::Lower, S::LegLength}, {M::Inner, S::InnerVsOuter},
        {M::Outer, S::Hip}, {M::Front, S::Shape}, {M::Back, S::Lean}, {M::Height, S::LegLength}}},
      {MorphCategory::Arms,
       {{M::Width, S::ArmGirth}, {M::Depth, S::ArmGirth}, {M::Girth, S::ArmGirth}, {M::Mass, S::Mass},
        {M::Tone, S::Athletic}, {M::Upper, S::ArmGirth}, {M::Lower, S::Forearm}, {M::Inner, S::Forearm},
        {M::Outer, S::ArmGirth}, {M::Length, S::ArmLength}, {M::Height, S::ArmLength}}},
      {MorphCategory::Hand,
       {{M::Width, S::HandWidth}, {M::Depth, S::HandWidth}, {M::Girth, S::HandWidth}, {M::Mass, S::Mass},
        {M::Tone, S::Athletic}, {M::Length, S::HandLength}, {M::Height, S::HandLength}}},
      {MorphCategory::Chest,
       {{M::Width, S::Chest}, {M::Depth, S::Chest}, {M::Girth, S::Chest}, {M::Mass, S::Mass},
        {M::Tone, S::Athletic}, {M::Upper, S::Chest}, {M::Lower, S::Underchest}, {M::Inner, S::Chest},
        {M::Outer, S::Shoulder}, {M::Front, S::Chest}, {M::Back, S::Underchest}, {M::Height, S::TorsoLength}}},
      {MorphCategory::Neck,
       {{M::Width, S::Neck}, {M::Girth, S::Neck}, {M::Mass, S::Mass}, {M::Tone, S::Athletic},
        {M::Height, S::Height}}},
      {MorphCategory::Head,
       {{M::Width, S::Head}, {M::Depth, S::Head}, {M::Girth, S::Head}, {M::Mass, S::Mass}, {M::Tone, S::Lean},
        {M::Height, S::Head}}},
      {MorphCategory::Legs,
       {{M::Width, S::Thigh}, {M::Depth, S::Calf}, {M::Girth, S::Thigh}, {M::Mass, S::Mass},
        {M::Tone, S::Athletic}, {M::Upper, S::Thigh}, {M::Lower, S::Calf}, {M::Inner, S::InnerVsOuter},
        {M::Outer, S::Hip}, {M::Front, S::FrontVsBack}, {M::Back, S::Lean}, {M::Length, S::LegLength},
        {M::Height, S::Height}}},
      {MorphCategory::Torso,
       {{M::Width, S::TorsoWidth}, {M::Depth, S::BellyProminence}, {M::Girth, S::TorsoWidth}, {M::Mass, S::Mass},
        {M::Tone, S::Athletic}, {M::Upper, S::Chest}, {M::Lower, S::Waist}, {M::Inner, S::Waist},
        {M::Outer, S::Shoulder}, {M::Front, S::BellyProminence}, {M::Back, S::Lean},
        {M::Length, S::TorsoLength}, {M::Height, S::TorsoLength}}},
      {MorphCategory::Base,
       {{M::Width, S::Height}, {M::Depth, S::Mass}, {M::Girth, S::TorsoWidth}, {M::Mass, S::Mass},
        {M::Tone, S::Athletic}, {M::Height, S::Height}, {M::Length, S::Height}}},
  };

  // Order matters: each rule sees the intensity left by the previous one.
  t.rules = {
      rule({"width", "diameter", "breadth"}, {m(M::Width), m(M::Girth)}, 0.6),
      rule({"thickness"}, {m(M::Girth), m(M::Width)}, 0.55),
      rule({"depth"}, {m(M::Depth), m(M::Mass)}, 0.5),
      rule({"height"}, {m(M::Height), m(M::Length), s(S::Height)}, 0.45),
      rule({"length"}, {m(M::Length), s(S::Height)}, 0.45),
      rule({"size", "volume"}, {m(M::Girth), m(M::Mass)}, 0.5),
      rule({"shape"}, {s(S::Shape)}, 0.35),
      rule({"angle", "rotate"}, {s(S::Shape)}, 0.25),
      rule({"move"}, {s(S::Height)}, 0.2),

      rule({"upper"}, {m(M::Upper), m(M::Front), base}, 0.35),
      rule({"lower"}, {m(M::Lower), m(M::Back), base}, 0.35),
      rule({"inner"}, {m(M::Inner), m(M::Width), base}, 0.3),
      rule({"outer"}, {m(M::Outer), m(M::Width), base}, 0.3),
      rule({"front"}, {m(M::Front), s(S::BellyProminence)}, 0.35),
      rule({"back"}, {m(M::Back), s(S::Lean)}, 0.35, true),
      rule({"left"}, {m(M::Outer), m(M::Width)}, 0.25),
      rule({"right"}, {m(M::Outer), m(M::Width)}, 0.25),

      rule({"muscular", "strength"}, {s(S::Athletic)}, 0.65),
      rule({"athletic", "defined"}, {s(S::Athletic)}, 0.5),
      rule({"tone"}, {m(M::Tone), s(S::Athletic)}, 0.4),
      rule({"fat", "flab", "heavy"}, {s(S::Mass)}, 0.6),
      rule({"preg"}, {s(S::BellyProminence)}, 0.85),
      rule({"bulge"}, {s(S::BellyProminence)}, 0.6),
      rule({"crease", "fold", "love"}, {s(S::BellyProminence)}, 0.45),
      rule({"sag", "droop"}, {s(S::Mass)}, 0.45),
      rule({"perk"}, {s(S::Lean)}, 0.4),
      rule({"flat", "small", "weak", "tiny"}, {s(S::Mass)}, 0.5, true),
      rule({"big", "large", "xl"}, {s(S::Mass)}, 0.55),
      rule({"natural"}, {s(S::Shape)}, 0.2),
      rule({"implant"}, {s(S::Mass)}, 0.5),
  };
  return t;
}
} // namespace

const char* to_string(Signal signal) {
  const auto index = static_cast<size_t>(signal);
  return index < kSignalCount ? kSignalNames[index] : "unknown";
}

std::optional<Signal> parse_signal(std::string_view name) {
  for (size_t i = 0; i < kSignalCount; ++i) {
    if (name == kSignalNames[i]) return static_cast<Signal>(i);
  }
  return std::nullopt;
}

const char* to_string(MetricField field) {
  const auto index = static_cast<size_t>(field);
  return index < kMetricFieldCount ? kMetricNames[index] : "unknown";
}

std::optional<MetricField> parse_metric_field(std::string_view name) {
  for (size_t i = 0; i < kMetricFieldCount; ++i) {
    if (name == kMetricNames[i]) return static_cast<MetricField>(i);
  }
  return std::nullopt;
}

const char* to_string(Gender gender) {
  switch (gender) {
    case Gender::Male: return "male";
    case Gender::Female: return "female";
    case Gender::Unspecified: break;
  }
  return "unspecified";
}

Gender parse_gender(std::string_view name) {
  if (name == "male" || name == "m") return Gender::Male;
  if (name == "female" || name == "f") return Gender::Female;
  return Gender::Unspecified;
}

const DerivationTables& default_derivation_tables() {
  static const DerivationTables kDefaults = build_defaults();
  return kDefaults;
}

} // namespace mfg
