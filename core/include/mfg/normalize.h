#pragma once

#include <optional>

namespace mfg {

struct AbsoluteRange {
  double min = 0.0;
  double max = 0.0;
};

constexpr double kDefaultRatioSpread = 0.25;

double clamp01(double value);

// Linear map of value into [min, max], clamped to [0, 1]. Returns nullopt for a
// missing or non-finite value and for max <= min.
std::optional<double> normalize_range(std::optional<double> value, double min, double max);

// Height-relative intensity in [0, 1]. The ratio window
// [base_ratio * (1 - spread), base_ratio * (1 + spread)] is used when base_ratio
// is set and height is positive; otherwise the absolute range, if any.
std::optional<double> normalize_ratio(double value,
                                      std::optional<double> height,
                                      std::optional<double> base_ratio,
                                      std::optional<double> spread = std::nullopt,
                                      std::optional<AbsoluteRange> absolute_range = std::nullopt);

} // namespace mfg
