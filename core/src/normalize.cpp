#include "mfg/normalize.h"

#include <algorithm>
#include <cmath>

namespace mfg {

double clamp01(double value) {
  return std::max(0.0, std::min(1.0, value));
}

std::optional<double> normalize_range(std::optional<double> value, double min, double max) {
  if (!value.has_value() || !std::isfinite(*value)) return std::nullopt;
  if (!(max > min)) return std::nullopt;
  return clamp01((*value - min) / (max - min));
}

std::optional<double> normalize_ratio(double value,
                                      std::optional<double> height,
                                      std::optional<double> base_ratio,
                                      std::optional<double> spread,
                                      std::optional<AbsoluteRange> absolute_range) {
  if (!std::isfinite(value)) return std::nullopt;

  const bool has_height = height.has_value() && std::isfinite(*height) && *height > 0.0;
  if (base_ratio.has_value() && *base_ratio != 0.0 && has_height) {
    const double ratio = value / *height;
    const double tolerance = spread.value_or(kDefaultRatioSpread);
    const double min_ratio = *base_ratio * (1.0 - tolerance);
    const double max_ratio = *base_ratio * (1.0 + tolerance);
    if (!(max_ratio > min_ratio)) return std::nullopt;
    return clamp01((ratio - min_ratio) / (max_ratio - min_ratio));
  }

  if (absolute_range.has_value()) {
    return normalize_range(value, absolute_range->min, absolute_range->max);
  }
  return std::nullopt;
}

} // namespace mfg
