#include "mfg/override_policy.h"

#include <algorithm>
#include <cstdlib>

namespace mfg {

bool is_manually_set(const MorphAttribute& attr) {
  return std::abs(attr.value - kNeutralMorphValue) > kManualEditTolerance;
}

MorphAttribute apply_derived_value(const MorphAttribute& current, int derived_value) {
  MorphAttribute out = current;
  if (!is_manually_set(current)) {
    out.value = std::clamp(derived_value, 0, 100);
  }
  return out;
}

} // namespace mfg
