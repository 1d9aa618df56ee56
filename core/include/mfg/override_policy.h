#pragma once

#include "mfg/morph_catalog.h"

namespace mfg {

// A value further than this from neutral counts as a user edit.
constexpr int kManualEditTolerance = 1;

bool is_manually_set(const MorphAttribute& attr);

// The attribute with derived_value applied, unless the user has edited it.
MorphAttribute apply_derived_value(const MorphAttribute& current, int derived_value);

} // namespace mfg
