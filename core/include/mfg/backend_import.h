#pragma once

#include "mfg/avatar_commands.h"
#include "mfg/derivation.h"
#include "mfg/morph_catalog.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mfg {

// Friendly backend keys ("waistWidth", "bellyPregnant", ...) -> catalog ids.
const std::map<std::string, int>& backend_morph_mapping();
std::optional<int> morph_id_for_backend_key(const std::string& key);
std::optional<std::string> backend_key_for_morph_id(int morph_id);

// Writes the stored 0-100 values onto the catalog, then selects the gender base
// morphs. Unknown keys and ids absent from the catalog are logged and skipped.
MorphCatalog apply_backend_morph_targets(const std::map<std::string, double>& targets,
                                         Gender gender,
                                         const MorphCatalog& catalog);

MorphCatalog apply_gender_base_morphs(const MorphCatalog& catalog, Gender gender);

ValidationReport validate_backend_morph_targets(const std::map<std::string, double>& targets);

} // namespace mfg
