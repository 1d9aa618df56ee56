#include "mfg/backend_import.h"

#include "mfg/log.h"

#include <algorithm>
#include <cmath>

namespace mfg {

const std::map<std::string, int>& backend_morph_mapping() {
  static const std::map<std::string, int> kMapping = {
      // Belly and waist
      {"lowerBellyMoveUpDown", 0},
      {"lowerBellyWidth", 1},
      {"bellyMoveInOut", 2},
      {"bellyMoveRotate", 3},
      {"bellyMoveUpDown", 4},
      {"upperBellyWidth", 5},
      {"pelvicDepth", 6},
      {"waistDepth", 7},
      {"waistMoveFrontBack", 8},
      {"abdomenMoveUpDown", 9},
      {"waistRotate", 10},
      {"waistWidth", 11},
      {"bellyHorizontalFold", 12},
      {"bellyMidLowSize", 13},
      {"upperBellyBulge", 14},
      {"lowerBellyShape", 15},
      {"bellyShapeFat1", 16},
      {"bellyShapeFat2", 17},
      {"abdomenShape", 18},
      {"loveHandles", 19},
      {"stomachDepthLower", 20},
      {"bellyMidHighSize", 21},
      {"bellyMidSize", 22},
      {"bellyPregnant", 23},
      // Arms and hands
      {"upperArmsLength", 24},
      {"lowerArmsLength", 25},
      {"lowerForearmSize", 26},
      {"higherForearmSize", 27},
      {"shoulderSize", 28},
      {"higherUpperArmSize", 29},
      {"lowerUpperArmSize", 30},
      {"fingersLength", 31},
      {"fingersWidth", 32},
      {"handSize", 33},
      {"shoulderWidth1", 34},
      {"shoulderWidth2", 35},
      {"shoulderHeight1", 36},
      {"wristThickness", 37},
      {"shoulderHeight2", 38},
      {"shoulderShape", 39},
      {"armsMuscular", 40},
      {"armFlab", 41},
      {"armpitHeight", 42},
      {"elbowShape", 43},
      // Torso, legs, chest, hips
      {"bodyMuscular", 149},
      {"bodyFitness", 150},
      {"shinLength", 116},
      {"thighLength", 117},
      {"chestSize", 53},
      {"pectoralsDiameter", 48},
      {"glutesSize", 93},
      {"hipsWidth1", 92},
  };
  return kMapping;
}

std::optional<int> morph_id_for_backend_key(const std::string& key) {
  const auto& mapping = backend_morph_mapping();
  auto it = mapping.find(key);
  if (it == mapping.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> backend_key_for_morph_id(int morph_id) {
  for (const auto& kv : backend_morph_mapping()) {
    if (kv.second == morph_id) return kv.first;
  }
  return std::nullopt;
}

MorphCatalog apply_gender_base_morphs(const MorphCatalog& catalog, Gender gender) {
  MorphCatalog out = catalog;
  if (gender == Gender::Unspecified) {
    log::warn("gender base morphs skipped: gender unspecified");
    return out;
  }
  const bool male = gender == Gender::Male;
  const auto set = [&out](int id, int value) {
    if (auto* attr = find_morph(out, id)) attr->value = value;
  };
  set(kBaseMasculineBodyId, male ? 100 : 0);
  set(kBaseMasculineHeadId, male ? 100 : 0);
  set(kBaseFeminineBodyId, male ? 0 : 100);
  set(kBaseFeminineHeadId, male ? 0 : 100);
  log::info(std::string("applied ") + to_string(gender) + " base morphs");
  return out;
}

MorphCatalog apply_backend_morph_targets(const std::map<std::string, double>& targets,
                                         Gender gender,
                                         const MorphCatalog& catalog) {
  MorphCatalog out = catalog;
  for (const auto& [key, value] : targets) {
    const auto id = morph_id_for_backend_key(key);
    if (!id) {
      log::warn("no mapping for backend morph key: " + key);
      continue;
    }
    auto* attr = find_morph(out, *id);
    if (!attr) {
      log::warn("morph id " + std::to_string(*id) + " not in catalog for backend key: " + key);
      continue;
    }
    if (!std::isfinite(value)) {
      log::warn("non-finite value for backend key: " + key);
      continue;
    }
    attr->value = static_cast<int>(std::clamp(std::floor(value + 0.5), 0.0, 100.0));
    log::debug("applied " + key + " -> morph " + std::to_string(*id) + " = " + std::to_string(attr->value));
  }
  return apply_gender_base_morphs(out, gender);
}

ValidationReport validate_backend_morph_targets(const std::map<std::string, double>& targets) {
  ValidationReport report;
  for (const auto& [key, value] : targets) {
    if (!morph_id_for_backend_key(key)) {
      report.warnings.push_back("Unknown morph key: " + key);
    }
    if (!std::isfinite(value) || value < 0.0 || value > 100.0) {
      report.errors.push_back("Invalid value for " + key + ": " + std::to_string(value) + " (expected 0-100)");
    }
  }
  report.valid = report.errors.empty();
  return report;
}

} // namespace mfg
