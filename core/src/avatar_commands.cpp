#include "mfg/avatar_commands.h"

#include "mfg/log.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <limits>

namespace mfg {

namespace {
using json = nlohmann::json;

json renderer_morph_values(const MorphCatalog& morphs) {
  json values = json::object();
  for (const auto& attr : morphs) {
    values[std::to_string(attr.morph_id)] = slider_to_renderer_value(attr.value, attr);
  }
  return values;
}

std::string generated_avatar_id() {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch());
  return "avatar_" + std::to_string(ms.count());
}

void put_color(json& payload, const std::string& color_hex) {
  if (color_hex.empty()) return;
  if (auto normalized = normalize_color_hex(color_hex)) {
    payload["color"] = *normalized;
  } else {
    log::warn("ignoring invalid colour '" + color_hex + "'");
  }
}
} // namespace

double slider_to_renderer_value(int slider, const MorphAttribute& attr) {
  return attr.min + (slider / 100.0) * (attr.max - attr.min);
}

int renderer_to_slider_value(double value, const MorphAttribute& attr) {
  const double range = attr.max - attr.min;
  if (range == 0.0 || !std::isfinite(value)) return kNeutralMorphValue;
  const double normalized = (value - attr.min) / range;
  if (std::isnan(normalized)) return kNeutralMorphValue;
  return static_cast<int>(std::clamp(std::floor(normalized * 100.0 + 0.5), 0.0, 100.0));
}

QueuedCommand make_configure_avatar_command(const AvatarConfiguration& config) {
  const bool female = config.gender == Gender::Female;
  const bool male = config.gender == Gender::Male;

  json data;
  data["avatarId"] = config.avatar_id.empty() ? generated_avatar_id() : config.avatar_id;
  data["gender"] = to_string(config.gender);
  data["baseMorphs"] = {
      {std::to_string(kBaseFeminineBodyId), female ? 1 : 0},
      {std::to_string(kBaseFeminineHeadId), female ? 1 : 0},
      {std::to_string(kBaseMasculineBodyId), male ? 1 : 0},
      {std::to_string(kBaseMasculineHeadId), male ? 1 : 0},
  };
  data["morphValues"] = renderer_morph_values(config.morphs);

  log::info("configureAvatar " + data["avatarId"].get<std::string>() + ": " +
            std::to_string(config.morphs.size()) + " morphs, gender " + to_string(config.gender));
  return {CommandKind::ConfigureAvatar, std::move(data), "avatar configuration"};
}

QueuedCommand make_update_morphs_command(const std::string& avatar_id, const MorphCatalog& changed) {
  json data;
  data["avatarId"] = avatar_id;
  data["morphValues"] = renderer_morph_values(changed);
  return {CommandKind::UpdateMorphs, std::move(data), std::to_string(changed.size()) + " morph updates"};
}

QueuedCommand make_update_morph_command(const MorphAttribute& attr) {
  json data;
  data["morphId"] = attr.morph_id;
  data["value"] = slider_to_renderer_value(attr.value, attr);
  return {CommandKind::UpdateMorph, std::move(data), "morph " + attr.label_name};
}

const char* to_string(ClothingCategory category) {
  return category == ClothingCategory::Bottom ? "bottom" : "top";
}

std::optional<ClothingCategory> parse_clothing_category(std::string_view name) {
  if (name == "top") return ClothingCategory::Top;
  if (name == "bottom") return ClothingCategory::Bottom;
  return std::nullopt;
}

QueuedCommand make_hair_command(const HairSelection& hair) {
  json data;
  data["styleId"] = hair.style_id;
  put_color(data, hair.color_hex);
  return {CommandKind::UpdateHair, std::move(data), "hair"};
}

QueuedCommand make_clothing_command(const ClothingSelection& clothing) {
  json data;
  data["category"] = to_string(clothing.category);
  data["itemId"] = clothing.item_id;
  data["subCategory"] = clothing.sub_category.empty() ? std::string("default") : clothing.sub_category;
  put_color(data, clothing.color_hex);
  return {CommandKind::UpdateClothing, std::move(data), std::string("clothing ") + to_string(clothing.category)};
}

QueuedCommand make_skin_command(const SkinSelection& skin) {
  json data;
  data["colorId"] = skin.color_id;
  data["shade"] = skin.shade;
  return {CommandKind::UpdateSkin, std::move(data), "skin tone"};
}

QueuedCommand make_rotate_camera_command(double yaw_degrees, double pitch_degrees) {
  return {CommandKind::RotateCamera, json{{"yaw", yaw_degrees}, {"pitch", pitch_degrees}}, "camera rotate"};
}

QueuedCommand make_zoom_camera_command(double delta) {
  return {CommandKind::ZoomCamera, json{{"delta", delta}}, "camera zoom"};
}

QueuedCommand make_move_camera_command(double dx, double dy) {
  return {CommandKind::MoveCamera, json{{"x", dx}, {"y", dy}}, "camera move"};
}

std::optional<std::string> normalize_color_hex(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) value.remove_prefix(1);
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) value.remove_suffix(1);
  if (!value.empty() && value.front() == '#') value.remove_prefix(1);
  if (value.size() != 3 && value.size() != 6) return std::nullopt;

  std::string digits;
  for (unsigned char c : value) {
    if (!std::isxdigit(c)) return std::nullopt;
    digits.push_back(static_cast<char>(std::tolower(c)));
  }
  if (digits.size() == 3) {
    digits = {digits[0], digits[0], digits[1], digits[1], digits[2], digits[2]};
  }
  return "#" + digits;
}

ValidationReport validate_avatar_configuration(const AvatarConfiguration& config) {
  ValidationReport report;
  if (config.gender == Gender::Unspecified) {
    report.errors.push_back("Gender is required");
  }
  if (config.morphs.empty()) {
    report.errors.push_back("Morph values are required");
  }

  bool has_base = false;
  for (const auto& attr : config.morphs) {
    if (attr.value < 0 || attr.value > 100) {
      report.errors.push_back("Invalid morph value for " + attr.label_name + ": " + std::to_string(attr.value) +
                              " (expected 0-100)");
    }
    if (attr.morph_name.empty()) {
      report.errors.push_back("Missing morphName for " + attr.label_name);
    }
    if (attr.morph_name.find("BaseFeminine") != std::string::npos ||
        attr.morph_name.find("BaseMasculine") != std::string::npos) {
      has_base = true;
    }
  }
  if (!config.morphs.empty() && !has_base) {
    report.warnings.push_back("No base morphs found - gender may not be applied correctly");
  }
  report.valid = report.errors.empty();
  return report;
}

MorphStatistics compute_morph_statistics(const MorphCatalog& morphs) {
  MorphStatistics stats;
  if (morphs.empty()) return stats;

  stats.total = morphs.size();
  stats.min = std::numeric_limits<int>::max();
  stats.max = std::numeric_limits<int>::min();
  double sum = 0.0;
  for (const auto& attr : morphs) {
    if (attr.value != kNeutralMorphValue) ++stats.non_neutral;
    ++stats.category_counts[to_string(attr.category)];
    stats.min = std::min(stats.min, attr.value);
    stats.max = std::max(stats.max, attr.value);
    sum += attr.value;
  }
  stats.average = sum / static_cast<double>(morphs.size());
  return stats;
}

} // namespace mfg
