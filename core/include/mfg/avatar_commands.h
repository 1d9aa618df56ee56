#pragma once

#include "mfg/command_queue.h"
#include "mfg/derivation.h"
#include "mfg/morph_catalog.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mfg {

// Base morph ids the renderer uses to select the body/head template.
constexpr int kBaseFeminineBodyId = 176;
constexpr int kBaseFeminineHeadId = 177;
constexpr int kBaseMasculineBodyId = 178;
constexpr int kBaseMasculineHeadId = 179;

struct AvatarConfiguration {
  std::string avatar_id;
  Gender gender = Gender::Unspecified;
  MorphCatalog morphs;
};

double slider_to_renderer_value(int slider, const MorphAttribute& attr);
int renderer_to_slider_value(double value, const MorphAttribute& attr);

QueuedCommand make_configure_avatar_command(const AvatarConfiguration& config);
QueuedCommand make_update_morphs_command(const std::string& avatar_id, const MorphCatalog& changed);
QueuedCommand make_update_morph_command(const MorphAttribute& attr);

enum class ClothingCategory { Top, Bottom };

const char* to_string(ClothingCategory category);
std::optional<ClothingCategory> parse_clothing_category(std::string_view name);

struct HairSelection {
  int style_id = 0;
  std::string color_hex;
};

struct ClothingSelection {
  ClothingCategory category = ClothingCategory::Top;
  int item_id = 0;
  std::string sub_category;
  std::string color_hex;
};

struct SkinSelection {
  int color_id = 0;
  int shade = 0;
};

QueuedCommand make_hair_command(const HairSelection& hair);
QueuedCommand make_clothing_command(const ClothingSelection& clothing);
QueuedCommand make_skin_command(const SkinSelection& skin);
QueuedCommand make_rotate_camera_command(double yaw_degrees, double pitch_degrees);
QueuedCommand make_zoom_camera_command(double delta);
QueuedCommand make_move_camera_command(double dx, double dy);

// "#abc", "abc", "#aabbcc" or "aabbcc" -> "#aabbcc" (lower case).
std::optional<std::string> normalize_color_hex(std::string_view value);

struct ValidationReport {
  bool valid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ValidationReport validate_avatar_configuration(const AvatarConfiguration& config);

struct MorphStatistics {
  size_t total = 0;
  size_t non_neutral = 0;
  std::map<std::string, size_t> category_counts;
  int min = 0;
  int max = 0;
  double average = 0.0;
};

MorphStatistics compute_morph_statistics(const MorphCatalog& morphs);

} // namespace mfg
