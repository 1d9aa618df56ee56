#include "mfg/anthro.h"
#include "mfg/avatar_commands.h"
#include "mfg/backend_import.h"
#include "mfg/command_queue.h"
#include "mfg/config.h"
#include "mfg/derivation.h"
#include "mfg/log.h"
#include "mfg/measurements.h"
#include "mfg/morph_catalog.h"
#include "mfg/replay.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string read_text_file(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return {};
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool parse_double(const std::string& value, double& out) {
  char* end = nullptr;
  out = std::strtod(value.c_str(), &end);
  return !value.empty() && end && *end == '\0';
}

bool parse_optional_double(const char* flag, const std::string& value, std::optional<double>& out) {
  double parsed = 0.0;
  if (!parse_double(value, parsed)) {
    mfg::log::error(std::string("invalid number for ") + flag + ": " + value);
    return false;
  }
  out = parsed;
  return true;
}

bool load_catalog(const fs::path& path, mfg::MorphCatalog& catalog) {
  std::string error;
  if (!mfg::load_morph_catalog(path, catalog, error)) {
    mfg::log::error("catalog load failed: " + error);
    return false;
  }
  return true;
}

struct DeriveArgs {
  fs::path catalog_path;
  fs::path measurements_path;
  fs::path backend_path;
  std::optional<fs::path> config_path;
  std::optional<fs::path> out_path;
  mfg::Gender gender = mfg::Gender::Unspecified;
};

int derive_cmd(const DeriveArgs& args) {
  mfg::MorphCatalog catalog;
  if (!load_catalog(args.catalog_path, catalog)) return 1;

  mfg::MorphConfig config;
  if (args.config_path) {
    config = mfg::load_morph_config(*args.config_path);
  }

  mfg::MorphCatalog derived;
  if (!args.backend_path.empty()) {
    const auto text = read_text_file(args.backend_path);
    const auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
      mfg::log::error("backend targets are not a JSON object: " + args.backend_path.string());
      return 1;
    }
    std::map<std::string, double> targets;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
      if (it.value().is_number()) targets[it.key()] = it.value().get<double>();
    }
    const auto report = mfg::validate_backend_morph_targets(targets);
    for (const auto& w : report.warnings) mfg::log::warn(w);
    for (const auto& e : report.errors) mfg::log::error(e);
    if (!report.valid) return 1;
    derived = mfg::apply_backend_morph_targets(targets, args.gender, catalog);
  } else {
    mfg::MeasurementSources sources;
    std::string error;
    if (!mfg::parse_measurement_sources(read_text_file(args.measurements_path), sources, error)) {
      mfg::log::error("measurements invalid: " + error);
      return 1;
    }
    mfg::DeriveOptions options;
    options.gender = args.gender;
    derived = mfg::derive_morph_targets(catalog, sources, options, config.tables);
  }

  if (args.out_path) {
    std::string error;
    if (!mfg::save_morph_catalog(*args.out_path, derived, error)) {
      mfg::log::error("catalog save failed: " + error);
      return 1;
    }
    mfg::log::info("wrote " + args.out_path->string());
  } else {
    std::cout << mfg::morph_catalog_to_json(derived).dump(2) << "\n";
  }

  const auto stats = mfg::compute_morph_statistics(derived);
  std::cerr << "morphs: " << stats.total << " non-neutral: " << stats.non_neutral
            << " range: [" << stats.min << ", " << stats.max << "]\n";
  return 0;
}

int estimate_cmd(mfg::Sex sex, const mfg::KnownMeasurements& known, mfg::AthleticLevel athletic, bool full) {
  auto estimated = mfg::estimate_missing_measurements(sex, known, athletic);
  if (full) {
    estimated = mfg::derive_missing_measurements(estimated, known.height, known.weight);
  }
  std::cout << mfg::to_measurement_record(estimated).dump(2) << "\n";
  return 0;
}

int configure_cmd(const fs::path& catalog_path, mfg::Gender gender, const std::string& avatar_id) {
  mfg::MorphCatalog catalog;
  if (!load_catalog(catalog_path, catalog)) return 1;

  mfg::AvatarConfiguration config;
  config.avatar_id = avatar_id;
  config.gender = gender;
  config.morphs = mfg::apply_gender_base_morphs(catalog, gender);

  const auto report = mfg::validate_avatar_configuration(config);
  for (const auto& w : report.warnings) mfg::log::warn(w);
  if (!report.valid) {
    for (const auto& e : report.errors) mfg::log::error(e);
    return 1;
  }
  std::cout << mfg::to_envelope(mfg::make_configure_avatar_command(config)).dump(2) << "\n";
  return 0;
}

int replay_cmd(const fs::path& commands_path, std::chrono::milliseconds debounce) {
  const auto script = json::parse(read_text_file(commands_path), nullptr, false);
  if (script.is_discarded() || !script.is_array()) {
    mfg::log::error("replay script must be a JSON array: " + commands_path.string());
    return 1;
  }

  const auto result = mfg::replay::run(
      script, debounce, [](const mfg::QueuedCommand& cmd) { std::cout << mfg::to_envelope(cmd).dump() << "\n"; });

  const auto& stats = result.stats;
  std::cerr << "sent: " << stats.sent << " coalesced: " << stats.coalesced << " dispatched: " << stats.dispatched
            << " flushed: " << stats.flushed << " failed: " << stats.failed << " pending: " << result.pending
            << " skipped: " << result.skipped << "\n";
  return 0;
}

void print_usage() {
  std::cout << "Usage:\n"
            << "  mfgctl derive --catalog <json> --measurements <json> [--config <file>] [--gender male|female] [--out <json>]\n"
            << "  mfgctl derive --catalog <json> --backend <json> [--gender male|female] [--out <json>]\n"
            << "  mfgctl estimate --sex <male|female> --height <cm> [--weight <kg>] [--chest <cm>] [--waist <cm>] [--lowhip <cm>] [--underchest <cm>] [--athletic <low|medium|high>] [--full]\n"
            << "  mfgctl configure --catalog <json> [--gender male|female] [--avatar-id <id>]\n"
            << "  mfgctl replay --commands <json> [--config <file>] [--debounce-ms <n>]\n"
            << "Options:\n"
            << "  --verbose   log info messages to stdout\n";
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  mfg::log::set_console_level(mfg::log::Level::Warn);
  for (int i = 2; i < argc; ++i) {
    if (std::string(argv[i]) == "--verbose") mfg::log::set_console_level(mfg::log::Level::Debug);
  }
  mfg::log::init();

  std::string command = argv[1];

  if (command == "derive") {
    DeriveArgs args;
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--catalog" && i + 1 < argc) {
        args.catalog_path = fs::path(argv[++i]);
      } else if (arg == "--measurements" && i + 1 < argc) {
        args.measurements_path = fs::path(argv[++i]);
      } else if (arg == "--backend" && i + 1 < argc) {
        args.backend_path = fs::path(argv[++i]);
      } else if (arg == "--config" && i + 1 < argc) {
        args.config_path = fs::path(argv[++i]);
      } else if (arg == "--out" && i + 1 < argc) {
        args.out_path = fs::path(argv[++i]);
      } else if (arg == "--gender" && i + 1 < argc) {
        args.gender = mfg::parse_gender(argv[++i]);
      }
    }
    if (args.catalog_path.empty() || (args.measurements_path.empty() && args.backend_path.empty())) {
      print_usage();
      return 1;
    }
    return derive_cmd(args);
  }

  if (command == "estimate") {
    std::optional<mfg::Sex> sex;
    mfg::KnownMeasurements known;
    mfg::AthleticLevel athletic = mfg::AthleticLevel::Medium;
    bool full = false;
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      bool ok = true;
      if (arg == "--sex" && i + 1 < argc) {
        sex = mfg::parse_sex(argv[++i]);
      } else if (arg == "--height" && i + 1 < argc) {
        ok = parse_optional_double("--height", argv[++i], known.height);
      } else if (arg == "--weight" && i + 1 < argc) {
        ok = parse_optional_double("--weight", argv[++i], known.weight);
      } else if (arg == "--chest" && i + 1 < argc) {
        ok = parse_optional_double("--chest", argv[++i], known.chest);
      } else if (arg == "--waist" && i + 1 < argc) {
        ok = parse_optional_double("--waist", argv[++i], known.waist);
      } else if (arg == "--lowhip" && i + 1 < argc) {
        ok = parse_optional_double("--lowhip", argv[++i], known.low_hip);
      } else if (arg == "--underchest" && i + 1 < argc) {
        ok = parse_optional_double("--underchest", argv[++i], known.underchest);
      } else if (arg == "--athletic" && i + 1 < argc) {
        const auto level = mfg::parse_athletic_level(argv[++i]);
        if (!level) {
          mfg::log::error("unknown athletic level");
          return 1;
        }
        athletic = *level;
      } else if (arg == "--full") {
        full = true;
      }
      if (!ok) return 1;
    }
    if (!sex || !known.height) {
      print_usage();
      return 1;
    }
    return estimate_cmd(*sex, known, athletic, full);
  }

  if (command == "configure") {
    fs::path catalog_path;
    mfg::Gender gender = mfg::Gender::Unspecified;
    std::string avatar_id;
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--catalog" && i + 1 < argc) {
        catalog_path = fs::path(argv[++i]);
      } else if (arg == "--gender" && i + 1 < argc) {
        gender = mfg::parse_gender(argv[++i]);
      } else if (arg == "--avatar-id" && i + 1 < argc) {
        avatar_id = argv[++i];
      }
    }
    if (catalog_path.empty()) {
      print_usage();
      return 1;
    }
    return configure_cmd(catalog_path, gender, avatar_id);
  }

  if (command == "replay") {
    fs::path commands_path;
    std::optional<fs::path> config_path;
    std::optional<std::chrono::milliseconds> debounce;
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--commands" && i + 1 < argc) {
        commands_path = fs::path(argv[++i]);
      } else if (arg == "--config" && i + 1 < argc) {
        config_path = fs::path(argv[++i]);
      } else if (arg == "--debounce-ms" && i + 1 < argc) {
        double ms = 0.0;
        if (!parse_double(argv[++i], ms) || ms < 0.0) {
          mfg::log::error("invalid --debounce-ms");
          return 1;
        }
        debounce = std::chrono::milliseconds(static_cast<int64_t>(ms));
      }
    }
    if (commands_path.empty()) {
      print_usage();
      return 1;
    }
    auto window = mfg::CommandQueue::kDefaultDebounce;
    if (config_path) window = mfg::load_morph_config(*config_path).debounce;
    if (debounce) window = *debounce;
    return replay_cmd(commands_path, window);
  }

  print_usage();
  return 1;
}
