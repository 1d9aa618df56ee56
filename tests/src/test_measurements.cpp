#include "mfg/anthro.h"
#include "mfg/log.h"
#include "mfg/measurements.h"
#include "mfg/normalize.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <iostream>
#include <optional>
#include <string>

using ojson = nlohmann::ordered_json;

namespace {
bool near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

bool near(std::optional<double> a, double b, double eps = 1e-9) {
  return a.has_value() && near(*a, b, eps);
}
} // namespace

int main() {
  mfg::log::init();
  mfg::log::set_console_level(mfg::log::Level::Error);

  int failures = 0;

  // Test: key normalization folds case, punctuation and aliases.
  {
    if (mfg::normalize_measurement_key("Bust Circumference") != std::optional<std::string>("chest")) {
      std::cerr << "bust circumference alias failed\n";
      ++failures;
    }
    if (mfg::normalize_measurement_key("waist_circumference") != std::optional<std::string>("waist")) {
      std::cerr << "waist circumference alias failed\n";
      ++failures;
    }
    if (mfg::normalize_measurement_key("Hip-Circumference") != std::optional<std::string>("lowhip")) {
      std::cerr << "hip circumference alias failed\n";
      ++failures;
    }
    if (mfg::normalize_measurement_key("UnderBust") != std::optional<std::string>("underchest")) {
      std::cerr << "underbust alias failed\n";
      ++failures;
    }
    if (mfg::normalize_measurement_key("High Thigh") != std::optional<std::string>("highthigh")) {
      std::cerr << "plain key normalization failed\n";
      ++failures;
    }
    if (mfg::normalize_measurement_key(" -_ ").has_value()) {
      std::cerr << "punctuation-only key should be skipped\n";
      ++failures;
    }
  }

  // Test: diacritics fold to their base letters, combining marks vanish.
  {
    if (mfg::normalize_measurement_key("W\xC3\xA4ist") != std::optional<std::string>("waist")) {
      std::cerr << "latin-1 diacritic not folded\n";
      ++failures;
    }
    if (mfg::normalize_measurement_key("\xC4\x8C" "est") != std::optional<std::string>("cest")) {
      std::cerr << "latin extended-a diacritic not folded\n";
      ++failures;
    }
    if (mfg::normalize_measurement_key("nec\xCC\x81k") != std::optional<std::string>("neck")) {
      std::cerr << "combining mark not removed\n";
      ++failures;
    }
  }

  // Test: value coercion.
  {
    if (!near(mfg::coerce_measurement_value(ojson("70,5")), 70.5)) {
      std::cerr << "comma decimal not accepted\n";
      ++failures;
    }
    if (!near(mfg::coerce_measurement_value(ojson(" 82.25 ")), 82.25)) {
      std::cerr << "padded numeric string not accepted\n";
      ++failures;
    }
    if (!near(mfg::coerce_measurement_value(ojson(91)), 91.0)) {
      std::cerr << "integer value not accepted\n";
      ++failures;
    }
    if (mfg::coerce_measurement_value(ojson("")).has_value() ||
        mfg::coerce_measurement_value(ojson("70cm")).has_value() ||
        mfg::coerce_measurement_value(ojson("1,2,3")).has_value() ||
        mfg::coerce_measurement_value(ojson(true)).has_value() ||
        mfg::coerce_measurement_value(ojson(nullptr)).has_value() ||
        mfg::coerce_measurement_value(ojson::object()).has_value() ||
        mfg::coerce_measurement_value(ojson("nan")).has_value()) {
      std::cerr << "non-numeric values should be dropped\n";
      ++failures;
    }
  }

  // Test: merge order basic, body, quick mode; first writer wins.
  {
    mfg::MeasurementSources sources;
    sources.basic = ojson{{"height", 172}, {"waist", 70}, {"chest", nullptr}};
    sources.body = ojson{{"Waist", 80}, {"chest", "90"}, {"Low Hip", 96}};
    mfg::QuickModeSettings quick;
    quick.measurements = ojson{{"lowhip", 100}, {"neck", "35,5"}};
    sources.quick_mode = quick;

    const auto map = mfg::collect_measurements(sources);
    if (!near(mfg::find_measurement(map, "waist"), 70.0)) {
      std::cerr << "basic waist should win over body waist\n";
      ++failures;
    }
    if (!near(mfg::find_measurement(map, "chest"), 90.0)) {
      std::cerr << "null basic chest should fall through to body\n";
      ++failures;
    }
    if (!near(mfg::find_measurement(map, "lowhip"), 96.0)) {
      std::cerr << "body low hip should win over quick mode\n";
      ++failures;
    }
    if (!near(mfg::find_measurement(map, "neck"), 35.5)) {
      std::cerr << "quick mode neck missing\n";
      ++failures;
    }
    if (map.size() != 5) {
      std::cerr << "unexpected measurement count " << map.size() << "\n";
      ++failures;
    }
  }

  // Test: source document parsing.
  {
    const std::string text =
        R"({"basic":{"height":180},"body":{"waist":"81,5"},"quick_mode":{"body_shape":"shape_2","athletic_level":"high","measurements":{"neck":38}}})";
    mfg::MeasurementSources sources;
    std::string error;
    if (!mfg::parse_measurement_sources(text, sources, error)) {
      std::cerr << "measurement sources failed to parse: " << error << "\n";
      ++failures;
    } else {
      if (!sources.quick_mode || sources.quick_mode->body_shape != std::optional<std::string>("shape_2") ||
          sources.quick_mode->athletic_level != std::optional<std::string>("high")) {
        std::cerr << "quick mode selectors not parsed\n";
        ++failures;
      }
      const auto map = mfg::collect_measurements(sources);
      if (!near(mfg::find_measurement(map, "waist"), 81.5) || !near(mfg::find_measurement(map, "neck"), 38.0)) {
        std::cerr << "parsed measurement values wrong\n";
        ++failures;
      }
    }
    if (mfg::parse_measurement_sources("{not json", sources, error) ||
        mfg::parse_measurement_sources("", sources, error) ||
        mfg::parse_measurement_sources("[1,2]", sources, error)) {
      std::cerr << "invalid measurement documents should be rejected\n";
      ++failures;
    }
  }

  // Test: ratio normalization boundaries.
  {
    const double height = 170.0;
    const double base = 0.44;
    const double spread = 0.35;
    if (!near(mfg::normalize_ratio(height * base, height, base, spread), 0.5, 1e-9)) {
      std::cerr << "ratio at baseline should map to 0.5\n";
      ++failures;
    }
    if (!near(mfg::normalize_ratio(height * base * (1.0 - spread), height, base, spread), 0.0, 1e-9)) {
      std::cerr << "ratio at lower window edge should map to 0\n";
      ++failures;
    }
    if (!near(mfg::normalize_ratio(height * base * (1.0 + spread), height, base, spread), 1.0, 1e-9)) {
      std::cerr << "ratio at upper window edge should map to 1\n";
      ++failures;
    }
    if (!near(mfg::normalize_ratio(10.0, height, base, spread), 0.0) ||
        !near(mfg::normalize_ratio(500.0, height, base, spread), 1.0)) {
      std::cerr << "ratio outside window should clamp\n";
      ++failures;
    }
    if (!near(mfg::normalize_ratio(height * 0.5, height, 0.5), 0.5, 1e-9)) {
      std::cerr << "default spread baseline should map to 0.5\n";
      ++failures;
    }
    if (mfg::normalize_ratio(70.0, height, base, 0.0).has_value()) {
      std::cerr << "zero-width window should not normalize\n";
      ++failures;
    }
  }

  // Test: waist 70 at height 170 sits in the lower half of the waist window.
  {
    const auto n = mfg::normalize_ratio(70.0, 170.0, 0.44, 0.35);
    if (!near(n, 0.408, 0.002)) {
      std::cerr << "waist 70/170 normalized to " << n.value_or(-1.0) << "\n";
      ++failures;
    }
  }

  // Test: absolute range fallback.
  {
    const mfg::AbsoluteRange range{60.0, 115.0};
    if (!near(mfg::normalize_ratio(87.5, std::nullopt, 0.44, 0.35, range), 0.5)) {
      std::cerr << "absolute fallback without height failed\n";
      ++failures;
    }
    if (!near(mfg::normalize_ratio(87.5, 170.0, std::nullopt, std::nullopt, range), 0.5)) {
      std::cerr << "absolute fallback without base ratio failed\n";
      ++failures;
    }
    if (mfg::normalize_ratio(87.5, std::nullopt, std::nullopt).has_value()) {
      std::cerr << "no ratio and no range should give nothing\n";
      ++failures;
    }
    if (mfg::normalize_range(5.0, 10.0, 10.0).has_value() || mfg::normalize_range(std::nullopt, 0.0, 1.0).has_value()) {
      std::cerr << "degenerate absolute range should give nothing\n";
      ++failures;
    }
    if (mfg::normalize_ratio(std::nan(""), 170.0, 0.44).has_value()) {
      std::cerr << "non-finite value should give nothing\n";
      ++failures;
    }
  }

  // Test: anthropometric estimation from height and known girths.
  {
    mfg::KnownMeasurements known;
    known.height = 180.0;
    known.chest = 100.0;
    known.low_hip = 100.0;
    known.waist = 86.4;
    const auto est = mfg::estimate_missing_measurements(mfg::Sex::Male, known, mfg::AthleticLevel::Medium);
    if (!near(est.at("inseam"), 81.0) || !near(est.at("handLength"), 19.4) || !near(est.at("footLength"), 27.4)) {
      std::cerr << "height-driven lengths wrong\n";
      ++failures;
    }
    if (!near(est.at("head"), 57.0)) {
      std::cerr << "head estimate wrong: " << est.at("head") << "\n";
      ++failures;
    }
    // waist/height is exactly 0.48, so the softness term is zero.
    if (!near(est.at("highHip"), 92.0) || !near(est.at("highThigh"), 60.0)) {
      std::cerr << "hip-driven girths wrong\n";
      ++failures;
    }
    if (!near(est.at("underchest"), 97.0) || !near(est.at("bicep"), 32.0)) {
      std::cerr << "chest-driven girths wrong\n";
      ++failures;
    }

    const auto strong = mfg::estimate_missing_measurements(mfg::Sex::Male, known, mfg::AthleticLevel::High);
    if (!(strong.at("bicep") > est.at("bicep"))) {
      std::cerr << "athletic level should add muscle\n";
      ++failures;
    }

    known.underchest = 90.0;
    const auto with_underchest = mfg::estimate_missing_measurements(mfg::Sex::Female, known);
    if (with_underchest.count("underchest")) {
      std::cerr << "known underchest should not be estimated\n";
      ++failures;
    }
  }

  // Test: baseline ratios fill only the missing keys.
  {
    mfg::EstimatedMeasurements input{{"waist", 75.0}};
    const auto filled = mfg::derive_missing_measurements(input, 170.0, 63.58);
    if (!near(filled.at("waist"), 75.0)) {
      std::cerr << "existing value overwritten\n";
      ++failures;
    }
    // BMI 22 leaves girths on the plain ratio.
    if (!near(filled.at("chest"), 86.7, 0.05) || !near(filled.at("inseam"), 76.5)) {
      std::cerr << "baseline ratios wrong\n";
      ++failures;
    }
    if (filled.size() != 21) {
      std::cerr << "expected 21 baseline keys, got " << filled.size() << "\n";
      ++failures;
    }
    const auto untouched = mfg::derive_missing_measurements(input, std::nullopt, std::nullopt);
    if (untouched.size() != 1) {
      std::cerr << "without height nothing should be derived\n";
      ++failures;
    }

    const auto record = mfg::to_measurement_record(filled);
    if (!record.contains("lowHip") || mfg::normalize_measurement_key("lowHip") != std::optional<std::string>("lowhip")) {
      std::cerr << "estimated record keys should feed the collector\n";
      ++failures;
    }
  }

  mfg::log::shutdown();
  return failures == 0 ? 0 : 1;
}
