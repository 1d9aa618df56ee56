#pragma once

#include "mfg/measurements.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace mfg {

enum class Sex { Male, Female };
enum class AthleticLevel { Low, Medium, High };

std::optional<Sex> parse_sex(std::string_view name);
std::optional<AthleticLevel> parse_athletic_level(std::string_view name);

struct KnownMeasurements {
  std::optional<double> height;  // cm
  std::optional<double> weight;  // kg
  std::optional<double> chest;   // bust for female
  std::optional<double> waist;
  std::optional<double> low_hip;
  std::optional<double> underchest;
};

// Keys use the camelCase spelling of the quick-mode form (highHip, shoulderToWrist,
// ...); collect_measurements() folds them onto canonical keys.
using EstimatedMeasurements = std::map<std::string, double>;

// Fills the quick-mode measurements from sex, the known girths and the athletic
// level. Every value is rounded to one decimal.
EstimatedMeasurements estimate_missing_measurements(Sex sex,
                                                    const KnownMeasurements& known,
                                                    AthleticLevel athletic = AthleticLevel::Medium);

// Fills every missing body measurement from height ratios, with girths scaled
// by a BMI term when weight is known. Existing values are never replaced.
EstimatedMeasurements derive_missing_measurements(const EstimatedMeasurements& input,
                                                  std::optional<double> height,
                                                  std::optional<double> weight);

MeasurementRecord to_measurement_record(const EstimatedMeasurements& values);

} // namespace mfg
