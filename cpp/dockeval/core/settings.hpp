#pragma once
/*
================================================================================
Fragment 1.4 - Core: Evaluation + Grading Settings
FILE: cpp/dockeval/core/settings.hpp

Purpose:
  - Centralize every threshold the pipeline depends on (phase rules, derived
    column constants, tiering knobs, storage locations) into validated
    objects with conservative defaults.
  - Defaults reproduce the values historical databases were built with.
    Changing them makes new results incomparable with stored flights.

Hardening:
  - validate_or_throw() catches nonsensical values early.
================================================================================
*/

#include <array>
#include <cmath>
#include <string>

#include "dockeval/core/errors.hpp"

namespace dockeval {

// ----------------------------- Phase detection --------------------------------
struct DetectionSettings {
  // Closing velocity (COG Vel.x, m/s) at or below which the approach starts.
  double approach_start_velocity = -0.1;

  // Axial distance (COG Pos.x, m) below which the final approach starts.
  double final_approach_distance_m = 20.0;

  void validate_or_throw() const {
    if (!(approach_start_velocity < 0.0) || approach_start_velocity < -10.0) {
      throw ValidationError("DetectionSettings: approach_start_velocity must be in [-10, 0)");
    }
    if (!(final_approach_distance_m > 0.0) || final_approach_distance_m > 1000.0) {
      throw ValidationError("DetectionSettings: final_approach_distance_m must be in (0, 1000]");
    }
  }
};

// ----------------------------- Structuring -----------------------------------
struct StructureSettings {
  // Longitudinal distance between docking port and periscope (m).
  double periscope_offset_m = 3.471;

  // Approach cone half-angle (deg).
  double approach_cone_half_angle_deg = 10.0;

  // Ideal approach velocity = -COG Pos.x / divisor outside the final approach.
  double ideal_velocity_divisor = 200.0;

  // Ideal approach velocity inside the final approach (m/s).
  double final_approach_ideal_velocity = -0.1;

  // Final approach distance used for the derived limit columns (m).
  double final_approach_distance_m = 20.0;

  // Allowed rotation angle (deg) / rate (deg/s) during final approach.
  double max_rot_angle_deg = 1.5;
  double max_rot_velocity_deg_s = 0.15;

  void validate_or_throw() const {
    if (periscope_offset_m < 0.0 || periscope_offset_m > 100.0) {
      throw ValidationError("StructureSettings: periscope_offset_m outside sane bounds");
    }
    if (!(approach_cone_half_angle_deg > 0.0) || approach_cone_half_angle_deg >= 90.0) {
      throw ValidationError("StructureSettings: approach_cone_half_angle_deg must be in (0, 90)");
    }
    if (!(ideal_velocity_divisor > 0.0)) {
      throw ValidationError("StructureSettings: ideal_velocity_divisor must be > 0");
    }
    if (!(final_approach_distance_m > 0.0)) {
      throw ValidationError("StructureSettings: final_approach_distance_m must be > 0");
    }
    if (!std::isfinite(final_approach_ideal_velocity) || !std::isfinite(max_rot_angle_deg) ||
        !std::isfinite(max_rot_velocity_deg_s)) {
      throw ValidationError("StructureSettings: limits must be finite");
    }
  }
};

// ----------------------------- Evaluation ------------------------------------
struct EvaluationSettings {
  // Angle to Port (deg) above which the port is out of the periscope view.
  double visibility_angle_deg = 7.5;

  void validate_or_throw() const {
    if (!(visibility_angle_deg > 0.0) || visibility_angle_deg > 180.0) {
      throw ValidationError("EvaluationSettings: visibility_angle_deg must be in (0, 180]");
    }
  }
};

// ----------------------------- Grading ---------------------------------------
enum class WeightingMethod : int {
  kGini = 0,
  kCritic = 1,
};

struct GradingSettings {
  // Significance level for normality and zero-inflation tests.
  double alpha = 0.05;

  // Values beyond mean +- outlier_sigma * std are trimmed (one pass).
  double outlier_sigma = 3.0;

  // Upper bound on reference quantiles for the quantile transform.
  int max_quantiles = 100;

  // Nearest-rank percentile ranks used as non-normal tier borders.
  std::array<double, 4> percentile_ranks{0.023, 0.159, 0.841, 0.977};

  // Sigma multipliers used as normal tier borders.
  std::array<double, 4> sigma_multipliers{-2.0, -1.0, 1.0, 2.0};

  // Tier factor per tier (Excellent..Very Poor); lower is better.
  std::array<double, 5> tier_factors{1.0, 2.0, 3.0, 4.0, 5.0};

  // Relevance of Alignment, Approach, Final Approach in the final score.
  std::array<double, 3> phase_relevance{0.2, 0.3, 0.5};

  WeightingMethod weighting = WeightingMethod::kGini;

  // Session flag that allows scoring. Scoring entry points require a
  // ScoringCapability created from it.
  bool scoring_unlocked = false;

  void validate_or_throw() const {
    if (!(alpha > 0.0) || !(alpha < 0.5)) {
      throw ValidationError("GradingSettings: alpha must be in (0, 0.5)");
    }
    if (!(outlier_sigma >= 1.0) || outlier_sigma > 10.0) {
      throw ValidationError("GradingSettings: outlier_sigma must be in [1, 10]");
    }
    if (max_quantiles < 2 || max_quantiles > 100000) {
      throw ValidationError("GradingSettings: max_quantiles must be in [2, 100000]");
    }
    for (size_t i = 0; i < percentile_ranks.size(); ++i) {
      if (!(percentile_ranks[i] > 0.0) || !(percentile_ranks[i] < 1.0)) {
        throw ValidationError("GradingSettings: percentile ranks must be in (0, 1)");
      }
      if (i > 0 && percentile_ranks[i] < percentile_ranks[i - 1]) {
        throw ValidationError("GradingSettings: percentile ranks must be non-decreasing");
      }
    }
    for (size_t i = 1; i < sigma_multipliers.size(); ++i) {
      if (sigma_multipliers[i] < sigma_multipliers[i - 1]) {
        throw ValidationError("GradingSettings: sigma multipliers must be non-decreasing");
      }
    }
    double relevance_sum = 0.0;
    for (double r : phase_relevance) {
      if (r < 0.0) throw ValidationError("GradingSettings: phase relevance must be >= 0");
      relevance_sum += r;
    }
    if (std::fabs(relevance_sum - 1.0) > 1e-9) {
      throw ValidationError("GradingSettings: phase relevance weights must sum to 1");
    }
  }
};

// ----------------------------- Storage ---------------------------------------
struct StorageSettings {
  // Directory holding <Scenario>_flight_data.json files.
  std::string database_dir = "database";

  // Directory holding per-flight raw series exports (<Flight ID>.csv).
  std::string series_dir = "data";

  // Schema resource (name -> unit/description/optional/alt_name).
  std::string schema_path = "resources/results_template.json";

  void validate_or_throw() const {
    if (database_dir.empty()) throw ValidationError("StorageSettings: database_dir is empty");
    if (series_dir.empty()) throw ValidationError("StorageSettings: series_dir is empty");
    if (schema_path.empty()) throw ValidationError("StorageSettings: schema_path is empty");
  }
};

// ----------------------------- Settings --------------------------------------
struct Settings {
  DetectionSettings detection;
  StructureSettings structure;
  EvaluationSettings evaluation;
  GradingSettings grading;
  StorageSettings storage;

  void validate_or_throw() const {
    detection.validate_or_throw();
    structure.validate_or_throw();
    evaluation.validate_or_throw();
    grading.validate_or_throw();
    storage.validate_or_throw();
  }

  static Settings defaults() {
    Settings s;
    return s;
  }
};

}  // namespace dockeval
