/*
===============================================================================
Fragment 5.7 - Grading: Tier Assignment
File: cpp/dockeval/grading/tiering.hpp
===============================================================================

Purpose:
  Grade one evaluated flight against the reference population of its
  scenario, one TieredMetric per metric column of the selected phase.

Tier rules:
  - normal (no transform): borders = mean + k*std (sample std), clamped at 0
    from below. A test value of exactly 0 is Excellent.
  - normal with transform: value and borders in transformed space,
    borders = mean + k*std (population std), no clamping. The zero fast
    path is checked on the raw value first.
  - non-normal / count-non-normal / zero-inflated: nearest-rank borders at
    the configured percentile ranks; percentile = fraction of reference
    values <= the test value.
  - bucketing: Excellent <= b0 < Good <= b1 < Normal <= b2 < Poor <= b3 < Very Poor.
  - optional schema columns, missing test values and columns the test
    record lacks are Not Tierable.

Outputs:
  A flat TieredMetric list in database column order. Grouping by tier is
  left to the caller (GradeReport::in_tier).
===============================================================================
*/

#pragma once

#include <array>
#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "dockeval/core/settings.hpp"
#include "dockeval/db/historical_database.hpp"
#include "dockeval/eval/metric_catalog.hpp"
#include "dockeval/eval/result_record.hpp"
#include "dockeval/eval/schema.hpp"
#include "dockeval/grading/distribution.hpp"

namespace dockeval {

class ReferenceStatsCache;

enum class Tier : int {
    kExcellent = 0,
    kGood = 1,
    kNormal = 2,
    kPoor = 3,
    kVeryPoor = 4,
    kNotTierable = 5,
};

inline constexpr std::size_t kTierCount = 6;
inline constexpr std::array<Tier, 5> kScoredTiers{Tier::kExcellent, Tier::kGood, Tier::kNormal, Tier::kPoor,
                                                  Tier::kVeryPoor};

const char* tier_name(Tier t) noexcept;

struct TieredMetric final {
    std::string name;
    Tier tier = Tier::kNotTierable;

    double value = std::numeric_limits<double>::quiet_NaN();            // test flight value
    double compared_value = std::numeric_limits<double>::quiet_NaN();   // value bucketed (transformed if any)

    // Reference metric distribution (trimmed or raw, untransformed).
    double mean = std::numeric_limits<double>::quiet_NaN();
    double stddev = std::numeric_limits<double>::quiet_NaN();
    std::size_t reference_size = 0;

    std::optional<DistributionType> distribution;
    std::string transform;  // empty when none

    std::array<double, 4> borders{std::numeric_limits<double>::quiet_NaN(),
                                  std::numeric_limits<double>::quiet_NaN(),
                                  std::numeric_limits<double>::quiet_NaN(),
                                  std::numeric_limits<double>::quiet_NaN()};
    std::optional<double> percentile;  // non-normal only

    std::string note;  // reason for Not Tierable
};

// Buckets `v` against ascending borders.
Tier bucket(double v, const std::array<double, 4>& borders) noexcept;

// Tiers one test value against a classified reference column.
TieredMetric tier_metric(const std::string& name, double test_value, const ClassifiedMetric& cm,
                         const GradingSettings& settings);

// Metric columns of `db` graded for `phase` (identity and unknown columns
// excluded; Time_Dock / LatOffsetAt_Dock only for Total).
std::vector<std::string> phase_columns(const HistoricalDatabase& db, Phase phase);

struct GradeReport {
    Phase phase = Phase::kTotal;
    std::string scenario;

    std::vector<TieredMetric> tiered;

    // Reference metric distribution per column (what the tier was computed
    // against; transformed when a transform was retained).
    std::map<std::string, std::vector<double>> metrics;

    // Phase columns minus optional ones: the table weights are computed on.
    std::vector<std::string> required_columns;
    std::vector<std::vector<double>> required_rows;  // complete rows only

    const TieredMetric* find(const std::string& name) const;
    std::vector<const TieredMetric*> in_tier(Tier t) const;
    std::size_t count(Tier t) const;
};

// Grades against an already loaded reference database.
GradeReport grade_against(const ResultRecord& test, Phase phase, const HistoricalDatabase& db, const Schema& schema,
                          const GradingSettings& settings, ReferenceStatsCache* cache = nullptr);

// Loads the scenario database named by the record's Scenario field. Throws
// ReferenceDatabaseMissing before any computation when it does not exist.
GradeReport grade(const ResultRecord& test, Phase phase, const Schema& schema, const GradingSettings& settings,
                  const StorageSettings& storage, ReferenceStatsCache* cache = nullptr);

} // namespace dockeval
