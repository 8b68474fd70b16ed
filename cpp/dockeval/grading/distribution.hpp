/*
===============================================================================
Fragment 5.6 - Grading: Distribution Classification
File: cpp/dockeval/grading/distribution.hpp
===============================================================================

Purpose:
  Classify one reference column (a metric across the historical flights of a
  scenario) and prepare what the tiering step needs:

    1. trim at mean +- outlier_sigma * std (one pass)
    2. zero-inflated count column         -> zero-inflated (trimmed values)
    3. empty / single distinct value      -> non-normal (raw values)
    4. trimmed values pass normality      -> normal
    5. Box-Cox (all > 0), then Yeo-Johnson -> normal with transform
    6. quantile-to-normal                 -> normal with transform
    7. otherwise                          -> count-non-normal / non-normal (raw)

  Degenerate columns never throw; the chain ends in a non-normal class.
===============================================================================
*/

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "dockeval/core/settings.hpp"
#include "dockeval/grading/transforms.hpp"

namespace dockeval {

enum class DistributionType : int {
    kNormal = 0,
    kNonNormal = 1,
    kCountNonNormal = 2,
    kZeroInflated = 3,
};

const char* distribution_name(DistributionType t) noexcept;

// One metric column of the reference database. Null entries are dropped from
// `values`; `has_nulls` records that they existed.
struct ReferenceColumn final {
    std::string name;
    std::vector<double> values;
    bool integral = true;   // every non-null entry was written as a JSON integer
    bool has_nulls = false;
};

// Integer-typed column of non-negative values.
bool is_count_column(const ReferenceColumn& col, const std::vector<double>& values);

struct ClassifiedMetric final {
    DistributionType type = DistributionType::kNonNormal;

    // Reference distribution reported for the metric (trimmed or raw).
    std::vector<double> values;

    // Set when a transform made the column normal; `transformed` holds
    // transform->apply() of `values`.
    std::shared_ptr<const stats::ITransform> transform;
    std::vector<double> transformed;
};

ClassifiedMetric classify_and_prepare(const ReferenceColumn& col, const GradingSettings& settings);

} // namespace dockeval
