// ============================================================================
// Fragment 5.4 - Grading: Excess-Zeros Test (van den Broek)
// File: cpp/dockeval/grading/zero_inflation.hpp
// ============================================================================
//
// Purpose:
// - Decide whether a count column has more zeros than a Poisson model with
//   the same mean predicts.
//
// Test:
//   p0   = exp(-mean)
//   stat = (n0 - n*p0)^2 / (n*p0*(1-p0) - n*mean*p0^2)
//   zero-inflated when the chi2(1) upper tail of stat is below alpha.
//
// Degenerate cases:
// - empty column            -> false
// - every value is zero     -> true (no statistic is computed)
// - stat NaN or <= 0        -> false
// - stat +inf               -> true
//
// ============================================================================

#pragma once

#include <vector>

namespace dockeval::stats {

struct ZeroInflationResult final {
    bool zero_inflated = false;
    double statistic = 0.0;
    double p_value = 1.0;
};

ZeroInflationResult zero_inflation_test(const std::vector<double>& xs, double alpha);

inline bool is_zero_inflated(const std::vector<double>& xs, double alpha) {
    return zero_inflation_test(xs, alpha).zero_inflated;
}

} // namespace dockeval::stats
