// ============================================================================
// Fragment 5.4 - Grading: Excess-Zeros Test (Implementation)
// File: cpp/dockeval/grading/zero_inflation.cpp
// ============================================================================

#include "dockeval/grading/zero_inflation.hpp"

#include "dockeval/grading/sample_stats.hpp"

#include <cmath>
#include <cstddef>

#include <boost/math/distributions/chi_squared.hpp>

namespace dockeval::stats {

ZeroInflationResult zero_inflation_test(const std::vector<double>& xs, double alpha) {
    ZeroInflationResult r;
    if (xs.empty()) return r;

    std::size_t zeros = 0;
    for (double x : xs) {
        if (x == 0.0) ++zeros;
    }
    if (zeros == xs.size()) {
        r.zero_inflated = true;
        r.p_value = 0.0;
        return r;
    }

    const double n = static_cast<double>(xs.size());
    const double n0 = static_cast<double>(zeros);
    const double mu = mean(xs);
    const double p0 = std::exp(-mu);

    const double num = (n0 - n * p0) * (n0 - n * p0);
    const double den = n * p0 * (1.0 - p0) - n * mu * p0 * p0;
    const double stat = num / den;
    r.statistic = stat;

    if (std::isnan(stat) || stat <= 0.0) return r;
    if (std::isinf(stat)) {
        r.zero_inflated = true;
        r.p_value = 0.0;
        return r;
    }

    const boost::math::chi_squared_distribution<double> chi2(1.0);
    r.p_value = boost::math::cdf(boost::math::complement(chi2, stat));
    r.zero_inflated = r.p_value < alpha;
    return r;
}

} // namespace dockeval::stats
