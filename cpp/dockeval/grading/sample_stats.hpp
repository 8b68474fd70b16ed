// ============================================================================
// Fragment 5.1 - Grading: Sample Statistics (Summary, Welford, Trimming)
// File: cpp/dockeval/grading/sample_stats.hpp
// ============================================================================
//
// Purpose:
// - Descriptive statistics of one reference column (a metric across the
//   historical flights of a scenario):
//     count, mean, sample/population variance (Welford), min/max
// - One-pass +-k sigma outlier trimming.
// - Column shape predicates used by the classification chain (distinct
//   values, non-negative integer counts).
//
// Conventions:
// - "std" without qualifier is the sample standard deviation (n-1); it is
//   NaN for fewer than two samples.
// - NaN samples are never pushed; callers drop missing values first.
//
// ============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace dockeval::stats {

// -----------------------------
// OnlineStats (Welford)
// -----------------------------
struct OnlineStats final {
    std::uint64_t n = 0;
    double mean = 0.0;
    double M2 = 0.0; // sum of squares of differences from the current mean
    double min_v = std::numeric_limits<double>::infinity();
    double max_v = -std::numeric_limits<double>::infinity();

    void push(double x) noexcept {
        if (std::isnan(x)) return;
        ++n;
        if (x < min_v) min_v = x;
        if (x > max_v) max_v = x;

        const double delta = x - mean;
        mean += delta / static_cast<double>(n);
        const double delta2 = x - mean;
        M2 += delta * delta2;
    }

    void extend(const std::vector<double>& xs) noexcept {
        for (double x : xs) push(x);
    }

    double mean_or_nan() const noexcept {
        return n == 0 ? std::numeric_limits<double>::quiet_NaN() : mean;
    }

    double variance_population() const noexcept {
        if (n == 0) return std::numeric_limits<double>::quiet_NaN();
        const double v = M2 / static_cast<double>(n);
        return v < 0.0 ? 0.0 : v;
    }

    double variance_sample() const noexcept {
        if (n < 2) return std::numeric_limits<double>::quiet_NaN();
        const double v = M2 / static_cast<double>(n - 1);
        return v < 0.0 ? 0.0 : v;
    }

    double stddev_population() const noexcept { return std::sqrt(variance_population()); }
    double stddev_sample() const noexcept { return std::sqrt(variance_sample()); }
};

inline OnlineStats summarize(const std::vector<double>& xs) noexcept {
    OnlineStats s;
    s.extend(xs);
    return s;
}

inline double mean(const std::vector<double>& xs) noexcept { return summarize(xs).mean_or_nan(); }
inline double stddev_sample(const std::vector<double>& xs) noexcept { return summarize(xs).stddev_sample(); }
inline double stddev_population(const std::vector<double>& xs) noexcept {
    return summarize(xs).stddev_population();
}

// Keeps values inside [mean - k*std, mean + k*std] (inclusive, sample std).
// Fewer than two samples are returned unchanged.
inline std::vector<double> trim_outliers(const std::vector<double>& xs, double k) {
    const OnlineStats s = summarize(xs);
    if (s.n < 2) return xs;
    const double sd = s.stddev_sample();
    const double lo = s.mean - k * sd;
    const double hi = s.mean + k * sd;

    std::vector<double> out;
    out.reserve(xs.size());
    for (double x : xs) {
        if (x >= lo && x <= hi) out.push_back(x);
    }
    return out;
}

inline std::size_t distinct_count(std::vector<double> xs) {
    std::sort(xs.begin(), xs.end());
    return static_cast<std::size_t>(std::unique(xs.begin(), xs.end()) - xs.begin());
}

// Every value is a finite, non-negative whole number.
inline bool all_nonnegative_whole(const std::vector<double>& xs) noexcept {
    for (double x : xs) {
        if (!std::isfinite(x) || x < 0.0 || x != std::floor(x)) return false;
    }
    return true;
}

} // namespace dockeval::stats
