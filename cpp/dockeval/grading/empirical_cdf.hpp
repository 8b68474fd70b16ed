/*
===============================================================================
Fragment 5.2 - Grading: Empirical CDF (Percentile Rank, Nearest-Rank Borders)
File: cpp/dockeval/grading/empirical_cdf.hpp
===============================================================================
*/

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <vector>

namespace dockeval::stats {

// -----------------------------
// Empirical CDF (ECDF)
// -----------------------------
class EmpiricalCDF final {
public:
    EmpiricalCDF() = default;
    explicit EmpiricalCDF(const std::vector<double>& xs) { extend(xs); }

    // NaN samples are ignored.
    void push(double x) {
        if (std::isnan(x)) return;
        samples_.push_back(x);
        sorted_ = false;
    }

    void extend(const std::vector<double>& xs) {
        for (double x : xs) push(x);
    }

    std::size_t size() const noexcept { return samples_.size(); }
    bool empty() const noexcept { return samples_.empty(); }

    // P(X <= x); 0 when empty or x is below every sample.
    double cdf(double x) {
        if (samples_.empty()) return 0.0;
        ensure_sorted_();
        auto it = std::upper_bound(samples_.begin(), samples_.end(), x);
        const auto k = static_cast<std::size_t>(std::distance(samples_.begin(), it));
        return static_cast<double>(k) / static_cast<double>(samples_.size());
    }

    // Nearest-rank selection: the round(n*p + 0.5)-th smallest sample, with
    // round-half-to-even. Clamped to [1, n]. Requires a non-empty sample.
    double nearest_rank(double p) {
        ensure_sorted_();
        const double n = static_cast<double>(samples_.size());
        long rank = std::lrint(n * p + 0.5);
        if (rank < 1) rank = 1;
        if (rank > static_cast<long>(samples_.size())) rank = static_cast<long>(samples_.size());
        return samples_[static_cast<std::size_t>(rank - 1)];
    }

private:
    void ensure_sorted_() {
        if (sorted_) return;
        std::sort(samples_.begin(), samples_.end());
        sorted_ = true;
    }

    std::vector<double> samples_;
    bool sorted_ = true;
};

} // namespace dockeval::stats
