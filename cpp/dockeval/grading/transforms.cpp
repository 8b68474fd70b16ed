/*
===============================================================================
Fragment 5.5 - Grading: Normalizing Transforms (Implementation)
File: cpp/dockeval/grading/transforms.cpp
===============================================================================
*/

#include "dockeval/grading/transforms.hpp"

#include "dockeval/core/errors.hpp"
#include "dockeval/grading/sample_stats.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include <boost/math/distributions/normal.hpp>
#include <boost/math/tools/minima.hpp>

namespace dockeval::stats {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kLambdaMin = -10.0;
constexpr double kLambdaMax = 10.0;
constexpr double kBoundsThreshold = 1e-7;

bool near_zero(double v) noexcept { return std::fabs(v) < std::numeric_limits<double>::epsilon(); }

double population_variance(const std::vector<double>& xs) {
    return summarize(xs).variance_population();
}

} // namespace

double box_cox(double x, double lambda) {
    if (!(x > 0.0)) return -kInf;
    if (near_zero(lambda)) return std::log(x);
    return (std::pow(x, lambda) - 1.0) / lambda;
}

double yeo_johnson(double x, double lambda) {
    if (x >= 0.0) {
        if (near_zero(lambda)) return std::log1p(x);
        return (std::pow(x + 1.0, lambda) - 1.0) / lambda;
    }
    if (near_zero(lambda - 2.0)) return -std::log1p(-x);
    return -(std::pow(-x + 1.0, 2.0 - lambda) - 1.0) / (2.0 - lambda);
}

double box_cox_neg_llf(const std::vector<double>& xs, double lambda) {
    double sum_log = 0.0;
    std::vector<double> t;
    t.reserve(xs.size());
    for (double x : xs) {
        if (!(x > 0.0)) return kInf;
        sum_log += std::log(x);
        t.push_back(box_cox(x, lambda));
    }
    const double var = population_variance(t);
    if (!(var > std::numeric_limits<double>::min()) || !std::isfinite(var)) return kInf;
    const double n = static_cast<double>(xs.size());
    const double llf = (lambda - 1.0) * sum_log - 0.5 * n * std::log(var);
    return -llf;
}

double yeo_johnson_neg_llf(const std::vector<double>& xs, double lambda) {
    double sum_log = 0.0;
    std::vector<double> t;
    t.reserve(xs.size());
    for (double x : xs) {
        const double sign = (x > 0.0) ? 1.0 : ((x < 0.0) ? -1.0 : 0.0);
        sum_log += sign * std::log1p(std::fabs(x));
        t.push_back(yeo_johnson(x, lambda));
    }
    const double var = population_variance(t);
    if (!(var > std::numeric_limits<double>::min()) || !std::isfinite(var)) return kInf;
    const double n = static_cast<double>(xs.size());
    const double llf = -0.5 * n * std::log(var) + (lambda - 1.0) * sum_log;
    return -llf;
}

// -----------------------------
// PowerTransform
// -----------------------------
PowerTransform PowerTransform::fit(PowerMethod method, const std::vector<double>& xs) {
    if (xs.size() < 2) throw NumericalError("PowerTransform: need at least two samples");
    if (method == PowerMethod::kBoxCox) {
        for (double x : xs) {
            if (!(x > 0.0)) throw ValidationError("PowerTransform: Box-Cox requires strictly positive data");
        }
    }

    auto objective = [&](double lambda) {
        return method == PowerMethod::kBoxCox ? box_cox_neg_llf(xs, lambda) : yeo_johnson_neg_llf(xs, lambda);
    };
    const int bits = std::numeric_limits<double>::digits / 2;
    const auto best = boost::math::tools::brent_find_minima(objective, kLambdaMin, kLambdaMax, bits);
    const double lambda = best.first;
    if (!std::isfinite(lambda) || !std::isfinite(best.second)) {
        throw NumericalError(std::string("PowerTransform: ") +
                             (method == PowerMethod::kBoxCox ? "Box-Cox" : "Yeo-Johnson") +
                             " likelihood has no finite optimum");
    }

    std::vector<double> t;
    t.reserve(xs.size());
    for (double x : xs) {
        const double v = method == PowerMethod::kBoxCox ? box_cox(x, lambda) : yeo_johnson(x, lambda);
        if (!std::isfinite(v)) throw NumericalError("PowerTransform: transformed column is not finite");
        t.push_back(v);
    }
    const OnlineStats s = summarize(t);
    double scale = s.stddev_population();
    if (!std::isfinite(scale)) throw NumericalError("PowerTransform: transformed scale is not finite");
    if (scale == 0.0) scale = 1.0;
    return PowerTransform(method, lambda, s.mean, scale);
}

const char* PowerTransform::name() const noexcept {
    return method_ == PowerMethod::kBoxCox ? "box-cox" : "yeo-johnson";
}

double PowerTransform::apply(double x) const {
    const double v = method_ == PowerMethod::kBoxCox ? box_cox(x, lambda_) : yeo_johnson(x, lambda_);
    return (v - mean_) / scale_;
}

// -----------------------------
// Quantile-to-normal
// -----------------------------
double interp(double x, const std::vector<double>& xp, const std::vector<double>& fp) {
    if (xp.empty()) return std::numeric_limits<double>::quiet_NaN();
    if (std::isnan(x)) return x;
    if (x < xp.front()) return fp.front();
    if (x >= xp.back()) return fp.back();

    const auto it = std::upper_bound(xp.begin(), xp.end(), x);
    const auto j = static_cast<std::size_t>(it - xp.begin()) - 1;
    const double dx = xp[j + 1] - xp[j];
    const double slope = (fp[j + 1] - fp[j]) / dx;
    return fp[j] + slope * (x - xp[j]);
}

double percentile_linear(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return std::numeric_limits<double>::quiet_NaN();
    const double pos = p * static_cast<double>(sorted.size() - 1);
    const auto lo = static_cast<std::size_t>(std::floor(pos));
    if (lo + 1 >= sorted.size()) return sorted.back();
    const double frac = pos - static_cast<double>(lo);
    return sorted[lo] + frac * (sorted[lo + 1] - sorted[lo]);
}

QuantileNormalTransform QuantileNormalTransform::fit(const std::vector<double>& xs, std::size_t max_quantiles) {
    std::vector<double> sorted;
    sorted.reserve(xs.size());
    for (double x : xs) {
        if (!std::isnan(x)) sorted.push_back(x);
    }
    if (sorted.empty()) throw NumericalError("QuantileNormalTransform: empty column");
    std::sort(sorted.begin(), sorted.end());

    const std::size_t nq = std::max<std::size_t>(2, std::min(max_quantiles, sorted.size()));
    std::vector<double> refs(nq);
    std::vector<double> q(nq);
    for (std::size_t i = 0; i < nq; ++i) {
        refs[i] = static_cast<double>(i) / static_cast<double>(nq - 1);
        q[i] = percentile_linear(sorted, refs[i]);
        if (i > 0 && q[i] < q[i - 1]) q[i] = q[i - 1];
    }
    return QuantileNormalTransform(std::move(q), std::move(refs));
}

double QuantileNormalTransform::apply(double x) const {
    if (std::isnan(x)) return x;

    static const boost::math::normal_distribution<double> std_normal(0.0, 1.0);
    const double eps = std::numeric_limits<double>::epsilon();
    static const double clip_max = boost::math::quantile(std_normal, 1.0 - (kBoundsThreshold - eps));
    static const double clip_min = boost::math::quantile(std_normal, kBoundsThreshold - eps);

    std::vector<double> neg_q(quantiles_.rbegin(), quantiles_.rend());
    std::vector<double> neg_r(references_.rbegin(), references_.rend());
    for (double& v : neg_q) v = -v;
    for (double& v : neg_r) v = -v;

    double u = 0.5 * (interp(x, quantiles_, references_) - interp(-x, neg_q, neg_r));
    if (x + kBoundsThreshold > quantiles_.back()) u = 1.0;
    if (x - kBoundsThreshold < quantiles_.front()) u = 0.0;

    if (u <= 0.0) return clip_min;
    if (u >= 1.0) return clip_max;
    return std::clamp(boost::math::quantile(std_normal, u), clip_min, clip_max);
}

} // namespace dockeval::stats
