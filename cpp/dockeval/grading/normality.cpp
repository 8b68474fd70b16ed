// ============================================================================
// Fragment 5.3 - Grading: Normality Tests (Implementation)
// File: cpp/dockeval/grading/normality.cpp
// ============================================================================

#include "dockeval/grading/normality.hpp"

#include "dockeval/grading/sample_stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

#include <boost/math/distributions/chi_squared.hpp>
#include <boost/math/distributions/normal.hpp>

namespace dockeval::stats {

namespace {

const boost::math::normal_distribution<double> kStdNormal(0.0, 1.0);

double poly(const double* c, int nord, double x) noexcept {
    double r = 0.0;
    for (int i = nord - 1; i >= 0; --i) r = r * x + c[i];
    return r;
}

double normal_upper_tail(double z) {
    if (std::isnan(z)) return z;
    if (z == -std::numeric_limits<double>::infinity()) return 1.0;
    if (z == std::numeric_limits<double>::infinity()) return 0.0;
    return boost::math::cdf(boost::math::complement(kStdNormal, z));
}

double log_normal_cdf(double z) {
    const double p = boost::math::cdf(kStdNormal, z);
    return p > 0.0 ? std::log(p) : -std::numeric_limits<double>::infinity();
}

double log_normal_sf(double z) {
    const double q = boost::math::cdf(boost::math::complement(kStdNormal, z));
    return q > 0.0 ? std::log(q) : -std::numeric_limits<double>::infinity();
}

// Central moments m2, m3, m4 (biased).
struct Moments final {
    double m2 = 0.0;
    double m3 = 0.0;
    double m4 = 0.0;
};

Moments central_moments(const std::vector<double>& xs) {
    const double mu = mean(xs);
    Moments m;
    for (double x : xs) {
        const double d = x - mu;
        const double d2 = d * d;
        m.m2 += d2;
        m.m3 += d2 * d;
        m.m4 += d2 * d2;
    }
    const double n = static_cast<double>(xs.size());
    m.m2 /= n;
    m.m3 /= n;
    m.m4 /= n;
    return m;
}

double skew_z(double b2, double n) {
    double y = b2 * std::sqrt(((n + 1.0) * (n + 3.0)) / (6.0 * (n - 2.0)));
    const double beta2 = (3.0 * (n * n + 27.0 * n - 70.0) * (n + 1.0) * (n + 3.0)) /
                         ((n - 2.0) * (n + 5.0) * (n + 7.0) * (n + 9.0));
    const double w2 = -1.0 + std::sqrt(2.0 * (beta2 - 1.0));
    const double delta = 1.0 / std::sqrt(0.5 * std::log(w2));
    const double alpha = std::sqrt(2.0 / (w2 - 1.0));
    if (y == 0.0) y = 1.0;
    return delta * std::log(y / alpha + std::sqrt((y / alpha) * (y / alpha) + 1.0));
}

double kurtosis_z(double b2, double n) {
    const double e = 3.0 * (n - 1.0) / (n + 1.0);
    const double varb2 = 24.0 * n * (n - 2.0) * (n - 3.0) /
                         ((n + 1.0) * (n + 1.0) * (n + 3.0) * (n + 5.0));
    const double x = (b2 - e) / std::sqrt(varb2);
    const double sqrtbeta1 = 6.0 * (n * n - 5.0 * n + 2.0) / ((n + 7.0) * (n + 9.0)) *
                             std::sqrt((6.0 * (n + 3.0) * (n + 5.0)) / (n * (n - 2.0) * (n - 3.0)));
    const double a = 6.0 + 8.0 / sqrtbeta1 *
                               (2.0 / sqrtbeta1 + std::sqrt(1.0 + 4.0 / (sqrtbeta1 * sqrtbeta1)));
    const double term1 = 1.0 - 2.0 / (9.0 * a);
    const double denom = 1.0 + x * std::sqrt(2.0 / (a - 4.0));
    if (denom == 0.0) return std::numeric_limits<double>::quiet_NaN();
    const double sign = denom > 0.0 ? 1.0 : -1.0;
    const double term2 = sign * std::cbrt((1.0 - 2.0 / a) / std::fabs(denom));
    return (term1 - term2) / std::sqrt(2.0 / (9.0 * a));
}

} // namespace

TestResult shapiro_wilk(const std::vector<double>& xs) {
    TestResult r;
    const std::size_t n = xs.size();
    if (n < 3) return r;

    std::vector<double> x = xs;
    std::sort(x.begin(), x.end());
    if (!(x.back() - x.front() > 0.0)) return r;

    // Upper-half coefficients a[0..nn2-1] pair x[n-1-i] with x[i].
    const std::size_t nn2 = n / 2;
    std::vector<double> a(nn2, 0.0);
    const double an = static_cast<double>(n);

    if (n == 3) {
        a[0] = std::sqrt(0.5);
    } else {
        static const double c1[6] = {0.0, 0.221157, -0.147981, -2.07119, 4.434685, -2.706056};
        static const double c2[6] = {0.0, 0.042981, -0.293762, -1.752461, 5.682633, -3.582633};

        std::vector<double> m(nn2);
        double summ2 = 0.0;
        for (std::size_t i = 0; i < nn2; ++i) {
            m[i] = boost::math::quantile(kStdNormal, (static_cast<double>(i + 1) - 0.375) / (an + 0.25));
            summ2 += m[i] * m[i];
        }
        summ2 *= 2.0;
        const double ssumm2 = std::sqrt(summ2);
        const double rsn = 1.0 / std::sqrt(an);
        const double a1 = poly(c1, 6, rsn) - m[0] / ssumm2;

        std::size_t i1 = 1;
        double fac = 0.0;
        if (n > 5) {
            i1 = 2;
            const double a2 = -m[1] / ssumm2 + poly(c2, 6, rsn);
            fac = std::sqrt((summ2 - 2.0 * m[0] * m[0] - 2.0 * m[1] * m[1]) /
                            (1.0 - 2.0 * a1 * a1 - 2.0 * a2 * a2));
            a[1] = a2;
        } else {
            fac = std::sqrt((summ2 - 2.0 * m[0] * m[0]) / (1.0 - 2.0 * a1 * a1));
        }
        a[0] = a1;
        for (std::size_t i = i1; i < nn2; ++i) a[i] = -m[i] / fac;
    }

    const double mu = mean(x);
    double ssq = 0.0;
    for (double v : x) ssq += (v - mu) * (v - mu);
    double num = 0.0;
    for (std::size_t i = 0; i < nn2; ++i) num += a[i] * (x[n - 1 - i] - x[i]);
    double w = num * num / ssq;
    if (w > 1.0) w = 1.0;

    r.applicable = std::isfinite(w);
    r.statistic = w;
    if (!r.applicable) return r;

    if (n == 3) {
        const double pi6 = 1.90985931710274;  // 6/pi
        const double stqr = 1.04719755119660; // asin(sqrt(3/4))
        r.p_value = std::max(0.0, pi6 * (std::asin(std::sqrt(w)) - stqr));
        return r;
    }

    static const double c3[4] = {0.544, -0.39978, 0.025054, -6.714e-4};
    static const double c4[4] = {1.3822, -0.77857, 0.062767, -0.0020322};
    static const double c5[4] = {-1.5861, -0.31082, -0.083751, 0.0038915};
    static const double c6[3] = {-0.4803, -0.082676, 0.0030302};

    const double w1 = 1.0 - w;
    if (w1 <= 0.0) {
        r.p_value = 1.0;
        return r;
    }
    double y = std::log(w1);
    double mu_w = 0.0;
    double sd_w = 0.0;
    if (n <= 11) {
        const double gamma = -2.273 + 0.459 * an;
        if (y >= gamma) {
            r.p_value = 1e-99;
            return r;
        }
        y = -std::log(gamma - y);
        mu_w = poly(c3, 4, an);
        sd_w = std::exp(poly(c4, 4, an));
    } else {
        const double ln_n = std::log(an);
        mu_w = poly(c5, 4, ln_n);
        sd_w = std::exp(poly(c6, 3, ln_n));
    }
    r.p_value = normal_upper_tail((y - mu_w) / sd_w);
    return r;
}

TestResult dagostino_k2(const std::vector<double>& xs) {
    TestResult r;
    const std::size_t n = xs.size();
    if (n < 8) return r;

    const Moments m = central_moments(xs);
    if (!(m.m2 > 0.0)) return r;

    const double nd = static_cast<double>(n);
    const double g1 = m.m3 / std::pow(m.m2, 1.5);
    const double b2 = m.m4 / (m.m2 * m.m2);
    const double zs = skew_z(g1, nd);
    const double zk = kurtosis_z(b2, nd);
    const double k2 = zs * zs + zk * zk;
    if (!std::isfinite(k2)) return r;

    r.applicable = true;
    r.statistic = k2;
    r.p_value = boost::math::cdf(boost::math::complement(boost::math::chi_squared_distribution<double>(2.0), k2));
    return r;
}

AndersonResult anderson_darling_normal(const std::vector<double>& xs) {
    AndersonResult r;
    const std::size_t n = xs.size();
    if (n < 2) return r;

    std::vector<double> y = xs;
    std::sort(y.begin(), y.end());
    const OnlineStats s = summarize(y);
    const double sd = s.stddev_sample();
    if (!(sd > 0.0)) return r;

    const double nd = static_cast<double>(n);
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double wi = (y[i] - s.mean) / sd;
        const double wr = (y[n - 1 - i] - s.mean) / sd;
        sum += (2.0 * static_cast<double>(i + 1) - 1.0) / nd * (log_normal_cdf(wi) + log_normal_sf(wr));
    }
    const double a2 = -nd - sum;

    static const double avals[5] = {0.576, 0.656, 0.787, 0.918, 1.092};
    const double scale = 1.0 + 4.0 / nd - 25.0 / (nd * nd);
    for (std::size_t k = 0; k < 5; ++k) {
        r.critical_values[k] = std::round(avals[k] / scale * 1000.0) / 1000.0;
    }
    r.statistic = a2;
    r.applicable = std::isfinite(a2);
    return r;
}

bool is_normal(const std::vector<double>& xs, double alpha) {
    const TestResult sw = shapiro_wilk(xs);
    if (sw.applicable && sw.p_value > alpha) return true;

    const TestResult k2 = dagostino_k2(xs);
    if (k2.applicable && k2.p_value > alpha) return true;

    const AndersonResult ad = anderson_darling_normal(xs);
    return ad.applicable && ad.statistic < ad.critical_values[2];
}

} // namespace dockeval::stats
