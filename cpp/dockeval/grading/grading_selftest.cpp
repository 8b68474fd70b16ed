/*
  Fragment 5.10 - Grading Selftest

  Objective
  ---------
  Framework-free checks for the statistics behind grading:
    1) Normality tests: applicability limits and the lenient OR.
    2) Excess-zeros test, including the all-zero shortcut.
    3) Power and quantile transforms.
    4) Distribution classification chain.
    5) Tier borders: monotone, clamped at zero, zero fast path, nearest-rank.
    6) Weights: constant columns get 0, the rest sum to 1.
    7) Scoring capability, rounding and the relevance-weighted final score.
    8) Reference statistics cache hits and misses.

  Expected use
  ------------
      ./dockeval_grading_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <boost/math/distributions/normal.hpp>

#include "dockeval/core/errors.hpp"
#include "dockeval/core/settings.hpp"
#include "dockeval/grading/distribution.hpp"
#include "dockeval/grading/normality.hpp"
#include "dockeval/grading/reference_cache.hpp"
#include "dockeval/grading/sample_stats.hpp"
#include "dockeval/grading/scoring.hpp"
#include "dockeval/grading/tiering.hpp"
#include "dockeval/grading/transforms.hpp"
#include "dockeval/grading/weighting.hpp"
#include "dockeval/grading/zero_inflation.hpp"

namespace dockeval {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
    ++g_fail_count;
    std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
    std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
    if (!v) fail(msg);
    else pass(msg);
}

void expect_near(double a, double b, double tol, std::string_view msg) {
    if (!(std::fabs(a - b) <= tol)) {
        fail(msg);
        std::cerr << "  got " << a << " expected " << b << "\n";
    } else {
        pass(msg);
    }
}

// Blom plotting positions of the standard normal: an ideal normal sample.
std::vector<double> normal_scores(std::size_t n, double mu = 0.0, double sigma = 1.0) {
    const boost::math::normal_distribution<double> nd(0.0, 1.0);
    std::vector<double> out;
    for (std::size_t i = 1; i <= n; ++i) {
        const double p = (static_cast<double>(i) - 0.375) / (static_cast<double>(n) + 0.25);
        out.push_back(mu + sigma * boost::math::quantile(nd, p));
    }
    return out;
}

ClassifiedMetric classified(DistributionType type, std::vector<double> values) {
    ClassifiedMetric cm;
    cm.type = type;
    cm.values = std::move(values);
    return cm;
}

void test_normality() {
    const std::vector<double> ideal = normal_scores(30, 10.0, 2.0);
    const stats::TestResult sw = stats::shapiro_wilk(ideal);
    expect_true(sw.applicable && sw.statistic > 0.97 && sw.p_value > 0.5, "shapiro: ideal sample not rejected");
    expect_true(stats::is_normal(ideal, 0.05), "normality: ideal sample is normal");

    const stats::TestResult three = stats::shapiro_wilk({1.0, 2.0, 3.0});
    expect_near(three.p_value, 1.0, 1e-9, "shapiro: n=3 equally spaced has p=1");

    expect_true(!stats::shapiro_wilk({1.0, 2.0}).applicable, "shapiro: n<3 not applicable");
    expect_true(!stats::shapiro_wilk({4.0, 4.0, 4.0, 4.0}).applicable, "shapiro: zero range not applicable");
    expect_true(!stats::dagostino_k2({1, 2, 3, 4, 5, 6, 7}).applicable, "k2: n<8 not applicable");
    expect_true(!stats::is_normal({5.0, 5.0}, 0.05), "normality: no applicable test does not vote normal");

    std::vector<double> spike(14, 1.0);
    spike.push_back(50.0);
    expect_true(!stats::is_normal(spike, 0.05), "normality: single spike rejected by every test");

    const stats::AndersonResult ad = stats::anderson_darling_normal(ideal);
    bool crit_up = true;
    for (std::size_t k = 1; k < ad.critical_values.size(); ++k) {
        crit_up = crit_up && ad.critical_values[k] > ad.critical_values[k - 1];
    }
    expect_true(ad.applicable && crit_up && ad.statistic < ad.critical_values[2],
                "anderson: increasing critical values, ideal sample below 3rd");
}

void test_zero_inflation() {
    expect_true(stats::is_zero_inflated({0, 0, 0, 0}, 0.05), "zero-inflation: all zeros");
    expect_true(!stats::is_zero_inflated({}, 0.05), "zero-inflation: empty column");

    std::vector<double> excess(10, 0.0);
    for (double v : {5, 6, 7, 5, 6, 7, 8, 5, 6, 7}) excess.push_back(v);
    const stats::ZeroInflationResult r = stats::zero_inflation_test(excess, 0.05);
    expect_true(r.zero_inflated && r.p_value < 1e-6, "zero-inflation: 10 zeros against mean 3.1");

    expect_true(!stats::is_zero_inflated({1, 2, 3, 2, 1, 2, 3, 4, 2, 1}, 0.05),
                "zero-inflation: Poisson-like counts");
}

void test_transforms() {
    expect_near(stats::box_cox(std::exp(1.0), 0.0), 1.0, 1e-12, "box-cox: lambda 0 is log");
    expect_near(stats::box_cox(3.0, 1.0), 2.0, 1e-12, "box-cox: lambda 1 is x-1");
    expect_true(std::isinf(stats::box_cox(0.0, 0.5)), "box-cox: x <= 0 maps to -inf");
    expect_near(stats::yeo_johnson(2.5, 1.0), 2.5, 1e-12, "yeo-johnson: lambda 1 is identity (x >= 0)");
    expect_near(stats::yeo_johnson(-1.0, 1.0), -1.0, 1e-12, "yeo-johnson: lambda 1 is identity (x < 0)");

    std::vector<double> lognormal;
    for (double z : normal_scores(40)) lognormal.push_back(std::exp(z));
    const stats::PowerTransform bc = stats::PowerTransform::fit(stats::PowerMethod::kBoxCox, lognormal);
    expect_near(bc.lambda(), 0.0, 0.2, "box-cox: lognormal sample fits lambda near 0");

    const std::vector<double> t = bc.apply_all(lognormal);
    const stats::OnlineStats ts = stats::summarize(t);
    expect_near(ts.mean, 0.0, 1e-9, "box-cox: standardized mean 0");
    expect_near(ts.stddev_population(), 1.0, 1e-9, "box-cox: standardized population std 1");
    expect_true(std::string(bc.name()) == "box-cox", "box-cox: name");

    try {
        stats::PowerTransform::fit(stats::PowerMethod::kBoxCox, {1.0, 0.0, 2.0});
        fail("box-cox: non-positive data must throw");
    } catch (const ValidationError&) {
        pass("box-cox: non-positive data rejected");
    }

    std::vector<double> ramp;
    for (int i = 1; i <= 11; ++i) ramp.push_back(static_cast<double>(i));
    const stats::QuantileNormalTransform qt = stats::QuantileNormalTransform::fit(ramp, 100);
    expect_true(qt.quantiles().size() == 11, "quantile: min(max_quantiles, n) references");
    expect_near(qt.apply(6.0), 0.0, 1e-9, "quantile: median maps to 0");
    expect_true(qt.apply(1.0) < -5.0 && qt.apply(11.0) > 5.0, "quantile: ends clip at 1e-7");
    expect_true(qt.apply(3.0) < qt.apply(4.0), "quantile: monotone");

    expect_near(stats::interp(2.5, {1, 2, 3}, {10, 20, 30}), 25.0, 1e-12, "interp: inside");
    expect_near(stats::interp(0.0, {1, 2, 3}, {10, 20, 30}), 10.0, 0.0, "interp: clamped left");
    expect_near(stats::interp(9.0, {1, 2, 3}, {10, 20, 30}), 30.0, 0.0, "interp: clamped right");
}

void test_classification() {
    const GradingSettings gs;

    ReferenceColumn normal{"LatOffAvg_FA", normal_scores(30, 1.0, 0.2), false, false};
    const ClassifiedMetric n = classify_and_prepare(normal, gs);
    expect_true(n.type == DistributionType::kNormal && !n.transform, "classify: normal column");

    ReferenceColumn zeros{"THCxErr_FA", {}, true, false};
    zeros.values.assign(10, 0.0);
    for (double v : {5, 6, 7, 5, 6, 7, 8, 5, 6, 7}) zeros.values.push_back(v);
    expect_true(classify_and_prepare(zeros, gs).type == DistributionType::kZeroInflated,
                "classify: integer column with excess zeros");

    ReferenceColumn zeros_with_nulls = zeros;
    zeros_with_nulls.has_nulls = true;
    expect_true(classify_and_prepare(zeros_with_nulls, gs).type != DistributionType::kZeroInflated,
                "classify: nulls disqualify the count test");

    const ReferenceColumn constant{"Duration_FA", {3, 3, 3, 3}, true, false};
    const ClassifiedMetric c = classify_and_prepare(constant, gs);
    expect_true(c.type == DistributionType::kNonNormal && c.values.size() == 4, "classify: constant column");

    ReferenceColumn skewed{"Fuel_Total", {}, false, false};
    for (double z : normal_scores(40)) skewed.values.push_back(std::exp(2.0 * z));
    const ClassifiedMetric s = classify_and_prepare(skewed, gs);
    expect_true(s.type == DistributionType::kNormal && s.transform != nullptr &&
                    s.transformed.size() == s.values.size(),
                "classify: skewed column normalized by a transform");
}

void test_tiering() {
    const GradingSettings gs;
    const ClassifiedMetric n = classified(DistributionType::kNormal, {8, 9, 10, 11, 12});

    const TieredMetric mid = tier_metric("m", 10.0, n, gs);
    const double sd = std::sqrt(2.5);
    expect_near(mid.borders[0], 10.0 - 2.0 * sd, 1e-12, "tier: normal border mean - 2 sd");
    expect_near(mid.borders[3], 10.0 + 2.0 * sd, 1e-12, "tier: normal border mean + 2 sd");
    expect_true(mid.tier == Tier::kNormal, "tier: mean is Normal");
    expect_true(tier_metric("m", 7.0, n, gs).tier == Tier::kGood, "tier: between -2 sd and -1 sd is Good");
    expect_true(tier_metric("m", 20.0, n, gs).tier == Tier::kVeryPoor, "tier: above +2 sd is Very Poor");
    expect_true(tier_metric("m", 0.0, classified(DistributionType::kNormal, {50, 60, 70}), gs).tier ==
                    Tier::kExcellent,
                "tier: zero fast path");

    const TieredMetric clamped = tier_metric("m", 1.0, classified(DistributionType::kNormal, {0, 1, 2}), gs);
    expect_true(clamped.borders[0] == 0.0 && clamped.borders[1] == 0.0, "tier: borders clamped at 0");
    bool mono = true;
    for (std::size_t k = 1; k < 4; ++k) mono = mono && clamped.borders[k - 1] <= clamped.borders[k];
    expect_true(mono, "tier: normal borders non-decreasing");

    std::vector<double> ramp;
    for (int i = 1; i <= 100; ++i) ramp.push_back(static_cast<double>(i));
    const ClassifiedMetric nn = classified(DistributionType::kNonNormal, ramp);
    const TieredMetric p = tier_metric("m", 50.0, nn, gs);
    expect_true(p.borders[0] == 3.0 && p.borders[1] == 16.0 && p.borders[2] == 85.0 && p.borders[3] == 98.0,
                "tier: nearest-rank borders at 2.3/15.9/84.1/97.7 %");
    expect_true(p.percentile && std::fabs(*p.percentile - 0.5) < 1e-12 && p.tier == Tier::kNormal,
                "tier: percentile rank and Normal");
    const TieredMetric low = tier_metric("m", 0.5, nn, gs);
    expect_true(low.percentile && *low.percentile == 0.0 && low.tier == Tier::kExcellent,
                "tier: new minimum has percentile 0");

    const TieredMetric missing = tier_metric("m", std::nan(""), n, gs);
    expect_true(missing.tier == Tier::kNotTierable && !missing.note.empty(), "tier: NaN value is Not Tierable");
}

void test_weighting() {
    const std::vector<std::string> names{"a", "b", "c"};
    const std::vector<std::vector<double>> rows{{1, 2, 7}, {2, 1, 7}, {3, 4, 7}, {4, 3, 7}, {5, 5, 7}};

    for (WeightingMethod m : {WeightingMethod::kGini, WeightingMethod::kCritic}) {
        const MetricWeights w = compute_phase_weights(names, rows, m);
        const char* label = m == WeightingMethod::kGini ? "gini" : "critic";
        expect_true(w.weight("c") == 0.0, std::string(label) + ": constant column weight 0");
        expect_near(w.sum(), 1.0, 1e-12, std::string(label) + ": weights sum to 1");
        expect_true(w.weight("a") > 0.0 && w.weight("b") > 0.0, std::string(label) + ": variable columns weighted");
    }

    const MetricWeights none = compute_phase_weights({"a"}, {{1}, {1}}, WeightingMethod::kGini);
    expect_true(none.sum() == 0.0, "weights: no variable column gives all zeros");

    try {
        compute_phase_weights(names, {{1, 2}}, WeightingMethod::kGini);
        fail("weights: short row must throw");
    } catch (const ValidationError&) {
        pass("weights: short row rejected");
    }
}

GradeReport report_for(Phase phase, Tier a, Tier b) {
    GradeReport r;
    r.phase = phase;
    TieredMetric ma;
    ma.name = "a";
    ma.tier = a;
    TieredMetric mb;
    mb.name = "b";
    mb.tier = b;
    TieredMetric opt;
    opt.name = "opt";
    r.tiered = {ma, mb, opt};
    r.required_columns = {"a", "b"};
    r.required_rows = {{1, 2}, {2, 1}, {3, 4}, {4, 3}, {5, 5}};
    return r;
}

void test_scoring() {
    GradingSettings gs;
    expect_true(!ScoringCapability::from_settings(gs), "scoring: locked by default");
    gs.scoring_unlocked = true;
    const std::optional<ScoringCapability> cap = ScoringCapability::from_settings(gs);
    expect_true(cap.has_value(), "scoring: unlocked session yields a capability");
    if (!cap) return;

    expect_near(round_score(2.344), 2.34, 1e-12, "scoring: round down");
    expect_near(round_score(2.346), 2.35, 1e-12, "scoring: round up");

    const GradeReport align = report_for(Phase::kAlign, Tier::kExcellent, Tier::kPoor);
    const PhaseScore ps = score_phase(*cap, align, gs);
    const double expected = round_score(ps.weights.weight("a") * 1.0 + ps.weights.weight("b") * 4.0);
    expect_near(ps.sub_score, expected, 1e-12, "scoring: sub-score = sum(weight * tier factor)");
    expect_true(ps.weights.weight("opt") == 0.0, "scoring: Not Tierable metric carries no weight");

    const std::vector<GradeReport> reports{
        align, report_for(Phase::kAppr, Tier::kGood, Tier::kGood), report_for(Phase::kFA, Tier::kVeryPoor, Tier::kVeryPoor),
        report_for(Phase::kTotal, Tier::kVeryPoor, Tier::kVeryPoor)};
    const FlightScore fs = compute_score(*cap, reports, gs);
    expect_near(fs.phases[1].sub_score, 2.0, 1e-12, "scoring: all Good scores 2");
    expect_near(fs.phases[2].sub_score, 5.0, 1e-12, "scoring: all Very Poor scores 5");
    expect_near(fs.final_score, round_score(0.2 * fs.phases[0].sub_score + 0.3 * 2.0 + 0.5 * 5.0), 1e-12,
                "scoring: relevance-weighted final score, Total excluded");

    try {
        compute_score(*cap, {align}, gs);
        fail("scoring: missing phases must throw");
    } catch (const ValidationError&) {
        pass("scoring: missing phases rejected");
    }
}

void test_reference_cache() {
    GradingSettings gs;
    ReferenceStatsCache cache(2);
    const ReferenceColumn col{"LatOffAvg_FA", normal_scores(20, 1.0, 0.2), false, false};

    const auto first = cache.get_or_classify("Soyuz", col, gs);
    const auto second = cache.get_or_classify("Soyuz", col, gs);
    expect_true(first == second && cache.stats().hits == 1 && cache.stats().misses == 1,
                "cache: second lookup is a hit");

    cache.get_or_classify("Progress", col, gs);
    expect_true(cache.stats().misses == 2, "cache: scenario is part of the key");

    gs.alpha = 0.01;
    cache.get_or_classify("Soyuz", col, gs);
    expect_true(cache.stats().misses == 3 && cache.size() == 2 && cache.stats().evictions == 1,
                "cache: settings are part of the key; LRU bound holds");
}

} // namespace
} // namespace dockeval

int main() {
    using namespace dockeval;

    try {
        test_normality();
        test_zero_inflation();
        test_transforms();
        test_classification();
        test_tiering();
        test_weighting();
        test_scoring();
        test_reference_cache();
    } catch (const std::exception& e) {
        fail(std::string("unexpected exception: ") + e.what());
    }

    if (g_fail_count != 0) {
        std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
        return 1;
    }
    std::cerr << "\nAll selftests passed.\n";
    return 0;
}
