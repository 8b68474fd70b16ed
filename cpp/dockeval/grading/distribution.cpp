/*
===============================================================================
Fragment 5.6 - Grading: Distribution Classification (Implementation)
File: cpp/dockeval/grading/distribution.cpp
===============================================================================
*/

#include "dockeval/grading/distribution.hpp"

#include "dockeval/core/errors.hpp"
#include "dockeval/core/logging.hpp"
#include "dockeval/grading/normality.hpp"
#include "dockeval/grading/sample_stats.hpp"
#include "dockeval/grading/zero_inflation.hpp"

#include <algorithm>
#include <utility>

namespace dockeval {

namespace {

// Fits `t`, applies it and keeps it when the result passes normality.
bool try_transform(std::shared_ptr<const stats::ITransform> t, const std::vector<double>& values, double alpha,
                   ClassifiedMetric& out) {
    std::vector<double> transformed = t->apply_all(values);
    if (!stats::is_normal(transformed, alpha)) return false;
    out.type = DistributionType::kNormal;
    out.values = values;
    out.transform = std::move(t);
    out.transformed = std::move(transformed);
    return true;
}

bool all_positive(const std::vector<double>& xs) {
    return std::all_of(xs.begin(), xs.end(), [](double x) { return x > 0.0; });
}

ClassifiedMetric classify(const ReferenceColumn& col, const GradingSettings& settings) {
    ClassifiedMetric out;
    const std::vector<double> trimmed = stats::trim_outliers(col.values, settings.outlier_sigma);

    if (!trimmed.empty() && is_count_column(col, trimmed) && stats::is_zero_inflated(trimmed, settings.alpha)) {
        out.type = DistributionType::kZeroInflated;
        out.values = trimmed;
        return out;
    }

    if (trimmed.empty() || stats::distinct_count(trimmed) <= 1) {
        out.type = DistributionType::kNonNormal;
        out.values = col.values;
        return out;
    }

    if (stats::is_normal(trimmed, settings.alpha)) {
        out.type = DistributionType::kNormal;
        out.values = trimmed;
        return out;
    }

    if (all_positive(trimmed)) {
        try {
            auto bc = std::make_shared<stats::PowerTransform>(
                stats::PowerTransform::fit(stats::PowerMethod::kBoxCox, trimmed));
            if (try_transform(std::move(bc), trimmed, settings.alpha, out)) return out;
        } catch (const NumericalError& e) {
            log(LogLevel::DEBUG, col.name + ": Box-Cox fit rejected: " + e.what());
        }
    }

    try {
        auto yj = std::make_shared<stats::PowerTransform>(
            stats::PowerTransform::fit(stats::PowerMethod::kYeoJohnson, trimmed));
        if (try_transform(std::move(yj), trimmed, settings.alpha, out)) return out;
    } catch (const NumericalError& e) {
        log(LogLevel::DEBUG, col.name + ": Yeo-Johnson fit rejected: " + e.what());
    }

    try {
        auto qt = std::make_shared<stats::QuantileNormalTransform>(stats::QuantileNormalTransform::fit(
            trimmed, static_cast<std::size_t>(settings.max_quantiles)));
        if (try_transform(std::move(qt), trimmed, settings.alpha, out)) return out;
    } catch (const NumericalError& e) {
        log(LogLevel::DEBUG, col.name + ": quantile transform rejected: " + e.what());
    }

    out.type = is_count_column(col, col.values) ? DistributionType::kCountNonNormal : DistributionType::kNonNormal;
    out.values = col.values;
    out.transform.reset();
    out.transformed.clear();
    return out;
}

} // namespace

const char* distribution_name(DistributionType t) noexcept {
    switch (t) {
        case DistributionType::kNormal: return "normal";
        case DistributionType::kNonNormal: return "non-normal";
        case DistributionType::kCountNonNormal: return "count-non-normal";
        case DistributionType::kZeroInflated: return "zero-inflated";
    }
    return "unknown";
}

bool is_count_column(const ReferenceColumn& col, const std::vector<double>& values) {
    return col.integral && !col.has_nulls && stats::all_nonnegative_whole(values);
}

ClassifiedMetric classify_and_prepare(const ReferenceColumn& col, const GradingSettings& settings) {
    ClassifiedMetric out = classify(col, settings);
    log(LogLevel::DEBUG, col.name + ": " + distribution_name(out.type) +
                             (out.transform ? std::string(" (") + out.transform->name() + ")" : std::string()) +
                             ", n=" + std::to_string(out.values.size()));
    return out;
}

} // namespace dockeval
