/*
===============================================================================
Fragment 5.7 - Grading: Tier Assignment (Implementation)
File: cpp/dockeval/grading/tiering.cpp
===============================================================================
*/

#include "dockeval/grading/tiering.hpp"

#include "dockeval/core/logging.hpp"
#include "dockeval/grading/empirical_cdf.hpp"
#include "dockeval/grading/reference_cache.hpp"
#include "dockeval/grading/sample_stats.hpp"

#include <cmath>
#include <memory>
#include <utility>

namespace dockeval {

const char* tier_name(Tier t) noexcept {
    switch (t) {
        case Tier::kExcellent: return "Excellent";
        case Tier::kGood: return "Good";
        case Tier::kNormal: return "Normal";
        case Tier::kPoor: return "Poor";
        case Tier::kVeryPoor: return "Very Poor";
        case Tier::kNotTierable: return "Not Tierable";
    }
    return "Unknown";
}

Tier bucket(double v, const std::array<double, 4>& borders) noexcept {
    if (v <= borders[0]) return Tier::kExcellent;
    if (v <= borders[1]) return Tier::kGood;
    if (v <= borders[2]) return Tier::kNormal;
    if (v <= borders[3]) return Tier::kPoor;
    return Tier::kVeryPoor;
}

TieredMetric tier_metric(const std::string& name, double test_value, const ClassifiedMetric& cm,
                         const GradingSettings& settings) {
    TieredMetric tm;
    tm.name = name;
    tm.value = test_value;
    tm.distribution = cm.type;

    const stats::OnlineStats ref = stats::summarize(cm.values);
    tm.mean = ref.mean_or_nan();
    tm.stddev = ref.stddev_sample();
    tm.reference_size = static_cast<std::size_t>(ref.n);

    if (ref.n == 0) {
        tm.note = "empty reference column";
        return tm;
    }
    if (std::isnan(test_value)) {
        tm.note = "no value in test flight";
        return tm;
    }

    if (cm.type == DistributionType::kNormal) {
        for (std::size_t k = 0; k < tm.borders.size(); ++k) {
            const double b = tm.mean + settings.sigma_multipliers[k] * tm.stddev;
            tm.borders[k] = b < 0.0 ? 0.0 : b;
        }
        if (test_value == 0.0) {
            tm.compared_value = 0.0;
            tm.tier = Tier::kExcellent;
            return tm;
        }
        tm.compared_value = test_value;
        if (cm.transform) {
            tm.transform = cm.transform->name();
            tm.compared_value = cm.transform->apply(test_value);
            const stats::OnlineStats t = stats::summarize(cm.transformed);
            const double sd = t.stddev_population();
            for (std::size_t k = 0; k < tm.borders.size(); ++k) {
                tm.borders[k] = t.mean + settings.sigma_multipliers[k] * sd;
            }
        }
    } else {
        stats::EmpiricalCDF ecdf(cm.values);
        tm.percentile = ecdf.cdf(test_value);
        for (std::size_t k = 0; k < tm.borders.size(); ++k) {
            tm.borders[k] = ecdf.nearest_rank(settings.percentile_ranks[k]);
        }
        tm.compared_value = test_value;
    }

    if (std::isnan(tm.compared_value)) {
        tm.note = "value cannot be mapped into the reference distribution";
        return tm;
    }
    tm.tier = bucket(tm.compared_value, tm.borders);
    return tm;
}

std::vector<std::string> phase_columns(const HistoricalDatabase& db, Phase phase) {
    std::vector<std::string> out;
    for (const auto& c : db.columns()) {
        if (is_identity_field(c)) continue;
        const std::optional<MetricId> id = parse_metric_name(c);
        if (!id) continue;
        if (is_flight_level_kind(id->kind)) {
            if (phase == Phase::kTotal) out.push_back(c);
            continue;
        }
        if (id->phase == phase) out.push_back(c);
    }
    return out;
}

// ---------------- GradeReport ----------------
const TieredMetric* GradeReport::find(const std::string& name) const {
    for (const auto& t : tiered) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

std::vector<const TieredMetric*> GradeReport::in_tier(Tier t) const {
    std::vector<const TieredMetric*> out;
    for (const auto& m : tiered) {
        if (m.tier == t) out.push_back(&m);
    }
    return out;
}

std::size_t GradeReport::count(Tier t) const {
    std::size_t n = 0;
    for (const auto& m : tiered) {
        if (m.tier == t) ++n;
    }
    return n;
}

// ---------------- grading ----------------
GradeReport grade_against(const ResultRecord& test, Phase phase, const HistoricalDatabase& db, const Schema& schema,
                          const GradingSettings& settings, ReferenceStatsCache* cache) {
    settings.validate_or_throw();

    GradeReport rep;
    rep.phase = phase;
    rep.scenario = test.text(field::kScenario);

    const std::vector<std::string> cols = phase_columns(db, phase);
    rep.tiered.reserve(cols.size());

    for (const auto& c : cols) {
        const ReferenceColumn col = db.column(c);
        std::shared_ptr<const ClassifiedMetric> cm;
        if (cache) {
            cm = cache->get_or_classify(rep.scenario, col, settings);
        } else {
            cm = std::make_shared<const ClassifiedMetric>(classify_and_prepare(col, settings));
        }
        rep.metrics[c] = cm->transform ? cm->transformed : cm->values;

        const bool optional = schema.is_optional(c);
        if (!optional) rep.required_columns.push_back(c);

        const std::optional<double> v = test.number(c);
        if (optional || !v) {
            TieredMetric tm = tier_metric(c, std::numeric_limits<double>::quiet_NaN(), *cm, settings);
            tm.note = optional ? "optional metric" : "missing in test flight";
            rep.tiered.push_back(std::move(tm));
            continue;
        }
        rep.tiered.push_back(tier_metric(c, *v, *cm, settings));
    }

    for (const auto& r : db.records()) {
        std::vector<double> row;
        row.reserve(rep.required_columns.size());
        bool complete = true;
        for (const auto& c : rep.required_columns) {
            const std::optional<double> v = r.number(c);
            if (!v || std::isnan(*v)) {
                complete = false;
                break;
            }
            row.push_back(*v);
        }
        if (complete) rep.required_rows.push_back(std::move(row));
    }

    log(LogLevel::INFO, std::string("Graded ") + phase_spec(phase).grading_name + " of " + rep.scenario + ": " +
                            std::to_string(rep.tiered.size()) + " metrics, " +
                            std::to_string(rep.count(Tier::kNotTierable)) + " not tierable, reference n=" +
                            std::to_string(db.size()));
    return rep;
}

GradeReport grade(const ResultRecord& test, Phase phase, const Schema& schema, const GradingSettings& settings,
                  const StorageSettings& storage, ReferenceStatsCache* cache) {
    const std::string scenario = test.text(field::kScenario);
    const std::string path = resolve_database_path(storage, scenario);
    const HistoricalDatabase db = HistoricalDatabase::load(path);
    return grade_against(test, phase, db, schema, settings, cache);
}

} // namespace dockeval
