/*
===============================================================================
Fragment 5.9 - Grading: Scoring (Implementation)
File: cpp/dockeval/grading/scoring.cpp
===============================================================================
*/

#include "dockeval/grading/scoring.hpp"

#include "dockeval/core/errors.hpp"
#include "dockeval/core/logging.hpp"

#include <cmath>
#include <sstream>
#include <string>

namespace dockeval {

double round_score(double v) noexcept { return std::nearbyint(v * 100.0) / 100.0; }

PhaseScore score_phase(const ScoringCapability&, const GradeReport& report, const GradingSettings& settings) {
    PhaseScore ps;
    ps.phase = report.phase;
    ps.weights = compute_phase_weights(report, settings.weighting);

    double sub = 0.0;
    for (const Tier t : kScoredTiers) {
        const double factor = settings.tier_factors[static_cast<std::size_t>(t)];
        for (const TieredMetric* m : report.in_tier(t)) sub += ps.weights.weight(m->name) * factor;
    }
    ps.sub_score = round_score(sub);
    return ps;
}

FlightScore compute_score(const ScoringCapability& cap, const std::vector<GradeReport>& reports,
                          const GradingSettings& settings) {
    static constexpr std::array<Phase, 3> kScoredPhases{Phase::kAlign, Phase::kAppr, Phase::kFA};

    FlightScore fs;
    double total = 0.0;
    for (std::size_t i = 0; i < kScoredPhases.size(); ++i) {
        const GradeReport* rep = nullptr;
        for (const auto& r : reports) {
            if (r.phase == kScoredPhases[i]) rep = &r;
        }
        if (!rep) {
            throw ValidationError(std::string("compute_score: no grading for ") +
                                  phase_spec(kScoredPhases[i]).grading_name);
        }
        fs.phases[i] = score_phase(cap, *rep, settings);
        fs.phases[i].relevance = settings.phase_relevance[i];
        total += fs.phases[i].sub_score * fs.phases[i].relevance;
    }
    fs.final_score = round_score(total);

    std::ostringstream os;
    os << "Phase Sub Scores: ";
    for (std::size_t i = 0; i < fs.phases.size(); ++i) {
        if (i) os << " | ";
        os << phase_spec(fs.phases[i].phase).grading_name << ": " << fs.phases[i].sub_score;
    }
    os << "; Total Flight Score: " << fs.final_score;
    log(LogLevel::INFO, os.str());
    return fs;
}

} // namespace dockeval
