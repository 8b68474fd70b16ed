/*
===============================================================================
Fragment 5.9 - Grading: Phase Sub-Scores and Final Score
File: cpp/dockeval/grading/scoring.hpp
===============================================================================

Purpose:
  sub_score(phase) = sum over tiered metrics of weight * tier_factor[tier]
                     (Not Tierable metrics contribute nothing), rounded to
                     two decimals
  final_score      = sum of sub_score * phase_relevance over Alignment,
                     Approach and Final Approach, rounded to two decimals
  Total Flight is informational and never part of the score.

Access:
  Scoring needs a ScoringCapability. The only way to obtain one is
  ScoringCapability::from_settings() on a session whose GradingSettings has
  scoring_unlocked set.
===============================================================================
*/

#pragma once

#include <array>
#include <optional>
#include <vector>

#include "dockeval/core/settings.hpp"
#include "dockeval/eval/metric_catalog.hpp"
#include "dockeval/grading/tiering.hpp"
#include "dockeval/grading/weighting.hpp"

namespace dockeval {

class ScoringCapability final {
public:
    static std::optional<ScoringCapability> from_settings(const GradingSettings& settings) {
        if (!settings.scoring_unlocked) return std::nullopt;
        return ScoringCapability();
    }

private:
    ScoringCapability() = default;
};

struct PhaseScore {
    Phase phase = Phase::kAlign;
    double sub_score = 0.0;
    double relevance = 0.0;
    MetricWeights weights;
};

struct FlightScore {
    std::array<PhaseScore, 3> phases{};
    double final_score = 0.0;
};

// Half-to-even at two decimals.
double round_score(double v) noexcept;

// Sub-score of one graded phase.
PhaseScore score_phase(const ScoringCapability& cap, const GradeReport& report, const GradingSettings& settings);

// `reports` must contain the Alignment, Approach and Final Approach phases
// (any order; others are ignored). Throws ValidationError otherwise.
FlightScore compute_score(const ScoringCapability& cap, const std::vector<GradeReport>& reports,
                          const GradingSettings& settings);

} // namespace dockeval
