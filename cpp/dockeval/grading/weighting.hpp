/*
===============================================================================
Fragment 5.8 - Grading: MCDA Metric Weights (Gini, CRITIC)
File: cpp/dockeval/grading/weighting.hpp
===============================================================================

Purpose:
  Importance weight per metric of one phase, computed on the reference table
  (rows = historical flights, columns = required metrics of the phase).

Rules:
  - Constant columns (fewer than two distinct values) get weight 0.
  - The remaining weights are normalized to sum to 1.
  - No variable column at all: every weight is 0.

Methods:
  - Gini: G_j = sum_i sum_k |x_ij - x_kj| / (2 m^2 mean_j)
          (mean_j == 0: / (m^2 - m)), w = G / sum(G)
  - CRITIC: min-max normalize, w_j ~ std_j * sum_k (1 - corr_jk)
===============================================================================
*/

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "dockeval/core/settings.hpp"

namespace dockeval {

struct GradeReport;

// Raw method weights over variable columns only (throws NumericalError when
// the weights cannot be normalized).
Eigen::VectorXd gini_weights(const Eigen::MatrixXd& x);
Eigen::VectorXd critic_weights(const Eigen::MatrixXd& x);

struct MetricWeights {
    std::vector<std::string> names;
    std::vector<double> weights;

    // 0 for unknown names.
    double weight(const std::string& name) const;
    double sum() const;
};

MetricWeights compute_phase_weights(const std::vector<std::string>& names, const std::vector<std::vector<double>>& rows,
                                    WeightingMethod method);

MetricWeights compute_phase_weights(const GradeReport& report, WeightingMethod method);

} // namespace dockeval
