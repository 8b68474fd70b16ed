/*
===============================================================================
Fragment 5.8 - Grading: MCDA Metric Weights (Implementation)
File: cpp/dockeval/grading/weighting.cpp
===============================================================================
*/

#include "dockeval/grading/weighting.hpp"

#include "dockeval/core/errors.hpp"
#include "dockeval/core/logging.hpp"
#include "dockeval/grading/sample_stats.hpp"
#include "dockeval/grading/tiering.hpp"

#include <cmath>

namespace dockeval {

namespace {

Eigen::VectorXd normalize_sum(const Eigen::VectorXd& g, const char* method) {
    const double s = g.sum();
    if (!std::isfinite(s) || s == 0.0) {
        throw NumericalError(std::string(method) + " weights cannot be normalized (sum = " + std::to_string(s) + ")");
    }
    return g / s;
}

} // namespace

Eigen::VectorXd gini_weights(const Eigen::MatrixXd& x) {
    const Eigen::Index m = x.rows();
    const Eigen::Index n = x.cols();
    const double md = static_cast<double>(m);
    Eigen::VectorXd g = Eigen::VectorXd::Zero(n);

    for (Eigen::Index j = 0; j < n; ++j) {
        const Eigen::VectorXd col = x.col(j);
        const double mean = col.mean();
        double acc = 0.0;
        for (Eigen::Index i = 0; i < m; ++i) {
            acc += (col.array() - col(i)).abs().sum();
        }
        g(j) = (mean != 0.0) ? acc / (2.0 * md * md * mean) : acc / (md * md - md);
    }
    return normalize_sum(g, "Gini");
}

Eigen::VectorXd critic_weights(const Eigen::MatrixXd& x) {
    const Eigen::Index m = x.rows();
    const Eigen::Index n = x.cols();

    Eigen::MatrixXd xn(m, n);
    for (Eigen::Index j = 0; j < n; ++j) {
        const double lo = x.col(j).minCoeff();
        const double hi = x.col(j).maxCoeff();
        xn.col(j) = (x.col(j).array() - lo) / (hi - lo);
    }

    // Population std and Pearson correlation of the normalized columns.
    const Eigen::RowVectorXd mu = xn.colwise().mean();
    const Eigen::MatrixXd centered = xn.rowwise() - mu;
    const Eigen::MatrixXd cov = (centered.adjoint() * centered) / static_cast<double>(m);
    const Eigen::VectorXd sd = cov.diagonal().array().sqrt();

    Eigen::VectorXd c(n);
    for (Eigen::Index j = 0; j < n; ++j) {
        double conflict = 0.0;
        for (Eigen::Index k = 0; k < n; ++k) {
            const double corr = cov(j, k) / (sd(j) * sd(k));
            conflict += 1.0 - corr;
        }
        c(j) = sd(j) * conflict;
    }
    return normalize_sum(c, "CRITIC");
}

double MetricWeights::weight(const std::string& name) const {
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) return weights[i];
    }
    return 0.0;
}

double MetricWeights::sum() const {
    double s = 0.0;
    for (double w : weights) s += w;
    return s;
}

MetricWeights compute_phase_weights(const std::vector<std::string>& names, const std::vector<std::vector<double>>& rows,
                                    WeightingMethod method) {
    MetricWeights out;
    out.names = names;
    out.weights.assign(names.size(), 0.0);

    std::vector<std::size_t> variable;
    for (std::size_t j = 0; j < names.size(); ++j) {
        std::vector<double> col;
        col.reserve(rows.size());
        for (const auto& r : rows) {
            if (r.size() != names.size()) throw ValidationError("compute_phase_weights: row width mismatch");
            col.push_back(r[j]);
        }
        if (stats::distinct_count(col) > 1) variable.push_back(j);
    }
    if (variable.empty()) {
        log(LogLevel::WARN, "No variable metric columns; all weights are 0");
        return out;
    }

    Eigen::MatrixXd x(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(variable.size()));
    for (std::size_t i = 0; i < rows.size(); ++i) {
        for (std::size_t k = 0; k < variable.size(); ++k) {
            x(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(k)) = rows[i][variable[k]];
        }
    }

    const Eigen::VectorXd w = (method == WeightingMethod::kCritic) ? critic_weights(x) : gini_weights(x);
    for (std::size_t k = 0; k < variable.size(); ++k) out.weights[variable[k]] = w(static_cast<Eigen::Index>(k));
    return out;
}

MetricWeights compute_phase_weights(const GradeReport& report, WeightingMethod method) {
    return compute_phase_weights(report.required_columns, report.required_rows, method);
}

} // namespace dockeval
