// ============================================================================
// Fragment 5.3 - Grading: Normality Tests (Shapiro-Wilk, D'Agostino K^2,
//                Anderson-Darling)
// File: cpp/dockeval/grading/normality.hpp
// ============================================================================
//
// Purpose:
// - Decide whether a reference column may be tiered with mean/std borders.
// - The decision is a lenient OR: the column counts as normal if ANY test
//   fails to reject normality at level alpha.
//
// Tests:
// - Shapiro-Wilk: Royston (1992/1995) coefficients and p-value, n >= 3.
// - D'Agostino-Pearson K^2: skewness + kurtosis z-scores, chi2(2) p-value,
//   n >= 8.
// - Anderson-Darling (normal, estimated mean/std): statistic compared with
//   the 3rd critical value (about 5%), n >= 2.
//
// Applicability:
// - A test whose precondition fails (too few samples, zero spread, NaN
//   statistic) reports applicable = false and never votes "normal".
//
// ============================================================================

#pragma once

#include <array>
#include <vector>

namespace dockeval::stats {

struct TestResult final {
    bool applicable = false;
    double statistic = 0.0;
    double p_value = 0.0;
};

struct AndersonResult final {
    bool applicable = false;
    double statistic = 0.0;
    std::array<double, 5> critical_values{}; // 15%, 10%, 5%, 2.5%, 1%
};

TestResult shapiro_wilk(const std::vector<double>& xs);
TestResult dagostino_k2(const std::vector<double>& xs);
AndersonResult anderson_darling_normal(const std::vector<double>& xs);

// Lenient OR of the three tests.
bool is_normal(const std::vector<double>& xs, double alpha);

} // namespace dockeval::stats
