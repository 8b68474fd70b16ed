/*
===============================================================================
Fragment 5.5 - Grading: Normalizing Transforms (Box-Cox, Yeo-Johnson,
               Quantile-to-Normal)
File: cpp/dockeval/grading/transforms.hpp
===============================================================================

Purpose:
  A reference column that fails the normality check may still be tiered with
  mean/std borders once it is mapped toward a normal shape. A fitted
  transform is kept with the classification so the test flight's value can
  be mapped into the same space.

Models:
  - PowerTransform (Box-Cox or Yeo-Johnson): lambda by maximum likelihood
    (Brent, lambda in [-10, 10]), then standardized to zero mean and unit
    population variance (a zero scale is left as 1).
  - QuantileNormalTransform: min(max_quantiles, n) evenly spaced reference
    quantiles; values map to [0,1] by averaged forward/backward linear
    interpolation, then to the standard normal quantile, clipped at 1e-7.

Errors:
  - fit() throws NumericalError when the likelihood optimum is not finite or
    the fitted column contains non-finite values.
===============================================================================
*/

#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace dockeval::stats {

class ITransform {
public:
    virtual ~ITransform() = default;
    virtual const char* name() const noexcept = 0;
    virtual double apply(double x) const = 0;

    std::vector<double> apply_all(const std::vector<double>& xs) const {
        std::vector<double> out;
        out.reserve(xs.size());
        for (double x : xs) out.push_back(apply(x));
        return out;
    }
};

// -----------------------------
// Power transforms
// -----------------------------
enum class PowerMethod : int { kBoxCox = 0, kYeoJohnson = 1 };

// Raw transforms (no standardization).
double box_cox(double x, double lambda);      // -inf for x <= 0
double yeo_johnson(double x, double lambda);

// Negative log-likelihood of lambda for the given column.
double box_cox_neg_llf(const std::vector<double>& xs, double lambda);
double yeo_johnson_neg_llf(const std::vector<double>& xs, double lambda);

class PowerTransform final : public ITransform {
public:
    // Box-Cox requires every value > 0 (ValidationError otherwise).
    static PowerTransform fit(PowerMethod method, const std::vector<double>& xs);

    const char* name() const noexcept override;
    double apply(double x) const override;

    PowerMethod method() const noexcept { return method_; }
    double lambda() const noexcept { return lambda_; }
    double mean() const noexcept { return mean_; }
    double scale() const noexcept { return scale_; }

private:
    PowerTransform(PowerMethod m, double lambda, double mean, double scale)
        : method_(m), lambda_(lambda), mean_(mean), scale_(scale) {}

    PowerMethod method_;
    double lambda_;
    double mean_;
    double scale_;
};

// -----------------------------
// Quantile-to-normal
// -----------------------------
class QuantileNormalTransform final : public ITransform {
public:
    static QuantileNormalTransform fit(const std::vector<double>& xs, std::size_t max_quantiles);

    const char* name() const noexcept override { return "quantile"; }
    double apply(double x) const override;

    const std::vector<double>& quantiles() const noexcept { return quantiles_; }

private:
    QuantileNormalTransform(std::vector<double> q, std::vector<double> refs)
        : quantiles_(std::move(q)), references_(std::move(refs)) {}

    std::vector<double> quantiles_;
    std::vector<double> references_;
};

// numpy-style linear interpolation over increasing xp (clamped at the ends).
double interp(double x, const std::vector<double>& xp, const std::vector<double>& fp);

// Linear-interpolated percentile of a sorted sample, p in [0, 1].
double percentile_linear(const std::vector<double>& sorted, double p);

} // namespace dockeval::stats
