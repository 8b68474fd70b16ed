#pragma once
/*
================================================================================
Fragment 4.6 - Eval: Spectral Power
FILE: cpp/dockeval/eval/spectral.hpp

Purpose:
  Roughness indicator of a controller signal: the mean of the power
  spectral density |FFT(x)|^2 / N over all N bins of the full spectrum.

Notes:
  - By Parseval the value equals mean(x^2); the FFT is kept so the
    periodogram itself is available to callers.
  - Empty input yields NaN.
================================================================================
*/

#include <vector>

namespace dockeval {

// |FFT(x)|^2 / N for every bin (full, two-sided spectrum).
std::vector<double> periodogram(const std::vector<double>& x);

// mean(periodogram(x)); NaN for empty x.
double mean_power_spectral_density(const std::vector<double>& x);

} // namespace dockeval
