#include "dockeval/eval/spectral.hpp"

#include <complex>
#include <limits>

#include <unsupported/Eigen/FFT>

namespace dockeval {

std::vector<double> periodogram(const std::vector<double>& x) {
  if (x.empty()) return {};

  Eigen::FFT<double> fft;
  std::vector<std::complex<double>> spectrum;
  fft.fwd(spectrum, x);

  const double n = static_cast<double>(x.size());
  std::vector<double> psd(spectrum.size());
  for (std::size_t k = 0; k < spectrum.size(); ++k) psd[k] = std::norm(spectrum[k]) / n;
  return psd;
}

double mean_power_spectral_density(const std::vector<double>& x) {
  if (x.empty()) return std::numeric_limits<double>::quiet_NaN();
  const std::vector<double> psd = periodogram(x);
  double sum = 0.0;
  for (double p : psd) sum += p;
  return sum / static_cast<double>(psd.size());
}

} // namespace dockeval
