#include "sc/math/Ema.hpp"

#include <cmath>
#include <limits>

namespace sc {

void computeEma(const double* input, double* output, int count, int period,
                int start) {
  if (count <= 0) return;
  const double nan = std::numeric_limits<double>::quiet_NaN();
  for (int i = 0; i < count; i++) output[i] = nan;
  if (period <= 0 || start < 0 || start + period > count) return;

  // SMA for the seed value
  double sum = 0.0;
  for (int i = start; i < start + period; i++) {
    sum += input[i];
  }
  int seedIdx = start + period - 1;
  output[seedIdx] = sum / static_cast<double>(period);

  // EMA for remaining values
  double k = 2.0 / (static_cast<double>(period) + 1.0);
  for (int i = seedIdx + 1; i < count; i++) {
    output[i] = input[i] * k + output[i - 1] * (1.0 - k);
  }
}

void computeSma(const double* input, double* output, int count, int period) {
  if (count <= 0) return;
  const double nan = std::numeric_limits<double>::quiet_NaN();
  for (int i = 0; i < count; i++) output[i] = nan;
  if (period <= 0) return;

  double sum = 0.0;
  int nanInWindow = 0;
  for (int i = 0; i < count; i++) {
    if (std::isnan(input[i])) nanInWindow++;
    else sum += input[i];

    if (i >= period) {
      double old = input[i - period];
      if (std::isnan(old)) nanInWindow--;
      else sum -= old;
    }

    if (i >= period - 1 && nanInWindow == 0) {
      output[i] = sum / static_cast<double>(period);
    }
  }
}

} // namespace sc
