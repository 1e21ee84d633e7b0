#include "sc/math/NiceTicks.hpp"
#include <cmath>

namespace sc {

TickSet computeNiceTicks(double lo, double hi, int targetCount) {
  TickSet result;
  if (targetCount < 1) targetCount = 1;
  if (!std::isfinite(lo) || !std::isfinite(hi) || hi <= lo) {
    result.min = lo;
    result.max = hi;
    if (std::isfinite(lo)) result.values.push_back(lo);
    return result;
  }

  double rawStep = (hi - lo) / static_cast<double>(targetCount);

  double mag = std::pow(10.0, std::floor(std::log10(rawStep)));
  double residual = rawStep / mag;

  double niceStep;
  if (residual <= 1.0)       niceStep = 1.0 * mag;
  else if (residual <= 2.0)  niceStep = 2.0 * mag;
  else if (residual <= 2.5)  niceStep = 2.5 * mag;
  else if (residual <= 5.0)  niceStep = 5.0 * mag;
  else                       niceStep = 10.0 * mag;

  result.step = niceStep;
  result.min = std::ceil(lo / niceStep) * niceStep;
  result.max = std::floor(hi / niceStep) * niceStep;

  // Integer stepping avoids accumulating float error.
  long long n = static_cast<long long>(std::llround((result.max - result.min) / niceStep));
  for (long long i = 0; i <= n; ++i) {
    result.values.push_back(result.min + static_cast<double>(i) * niceStep);
  }

  return result;
}

} // namespace sc
