#pragma once
#include <vector>

namespace sc {

struct TickSet {
  double min{0}, max{0}, step{1};
  std::vector<double> values;  // only ticks inside [lo, hi]
};

// Price-axis ticks. Snaps step to {1, 2, 2.5, 5, 10} x 10^n.
TickSet computeNiceTicks(double lo, double hi, int targetCount = 5);

} // namespace sc
