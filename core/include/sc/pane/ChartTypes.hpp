#pragma once
#include <cmath>

namespace sc {

// Visible window on the shared time axis, in real-valued bar indices.
struct LogicalRange {
  double from{0};
  double to{0};

  double width() const { return to - from; }
  double center() const { return (from + to) * 0.5; }
  bool valid() const {
    return std::isfinite(from) && std::isfinite(to) && from < to;
  }
};

inline bool operator==(const LogicalRange& a, const LogicalRange& b) {
  return a.from == b.from && a.to == b.to;
}
inline bool operator!=(const LogicalRange& a, const LogicalRange& b) {
  return !(a == b);
}

// Chart space: the only coordinates ever persisted for annotations.
struct ChartPoint {
  double logicalIndex{0};
  double price{0};
};

// Pane-local pixels, origin at the top-left of the plot area.
struct PixelPoint {
  double x{0};
  double y{0};
};

struct PriceRange {
  double min{0};
  double max{0};

  double span() const { return max - min; }
  bool valid() const {
    return std::isfinite(min) && std::isfinite(max) && min < max;
  }
};

} // namespace sc
