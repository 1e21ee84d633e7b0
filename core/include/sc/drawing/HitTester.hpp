#pragma once
#include "sc/pane/ChartTypes.hpp"

#include <cstdint>

namespace sc {

class DrawingStore;
struct Drawing;
class Pane;

struct HitTestConfig {
  double lineThreshold{12.0};   // strict: distance must be below this
  double boxMargin{5.0};        // rectangle / fibonacci / golden
  double charWidth{8.0};        // text box width = chars * charWidth + textPadding
  double textPadding{10.0};
  double textAbove{18.0};
  double textBelow{5.0};
  double textLeft{5.0};
};

struct DrawingHit {
  bool hit{false};
  std::uint32_t drawingId{0};
};

// Distance from p to segment ab with the projection clamped to [0,1].
// A zero-length segment measures distance to a.
double distanceToSegment(const PixelPoint& p, const PixelPoint& a, const PixelPoint& b);

class HitTester {
public:
  void setConfig(const HitTestConfig& cfg) { config_ = cfg; }
  const HitTestConfig& config() const { return config_; }

  // Newest drawing first; the first match wins. Drawings whose vertices
  // cannot be mapped this frame are skipped.
  DrawingHit pick(const PixelPoint& cursor, const DrawingStore& store,
                  const Pane& pane) const;

  bool hits(const Drawing& drawing, const PixelPoint& cursor, const Pane& pane) const;

private:
  HitTestConfig config_;
};

} // namespace sc
