#include "sc/drawing/HitTester.hpp"
#include "sc/drawing/DrawingStore.hpp"
#include "sc/pane/Pane.hpp"
#include "sc/transform/CoordinateTransform.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace sc {

double distanceToSegment(const PixelPoint& p, const PixelPoint& a, const PixelPoint& b) {
  const double dx = b.x - a.x, dy = b.y - a.y;
  const double len2 = dx * dx + dy * dy;
  if (len2 == 0.0) return std::hypot(p.x - a.x, p.y - a.y);

  double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / len2;
  t = std::max(0.0, std::min(1.0, t));
  return std::hypot(p.x - (a.x + t * dx), p.y - (a.y + t * dy));
}

bool HitTester::hits(const Drawing& d, const PixelPoint& cursor, const Pane& pane) const {
  std::vector<PixelPoint> pts;
  pts.reserve(d.points.size());
  for (const auto& cp : d.points) {
    PixelPoint px;
    if (!chartToPixel(pane, cp, px)) return false;
    pts.push_back(px);
  }
  if (pts.size() != pointCountFor(d.type)) return false;

  const double th = config_.lineThreshold;
  switch (d.type) {
    case DrawingType::Trendline:
    case DrawingType::Segment:
    case DrawingType::Ray:
      return distanceToSegment(cursor, pts[0], pts[1]) < th;

    case DrawingType::Horizontal:
      return std::fabs(cursor.y - pts[0].y) < th;

    case DrawingType::Vertical:
      return std::fabs(cursor.x - pts[0].x) < th;

    case DrawingType::ParallelChannel: {
      if (distanceToSegment(cursor, pts[0], pts[1]) < th) return true;
      const double dx = pts[1].x - pts[0].x, dy = pts[1].y - pts[0].y;
      PixelPoint o0{pts[2].x - dx, pts[2].y - dy};
      PixelPoint o1{pts[2].x + dx, pts[2].y + dy};
      return distanceToSegment(cursor, o0, o1) < th;
    }

    case DrawingType::Rectangle:
    case DrawingType::Fibonacci:
    case DrawingType::GoldenRatio: {
      const double m = config_.boxMargin;
      const double minX = std::min(pts[0].x, pts[1].x) - m;
      const double maxX = std::max(pts[0].x, pts[1].x) + m;
      const double minY = std::min(pts[0].y, pts[1].y) - m;
      const double maxY = std::max(pts[0].y, pts[1].y) + m;
      return cursor.x >= minX && cursor.x <= maxX &&
             cursor.y >= minY && cursor.y <= maxY;
    }

    case DrawingType::Text: {
      if (d.text.empty()) return false;
      const double textW = static_cast<double>(textLength(d.text)) * config_.charWidth +
                           config_.textPadding;
      return cursor.x >= pts[0].x - config_.textLeft && cursor.x <= pts[0].x + textW &&
             cursor.y >= pts[0].y - config_.textAbove && cursor.y <= pts[0].y + config_.textBelow;
    }
  }
  return false;
}

DrawingHit HitTester::pick(const PixelPoint& cursor, const DrawingStore& store,
                           const Pane& pane) const {
  DrawingHit result;
  const auto& all = store.drawings();
  for (auto it = all.rbegin(); it != all.rend(); ++it) {
    if (hits(*it, cursor, pane)) {
      result.hit = true;
      result.drawingId = it->id;
      return result;
    }
  }
  return result;
}

} // namespace sc
