#include "sc/transform/CoordinateTransform.hpp"
#include "sc/pane/Pane.hpp"

#include <cmath>

namespace sc {

namespace {

bool representable(double px) {
  return std::isfinite(px) && std::fabs(px) <= kMaxPixelMagnitude;
}

bool timeAxisReady(const Pane& pane) {
  return pane.isMeasured() && pane.hasVisibleRange();
}

bool priceAxisReady(const Pane& pane) {
  return pane.isMeasured() && pane.hasPriceScale();
}

} // namespace

bool indexToX(const Pane& pane, double logicalIndex, double& x) {
  if (!timeAxisReady(pane) || !std::isfinite(logicalIndex)) return false;

  const LogicalRange& r = pane.visibleRange();
  const double w = pane.plotWidth();
  double result;
  if (pane.isBarSpacingLocked()) {
    // Right-anchored: range end sits on the right plot edge.
    result = w - (r.to - logicalIndex) * pane.lockedBarSpacing();
  } else {
    result = (logicalIndex - r.from) / r.width() * w;
  }
  if (!representable(result)) return false;
  x = result;
  return true;
}

bool xToIndex(const Pane& pane, double x, double& logicalIndex) {
  if (!timeAxisReady(pane) || !representable(x)) return false;

  const LogicalRange& r = pane.visibleRange();
  const double w = pane.plotWidth();
  double result;
  if (pane.isBarSpacingLocked()) {
    result = r.to - (w - x) / pane.lockedBarSpacing();
  } else {
    result = r.from + x / w * r.width();
  }
  if (!std::isfinite(result)) return false;
  logicalIndex = result;
  return true;
}

bool priceToY(const Pane& pane, double price, double& y) {
  if (!priceAxisReady(pane) || !std::isfinite(price)) return false;

  const PriceRange& p = pane.priceRange();
  double result = (p.max - price) / p.span() * pane.plotHeight();
  if (!representable(result)) return false;
  y = result;
  return true;
}

bool yToPrice(const Pane& pane, double y, double& price) {
  if (!priceAxisReady(pane) || !representable(y)) return false;

  const PriceRange& p = pane.priceRange();
  double result = p.max - y / pane.plotHeight() * p.span();
  if (!std::isfinite(result)) return false;
  price = result;
  return true;
}

bool chartToPixel(const Pane& pane, const ChartPoint& point, PixelPoint& out) {
  if (!pane.isReady()) return false;
  PixelPoint p;
  if (!indexToX(pane, point.logicalIndex, p.x)) return false;
  if (!priceToY(pane, point.price, p.y)) return false;
  out = p;
  return true;
}

bool pixelToChart(const Pane& pane, const PixelPoint& pixel, ChartPoint& out) {
  if (!pane.isReady()) return false;
  ChartPoint c;
  if (!xToIndex(pane, pixel.x, c.logicalIndex)) return false;
  if (!yToPrice(pane, pixel.y, c.price)) return false;
  out = c;
  return true;
}

} // namespace sc
