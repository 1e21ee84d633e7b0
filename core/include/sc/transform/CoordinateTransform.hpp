#pragma once
#include "sc/pane/ChartTypes.hpp"

namespace sc {

class Pane;

// Pixel coordinates beyond this magnitude are treated as unrepresentable.
inline constexpr double kMaxPixelMagnitude = 1e7;

// Pure per-pane mappings between plot-area pixels and chart space.
// All return false (leaving `out` untouched) when the pane is not ready
// (unmeasured, no visible range, no price scale), when an input is not
// finite, or when the result falls outside the representable domain.
// Callers treat false as "retry next frame".

bool chartToPixel(const Pane& pane, const ChartPoint& point, PixelPoint& out);
bool pixelToChart(const Pane& pane, const PixelPoint& pixel, ChartPoint& out);

// Single-axis variants. The x-axis helpers need only a measured pane with a
// visible range; the y-axis helpers need a measured pane with a price scale.
bool indexToX(const Pane& pane, double logicalIndex, double& x);
bool xToIndex(const Pane& pane, double x, double& logicalIndex);
bool priceToY(const Pane& pane, double price, double& y);
bool yToPrice(const Pane& pane, double y, double& price);

} // namespace sc
