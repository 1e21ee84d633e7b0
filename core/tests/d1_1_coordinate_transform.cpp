// D1.1 - CoordinateTransform: chart <-> pixel mapping on one pane
// Tests: linear mapping, round trip, not-ready panes, locked bar spacing,
// out-of-range and non-finite inputs.

#include "sc/pane/Pane.hpp"
#include "sc/transform/CoordinateTransform.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireClose(double a, double b, double tol, const char* msg) {
  if (std::fabs(a - b) > tol) {
    std::fprintf(stderr, "ASSERT FAIL: %s (%.6f vs %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

// 1050x500 pane: plot area 1000x500 after the 50px price axis.
static void setupPane(sc::Pane& pane) {
  pane.setPixelSize(1050, 500);
  requireTrue(pane.setVisibleRange({0.0, 100.0}), "set range");
  requireTrue(pane.setPriceRange({50.0, 150.0}), "set price range");
}

int main() {
  // ---- Test 1: Linear mapping ----
  {
    sc::Pane pane(1, sc::PaneKind::Price);
    setupPane(pane);
    requireTrue(pane.isReady(), "pane ready");
    requireClose(pane.plotWidth(), 1000.0, 1e-9, "plot width");

    sc::PixelPoint px;
    requireTrue(sc::chartToPixel(pane, {50.0, 100.0}, px), "chartToPixel ok");
    requireClose(px.x, 500.0, 1e-9, "x at mid index");
    requireClose(px.y, 250.0, 1e-9, "y at mid price");

    requireTrue(sc::chartToPixel(pane, {0.0, 150.0}, px), "top-left");
    requireClose(px.x, 0.0, 1e-9, "x at range start");
    requireClose(px.y, 0.0, 1e-9, "y at price max");

    std::printf("  Test 1 (linear mapping): PASS\n");
  }

  // ---- Test 2: Round trip within epsilon ----
  {
    sc::Pane pane(1, sc::PaneKind::Price);
    setupPane(pane);

    const sc::ChartPoint samples[] = {
      {0.0, 50.0}, {12.5, 73.25}, {99.9, 149.0}, {-20.0, 10.0}, {140.0, 300.0}
    };
    for (const auto& cp : samples) {
      sc::PixelPoint px;
      sc::ChartPoint back;
      requireTrue(sc::chartToPixel(pane, cp, px), "forward");
      requireTrue(sc::pixelToChart(pane, px, back), "inverse");
      requireClose(back.logicalIndex, cp.logicalIndex, 1e-9, "index round trip");
      requireClose(back.price, cp.price, 1e-9, "price round trip");
    }

    std::printf("  Test 2 (round trip): PASS\n");
  }

  // ---- Test 3: Not-ready pane fails without writing ----
  {
    sc::Pane pane(1, sc::PaneKind::Price);
    sc::PixelPoint px{7.0, 9.0};
    requireTrue(!sc::chartToPixel(pane, {1.0, 1.0}, px), "unmeasured fails");
    requireClose(px.x, 7.0, 0.0, "out untouched x");
    requireClose(px.y, 9.0, 0.0, "out untouched y");

    pane.setPixelSize(1050, 500);
    pane.setVisibleRange({0.0, 100.0});
    requireTrue(!pane.isReady(), "no price scale yet");
    requireTrue(!sc::chartToPixel(pane, {1.0, 1.0}, px), "no price scale fails");

    double x = 0;
    requireTrue(sc::indexToX(pane, 25.0, x), "time axis alone is usable");
    requireClose(x, 250.0, 1e-9, "index 25");

    double y = 0;
    requireTrue(!sc::priceToY(pane, 10.0, y), "price axis not usable");

    std::printf("  Test 3 (not ready): PASS\n");
  }

  // ---- Test 4: Locked bar spacing anchors the range end ----
  {
    sc::Pane pane(1, sc::PaneKind::Price);
    pane.setPixelSize(1000, 400);  // plot width 950
    pane.lockBarSpacing(8.0);
    pane.setVisibleRange({182.0, 301.0});
    pane.setPriceRange({0.0, 10.0});

    requireTrue(pane.isBarSpacingLocked(), "locked");
    requireClose(pane.barSpacing(), 8.0, 0.0, "spacing 8");

    double x = 0;
    requireTrue(sc::indexToX(pane, 300.0, x), "last bar");
    requireClose(x, 950.0 - 8.0, 1e-9, "last bar one spacing left of edge");
    requireTrue(sc::indexToX(pane, 182.0, x), "first bar");
    requireClose(x, 950.0 - 119.0 * 8.0, 1e-9, "first bar at/left of plot start");
    requireTrue(x <= 0.0, "first bar not inside plot");

    double idx = 0;
    requireTrue(sc::xToIndex(pane, 942.0, idx), "inverse");
    requireClose(idx, 300.0, 1e-9, "inverse index");

    pane.unlockBarSpacing();
    requireClose(pane.barSpacing(), 950.0 / 119.0, 1e-9, "derived spacing after unlock");

    std::printf("  Test 4 (locked spacing): PASS\n");
  }

  // ---- Test 5: Non-finite and unrepresentable inputs ----
  {
    sc::Pane pane(1, sc::PaneKind::Price);
    setupPane(pane);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    sc::PixelPoint px;
    sc::ChartPoint cp;
    requireTrue(!sc::chartToPixel(pane, {nan, 100.0}, px), "NaN index");
    requireTrue(!sc::chartToPixel(pane, {10.0, nan}, px), "NaN price");
    requireTrue(!sc::chartToPixel(pane, {1e9, 100.0}, px), "index far off-screen");
    requireTrue(!sc::pixelToChart(pane, {nan, 10.0}, cp), "NaN x");

    requireTrue(!pane.setVisibleRange({5.0, 5.0}), "empty range rejected");
    requireTrue(!pane.setVisibleRange({9.0, 3.0}), "reversed range rejected");
    requireTrue(!pane.setPriceRange({1.0, nan}), "NaN price range rejected");
    requireClose(pane.visibleRange().to, 100.0, 0.0, "range kept");

    std::printf("  Test 5 (invalid inputs): PASS\n");
  }

  std::printf("D1.1 coordinate_transform: ALL PASS\n");
  return 0;
}
