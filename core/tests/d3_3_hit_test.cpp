// D3.3 - HitTester: picking drawings under the cursor
// Tests: segment distance threshold at the midpoint, newest-first order,
// guides, boxes with margin, text boxes, channel offset line, not-ready
// panes, multibyte labels.

#include "sc/drawing/DrawingStore.hpp"
#include "sc/drawing/HitTester.hpp"
#include "sc/pane/Pane.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

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

// Plot 1000x500, index 0-100 and price 0-100: x = 10*idx, y = 5*(100-price).
static void setupPane(sc::Pane& pane) {
  pane.setPixelSize(1050, 500);
  pane.setVisibleRange({0.0, 100.0});
  pane.setPriceRange({0.0, 100.0});
}

int main() {
  sc::Pane pane(1, sc::PaneKind::Price);
  setupPane(pane);
  sc::HitTester tester;

  // ---- Test 1: Trendline picked near its midpoint only ----
  {
    sc::DrawingStore store;
    auto id = store.add(sc::DrawingType::Trendline, {{10.0, 50.0}, {50.0, 80.0}});

    // Pixels (100,250)-(500,100); midpoint (300,175); unit normal below.
    const double len = std::hypot(400.0, 150.0);
    const double nx = 150.0 / len, ny = 400.0 / len;
    auto at = [&](double dist) { return sc::PixelPoint{300.0 + nx * dist, 175.0 + ny * dist}; };

    sc::DrawingHit hit = tester.pick(at(10.0), store, pane);
    requireTrue(hit.hit && hit.drawingId == id, "10px away selects");

    hit = tester.pick(at(20.0), store, pane);
    requireTrue(!hit.hit && hit.drawingId == 0, "20px away selects nothing");

    const double th = tester.config().lineThreshold;
    requireTrue(tester.pick(at(th - 0.01), store, pane).hit, "just inside threshold");
    requireTrue(!tester.pick(at(th + 0.01), store, pane).hit, "just outside threshold");

    std::printf("  Test 1 (trendline threshold): PASS\n");
  }

  // ---- Test 2: Newest drawing wins ----
  {
    sc::DrawingStore store;
    store.add(sc::DrawingType::Horizontal, {{0.0, 50.0}});
    auto newer = store.add(sc::DrawingType::Vertical, {{30.0, 0.0}});

    // (300, 250) lies on both guides.
    sc::DrawingHit hit = tester.pick({300.0, 250.0}, store, pane);
    requireTrue(hit.hit && hit.drawingId == newer, "newest first");

    hit = tester.pick({600.0, 255.0}, store, pane);
    requireTrue(hit.hit && hit.drawingId == 1, "horizontal anywhere along y");

    std::printf("  Test 2 (newest first): PASS\n");
  }

  // ---- Test 3: Boxes include a margin ----
  {
    sc::DrawingStore store;
    auto id = store.add(sc::DrawingType::Rectangle, {{10.0, 80.0}, {20.0, 60.0}});
    // Pixel box x 100-200, y 100-200.
    requireTrue(tester.pick({150.0, 150.0}, store, pane).drawingId == id, "inside");
    requireTrue(tester.pick({204.0, 150.0}, store, pane).hit, "inside margin");
    requireTrue(!tester.pick({206.0, 150.0}, store, pane).hit, "outside margin");

    store.clear();
    auto fib = store.add(sc::DrawingType::Fibonacci, {{10.0, 80.0}, {20.0, 60.0}});
    requireTrue(tester.pick({150.0, 150.0}, store, pane).drawingId == fib, "fib box");

    std::printf("  Test 3 (boxes): PASS\n");
  }

  // ---- Test 4: Text box from the label extent ----
  {
    sc::DrawingStore store;
    auto id = store.add(sc::DrawingType::Text, {{20.0, 50.0}}, nullptr, "abc");
    // Anchor (200, 250); box x 195-234, y 232-255.
    requireTrue(tester.pick({230.0, 245.0}, store, pane).drawingId == id, "over text");
    requireTrue(!tester.pick({240.0, 245.0}, store, pane).hit, "right of text");
    requireTrue(!tester.pick({210.0, 230.0}, store, pane).hit, "above text");

    std::printf("  Test 4 (text): PASS\n");
  }

  // ---- Test 5: Channel offset line ----
  {
    sc::DrawingStore store;
    auto id = store.add(sc::DrawingType::ParallelChannel,
                        {{10.0, 20.0}, {50.0, 60.0}, {30.0, 70.0}});
    // Offset line passes through the anchor pixel (300, 150).
    requireTrue(tester.pick({300.0, 152.0}, store, pane).drawingId == id, "near offset line");
    requireTrue(tester.pick({300.0, 300.0}, store, pane).drawingId == id, "near baseline");
    requireTrue(!tester.pick({300.0, 225.0}, store, pane).hit, "between the lines");

    std::printf("  Test 5 (channel): PASS\n");
  }

  // ---- Test 6: Helpers and not-ready panes ----
  {
    requireClose(sc::distanceToSegment({3.0, 4.0}, {0.0, 0.0}, {0.0, 0.0}), 5.0, 1e-12,
                 "degenerate segment");
    requireClose(sc::distanceToSegment({-3.0, 4.0}, {0.0, 0.0}, {10.0, 0.0}), 5.0, 1e-12,
                 "clamped to endpoint");

    sc::DrawingStore store;
    store.add(sc::DrawingType::Horizontal, {{0.0, 50.0}});
    sc::Pane unready(1, sc::PaneKind::Price);
    requireTrue(!tester.pick({10.0, 250.0}, store, unready).hit, "no hit when not ready");

    std::printf("  Test 6 (helpers): PASS\n");
  }

  // ---- Test 7: Text box counts characters, not bytes ----
  {
    const std::string label = "\xe6\x94\xaf\xe6\x92\x90";  // two CJK characters
    requireTrue(label.size() == 6, "six bytes");
    requireTrue(sc::textLength(label) == 2, "two characters");
    requireTrue(sc::textLength("abc") == 3, "ascii");
    requireTrue(sc::textLength("") == 0, "empty");

    sc::DrawingStore store;
    auto id = store.add(sc::DrawingType::Text, {{20.0, 50.0}}, nullptr, label);
    // Anchor (200, 250); box x 195-226.
    requireTrue(tester.pick({220.0, 245.0}, store, pane).drawingId == id, "over label");
    requireTrue(!tester.pick({230.0, 245.0}, store, pane).hit, "right of label");
    requireTrue(!tester.pick({250.0, 245.0}, store, pane).hit, "byte width not used");

    std::printf("  Test 7 (multibyte text): PASS\n");
  }

  std::printf("D3.3 hit_test: ALL PASS\n");
  return 0;
}
