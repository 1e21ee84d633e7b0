// D3.5 - DrawingEngine: modes, palette, selection and deletion
// Tests: committed captures land in the store with palette colours,
// select-mode hit testing, mode changes clear selection, delete
// affordance placement, redraw with preview, warning routing.

#include "sc/drawing/DrawingEngine.hpp"
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

static bool sameColor(const float* a, const float* b) {
  for (int i = 0; i < 4; ++i) {
    if (a[i] != b[i]) return false;
  }
  return true;
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
  using S = sc::CaptureStatus;

  // ---- Test 1: Captures are stored with round-robin colours ----
  {
    sc::DrawingEngine engine;
    engine.setInteractionMode(sc::InteractionMode::Draw, sc::DrawingType::Segment);

    engine.pointerDown(pane, {100.0, 250.0});
    requireTrue(engine.pointerUp(pane, {500.0, 100.0}) == S::Committed, "committed");
    requireTrue(engine.lastCreatedId() == 1, "id 1");
    requireTrue(engine.store().count() == 1, "stored");
    const sc::Drawing* d = engine.store().get(1);
    requireTrue(sameColor(d->color, sc::DrawingEngine::kPalette[0]), "first palette colour");
    requireClose(d->points[1].price, 80.0, 1e-9, "chart-space point");

    engine.pointerDown(pane, {100.0, 300.0});
    engine.pointerUp(pane, {200.0, 300.0});
    requireTrue(sameColor(engine.store().get(2)->color, sc::DrawingEngine::kPalette[1]),
                "second palette colour");

    auto id = engine.addDrawing(sc::DrawingType::Horizontal, {{0.0, 40.0}});
    requireTrue(id == 3, "programmatic add");
    requireTrue(sameColor(engine.store().get(3)->color, sc::DrawingEngine::kPalette[2]),
                "programmatic add uses the palette");
    requireTrue(engine.addDrawing(sc::DrawingType::Horizontal, {}) == 0, "invalid add");

    std::printf("  Test 1 (commit + palette): PASS\n");
  }

  // ---- Test 2: Select mode ----
  {
    sc::DrawingEngine engine;
    auto id = engine.addDrawing(sc::DrawingType::Segment, {{10.0, 50.0}, {50.0, 80.0}});
    engine.setInteractionMode(sc::InteractionMode::Select);

    requireTrue(engine.pointerDown(pane, {300.0, 180.0}) == S::Intercepted, "hit consumed");
    requireTrue(engine.selectedId() == id, "selected");

    requireTrue(engine.pointerDown(pane, {900.0, 450.0}) == S::Ignored, "empty space falls through");
    requireTrue(engine.selectedId() == 0, "selection cleared");

    requireTrue(engine.selectDrawing(id), "programmatic select");
    engine.setInteractionMode(sc::InteractionMode::Off);
    requireTrue(engine.selectedId() == 0, "leaving select clears selection");

    requireTrue(!engine.selectDrawing(99), "unknown id");
    requireTrue(engine.selectDrawing(id), "select again");
    requireTrue(engine.selectDrawing(0), "null clears");
    requireTrue(engine.selectedId() == 0, "cleared");

    std::printf("  Test 2 (select): PASS\n");
  }

  // ---- Test 3: Deletion ----
  {
    sc::DrawingEngine engine;
    auto a = engine.addDrawing(sc::DrawingType::Vertical, {{10.0, 0.0}});
    auto b = engine.addDrawing(sc::DrawingType::Vertical, {{20.0, 0.0}});

    requireTrue(!engine.deleteSelected(), "nothing selected");
    engine.selectDrawing(a);
    requireTrue(engine.deleteSelected(), "delete selected");
    requireTrue(engine.store().get(a) == nullptr, "a deleted");
    requireTrue(engine.selectedId() == 0, "selection cleared");

    requireTrue(engine.deleteDrawing(b), "delete by id");
    requireTrue(!engine.deleteDrawing(b), "already gone");

    engine.addDrawing(sc::DrawingType::Vertical, {{30.0, 0.0}});
    engine.clearDrawings();
    requireTrue(engine.store().count() == 0, "cleared");

    std::printf("  Test 3 (delete): PASS\n");
  }

  // ---- Test 4: Delete affordance placement ----
  {
    sc::DrawingEngine engine;
    sc::PixelPoint p;
    requireTrue(!engine.deleteAffordance(pane, p), "no selection");

    auto seg = engine.addDrawing(sc::DrawingType::Segment, {{10.0, 50.0}, {50.0, 80.0}});
    engine.selectDrawing(seg);
    requireTrue(engine.deleteAffordance(pane, p), "segment");
    requireClose(p.x, 300.0, 1e-9, "midpoint x");
    requireClose(p.y, 175.0, 1e-9, "midpoint y");

    auto h = engine.addDrawing(sc::DrawingType::Horizontal, {{0.0, 99.0}});
    engine.selectDrawing(h);
    requireTrue(engine.deleteAffordance(pane, p), "horizontal");
    requireClose(p.x, 525.0, 1e-9, "centered horizontally");
    requireClose(p.y, 25.0, 1e-9, "clamped below the top");

    auto v = engine.addDrawing(sc::DrawingType::Vertical, {{1.0, 0.0}});
    engine.selectDrawing(v);
    requireTrue(engine.deleteAffordance(pane, p), "vertical");
    requireClose(p.x, 50.0, 1e-9, "clamped right of the left edge");
    requireClose(p.y, 250.0, 1e-9, "centered vertically");

    std::printf("  Test 4 (delete affordance): PASS\n");
  }

  // ---- Test 5: Redraw includes the capture preview ----
  {
    sc::DrawingEngine engine;
    engine.addDrawing(sc::DrawingType::Segment, {{10.0, 50.0}, {50.0, 80.0}});
    requireTrue(engine.isDirty(), "dirty after add");

    sc::DrawingShapes shapes;
    engine.redraw(pane, shapes);
    requireTrue(!engine.isDirty(), "clean after redraw");
    requireTrue(shapes.lines.size() == 1, "one stored line");

    engine.setInteractionMode(sc::InteractionMode::Draw, sc::DrawingType::Segment);
    engine.pointerDown(pane, {100.0, 400.0});
    engine.pointerMove(pane, {400.0, 400.0});
    requireTrue(engine.isDirty(), "move marks dirty");

    sc::DrawingShapes withPreview;
    engine.redraw(pane, withPreview);
    requireTrue(withPreview.lines.size() == 2, "stored line + preview");
    requireClose(withPreview.lines[1].b.x, 400.0, 1e-9, "preview to pointer");

    std::printf("  Test 5 (redraw): PASS\n");
  }

  // ---- Test 6: Warnings reach the handler ----
  {
    sc::Pane unready(1, sc::PaneKind::Price);
    sc::DrawingEngine engine;
    std::string warning;
    engine.setWarningHandler([&](const std::string& msg) { warning = msg; });
    engine.setInteractionMode(sc::InteractionMode::Draw, sc::DrawingType::Rectangle);
    engine.pointerDown(unready, {10.0, 10.0});
    requireTrue(engine.pointerUp(unready, {20.0, 20.0}) == S::Discarded, "discarded");
    requireTrue(!warning.empty(), "warning delivered");
    requireTrue(engine.store().count() == 0, "nothing stored");

    std::printf("  Test 6 (warnings): PASS\n");
  }

  std::printf("D3.5 drawing_engine: ALL PASS\n");
  return 0;
}
