// D2.3 - InputMapper: drag, wheel and keys drive the shared range
// Tests: drag pans by pixel delta, wheel zooms around the cursor, minimum
// visible bars, key forwarding, unknown panes.

#include "sc/data/SyntheticSeries.hpp"
#include "sc/pane/Pane.hpp"
#include "sc/sync/InputMapper.hpp"
#include "sc/sync/PaneSynchronizer.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

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

int main() {
  sc::SyntheticSeriesConfig cfg;
  cfg.count = 300;
  sc::DataSeries series = sc::makeSyntheticSeries(cfg);

  sc::Pane price(1, sc::PaneKind::Price);
  sc::Pane volume(2, sc::PaneKind::Volume);
  price.setPixelSize(1050, 500);   // plot width 1000
  volume.setPixelSize(1050, 150);
  sc::PaneSynchronizer sync;
  sync.setSeries(&series);
  sync.registerPane(price);
  sync.registerPane(volume);
  sc::InputMapper mapper(sync);

  // ---- Test 1: Drag right reveals earlier bars ----
  {
    sync.setRange(1, {0.0, 100.0});  // 10 px per bar

    sc::PaneInputState in;
    in.paneId = 1;
    in.dragging = true;
    in.dragDx = 50.0;
    requireTrue(mapper.processInput(in), "drag changed range");
    requireClose(price.visibleRange().from, -5.0, 1e-9, "from shifted by 5 bars");
    requireClose(price.visibleRange().to, 95.0, 1e-9, "to shifted by 5 bars");
    requireClose(volume.visibleRange().from, -5.0, 1e-9, "volume follows drag");
    requireTrue(mapper.activePaneId() == 1, "active pane");

    // Dragging the volume pane moves the price pane too.
    in.paneId = 2;
    in.dragDx = -100.0;
    requireTrue(mapper.processInput(in), "drag on volume");
    requireClose(price.visibleRange().from, 5.0, 1e-9, "price follows volume drag");

    in.dragging = false;
    requireTrue(!mapper.processInput(in), "delta without button does nothing");

    std::printf("  Test 1 (drag): PASS\n");
  }

  // ---- Test 2: Wheel zooms around the cursor ----
  {
    sync.setRange(1, {0.0, 100.0});

    sc::PaneInputState in;
    in.paneId = 1;
    in.cursorX = 500.0;     // index 50
    in.scrollDelta = 1.0;   // zoom in by 1/1.1
    requireTrue(mapper.processInput(in), "wheel zoom");
    requireClose(price.visibleRange().from, 50.0 - 50.0 / 1.1, 1e-9, "from scaled toward cursor");
    requireClose(price.visibleRange().to, 50.0 + 50.0 / 1.1, 1e-9, "to scaled toward cursor");

    // Anchor stays under the cursor.
    sync.setRange(1, {0.0, 100.0});
    in.cursorX = 200.0;     // index 20
    in.scrollDelta = -1.0;  // zoom out by 1/0.9
    requireTrue(mapper.processInput(in), "wheel zoom out");
    const sc::LogicalRange& r = price.visibleRange();
    requireClose(r.from + 200.0 / 1000.0 * r.width(), 20.0, 1e-9, "cursor index preserved");

    std::printf("  Test 2 (wheel): PASS\n");
  }

  // ---- Test 3: Minimum visible bars and degenerate factors ----
  {
    sync.setRange(1, {0.0, 5.2});

    sc::PaneInputState in;
    in.paneId = 1;
    in.cursorX = 500.0;
    in.scrollDelta = 1.0;
    requireTrue(!mapper.processInput(in), "zoom below 5 bars rejected");
    requireClose(price.visibleRange().to, 5.2, 1e-12, "range kept");

    in.scrollDelta = -10.0;  // factor -1
    requireTrue(!mapper.processInput(in), "infinite scale rejected");

    std::printf("  Test 3 (zoom limits): PASS\n");
  }

  // ---- Test 4: Keys and unknown panes ----
  {
    sync.setRange(1, {0.0, 50.0});

    sc::PaneInputState in;
    in.paneId = 1;
    in.keyPressed = sc::KeyCode::Home;
    requireTrue(mapper.processInput(in), "Home key");
    requireClose(price.visibleRange().to, 305.0, 1e-9, "jumped to latest");

    sc::PaneInputState stray;
    stray.paneId = 42;
    stray.dragging = true;
    stray.dragDx = 10.0;
    requireTrue(!mapper.processInput(stray), "unknown pane ignored");
    requireTrue(mapper.activePaneId() == 0, "no active pane");

    std::printf("  Test 4 (keys + unknown pane): PASS\n");
  }

  std::printf("D2.3 input_mapper: ALL PASS\n");
  return 0;
}
