// D4.5 - Headless Capture Demo
// Builds a three-pane chart (price, volume, indicator) over synthetic bars
// or a JSON series file, adds a few annotations through the command
// processor, captures the panes ending at a date and writes one PNG per pane.
//
// Usage: d4_5_capture_demo [series.json] [targetDate] [outPrefix]

#include "sc/commands/CommandProcessor.hpp"
#include "sc/data/SyntheticSeries.hpp"
#include "sc/export/ChartSnapshot.hpp"
#include "sc/gl/OsMesaSurface.hpp"
#include "sc/session/ChartWorkspace.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

static void requireOk(const sc::CmdResult& r, const char* ctx) {
  if (!r.ok) {
    std::fprintf(stderr, "FAIL [%s]: code=%s msg=%s\n",
                 ctx, r.err.code.c_str(), r.err.message.c_str());
    std::exit(1);
  }
}

static bool readFile(const std::string& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

int main(int argc, char** argv) {
  const std::string seriesPath = argc > 1 ? argv[1] : "";
  const std::string targetDate = argc > 2 ? argv[2] : "";
  const std::string prefix = argc > 3 ? argv[3] : "capture";

  sc::ChartWorkspace ws([](int w, int h) -> std::unique_ptr<sc::RasterSurface> {
    return sc::OsMesaSurface::create(w, h);
  });
  sc::CommandProcessor cp(ws);

  requireOk(cp.applyJsonText(R"({"cmd":"resizePane","paneId":1,"width":1000,"height":420})"), "price");
  requireOk(cp.applyJsonText(R"({"cmd":"resizePane","paneId":2,"width":1000,"height":120})"), "volume");
  requireOk(cp.applyJsonText(R"({"cmd":"resizePane","paneId":3,"width":1000,"height":160})"), "indicator");

  if (seriesPath.empty()) {
    sc::SyntheticSeriesConfig cfg;
    cfg.count = 400;
    ws.setSeries(sc::makeSyntheticSeries(cfg).records());
  } else {
    std::string json;
    if (!readFile(seriesPath, json) || !ws.loadSeriesJSON(json)) {
      std::fprintf(stderr, "Could not load series from %s\n", seriesPath.c_str());
      return 1;
    }
  }
  if (ws.series().empty()) {
    std::fprintf(stderr, "Series is empty\n");
    return 1;
  }

  // A horizontal level at the last close and a trendline across the tail.
  const sc::DataSeries& s = ws.series();
  const std::size_t last = s.lastIndex();
  const std::size_t back = last >= 60 ? last - 60 : 0;
  char buf[256];
  std::snprintf(buf, sizeof(buf),
                R"({"cmd":"addDrawing","type":"horizontal","points":[[%zu,%.4f]]})",
                last, s.at(last).close);
  requireOk(cp.applyJsonText(buf), "horizontal");
  std::snprintf(buf, sizeof(buf),
                R"({"cmd":"addDrawing","type":"trendline","points":[[%zu,%.4f],[%zu,%.4f]]})",
                back, s.at(back).low, last, s.at(last).low);
  requireOk(cp.applyJsonText(buf), "trendline");
  requireOk(cp.applyJsonText(R"({"cmd":"setIndicator","kind":"rsi"})"), "indicator");

  ws.renderFrame();

  std::string captureCmd = R"({"cmd":"capture","targetDate":")" + targetDate + "\"}";
  requireOk(cp.applyJsonText(captureCmd), "capture");
  // Capture runs on the next frame; the restored view settles after it.
  for (int frames = 0; frames < 4 && ws.needsFrame(); ++frames) ws.renderFrame();

  if (!cp.hasCaptureResult() || !cp.lastCaptureResult().ok) {
    std::fprintf(stderr, "Capture failed (is OSMesa available?)\n");
    return 1;
  }

  const sc::CaptureResult& res = cp.lastCaptureResult();
  std::printf("Captured %zu bars ending %s (index %zu), range [%.1f, %.1f)\n",
              res.barsNeeded, res.endDate.c_str(), res.endIndex, res.range.from, res.range.to);

  static const char* kNames[] = {"price", "volume", "indicator"};
  for (std::size_t i = 0; i < res.panes.size() && i < 3; ++i) {
    std::string path = prefix + "_" + kNames[i] + ".png";
    if (!sc::writePNG(path, res.panes[i].image)) {
      std::fprintf(stderr, "Could not write %s\n", path.c_str());
      return 1;
    }
    std::printf("  %s (%dx%d)\n", path.c_str(),
                res.panes[i].image.width, res.panes[i].image.height);
  }
  return 0;
}
