#include "sc/render/SeriesLayer.hpp"
#include "sc/data/DataSeries.hpp"
#include "sc/drawing/DrawingGeometry.hpp"
#include "sc/math/NiceTicks.hpp"
#include "sc/pane/Pane.hpp"
#include "sc/render/PaneScene.hpp"
#include "sc/transform/CoordinateTransform.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace sc {

namespace {

// Polyline through the finite values of `field`, broken at gaps.
void addFieldLine(const Pane& pane, const DataSeries& series, SeriesField field,
                  int first, int last, const float color[4], float width,
                  PaneScene& scene) {
  DrawBatch& b = scene.addLines(color, width);
  bool havePrev = false;
  double px = 0, py = 0;
  for (int i = first; i <= last; ++i) {
    double v = fieldValue(series.at(static_cast<std::size_t>(i)), field);
    double x, y;
    if (!indexToX(pane, i, x) || !priceToY(pane, v, y)) {
      havePrev = false;
      continue;
    }
    if (havePrev) {
      b.vertices.push_back(static_cast<float>(px));
      b.vertices.push_back(static_cast<float>(py));
      b.vertices.push_back(static_cast<float>(x));
      b.vertices.push_back(static_cast<float>(y));
    }
    px = x;
    py = y;
    havePrev = true;
  }
}

// Bars from `base` to each value; sign or candle direction picks the colour.
template <typename IsUp>
void addBars(const Pane& pane, const DataSeries& series, SeriesField field,
             int first, int last, double base, double halfWidth,
             const float up[4], const float down[4], IsUp isUp, PaneScene& scene) {
  double yBase;
  if (!priceToY(pane, base, yBase)) return;

  for (int pass = 0; pass < 2; ++pass) {
    const bool wantUp = pass == 0;
    for (int i = first; i <= last; ++i) {
      const SeriesRecord& r = series.at(static_cast<std::size_t>(i));
      double v = fieldValue(r, field);
      double x, y;
      if (!indexToX(pane, i, x) || !priceToY(pane, v, y)) continue;
      if (isUp(r) != wantUp) continue;
      if (std::fabs(y - yBase) < 1.0) y = yBase - 1.0;
      scene.addRect(x - halfWidth, y, x + halfWidth, yBase, wantUp ? up : down);
    }
  }
}

} // namespace

void SeriesLayer::appendShapes(const DrawingShapes& shapes, PaneScene& scene) {
  for (const auto& f : shapes.fills) {
    scene.addPolygon(f.polygon, f.color);
  }
  for (const auto& l : shapes.lines) {
    DrawBatch& b = scene.addLines(l.color, l.width, l.dashLength, l.gapLength);
    b.vertices.push_back(static_cast<float>(l.a.x));
    b.vertices.push_back(static_cast<float>(l.a.y));
    b.vertices.push_back(static_cast<float>(l.b.x));
    b.vertices.push_back(static_cast<float>(l.b.y));
  }
  for (const auto& m : shapes.markers) {
    scene.addDisc(m.center, m.radius, m.color);
  }
  for (const auto& t : shapes.labels) {
    scene.addLabel(t.anchor, t.text, t.color, t.bold);
  }
}

bool SeriesLayer::build(const Pane& pane, const DataSeries& series,
                        const DrawingShapes* overlay, PaneScene& scene) const {
  scene.reset(pane.pixelWidth(), pane.pixelHeight(), theme_.backgroundColor);
  if (!pane.isReady()) return false;

  buildGrid(pane, scene);

  if (!series.empty()) {
    // One extra bar each side so partially visible bars are drawn.
    const LogicalRange& r = pane.visibleRange();
    const double lastIdx = static_cast<double>(series.lastIndex());
    int first = static_cast<int>(std::max(0.0, std::floor(r.from) - 1.0));
    int last = static_cast<int>(std::min(lastIdx, std::ceil(r.to) + 1.0));

    if (first <= last) {
      switch (pane.kind()) {
        case PaneKind::Price:  buildCandles(pane, series, first, last, scene); break;
        case PaneKind::Volume: buildVolume(pane, series, first, last, scene); break;
        case PaneKind::Macd:   buildMacd(pane, series, first, last, scene); break;
        case PaneKind::Kd:
        case PaneKind::Rsi:    buildOscillator(pane, series, first, last, scene); break;
      }
    }
  }

  if (overlay) appendShapes(*overlay, scene);

  buildAxis(pane, scene);
  return true;
}

void SeriesLayer::buildGrid(const Pane& pane, PaneScene& scene) const {
  const PriceRange& p = pane.priceRange();
  TickSet ticks = computeNiceTicks(p.min, p.max, config_.targetTicks);
  DrawBatch& b = scene.addLines(theme_.gridColor, theme_.gridLineWidth);
  for (double v : ticks.values) {
    double y;
    if (!priceToY(pane, v, y)) continue;
    b.vertices.push_back(0.0f);
    b.vertices.push_back(static_cast<float>(y));
    b.vertices.push_back(static_cast<float>(pane.plotWidth()));
    b.vertices.push_back(static_cast<float>(y));
  }
}

void SeriesLayer::buildCandles(const Pane& pane, const DataSeries& series, int first, int last,
                               PaneScene& scene) const {
  const double halfBody =
      std::max(config_.minBodyWidth, pane.barSpacing() * config_.candleBodyFraction) * 0.5;

  if (config_.showBollinger) {
    addFieldLine(pane, series, SeriesField::BbUpper, first, last,
                 theme_.bollingerUpper, theme_.overlayLineWidth, scene);
    addFieldLine(pane, series, SeriesField::BbMiddle, first, last,
                 theme_.bollingerMiddle, theme_.overlayLineWidth, scene);
    addFieldLine(pane, series, SeriesField::BbLower, first, last,
                 theme_.bollingerLower, theme_.overlayLineWidth, scene);
  }

  // Up candles then down candles, one batch each.
  for (int pass = 0; pass < 2; ++pass) {
    const bool wantUp = pass == 0;
    const float* color = wantUp ? theme_.candleUp : theme_.candleDown;
    for (int i = first; i <= last; ++i) {
      const SeriesRecord& r = series.at(static_cast<std::size_t>(i));
      if ((r.close >= r.open) != wantUp) continue;

      double x, yO, yC, yH, yL;
      if (!indexToX(pane, i, x) || !priceToY(pane, r.open, yO) || !priceToY(pane, r.close, yC) ||
          !priceToY(pane, r.high, yH) || !priceToY(pane, r.low, yL))
        continue;

      scene.addRect(x - 0.5, yH, x + 0.5, yL, color);
      double top = std::min(yO, yC), bottom = std::max(yO, yC);
      if (bottom - top < 1.0) bottom = top + 1.0;
      scene.addRect(x - halfBody, top, x + halfBody, bottom, color);
    }
  }

  const SeriesField mas[5] = {SeriesField::Ma5, SeriesField::Ma10, SeriesField::Ma20,
                              SeriesField::Ma60, SeriesField::Ma120};
  for (int m = 0; m < 5; ++m) {
    addFieldLine(pane, series, mas[m], first, last, theme_.maColors[m],
                 theme_.overlayLineWidth, scene);
  }
}

void SeriesLayer::buildVolume(const Pane& pane, const DataSeries& series, int first, int last,
                              PaneScene& scene) const {
  const double half =
      std::max(config_.minBodyWidth, pane.barSpacing() * config_.candleBodyFraction) * 0.5;
  addBars(pane, series, SeriesField::Volume, first, last, 0.0, half,
          theme_.volumeUp, theme_.volumeDown,
          [](const SeriesRecord& r) { return r.close >= r.open; }, scene);
  addFieldLine(pane, series, SeriesField::VolumeMa5, first, last, theme_.volumeMa5,
               theme_.overlayLineWidth, scene);
}

void SeriesLayer::buildMacd(const Pane& pane, const DataSeries& series, int first, int last,
                            PaneScene& scene) const {
  const double half =
      std::max(config_.minBodyWidth, pane.barSpacing() * config_.candleBodyFraction) * 0.5;
  addBars(pane, series, SeriesField::MacdHist, first, last, 0.0, half,
          theme_.histogramUp, theme_.histogramDown,
          [](const SeriesRecord& r) { return r.macdHist >= 0.0; }, scene);
  addFieldLine(pane, series, SeriesField::Macd, first, last, theme_.macdLine,
               theme_.overlayLineWidth, scene);
  addFieldLine(pane, series, SeriesField::MacdSignal, first, last, theme_.macdSignal,
               theme_.overlayLineWidth, scene);
}

void SeriesLayer::buildOscillator(const Pane& pane, const DataSeries& series, int first, int last,
                                  PaneScene& scene) const {
  const bool kd = pane.kind() == PaneKind::Kd;
  const double* bands = kd ? config_.kdBands : config_.rsiBands;
  const double w = pane.plotWidth();

  double yTop, yHigh, yLow, yBottom;
  if (priceToY(pane, 100.0, yTop) && priceToY(pane, bands[0], yHigh) &&
      priceToY(pane, bands[1], yLow) && priceToY(pane, 0.0, yBottom)) {
    scene.addRect(0.0, yTop, w, yHigh, theme_.overboughtBand);
    scene.addRect(0.0, yLow, w, yBottom, theme_.oversoldBand);
  }

  if (kd) {
    addFieldLine(pane, series, SeriesField::K, first, last, theme_.kLine,
                 theme_.overlayLineWidth, scene);
    addFieldLine(pane, series, SeriesField::D, first, last, theme_.dLine,
                 theme_.overlayLineWidth, scene);
  } else {
    addFieldLine(pane, series, SeriesField::Rsi, first, last, theme_.rsiLine,
                 theme_.overlayLineWidth, scene);
  }
}

void SeriesLayer::buildAxis(const Pane& pane, PaneScene& scene) const {
  const double plotW = pane.plotWidth();
  const double w = pane.pixelWidth();
  const double h = pane.pixelHeight();

  // Gutter covers anything drawn past the plot edge.
  scene.addRect(plotW, 0.0, w, h, theme_.axisGutterColor);
  if (pane.plotHeight() < h) scene.addRect(0.0, pane.plotHeight(), plotW, h, theme_.axisGutterColor);

  DrawBatch& edge = scene.addLines(theme_.axisLineColor, 1.0f);
  edge.vertices.insert(edge.vertices.end(),
                       {static_cast<float>(plotW), 0.0f,
                        static_cast<float>(plotW), static_cast<float>(h)});

  const PriceRange& p = pane.priceRange();
  TickSet ticks = computeNiceTicks(p.min, p.max, config_.targetTicks);
  int decimals = ticks.step >= 1.0 ? 0 : static_cast<int>(std::ceil(-std::log10(ticks.step)));
  decimals = std::min(decimals, 6);
  for (double v : ticks.values) {
    double y;
    if (!priceToY(pane, v, y)) continue;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
    scene.addLabel({plotW + 4.0, y + 4.0}, buf, theme_.labelColor);
  }
}

} // namespace sc
