#include "sc/drawing/DrawingGeometry.hpp"
#include "sc/pane/Pane.hpp"
#include "sc/transform/CoordinateTransform.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace sc {

void DrawingShapes::clear() {
  fills.clear();
  lines.clear();
  markers.clear();
  labels.clear();
}

bool DrawingShapes::empty() const {
  return fills.empty() && lines.empty() && markers.empty() && labels.empty();
}

void DrawingShapes::append(const DrawingShapes& other) {
  fills.insert(fills.end(), other.fills.begin(), other.fills.end());
  lines.insert(lines.end(), other.lines.begin(), other.lines.end());
  markers.insert(markers.end(), other.markers.begin(), other.markers.end());
  labels.insert(labels.end(), other.labels.begin(), other.labels.end());
}

bool extendToEdge(const PixelPoint& anchor, double dx, double dy,
                  double width, double height, PixelPoint& out) {
  if (dx == 0.0 && dy == 0.0) return false;

  double t = std::numeric_limits<double>::infinity();
  if (dx > 0) t = std::min(t, (width - anchor.x) / dx);
  if (dx < 0) t = std::min(t, -anchor.x / dx);
  if (dy > 0) t = std::min(t, (height - anchor.y) / dy);
  if (dy < 0) t = std::min(t, -anchor.y / dy);
  t = std::max(t, 0.0);

  out.x = anchor.x + dx * t;
  out.y = anchor.y + dy * t;
  return true;
}

namespace {

// Fibonacci: 0, .236, .382, .5, .618, .786, 1
const double kFibLevels[7] = {0.0, 0.236, 0.382, 0.5, 0.618, 0.786, 1.0};
const float kFibColors[7][4] = {
  {0.937f, 0.267f, 0.267f, 1.0f},  // #ef4444
  {0.976f, 0.451f, 0.086f, 1.0f},  // #f97316
  {0.918f, 0.702f, 0.031f, 1.0f},  // #eab308
  {0.133f, 0.773f, 0.369f, 1.0f},  // #22c55e
  {0.231f, 0.510f, 0.965f, 1.0f},  // #3b82f6
  {0.545f, 0.361f, 0.965f, 1.0f},  // #8b5cf6
  {0.937f, 0.267f, 0.267f, 1.0f},  // #ef4444
};

const double kGoldenLevels[5] = {0.0, 0.382, 0.5, 0.618, 1.0};
const char* const kGoldenLabels[5] = {"0%", "38.2%", "50%", "61.8% \xE2\x98\x85", "100%"};
const float kGoldenColors[5][4] = {
  {0.937f, 0.267f, 0.267f, 1.0f},  // #ef4444
  {1.000f, 0.757f, 0.027f, 1.0f},  // #ffc107
  {0.133f, 0.773f, 0.369f, 1.0f},  // #22c55e
  {0.231f, 0.510f, 0.965f, 1.0f},  // #3b82f6
  {0.937f, 0.267f, 0.267f, 1.0f},  // #ef4444
};
const float kGoldenBand[4] = {1.000f, 0.757f, 0.027f, 1.0f};

void copyColor(const float* src, float* dst) {
  std::copy(src, src + 4, dst);
}

bool samePoint(const PixelPoint& a, const PixelPoint& b) {
  return a.x == b.x && a.y == b.y;
}

} // namespace

void DrawingGeometry::addMarker(const PixelPoint& c, bool selected, const float color[4],
                                DrawingShapes& out) const {
  ShapeMarker m;
  m.center = c;
  m.radius = selected ? config_.selectedMarkerRadius : config_.markerRadius;
  copyColor(color, m.color);
  out.markers.push_back(m);
}

void DrawingGeometry::addLine(const PixelPoint& a, const PixelPoint& b, const float color[4],
                              float width, DrawingShapes& out) const {
  if (samePoint(a, b)) {
    ShapeMarker m;
    m.center = a;
    m.radius = config_.degenerateMarkerRadius;
    copyColor(color, m.color);
    out.markers.push_back(m);
    return;
  }
  ShapeLine l;
  l.a = a;
  l.b = b;
  l.width = width;
  copyColor(color, l.color);
  out.lines.push_back(l);
}

void DrawingGeometry::addExtendedLine(const PixelPoint& a, const PixelPoint& b,
                                      bool extendStart, const float color[4], float width,
                                      double w, double h, DrawingShapes& out) const {
  double dx = b.x - a.x;
  double dy = b.y - a.y;
  double len = std::sqrt(dx * dx + dy * dy);
  if (!(len > 0.0)) {
    addLine(a, b, color, width, out);
    return;
  }
  double ux = dx / len, uy = dy / len;

  PixelPoint start = a, end = b;
  extendToEdge(b, ux, uy, w, h, end);
  if (extendStart) extendToEdge(a, -ux, -uy, w, h, start);
  addLine(start, end, color, width, out);
}

void DrawingGeometry::addLevels(DrawingType type, const PixelPoint& p0, const PixelPoint& p1,
                                bool selected, DrawingShapes& out) const {
  const bool golden = type == DrawingType::GoldenRatio;
  const double* levels = golden ? kGoldenLevels : kFibLevels;
  const int n = golden ? 5 : 7;
  const double minX = std::min(p0.x, p1.x);
  const double maxX = std::max(p0.x, p1.x);

  auto levelY = [&](double level) { return p0.y + (p1.y - p0.y) * level; };

  if (golden) {
    double y382 = levelY(0.382), y618 = levelY(0.618);
    ShapeFill band;
    band.polygon = {{minX, std::min(y382, y618)}, {maxX, std::min(y382, y618)},
                    {maxX, std::max(y382, y618)}, {minX, std::max(y382, y618)}};
    copyColor(selected ? config_.selectedColor : kGoldenBand, band.color);
    band.color[3] = config_.bandFillAlpha;
    out.fills.push_back(band);
  }

  for (int i = 0; i < n; ++i) {
    const double level = levels[i];
    const float* c = selected ? config_.selectedColor
                              : (golden ? kGoldenColors[i] : kFibColors[i]);
    const bool emphasis = golden && level == 0.618;
    const double y = levelY(level);

    ShapeLine l;
    l.a = {minX, y};
    l.b = {maxX, y};
    l.width = emphasis ? config_.goldenEmphasisWidth : config_.levelLineWidth;
    if (!golden || level == 0.5) {
      l.dashLength = config_.levelDash;
      l.gapLength = config_.levelGap;
    }
    copyColor(c, l.color);
    if (samePoint(l.a, l.b)) addLine(l.a, l.b, c, l.width, out);
    else out.lines.push_back(l);

    ShapeLabel label;
    label.anchor = {maxX + config_.labelOffsetX, y + config_.labelOffsetY};
    if (golden) {
      label.text = kGoldenLabels[i];
    } else {
      char buf[16];
      std::snprintf(buf, sizeof(buf), "%.1f%%", level * 100.0);
      label.text = buf;
    }
    label.bold = emphasis;
    copyColor(c, label.color);
    out.labels.push_back(label);
  }
}

void DrawingGeometry::buildFromPixels(DrawingType type, const std::vector<PixelPoint>& pts,
                                      const float color[4], float lineWidth,
                                      const std::string& text, bool selected,
                                      double plotWidth, double plotHeight,
                                      DrawingShapes& out) const {
  if (pts.empty()) return;

  const float* c = selected ? config_.selectedColor : color;
  const float width = selected ? config_.selectedLineWidth : lineWidth;
  const PixelPoint& p0 = pts[0];

  switch (type) {
    case DrawingType::Trendline:
    case DrawingType::Segment:
    case DrawingType::Ray: {
      if (pts.size() < 2) break;
      const PixelPoint& p1 = pts[1];
      if (type == DrawingType::Segment)
        addLine(p0, p1, c, width, out);
      else
        addExtendedLine(p0, p1, type == DrawingType::Trendline, c, width,
                        plotWidth, plotHeight, out);
      addMarker(p0, selected, c, out);
      if (type != DrawingType::Ray) addMarker(p1, selected, c, out);
      break;
    }
    case DrawingType::Horizontal:
    case DrawingType::Vertical: {
      ShapeLine l;
      if (type == DrawingType::Horizontal) {
        l.a = {0.0, p0.y};
        l.b = {plotWidth, p0.y};
      } else {
        l.a = {p0.x, 0.0};
        l.b = {p0.x, plotHeight};
      }
      l.width = width;
      l.dashLength = config_.guideDash;
      l.gapLength = config_.guideGap;
      copyColor(c, l.color);
      out.lines.push_back(l);
      break;
    }
    case DrawingType::ParallelChannel: {
      if (pts.size() < 2) break;
      const PixelPoint& p1 = pts[1];
      addExtendedLine(p0, p1, true, c, width, plotWidth, plotHeight, out);
      if (pts.size() < 3) break;

      // Offset line: the baseline vector re-centred on the anchor.
      const PixelPoint& p3 = pts[2];
      const double dx = p1.x - p0.x, dy = p1.y - p0.y;
      PixelPoint o0{p3.x - dx, p3.y - dy};
      PixelPoint o1{p3.x + dx, p3.y + dy};
      addExtendedLine(o0, o1, true, c, width, plotWidth, plotHeight, out);

      ShapeFill fill;
      fill.polygon = {p0, p1, o1, o0};
      copyColor(c, fill.color);
      fill.color[3] = config_.bandFillAlpha;
      out.fills.push_back(fill);
      break;
    }
    case DrawingType::Fibonacci:
    case DrawingType::GoldenRatio:
      if (pts.size() < 2) break;
      addLevels(type, p0, pts[1], selected, out);
      break;
    case DrawingType::Rectangle: {
      if (pts.size() < 2) break;
      const PixelPoint& p1 = pts[1];
      const double x0 = std::min(p0.x, p1.x), x1 = std::max(p0.x, p1.x);
      const double y0 = std::min(p0.y, p1.y), y1 = std::max(p0.y, p1.y);

      ShapeFill fill;
      fill.polygon = {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}};
      copyColor(c, fill.color);
      fill.color[3] = config_.rectangleFillAlpha;
      out.fills.push_back(fill);

      addLine({x0, y0}, {x1, y0}, c, width, out);
      addLine({x1, y0}, {x1, y1}, c, width, out);
      addLine({x1, y1}, {x0, y1}, c, width, out);
      addLine({x0, y1}, {x0, y0}, c, width, out);
      break;
    }
    case DrawingType::Text: {
      if (text.empty()) break;
      const double textW = static_cast<double>(textLength(text)) * config_.charWidth;

      ShapeFill backdrop;
      backdrop.polygon = {{p0.x - 2, p0.y - 14}, {p0.x + textW + 2, p0.y - 14},
                          {p0.x + textW + 2, p0.y + 4}, {p0.x - 2, p0.y + 4}};
      copyColor(config_.textBackdrop, backdrop.color);
      out.fills.push_back(backdrop);

      ShapeLabel label;
      label.anchor = p0;
      label.text = text;
      label.bold = true;
      label.backdrop = true;
      label.backdropWidth = static_cast<float>(textW);
      copyColor(c, label.color);
      out.labels.push_back(label);
      break;
    }
  }
}

bool DrawingGeometry::build(const Drawing& drawing, const Pane& pane, bool selected,
                            DrawingShapes& out) const {
  std::vector<PixelPoint> pts;
  pts.reserve(drawing.points.size());
  for (const auto& cp : drawing.points) {
    PixelPoint px;
    if (!chartToPixel(pane, cp, px)) return false;
    pts.push_back(px);
  }
  buildFromPixels(drawing.type, pts, drawing.color, drawing.lineWidth, drawing.text,
                  selected, pane.plotWidth(), pane.plotHeight(), out);
  return true;
}

std::size_t DrawingGeometry::buildAll(const DrawingStore& store, const Pane& pane,
                                      std::uint32_t selectedId, DrawingShapes& out) const {
  std::size_t built = 0;
  for (const auto& d : store.drawings()) {
    if (build(d, pane, d.id == selectedId, out)) built++;
  }
  return built;
}

} // namespace sc
