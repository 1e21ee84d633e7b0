#include "sc/render/PaneScene.hpp"

#include <algorithm>
#include <cmath>

namespace sc {

namespace {

constexpr double kPi = 3.14159265358979323846;

bool sameColor(const float* a, const float* b) {
  return a[0] == b[0] && a[1] == b[1] && a[2] == b[2] && a[3] == b[3];
}

void pushVertex(DrawBatch& b, double x, double y) {
  b.vertices.push_back(static_cast<float>(x));
  b.vertices.push_back(static_cast<float>(y));
}

} // namespace

void PaneScene::reset(int width, int height, const float background[4]) {
  width_ = width;
  height_ = height;
  std::copy(background, background + 4, background_);
  batches_.clear();
  labels_.clear();
}

DrawBatch& PaneScene::addTriangles(const float color[4]) {
  // Consecutive solid geometry of one colour shares a batch.
  if (!batches_.empty()) {
    DrawBatch& last = batches_.back();
    if (last.kind == PrimitiveKind::Triangles && sameColor(last.color, color)) return last;
  }
  DrawBatch b;
  b.kind = PrimitiveKind::Triangles;
  std::copy(color, color + 4, b.color);
  batches_.push_back(std::move(b));
  return batches_.back();
}

DrawBatch& PaneScene::addLines(const float color[4], float width,
                               float dashLength, float gapLength) {
  if (!batches_.empty()) {
    DrawBatch& last = batches_.back();
    if (last.kind == PrimitiveKind::Lines && sameColor(last.color, color) &&
        last.lineWidth == width && last.dashLength == dashLength &&
        last.gapLength == gapLength)
      return last;
  }
  DrawBatch b;
  b.kind = PrimitiveKind::Lines;
  std::copy(color, color + 4, b.color);
  b.lineWidth = width;
  b.dashLength = dashLength;
  b.gapLength = gapLength;
  batches_.push_back(std::move(b));
  return batches_.back();
}

void PaneScene::addRect(double x0, double y0, double x1, double y1, const float color[4]) {
  if (x0 > x1) std::swap(x0, x1);
  if (y0 > y1) std::swap(y0, y1);
  DrawBatch& b = addTriangles(color);
  pushVertex(b, x0, y0); pushVertex(b, x1, y0); pushVertex(b, x0, y1);
  pushVertex(b, x0, y1); pushVertex(b, x1, y0); pushVertex(b, x1, y1);
}

void PaneScene::addPolygon(const std::vector<PixelPoint>& convex, const float color[4]) {
  if (convex.size() < 3) return;
  DrawBatch& b = addTriangles(color);
  for (std::size_t i = 1; i + 1 < convex.size(); ++i) {
    pushVertex(b, convex[0].x, convex[0].y);
    pushVertex(b, convex[i].x, convex[i].y);
    pushVertex(b, convex[i + 1].x, convex[i + 1].y);
  }
}

void PaneScene::addDisc(const PixelPoint& center, double radius, const float color[4],
                        int segments) {
  if (!(radius > 0.0) || segments < 3) return;
  DrawBatch& b = addTriangles(color);
  const double step = 2.0 * kPi / segments;
  for (int i = 0; i < segments; ++i) {
    double a0 = step * i, a1 = step * (i + 1);
    pushVertex(b, center.x, center.y);
    pushVertex(b, center.x + radius * std::cos(a0), center.y + radius * std::sin(a0));
    pushVertex(b, center.x + radius * std::cos(a1), center.y + radius * std::sin(a1));
  }
}

void PaneScene::addLabel(const PixelPoint& anchor, const std::string& text,
                         const float color[4], bool bold) {
  SceneLabel l;
  l.anchor = anchor;
  l.text = text;
  std::copy(color, color + 4, l.color);
  l.bold = bold;
  labels_.push_back(std::move(l));
}

} // namespace sc
