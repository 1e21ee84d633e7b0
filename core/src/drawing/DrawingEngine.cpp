#include "sc/drawing/DrawingEngine.hpp"
#include "sc/pane/Pane.hpp"
#include "sc/transform/CoordinateTransform.hpp"

#include <algorithm>
#include <cstdio>

namespace sc {

const float DrawingEngine::kPalette[kPaletteSize][4] = {
  {0.937f, 0.267f, 0.267f, 1.0f},  // #ef4444
  {0.976f, 0.451f, 0.086f, 1.0f},  // #f97316
  {0.918f, 0.702f, 0.031f, 1.0f},  // #eab308
  {0.133f, 0.773f, 0.369f, 1.0f},  // #22c55e
  {0.231f, 0.510f, 0.965f, 1.0f},  // #3b82f6
  {0.545f, 0.361f, 0.965f, 1.0f},  // #8b5cf6
  {0.925f, 0.282f, 0.600f, 1.0f},  // #ec4899
  {0.392f, 0.455f, 0.545f, 1.0f},  // #64748b
};

DrawingEngine::DrawingEngine() {
  interaction_.setWarningHandler([](const std::string& msg) {
    std::fprintf(stderr, "%s\n", msg.c_str());
  });
}

void DrawingEngine::setWarningHandler(WarningHandler handler) {
  interaction_.setWarningHandler(std::move(handler));
}

void DrawingEngine::setInteractionMode(InteractionMode mode, DrawingType drawType) {
  if (mode != InteractionMode::Select) selectedId_ = 0;
  interaction_.setMode(mode, drawType);
  dirty_ = true;
}

const float* DrawingEngine::nextColor() {
  const float* c = kPalette[paletteIndex_ % kPaletteSize];
  paletteIndex_++;
  return c;
}

CaptureStatus DrawingEngine::handle(CaptureStatus status) {
  if (status == CaptureStatus::Ignored) return status;
  dirty_ = true;

  if (status == CaptureStatus::Committed) {
    CaptureCommit c;
    if (interaction_.takeCommit(c)) {
      lastCreatedId_ = store_.add(c.type, std::move(c.points), nextColor(), std::move(c.text));
    }
  }
  return status;
}

CaptureStatus DrawingEngine::pointerDown(const Pane& pane, const PixelPoint& p) {
  if (interaction_.mode() == InteractionMode::Select) {
    DrawingHit hit = hitTester_.pick(p, store_, pane);
    if (selectedId_ != hit.drawingId) dirty_ = true;
    selectedId_ = hit.drawingId;
    return hit.hit ? CaptureStatus::Intercepted : CaptureStatus::Ignored;
  }
  return handle(interaction_.pointerDown(pane, p));
}

CaptureStatus DrawingEngine::pointerMove(const Pane& pane, const PixelPoint& p) {
  return handle(interaction_.pointerMove(pane, p));
}

CaptureStatus DrawingEngine::pointerUp(const Pane& pane, const PixelPoint& p) {
  return handle(interaction_.pointerUp(pane, p));
}

CaptureStatus DrawingEngine::pointerLeave(const Pane& pane) {
  return handle(interaction_.pointerLeave(pane));
}

CaptureStatus DrawingEngine::confirmText(const Pane& pane, const std::string& text) {
  return handle(interaction_.confirmText(pane, text));
}

void DrawingEngine::cancelText() {
  interaction_.cancelText();
  dirty_ = true;
}

std::uint32_t DrawingEngine::addDrawing(DrawingType type, std::vector<ChartPoint> points,
                                        std::string text) {
  if (!DrawingStore::validate(type, points, text)) return 0;
  std::uint32_t id = store_.add(type, std::move(points), nextColor(), std::move(text));
  if (id) dirty_ = true;
  return id;
}

bool DrawingEngine::deleteDrawing(std::uint32_t id) {
  if (!store_.remove(id)) return false;
  if (selectedId_ == id) selectedId_ = 0;
  dirty_ = true;
  return true;
}

void DrawingEngine::clearDrawings() {
  store_.clear();
  selectedId_ = 0;
  lastCreatedId_ = 0;
  dirty_ = true;
}

bool DrawingEngine::selectDrawing(std::uint32_t id) {
  if (id != 0 && !store_.get(id)) return false;
  if (selectedId_ != id) dirty_ = true;
  selectedId_ = id;
  return true;
}

bool DrawingEngine::deleteSelected() {
  if (selectedId_ == 0) return false;
  return deleteDrawing(selectedId_);
}

bool DrawingEngine::deleteAffordance(const Pane& pane, PixelPoint& out) const {
  const Drawing* d = store_.get(selectedId_);
  if (!d || d->points.empty()) return false;

  PixelPoint p0;
  if (!chartToPixel(pane, d->points[0], p0)) return false;

  const double w = pane.pixelWidth();
  const double h = pane.pixelHeight();
  double x = p0.x, y = p0.y;
  if (d->type == DrawingType::Horizontal) {
    x = w / 2;
  } else if (d->type == DrawingType::Vertical) {
    y = h / 2;
  } else if (d->points.size() >= 2) {
    PixelPoint p1;
    if (chartToPixel(pane, d->points[1], p1)) {
      x = (p0.x + p1.x) / 2;
      y = (p0.y + p1.y) / 2;
    }
  }

  out.x = std::max(50.0, std::min(w - 50.0, x));
  out.y = std::max(25.0, std::min(h - 25.0, y));
  return true;
}

void DrawingEngine::redraw(const Pane& pane, DrawingShapes& out) {
  geometry_.buildAll(store_, pane, selectedId_, out);

  std::vector<PixelPoint> preview;
  if (interaction_.previewPixels(pane, preview)) {
    const float* c = kPalette[paletteIndex_ % kPaletteSize];
    geometry_.buildFromPixels(interaction_.drawType(), preview, c, 2.0f, {}, false,
                              pane.plotWidth(), pane.plotHeight(), out);
  }
  dirty_ = false;
}

} // namespace sc
