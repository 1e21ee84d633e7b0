#include "sc/drawing/DrawingInteraction.hpp"
#include "sc/pane/Pane.hpp"
#include "sc/transform/CoordinateTransform.hpp"

namespace sc {

const char* interactionModeName(InteractionMode mode) {
  switch (mode) {
    case InteractionMode::Off:    return "off";
    case InteractionMode::Select: return "select";
    case InteractionMode::Draw:   return "draw";
  }
  return "off";
}

bool parseInteractionMode(const std::string& name, InteractionMode& out) {
  if (name == "off") { out = InteractionMode::Off; return true; }
  if (name == "select") { out = InteractionMode::Select; return true; }
  if (name == "draw") { out = InteractionMode::Draw; return true; }
  return false;
}

void DrawingInteraction::setMode(InteractionMode mode, DrawingType drawType) {
  reset();
  textPending_ = false;
  mode_ = mode;
  drawType_ = drawType;
}

void DrawingInteraction::reset() {
  pressed_ = false;
  step_ = 0;
  start_ = {};
  current_ = {};
}

void DrawingInteraction::cancel() {
  reset();
}

CaptureStatus DrawingInteraction::pointerDown(const Pane&, const PixelPoint& p) {
  if (mode_ != InteractionMode::Draw) return CaptureStatus::Ignored;

  if (drawType_ == DrawingType::Text) {
    textPending_ = true;
    textAnchor_ = p;
    return CaptureStatus::TextRequested;
  }

  pressed_ = true;
  current_ = p;
  if (step_ == 0) start_ = p;
  return CaptureStatus::Intercepted;
}

CaptureStatus DrawingInteraction::pointerMove(const Pane&, const PixelPoint& p) {
  if (mode_ != InteractionMode::Draw) return CaptureStatus::Ignored;
  if (isCapturing()) current_ = p;
  return CaptureStatus::Intercepted;
}

CaptureStatus DrawingInteraction::pointerUp(const Pane& pane, const PixelPoint& p) {
  if (mode_ != InteractionMode::Draw) return CaptureStatus::Ignored;
  if (!pressed_) return CaptureStatus::Intercepted;

  pressed_ = false;
  current_ = p;
  return finish(pane);
}

CaptureStatus DrawingInteraction::pointerLeave(const Pane& pane) {
  if (mode_ != InteractionMode::Draw || !isCapturing()) return CaptureStatus::Ignored;

  if (drawType_ == DrawingType::ParallelChannel) {
    // The baseline is not fixed until its pointer-up; leaving abandons it.
    if (step_ == 0) {
      reset();
      return CaptureStatus::Discarded;
    }
    if (!pressed_) return CaptureStatus::Intercepted;
  }

  pressed_ = false;
  return finish(pane);
}

CaptureStatus DrawingInteraction::finish(const Pane& pane) {
  ChartPoint end;
  if (!pixelToChart(pane, current_, end)) {
    return discard("coordinate conversion failed, chart not ready");
  }

  switch (drawType_) {
    case DrawingType::Horizontal:
    case DrawingType::Vertical:
      return commit({end});

    case DrawingType::ParallelChannel: {
      if (step_ == 0) {
        ChartPoint start;
        if (!pixelToChart(pane, start_, start)) {
          return discard("coordinate conversion failed, chart not ready");
        }
        baseline_[0] = start;
        baseline_[1] = end;
        step_ = 1;
        return CaptureStatus::Intercepted;
      }
      return commit({baseline_[0], baseline_[1], end});
    }

    default: {
      ChartPoint start;
      if (!pixelToChart(pane, start_, start)) {
        return discard("coordinate conversion failed, chart not ready");
      }
      return commit({start, end});
    }
  }
}

CaptureStatus DrawingInteraction::discard(const char* reason) {
  if (warn_) {
    std::string msg = "DrawingInteraction: ";
    msg += reason;
    msg += "; ";
    msg += drawingTypeName(drawType_);
    msg += " capture discarded";
    warn_(msg);
  }
  reset();
  return CaptureStatus::Discarded;
}

CaptureStatus DrawingInteraction::commit(std::vector<ChartPoint> points, std::string text) {
  if (!DrawingStore::validate(drawType_, points, text)) {
    return discard("captured points are not valid");
  }
  commit_.type = drawType_;
  commit_.points = std::move(points);
  commit_.text = std::move(text);
  hasCommit_ = true;
  reset();
  return CaptureStatus::Committed;
}

CaptureStatus DrawingInteraction::confirmText(const Pane& pane, const std::string& text) {
  if (!textPending_) return CaptureStatus::Ignored;
  textPending_ = false;

  if (!DrawingStore::validate(DrawingType::Text, {ChartPoint{}}, text)) {
    return CaptureStatus::Discarded;
  }

  ChartPoint anchor;
  if (!pixelToChart(pane, textAnchor_, anchor)) {
    return discard("coordinate conversion failed, chart not ready");
  }
  return commit({anchor}, text);
}

void DrawingInteraction::cancelText() {
  textPending_ = false;
}

bool DrawingInteraction::takeCommit(CaptureCommit& out) {
  if (!hasCommit_) return false;
  out = std::move(commit_);
  commit_ = CaptureCommit{};
  hasCommit_ = false;
  return true;
}

bool DrawingInteraction::previewPixels(const Pane& pane, std::vector<PixelPoint>& out) const {
  if (mode_ != InteractionMode::Draw || !isCapturing()) return false;
  out.clear();

  if (drawType_ == DrawingType::ParallelChannel && step_ == 1) {
    PixelPoint b0, b1;
    if (!chartToPixel(pane, baseline_[0], b0) || !chartToPixel(pane, baseline_[1], b1))
      return false;
    out = {b0, b1, current_};
    return true;
  }

  if (drawType_ == DrawingType::Horizontal || drawType_ == DrawingType::Vertical) {
    out = {current_};
  } else {
    out = {start_, current_};
  }
  return true;
}

} // namespace sc
