#pragma once
#include "sc/drawing/DrawingStore.hpp"
#include "sc/pane/ChartTypes.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace sc {

class Pane;

enum class InteractionMode : std::uint8_t {
  Off = 0,   // pointer input pans/zooms the chart
  Select,    // clicks hit-test drawings
  Draw       // pointer input builds one drawing of drawType()
};

const char* interactionModeName(InteractionMode mode);
bool parseInteractionMode(const std::string& name, InteractionMode& out);

enum class CaptureStatus : std::uint8_t {
  Ignored = 0,     // not consumed; route to pan/zoom or selection
  Intercepted,     // consumed, capture continues
  Committed,       // a drawing is ready in takeCommit()
  Discarded,       // capture abandoned, nothing persisted
  TextRequested    // text input opened at textAnchor()
};

struct CaptureCommit {
  DrawingType type{DrawingType::Trendline};
  std::vector<ChartPoint> points;
  std::string text;
};

using WarningHandler = std::function<void(const std::string&)>;

// Draw-mode state machine. Pixel positions are converted to chart space
// only at commit time (the channel baseline at the end of its first step).
class DrawingInteraction {
public:
  // Switching mode discards any in-progress capture and pending text.
  void setMode(InteractionMode mode, DrawingType drawType = DrawingType::Trendline);
  InteractionMode mode() const { return mode_; }
  DrawingType drawType() const { return drawType_; }

  bool isCapturing() const { return pressed_ || step_ > 0; }
  bool isPressed() const { return pressed_; }
  int step() const { return step_; }

  bool isTextPending() const { return textPending_; }
  const PixelPoint& textAnchor() const { return textAnchor_; }

  CaptureStatus pointerDown(const Pane& pane, const PixelPoint& p);
  CaptureStatus pointerMove(const Pane& pane, const PixelPoint& p);
  CaptureStatus pointerUp(const Pane& pane, const PixelPoint& p);
  CaptureStatus pointerLeave(const Pane& pane);

  // Commits a Text drawing at the anchor. Blank text closes the input
  // without creating anything.
  CaptureStatus confirmText(const Pane& pane, const std::string& text);
  void cancelText();

  // Drops the in-progress capture (not the pending text).
  void cancel();

  // One-shot: moves the last committed capture into `out`.
  bool takeCommit(CaptureCommit& out);

  // Pixel vertices for the in-progress preview, or false when idle.
  bool previewPixels(const Pane& pane, std::vector<PixelPoint>& out) const;

  void setWarningHandler(WarningHandler handler) { warn_ = std::move(handler); }

private:
  CaptureStatus finish(const Pane& pane);
  CaptureStatus discard(const char* reason);
  CaptureStatus commit(std::vector<ChartPoint> points, std::string text = {});
  void reset();

  InteractionMode mode_{InteractionMode::Off};
  DrawingType drawType_{DrawingType::Trendline};

  bool pressed_{false};
  int step_{0};
  PixelPoint start_;
  PixelPoint current_;
  ChartPoint baseline_[2];

  bool textPending_{false};
  PixelPoint textAnchor_;

  bool hasCommit_{false};
  CaptureCommit commit_;

  WarningHandler warn_;
};

} // namespace sc
