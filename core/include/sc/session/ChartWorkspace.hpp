#pragma once
#include "sc/capture/CaptureSession.hpp"
#include "sc/capture/FrameLoop.hpp"
#include "sc/data/DataSeries.hpp"
#include "sc/drawing/DrawingEngine.hpp"
#include "sc/pane/AutoScale.hpp"
#include "sc/pane/Pane.hpp"
#include "sc/render/PaneScene.hpp"
#include "sc/render/SeriesLayer.hpp"
#include "sc/sync/InputMapper.hpp"
#include "sc/sync/PaneSynchronizer.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sc {

class RasterSurface;

// Builds the pixel target for a pane of the given size; may return nullptr
// (the pane then renders into its scene only).
using SurfaceFactory = std::function<std::unique_ptr<RasterSurface>(int, int)>;

inline constexpr Id kPricePaneId = 1;
inline constexpr Id kVolumePaneId = 2;
inline constexpr Id kIndicatorPaneId = 3;

// Price, volume and one switchable indicator pane on a shared time axis,
// with annotations on the price pane and reversible capture.
class ChartWorkspace {
public:
  explicit ChartWorkspace(SurfaceFactory factory = SurfaceFactory());
  ~ChartWorkspace();

  ChartWorkspace(const ChartWorkspace&) = delete;
  ChartWorkspace& operator=(const ChartWorkspace&) = delete;

  // ---- data ----
  // Fills missing indicator columns, then resets the view.
  void setSeries(std::vector<SeriesRecord> records);
  bool loadSeriesJSON(const std::string& json);
  const DataSeries& series() const { return series_; }

  // ---- panes ----
  Pane* pane(Id paneId) const;
  Pane& pricePane() { return *price_; }
  Pane& volumePane() { return *volume_; }
  Pane& indicatorPane() { return *indicator_; }

  void setPaneConfig(const PaneConfig& cfg);
  bool resizePane(Id paneId, int width, int height);

  // Macd, Kd or Rsi.
  bool setIndicator(PaneKind kind);
  PaneKind indicatorKind() const { return indicator_->kind(); }

  void setTheme(const Theme& theme);
  const Theme& theme() const { return layer_.theme(); }

  // ---- pointer / keyboard ----
  // Price-pane events go to the drawing engine first; unconsumed events
  // drive pan (drag) on any pane. Returns true when consumed.
  bool pointerDown(Id paneId, double x, double y);
  bool pointerMove(Id paneId, double x, double y);
  bool pointerUp(Id paneId, double x, double y);
  bool pointerLeave(Id paneId);
  bool wheel(Id paneId, double x, double y, double delta);
  bool keyDown(KeyCode key);
  CaptureStatus lastDrawingStatus() const { return lastStatus_; }

  // ---- control surface ----
  void setInteractionMode(InteractionMode mode, DrawingType type = DrawingType::Trendline);
  bool jumpToRange(int days) { return sync_.jumpToRange(days); }
  bool resetView() { return sync_.resetView(); }
  bool zoomIn() { return sync_.zoomIn(); }
  bool zoomOut() { return sync_.zoomOut(); }
  bool panLeft() { return sync_.panLeft(); }
  bool panRight() { return sync_.panRight(); }
  bool jumpToLatest() { return sync_.jumpToLatest(); }
  bool jumpToEarliest() { return sync_.jumpToEarliest(); }
  bool setRange(Id paneId, const LogicalRange& range) { return sync_.setRange(paneId, range); }

  std::uint32_t addDrawing(DrawingType type, std::vector<ChartPoint> points,
                           std::string text = {});
  bool deleteDrawing(std::uint32_t id) { return drawing_.deleteDrawing(id); }
  void clearDrawings() { drawing_.clearDrawings(); }
  bool selectDrawing(std::uint32_t id) { return drawing_.selectDrawing(id); }
  bool deleteSelected() { return drawing_.deleteSelected(); }
  // Returns the created drawing id, or 0.
  std::uint32_t confirmText(const std::string& text);
  void cancelText() { drawing_.cancelText(); }

  bool capture(const std::string& targetDate, CaptureCallback done);

  // ---- frames ----
  // One render tick: autoscale, re-render dirty panes, run continuations.
  void renderFrame();
  // True while a pane or the overlay is stale or a continuation waits on a
  // render. Hosts drawing on demand tick while this holds.
  bool needsFrame() const;
  const PaneScene* scene(Id paneId) const;

  // ---- state ----
  void setSymbol(const std::string& symbol) { symbol_ = symbol; }
  void setPeriod(const std::string& period) { period_ = period; }
  std::string saveState() const;
  // Validates the whole state before applying any of it.
  bool restoreState(const std::string& json);

  PaneSynchronizer& synchronizer() { return sync_; }
  InputMapper& inputMapper() { return mapper_; }
  DrawingEngine& drawings() { return drawing_; }
  AutoScale& autoScale() { return autoScale_; }
  SeriesLayer& seriesLayer() { return layer_; }
  CaptureSession& captureSession() { return capture_; }
  FrameLoop& frameLoop() { return loop_; }

private:
  void renderPanes();
  void renderPane(Pane& pane, PaneScene& scene);
  void attachSurface(Pane& pane);
  int sceneSlot(Id paneId) const;

  SurfaceFactory factory_;
  DataSeries series_;

  // Panes outlive the synchronizer that listens to them.
  std::unique_ptr<Pane> price_;
  std::unique_ptr<Pane> volume_;
  std::unique_ptr<Pane> indicator_;

  PaneSynchronizer sync_;
  InputMapper mapper_;
  DrawingEngine drawing_;
  AutoScale autoScale_;
  SeriesLayer layer_;
  PaneScene scenes_[3];
  DrawingShapes overlay_;

  // Destroyed before sync_; dropped continuations restore through it.
  FrameLoop loop_;
  CaptureSession capture_;

  bool dragging_{false};
  Id dragPane_{0};
  double lastX_{0};
  double lastY_{0};
  CaptureStatus lastStatus_{CaptureStatus::Ignored};

  std::string symbol_;
  std::string period_;
};

} // namespace sc
