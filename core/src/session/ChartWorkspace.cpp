#include "sc/session/ChartWorkspace.hpp"
#include "sc/math/Indicators.hpp"
#include "sc/render/RasterSurface.hpp"
#include "sc/session/ChartState.hpp"

#include <cstdio>
#include <memory>
#include <utility>

namespace sc {

ChartWorkspace::ChartWorkspace(SurfaceFactory factory)
  : factory_(std::move(factory)),
    price_(std::make_unique<Pane>(kPricePaneId, PaneKind::Price)),
    volume_(std::make_unique<Pane>(kVolumePaneId, PaneKind::Volume)),
    indicator_(std::make_unique<Pane>(kIndicatorPaneId, PaneKind::Macd)),
    mapper_(sync_),
    capture_(sync_, loop_) {
  sync_.setSeries(&series_);
  sync_.registerPane(*price_);   // primary
  sync_.registerPane(*volume_);
  sync_.registerPane(*indicator_);

  loop_.setRenderCallback([this]() { renderPanes(); });
}

ChartWorkspace::~ChartWorkspace() = default;

// ---- data ----

void ChartWorkspace::setSeries(std::vector<SeriesRecord> records) {
  fillMissingIndicators(records);
  series_.setRecords(std::move(records));

  for (Id id : sync_.paneIds()) sync_.pane(id)->clearPriceScale();
  drawing_.markDirty();

  if (!series_.empty() && !sync_.resetView()) {
    // Applied on the first resizePane() instead.
    std::fprintf(stderr, "ChartWorkspace: view reset deferred, primary pane not measured\n");
  }
}

bool ChartWorkspace::loadSeriesJSON(const std::string& json) {
  DataSeries parsed;
  if (!parsed.loadJSON(json)) return false;
  setSeries(parsed.records());
  return true;
}

// ---- panes ----

Pane* ChartWorkspace::pane(Id paneId) const {
  return sync_.pane(paneId);
}

void ChartWorkspace::setPaneConfig(const PaneConfig& cfg) {
  price_->setConfig(cfg);
  volume_->setConfig(cfg);
  indicator_->setConfig(cfg);
}

void ChartWorkspace::attachSurface(Pane& pane) {
  if (pane.surface() || !factory_) return;
  if (pane.pixelWidth() <= 0 || pane.pixelHeight() <= 0) return;

  std::unique_ptr<RasterSurface> surface = factory_(pane.pixelWidth(), pane.pixelHeight());
  if (!surface) {
    std::fprintf(stderr, "ChartWorkspace: no surface for pane %llu\n",
                 static_cast<unsigned long long>(pane.id()));
    return;
  }
  pane.setSurface(std::move(surface));
}

bool ChartWorkspace::resizePane(Id paneId, int width, int height) {
  Pane* p = sync_.pane(paneId);
  if (!p || width < 0 || height < 0) return false;

  p->setPixelSize(width, height);
  attachSurface(*p);

  LogicalRange shared;
  if (!series_.empty() && !sync_.sharedRange(shared)) sync_.resetView();
  drawing_.markDirty();
  return true;
}

bool ChartWorkspace::setIndicator(PaneKind kind) {
  if (kind == PaneKind::Price || kind == PaneKind::Volume) return false;
  if (capture_.inFlight()) return false;
  if (kind == indicator_->kind()) return true;

  auto fresh = std::make_unique<Pane>(kIndicatorPaneId, kind);
  fresh->setConfig(indicator_->config());
  fresh->setPixelSize(indicator_->pixelWidth(), indicator_->pixelHeight());

  sync_.unregisterPane(kIndicatorPaneId);
  indicator_ = std::move(fresh);
  attachSurface(*indicator_);
  sync_.registerPane(*indicator_);
  return true;
}

void ChartWorkspace::setTheme(const Theme& theme) {
  layer_.setTheme(theme);
  for (Id id : sync_.paneIds()) sync_.pane(id)->markDirty();
}

// ---- pointer / keyboard ----

bool ChartWorkspace::pointerDown(Id paneId, double x, double y) {
  Pane* p = sync_.pane(paneId);
  if (!p) return false;

  if (paneId == kPricePaneId) {
    lastStatus_ = drawing_.pointerDown(*p, {x, y});
    if (lastStatus_ != CaptureStatus::Ignored) return true;
  }

  dragging_ = true;
  dragPane_ = paneId;
  lastX_ = x;
  lastY_ = y;
  return true;
}

bool ChartWorkspace::pointerMove(Id paneId, double x, double y) {
  Pane* p = sync_.pane(paneId);
  if (!p) return false;

  if (paneId == kPricePaneId && !dragging_) {
    lastStatus_ = drawing_.pointerMove(*p, {x, y});
    if (lastStatus_ != CaptureStatus::Ignored) return true;
  }

  if (!dragging_ || dragPane_ != paneId) return false;

  PaneInputState in;
  in.paneId = paneId;
  in.cursorX = x;
  in.cursorY = y;
  in.dragDx = x - lastX_;
  in.dragDy = y - lastY_;
  in.dragging = true;
  lastX_ = x;
  lastY_ = y;
  return mapper_.processInput(in);
}

bool ChartWorkspace::pointerUp(Id paneId, double x, double y) {
  Pane* p = sync_.pane(paneId);
  if (!p) return false;

  bool wasDragging = dragging_;
  dragging_ = false;

  if (paneId == kPricePaneId && !wasDragging) {
    lastStatus_ = drawing_.pointerUp(*p, {x, y});
    return lastStatus_ != CaptureStatus::Ignored;
  }
  return wasDragging;
}

bool ChartWorkspace::pointerLeave(Id paneId) {
  Pane* p = sync_.pane(paneId);
  if (!p) return false;

  if (dragPane_ == paneId) dragging_ = false;

  if (paneId == kPricePaneId) {
    lastStatus_ = drawing_.pointerLeave(*p);
    return lastStatus_ != CaptureStatus::Ignored;
  }
  return false;
}

bool ChartWorkspace::wheel(Id paneId, double x, double y, double delta) {
  PaneInputState in;
  in.paneId = paneId;
  in.cursorX = x;
  in.cursorY = y;
  in.scrollDelta = delta;
  return mapper_.processInput(in);
}

bool ChartWorkspace::keyDown(KeyCode key) {
  PaneInputState in;
  in.paneId = kPricePaneId;
  in.keyPressed = key;
  return mapper_.processInput(in);
}

// ---- control surface ----

void ChartWorkspace::setInteractionMode(InteractionMode mode, DrawingType type) {
  dragging_ = false;
  drawing_.setInteractionMode(mode, type);
}

std::uint32_t ChartWorkspace::addDrawing(DrawingType type, std::vector<ChartPoint> points,
                                         std::string text) {
  return drawing_.addDrawing(type, std::move(points), std::move(text));
}

std::uint32_t ChartWorkspace::confirmText(const std::string& text) {
  lastStatus_ = drawing_.confirmText(*price_, text);
  return lastStatus_ == CaptureStatus::Committed ? drawing_.lastCreatedId() : 0;
}

bool ChartWorkspace::capture(const std::string& targetDate, CaptureCallback done) {
  return capture_.capture(targetDate, std::move(done));
}

// ---- frames ----

void ChartWorkspace::renderFrame() {
  loop_.tick();
}

bool ChartWorkspace::needsFrame() const {
  if (loop_.pendingCount() > 0) return true;
  // The overlay can only be redrawn once the price pane has a size.
  if (drawing_.isDirty() && price_->isReady()) return true;
  for (const Pane* p : {price_.get(), volume_.get(), indicator_.get()}) {
    if (p->isDirty()) return true;
  }
  return false;
}

int ChartWorkspace::sceneSlot(Id paneId) const {
  switch (paneId) {
    case kPricePaneId:     return 0;
    case kVolumePaneId:    return 1;
    case kIndicatorPaneId: return 2;
    default:               return -1;
  }
}

const PaneScene* ChartWorkspace::scene(Id paneId) const {
  int slot = sceneSlot(paneId);
  return slot < 0 ? nullptr : &scenes_[slot];
}

void ChartWorkspace::renderPanes() {
  if (drawing_.isDirty()) price_->markDirty();

  for (Id id : sync_.paneIds()) {
    Pane* p = sync_.pane(id);
    int slot = sceneSlot(id);
    if (slot < 0) continue;

    // Scale follows the visible window; a changed scale marks the pane dirty.
    if (p->hasVisibleRange()) autoScale_.apply(*p, series_);
    if (p->isDirty()) renderPane(*p, scenes_[slot]);
  }
}

void ChartWorkspace::renderPane(Pane& pane, PaneScene& scene) {
  const DrawingShapes* overlay = nullptr;
  if (pane.id() == kPricePaneId) {
    overlay_.clear();
    if (pane.isReady()) {
      drawing_.redraw(pane, overlay_);
      overlay = &overlay_;
    }
  }

  layer_.build(pane, series_, overlay, scene);

  if (RasterSurface* surface = pane.surface()) {
    if (!surface->render(scene)) {
      std::fprintf(stderr, "ChartWorkspace: render failed for pane %llu\n",
                   static_cast<unsigned long long>(pane.id()));
    }
  }
  pane.clearDirty();
}

// ---- state ----

std::string ChartWorkspace::saveState() const {
  ChartState state;
  state.hasRange = sync_.sharedRange(state.range);
  state.indicator = paneKindName(indicator_->kind());
  state.drawingsJSON = drawing_.store().toJSON();
  state.themeName = layer_.theme().name;
  state.symbol = symbol_;
  state.period = period_;
  return serializeChartState(state);
}

bool ChartWorkspace::restoreState(const std::string& json) {
  ChartState state;
  if (!deserializeChartState(json, state)) {
    std::fprintf(stderr, "ChartWorkspace: malformed chart state\n");
    return false;
  }

  PaneKind kind;
  if (!parsePaneKind(state.indicator, kind) ||
      kind == PaneKind::Price || kind == PaneKind::Volume) {
    std::fprintf(stderr, "ChartWorkspace: unknown indicator '%s'\n", state.indicator.c_str());
    return false;
  }

  Theme theme = layer_.theme();
  if (!state.themeName.empty() && !themeByName(state.themeName, theme)) {
    std::fprintf(stderr, "ChartWorkspace: unknown theme '%s'\n", state.themeName.c_str());
    return false;
  }

  DrawingStore drawings;
  if (!state.drawingsJSON.empty() && !drawings.loadJSON(state.drawingsJSON)) {
    std::fprintf(stderr, "ChartWorkspace: invalid drawings in chart state\n");
    return false;
  }

  if (!setIndicator(kind)) return false;
  setTheme(theme);
  drawing_.setInteractionMode(InteractionMode::Off);
  drawing_.clearDrawings();
  drawing_.store().replaceDrawings(std::move(drawings));
  if (state.hasRange) sync_.setRange(kPricePaneId, state.range);

  symbol_ = state.symbol;
  period_ = state.period;
  return true;
}

} // namespace sc
