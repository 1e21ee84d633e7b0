#include "sc/capture/CaptureSession.hpp"
#include "sc/capture/FrameLoop.hpp"
#include "sc/data/DataSeries.hpp"
#include "sc/pane/Pane.hpp"
#include "sc/render/RasterSurface.hpp"
#include "sc/sync/PaneSynchronizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <memory>

namespace sc {

std::size_t computeBarsNeeded(double paneWidth, double axisReserve, double barSpacing) {
  double avail = paneWidth - axisReserve;
  if (!(avail > 0.0) || !(barSpacing > 0.0)) return 0;
  return static_cast<std::size_t>(std::ceil(avail / barSpacing));
}

LogicalRange computeCaptureRange(std::size_t endIndex, std::size_t barsNeeded) {
  double end = static_cast<double>(endIndex);
  double bars = static_cast<double>(barsNeeded);
  LogicalRange r;
  r.from = std::max(0.0, end - bars + 1.0);
  r.to = end + 1.0;
  return r;
}

// ---- RangeTransaction ----

RangeTransaction::RangeTransaction(PaneSynchronizer& sync) : sync_(sync) {
  for (Id id : sync_.paneIds()) {
    const Pane* p = sync_.pane(id);
    Saved s;
    s.paneId = id;
    s.hadRange = p->hasVisibleRange();
    s.range = p->visibleRange();
    s.locked = p->isBarSpacingLocked();
    s.spacing = p->lockedBarSpacing();
    s.hadPrice = p->hasPriceScale();
    s.price = p->priceRange();
    saved_.push_back(s);
  }
}

RangeTransaction::~RangeTransaction() {
  restore();
}

void RangeTransaction::restore() {
  if (restored_) return;
  restored_ = true;

  for (const Saved& s : saved_) {
    Pane* p = sync_.pane(s.paneId);
    if (!p) continue;  // unregistered meanwhile

    if (s.locked) p->lockBarSpacing(s.spacing);
    else p->unlockBarSpacing();

    if (s.hadRange) p->setVisibleRange(s.range, kUnsyncedOrigin);
    else p->clearVisibleRange();

    if (s.hadPrice) p->setPriceRange(s.price);
    else p->clearPriceScale();
  }
}

// ---- CaptureSession ----

CaptureSession::CaptureSession(PaneSynchronizer& sync, FrameLoop& loop)
  : sync_(sync), loop_(loop) {}

bool CaptureSession::capture(const std::string& targetDate, CaptureCallback done) {
  CaptureResult result;
  auto fail = [&](const char* why) {
    std::fprintf(stderr, "CaptureSession: %s\n", why);
    result.ok = false;
    result.error = "export failed";
    if (done) done(result);
    return false;
  };

  if (inFlight_) {
    std::fprintf(stderr, "CaptureSession: capture already in flight\n");
    result.error = "capture in progress";
    if (done) done(result);
    return false;
  }

  const DataSeries* series = sync_.series();
  Pane* primary = sync_.primaryPane();
  if (!series || series->empty()) return fail("no data");
  if (!primary || !primary->isMeasured()) return fail("primary pane not measured");

  std::size_t endIdx = series->lastIndex();
  if (!targetDate.empty() && !series->indexOfDate(targetDate, endIdx))
    return fail("target date not in series");

  double spacing = primary->config().barSpacing;
  double reserve = config_.axisReserve >= 0.0 ? config_.axisReserve
                                              : primary->config().priceAxisWidth;
  std::size_t bars = computeBarsNeeded(primary->pixelWidth(), reserve, spacing);
  if (bars == 0) return fail("no room for bars");

  result.endDate = series->at(endIdx).date;
  result.endIndex = endIdx;
  result.barsNeeded = bars;
  result.barSpacing = spacing;
  result.range = computeCaptureRange(endIdx, bars);

  // Everything from here on is undone by the transaction, including when
  // the continuation is dropped without running.
  auto txn = std::make_shared<RangeTransaction>(sync_);
  for (Id id : sync_.paneIds()) {
    Pane* p = sync_.pane(id);
    p->lockBarSpacing(spacing);
    p->setVisibleRange(result.range, kUnsyncedOrigin);
  }

  inFlight_ = true;
  loop_.afterNextRender([this, txn, result, done]() mutable {
    bool all = true;
    for (Id id : sync_.paneIds()) {
      Pane* p = sync_.pane(id);
      PaneRaster raster;
      raster.paneId = id;
      RasterSurface* surface = p ? p->surface() : nullptr;
      raster.ok = surface && surface->readPixels(raster.image) && raster.image.valid();
      if (!raster.ok) {
        std::fprintf(stderr, "CaptureSession: pane %llu has no raster\n",
                     static_cast<unsigned long long>(id));
        all = false;
      }
      result.panes.push_back(std::move(raster));
    }

    txn->restore();
    inFlight_ = false;

    result.ok = all && !result.panes.empty();
    if (!result.ok) result.error = "export failed";
    if (done) done(result);
  });
  return true;
}

} // namespace sc
