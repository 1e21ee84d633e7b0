#include "sc/sync/InputMapper.hpp"
#include "sc/pane/Pane.hpp"
#include "sc/sync/PaneSynchronizer.hpp"
#include "sc/transform/CoordinateTransform.hpp"

#include <cmath>

namespace sc {

InputMapper::InputMapper(PaneSynchronizer& sync) : sync_(sync) {}

bool InputMapper::processInput(const PaneInputState& input) {
  active_ = 0;
  Pane* pane = sync_.pane(input.paneId);
  if (!pane) return false;
  active_ = pane->id();

  bool changed = false;

  // Pan
  if (input.dragging && input.dragDx != 0) {
    changed |= applyDrag(input);
  }

  // Zoom
  if (input.scrollDelta != 0) {
    changed |= applyZoom(input);
  }

  if (input.keyPressed != KeyCode::None) {
    changed |= sync_.processKey(input.keyPressed);
  }

  return changed;
}

bool InputMapper::applyDrag(const PaneInputState& input) {
  Pane* pane = sync_.pane(active_);
  if (!pane->isMeasured() || !pane->hasVisibleRange()) return false;

  // Dragging right reveals earlier bars.
  double spacing = pane->barSpacing();
  if (!(spacing > 0.0)) return false;
  double shift = -input.dragDx / spacing;

  LogicalRange r = pane->visibleRange();
  r.from += shift;
  r.to += shift;
  return sync_.setRange(active_, r);
}

bool InputMapper::applyZoom(const PaneInputState& input) {
  Pane* pane = sync_.pane(active_);
  if (!pane->isMeasured() || !pane->hasVisibleRange()) return false;

  double factor = input.scrollDelta * config_.zoomSensitivity;
  double scale = 1.0 / (1.0 + factor);
  if (!(scale > 0.0) || !std::isfinite(scale)) return false;

  LogicalRange cur = pane->visibleRange();
  double pivot = cur.center();
  double idx = 0;
  if (xToIndex(*pane, input.cursorX, idx)) pivot = idx;

  // Scale the range around the index under the cursor.
  LogicalRange r;
  r.from = pivot + (cur.from - pivot) * scale;
  r.to = pivot + (cur.to - pivot) * scale;
  if (r.width() < config_.minVisibleBars && r.width() < cur.width()) return false;
  return sync_.setRange(active_, r);
}

} // namespace sc
