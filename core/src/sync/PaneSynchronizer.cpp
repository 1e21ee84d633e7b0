#include "sc/sync/PaneSynchronizer.hpp"
#include "sc/data/DataSeries.hpp"
#include "sc/pane/Pane.hpp"

#include <algorithm>
#include <cmath>

namespace sc {

const TimeRangePreset kTimeRangePresets[7] = {
  {"1M", 22}, {"3M", 66}, {"6M", 132}, {"1Y", 252},
  {"3Y", 756}, {"5Y", 1260}, {"All", 0},
};

PaneSynchronizer::~PaneSynchronizer() {
  for (auto& e : entries_) {
    e.pane->removeRangeListener(e.token);
  }
}

bool PaneSynchronizer::registerPane(Pane& pane) {
  if (this->pane(pane.id())) return false;

  // Adopt the shared range before listening, tagged with the primary's id
  // so the adoption is not mistaken for a user change.
  LogicalRange shared;
  if (sharedRange(shared)) {
    pane.setVisibleRange(shared, primaryPane()->id());
  }

  std::uint64_t token = pane.addRangeListener(
    [this](Id paneId, const LogicalRange& range, Id origin) {
      onRangeChanged(paneId, range, origin);
    });
  entries_.push_back({&pane, token});
  return true;
}

bool PaneSynchronizer::unregisterPane(Id paneId) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
    [paneId](const Entry& e) { return e.pane->id() == paneId; });
  if (it == entries_.end()) return false;
  it->pane->removeRangeListener(it->token);
  entries_.erase(it);
  return true;
}

Pane* PaneSynchronizer::pane(Id paneId) const {
  for (const auto& e : entries_) {
    if (e.pane->id() == paneId) return e.pane;
  }
  return nullptr;
}

Pane* PaneSynchronizer::primaryPane() const {
  return entries_.empty() ? nullptr : entries_.front().pane;
}

std::vector<Id> PaneSynchronizer::paneIds() const {
  std::vector<Id> ids;
  ids.reserve(entries_.size());
  for (const auto& e : entries_) ids.push_back(e.pane->id());
  return ids;
}

bool PaneSynchronizer::setRange(Id paneId, const LogicalRange& range) {
  Pane* p = pane(paneId);
  if (!p) return false;
  return p->setVisibleRange(range, paneId);
}

bool PaneSynchronizer::sharedRange(LogicalRange& out) const {
  Pane* p = primaryPane();
  if (!p || !p->hasVisibleRange()) return false;
  out = p->visibleRange();
  return true;
}

void PaneSynchronizer::onRangeChanged(Id paneId, const LogicalRange& range, Id origin) {
  // Only changes a pane made itself are propagated; applied ranges carry
  // the source pane's id and stop here, so every pass is one hop.
  if (origin != paneId) {
    stats_.echoesIgnored++;
    return;
  }

  stats_.passes++;
  for (auto& e : entries_) {
    if (e.pane->id() == paneId) continue;
    if (e.pane->setVisibleRange(range, paneId)) stats_.applied++;
  }

  if (datesListener_) {
    std::string from, to;
    if (visibleDates(from, to)) datesListener_(from, to);
  }
}

bool PaneSynchronizer::seriesReady(double& length) const {
  Pane* p = primaryPane();
  if (!p || !p->isMeasured()) return false;
  if (!series_ || series_->empty()) return false;
  length = static_cast<double>(series_->size());
  return true;
}

bool PaneSynchronizer::navigationState(LogicalRange& range, double& length) const {
  if (!seriesReady(length)) return false;
  return sharedRange(range);
}

bool PaneSynchronizer::applyPrimary(const LogicalRange& range) {
  Pane* p = primaryPane();
  if (!p) return false;
  return p->setVisibleRange(range, p->id());
}

bool PaneSynchronizer::jumpToRange(int days) {
  double length = 0;
  if (!seriesReady(length) || days < 0) return false;

  double last = length - 1.0;
  LogicalRange r;
  r.from = (days == 0) ? 0.0 : std::max(0.0, last - static_cast<double>(days));
  r.to = last + config_.rightMargin;
  return applyPrimary(r);
}

bool PaneSynchronizer::resetView() {
  return jumpToRange(config_.defaultDays);
}

bool PaneSynchronizer::zoomIn() {
  LogicalRange cur;
  double length = 0;
  if (!navigationState(cur, length)) return false;

  double c = cur.center();
  double w = cur.width() * config_.zoomInFactor;
  return applyPrimary({c - w * 0.5, c + w * 0.5});
}

bool PaneSynchronizer::zoomOut() {
  LogicalRange cur;
  double length = 0;
  if (!navigationState(cur, length)) return false;

  double c = cur.center();
  double w = cur.width() * config_.zoomOutFactor;
  LogicalRange r;
  r.from = std::max(0.0, c - w * 0.5);
  r.to = std::min(length + config_.rightMargin, c + w * 0.5);
  if (!r.valid()) return false;
  return applyPrimary(r);
}

bool PaneSynchronizer::panLeft() {
  LogicalRange cur;
  double length = 0;
  if (!navigationState(cur, length)) return false;

  double w = cur.width();
  double step = w * config_.panFraction;
  LogicalRange r;
  r.from = std::max(0.0, cur.from - step);
  r.to = r.from + w;
  return applyPrimary(r);
}

bool PaneSynchronizer::panRight() {
  LogicalRange cur;
  double length = 0;
  if (!navigationState(cur, length)) return false;

  double w = cur.width();
  double step = w * config_.panFraction;
  LogicalRange r;
  r.to = std::min(length + config_.rightMargin, cur.to + step);
  r.from = r.to - w;
  return applyPrimary(r);
}

bool PaneSynchronizer::jumpToLatest() {
  LogicalRange cur;
  double length = 0;
  if (!navigationState(cur, length)) return false;

  double w = cur.width();
  LogicalRange r;
  r.to = length + config_.rightMargin;
  r.from = r.to - w;
  return applyPrimary(r);
}

bool PaneSynchronizer::jumpToEarliest() {
  LogicalRange cur;
  double length = 0;
  if (!navigationState(cur, length)) return false;

  return applyPrimary({0.0, cur.width()});
}

bool PaneSynchronizer::processKey(KeyCode key) {
  switch (key) {
    case KeyCode::Left:  return panLeft();
    case KeyCode::Right: return panRight();
    case KeyCode::Plus:  return zoomIn();
    case KeyCode::Minus: return zoomOut();
    case KeyCode::Home:  return jumpToLatest();
    case KeyCode::End:   return jumpToEarliest();
    case KeyCode::Reset: return resetView();
    default:             return false;
  }
}

bool PaneSynchronizer::visibleDates(std::string& from, std::string& to) const {
  LogicalRange r;
  if (!series_ || series_->empty() || !sharedRange(r)) return false;

  double last = static_cast<double>(series_->lastIndex());
  double fromIdx = std::max(0.0, std::floor(r.from));
  double toIdx = std::min(last, std::ceil(r.to));
  if (fromIdx > last || toIdx < 0.0 || fromIdx > toIdx) return false;

  from = series_->at(static_cast<std::size_t>(fromIdx)).date;
  to = series_->at(static_cast<std::size_t>(toIdx)).date;
  return true;
}

void PaneSynchronizer::setVisibleDatesListener(VisibleDatesListener listener) {
  datesListener_ = std::move(listener);
}

} // namespace sc
