#include "sc/pane/Pane.hpp"
#include "sc/render/RasterSurface.hpp"

#include <algorithm>
#include <cstdio>

namespace sc {

const char* paneKindName(PaneKind kind) {
  switch (kind) {
    case PaneKind::Price:  return "price";
    case PaneKind::Volume: return "volume";
    case PaneKind::Macd:   return "macd";
    case PaneKind::Kd:     return "kd";
    case PaneKind::Rsi:    return "rsi";
  }
  return "price";
}

bool parsePaneKind(const std::string& name, PaneKind& out) {
  static const PaneKind kAll[] = {PaneKind::Price, PaneKind::Volume,
                                  PaneKind::Macd, PaneKind::Kd, PaneKind::Rsi};
  for (PaneKind k : kAll) {
    if (name == paneKindName(k)) {
      out = k;
      return true;
    }
  }
  return false;
}

Pane::Pane(Id id, PaneKind kind) : id_(id), kind_(kind) {}

Pane::~Pane() = default;

void Pane::setConfig(const PaneConfig& cfg) {
  config_ = cfg;
  dirty_ = true;
}

void Pane::setPixelSize(int width, int height) {
  width_ = std::max(0, width);
  height_ = std::max(0, height);
  if (surface_ && width_ > 0 && height_ > 0) {
    if (!surface_->resize(width_, height_)) {
      std::fprintf(stderr, "Pane %llu: surface resize to %dx%d failed\n",
                   static_cast<unsigned long long>(id_), width_, height_);
    }
  }
  dirty_ = true;
}

double Pane::plotWidth() const {
  return static_cast<double>(width_) - config_.priceAxisWidth;
}

double Pane::plotHeight() const {
  return static_cast<double>(height_) - config_.timeAxisHeight;
}

bool Pane::setVisibleRange(const LogicalRange& range, Id origin) {
  if (!range.valid()) return false;

  range_ = range;
  hasRange_ = true;
  dirty_ = true;

  // Copy so a listener may unsubscribe while being notified.
  auto listeners = listeners_;
  for (const auto& l : listeners) {
    l.fn(id_, range_, origin);
  }
  return true;
}

void Pane::clearVisibleRange() {
  hasRange_ = false;
  range_ = {};
  dirty_ = true;
}

bool Pane::setPriceRange(const PriceRange& range) {
  if (!range.valid()) return false;
  if (!hasPrice_ || price_.min != range.min || price_.max != range.max)
    dirty_ = true;
  price_ = range;
  hasPrice_ = true;
  return true;
}

void Pane::clearPriceScale() {
  hasPrice_ = false;
  dirty_ = true;
}

double Pane::barSpacing() const {
  if (spacingLocked_) return lockedSpacing_;
  if (!hasRange_ || plotWidth() <= 0.0) return config_.barSpacing;
  return plotWidth() / range_.width();
}

void Pane::lockBarSpacing(double spacing) {
  if (!(spacing > 0.0)) return;
  spacingLocked_ = true;
  lockedSpacing_ = std::max(spacing, config_.minBarSpacing);
  dirty_ = true;
}

void Pane::unlockBarSpacing() {
  spacingLocked_ = false;
  lockedSpacing_ = 0;
  dirty_ = true;
}

std::uint64_t Pane::addRangeListener(RangeListener listener) {
  std::uint64_t token = nextToken_++;
  listeners_.push_back({token, std::move(listener)});
  return token;
}

void Pane::removeRangeListener(std::uint64_t token) {
  listeners_.erase(
    std::remove_if(listeners_.begin(), listeners_.end(),
      [token](const ListenerEntry& e) { return e.token == token; }),
    listeners_.end());
}

void Pane::setSurface(std::unique_ptr<RasterSurface> surface) {
  surface_ = std::move(surface);
  if (surface_ && width_ > 0 && height_ > 0) {
    if (!surface_->resize(width_, height_)) {
      std::fprintf(stderr, "Pane %llu: surface resize to %dx%d failed\n",
                   static_cast<unsigned long long>(id_), width_, height_);
    }
  }
  dirty_ = true;
}

} // namespace sc
