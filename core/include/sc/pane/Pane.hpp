#pragma once
#include "sc/ids/Id.hpp"
#include "sc/pane/ChartTypes.hpp"

#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace sc {

class RasterSurface;

enum class PaneKind : std::uint8_t {
  Price = 0,   // candles + moving averages + Bollinger
  Volume,      // volume bars + MA5
  Macd,        // MACD line, signal, histogram
  Kd,          // stochastic K/D
  Rsi
};

const char* paneKindName(PaneKind kind);
bool parsePaneKind(const std::string& name, PaneKind& out);

struct PaneConfig {
  double priceAxisWidth{50.0};   // right gutter, excluded from the plot area
  double timeAxisHeight{0.0};    // bottom gutter
  double barSpacing{8.0};        // preferred pixels per bar
  double minBarSpacing{2.0};
  double scaleMarginTop{0.1};
  double scaleMarginBottom{0.1};
};

// Origin tag for range changes that must not propagate to other panes.
inline constexpr Id kUnsyncedOrigin = std::numeric_limits<Id>::max();

// (paneId, newRange, origin). origin == paneId means the pane itself
// initiated the change; anything else is an applied or echoed change.
using RangeListener = std::function<void(Id, const LogicalRange&, Id)>;

class Pane {
public:
  Pane(Id id, PaneKind kind);
  ~Pane();

  Pane(const Pane&) = delete;
  Pane& operator=(const Pane&) = delete;

  Id id() const { return id_; }
  PaneKind kind() const { return kind_; }

  void setConfig(const PaneConfig& cfg);
  const PaneConfig& config() const { return config_; }

  void setPixelSize(int width, int height);
  int pixelWidth() const { return width_; }
  int pixelHeight() const { return height_; }
  double plotWidth() const;
  double plotHeight() const;
  bool isMeasured() const { return plotWidth() > 0.0 && plotHeight() > 0.0; }

  // Time scale. Rejects invalid ranges. Listeners fire on every accepted set.
  bool setVisibleRange(const LogicalRange& range, Id origin);
  bool setVisibleRange(const LogicalRange& range) { return setVisibleRange(range, id_); }
  bool hasVisibleRange() const { return hasRange_; }
  void clearVisibleRange();
  const LogicalRange& visibleRange() const { return range_; }

  // Price scale, established by autoscale on the first render tick.
  bool setPriceRange(const PriceRange& range);
  void clearPriceScale();
  bool hasPriceScale() const { return hasPrice_; }
  const PriceRange& priceRange() const { return price_; }

  // Measured, with a visible range and a price scale.
  bool isReady() const { return isMeasured() && hasRange_ && hasPrice_; }

  // Pixels per bar. Derived from the range unless locked; a locked pane
  // anchors the range end at the right plot edge with no right margin.
  double barSpacing() const;
  void lockBarSpacing(double spacing);
  void unlockBarSpacing();
  bool isBarSpacingLocked() const { return spacingLocked_; }
  double lockedBarSpacing() const { return lockedSpacing_; }

  std::uint64_t addRangeListener(RangeListener listener);
  void removeRangeListener(std::uint64_t token);
  std::size_t rangeListenerCount() const { return listeners_.size(); }

  void setSurface(std::unique_ptr<RasterSurface> surface);
  RasterSurface* surface() const { return surface_.get(); }

  bool isDirty() const { return dirty_; }
  void markDirty() { dirty_ = true; }
  void clearDirty() { dirty_ = false; }

private:
  struct ListenerEntry {
    std::uint64_t token;
    RangeListener fn;
  };

  Id id_;
  PaneKind kind_;
  PaneConfig config_;

  int width_{0};
  int height_{0};

  LogicalRange range_;
  bool hasRange_{false};

  PriceRange price_;
  bool hasPrice_{false};

  bool spacingLocked_{false};
  double lockedSpacing_{0};

  std::vector<ListenerEntry> listeners_;
  std::uint64_t nextToken_{1};

  std::unique_ptr<RasterSurface> surface_;
  bool dirty_{true};
};

} // namespace sc
