#pragma once
#include "sc/export/ChartSnapshot.hpp"
#include "sc/ids/Id.hpp"
#include "sc/pane/ChartTypes.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace sc {

class FrameLoop;
class PaneSynchronizer;

struct CaptureConfig {
  double axisReserve{-1.0};  // < 0: the primary pane's price-axis width
};

struct PaneRaster {
  Id paneId{0};
  bool ok{false};
  RasterImage image;
};

struct CaptureResult {
  bool ok{false};
  std::string error;
  std::string endDate;
  std::size_t endIndex{0};
  std::size_t barsNeeded{0};
  double barSpacing{0};
  LogicalRange range;
  std::vector<PaneRaster> panes;  // registration order
};

using CaptureCallback = std::function<void(const CaptureResult&)>;

// Smallest bar count whose total width covers the plot:
// bars * spacing >= width - reserve > (bars - 1) * spacing. 0 if none fits.
std::size_t computeBarsNeeded(double paneWidth, double axisReserve, double barSpacing);

// {max(0, end - bars + 1), end + 1}
LogicalRange computeCaptureRange(std::size_t endIndex, std::size_t barsNeeded);

// Saves every registered pane's time scale (range, bar-spacing lock) and
// price scale; restore() puts them back by pane id. Restores on destruction.
class RangeTransaction {
public:
  explicit RangeTransaction(PaneSynchronizer& sync);
  ~RangeTransaction();

  RangeTransaction(const RangeTransaction&) = delete;
  RangeTransaction& operator=(const RangeTransaction&) = delete;

  void restore();
  bool restored() const { return restored_; }

private:
  struct Saved {
    Id paneId;
    bool hadRange;
    LogicalRange range;
    bool locked;
    double spacing;
    bool hadPrice;
    PriceRange price;
  };

  PaneSynchronizer& sync_;
  std::vector<Saved> saved_;
  bool restored_{false};
};

// Fitted, reversible raster export across all registered panes.
class CaptureSession {
public:
  CaptureSession(PaneSynchronizer& sync, FrameLoop& loop);

  void setConfig(const CaptureConfig& cfg) { config_ = cfg; }
  const CaptureConfig& config() const { return config_; }

  // Captures the bars ending at `targetDate` (empty = last date). Returns
  // true when the capture is scheduled; `done` runs after the next render
  // tick with ranges already restored. On false, `done` has already run
  // with ok == false and nothing was changed.
  bool capture(const std::string& targetDate, CaptureCallback done);

  bool inFlight() const { return inFlight_; }

private:
  PaneSynchronizer& sync_;
  FrameLoop& loop_;
  CaptureConfig config_;
  bool inFlight_{false};
};

} // namespace sc
