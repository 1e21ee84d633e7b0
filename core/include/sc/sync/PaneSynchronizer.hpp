#pragma once
#include "sc/ids/Id.hpp"
#include "sc/pane/ChartTypes.hpp"
#include "sc/sync/InputState.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace sc {

class DataSeries;
class Pane;

struct SyncConfig {
  double zoomInFactor{0.7};
  double zoomOutFactor{1.4};
  double panFraction{0.3};
  double rightMargin{5.0};   // bars of empty space past the last record
  int defaultDays{66};       // resetView() window
};

struct TimeRangePreset {
  const char* label;
  int days;   // 0 = all data
};

// 1M, 3M, 6M, 1Y, 3Y, 5Y, All in trading days.
extern const TimeRangePreset kTimeRangePresets[7];

struct SyncStats {
  std::uint64_t passes{0};          // propagation passes started by a pane
  std::uint64_t applied{0};         // ranges written to sibling panes
  std::uint64_t echoesIgnored{0};   // notifications not originating at the emitter
};

using VisibleDatesListener = std::function<void(const std::string&, const std::string&)>;

// Registry of panes sharing one logical time axis. The first registered
// pane is primary: derived navigation is computed from its range.
class PaneSynchronizer {
public:
  PaneSynchronizer() = default;
  ~PaneSynchronizer();

  PaneSynchronizer(const PaneSynchronizer&) = delete;
  PaneSynchronizer& operator=(const PaneSynchronizer&) = delete;

  void setConfig(const SyncConfig& cfg) { config_ = cfg; }
  const SyncConfig& config() const { return config_; }

  void setSeries(const DataSeries* series) { series_ = series; }
  const DataSeries* series() const { return series_; }

  // Adopts the current shared range, then follows it. Returns false if a
  // pane with the same id is already registered.
  bool registerPane(Pane& pane);
  bool unregisterPane(Id paneId);

  Pane* pane(Id paneId) const;
  Pane* primaryPane() const;
  std::vector<Id> paneIds() const;
  std::size_t paneCount() const { return entries_.size(); }

  // Set `range` on pane `paneId`; every other pane follows in one pass.
  bool setRange(Id paneId, const LogicalRange& range);
  bool sharedRange(LogicalRange& out) const;

  // Navigation. All return false and change nothing when the primary pane
  // is unmeasured or the series is empty; all but jumpToRange/resetView
  // also need an established visible range.
  bool jumpToRange(int days);
  bool resetView();
  bool zoomIn();
  bool zoomOut();
  bool panLeft();
  bool panRight();
  bool jumpToLatest();
  bool jumpToEarliest();

  // Keyboard shortcuts: Left/Right pan, Plus/Minus zoom, Home latest,
  // End earliest, Reset default view.
  bool processKey(KeyCode key);

  // First and last dates covered by the shared range.
  bool visibleDates(std::string& from, std::string& to) const;
  void setVisibleDatesListener(VisibleDatesListener listener);

  const SyncStats& stats() const { return stats_; }

private:
  struct Entry {
    Pane* pane;
    std::uint64_t token;
  };

  void onRangeChanged(Id paneId, const LogicalRange& range, Id origin);
  bool seriesReady(double& length) const;
  bool navigationState(LogicalRange& range, double& length) const;
  bool applyPrimary(const LogicalRange& range);

  SyncConfig config_;
  const DataSeries* series_{nullptr};
  std::vector<Entry> entries_;
  SyncStats stats_;
  VisibleDatesListener datesListener_;
};

} // namespace sc
