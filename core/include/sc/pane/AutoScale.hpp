#pragma once
#include "sc/data/DataSeries.hpp"
#include "sc/pane/ChartTypes.hpp"
#include "sc/pane/Pane.hpp"

#include <vector>

namespace sc {

struct AutoScaleConfig {
  bool fixedOscillatorRange{true};  // KD and RSI pinned to [0, 100]
};

// Fits a pane's price scale to the fields it shows within its visible range.
class AutoScale {
public:
  void setConfig(const AutoScaleConfig& cfg) { config_ = cfg; }
  const AutoScaleConfig& config() const { return config_; }

  // Fields drawn by a pane of this kind.
  static std::vector<SeriesField> fieldsFor(PaneKind kind);

  // Returns false if the pane has no visible range or no finite data.
  bool computePriceRange(const Pane& pane, const DataSeries& series, PriceRange& out) const;

  // computePriceRange() + Pane::setPriceRange().
  bool apply(Pane& pane, const DataSeries& series) const;

private:
  AutoScaleConfig config_;
};

} // namespace sc
