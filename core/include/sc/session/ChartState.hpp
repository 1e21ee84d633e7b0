#pragma once
#include "sc/pane/ChartTypes.hpp"

#include <string>

namespace sc {

// Serializable chart view: shared range, indicator pane, annotations.
struct ChartState {
  std::string version{"1.0"};
  bool hasRange{false};
  LogicalRange range;
  std::string indicator{"macd"};  // paneKindName() of the indicator pane
  std::string drawingsJSON;       // DrawingStore::toJSON() output
  std::string themeName;          // "Light" or "Dark"

  // Optional metadata
  std::string symbol;   // e.g. "2330"
  std::string period;   // e.g. "1D"
};

std::string serializeChartState(const ChartState& state);

// Returns false on malformed JSON; absent fields keep their defaults.
bool deserializeChartState(const std::string& json, ChartState& out);

} // namespace sc
