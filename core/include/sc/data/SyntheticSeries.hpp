#pragma once
#include "sc/data/DataSeries.hpp"

#include <cstdint>
#include <string>

namespace sc {

// Deterministic random-walk daily bars for demos and tests.
struct SyntheticSeriesConfig {
  std::size_t count{300};
  std::string startDate{"2023-01-02"};  // must be yyyy-mm-dd
  double startPrice{100.0};
  double volatility{0.02};              // per-bar fractional move
  double baseVolume{20000.0};
  std::uint32_t seed{42};
  bool skipWeekends{true};
};

DataSeries makeSyntheticSeries(const SyntheticSeriesConfig& config);

// Calendar helpers (proleptic Gregorian, days since 1970-01-01).
bool parseIsoDate(const std::string& s, std::int64_t& daysOut);
std::string formatIsoDate(std::int64_t days);

} // namespace sc
