#include "sc/data/SyntheticSeries.hpp"
#include "sc/math/Indicators.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace sc {

bool parseIsoDate(const std::string& s, std::int64_t& daysOut) {
  int y = 0;
  unsigned m = 0, d = 0;
  if (s.size() != 10 || std::sscanf(s.c_str(), "%4d-%2u-%2u", &y, &m, &d) != 3)
    return false;
  if (m < 1 || m > 12 || d < 1 || d > 31) return false;

  // days_from_civil
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  daysOut = era * 146097 + static_cast<std::int64_t>(doe) - 719468;
  return true;
}

std::string formatIsoDate(std::int64_t days) {
  days += 719468;
  const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(days - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  if (m <= 2) ++y;

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(y), m, d);
  return buf;
}

DataSeries makeSyntheticSeries(const SyntheticSeriesConfig& config) {
  std::int64_t day = 0;
  if (!parseIsoDate(config.startDate, day)) {
    std::fprintf(stderr, "makeSyntheticSeries: bad start date '%s'\n",
                 config.startDate.c_str());
    return DataSeries{};
  }

  // RNG: simple LCG
  std::uint32_t seed = config.seed;
  auto rng = [&seed]() -> double {
    seed = seed * 1103515245u + 12345u;
    return static_cast<double>((seed >> 16) & 0x7FFF) / 32767.0;
  };

  std::vector<SeriesRecord> records;
  records.reserve(config.count);

  double price = config.startPrice;
  while (records.size() < config.count) {
    if (config.skipWeekends) {
      // 1970-01-01 was a Thursday; weekday 0 = Monday.
      int weekday = static_cast<int>(((day % 7) + 7 + 3) % 7);
      if (weekday >= 5) { ++day; continue; }
    }

    SeriesRecord r;
    r.date = formatIsoDate(day);
    r.open = price;
    double move = (rng() - 0.5) * 2.0 * config.volatility * price;
    r.close = std::max(0.01, price + move);
    double wick = rng() * config.volatility * 0.5 * price;
    r.high = std::max(r.open, r.close) + wick;
    r.low = std::max(0.005, std::min(r.open, r.close) - rng() * config.volatility * 0.5 * price);
    r.volume = std::floor(config.baseVolume * (0.5 + rng()));
    records.push_back(r);

    price = r.close;
    ++day;
  }

  fillMissingIndicators(records);
  return DataSeries(std::move(records));
}

} // namespace sc
