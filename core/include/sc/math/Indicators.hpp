#pragma once
#include "sc/data/DataSeries.hpp"

#include <vector>

namespace sc {

// RSI (Relative Strength Index), Wilder smoothing. Output 0-100.
// First `period` values are NaN (not enough data).
std::vector<double> computeRSI(const double* closes, int count, int period = 14);

// Stochastic oscillator (%K and %D). Output 0-100, NaN during warm-up.
struct StochasticResult {
  std::vector<double> percentK;
  std::vector<double> percentD;
};

StochasticResult computeStochastic(const double* highs, const double* lows,
                                   const double* closes, int count,
                                   int kPeriod = 9, int dPeriod = 3);

struct MacdResult {
  std::vector<double> macd;       // fast EMA - slow EMA
  std::vector<double> signal;     // EMA of macd
  std::vector<double> histogram;  // macd - signal
};

MacdResult computeMACD(const double* closes, int count,
                       int fastPeriod = 12, int slowPeriod = 26, int signalPeriod = 9);

struct BollingerResult {
  std::vector<double> upper;
  std::vector<double> middle;
  std::vector<double> lower;
};

// Middle = SMA(period); bands at +/- numStdDev population standard deviations.
BollingerResult computeBollinger(const double* closes, int count,
                                 int period = 20, double numStdDev = 2.0);

// Computes every indicator column from OHLCV and writes it into records
// whose value is still NaN. Supplied values are never overwritten.
void fillMissingIndicators(std::vector<SeriesRecord>& records);

} // namespace sc
