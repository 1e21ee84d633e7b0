#include "sc/math/Indicators.hpp"
#include "sc/math/Ema.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace sc {

namespace {
const double kNaN = std::numeric_limits<double>::quiet_NaN();
}

std::vector<double> computeRSI(const double* closes, int count, int period) {
  std::vector<double> rsi(static_cast<std::size_t>(std::max(count, 0)), kNaN);
  if (count < period + 1 || period < 1) return rsi;

  // First pass: compute initial average gain/loss
  double avgGain = 0.0, avgLoss = 0.0;
  for (int i = 1; i <= period; i++) {
    double change = closes[i] - closes[i - 1];
    if (change > 0) avgGain += change;
    else avgLoss -= change;
  }
  avgGain /= static_cast<double>(period);
  avgLoss /= static_cast<double>(period);

  auto rsiOf = [](double gain, double loss) {
    if (loss == 0.0) return 100.0;
    double rs = gain / loss;
    return 100.0 - 100.0 / (1.0 + rs);
  };

  rsi[static_cast<std::size_t>(period)] = rsiOf(avgGain, avgLoss);

  // Subsequent values: Wilder's smoothing
  double inv = 1.0 / static_cast<double>(period);
  for (int i = period + 1; i < count; i++) {
    double change = closes[i] - closes[i - 1];
    double gain = (change > 0) ? change : 0.0;
    double loss = (change < 0) ? -change : 0.0;

    avgGain = (avgGain * (static_cast<double>(period) - 1.0) + gain) * inv;
    avgLoss = (avgLoss * (static_cast<double>(period) - 1.0) + loss) * inv;

    rsi[static_cast<std::size_t>(i)] = rsiOf(avgGain, avgLoss);
  }

  return rsi;
}

StochasticResult computeStochastic(const double* highs, const double* lows,
                                   const double* closes, int count,
                                   int kPeriod, int dPeriod) {
  StochasticResult result;
  std::size_t n = static_cast<std::size_t>(std::max(count, 0));
  result.percentK.resize(n, kNaN);
  result.percentD.resize(n, kNaN);

  if (count < kPeriod || kPeriod < 1) return result;

  // %K: (close - lowestLow) / (highestHigh - lowestLow) * 100
  for (int i = kPeriod - 1; i < count; i++) {
    double hh = -std::numeric_limits<double>::infinity();
    double ll = std::numeric_limits<double>::infinity();
    for (int j = i - kPeriod + 1; j <= i; j++) {
      hh = std::max(hh, highs[j]);
      ll = std::min(ll, lows[j]);
    }
    double range = hh - ll;
    result.percentK[static_cast<std::size_t>(i)] =
        (range > 0.0) ? (closes[i] - ll) / range * 100.0 : 50.0;
  }

  // %D: simple moving average of %K
  if (dPeriod < 1) return result;
  computeSma(result.percentK.data(), result.percentD.data(), count, dPeriod);
  return result;
}

MacdResult computeMACD(const double* closes, int count,
                       int fastPeriod, int slowPeriod, int signalPeriod) {
  MacdResult r;
  std::size_t n = static_cast<std::size_t>(std::max(count, 0));
  r.macd.assign(n, kNaN);
  r.signal.assign(n, kNaN);
  r.histogram.assign(n, kNaN);
  if (count < slowPeriod || fastPeriod < 1 || slowPeriod < fastPeriod) return r;

  std::vector<double> fast(n), slow(n);
  computeEma(closes, fast.data(), count, fastPeriod);
  computeEma(closes, slow.data(), count, slowPeriod);

  int first = slowPeriod - 1;
  for (int i = first; i < count; i++) {
    r.macd[static_cast<std::size_t>(i)] =
        fast[static_cast<std::size_t>(i)] - slow[static_cast<std::size_t>(i)];
  }

  computeEma(r.macd.data(), r.signal.data(), count, signalPeriod, first);
  for (std::size_t i = 0; i < n; i++) {
    if (!std::isnan(r.signal[i])) r.histogram[i] = r.macd[i] - r.signal[i];
  }
  return r;
}

BollingerResult computeBollinger(const double* closes, int count,
                                 int period, double numStdDev) {
  BollingerResult r;
  std::size_t n = static_cast<std::size_t>(std::max(count, 0));
  r.upper.assign(n, kNaN);
  r.middle.assign(n, kNaN);
  r.lower.assign(n, kNaN);
  if (period < 1 || count < period) return r;

  computeSma(closes, r.middle.data(), count, period);
  for (int i = period - 1; i < count; i++) {
    double mean = r.middle[static_cast<std::size_t>(i)];
    if (std::isnan(mean)) continue;
    double var = 0.0;
    for (int j = i - period + 1; j <= i; j++) {
      double dv = closes[j] - mean;
      var += dv * dv;
    }
    double sd = std::sqrt(var / static_cast<double>(period));
    r.upper[static_cast<std::size_t>(i)] = mean + numStdDev * sd;
    r.lower[static_cast<std::size_t>(i)] = mean - numStdDev * sd;
  }
  return r;
}

namespace {

void fillColumn(std::vector<SeriesRecord>& records, SeriesField f,
                const std::vector<double>& values) {
  for (std::size_t i = 0; i < records.size() && i < values.size(); ++i) {
    double& slot = fieldRef(records[i], f);
    if (std::isnan(slot)) slot = values[i];
  }
}

} // namespace

void fillMissingIndicators(std::vector<SeriesRecord>& records) {
  const int count = static_cast<int>(records.size());
  if (count == 0) return;

  std::vector<double> high, low, close, volume;
  for (const auto& r : records) {
    high.push_back(r.high);
    low.push_back(r.low);
    close.push_back(r.close);
    volume.push_back(r.volume);
  }

  std::vector<double> tmp(records.size());
  const struct { int period; SeriesField field; } kMas[] = {
    {5, SeriesField::Ma5}, {10, SeriesField::Ma10}, {20, SeriesField::Ma20},
    {60, SeriesField::Ma60}, {120, SeriesField::Ma120},
  };
  for (const auto& ma : kMas) {
    computeSma(close.data(), tmp.data(), count, ma.period);
    fillColumn(records, ma.field, tmp);
  }

  computeSma(volume.data(), tmp.data(), count, 5);
  fillColumn(records, SeriesField::VolumeMa5, tmp);

  MacdResult macd = computeMACD(close.data(), count);
  fillColumn(records, SeriesField::Macd, macd.macd);
  fillColumn(records, SeriesField::MacdSignal, macd.signal);
  fillColumn(records, SeriesField::MacdHist, macd.histogram);

  StochasticResult kd = computeStochastic(high.data(), low.data(), close.data(), count);
  fillColumn(records, SeriesField::K, kd.percentK);
  fillColumn(records, SeriesField::D, kd.percentD);

  fillColumn(records, SeriesField::Rsi, computeRSI(close.data(), count));

  BollingerResult bb = computeBollinger(close.data(), count);
  fillColumn(records, SeriesField::BbUpper, bb.upper);
  fillColumn(records, SeriesField::BbMiddle, bb.middle);
  fillColumn(records, SeriesField::BbLower, bb.lower);
}

} // namespace sc
