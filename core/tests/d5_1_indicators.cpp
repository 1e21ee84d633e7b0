// D5.1 - Series data and indicator math
// Tests: SMA/EMA warm-up and NaN handling, RSI, stochastic, MACD,
// Bollinger, nice ticks, fillMissingIndicators, JSON loading, synthetic bars.

#include "sc/data/DataSeries.hpp"
#include "sc/data/SyntheticSeries.hpp"
#include "sc/math/Ema.hpp"
#include "sc/math/Indicators.hpp"
#include "sc/math/NiceTicks.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireClose(double a, double b, double tol, const char* msg) {
  if (std::fabs(a - b) > tol) {
    std::fprintf(stderr, "ASSERT FAIL: %s (%.6f vs %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

int main() {
  const double nan = std::numeric_limits<double>::quiet_NaN();

  // ---- Test 1: SMA ----
  {
    std::vector<double> in = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    std::vector<double> out(in.size());
    sc::computeSma(in.data(), out.data(), 10, 3);
    requireTrue(std::isnan(out[0]) && std::isnan(out[1]), "warm-up NaN");
    requireClose(out[2], 2.0, 1e-12, "first window");
    requireClose(out[9], 9.0, 1e-12, "last window");

    in[4] = nan;
    sc::computeSma(in.data(), out.data(), 10, 3);
    requireTrue(std::isnan(out[4]) && std::isnan(out[5]) && std::isnan(out[6]),
                "windows holding NaN");
    requireClose(out[3], 3.0, 1e-12, "before the gap");
    requireClose(out[7], 7.0, 1e-12, "after the gap");

    std::printf("  Test 1 (SMA): PASS\n");
  }

  // ---- Test 2: EMA ----
  {
    std::vector<double> in = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    std::vector<double> out(in.size());
    sc::computeEma(in.data(), out.data(), 10, 3);
    requireTrue(std::isnan(out[1]), "warm-up NaN");
    requireClose(out[2], 2.0, 1e-12, "SMA seed");
    // k = 0.5 on a linear ramp lags by exactly one step
    for (int i = 3; i < 10; i++) requireClose(out[i], i, 1e-12, "ramp EMA");

    std::vector<double> late = {nan, nan, 3, 4, 5, 6};
    std::vector<double> lateOut(late.size());
    sc::computeEma(late.data(), lateOut.data(), 6, 2, 2);
    requireTrue(std::isnan(lateOut[2]), "seed not reached");
    requireClose(lateOut[3], 3.5, 1e-12, "seed from start offset");

    sc::computeEma(in.data(), out.data(), 10, 20);
    requireTrue(std::isnan(out[9]), "period longer than data");

    std::printf("  Test 2 (EMA): PASS\n");
  }

  // ---- Test 3: RSI ----
  {
    std::vector<double> rising;
    for (int i = 0; i < 20; i++) rising.push_back(100.0 + i);
    std::vector<double> rsi = sc::computeRSI(rising.data(), 20, 14);
    requireTrue(rsi.size() == 20, "size");
    requireTrue(std::isnan(rsi[13]), "warm-up");
    requireClose(rsi[14], 100.0, 1e-12, "no losses");
    requireClose(rsi[19], 100.0, 1e-12, "still no losses");

    std::vector<double> zigzag = {10, 11, 10, 11, 10, 11, 10};
    rsi = sc::computeRSI(zigzag.data(), 7, 2);
    requireClose(rsi[2], 50.0, 1e-12, "balanced");
    for (double v : rsi) {
      if (!std::isnan(v)) requireTrue(v >= 0.0 && v <= 100.0, "bounded");
    }

    rsi = sc::computeRSI(zigzag.data(), 7, 14);
    requireTrue(std::isnan(rsi[6]), "too short");

    std::printf("  Test 3 (RSI): PASS\n");
  }

  // ---- Test 4: Stochastic ----
  {
    const double highs[] = {5, 6, 7, 8, 9};
    const double lows[] = {1, 2, 3, 4, 5};
    const double closes[] = {3, 4, 7, 6, 5};
    sc::StochasticResult kd = sc::computeStochastic(highs, lows, closes, 5, 3, 3);
    requireTrue(std::isnan(kd.percentK[1]), "K warm-up");
    requireClose(kd.percentK[2], 100.0, 1e-9, "close at the high");
    requireClose(kd.percentK[3], 4.0 / 6.0 * 100.0, 1e-9, "(6-2)/(8-2)");
    requireClose(kd.percentK[4], 2.0 / 6.0 * 100.0, 1e-9, "(5-3)/(9-3)");
    requireTrue(std::isnan(kd.percentD[3]), "D warm-up");
    requireClose(kd.percentD[4], 200.0 / 3.0, 1e-9, "D = SMA(K)");

    const double flat[] = {4, 4, 4};
    kd = sc::computeStochastic(flat, flat, flat, 3, 3, 1);
    requireClose(kd.percentK[2], 50.0, 1e-12, "flat window");

    std::printf("  Test 4 (stochastic): PASS\n");
  }

  // ---- Test 5: MACD ----
  {
    std::vector<double> flat(60, 42.0);
    sc::MacdResult m = sc::computeMACD(flat.data(), 60);
    requireTrue(std::isnan(m.macd[24]), "slow EMA warm-up");
    requireClose(m.macd[25], 0.0, 1e-12, "flat MACD");
    requireTrue(std::isnan(m.signal[32]), "signal warm-up");
    requireClose(m.signal[33], 0.0, 1e-12, "signal");
    requireClose(m.histogram[59], 0.0, 1e-12, "histogram");

    std::vector<double> ramp;
    for (int i = 0; i < 60; i++) ramp.push_back(10.0 + i);
    m = sc::computeMACD(ramp.data(), 60);
    requireTrue(m.macd[59] > 0.0, "fast above slow on a rise");

    m = sc::computeMACD(ramp.data(), 20);
    requireTrue(std::isnan(m.macd[19]), "too short");

    std::printf("  Test 5 (MACD): PASS\n");
  }

  // ---- Test 6: Bollinger ----
  {
    const double closes[] = {1, 2, 3, 4, 5};
    sc::BollingerResult bb = sc::computeBollinger(closes, 5, 5, 2.0);
    requireTrue(std::isnan(bb.middle[3]), "warm-up");
    requireClose(bb.middle[4], 3.0, 1e-12, "mean");
    requireClose(bb.upper[4], 3.0 + 2.0 * std::sqrt(2.0), 1e-12, "upper");
    requireClose(bb.lower[4], 3.0 - 2.0 * std::sqrt(2.0), 1e-12, "lower");

    std::printf("  Test 6 (Bollinger): PASS\n");
  }

  // ---- Test 7: Nice ticks ----
  {
    sc::TickSet t = sc::computeNiceTicks(0.0, 100.0, 5);
    requireClose(t.step, 20.0, 1e-12, "step 20");
    requireTrue(t.values.size() == 6, "0..100");

    t = sc::computeNiceTicks(0.5, 3.7, 5);
    requireClose(t.step, 1.0, 1e-12, "step 1");
    requireTrue(t.values.size() == 3, "1, 2, 3");
    requireClose(t.values.front(), 1.0, 1e-12, "first inside");

    t = sc::computeNiceTicks(0.0, 1.0, 4);
    requireClose(t.step, 0.25, 1e-12, "2.5 x 10^-1");

    t = sc::computeNiceTicks(5.0, 5.0, 5);
    requireTrue(t.values.size() == 1, "degenerate range");

    std::printf("  Test 7 (nice ticks): PASS\n");
  }

  // ---- Test 8: fillMissingIndicators keeps supplied values ----
  {
    sc::SyntheticSeriesConfig cfg;
    cfg.count = 150;
    std::vector<sc::SeriesRecord> records = sc::makeSyntheticSeries(cfg).records();
    for (auto& r : records) {
      r.ma5 = sc::kMissing;
      r.rsi = sc::kMissing;
    }
    records[10].ma5 = 999.0;

    sc::fillMissingIndicators(records);
    requireClose(records[10].ma5, 999.0, 0.0, "supplied value kept");
    double sum = 0.0;
    for (int i = 7; i <= 11; i++) sum += records[static_cast<std::size_t>(i)].close;
    requireClose(records[11].ma5, sum / 5.0, 1e-9, "computed MA5");
    requireTrue(std::isnan(records[13].rsi), "RSI warm-up");
    requireTrue(!std::isnan(records[14].rsi), "RSI filled");
    requireTrue(!std::isnan(records[119].ma120), "MA120 filled");
    requireTrue(!std::isnan(records[149].bbUpper), "Bollinger filled");

    std::printf("  Test 8 (fillMissingIndicators): PASS\n");
  }

  // ---- Test 9: DataSeries JSON ----
  {
    sc::DataSeries s;
    requireTrue(s.loadJSON(R"([{"date":"2024-01-02","open":1,"high":2,"low":0.5,"close":1.5,"volume":100},)"
                           R"({"date":"2024-01-03","open":1.5,"high":3,"low":1,"close":2.5,"volume":200,"macd_hist":0.2}])"),
                "array form");
    requireTrue(s.size() == 2, "two records");
    requireClose(s.at(1).macdHist, 0.2, 1e-12, "snake_case key");
    requireTrue(std::isnan(s.at(0).ma5), "absent column stays NaN");

    std::size_t idx = 99;
    requireTrue(s.indexOfDate("2024-01-03", idx) && idx == 1, "date lookup");
    requireTrue(!s.indexOfDate("2024-01-04", idx), "missing date");

    double lo = 0, hi = 0;
    requireTrue(s.valueRange(sc::SeriesField::High, 0, 5, lo, hi), "range clamps last");
    requireClose(lo, 2.0, 0.0, "lo");
    requireClose(hi, 3.0, 0.0, "hi");
    requireTrue(!s.valueRange(sc::SeriesField::Ma5, 0, 1, lo, hi), "all NaN");

    requireTrue(s.loadJSON(R"({"data":[{"date":"2024-02-01","close":7}]})"), "wrapped form");
    requireTrue(s.size() == 1, "replaced");

    requireTrue(!s.loadJSON(R"([{"date":"2024-01-03"},{"date":"2024-01-02"}])"), "out of order");
    requireTrue(!s.loadJSON(R"([{"close":1}])"), "missing date");
    requireTrue(!s.loadJSON("[{"), "parse error");
    requireTrue(s.size() == 1, "failed loads change nothing");

    std::printf("  Test 9 (JSON): PASS\n");
  }

  // ---- Test 10: Synthetic series ----
  {
    sc::SyntheticSeriesConfig cfg;
    cfg.count = 40;
    sc::DataSeries a = sc::makeSyntheticSeries(cfg);
    sc::DataSeries b = sc::makeSyntheticSeries(cfg);
    requireTrue(a.size() == 40, "count");
    requireTrue(a.at(0).date == "2023-01-02", "start date");
    requireClose(a.at(39).close, b.at(39).close, 0.0, "deterministic");

    for (std::size_t i = 0; i < a.size(); ++i) {
      const sc::SeriesRecord& r = a.at(i);
      requireTrue(r.high >= std::max(r.open, r.close), "high on top");
      requireTrue(r.low <= std::min(r.open, r.close), "low at bottom");
      std::int64_t day = 0;
      requireTrue(sc::parseIsoDate(r.date, day), "parsable date");
      int weekday = static_cast<int>(((day % 7) + 7 + 3) % 7);
      requireTrue(weekday < 5, "weekdays only");
      if (i > 0) requireTrue(a.at(i - 1).date < r.date, "ascending");
    }

    std::int64_t epoch = -1;
    requireTrue(sc::parseIsoDate("1970-01-01", epoch) && epoch == 0, "epoch");
    requireTrue(sc::formatIsoDate(19358) == "2023-01-01", "format");
    requireTrue(!sc::parseIsoDate("2023-1-2", epoch), "strict format");

    cfg.startDate = "bad";
    requireTrue(sc::makeSyntheticSeries(cfg).empty(), "bad start date");

    std::printf("  Test 10 (synthetic): PASS\n");
  }

  std::printf("D5.1 indicators: ALL PASS\n");
  return 0;
}
