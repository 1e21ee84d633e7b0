#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace sc {

inline constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

// One trading day. Indicator columns are NaN until supplied or filled.
struct SeriesRecord {
  std::string date;  // ISO yyyy-mm-dd
  double open{kMissing}, high{kMissing}, low{kMissing}, close{kMissing};
  double volume{kMissing};

  double ma5{kMissing}, ma10{kMissing}, ma20{kMissing};
  double ma60{kMissing}, ma120{kMissing};

  double macd{kMissing}, macdSignal{kMissing}, macdHist{kMissing};
  double k{kMissing}, d{kMissing};
  double rsi{kMissing};

  double bbUpper{kMissing}, bbMiddle{kMissing}, bbLower{kMissing};
  double volumeMa5{kMissing};
};

enum class SeriesField : std::uint8_t {
  Open = 0, High, Low, Close, Volume,
  Ma5, Ma10, Ma20, Ma60, Ma120,
  Macd, MacdSignal, MacdHist,
  K, D, Rsi,
  BbUpper, BbMiddle, BbLower,
  VolumeMa5
};

double fieldValue(const SeriesRecord& r, SeriesField f);
double& fieldRef(SeriesRecord& r, SeriesField f);

// Ordered, date-indexed sequence of records. Read-only once handed to the
// chart; replace it wholesale with setRecords().
class DataSeries {
public:
  DataSeries() = default;
  explicit DataSeries(std::vector<SeriesRecord> records);

  void setRecords(std::vector<SeriesRecord> records);

  const std::vector<SeriesRecord>& records() const { return records_; }
  std::size_t size() const { return records_.size(); }
  bool empty() const { return records_.empty(); }

  const SeriesRecord& at(std::size_t i) const { return records_[i]; }

  // Index of the last record; only meaningful when !empty().
  std::size_t lastIndex() const { return records_.empty() ? 0 : records_.size() - 1; }

  // Exact date lookup. Returns false when the date is not in the series.
  bool indexOfDate(const std::string& date, std::size_t& out) const;

  // Min/max of a field over records [first, last], skipping NaN.
  // Returns false if no finite value is found.
  bool valueRange(SeriesField f, std::size_t first, std::size_t last,
                  double& lo, double& hi) const;

  // Parses the chart API payload: an array of objects (or {"data":[...]})
  // with keys date, open, high, low, close, volume, ma5 ... volume_ma5.
  bool loadJSON(const std::string& json);

private:
  std::vector<SeriesRecord> records_;
};

} // namespace sc
