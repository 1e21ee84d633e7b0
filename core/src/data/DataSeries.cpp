#include "sc/data/DataSeries.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include <rapidjson/document.h>

namespace sc {

namespace {

template <typename Record>
auto& fieldOf(Record& r, SeriesField f) {
  switch (f) {
    case SeriesField::Open:       return r.open;
    case SeriesField::High:       return r.high;
    case SeriesField::Low:        return r.low;
    case SeriesField::Close:      return r.close;
    case SeriesField::Volume:     return r.volume;
    case SeriesField::Ma5:        return r.ma5;
    case SeriesField::Ma10:       return r.ma10;
    case SeriesField::Ma20:       return r.ma20;
    case SeriesField::Ma60:       return r.ma60;
    case SeriesField::Ma120:      return r.ma120;
    case SeriesField::Macd:       return r.macd;
    case SeriesField::MacdSignal: return r.macdSignal;
    case SeriesField::MacdHist:   return r.macdHist;
    case SeriesField::K:          return r.k;
    case SeriesField::D:          return r.d;
    case SeriesField::Rsi:        return r.rsi;
    case SeriesField::BbUpper:    return r.bbUpper;
    case SeriesField::BbMiddle:   return r.bbMiddle;
    case SeriesField::BbLower:    return r.bbLower;
    case SeriesField::VolumeMa5:  return r.volumeMa5;
  }
  return r.close;
}

} // namespace

double fieldValue(const SeriesRecord& r, SeriesField f) {
  return fieldOf(r, f);
}

double& fieldRef(SeriesRecord& r, SeriesField f) {
  return fieldOf(r, f);
}

DataSeries::DataSeries(std::vector<SeriesRecord> records)
  : records_(std::move(records)) {}

void DataSeries::setRecords(std::vector<SeriesRecord> records) {
  records_ = std::move(records);
}

bool DataSeries::indexOfDate(const std::string& date, std::size_t& out) const {
  if (date.empty()) return false;
  // Dates are ISO strings in ascending order, so lexical order is time order.
  auto it = std::lower_bound(records_.begin(), records_.end(), date,
    [](const SeriesRecord& r, const std::string& d) { return r.date < d; });
  if (it == records_.end() || it->date != date) return false;
  out = static_cast<std::size_t>(it - records_.begin());
  return true;
}

bool DataSeries::valueRange(SeriesField f, std::size_t first, std::size_t last,
                            double& lo, double& hi) const {
  if (records_.empty() || first > last) return false;
  last = std::min(last, records_.size() - 1);

  bool found = false;
  for (std::size_t i = first; i <= last; ++i) {
    double v = fieldValue(records_[i], f);
    if (!std::isfinite(v)) continue;
    if (!found) {
      lo = hi = v;
      found = true;
    } else {
      lo = std::min(lo, v);
      hi = std::max(hi, v);
    }
  }
  return found;
}

namespace {

struct JsonKey {
  const char* key;
  SeriesField field;
};

const JsonKey kJsonKeys[] = {
  {"open", SeriesField::Open},          {"high", SeriesField::High},
  {"low", SeriesField::Low},            {"close", SeriesField::Close},
  {"volume", SeriesField::Volume},      {"ma5", SeriesField::Ma5},
  {"ma10", SeriesField::Ma10},          {"ma20", SeriesField::Ma20},
  {"ma60", SeriesField::Ma60},          {"ma120", SeriesField::Ma120},
  {"macd", SeriesField::Macd},          {"macd_signal", SeriesField::MacdSignal},
  {"macd_hist", SeriesField::MacdHist}, {"k", SeriesField::K},
  {"d", SeriesField::D},                {"rsi", SeriesField::Rsi},
  {"bb_upper", SeriesField::BbUpper},   {"bb_middle", SeriesField::BbMiddle},
  {"bb_lower", SeriesField::BbLower},   {"volume_ma5", SeriesField::VolumeMa5},
};

} // namespace

bool DataSeries::loadJSON(const std::string& json) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    std::fprintf(stderr, "DataSeries: JSON parse error at offset %zu\n",
                 doc.GetErrorOffset());
    return false;
  }

  const rapidjson::Value* arr = nullptr;
  if (doc.IsArray()) {
    arr = &doc;
  } else if (doc.IsObject() && doc.HasMember("data") && doc["data"].IsArray()) {
    arr = &doc["data"];
  } else {
    return false;
  }

  std::vector<SeriesRecord> loaded;
  loaded.reserve(arr->Size());

  for (const auto& v : arr->GetArray()) {
    if (!v.IsObject()) return false;
    if (!v.HasMember("date") || !v["date"].IsString()) return false;

    SeriesRecord r;
    r.date = v["date"].GetString();
    for (const auto& jk : kJsonKeys) {
      auto it = v.FindMember(jk.key);
      if (it != v.MemberEnd() && it->value.IsNumber())
        fieldRef(r, jk.field) = it->value.GetDouble();
    }
    if (!loaded.empty() && !(loaded.back().date < r.date)) {
      std::fprintf(stderr, "DataSeries: dates out of order at %s\n", r.date.c_str());
      return false;
    }
    loaded.push_back(std::move(r));
  }

  records_ = std::move(loaded);
  return true;
}

} // namespace sc
