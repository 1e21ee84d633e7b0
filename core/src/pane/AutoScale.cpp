#include "sc/pane/AutoScale.hpp"

#include <algorithm>
#include <cmath>

namespace sc {

std::vector<SeriesField> AutoScale::fieldsFor(PaneKind kind) {
  switch (kind) {
    case PaneKind::Price:
      return {SeriesField::High, SeriesField::Low,
              SeriesField::Ma5, SeriesField::Ma10, SeriesField::Ma20,
              SeriesField::Ma60, SeriesField::Ma120,
              SeriesField::BbUpper, SeriesField::BbLower};
    case PaneKind::Volume:
      return {SeriesField::Volume, SeriesField::VolumeMa5};
    case PaneKind::Macd:
      return {SeriesField::Macd, SeriesField::MacdSignal, SeriesField::MacdHist};
    case PaneKind::Kd:
      return {SeriesField::K, SeriesField::D};
    case PaneKind::Rsi:
      return {SeriesField::Rsi};
  }
  return {};
}

bool AutoScale::computePriceRange(const Pane& pane, const DataSeries& series,
                                  PriceRange& out) const {
  if (!pane.hasVisibleRange() || series.empty()) return false;

  const PaneKind kind = pane.kind();
  if (config_.fixedOscillatorRange && (kind == PaneKind::Kd || kind == PaneKind::Rsi)) {
    out = {0.0, 100.0};
    return true;
  }

  // Bars touched by the visible range, clamped into the series.
  const LogicalRange& r = pane.visibleRange();
  const double last = static_cast<double>(series.lastIndex());
  double first = std::min(last, std::max(0.0, std::floor(r.from)));
  double end = std::max(first, std::min(last, std::ceil(r.to)));

  bool found = false;
  double lo = 0, hi = 0;
  for (SeriesField f : fieldsFor(kind)) {
    double flo, fhi;
    if (!series.valueRange(f, static_cast<std::size_t>(first),
                           static_cast<std::size_t>(end), flo, fhi))
      continue;
    lo = found ? std::min(lo, flo) : flo;
    hi = found ? std::max(hi, fhi) : fhi;
    found = true;
  }
  if (!found) return false;

  // Volume bars and the MACD histogram grow from zero.
  if (kind == PaneKind::Volume || kind == PaneKind::Macd) {
    lo = std::min(lo, 0.0);
    hi = std::max(hi, 0.0);
  }

  if (hi - lo <= 0.0) {
    double pad = std::fabs(hi) > 0.0 ? std::fabs(hi) * 0.01 : 1.0;
    lo -= pad;
    hi += pad;
  }

  // Data occupies (1 - top - bottom) of the plot height.
  const PaneConfig& cfg = pane.config();
  double content = 1.0 - cfg.scaleMarginTop - cfg.scaleMarginBottom;
  if (content <= 0.0) content = 1.0;
  double total = (hi - lo) / content;
  out.max = hi + total * cfg.scaleMarginTop;
  out.min = lo - total * cfg.scaleMarginBottom;
  return out.valid();
}

bool AutoScale::apply(Pane& pane, const DataSeries& series) const {
  PriceRange range;
  if (!computePriceRange(pane, series, range)) return false;
  return pane.setPriceRange(range);
}

} // namespace sc
