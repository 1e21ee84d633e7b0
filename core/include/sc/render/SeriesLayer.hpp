#pragma once
#include "sc/style/Theme.hpp"

namespace sc {

class DataSeries;
class Pane;
class PaneScene;
struct DrawingShapes;

struct SeriesLayerConfig {
  double candleBodyFraction{0.7};   // body width / bar spacing
  double minBodyWidth{1.0};
  int targetTicks{5};
  bool showBollinger{true};
  double kdBands[2] = {80.0, 20.0};
  double rsiBands[2] = {70.0, 30.0};
};

// Builds the pixel-space scene of one pane: grid, series for the pane's
// kind, an optional drawing overlay, then the price-axis gutter.
class SeriesLayer {
public:
  void setTheme(const Theme& theme) { theme_ = theme; }
  const Theme& theme() const { return theme_; }
  void setConfig(const SeriesLayerConfig& cfg) { config_ = cfg; }

  // Resets `scene`. Returns false (scene holds only the background) when
  // the pane is not ready.
  bool build(const Pane& pane, const DataSeries& series, const DrawingShapes* overlay,
             PaneScene& scene) const;

  static void appendShapes(const DrawingShapes& shapes, PaneScene& scene);

private:
  void buildGrid(const Pane& pane, PaneScene& scene) const;
  void buildCandles(const Pane& pane, const DataSeries& series, int first, int last,
                    PaneScene& scene) const;
  void buildVolume(const Pane& pane, const DataSeries& series, int first, int last,
                   PaneScene& scene) const;
  void buildMacd(const Pane& pane, const DataSeries& series, int first, int last,
                 PaneScene& scene) const;
  void buildOscillator(const Pane& pane, const DataSeries& series, int first, int last,
                       PaneScene& scene) const;
  void buildAxis(const Pane& pane, PaneScene& scene) const;

  Theme theme_ = lightTheme();
  SeriesLayerConfig config_;
};

} // namespace sc
