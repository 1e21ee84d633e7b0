#pragma once
#include "sc/drawing/DrawingStore.hpp"
#include "sc/pane/ChartTypes.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sc {

class Pane;

// Pixel-space shapes re-derived from chart-space drawings on every redraw.
struct ShapeLine {
  PixelPoint a, b;
  float color[4] = {1, 1, 1, 1};
  float width{2.0f};
  float dashLength{0};   // 0 = solid
  float gapLength{0};
};

struct ShapeFill {
  std::vector<PixelPoint> polygon;  // convex, in order
  float color[4] = {1, 1, 1, 0.1f};
};

struct ShapeMarker {
  PixelPoint center;
  float radius{4.0f};
  float color[4] = {1, 1, 1, 1};
};

struct ShapeLabel {
  PixelPoint anchor;  // baseline-left
  std::string text;
  float color[4] = {1, 1, 1, 1};
  bool bold{false};
  bool backdrop{false};
  float backdropWidth{0};  // estimated text advance when backdrop is set
};

struct DrawingShapes {
  std::vector<ShapeFill> fills;
  std::vector<ShapeLine> lines;
  std::vector<ShapeMarker> markers;
  std::vector<ShapeLabel> labels;

  void clear();
  bool empty() const;
  void append(const DrawingShapes& other);
};

struct DrawingGeometryConfig {
  float selectedColor[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float selectedLineWidth{2.5f};
  float markerRadius{4.0f};
  float selectedMarkerRadius{5.0f};
  float degenerateMarkerRadius{1.0f};

  float levelLineWidth{1.5f};
  float goldenEmphasisWidth{2.5f};
  float levelDash{5.0f}, levelGap{3.0f};        // fibonacci / golden .5
  float guideDash{8.0f}, guideGap{4.0f};        // horizontal / vertical

  float rectangleFillAlpha{0x20 / 255.0f};
  float bandFillAlpha{0x15 / 255.0f};           // golden band, channel
  float textBackdrop[4] = {0.0f, 0.0f, 0.0f, 0x80 / 255.0f};

  double labelOffsetX{5.0};
  double labelOffsetY{3.0};
  double charWidth{8.0};
};

// Ray from `anchor` along (dx, dy) to the plot boundary [0,w] x [0,h].
// t is the minimum over the axes the direction heads toward, clamped at 0.
// Returns false for a zero direction.
bool extendToEdge(const PixelPoint& anchor, double dx, double dy,
                  double width, double height, PixelPoint& out);

class DrawingGeometry {
public:
  void setConfig(const DrawingGeometryConfig& cfg) { config_ = cfg; }
  const DrawingGeometryConfig& config() const { return config_; }

  // Shapes for one stored drawing on `pane`. Returns false (and appends
  // nothing) when any vertex cannot be mapped this frame.
  bool build(const Drawing& drawing, const Pane& pane, bool selected,
             DrawingShapes& out) const;

  // All stored drawings in insertion order; unmappable ones are skipped.
  // Returns the number of drawings that produced shapes.
  std::size_t buildAll(const DrawingStore& store, const Pane& pane,
                       std::uint32_t selectedId, DrawingShapes& out) const;

  // Shapes from pixel vertices, used for stored drawings and for the
  // in-progress preview. A channel with two vertices renders its baseline.
  void buildFromPixels(DrawingType type, const std::vector<PixelPoint>& pts,
                       const float color[4], float lineWidth, const std::string& text,
                       bool selected, double plotWidth, double plotHeight,
                       DrawingShapes& out) const;

private:
  void addLine(const PixelPoint& a, const PixelPoint& b, const float color[4],
               float width, DrawingShapes& out) const;
  void addExtendedLine(const PixelPoint& a, const PixelPoint& b, bool extendStart,
                       const float color[4], float width, double w, double h,
                       DrawingShapes& out) const;
  void addMarker(const PixelPoint& c, bool selected, const float color[4],
                 DrawingShapes& out) const;
  void addLevels(DrawingType type, const PixelPoint& p0, const PixelPoint& p1,
                 bool selected, DrawingShapes& out) const;

  DrawingGeometryConfig config_;
};

} // namespace sc
