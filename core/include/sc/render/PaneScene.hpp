#pragma once
#include "sc/pane/ChartTypes.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sc {

enum class PrimitiveKind : std::uint8_t {
  Triangles = 0,  // x,y per vertex, 3 vertices per triangle
  Lines           // x0,y0,x1,y1 per segment, drawn as anti-aliased quads
};

struct DrawBatch {
  PrimitiveKind kind{PrimitiveKind::Triangles};
  float color[4] = {0, 0, 0, 1};
  float lineWidth{1.0f};
  float dashLength{0};   // Lines only; 0 = solid
  float gapLength{0};
  std::vector<float> vertices;

  std::size_t primitiveCount() const {
    return kind == PrimitiveKind::Triangles ? vertices.size() / 6 : vertices.size() / 4;
  }
};

struct SceneLabel {
  PixelPoint anchor;
  std::string text;
  float color[4] = {0, 0, 0, 1};
  bool bold{false};
};

// Ordered pixel-space draw list for one pane. Batches draw in insertion
// order over the background; labels are exposed for the host to overlay.
class PaneScene {
public:
  void reset(int width, int height, const float background[4]);

  int width() const { return width_; }
  int height() const { return height_; }
  const float* background() const { return background_; }

  DrawBatch& addTriangles(const float color[4]);
  DrawBatch& addLines(const float color[4], float width,
                      float dashLength = 0, float gapLength = 0);

  void addRect(double x0, double y0, double x1, double y1, const float color[4]);
  void addPolygon(const std::vector<PixelPoint>& convex, const float color[4]);
  void addDisc(const PixelPoint& center, double radius, const float color[4],
               int segments = 16);
  void addLabel(const PixelPoint& anchor, const std::string& text,
                const float color[4], bool bold = false);

  const std::vector<DrawBatch>& batches() const { return batches_; }
  const std::vector<SceneLabel>& labels() const { return labels_; }

private:
  int width_{0};
  int height_{0};
  float background_[4] = {1, 1, 1, 1};
  std::vector<DrawBatch> batches_;
  std::vector<SceneLabel> labels_;
};

} // namespace sc
