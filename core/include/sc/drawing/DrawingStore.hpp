#pragma once
#include "sc/pane/ChartTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sc {

// User annotations. Every vertex is stored in chart space.
enum class DrawingType : std::uint8_t {
  Trendline = 1,        // two points, extended to both edges
  Segment = 2,          // two points
  Ray = 3,              // two points, extended past the second
  Horizontal = 4,       // one point, price level
  Vertical = 5,         // one point, bar index
  ParallelChannel = 6,  // baseline (2 points) + offset anchor
  Fibonacci = 7,        // two points, 7 retracement levels
  GoldenRatio = 8,      // two points, 5 levels with .618 emphasized
  Rectangle = 9,        // two opposite corners
  Text = 10             // one point + label
};

std::size_t pointCountFor(DrawingType type);
const char* drawingTypeName(DrawingType type);
bool parseDrawingType(const std::string& name, DrawingType& out);

// Number of characters (UTF-8 code points) in a label; sizes text boxes.
std::size_t textLength(const std::string& text);

struct Drawing {
  std::uint32_t id{0};
  DrawingType type{DrawingType::Trendline};
  std::vector<ChartPoint> points;

  float color[4] = {0.231f, 0.510f, 0.965f, 1.0f};  // #3b82f6
  float lineWidth{2.0f};
  std::string text;  // Text only
};

class DrawingStore {
public:
  // Validates and stores a drawing. Returns its id, or 0 when the point
  // count does not match the type, a coordinate is not finite, a Text
  // drawing has blank text, or ids are exhausted.
  std::uint32_t add(DrawingType type, std::vector<ChartPoint> points,
                    const float color[4] = nullptr, std::string text = {});

  static bool validate(DrawingType type, const std::vector<ChartPoint>& points,
                       const std::string& text);

  bool remove(std::uint32_t id);
  void clear();

  const Drawing* get(std::uint32_t id) const;
  const std::vector<Drawing>& drawings() const { return drawings_; }
  std::size_t count() const { return drawings_.size(); }

  // Serialization
  std::string toJSON() const;
  bool loadJSON(const std::string& json);

  // Takes other's drawings. Numbering continues from whichever store is
  // further ahead, so ids issued before the swap are never handed out again.
  void replaceDrawings(DrawingStore&& other);

private:
  std::vector<Drawing> drawings_;
  std::uint32_t nextId_{1};
};

} // namespace sc
