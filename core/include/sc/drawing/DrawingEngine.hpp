#pragma once
#include "sc/drawing/DrawingGeometry.hpp"
#include "sc/drawing/DrawingInteraction.hpp"
#include "sc/drawing/DrawingStore.hpp"
#include "sc/drawing/HitTester.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sc {

class Pane;

// Owns all annotations and the interaction state that creates, selects
// and deletes them. Reads panes only through the coordinate transform.
class DrawingEngine {
public:
  DrawingEngine();

  void setInteractionMode(InteractionMode mode, DrawingType drawType = DrawingType::Trendline);
  InteractionMode mode() const { return interaction_.mode(); }
  const DrawingInteraction& interaction() const { return interaction_; }

  // Pointer routing. Ignored means the event was not consumed and may
  // drive pan/zoom instead.
  CaptureStatus pointerDown(const Pane& pane, const PixelPoint& p);
  CaptureStatus pointerMove(const Pane& pane, const PixelPoint& p);
  CaptureStatus pointerUp(const Pane& pane, const PixelPoint& p);
  CaptureStatus pointerLeave(const Pane& pane);

  CaptureStatus confirmText(const Pane& pane, const std::string& text);
  void cancelText();

  // Id of the drawing created by the most recent commit, or 0.
  std::uint32_t lastCreatedId() const { return lastCreatedId_; }

  // Programmatic creation; colour comes from the palette. Returns 0 if the
  // drawing is invalid.
  std::uint32_t addDrawing(DrawingType type, std::vector<ChartPoint> points,
                           std::string text = {});
  bool deleteDrawing(std::uint32_t id);
  void clearDrawings();

  // 0 clears the selection. Returns false for an unknown id.
  bool selectDrawing(std::uint32_t id);
  std::uint32_t selectedId() const { return selectedId_; }
  bool deleteSelected();

  // Where to place the delete button for the selected drawing.
  bool deleteAffordance(const Pane& pane, PixelPoint& out) const;

  // Re-derives every drawing plus the capture preview for `pane` and
  // clears the dirty flag.
  void redraw(const Pane& pane, DrawingShapes& out);

  bool isDirty() const { return dirty_; }
  void markDirty() { dirty_ = true; }

  DrawingStore& store() { return store_; }
  const DrawingStore& store() const { return store_; }
  DrawingGeometry& geometry() { return geometry_; }
  HitTester& hitTester() { return hitTester_; }

  void setWarningHandler(WarningHandler handler);

  static constexpr std::size_t kPaletteSize = 8;
  static const float kPalette[kPaletteSize][4];

private:
  CaptureStatus handle(CaptureStatus status);
  const float* nextColor();

  DrawingStore store_;
  DrawingInteraction interaction_;
  DrawingGeometry geometry_;
  HitTester hitTester_;

  std::uint32_t selectedId_{0};
  std::uint32_t lastCreatedId_{0};
  std::size_t paletteIndex_{0};
  bool dirty_{true};
};

} // namespace sc
