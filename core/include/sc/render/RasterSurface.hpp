#pragma once
#include "sc/export/ChartSnapshot.hpp"

namespace sc {

class PaneScene;

// Per-pane pixel target. Implementations own their backing store.
class RasterSurface {
public:
  virtual ~RasterSurface() = default;

  virtual bool resize(int width, int height) = 0;
  virtual bool render(const PaneScene& scene) = 0;

  // Pixels of the last completed render, rows top-down.
  virtual bool readPixels(RasterImage& out) const = 0;

  virtual int width() const = 0;
  virtual int height() const = 0;
};

} // namespace sc
