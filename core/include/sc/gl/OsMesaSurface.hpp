#pragma once
#include "sc/gl/PaneRenderer.hpp"
#include "sc/render/RasterSurface.hpp"

#include <glad/gl.h>    // GLAD must precede osmesa.h (guards GL/gl.h)

// OSMesa header uses GLAPI and APIENTRY from GL/gl.h, which GLAD suppresses.
#ifndef APIENTRY
#define APIENTRY
#endif
#ifndef GLAPI
#define GLAPI extern
#endif

#include <GL/osmesa.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace sc {

// Off-screen GL 3.3 core surface for one pane. Each surface owns its own
// OSMesa context and colour buffer; render() makes it current.
class OsMesaSurface : public RasterSurface {
public:
  OsMesaSurface();
  ~OsMesaSurface() override;

  OsMesaSurface(const OsMesaSurface&) = delete;
  OsMesaSurface& operator=(const OsMesaSurface&) = delete;

  // Creates the context. Returns false (errors to stderr) when OSMesa or
  // the GL loader is unavailable.
  bool init(int width, int height);
  bool isInitialized() const { return ctx_ != nullptr; }

  bool resize(int width, int height) override;
  bool render(const PaneScene& scene) override;
  bool readPixels(RasterImage& out) const override;

  int width() const override { return width_; }
  int height() const override { return height_; }

  const PaneRendererStats& lastStats() const { return stats_; }

  // Factory helper: a ready surface, or nullptr if init fails.
  static std::unique_ptr<OsMesaSurface> create(int width, int height);

private:
  bool makeCurrent();

  OSMesaContext ctx_{nullptr};
  int width_{0};
  int height_{0};
  std::vector<std::uint8_t> framebuf_;
  PaneRenderer renderer_;
  PaneRendererStats stats_;
  bool rendered_{false};
};

} // namespace sc
