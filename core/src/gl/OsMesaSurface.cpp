#include "sc/gl/OsMesaSurface.hpp"
#include "sc/render/PaneScene.hpp"

#include <algorithm>
#include <cstdio>

namespace sc {

OsMesaSurface::OsMesaSurface() = default;

OsMesaSurface::~OsMesaSurface() {
  if (ctx_) {
    // GL objects must be deleted with their context current.
    if (makeCurrent()) renderer_.release();
    OSMesaDestroyContext(ctx_);
  }
}

std::unique_ptr<OsMesaSurface> OsMesaSurface::create(int width, int height) {
  auto surface = std::make_unique<OsMesaSurface>();
  if (!surface->init(width, height)) return nullptr;
  return surface;
}

bool OsMesaSurface::init(int width, int height) {
  if (ctx_) return resize(width, height);
  if (width <= 0 || height <= 0) {
    std::fprintf(stderr, "OsMesaSurface: invalid size %dx%d\n", width, height);
    return false;
  }

  static const int attribs[] = {
    OSMESA_FORMAT,            OSMESA_RGBA,
    OSMESA_DEPTH_BITS,        0,
    OSMESA_STENCIL_BITS,      0,
    OSMESA_PROFILE,           OSMESA_CORE_PROFILE,
    OSMESA_CONTEXT_MAJOR_VERSION, 3,
    OSMESA_CONTEXT_MINOR_VERSION, 3,
    0
  };

  ctx_ = OSMesaCreateContextAttribs(attribs, nullptr);
  if (!ctx_) {
    std::fprintf(stderr, "OsMesaSurface: OSMesaCreateContextAttribs failed\n");
    return false;
  }

  width_  = width;
  height_ = height;
  framebuf_.assign(static_cast<std::size_t>(width) * height * 4, 0);

  if (!makeCurrent()) {
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
    return false;
  }

  // Load GL function pointers via GLAD, using OSMesa's loader.
  int version = gladLoadGL((GLADloadfunc)OSMesaGetProcAddress);
  if (!version) {
    std::fprintf(stderr, "OsMesaSurface: gladLoadGL failed\n");
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
    return false;
  }

  if (!renderer_.init()) {
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
    return false;
  }
  return true;
}

bool OsMesaSurface::makeCurrent() {
  if (!OSMesaMakeCurrent(ctx_, framebuf_.data(), GL_UNSIGNED_BYTE, width_, height_)) {
    std::fprintf(stderr, "OsMesaSurface: OSMesaMakeCurrent failed\n");
    return false;
  }
  return true;
}

bool OsMesaSurface::resize(int width, int height) {
  if (!ctx_) return init(width, height);
  if (width <= 0 || height <= 0) return false;
  if (width == width_ && height == height_) return true;

  width_ = width;
  height_ = height;
  framebuf_.assign(static_cast<std::size_t>(width) * height * 4, 0);
  rendered_ = false;
  return makeCurrent();
}

bool OsMesaSurface::render(const PaneScene& scene) {
  if (!ctx_ || !makeCurrent()) return false;

  stats_ = renderer_.render(scene, width_, height_);
  glFinish();
  rendered_ = true;
  return true;
}

bool OsMesaSurface::readPixels(RasterImage& out) const {
  if (!ctx_ || !rendered_) return false;

  // OSMesa renders straight into framebuf_, bottom row first.
  out.width = width_;
  out.height = height_;
  out.rgba = framebuf_;
  flipRows(out);
  return true;
}

} // namespace sc
