#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace sc {

// Captured pane pixels: tightly packed RGBA8, rows top-down.
struct RasterImage {
  int width{0};
  int height{0};
  std::vector<std::uint8_t> rgba;

  bool valid() const {
    return width > 0 && height > 0 &&
           rgba.size() == static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4;
  }
  const std::uint8_t* pixel(int x, int y) const {
    return &rgba[(static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                  static_cast<std::size_t>(x)) * 4];
  }
};

// Reverses row order in place (GL read-back is bottom-up).
void flipRows(RasterImage& image);

// Encodes to PNG (RGB, no alpha) in memory. Self-contained encoder using
// stored deflate blocks. Returns an empty buffer for an invalid image.
std::vector<std::uint8_t> encodePNG(const RasterImage& image);

bool writePNG(const std::string& path, const RasterImage& image);

// Binary PPM (P6), RGB.
bool writePPM(const std::string& path, const RasterImage& image);

} // namespace sc
