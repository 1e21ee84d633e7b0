// D4.3 - PNG / PPM export
// Tests: PNG signature and chunk layout, IHDR fields, stored-block zlib
// framing, invalid images, row flipping, file output.

#include "sc/export/ChartSnapshot.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static std::uint32_t readBE32(const std::vector<std::uint8_t>& b, std::size_t at) {
  return (static_cast<std::uint32_t>(b[at]) << 24) | (static_cast<std::uint32_t>(b[at + 1]) << 16) |
         (static_cast<std::uint32_t>(b[at + 2]) << 8) | static_cast<std::uint32_t>(b[at + 3]);
}

static sc::RasterImage makeImage(int w, int h) {
  sc::RasterImage img;
  img.width = w;
  img.height = h;
  img.rgba.resize(static_cast<std::size_t>(w) * h * 4);
  for (int y = 0; y < h; y++) {
    for (int x = 0; x < w; x++) {
      std::uint8_t* px = &img.rgba[(static_cast<std::size_t>(y) * w + x) * 4];
      px[0] = static_cast<std::uint8_t>(x);
      px[1] = static_cast<std::uint8_t>(y);
      px[2] = 200;
      px[3] = 255;
    }
  }
  return img;
}

int main() {
  // ---- Test 1: Signature and chunk order ----
  {
    sc::RasterImage img = makeImage(7, 3);
    std::vector<std::uint8_t> png = sc::encodePNG(img);
    const std::uint8_t sig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    requireTrue(png.size() > 8 && std::memcmp(png.data(), sig, 8) == 0, "signature");

    // IHDR: length 13, width, height, depth 8, colour type 2
    requireTrue(readBE32(png, 8) == 13, "IHDR length");
    requireTrue(std::memcmp(&png[12], "IHDR", 4) == 0, "IHDR type");
    requireTrue(readBE32(png, 16) == 7, "width");
    requireTrue(readBE32(png, 20) == 3, "height");
    requireTrue(png[24] == 8 && png[25] == 2, "RGB8");

    // IDAT follows IHDR's CRC
    const std::size_t idat = 8 + 4 + 4 + 13 + 4;
    std::uint32_t idatLen = readBE32(png, idat);
    requireTrue(std::memcmp(&png[idat + 4], "IDAT", 4) == 0, "IDAT type");
    // filter byte + RGB per row, wrapped in 2 + 5 + 4 bytes of zlib framing
    const std::uint32_t raw = 3 * (1 + 7 * 3);
    requireTrue(idatLen == raw + 11, "stored zlib size");
    requireTrue(png[idat + 8] == 0x78 && png[idat + 9] == 0x01, "zlib header");
    requireTrue(png[idat + 10] == 0x01, "single final stored block");

    // IEND closes the file
    requireTrue(png.size() >= 12, "room for IEND");
    requireTrue(readBE32(png, png.size() - 12) == 0, "IEND empty");
    requireTrue(std::memcmp(&png[png.size() - 8], "IEND", 4) == 0, "IEND type");
    requireTrue(readBE32(png, png.size() - 4) == 0xAE426082u, "IEND CRC");

    // First row: filter 0 then R,G,B of pixel (0,0)
    requireTrue(png[idat + 15] == 0x00, "filter byte");
    requireTrue(png[idat + 16] == 0 && png[idat + 17] == 0 && png[idat + 18] == 200,
                "first pixel RGB, alpha dropped");

    std::printf("  Test 1 (chunk layout): PASS\n");
  }

  // ---- Test 2: Large image spans several stored blocks ----
  {
    sc::RasterImage img = makeImage(300, 100);  // 90100 raw bytes
    std::vector<std::uint8_t> png = sc::encodePNG(img);
    const std::size_t idat = 8 + 4 + 4 + 13 + 4;
    std::uint32_t idatLen = readBE32(png, idat);
    const std::uint32_t raw = 100 * (1 + 300 * 3);
    requireTrue(idatLen == raw + 2 + 2 * 5 + 4, "two stored blocks");
    requireTrue(png[idat + 10] == 0x00, "first block not final");

    std::printf("  Test 2 (multi-block): PASS\n");
  }

  // ---- Test 3: Invalid images ----
  {
    sc::RasterImage empty;
    requireTrue(sc::encodePNG(empty).empty(), "empty image");

    sc::RasterImage shortBuf = makeImage(4, 4);
    shortBuf.rgba.resize(10);
    requireTrue(!shortBuf.valid(), "buffer size mismatch");
    requireTrue(sc::encodePNG(shortBuf).empty(), "mismatch rejected");
    requireTrue(!sc::writePNG("/tmp/sc_invalid.png", shortBuf), "writePNG rejects");
    requireTrue(!sc::writePPM("/tmp/sc_invalid.ppm", shortBuf), "writePPM rejects");

    std::printf("  Test 3 (invalid): PASS\n");
  }

  // ---- Test 4: flipRows ----
  {
    sc::RasterImage img = makeImage(2, 3);
    sc::flipRows(img);
    requireTrue(img.pixel(0, 0)[1] == 2, "bottom row now on top");
    requireTrue(img.pixel(1, 1)[1] == 1, "middle row stays");
    requireTrue(img.pixel(1, 2)[1] == 0 && img.pixel(1, 2)[0] == 1, "top row now at bottom");
    sc::flipRows(img);
    requireTrue(img.pixel(0, 0)[1] == 0, "flip twice is identity");

    std::printf("  Test 4 (flipRows): PASS\n");
  }

  // ---- Test 5: File output ----
  {
    sc::RasterImage img = makeImage(16, 8);
    requireTrue(sc::writePNG("/tmp/sc_d4_3.png", img), "writePNG");
    requireTrue(sc::writePPM("/tmp/sc_d4_3.ppm", img), "writePPM");

    FILE* f = std::fopen("/tmp/sc_d4_3.ppm", "rb");
    requireTrue(f != nullptr, "ppm exists");
    char magic[3] = {0, 0, 0};
    requireTrue(std::fread(magic, 1, 2, f) == 2, "read magic");
    std::fseek(f, 0, SEEK_END);
    long size = std::ftell(f);
    std::fclose(f);
    requireTrue(std::strcmp(magic, "P6") == 0, "P6");
    const long header = static_cast<long>(std::strlen("P6\n16 8\n255\n"));
    requireTrue(size == header + 16 * 8 * 3, "ppm size");

    f = std::fopen("/tmp/sc_d4_3.png", "rb");
    requireTrue(f != nullptr, "png exists");
    std::fseek(f, 0, SEEK_END);
    long pngSize = std::ftell(f);
    std::fclose(f);
    requireTrue(pngSize == static_cast<long>(sc::encodePNG(img).size()), "png size");

    std::remove("/tmp/sc_d4_3.png");
    std::remove("/tmp/sc_d4_3.ppm");
    requireTrue(!sc::writePNG("/nonexistent_dir/x.png", img), "bad path");

    std::printf("  Test 5 (files): PASS\n");
  }

  std::printf("D4.3 png_export: ALL PASS\n");
  return 0;
}
