#include "sc/export/ChartSnapshot.hpp"
#include <algorithm>
#include <cstdio>

namespace sc {

void flipRows(RasterImage& image) {
  if (!image.valid()) return;
  const std::size_t rowBytes = static_cast<std::size_t>(image.width) * 4;
  for (int top = 0, bottom = image.height - 1; top < bottom; ++top, --bottom) {
    std::swap_ranges(image.rgba.begin() + static_cast<std::ptrdiff_t>(top * rowBytes),
                     image.rgba.begin() + static_cast<std::ptrdiff_t>((top + 1) * rowBytes),
                     image.rgba.begin() + static_cast<std::ptrdiff_t>(bottom * rowBytes));
  }
}

// ---------------------------------------------------------------------------
// PPM export
// ---------------------------------------------------------------------------

bool writePPM(const std::string& path, const RasterImage& image) {
  if (!image.valid()) return false;

  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "writePPM: cannot open %s\n", path.c_str());
    return false;
  }

  std::fprintf(f, "P6\n%d %d\n255\n", image.width, image.height);
  for (int y = 0; y < image.height; y++) {
    for (int x = 0; x < image.width; x++) {
      const std::uint8_t* px = image.pixel(x, y);
      std::fputc(px[0], f); // R
      std::fputc(px[1], f); // G
      std::fputc(px[2], f); // B
    }
  }

  bool ok = std::ferror(f) == 0;
  std::fclose(f);
  return ok;
}

// ---------------------------------------------------------------------------
// PNG export: stored deflate blocks (uncompressed), no zlib dependency.
// ---------------------------------------------------------------------------

namespace {

// CRC32 lookup table (PNG uses ISO 3309 / ITU-T V.42 polynomial).
struct CrcTable {
  std::uint32_t entries[256];

  CrcTable() {
    for (std::uint32_t n = 0; n < 256; n++) {
      std::uint32_t c = n;
      for (int k = 0; k < 8; k++) {
        c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
      }
      entries[n] = c;
    }
  }
};

std::uint32_t computeCrc32(const std::uint8_t* data, std::size_t len) {
  static const CrcTable table;
  std::uint32_t c = 0xFFFFFFFFu;
  for (std::size_t i = 0; i < len; i++) {
    c = table.entries[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  }
  return c ^ 0xFFFFFFFFu;
}

std::uint32_t computeAdler32(const std::uint8_t* data, std::size_t len) {
  std::uint32_t a = 1, b = 0;
  constexpr std::uint32_t MOD = 65521u;
  constexpr std::size_t NMAX = 5552; // max bytes before modding (RFC 1950)
  std::size_t offset = 0;
  while (offset < len) {
    std::size_t chunk = std::min(len - offset, NMAX);
    for (std::size_t i = 0; i < chunk; i++) {
      a += data[offset + i];
      b += a;
    }
    a %= MOD;
    b %= MOD;
    offset += chunk;
  }
  return (b << 16) | a;
}

void pushBE32(std::vector<std::uint8_t>& buf, std::uint32_t v) {
  buf.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
  buf.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
  buf.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
  buf.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

void writeChunk(std::vector<std::uint8_t>& out, const char type[4],
                const std::uint8_t* data, std::size_t dataLen) {
  pushBE32(out, static_cast<std::uint32_t>(dataLen));

  std::size_t typeStart = out.size();
  out.insert(out.end(), type, type + 4);
  if (dataLen > 0 && data) {
    out.insert(out.end(), data, data + dataLen);
  }

  // CRC32 over type + data
  pushBE32(out, computeCrc32(&out[typeStart], 4 + dataLen));
}

// Filter byte 0 (None) + RGB per row.
std::vector<std::uint8_t> filteredRows(const RasterImage& image) {
  const std::size_t rowBytes = 1 + static_cast<std::size_t>(image.width) * 3;
  std::vector<std::uint8_t> raw;
  raw.reserve(static_cast<std::size_t>(image.height) * rowBytes);

  for (int y = 0; y < image.height; y++) {
    raw.push_back(0x00);
    for (int x = 0; x < image.width; x++) {
      const std::uint8_t* px = image.pixel(x, y);
      raw.insert(raw.end(), px, px + 3);
    }
  }
  return raw;
}

// zlib stream of stored blocks (RFC 1950 / RFC 1951), max 65535 bytes each.
std::vector<std::uint8_t> wrapZlibStored(const std::uint8_t* data, std::size_t len) {
  std::vector<std::uint8_t> zlib;
  std::size_t numBlocks = std::max<std::size_t>(1, (len + 65534) / 65535);
  zlib.reserve(2 + numBlocks * 5 + len + 4);

  // CMF=0x78 (deflate, 32K window), FLG=0x01
  zlib.push_back(0x78);
  zlib.push_back(0x01);

  std::size_t offset = 0;
  do {
    std::size_t blockLen = std::min(len - offset, static_cast<std::size_t>(65535));
    bool last = offset + blockLen == len;
    zlib.push_back(last ? 0x01 : 0x00); // BFINAL | BTYPE=00

    auto len16 = static_cast<std::uint16_t>(blockLen);
    auto nlen16 = static_cast<std::uint16_t>(~len16);
    zlib.push_back(static_cast<std::uint8_t>(len16 & 0xFF));
    zlib.push_back(static_cast<std::uint8_t>((len16 >> 8) & 0xFF));
    zlib.push_back(static_cast<std::uint8_t>(nlen16 & 0xFF));
    zlib.push_back(static_cast<std::uint8_t>((nlen16 >> 8) & 0xFF));

    zlib.insert(zlib.end(), data + offset, data + offset + blockLen);
    offset += blockLen;
  } while (offset < len);

  pushBE32(zlib, computeAdler32(data, len));
  return zlib;
}

} // namespace

std::vector<std::uint8_t> encodePNG(const RasterImage& image) {
  std::vector<std::uint8_t> out;
  if (!image.valid()) return out;

  out.reserve(128 + static_cast<std::size_t>(image.height) *
                    (1 + static_cast<std::size_t>(image.width) * 3));

  const std::uint8_t sig[8] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
  out.insert(out.end(), sig, sig + 8);

  std::vector<std::uint8_t> ihdr;
  ihdr.reserve(13);
  pushBE32(ihdr, static_cast<std::uint32_t>(image.width));
  pushBE32(ihdr, static_cast<std::uint32_t>(image.height));
  ihdr.push_back(8);  // bit depth
  ihdr.push_back(2);  // color type: RGB
  ihdr.push_back(0);  // compression: deflate
  ihdr.push_back(0);  // filter method
  ihdr.push_back(0);  // interlace: none
  writeChunk(out, "IHDR", ihdr.data(), ihdr.size());

  auto raw = filteredRows(image);
  auto zlibData = wrapZlibStored(raw.data(), raw.size());
  writeChunk(out, "IDAT", zlibData.data(), zlibData.size());

  writeChunk(out, "IEND", nullptr, 0);
  return out;
}

bool writePNG(const std::string& path, const RasterImage& image) {
  std::vector<std::uint8_t> png = encodePNG(image);
  if (png.empty()) return false;

  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "writePNG: cannot open %s\n", path.c_str());
    return false;
  }
  std::size_t written = std::fwrite(png.data(), 1, png.size(), f);
  std::fclose(f);
  return written == png.size();
}

} // namespace sc
