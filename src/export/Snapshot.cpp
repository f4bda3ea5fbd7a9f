#include "sg/export/Snapshot.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace sg {

namespace {

struct Crc32Table {
  std::uint32_t v[256];
  Crc32Table() {
    for (std::uint32_t n = 0; n < 256; n++) {
      std::uint32_t c = n;
      for (int k = 0; k < 8; k++) c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
      v[n] = c;
    }
  }
};

std::uint32_t crc32(const std::uint8_t* data, std::size_t len, std::uint32_t c = 0xFFFFFFFFu) {
  static const Crc32Table table;
  for (std::size_t i = 0; i < len; i++) c = table.v[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return c;
}

std::uint32_t adler32(const std::vector<std::uint8_t>& data) {
  constexpr std::uint32_t kMod = 65521u;
  std::uint32_t a = 1, b = 0;
  for (std::uint8_t byte : data) {
    a = (a + byte) % kMod;
    b = (b + a) % kMod;
  }
  return (b << 16) | a;
}

void putBE32(std::vector<std::uint8_t>& out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 24));
  out.push_back(static_cast<std::uint8_t>(v >> 16));
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v));
}

void putChunk(std::vector<std::uint8_t>& out, const char* type,
              const std::vector<std::uint8_t>& body) {
  putBE32(out, static_cast<std::uint32_t>(body.size()));
  std::size_t typeAt = out.size();
  out.insert(out.end(), type, type + 4);
  out.insert(out.end(), body.begin(), body.end());
  std::uint32_t c = crc32(&out[typeAt], 4 + body.size()) ^ 0xFFFFFFFFu;
  putBE32(out, c);
}

// zlib stream made of stored (uncompressed) deflate blocks.
std::vector<std::uint8_t> storedZlib(const std::vector<std::uint8_t>& raw) {
  constexpr std::size_t kMaxBlock = 65535;
  std::vector<std::uint8_t> z;
  z.reserve(raw.size() + raw.size() / kMaxBlock * 5 + 16);
  z.push_back(0x78);
  z.push_back(0x01);

  std::size_t pos = 0;
  do {
    std::size_t n = std::min(kMaxBlock, raw.size() - pos);
    bool last = pos + n == raw.size();
    z.push_back(last ? 1 : 0);
    auto len = static_cast<std::uint16_t>(n);
    auto nlen = static_cast<std::uint16_t>(~len);
    z.push_back(static_cast<std::uint8_t>(len & 0xFF));
    z.push_back(static_cast<std::uint8_t>(len >> 8));
    z.push_back(static_cast<std::uint8_t>(nlen & 0xFF));
    z.push_back(static_cast<std::uint8_t>(nlen >> 8));
    z.insert(z.end(), raw.begin() + static_cast<std::ptrdiff_t>(pos),
             raw.begin() + static_cast<std::ptrdiff_t>(pos + n));
    pos += n;
  } while (pos < raw.size());

  putBE32(z, adler32(raw));
  return z;
}

bool writeBytes(const std::string& path, const std::vector<std::uint8_t>& bytes) {
  if (bytes.empty()) return false;
  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "Snapshot: cannot open %s for writing\n", path.c_str());
    return false;
  }
  std::size_t written = std::fwrite(bytes.data(), 1, bytes.size(), f);
  std::fclose(f);
  return written == bytes.size();
}

} // namespace

std::vector<std::uint8_t> encodePNG(const std::uint8_t* rgba, int width, int height) {
  std::vector<std::uint8_t> out;
  if (!rgba || width <= 0 || height <= 0) return out;

  const std::uint8_t sig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
  out.insert(out.end(), sig, sig + 8);

  std::vector<std::uint8_t> ihdr;
  putBE32(ihdr, static_cast<std::uint32_t>(width));
  putBE32(ihdr, static_cast<std::uint32_t>(height));
  ihdr.push_back(8); // bit depth
  ihdr.push_back(6); // RGBA
  ihdr.push_back(0);
  ihdr.push_back(0);
  ihdr.push_back(0);
  putChunk(out, "IHDR", ihdr);

  const std::size_t stride = static_cast<std::size_t>(width) * 4;
  std::vector<std::uint8_t> raw;
  raw.reserve((stride + 1) * static_cast<std::size_t>(height));
  for (int y = 0; y < height; y++) {
    raw.push_back(0); // filter: none
    const std::uint8_t* row = rgba + static_cast<std::size_t>(y) * stride;
    raw.insert(raw.end(), row, row + stride);
  }
  putChunk(out, "IDAT", storedZlib(raw));
  putChunk(out, "IEND", {});
  return out;
}

std::vector<std::uint8_t> encodePPM(const std::uint8_t* rgba, int width, int height,
                                    const Color& background) {
  std::vector<std::uint8_t> out;
  if (!rgba || width <= 0 || height <= 0) return out;

  char header[64];
  int n = std::snprintf(header, sizeof(header), "P6\n%d %d\n255\n", width, height);
  out.insert(out.end(), header, header + n);

  const float bg[3] = {background.r, background.g, background.b};
  const std::size_t count = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
  for (std::size_t i = 0; i < count; i++) {
    float a = rgba[i * 4 + 3] / 255.0f;
    for (int ch = 0; ch < 3; ch++) {
      float v = rgba[i * 4 + ch] / 255.0f * a + bg[ch] * (1.0f - a);
      out.push_back(static_cast<std::uint8_t>(std::lround(std::min(std::max(v, 0.0f), 1.0f) * 255.0f)));
    }
  }
  return out;
}

bool writePNG(const std::string& path, const RasterSurface& surface) {
  std::vector<std::uint8_t> px = surface.toRGBA8();
  return writeBytes(path, encodePNG(px.data(), surface.width(), surface.height()));
}

bool writePPM(const std::string& path, const RasterSurface& surface, const Color& background) {
  std::vector<std::uint8_t> px = surface.toRGBA8();
  return writeBytes(path, encodePPM(px.data(), surface.width(), surface.height(), background));
}

} // namespace sg
