#pragma once
#include "sg/surface/RasterSurface.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sg {

// Encode 8-bit RGBA rows (top-down) as a PNG with alpha. Uses stored
// deflate blocks, so no zlib/libpng dependency.
std::vector<std::uint8_t> encodePNG(const std::uint8_t* rgba, int width, int height);

// Encode as binary PPM (P6). Alpha is flattened over `background`.
std::vector<std::uint8_t> encodePPM(const std::uint8_t* rgba, int width, int height,
                                    const Color& background = Color::white());

bool writePNG(const std::string& path, const RasterSurface& surface);
bool writePPM(const std::string& path, const RasterSurface& surface,
              const Color& background = Color::white());

} // namespace sg
