#pragma once

#include "Pixel.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

namespace Lmx {

// Matrix dimensions + row-major index mapping.
struct MatrixSize final {
  int32_t width = 0;
  int32_t height = 0;

  constexpr bool operator==(const MatrixSize &o) const = default;

  constexpr bool valid() const { return width > 0 && height > 0; }
  constexpr size_t count() const {
    return valid() ? size_t(width) * size_t(height) : 0;
  }

  bool contains(glm::ivec2 p) const {
    return p.x >= 0 && p.y >= 0 && p.x < width && p.y < height;
  }
  size_t indexOf(glm::ivec2 p) const {
    return size_t(p.y) * size_t(width) + size_t(p.x);
  }
  glm::ivec2 coordOf(size_t index) const {
    return {int32_t(index % size_t(width)), int32_t(index / size_t(width))};
  }
};

PixelBuffer makeBlackBuffer(MatrixSize size);
PixelBuffer makeFilledBuffer(MatrixSize size, Pixel p);

bool hasExactSize(const PixelBuffer &pixels, MatrixSize size);

// Truncates or pads with black in flat row-major order.
void repadBuffer(PixelBuffer &pixels, size_t count);

// R,G,B,R,G,B,... for device byte streams.
std::vector<uint8_t> packRgb(const PixelBuffer &pixels);

// "RRGGBB" per pixel, lowercase, concatenated.
std::string toHex(const PixelBuffer &pixels);
// Accepts upper/lowercase; rejects lengths that are not a multiple of 6.
bool fromHex(std::string_view hex, PixelBuffer &out);

} // namespace Lmx
