#pragma once

#include <cstdint>
#include <vector>

namespace Lmx {

// 8-bit RGB. No alpha: black doubles as "transparent" during compositing.
struct Pixel final {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;

  constexpr bool operator==(const Pixel &o) const = default;

  constexpr bool isBlack() const { return r == 0 && g == 0 && b == 0; }
};

inline constexpr Pixel Black{0, 0, 0};
inline constexpr Pixel White{255, 255, 255};

// Row-major, width * height entries.
using PixelBuffer = std::vector<Pixel>;

} // namespace Lmx
