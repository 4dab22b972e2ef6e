#include "PixelGrid.h"

#include <utility>

#include <spdlog/fmt/fmt.h>

namespace Lmx {

PixelBuffer makeBlackBuffer(MatrixSize size) {
  return PixelBuffer(size.count(), Black);
}

PixelBuffer makeFilledBuffer(MatrixSize size, Pixel p) {
  return PixelBuffer(size.count(), p);
}

bool hasExactSize(const PixelBuffer &pixels, MatrixSize size) {
  return size.valid() && pixels.size() == size.count();
}

void repadBuffer(PixelBuffer &pixels, size_t count) {
  pixels.resize(count, Black);
}

std::vector<uint8_t> packRgb(const PixelBuffer &pixels) {
  std::vector<uint8_t> out;
  out.reserve(pixels.size() * 3);
  for (const Pixel &p : pixels) {
    out.push_back(p.r);
    out.push_back(p.g);
    out.push_back(p.b);
  }
  return out;
}

std::string toHex(const PixelBuffer &pixels) {
  std::string out;
  out.reserve(pixels.size() * 6);
  for (const Pixel &p : pixels)
    out += fmt::format("{:02x}{:02x}{:02x}", p.r, p.g, p.b);
  return out;
}

static int hexNibble(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F')
    return 10 + (c - 'A');
  return -1;
}

static bool hexByte(std::string_view s, size_t at, uint8_t &out) {
  const int hi = hexNibble(s[at]);
  const int lo = hexNibble(s[at + 1]);
  if (hi < 0 || lo < 0)
    return false;
  out = uint8_t((hi << 4) | lo);
  return true;
}

bool fromHex(std::string_view hex, PixelBuffer &out) {
  if (hex.size() % 6 != 0)
    return false;

  PixelBuffer px(hex.size() / 6);
  for (size_t i = 0; i < px.size(); ++i) {
    const size_t at = i * 6;
    if (!hexByte(hex, at, px[i].r) || !hexByte(hex, at + 2, px[i].g) ||
        !hexByte(hex, at + 4, px[i].b))
      return false;
  }
  out = std::move(px);
  return true;
}

} // namespace Lmx
