#include "ActionTransforms.h"

#include "core/Assert.h"

#include <algorithm>
#include <type_traits>

namespace Lmx::Transforms {

static Pixel scaled(Pixel p, double f) {
  return Pixel{(uint8_t)(p.r * f), (uint8_t)(p.g * f), (uint8_t)(p.b * f)};
}

void scroll(PixelBuffer &px, MatrixSize size, ScrollDirection dir,
            int64_t distance) {
  if (distance == 0)
    return;

  int64_t dx = 0;
  int64_t dy = 0;
  switch (dir) {
  case ScrollDirection::Right:
    dx = distance;
    break;
  case ScrollDirection::Left:
    dx = -distance;
    break;
  case ScrollDirection::Down:
    dy = distance;
    break;
  case ScrollDirection::Up:
    dy = -distance;
    break;
  }

  const int64_t w = size.width;
  const int64_t h = size.height;
  PixelBuffer out(px.size(), Black);
  for (int64_t y = 0; y < h; ++y) {
    for (int64_t x = 0; x < w; ++x) {
      const int64_t sx = x - dx;
      const int64_t sy = y - dy;
      if (sx < 0 || sy < 0 || sx >= w || sy >= h)
        continue;
      out[(size_t)(y * w + x)] = px[(size_t)(sy * w + sx)];
    }
  }
  px.swap(out);
}

void rotateQuarter(PixelBuffer &px, MatrixSize size, RotateMode mode) {
  const int32_t w = size.width;
  const int32_t h = size.height;
  PixelBuffer out(px.size(), Black);

  for (int32_t y = 0; y < h; ++y) {
    for (int32_t x = 0; x < w; ++x) {
      int32_t nx = 0;
      int32_t ny = 0;
      if (mode == RotateMode::Clockwise90) {
        nx = h - 1 - y;
        ny = x;
      } else {
        nx = y;
        ny = w - 1 - x;
      }
      const size_t dst = (size_t)ny * (size_t)w + (size_t)nx;
      if (dst < out.size())
        out[dst] = px[size.indexOf({x, y})];
    }
  }
  px.swap(out);
}

void mirror(PixelBuffer &px, MatrixSize size, MirrorAxis axis) {
  const int32_t w = size.width;
  const int32_t h = size.height;
  PixelBuffer out(px.size(), Black);

  for (int32_t y = 0; y < h; ++y) {
    for (int32_t x = 0; x < w; ++x) {
      const glm::ivec2 src = (axis == MirrorAxis::Horizontal)
                                 ? glm::ivec2{w - 1 - x, y}
                                 : glm::ivec2{x, h - 1 - y};
      out[size.indexOf({x, y})] = px[size.indexOf(src)];
    }
  }
  px.swap(out);
}

void invert(PixelBuffer &px) {
  for (Pixel &p : px) {
    p.r = uint8_t(255 - p.r);
    p.g = uint8_t(255 - p.g);
    p.b = uint8_t(255 - p.b);
  }
}

void colourCycle(PixelBuffer &px, ColourCycleMode mode) {
  for (Pixel &p : px) {
    const Pixel c = p;
    if (mode == ColourCycleMode::Rgb)
      p = Pixel{c.g, c.b, c.r};
    else
      p = Pixel{c.b, c.r, c.g};
  }
}

void wipe(PixelBuffer &px, MatrixSize size, WipeMode mode, int64_t position) {
  const bool horizontal =
      (mode == WipeMode::LeftToRight || mode == WipeMode::RightToLeft);
  const bool forward =
      (mode == WipeMode::LeftToRight || mode == WipeMode::TopToBottom);

  const int64_t length = horizontal ? size.width : size.height;
  const int64_t p = std::min(position, length);
  const double span = (double)std::max<int64_t>(1, length - p);

  for (int32_t y = 0; y < size.height; ++y) {
    for (int32_t x = 0; x < size.width; ++x) {
      const int64_t along = horizontal ? x : y;
      const int64_t t = forward ? along : (length - 1 - along);
      if (t < p)
        continue;

      const double fade = std::max(0.0, 1.0 - (double)(t - p) / span);
      Pixel &c = px[size.indexOf({x, y})];
      c = scaled(c, fade);
    }
  }
}

void reveal(PixelBuffer &px, MatrixSize size, RevealEdge edge,
            int64_t position) {
  for (int32_t y = 0; y < size.height; ++y) {
    for (int32_t x = 0; x < size.width; ++x) {
      bool keep = false;
      switch (edge) {
      case RevealEdge::Left:
        keep = x < std::min<int64_t>(position, size.width);
        break;
      case RevealEdge::Right:
        keep = x >= size.width - std::min<int64_t>(position, size.width);
        break;
      case RevealEdge::Top:
        keep = y < std::min<int64_t>(position, size.height);
        break;
      case RevealEdge::Bottom:
        keep = y >= size.height - std::min<int64_t>(position, size.height);
        break;
      }
      if (!keep)
        px[size.indexOf({x, y})] = Black;
    }
  }
}

// step * offset, saturated at +-limit. Anything past the matrix extent
// renders the same, and huge steps must not overflow.
static int64_t travel(int64_t step, int32_t offset, int64_t limit) {
  const int64_t per = std::max<int32_t>(1, offset);
  if (step >= 0)
    return step > limit / per ? limit : std::min(step * per, limit);
  return step < -(limit / per) ? -limit : std::max(step * per, -limit);
}

void apply(PixelBuffer &px, MatrixSize size, const LayerAction &action,
           int64_t step) {
  LMX_ASSERT(hasExactSize(px, size), "transform buffer size mismatch");
  const int64_t extent = std::max<int64_t>(size.width, size.height);

  std::visit(
      [&](const auto &p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ScrollParams>) {
          scroll(px, size, p.direction, travel(step, p.offset, extent));
        } else if constexpr (std::is_same_v<T, RotateParams>) {
          const int64_t turns = step % 4;
          for (int64_t i = 0; i < turns; ++i)
            rotateQuarter(px, size, p.mode);
        } else if constexpr (std::is_same_v<T, MirrorParams>) {
          mirror(px, size, p.axis);
        } else if constexpr (std::is_same_v<T, BounceParams>) {
          if (step % 2 == 1)
            mirror(px, size, p.axis);
        } else if constexpr (std::is_same_v<T, WipeParams>) {
          wipe(px, size, p.mode, travel(step, p.offset, extent));
        } else if constexpr (std::is_same_v<T, RevealParams>) {
          reveal(px, size, p.edge, travel(step, p.offset, extent));
        } else if constexpr (std::is_same_v<T, ColourCycleParams>) {
          colourCycle(px, p.mode);
        } else {
          invert(px);
        }
      },
      action.params);
}

} // namespace Lmx::Transforms
