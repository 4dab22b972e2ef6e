#pragma once

#include "pixel/Pixel.h"

#include <optional>

namespace Lmx {

// Stored content of one track at one frame index.
struct LayerFrame final {
  PixelBuffer pixels;

  // nullopt = inherit from track
  std::optional<bool> visibleOverride;
  std::optional<double> opacityOverride;
};

} // namespace Lmx
