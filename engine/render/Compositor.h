#pragma once

#include "layers/LayerGroup.h"
#include "layers/LayerStack.h"
#include "layers/LayerTrack.h"
#include "pixel/PixelGrid.h"

#include <vector>

namespace Lmx {

// Final multi-layer render: tracks bottom to top, last non-black pixel wins.
// Pure: same inputs, same bytes, in any call order.
class Compositor final {
public:
  // `tracks` in insertion order; sorted here by (zIndex, insertion order).
  // `groups` resolves LayerTrack::group (may be empty).
  static PixelBuffer render(const std::vector<LayerTrack> &tracks,
                            const std::vector<LayerGroup> &groups,
                            FrameIndex frame, MatrixSize size);

  // Same, over a stack. Holds a LayerStack::RenderScope for the duration.
  static PixelBuffer render(const LayerStack &stack, FrameIndex frame);

  // Inclusive range, one buffer per frame.
  static std::vector<PixelBuffer> renderRange(const LayerStack &stack,
                                              FrameIndex first,
                                              FrameIndex last);

  // Non-black pixels of `top` replace `dst`; black is transparent.
  static void overwriteNonBlack(PixelBuffer &dst, const PixelBuffer &top);
};

} // namespace Lmx
