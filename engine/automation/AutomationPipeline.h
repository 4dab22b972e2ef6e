#pragma once

#include "layers/LayerGroup.h"
#include "layers/LayerTrack.h"
#include "pixel/PixelGrid.h"

#include <optional>
#include <vector>

namespace Lmx {

// Per-track, per-frame evaluation: base pixels -> priority-ordered actions ->
// brightness scaling. Reads only the track's own stored frame for `frame`.
class AutomationPipeline final {
public:
  // nullopt when the track contributes nothing at `frame` (no stored frame,
  // outside window, hidden by override/track/group).
  // `group` is the track's owning group, or nullptr.
  static std::optional<PixelBuffer> evaluateTrack(const LayerTrack &track,
                                                  FrameIndex frame,
                                                  MatrixSize size,
                                                  const LayerGroup *group);

  // Runs the track's active actions over `px` in priority order.
  static void applyAutomation(const LayerTrack &track, FrameIndex frame,
                              MatrixSize size, PixelBuffer &px);

  // Stable by priority; ties keep list order.
  static std::vector<const LayerAction *>
  sortedActions(const std::vector<LayerAction> &actions);

  // trunc(c * opacity) per channel. Identity at opacity >= 1.
  static void applyOpacity(PixelBuffer &px, double opacity);
};

} // namespace Lmx
