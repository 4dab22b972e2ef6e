#include "LayerTrack.h"

#include <algorithm>

namespace Lmx {

bool LayerTrack::effectiveVisible(const LayerFrame &frame) const {
  return frame.visibleOverride.value_or(visible);
}

double LayerTrack::effectiveOpacity(const LayerFrame &frame) const {
  return std::clamp(frame.opacityOverride.value_or(opacity), 0.0, 1.0);
}

} // namespace Lmx
