#pragma once

#include "FrameStore.h"
#include "LayerTypes.h"
#include "automation/LayerAction.h"

#include <cstdint>
#include <string>
#include <vector>

namespace Lmx {

// A named layer spanning the whole pattern timeline.
struct LayerTrack final {
  TrackId id = InvalidTrack;
  std::string name{"Layer"};

  // Lower = bottom. Ties keep insertion order.
  int64_t zIndex = 0;

  bool visible = true;
  double opacity = 1.0;
  bool locked = false;
  GroupId group = InvalidGroup;

  // Coarse activity bound; outside it the track contributes nothing.
  FrameWindow window{};

  FrameStore frames;

  // Evaluated by fixed priority, not by list order.
  std::vector<LayerAction> automation;

  bool isActiveAt(FrameIndex f) const { return window.contains(f); }

  // Frame override, else track default. Ignores groups.
  bool effectiveVisible(const LayerFrame &frame) const;
  // Clamped to [0,1]. Ignores groups.
  double effectiveOpacity(const LayerFrame &frame) const;
};

} // namespace Lmx
