#pragma once

#include "layers/LayerGroup.h"
#include "layers/LayerStack.h"
#include "layers/LayerTypes.h"
#include "pixel/PixelGrid.h"

#include <expected>
#include <map>
#include <string>
#include <vector>

namespace Lmx {

// One layer of the old per-frame model. Layers with the same name across
// frames become one track.
struct LegacyLayer final {
  std::string name{"Layer"};
  PixelBuffer pixels;
  bool visible = true;
  double opacity = 1.0;
  bool locked = false;
  GroupId group = InvalidGroup;
};

using LegacyFrameLayers = std::map<FrameIndex, std::vector<LegacyLayer>>;
using LegacyFrameGroups = std::map<FrameIndex, std::vector<LayerGroup>>;

// Bulk constructor for documents saved before tracks existed.
//  - tracks appear in order of first appearance (frames ascending, layers in
//    list order) with zIndex 0,1,2,...
//  - track defaults come from the first-seen layer of that name
//  - a frame gets an override only where it differs from those defaults
//    (opacity: by at least 0.001)
//  - groups keep their first-seen definition
// A name repeated within one frame keeps the last entry.
std::expected<LayerStack, std::string>
migrateLegacyLayers(MatrixSize size, const LegacyFrameLayers &layers,
                    const LegacyFrameGroups &groups = {});

} // namespace Lmx
