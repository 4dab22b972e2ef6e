#pragma once

#include "LayerTypes.h"

#include <string>

namespace Lmx {

// Collective gate for a set of tracks. Hidden group hides members; opacity
// multiplies into each member's effective opacity.
struct LayerGroup final {
  GroupId id = InvalidGroup;
  std::string name{"Group"};
  bool visible = true;
  double opacity = 1.0;
};

} // namespace Lmx
