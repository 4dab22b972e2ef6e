#pragma once

#include "layers/LayerStack.h"
#include "pixel/PixelGrid.h"

#include <expected>
#include <map>
#include <string>

namespace Lmx {

// A golden-master case: a document plus the bytes LMS
// produced for some of its frames.
struct ParityFixture final {
  std::string name;
  LayerStack stack;
  std::map<FrameIndex, PixelBuffer> expected;
};

// JSON fixture:
// {
//   "name": "scroll_no_wrap",
//   "width": 8, "height": 1,
//   "groups": [ { "id": 1, "name": "G", "visible": true, "opacity": 0.5 } ],
//   "tracks": [ {
//       "name": "A", "z": 0, "visible": true, "opacity": 1.0,
//       "locked": false, "group": 1,
//       "window": { "start": 0, "end": 20 },
//       "frames": { "0": { "pixels": "ff0000000000...", "visible": true,
//                          "opacity": 0.5 } },
//       "actions": [ { "type": "scroll", "start": 0, "end": 7,
//                      "params": { "direction": "right", "offset": 1 } } ]
//   } ],
//   "expect": { "0": "ff0000000000..." }
// }
// Instead of "tracks" a fixture may carry "legacy" (frame -> list of named
// layers, same keys as a track plus "pixels") and optionally "legacyGroups"
// (frame -> list of groups); those go through migrateLegacyLayers.
class ParityFixtureIO final {
public:
  static std::expected<ParityFixture, std::string>
  parse(const std::string &jsonText, const std::string &fallbackName = {});
  static std::expected<ParityFixture, std::string>
  load(const std::string &path);
};

} // namespace Lmx
