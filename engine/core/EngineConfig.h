#pragma once

#include "Log.h"

#include <expected>
#include <string>

namespace Lmx {

struct ParityConfig final {
  bool stopOnFirstFailure = false;
  int maxReportedMismatches = 16;
};

// Tool-level settings. Rendering itself takes no configuration.
struct EngineConfig final {
  LogConfig log{};
  ParityConfig parity{};
};

// JSON config:
// {
//   "log":    { "level": "debug", "file": "out/lmx.log", "console": true },
//   "parity": { "stopOnFirstFailure": false, "maxReportedMismatches": 16 }
// }
class EngineConfigIO final {
public:
  static std::expected<EngineConfig, std::string>
  parse(const std::string &jsonText);
  static std::expected<EngineConfig, std::string> load(const std::string &path);
};

} // namespace Lmx
