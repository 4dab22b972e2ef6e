#pragma once

#include "ParityFixture.h"
#include "core/EngineConfig.h"

#include <cstddef>
#include <string>
#include <vector>

namespace Lmx {

struct FrameMismatch final {
  FrameIndex frame = 0;
  size_t differing = 0;
  // First ParityConfig::maxReportedMismatches differing pixel indices.
  std::vector<size_t> pixels;
};

struct ParityReport final {
  std::string fixture;
  size_t framesChecked = 0;
  std::vector<FrameMismatch> mismatches;

  bool passed() const { return mismatches.empty(); }
};

// Renders every expected frame of the fixture and compares byte for byte.
ParityReport verifyFixture(const ParityFixture &fixture,
                           const ParityConfig &cfg = {});

} // namespace Lmx
