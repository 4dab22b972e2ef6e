#pragma once

#include <cstdint>
#include <optional>

namespace Lmx {

// Frame index (integer timeline). Signed: windows may start before 0.
using FrameIndex = int64_t;

using TrackId = uint32_t;
inline constexpr TrackId InvalidTrack = 0;

using GroupId = uint32_t;
inline constexpr GroupId InvalidGroup = 0;

// Inclusive [start, end]; no end = unbounded upward.
struct FrameWindow final {
  FrameIndex start = 0;
  std::optional<FrameIndex> end;

  constexpr bool contains(FrameIndex f) const {
    if (f < start)
      return false;
    if (end && f > *end)
      return false;
    return true;
  }
};

} // namespace Lmx
