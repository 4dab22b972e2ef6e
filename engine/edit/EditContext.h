#pragma once

#include "EditError.h"
#include "layers/LayerTypes.h"

#include <expected>

namespace Lmx {

// The one (track, frame) an authoring caller is allowed to mutate.
// Passed explicitly into every authoring call; rendering never sees it.
struct EditContext final {
  TrackId activeTrack = InvalidTrack;
  FrameIndex activeFrame = 0;

  constexpr bool matches(TrackId t, FrameIndex f) const {
    return activeTrack == t && activeFrame == f;
  }
};

// IsolationViolation unless (track, frame) is the active pair.
std::expected<void, EditError> checkEditTarget(const EditContext &ctx,
                                               TrackId track, FrameIndex frame);

// Track-level operations only need the active track.
std::expected<void, EditError> checkEditTrack(const EditContext &ctx,
                                              TrackId track);

} // namespace Lmx
