#include "EditContext.h"

#include "core/Log.h"

namespace Lmx {

const char *editErrorCodeName(EditErrorCode c) {
  switch (c) {
  case EditErrorCode::IsolationViolation:
    return "IsolationViolation";
  case EditErrorCode::RenderInProgress:
    return "RenderInProgress";
  case EditErrorCode::FrameNotFound:
    return "FrameNotFound";
  case EditErrorCode::FrameAlreadyExists:
    return "FrameAlreadyExists";
  case EditErrorCode::TrackNotFound:
    return "TrackNotFound";
  case EditErrorCode::TrackLocked:
    return "TrackLocked";
  case EditErrorCode::SizeMismatch:
    return "SizeMismatch";
  case EditErrorCode::OutOfRange:
    return "OutOfRange";
  }
  return "Unknown";
}

std::expected<void, EditError> checkEditTarget(const EditContext &ctx,
                                               TrackId track,
                                               FrameIndex frame) {
  if (ctx.matches(track, frame))
    return {};

  std::string msg = fmt::format(
      "ISOLATION VIOLATION: target track {} frame {} but active is track {} "
      "frame {}",
      track, frame, ctx.activeTrack, ctx.activeFrame);
  Log::Warn("{}", msg);
  return std::unexpected(
      EditError{EditErrorCode::IsolationViolation, std::move(msg)});
}

std::expected<void, EditError> checkEditTrack(const EditContext &ctx,
                                              TrackId track) {
  if (ctx.activeTrack == track)
    return {};

  std::string msg =
      fmt::format("ISOLATION VIOLATION: target track {} but active is track {}",
                  track, ctx.activeTrack);
  Log::Warn("{}", msg);
  return std::unexpected(
      EditError{EditErrorCode::IsolationViolation, std::move(msg)});
}

} // namespace Lmx
