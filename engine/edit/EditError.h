#pragma once

#include <cstdint>
#include <string>

namespace Lmx {

enum class EditErrorCode : uint8_t {
  IsolationViolation, // target is not the active (track, frame)
  RenderInProgress,
  FrameNotFound,
  FrameAlreadyExists,
  TrackNotFound,
  TrackLocked,
  SizeMismatch, // pixel count != width * height
  OutOfRange,
};

struct EditError final {
  EditErrorCode code = EditErrorCode::OutOfRange;
  std::string message;
};

const char *editErrorCodeName(EditErrorCode c);

} // namespace Lmx
