#include "LayerStack.h"

#include "core/Log.h"

#include <algorithm>

namespace Lmx {

static EditError badCount(const char *op, int64_t count) {
  return EditError{EditErrorCode::OutOfRange,
                   fmt::format("{}: count must be >= 1 (got {})", op, count)};
}

std::expected<void, EditError> LayerStack::framesInserted(FrameIndex index,
                                                          int64_t count) {
  if (auto r = rejectIfRendering("framesInserted"); !r)
    return r;
  if (count < 1)
    return std::unexpected(badCount("framesInserted", count));

  for (auto &t : m_tracks) {
    t.frames.remap([&](FrameIndex f) -> std::optional<FrameIndex> {
      return f >= index ? f + count : f;
    });

    for (auto &a : t.automation) {
      if (a.start >= index)
        a.start += count;
      if (a.end && *a.end >= index)
        *a.end += count;
    }

    if (t.window.start >= index)
      t.window.start += count;
    if (t.window.end && *t.window.end >= index)
      *t.window.end += count;
  }

  Log::Debug("framesInserted at {} (+{})", index, count);
  return {};
}

std::expected<void, EditError> LayerStack::framesDeleted(FrameIndex index,
                                                         int64_t count) {
  if (auto r = rejectIfRendering("framesDeleted"); !r)
    return r;
  if (count < 1)
    return std::unexpected(badCount("framesDeleted", count));

  const FrameIndex after = index + count;

  for (auto &t : m_tracks) {
    t.frames.remap([&](FrameIndex f) -> std::optional<FrameIndex> {
      if (f < index)
        return f;
      if (f >= after)
        return f - count;
      return std::nullopt;
    });

    for (auto &a : t.automation) {
      if (a.start >= after)
        a.start -= count;
      if (a.end) {
        if (*a.end >= after)
          *a.end -= count;
        else if (*a.end >= index)
          *a.end = std::max(a.start, index - 1);
      }
    }

    if (t.window.start >= after)
      t.window.start -= count;
    if (t.window.end && *t.window.end >= after)
      *t.window.end -= count;
  }

  Log::Debug("framesDeleted at {} (-{})", index, count);
  return {};
}

std::expected<void, EditError> LayerStack::frameDuplicated(FrameIndex src,
                                                           FrameIndex dest) {
  if (auto r = framesInserted(dest, 1); !r)
    return r;

  const FrameIndex shiftedSrc = (src < dest) ? src : src + 1;
  for (auto &t : m_tracks) {
    const LayerFrame *from = t.frames.find(shiftedSrc);
    if (!from)
      continue;
    LayerFrame copy = *from;
    t.frames.insert(dest, std::move(copy));
  }
  return {};
}

std::expected<void, EditError> LayerStack::frameMoved(FrameIndex src,
                                                      FrameIndex dest) {
  if (auto r = rejectIfRendering("frameMoved"); !r)
    return r;
  if (src == dest)
    return {};

  for (auto &t : m_tracks) {
    t.frames.remap([&](FrameIndex f) -> std::optional<FrameIndex> {
      if (f == src)
        return dest;
      if (src < dest && f > src && f <= dest)
        return f - 1;
      if (dest < src && f >= dest && f < src)
        return f + 1;
      return f;
    });
  }
  return {};
}

} // namespace Lmx
