#include "FrameOperations.h"

#include "core/Log.h"

#include <algorithm>
#include <utility>

namespace Lmx::FrameOps {

static std::unexpected<EditError> reject(EditErrorCode code, std::string msg) {
  Log::Warn("{}: {}", editErrorCodeName(code), msg);
  return std::unexpected(EditError{code, std::move(msg)});
}

// Shared gate for track-level calls. On success `out` points at the track.
static std::expected<void, EditError> gateTrack(const EditContext &ctx,
                                                LayerStack &stack,
                                                TrackId track,
                                                LayerTrack *&out) {
  if (auto r = checkEditTrack(ctx, track); !r)
    return r;
  if (stack.isRendering())
    return reject(EditErrorCode::RenderInProgress,
                  "cannot perform edits during rendering");

  out = stack.track(track);
  if (!out)
    return reject(EditErrorCode::TrackNotFound,
                  fmt::format("track {} does not exist", track));
  return {};
}

// Shared gate for frame content calls.
static std::expected<void, EditError> gateFrame(const EditContext &ctx,
                                                LayerStack &stack,
                                                TrackId track, FrameIndex frame,
                                                LayerTrack *&out) {
  if (auto r = checkEditTarget(ctx, track, frame); !r)
    return r;
  if (auto r = gateTrack(ctx, stack, track, out); !r)
    return r;
  if (out->locked)
    return reject(EditErrorCode::TrackLocked,
                  fmt::format("track '{}' is locked", out->name));
  return {};
}

static std::expected<LayerFrame *, EditError>
existingFrame(LayerTrack &t, FrameIndex frame) {
  LayerFrame *f = t.frames.find(frame);
  if (!f)
    return reject(EditErrorCode::FrameNotFound,
                  fmt::format("frame {} does not exist in track '{}'; create "
                              "it first",
                              frame, t.name));
  return f;
}

std::expected<void, EditError> createFrame(const EditContext &ctx,
                                           LayerStack &stack, TrackId track,
                                           FrameIndex frame,
                                           std::optional<PixelBuffer> initial) {
  LayerTrack *t = nullptr;
  if (auto r = gateFrame(ctx, stack, track, frame, t); !r)
    return r;

  if (t->frames.contains(frame))
    return reject(EditErrorCode::FrameAlreadyExists,
                  fmt::format("frame {} already exists in track '{}'", frame,
                              t->name));

  LayerFrame lf{};
  if (initial) {
    if (!hasExactSize(*initial, stack.size()))
      return reject(EditErrorCode::SizeMismatch,
                    fmt::format("initial pixels: {} given, expected {}",
                                initial->size(), stack.pixelCount()));
    lf.pixels = std::move(*initial);
  } else {
    lf.pixels = makeBlackBuffer(stack.size());
  }

  t->frames.insert(frame, std::move(lf));
  Log::Debug("created frame {} in track '{}'", frame, t->name);
  return {};
}

std::expected<void, EditError> deleteFrame(const EditContext &ctx,
                                           LayerStack &stack, TrackId track,
                                           FrameIndex frame) {
  LayerTrack *t = nullptr;
  if (auto r = gateFrame(ctx, stack, track, frame, t); !r)
    return r;
  if (!t->frames.erase(frame))
    return reject(EditErrorCode::FrameNotFound,
                  fmt::format("frame {} does not exist in track '{}'", frame,
                              t->name));
  Log::Debug("deleted frame {} in track '{}'", frame, t->name);
  return {};
}

std::expected<LayerFrame *, EditError> getFrameForEdit(const EditContext &ctx,
                                                       LayerStack &stack,
                                                       TrackId track,
                                                       FrameIndex frame) {
  LayerTrack *t = nullptr;
  if (auto r = gateFrame(ctx, stack, track, frame, t); !r)
    return std::unexpected(r.error());
  return existingFrame(*t, frame);
}

const LayerFrame *getFrameForRead(const LayerStack &stack, TrackId track,
                                  FrameIndex frame) {
  const LayerTrack *t = stack.track(track);
  if (!t)
    return nullptr;
  return t->frames.find(frame);
}

std::expected<void, EditError> setPixel(const EditContext &ctx,
                                        LayerStack &stack, TrackId track,
                                        FrameIndex frame, glm::ivec2 at,
                                        Pixel colour) {
  auto f = getFrameForEdit(ctx, stack, track, frame);
  if (!f)
    return std::unexpected(f.error());

  if (!stack.size().contains(at))
    return reject(EditErrorCode::OutOfRange,
                  fmt::format("pixel ({}, {}) outside {}x{}", at.x, at.y,
                              stack.size().width, stack.size().height));

  (*f)->pixels[stack.size().indexOf(at)] = colour;
  return {};
}

std::expected<void, EditError>
setFrameVisibility(const EditContext &ctx, LayerStack &stack, TrackId track,
                   FrameIndex frame, std::optional<bool> visible) {
  auto f = getFrameForEdit(ctx, stack, track, frame);
  if (!f)
    return std::unexpected(f.error());
  (*f)->visibleOverride = visible;
  return {};
}

std::expected<void, EditError>
setFrameOpacity(const EditContext &ctx, LayerStack &stack, TrackId track,
                FrameIndex frame, std::optional<double> opacity) {
  auto f = getFrameForEdit(ctx, stack, track, frame);
  if (!f)
    return std::unexpected(f.error());
  if (opacity)
    opacity = std::clamp(*opacity, 0.0, 1.0);
  (*f)->opacityOverride = opacity;
  return {};
}

std::expected<void, EditError> setAction(const EditContext &ctx,
                                         LayerStack &stack, TrackId track,
                                         std::optional<size_t> index,
                                         LayerAction action) {
  LayerTrack *t = nullptr;
  if (auto r = gateTrack(ctx, stack, track, t); !r)
    return r;

  if (action.end && *action.end < action.start)
    return reject(EditErrorCode::OutOfRange,
                  fmt::format("action window [{}, {}] is empty", action.start,
                              *action.end));

  if (!index) {
    t->automation.push_back(std::move(action));
    return {};
  }
  if (*index >= t->automation.size())
    return reject(EditErrorCode::OutOfRange,
                  fmt::format("action index {} out of range ({} actions)",
                              *index, t->automation.size()));
  t->automation[*index] = std::move(action);
  return {};
}

std::expected<void, EditError> removeAction(const EditContext &ctx,
                                            LayerStack &stack, TrackId track,
                                            size_t index) {
  LayerTrack *t = nullptr;
  if (auto r = gateTrack(ctx, stack, track, t); !r)
    return r;
  if (index >= t->automation.size())
    return reject(EditErrorCode::OutOfRange,
                  fmt::format("action index {} out of range ({} actions)",
                              index, t->automation.size()));
  t->automation.erase(t->automation.begin() + (ptrdiff_t)index);
  return {};
}

std::expected<void, EditError> reorderTrack(const EditContext &ctx,
                                            LayerStack &stack, TrackId track,
                                            int64_t zIndex) {
  LayerTrack *t = nullptr;
  if (auto r = gateTrack(ctx, stack, track, t); !r)
    return r;
  t->zIndex = zIndex;
  return {};
}

} // namespace Lmx::FrameOps
