#pragma once

#include "EditContext.h"
#include "EditError.h"
#include "layers/LayerStack.h"

#include <cstddef>
#include <expected>
#include <optional>

#include <glm/glm.hpp>

namespace Lmx::FrameOps {

// Authoring API. Every mutating call:
//  - must target the active (track, frame) of `ctx` (track-level calls: the
//    active track), else IsolationViolation
//  - fails with RenderInProgress while the stack is being rendered
//  - never creates a frame other than through createFrame
// A rejected call leaves the stack untouched.

// Frame content calls also reject locked tracks.
std::expected<void, EditError>
createFrame(const EditContext &ctx, LayerStack &stack, TrackId track,
            FrameIndex frame,
            std::optional<PixelBuffer> initial = std::nullopt);

std::expected<void, EditError> deleteFrame(const EditContext &ctx,
                                           LayerStack &stack, TrackId track,
                                           FrameIndex frame);

// FrameNotFound if the frame was never created. The returned pointer is valid
// until the stack's tracks or that track's frames change.
std::expected<LayerFrame *, EditError>
getFrameForEdit(const EditContext &ctx, LayerStack &stack, TrackId track,
                FrameIndex frame);

// Read-only, ungated, never creates. nullptr if absent.
const LayerFrame *getFrameForRead(const LayerStack &stack, TrackId track,
                                  FrameIndex frame);

std::expected<void, EditError> setPixel(const EditContext &ctx,
                                        LayerStack &stack, TrackId track,
                                        FrameIndex frame, glm::ivec2 at,
                                        Pixel colour);

// nullopt clears the override (inherit track default).
std::expected<void, EditError>
setFrameVisibility(const EditContext &ctx, LayerStack &stack, TrackId track,
                   FrameIndex frame, std::optional<bool> visible);
std::expected<void, EditError>
setFrameOpacity(const EditContext &ctx, LayerStack &stack, TrackId track,
                FrameIndex frame, std::optional<double> opacity);

// index == nullopt appends; otherwise replaces automation[index].
std::expected<void, EditError>
setAction(const EditContext &ctx, LayerStack &stack, TrackId track,
          std::optional<size_t> index, LayerAction action);

std::expected<void, EditError> removeAction(const EditContext &ctx,
                                            LayerStack &stack, TrackId track,
                                            size_t index);

std::expected<void, EditError> reorderTrack(const EditContext &ctx,
                                            LayerStack &stack, TrackId track,
                                            int64_t zIndex);

} // namespace Lmx::FrameOps
