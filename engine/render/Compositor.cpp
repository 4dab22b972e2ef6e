#include "Compositor.h"

#include "automation/AutomationPipeline.h"
#include "core/Assert.h"

#include <algorithm>

namespace Lmx {

static const LayerGroup *findGroup(const std::vector<LayerGroup> &groups,
                                   GroupId id) {
  if (id == InvalidGroup)
    return nullptr;
  for (const auto &g : groups) {
    if (g.id == id)
      return &g;
  }
  return nullptr;
}

void Compositor::overwriteNonBlack(PixelBuffer &dst, const PixelBuffer &top) {
  const size_t n = std::min(dst.size(), top.size());
  for (size_t i = 0; i < n; ++i) {
    if (!top[i].isBlack())
      dst[i] = top[i];
  }
}

PixelBuffer Compositor::render(const std::vector<LayerTrack> &tracks,
                               const std::vector<LayerGroup> &groups,
                               FrameIndex frame, MatrixSize size) {
  LMX_ASSERT(size.valid(), "render needs a positive size, got {}x{}",
             size.width, size.height);

  std::vector<const LayerTrack *> order;
  order.reserve(tracks.size());
  for (const auto &t : tracks)
    order.push_back(&t);
  std::stable_sort(order.begin(), order.end(),
                   [](const LayerTrack *a, const LayerTrack *b) {
                     return a->zIndex < b->zIndex;
                   });

  PixelBuffer out = makeBlackBuffer(size);
  for (const LayerTrack *t : order) {
    const std::optional<PixelBuffer> px = AutomationPipeline::evaluateTrack(
        *t, frame, size, findGroup(groups, t->group));
    if (!px)
      continue;
    overwriteNonBlack(out, *px);
  }
  return out;
}

PixelBuffer Compositor::render(const LayerStack &stack, FrameIndex frame) {
  LayerStack::RenderScope scope(stack);
  return render(stack.tracks(), stack.groups(), frame, stack.size());
}

std::vector<PixelBuffer> Compositor::renderRange(const LayerStack &stack,
                                                 FrameIndex first,
                                                 FrameIndex last) {
  std::vector<PixelBuffer> out;
  if (last < first)
    return out;

  LayerStack::RenderScope scope(stack);
  out.reserve((size_t)(last - first + 1));
  for (FrameIndex f = first; f <= last; ++f)
    out.push_back(render(stack.tracks(), stack.groups(), f, stack.size()));
  return out;
}

} // namespace Lmx
