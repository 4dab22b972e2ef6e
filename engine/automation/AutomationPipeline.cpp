#include "AutomationPipeline.h"

#include "ActionTransforms.h"
#include "core/Assert.h"

#include <algorithm>

namespace Lmx {

std::vector<const LayerAction *>
AutomationPipeline::sortedActions(const std::vector<LayerAction> &actions) {
  std::vector<const LayerAction *> out;
  out.reserve(actions.size());
  for (const auto &a : actions)
    out.push_back(&a);

  std::stable_sort(out.begin(), out.end(),
                   [](const LayerAction *a, const LayerAction *b) {
                     return a->priority() < b->priority();
                   });
  return out;
}

void AutomationPipeline::applyAutomation(const LayerTrack &track,
                                         FrameIndex frame, MatrixSize size,
                                         PixelBuffer &px) {
  for (const LayerAction *a : sortedActions(track.automation)) {
    const std::optional<int64_t> step = actionStep(*a, frame);
    if (!step)
      continue;
    Transforms::apply(px, size, *a, *step);
  }
}

void AutomationPipeline::applyOpacity(PixelBuffer &px, double opacity) {
  if (opacity >= 1.0)
    return;

  const double o = std::max(0.0, opacity);
  for (Pixel &p : px) {
    p.r = (uint8_t)((double)p.r * o);
    p.g = (uint8_t)((double)p.g * o);
    p.b = (uint8_t)((double)p.b * o);
  }
}

std::optional<PixelBuffer>
AutomationPipeline::evaluateTrack(const LayerTrack &track, FrameIndex frame,
                                  MatrixSize size, const LayerGroup *group) {
  if (!track.isActiveAt(frame))
    return std::nullopt;

  const LayerFrame *base = track.frames.find(frame);
  if (!base)
    return std::nullopt;

  if (!track.effectiveVisible(*base))
    return std::nullopt;
  if (group && !group->visible)
    return std::nullopt;

  LMX_ASSERT(hasExactSize(base->pixels, size),
             "track '{}' frame {}: {} pixels stored, matrix has {}", track.name,
             frame, base->pixels.size(), size.count());

  // Always restart from this frame's stored pixels.
  PixelBuffer px = base->pixels;
  applyAutomation(track, frame, size, px);

  double opacity = track.effectiveOpacity(*base);
  if (group)
    opacity *= std::clamp(group->opacity, 0.0, 1.0);
  applyOpacity(px, opacity);

  return px;
}

} // namespace Lmx
