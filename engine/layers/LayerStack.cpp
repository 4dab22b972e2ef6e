#include "LayerStack.h"

#include "core/Assert.h"
#include "core/Log.h"

#include <algorithm>

namespace Lmx {

LayerStack::LayerStack(MatrixSize size) : m_size(size) {
  LMX_ASSERT(size.valid(), "LayerStack needs positive width and height");
}

std::expected<void, EditError>
LayerStack::rejectIfRendering(const char *op) const {
  if (!isRendering())
    return {};
  Log::Warn("{} rejected: render in progress", op);
  return std::unexpected(EditError{EditErrorCode::RenderInProgress,
                                   std::string(op) +
                                       ": cannot edit during rendering"});
}

TrackId LayerStack::addTrack(std::string name) {
  if (!rejectIfRendering("addTrack"))
    return InvalidTrack;

  int64_t z = 0;
  for (const auto &t : m_tracks)
    z = std::max(z, t.zIndex + 1);

  LayerTrack t{};
  t.id = m_nextTrack++;
  t.name = std::move(name);
  t.zIndex = z;
  m_tracks.push_back(std::move(t));
  return m_tracks.back().id;
}

std::expected<TrackId, EditError> LayerStack::adoptTrack(LayerTrack track) {
  if (auto r = rejectIfRendering("adoptTrack"); !r)
    return std::unexpected(r.error());

  std::expected<void, EditError> bad{};
  track.frames.forEach([&](FrameIndex f, const LayerFrame &frame) {
    if (bad && !hasExactSize(frame.pixels, m_size)) {
      bad = std::unexpected(EditError{
          EditErrorCode::SizeMismatch,
          fmt::format("track '{}' frame {}: {} pixels, expected {}",
                      track.name, f, frame.pixels.size(), m_size.count())});
    }
  });
  if (!bad)
    return std::unexpected(bad.error());

  track.id = m_nextTrack++;
  m_tracks.push_back(std::move(track));
  return m_tracks.back().id;
}

bool LayerStack::removeTrack(TrackId id) {
  if (!rejectIfRendering("removeTrack"))
    return false;
  auto it = std::find_if(m_tracks.begin(), m_tracks.end(),
                         [&](const LayerTrack &t) { return t.id == id; });
  if (it == m_tracks.end())
    return false;
  m_tracks.erase(it);
  return true;
}

LayerTrack *LayerStack::track(TrackId id) {
  for (auto &t : m_tracks) {
    if (t.id == id)
      return &t;
  }
  return nullptr;
}

const LayerTrack *LayerStack::track(TrackId id) const {
  for (const auto &t : m_tracks) {
    if (t.id == id)
      return &t;
  }
  return nullptr;
}

std::vector<const LayerTrack *> LayerStack::renderOrder() const {
  std::vector<const LayerTrack *> out;
  out.reserve(m_tracks.size());
  for (const auto &t : m_tracks)
    out.push_back(&t);

  // m_tracks is in insertion order, so a stable sort keeps ties ordered.
  std::stable_sort(out.begin(), out.end(),
                   [](const LayerTrack *a, const LayerTrack *b) {
                     return a->zIndex < b->zIndex;
                   });
  return out;
}

bool LayerStack::moveTrack(TrackId id, size_t position) {
  if (!rejectIfRendering("moveTrack"))
    return false;

  std::vector<const LayerTrack *> order = renderOrder();
  auto it = std::find_if(order.begin(), order.end(),
                         [&](const LayerTrack *t) { return t->id == id; });
  if (it == order.end() || position >= order.size())
    return false;

  const LayerTrack *moving = *it;
  order.erase(it);
  order.insert(order.begin() + (ptrdiff_t)position, moving);

  for (size_t i = 0; i < order.size(); ++i)
    track(order[i]->id)->zIndex = (int64_t)i;
  return true;
}

GroupId LayerStack::addGroup(LayerGroup g) {
  if (!rejectIfRendering("addGroup"))
    return InvalidGroup;
  if (g.id == InvalidGroup || group(g.id))
    g.id = m_nextGroup;
  m_nextGroup = std::max(m_nextGroup, g.id + 1u);
  m_groups.push_back(std::move(g));
  return m_groups.back().id;
}

bool LayerStack::removeGroup(GroupId id) {
  if (!rejectIfRendering("removeGroup"))
    return false;
  auto it = std::find_if(m_groups.begin(), m_groups.end(),
                         [&](const LayerGroup &g) { return g.id == id; });
  if (it == m_groups.end())
    return false;
  m_groups.erase(it);

  for (auto &t : m_tracks) {
    if (t.group == id)
      t.group = InvalidGroup;
  }
  return true;
}

LayerGroup *LayerStack::group(GroupId id) {
  if (id == InvalidGroup)
    return nullptr;
  for (auto &g : m_groups) {
    if (g.id == id)
      return &g;
  }
  return nullptr;
}

const LayerGroup *LayerStack::group(GroupId id) const {
  if (id == InvalidGroup)
    return nullptr;
  for (const auto &g : m_groups) {
    if (g.id == id)
      return &g;
  }
  return nullptr;
}

std::expected<void, EditError> LayerStack::resize(MatrixSize size) {
  if (auto r = rejectIfRendering("resize"); !r)
    return r;
  if (!size.valid()) {
    return std::unexpected(
        EditError{EditErrorCode::OutOfRange,
                  fmt::format("resize: invalid matrix {}x{}", size.width,
                              size.height)});
  }

  const size_t count = size.count();
  size_t touched = 0;
  for (auto &t : m_tracks) {
    t.frames.forEach([&](FrameIndex, LayerFrame &frame) {
      repadBuffer(frame.pixels, count);
      ++touched;
    });
  }

  Log::Info("resize {}x{} -> {}x{} ({} frames re-padded)", m_size.width,
            m_size.height, size.width, size.height, touched);
  m_size = size;
  return {};
}

LayerStack::RenderScope::RenderScope(const LayerStack &stack)
    : m_stack(stack) {
  ++m_stack.m_renderDepth;
}

LayerStack::RenderScope::~RenderScope() { --m_stack.m_renderDepth; }

} // namespace Lmx
