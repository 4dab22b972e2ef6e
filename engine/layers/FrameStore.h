#pragma once

#include "LayerFrame.h"
#include "LayerTypes.h"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace Lmx {

// Sparse per-index frame storage: frames live in a dense arena, an ordered
// index map points into it. Nothing here creates a frame implicitly.
class FrameStore final {
public:
  bool contains(FrameIndex f) const { return m_slots.count(f) != 0; }

  const LayerFrame *find(FrameIndex f) const;
  LayerFrame *find(FrameIndex f);

  // false if an entry already exists at f (existing entry untouched).
  bool insert(FrameIndex f, LayerFrame frame);
  bool erase(FrameIndex f);
  void clear();

  size_t size() const { return m_arena.size(); }
  bool empty() const { return m_arena.empty(); }

  // Ascending.
  std::vector<FrameIndex> indices() const;

  // Re-keys every entry. nullopt drops the entry; when two entries land on
  // the same key the one visited later (higher old index) wins.
  void remap(const std::function<std::optional<FrameIndex>(FrameIndex)> &fn);

  template <class Fn> void forEach(Fn &&fn) {
    for (const auto &[f, slot] : m_slots)
      fn(f, m_arena[slot]);
  }
  template <class Fn> void forEach(Fn &&fn) const {
    for (const auto &[f, slot] : m_slots)
      fn(f, static_cast<const LayerFrame &>(m_arena[slot]));
  }

private:
  std::vector<LayerFrame> m_arena;
  std::vector<FrameIndex> m_owner; // arena slot -> frame index
  std::map<FrameIndex, uint32_t> m_slots;
};

} // namespace Lmx
