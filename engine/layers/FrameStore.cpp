#include "FrameStore.h"

#include <utility>

namespace Lmx {

const LayerFrame *FrameStore::find(FrameIndex f) const {
  auto it = m_slots.find(f);
  if (it == m_slots.end())
    return nullptr;
  return &m_arena[it->second];
}

LayerFrame *FrameStore::find(FrameIndex f) {
  auto it = m_slots.find(f);
  if (it == m_slots.end())
    return nullptr;
  return &m_arena[it->second];
}

bool FrameStore::insert(FrameIndex f, LayerFrame frame) {
  if (m_slots.count(f))
    return false;

  m_slots.emplace(f, (uint32_t)m_arena.size());
  m_arena.push_back(std::move(frame));
  m_owner.push_back(f);
  return true;
}

bool FrameStore::erase(FrameIndex f) {
  auto it = m_slots.find(f);
  if (it == m_slots.end())
    return false;

  const uint32_t slot = it->second;
  const uint32_t last = (uint32_t)m_arena.size() - 1u;
  m_slots.erase(it);

  // Swap-remove; re-point the moved entry.
  if (slot != last) {
    m_arena[slot] = std::move(m_arena[last]);
    m_owner[slot] = m_owner[last];
    m_slots[m_owner[slot]] = slot;
  }
  m_arena.pop_back();
  m_owner.pop_back();
  return true;
}

void FrameStore::clear() {
  m_arena.clear();
  m_owner.clear();
  m_slots.clear();
}

std::vector<FrameIndex> FrameStore::indices() const {
  std::vector<FrameIndex> out;
  out.reserve(m_slots.size());
  for (const auto &it : m_slots)
    out.push_back(it.first);
  return out;
}

void FrameStore::remap(
    const std::function<std::optional<FrameIndex>(FrameIndex)> &fn) {
  std::map<FrameIndex, LayerFrame> rekeyed;
  for (const auto &[f, slot] : m_slots) {
    const std::optional<FrameIndex> to = fn(f);
    if (!to)
      continue;
    rekeyed.insert_or_assign(*to, std::move(m_arena[slot]));
  }

  clear();
  for (auto &[f, frame] : rekeyed)
    insert(f, std::move(frame));
}

} // namespace Lmx
