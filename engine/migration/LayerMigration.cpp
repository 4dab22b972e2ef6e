#include "LayerMigration.h"

#include "core/Log.h"

#include <cmath>
#include <unordered_map>
#include <unordered_set>

namespace Lmx {

static constexpr double OpacityEpsilon = 0.001;

static LayerFrame toFrame(const LegacyLayer &l, const LegacyLayer &first) {
  LayerFrame f{};
  f.pixels = l.pixels;
  if (l.visible != first.visible)
    f.visibleOverride = l.visible;
  if (std::fabs(l.opacity - first.opacity) >= OpacityEpsilon)
    f.opacityOverride = l.opacity;
  return f;
}

std::expected<LayerStack, std::string>
migrateLegacyLayers(MatrixSize size, const LegacyFrameLayers &layers,
                    const LegacyFrameGroups &groups) {
  if (!size.valid())
    return std::unexpected(fmt::format("migration: invalid matrix {}x{}",
                                       size.width, size.height));

  LayerStack stack(size);

  std::unordered_set<GroupId> seenGroups;
  for (const auto &[frame, list] : groups) {
    for (const LayerGroup &g : list) {
      if (g.id == InvalidGroup || !seenGroups.insert(g.id).second)
        continue;
      stack.addGroup(g);
    }
  }

  // name -> index into `built`, in order of first appearance
  std::unordered_map<std::string, size_t> byName;
  std::vector<LayerTrack> built;
  std::vector<const LegacyLayer *> firstSeen;

  for (const auto &[frame, list] : layers) {
    std::unordered_set<std::string> inThisFrame;
    for (const LegacyLayer &l : list) {
      if (!hasExactSize(l.pixels, size)) {
        return std::unexpected(
            fmt::format("migration: layer '{}' frame {}: {} pixels, expected {}",
                        l.name, frame, l.pixels.size(), size.count()));
      }

      auto it = byName.find(l.name);
      if (it == byName.end()) {
        LayerTrack t{};
        t.name = l.name;
        t.zIndex = (int64_t)built.size();
        t.visible = l.visible;
        t.opacity = l.opacity;
        t.locked = l.locked;
        t.group = l.group;
        it = byName.emplace(l.name, built.size()).first;
        built.push_back(std::move(t));
        firstSeen.push_back(&l);
      }

      LayerTrack &t = built[it->second];
      LayerFrame f = toFrame(l, *firstSeen[it->second]);

      if (!inThisFrame.insert(l.name).second) {
        Log::Warn("migration: layer '{}' appears twice in frame {}, keeping "
                  "the last one",
                  l.name, frame);
        t.frames.erase(frame);
      }
      t.frames.insert(frame, std::move(f));
    }
  }

  for (LayerTrack &t : built) {
    if (t.group != InvalidGroup && !stack.group(t.group)) {
      Log::Warn("migration: track '{}' references unknown group {}", t.name,
                t.group);
    }
    auto r = stack.adoptTrack(std::move(t));
    if (!r)
      return std::unexpected(r.error().message);
  }

  Log::Info("migrated {} legacy frames into {} tracks, {} groups",
            layers.size(), stack.tracks().size(), stack.groups().size());
  return stack;
}

} // namespace Lmx
