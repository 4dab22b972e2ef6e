#pragma once

#include "LayerGroup.h"
#include "LayerTrack.h"
#include "LayerTypes.h"
#include "edit/EditError.h"
#include "pixel/PixelGrid.h"

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace Lmx {

// Pattern-level owner of the ordered tracks and groups.
// Pointers returned by track()/group() are invalidated by add/remove.
class LayerStack final {
public:
  explicit LayerStack(MatrixSize size);

  MatrixSize size() const { return m_size; }
  size_t pixelCount() const { return m_size.count(); }

  // Tracks (insertion order)
  // Structural edits are refused while a RenderScope is open: addTrack and
  // addGroup return the Invalid id, the others return false.
  TrackId addTrack(std::string name);
  // Takes a fully built track (migration, fixtures). Assigns a fresh id and
  // rejects frames whose pixel count does not match the matrix.
  std::expected<TrackId, EditError> adoptTrack(LayerTrack track);
  bool removeTrack(TrackId id);

  LayerTrack *track(TrackId id);
  const LayerTrack *track(TrackId id) const;

  const std::vector<LayerTrack> &tracks() const { return m_tracks; }

  // Sorted by (zIndex, insertion order).
  std::vector<const LayerTrack *> renderOrder() const;

  // Moves a track to `position` in render order and renumbers every zIndex
  // to 0..n-1.
  bool moveTrack(TrackId id, size_t position);

  // Groups
  // Keeps g.id when it is set and unused, otherwise allocates one.
  GroupId addGroup(LayerGroup g);
  bool removeGroup(GroupId id);
  LayerGroup *group(GroupId id);
  const LayerGroup *group(GroupId id) const;
  const std::vector<LayerGroup> &groups() const { return m_groups; }

  // Re-pads or truncates every stored frame of every track.
  std::expected<void, EditError> resize(MatrixSize size);

  // Timeline bookkeeping: shift frame keys, action windows and track windows
  // when frames are inserted/removed/duplicated/moved in the pattern.
  std::expected<void, EditError> framesInserted(FrameIndex index,
                                                int64_t count = 1);
  std::expected<void, EditError> framesDeleted(FrameIndex index,
                                               int64_t count = 1);
  std::expected<void, EditError> frameDuplicated(FrameIndex src,
                                                 FrameIndex dest);
  std::expected<void, EditError> frameMoved(FrameIndex src, FrameIndex dest);

  bool isRendering() const { return m_renderDepth > 0; }

  // Marks a render in progress; edits are rejected while one is alive.
  class RenderScope final {
  public:
    explicit RenderScope(const LayerStack &stack);
    ~RenderScope();

    RenderScope(const RenderScope &) = delete;
    RenderScope &operator=(const RenderScope &) = delete;

  private:
    const LayerStack &m_stack;
  };

private:
  MatrixSize m_size{};
  std::vector<LayerTrack> m_tracks;
  std::vector<LayerGroup> m_groups;

  TrackId m_nextTrack = 1;
  GroupId m_nextGroup = 1;

  mutable int32_t m_renderDepth = 0;

  std::expected<void, EditError> rejectIfRendering(const char *op) const;
};

} // namespace Lmx
