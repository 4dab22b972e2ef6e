#pragma once

#include "layers/LayerTypes.h"

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace Lmx {

enum class ScrollDirection : uint8_t { Up, Down, Left, Right };
enum class RotateMode : uint8_t { Clockwise90, CounterClockwise90 };
enum class MirrorAxis : uint8_t { Horizontal, Vertical };
enum class WipeMode : uint8_t { LeftToRight, RightToLeft, TopToBottom, BottomToTop };
enum class RevealEdge : uint8_t { Left, Right, Top, Bottom };
enum class ColourCycleMode : uint8_t { Rgb, Ryb };

// Per-kind parameters. Offsets are pixels per step; values below 1 act as 1.
struct ScrollParams final {
  ScrollDirection direction = ScrollDirection::Right;
  int32_t offset = 1;
};
struct RotateParams final {
  RotateMode mode = RotateMode::Clockwise90;
};
struct MirrorParams final {
  MirrorAxis axis = MirrorAxis::Horizontal;
};
struct BounceParams final {
  MirrorAxis axis = MirrorAxis::Horizontal;
};
struct WipeParams final {
  WipeMode mode = WipeMode::LeftToRight;
  int32_t offset = 1;
};
struct RevealParams final {
  RevealEdge edge = RevealEdge::Left;
  int32_t offset = 1;
};
struct ColourCycleParams final {
  ColourCycleMode mode = ColourCycleMode::Rgb;
};
struct InvertParams final {};

using ActionParams =
    std::variant<ScrollParams, RotateParams, MirrorParams, BounceParams,
                 WipeParams, RevealParams, ColourCycleParams, InvertParams>;

enum class ActionKind : uint8_t {
  Scroll,
  Rotate,
  Mirror,
  Bounce,
  Wipe,
  Reveal,
  ColourCycle,
  Invert,
};

// One automation entry on a track. Active on its own inclusive window,
// independent of the track window.
struct LayerAction final {
  ActionParams params{ScrollParams{}};
  FrameIndex start = 0;
  std::optional<FrameIndex> end;

  ActionKind kind() const;
  int32_t priority() const;
  bool isTimeBased() const;
};

// Fixed evaluation order (lower runs first). Not configurable per action.
constexpr int32_t actionPriority(ActionKind k) {
  switch (k) {
  case ActionKind::Scroll:
    return 10;
  case ActionKind::Rotate:
    return 20;
  case ActionKind::Mirror:
    return 30;
  case ActionKind::Bounce:
    return 40;
  case ActionKind::Wipe:
    return 50;
  case ActionKind::Reveal:
    return 60;
  case ActionKind::ColourCycle:
    return 80;
  case ActionKind::Invert:
    return 90;
  }
  return 100;
}

// Local step = frame - start, or nullopt outside the action window.
std::optional<int64_t> actionStep(const LayerAction &a, FrameIndex frame);

const char *actionKindName(ActionKind k);

// Accepts the LMS action names: "scroll", "rotate", "mirror", "flip",
// "bounce", "wipe", "reveal", "colour_cycle"/"color_cycle", "invert".
// Case-insensitive.
std::optional<ActionKind> parseActionKind(std::string_view name);

// Parameter-name parsing ("right", "90 Clockwise", "Top to Bottom", ...).
std::optional<ScrollDirection> parseScrollDirection(std::string_view s);
std::optional<RotateMode> parseRotateMode(std::string_view s);
std::optional<MirrorAxis> parseMirrorAxis(std::string_view s);
std::optional<WipeMode> parseWipeMode(std::string_view s);
std::optional<RevealEdge> parseRevealEdge(std::string_view s);
std::optional<ColourCycleMode> parseColourCycleMode(std::string_view s);

} // namespace Lmx
