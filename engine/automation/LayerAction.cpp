#include "LayerAction.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <type_traits>

namespace Lmx {

static std::string toLower(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s)
    out.push_back((char)std::tolower((unsigned char)c));
  return out;
}

static bool has(const std::string &h, std::string_view n) {
  return h.find(n) != std::string::npos;
}

ActionKind LayerAction::kind() const {
  return std::visit(
      [](const auto &p) -> ActionKind {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ScrollParams>)
          return ActionKind::Scroll;
        else if constexpr (std::is_same_v<T, RotateParams>)
          return ActionKind::Rotate;
        else if constexpr (std::is_same_v<T, MirrorParams>)
          return ActionKind::Mirror;
        else if constexpr (std::is_same_v<T, BounceParams>)
          return ActionKind::Bounce;
        else if constexpr (std::is_same_v<T, WipeParams>)
          return ActionKind::Wipe;
        else if constexpr (std::is_same_v<T, RevealParams>)
          return ActionKind::Reveal;
        else if constexpr (std::is_same_v<T, ColourCycleParams>)
          return ActionKind::ColourCycle;
        else
          return ActionKind::Invert;
      },
      params);
}

int32_t LayerAction::priority() const { return actionPriority(kind()); }

bool LayerAction::isTimeBased() const {
  switch (kind()) {
  case ActionKind::Scroll:
  case ActionKind::Rotate:
  case ActionKind::Bounce:
  case ActionKind::Wipe:
  case ActionKind::Reveal:
    return true;
  case ActionKind::Mirror:
  case ActionKind::ColourCycle:
  case ActionKind::Invert:
    return false;
  }
  return false;
}

std::optional<int64_t> actionStep(const LayerAction &a, FrameIndex frame) {
  if (frame < a.start)
    return std::nullopt;
  if (a.end && frame > *a.end)
    return std::nullopt;
  // frame >= start, so the unsigned difference is exact; saturate past int64.
  const uint64_t step = (uint64_t)frame - (uint64_t)a.start;
  return (int64_t)std::min<uint64_t>(step, (uint64_t)INT64_MAX);
}

const char *actionKindName(ActionKind k) {
  switch (k) {
  case ActionKind::Scroll:
    return "scroll";
  case ActionKind::Rotate:
    return "rotate";
  case ActionKind::Mirror:
    return "mirror";
  case ActionKind::Bounce:
    return "bounce";
  case ActionKind::Wipe:
    return "wipe";
  case ActionKind::Reveal:
    return "reveal";
  case ActionKind::ColourCycle:
    return "colour_cycle";
  case ActionKind::Invert:
    return "invert";
  }
  return "unknown";
}

std::optional<ActionKind> parseActionKind(std::string_view name) {
  const std::string n = toLower(name);
  if (n == "scroll")
    return ActionKind::Scroll;
  if (n == "rotate")
    return ActionKind::Rotate;
  if (n == "mirror" || n == "flip")
    return ActionKind::Mirror;
  if (n == "bounce")
    return ActionKind::Bounce;
  if (n == "wipe")
    return ActionKind::Wipe;
  if (n == "reveal")
    return ActionKind::Reveal;
  if (n == "colour_cycle" || n == "color_cycle")
    return ActionKind::ColourCycle;
  if (n == "invert")
    return ActionKind::Invert;
  return std::nullopt;
}

std::optional<ScrollDirection> parseScrollDirection(std::string_view s) {
  const std::string n = toLower(s);
  if (n == "up")
    return ScrollDirection::Up;
  if (n == "down")
    return ScrollDirection::Down;
  if (n == "left")
    return ScrollDirection::Left;
  if (n == "right")
    return ScrollDirection::Right;
  return std::nullopt;
}

std::optional<RotateMode> parseRotateMode(std::string_view s) {
  const std::string n = toLower(s);
  // "counter-clockwise" also contains "clockwise": test the counter forms first.
  if (has(n, "counter") || has(n, "anti") || n == "ccw")
    return RotateMode::CounterClockwise90;
  if (has(n, "clockwise") || n == "cw")
    return RotateMode::Clockwise90;
  return std::nullopt;
}

std::optional<MirrorAxis> parseMirrorAxis(std::string_view s) {
  const std::string n = toLower(s);
  if (n == "horizontal")
    return MirrorAxis::Horizontal;
  if (n == "vertical")
    return MirrorAxis::Vertical;
  return std::nullopt;
}

std::optional<WipeMode> parseWipeMode(std::string_view s) {
  const std::string n = toLower(s);
  // Split on the " to " word, not the letters: "bottom" contains "to".
  const size_t to = n.find(" to ");
  const std::string head = (to == std::string::npos) ? n : n.substr(0, to);

  if (has(n, "left") && has(n, "right"))
    return has(head, "left") ? WipeMode::LeftToRight : WipeMode::RightToLeft;
  if (has(n, "top") || has(n, "bottom"))
    return has(head, "top") ? WipeMode::TopToBottom : WipeMode::BottomToTop;
  return std::nullopt;
}

std::optional<RevealEdge> parseRevealEdge(std::string_view s) {
  const std::string n = toLower(s);
  if (n == "left")
    return RevealEdge::Left;
  if (n == "right")
    return RevealEdge::Right;
  if (n == "top")
    return RevealEdge::Top;
  if (n == "bottom")
    return RevealEdge::Bottom;
  return std::nullopt;
}

std::optional<ColourCycleMode> parseColourCycleMode(std::string_view s) {
  const std::string n = toLower(s);
  if (n == "rgb")
    return ColourCycleMode::Rgb;
  if (n == "ryb")
    return ColourCycleMode::Ryb;
  return std::nullopt;
}

} // namespace Lmx
