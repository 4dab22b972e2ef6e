#include "ParityFixture.h"

#include "core/Log.h"
#include "migration/LayerMigration.h"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

namespace Lmx {

using json = nlohmann::json;

namespace {

using Error = std::unexpected<std::string>;

std::optional<FrameIndex> parseFrameKey(const std::string &s) {
  FrameIndex v = 0;
  const char *end = s.data() + s.size();
  auto [p, ec] = std::from_chars(s.data(), end, v);
  if (ec != std::errc{} || p != end)
    return std::nullopt;
  return v;
}

std::optional<FrameIndex> optionalFrame(const json &j, const char *key) {
  if (!j.contains(key) || j[key].is_null())
    return std::nullopt;
  return j[key].get<FrameIndex>();
}

std::expected<PixelBuffer, std::string>
parsePixels(const json &j, MatrixSize size, const std::string &where) {
  if (!j.is_string())
    return Error(where + ": pixels must be a hex string");

  PixelBuffer px;
  if (!fromHex(j.get<std::string>(), px))
    return Error(where + ": pixels are not RRGGBB hex");
  if (!hasExactSize(px, size))
    return Error(fmt::format("{}: {} pixels, expected {}", where, px.size(),
                             size.count()));
  return px;
}

template <class T, class Fn>
std::expected<T, std::string> parseParam(const json &p, const char *key,
                                         T fallback, Fn &&parseFn) {
  if (!p.contains(key))
    return fallback;
  const std::string s = p[key].get<std::string>();
  std::optional<T> v = parseFn(s);
  if (!v)
    return Error(fmt::format("unknown {} '{}'", key, s));
  return *v;
}

std::expected<LayerAction, std::string> parseAction(const json &j) {
  const std::string type = j.value("type", std::string{});
  const std::optional<ActionKind> kind = parseActionKind(type);
  if (!kind)
    return Error("unknown action type '" + type + "'");

  const json p = j.value("params", json::object());
  const int32_t offset = p.value("offset", 1);

  LayerAction a{};
  a.start = j.value("start", FrameIndex{0});
  a.end = optionalFrame(j, "end");

  switch (*kind) {
  case ActionKind::Scroll: {
    auto d = parseParam(p, "direction", ScrollDirection::Right,
                        parseScrollDirection);
    if (!d)
      return Error(d.error());
    a.params = ScrollParams{*d, offset};
    break;
  }
  case ActionKind::Rotate: {
    auto m = parseParam(p, "mode", RotateMode::Clockwise90, parseRotateMode);
    if (!m)
      return Error(m.error());
    a.params = RotateParams{*m};
    break;
  }
  case ActionKind::Mirror:
  case ActionKind::Bounce: {
    auto ax = parseParam(p, "axis", MirrorAxis::Horizontal, parseMirrorAxis);
    if (!ax)
      return Error(ax.error());
    if (*kind == ActionKind::Mirror)
      a.params = MirrorParams{*ax};
    else
      a.params = BounceParams{*ax};
    break;
  }
  case ActionKind::Wipe: {
    auto m = parseParam(p, "mode", WipeMode::LeftToRight, parseWipeMode);
    if (!m)
      return Error(m.error());
    a.params = WipeParams{*m, offset};
    break;
  }
  case ActionKind::Reveal: {
    auto e = parseParam(p, "edge", RevealEdge::Left, parseRevealEdge);
    if (!e)
      return Error(e.error());
    a.params = RevealParams{*e, offset};
    break;
  }
  case ActionKind::ColourCycle: {
    auto m = parseParam(p, "mode", ColourCycleMode::Rgb, parseColourCycleMode);
    if (!m)
      return Error(m.error());
    a.params = ColourCycleParams{*m};
    break;
  }
  case ActionKind::Invert:
    a.params = InvertParams{};
    break;
  }
  return a;
}

LayerGroup parseGroup(const json &j) {
  LayerGroup g{};
  g.id = j.value("id", InvalidGroup);
  g.name = j.value("name", g.name);
  g.visible = j.value("visible", g.visible);
  g.opacity = j.value("opacity", g.opacity);
  return g;
}

std::expected<LayerTrack, std::string> parseTrack(const json &j,
                                                  MatrixSize size) {
  LayerTrack t{};
  t.name = j.value("name", t.name);
  t.zIndex = j.value("z", t.zIndex);
  t.visible = j.value("visible", t.visible);
  t.opacity = j.value("opacity", t.opacity);
  t.locked = j.value("locked", t.locked);
  t.group = j.value("group", InvalidGroup);

  if (j.contains("window")) {
    const json &w = j["window"];
    t.window.start = w.value("start", FrameIndex{0});
    t.window.end = optionalFrame(w, "end");
  }

  if (j.contains("frames")) {
    for (const auto &[key, fj] : j["frames"].items()) {
      const std::optional<FrameIndex> f = parseFrameKey(key);
      if (!f)
        return Error("track '" + t.name + "': bad frame key '" + key + "'");

      auto px = parsePixels(fj.value("pixels", json{}), size,
                            fmt::format("track '{}' frame {}", t.name, *f));
      if (!px)
        return Error(px.error());

      LayerFrame lf{};
      lf.pixels = std::move(*px);
      if (fj.contains("visible"))
        lf.visibleOverride = fj["visible"].get<bool>();
      if (fj.contains("opacity"))
        lf.opacityOverride = fj["opacity"].get<double>();
      t.frames.insert(*f, std::move(lf));
    }
  }

  for (const json &aj : j.value("actions", json::array())) {
    auto a = parseAction(aj);
    if (!a)
      return Error("track '" + t.name + "': " + a.error());
    t.automation.push_back(std::move(*a));
  }
  return t;
}

std::expected<LayerStack, std::string> parseLegacy(const json &root,
                                                   MatrixSize size) {
  LegacyFrameLayers layers;
  for (const auto &[key, list] : root["legacy"].items()) {
    const std::optional<FrameIndex> f = parseFrameKey(key);
    if (!f)
      return Error("legacy: bad frame key '" + key + "'");

    auto &out = layers[*f];
    for (const json &lj : list) {
      LegacyLayer l{};
      l.name = lj.value("name", l.name);
      l.visible = lj.value("visible", l.visible);
      l.opacity = lj.value("opacity", l.opacity);
      l.locked = lj.value("locked", l.locked);
      l.group = lj.value("group", InvalidGroup);

      // Size is checked by the migration itself.
      if (!lj.contains("pixels") || !lj["pixels"].is_string() ||
          !fromHex(lj["pixels"].get<std::string>(), l.pixels))
        return Error(fmt::format("legacy frame {} layer '{}': pixels are not "
                                 "RRGGBB hex",
                                 *f, l.name));
      out.push_back(std::move(l));
    }
  }

  LegacyFrameGroups groups;
  if (root.contains("legacyGroups")) {
    for (const auto &[key, list] : root["legacyGroups"].items()) {
      const std::optional<FrameIndex> f = parseFrameKey(key);
      if (!f)
        return Error("legacyGroups: bad frame key '" + key + "'");
      for (const json &gj : list)
        groups[*f].push_back(parseGroup(gj));
    }
  }

  return migrateLegacyLayers(size, layers, groups);
}

} // namespace

std::expected<ParityFixture, std::string>
ParityFixtureIO::parse(const std::string &jsonText,
                       const std::string &fallbackName) {
  json root = json::parse(jsonText, nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded())
    return Error("fixture: malformed JSON");
  if (!root.is_object())
    return Error("fixture: root must be an object");

  try {
    const std::string name = root.value("name", fallbackName);
    const MatrixSize size{root.value("width", 0), root.value("height", 0)};
    if (!size.valid())
      return Error(fmt::format("fixture '{}': invalid matrix {}x{}", name,
                               size.width, size.height));

    const bool hasTracks = root.contains("tracks");
    const bool hasLegacy = root.contains("legacy");
    if (hasTracks == hasLegacy)
      return Error("fixture '" + name +
                   "': needs exactly one of 'tracks' or 'legacy'");

    std::expected<LayerStack, std::string> stack = LayerStack(size);
    if (hasLegacy) {
      stack = parseLegacy(root, size);
      if (!stack)
        return Error("fixture '" + name + "': " + stack.error());
    } else {
      for (const json &gj : root.value("groups", json::array()))
        stack->addGroup(parseGroup(gj));

      for (const json &tj : root["tracks"]) {
        auto t = parseTrack(tj, size);
        if (!t)
          return Error("fixture '" + name + "': " + t.error());
        auto id = stack->adoptTrack(std::move(*t));
        if (!id)
          return Error("fixture '" + name + "': " + id.error().message);
      }
    }

    const json expect = root.value("expect", json::object());
    std::map<FrameIndex, PixelBuffer> expected;
    for (const auto &[key, hex] : expect.items()) {
      const std::optional<FrameIndex> f = parseFrameKey(key);
      if (!f)
        return Error("fixture '" + name + "': bad expect key '" + key + "'");
      auto px = parsePixels(hex, size, fmt::format("expect frame {}", *f));
      if (!px)
        return Error("fixture '" + name + "': " + px.error());
      expected.emplace(*f, std::move(*px));
    }
    if (expected.empty())
      return Error("fixture '" + name + "': no expected frames");

    return ParityFixture{name, std::move(*stack), std::move(expected)};
  } catch (const json::exception &e) {
    return Error(std::string("fixture: ") + e.what());
  }
}

std::expected<ParityFixture, std::string>
ParityFixtureIO::load(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return Error("fixture: failed to open " + path);

  std::ostringstream ss;
  ss << in.rdbuf();
  return parse(ss.str(), std::filesystem::path(path).stem().string());
}

} // namespace Lmx
