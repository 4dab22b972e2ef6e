/**
 * Per-frame legacy layers -> tracks.
 */

#include <unity.h>

#include "TestPatterns.h"
#include "migration/LayerMigration.h"
#include "render/Compositor.h"

using namespace Lmx;
using namespace LmxTest;

static const MatrixSize One{1, 1};

void setUp(void) { quietLogs(); }
void tearDown(void) {}

static LegacyLayer layer(std::string name, Pixel c, bool visible = true,
                         double opacity = 1.0) {
  LegacyLayer l{};
  l.name = std::move(name);
  l.pixels = pixels({c});
  l.visible = visible;
  l.opacity = opacity;
  return l;
}

static const LayerTrack *byName(const LayerStack &stack, const char *name) {
  for (const auto &t : stack.tracks()) {
    if (t.name == name)
      return &t;
  }
  return nullptr;
}

void test_tracks_follow_first_appearance() {
  LegacyFrameLayers in;
  in[0] = {layer("Background", Blue), layer("Sprite", Red)};
  in[1] = {layer("Sparkle", White), layer("Background", Blue)};

  auto stack = migrateLegacyLayers(One, in);
  TEST_ASSERT_TRUE(stack.has_value());
  TEST_ASSERT_EQUAL_UINT(3, (unsigned)stack->tracks().size());

  TEST_ASSERT_EQUAL_INT(0, (int)byName(*stack, "Background")->zIndex);
  TEST_ASSERT_EQUAL_INT(1, (int)byName(*stack, "Sprite")->zIndex);
  TEST_ASSERT_EQUAL_INT(2, (int)byName(*stack, "Sparkle")->zIndex);

  const LayerTrack *bg = byName(*stack, "Background");
  TEST_ASSERT_TRUE(bg->frames.contains(0));
  TEST_ASSERT_TRUE(bg->frames.contains(1));
  TEST_ASSERT_FALSE(byName(*stack, "Sprite")->frames.contains(1));
}

void test_overrides_only_where_values_differ() {
  LegacyFrameLayers in;
  in[0] = {layer("A", Red, true, 0.8)};
  in[1] = {layer("A", Red, false, 0.8005)};
  in[2] = {layer("A", Red, true, 0.5)};

  auto stack = migrateLegacyLayers(One, in);
  TEST_ASSERT_TRUE(stack.has_value());
  const LayerTrack &t = stack->tracks()[0];
  TEST_ASSERT_TRUE(t.visible);
  TEST_ASSERT_EQUAL_FLOAT(0.8, t.opacity);

  const LayerFrame *f0 = t.frames.find(0);
  TEST_ASSERT_FALSE(f0->visibleOverride.has_value());
  TEST_ASSERT_FALSE(f0->opacityOverride.has_value());

  const LayerFrame *f1 = t.frames.find(1);
  TEST_ASSERT_TRUE(f1->visibleOverride == false);
  TEST_ASSERT_FALSE(f1->opacityOverride.has_value());

  const LayerFrame *f2 = t.frames.find(2);
  TEST_ASSERT_FALSE(f2->visibleOverride.has_value());
  TEST_ASSERT_EQUAL_FLOAT(0.5, *f2->opacityOverride);
}

void test_migrated_render_matches_legacy_composite() {
  LegacyFrameLayers in;
  in[0] = {layer("Back", Blue), layer("Front", Black)};
  in[1] = {layer("Back", Blue), layer("Front", Red)};

  auto stack = migrateLegacyLayers(One, in);
  TEST_ASSERT_TRUE(stack.has_value());
  TEST_ASSERT_TRUE(Compositor::render(*stack, 0)[0] == Blue);
  TEST_ASSERT_TRUE(Compositor::render(*stack, 1)[0] == Red);
  TEST_ASSERT_TRUE(Compositor::render(*stack, 2)[0] == Black);
}

void test_duplicate_name_in_frame_keeps_last() {
  LegacyFrameLayers in;
  in[0] = {layer("A", Red), layer("A", Green)};

  auto stack = migrateLegacyLayers(One, in);
  TEST_ASSERT_TRUE(stack.has_value());
  TEST_ASSERT_EQUAL_UINT(1, (unsigned)stack->tracks().size());
  TEST_ASSERT_TRUE(stack->tracks()[0].frames.find(0)->pixels[0] == Green);
}

void test_groups_keep_first_definition() {
  LegacyFrameLayers in;
  LegacyLayer a = layer("A", Red);
  a.group = 3;
  in[0] = {a};

  LayerGroup first{};
  first.id = 3;
  first.name = "first";
  first.opacity = 0.5;
  LayerGroup second = first;
  second.name = "second";

  LegacyFrameGroups groups;
  groups[0] = {first};
  groups[4] = {second};

  auto stack = migrateLegacyLayers(One, in, groups);
  TEST_ASSERT_TRUE(stack.has_value());
  TEST_ASSERT_EQUAL_UINT(1, (unsigned)stack->groups().size());
  TEST_ASSERT_EQUAL_STRING("first", stack->group(3)->name.c_str());
  TEST_ASSERT_EQUAL_UINT(3, stack->tracks()[0].group);
  TEST_ASSERT_EQUAL_UINT8(127, Compositor::render(*stack, 0)[0].r);
}

void test_size_mismatch_is_an_error() {
  LegacyFrameLayers in;
  LegacyLayer bad = layer("A", Red);
  bad.pixels = pixels({Red, Red});
  in[0] = {bad};

  auto stack = migrateLegacyLayers(One, in);
  TEST_ASSERT_FALSE(stack.has_value());
  TEST_ASSERT_TRUE(stack.error().find("expected 1") != std::string::npos);
}

void test_empty_input_gives_empty_stack() {
  auto stack = migrateLegacyLayers(One, {});
  TEST_ASSERT_TRUE(stack.has_value());
  TEST_ASSERT_TRUE(stack->tracks().empty());
}

int main(int argc, char **argv) {
  (void)argc;
  (void)argv;
  UNITY_BEGIN();

  RUN_TEST(test_tracks_follow_first_appearance);
  RUN_TEST(test_overrides_only_where_values_differ);
  RUN_TEST(test_migrated_render_matches_legacy_composite);
  RUN_TEST(test_duplicate_name_in_frame_keeps_last);
  RUN_TEST(test_groups_keep_first_definition);
  RUN_TEST(test_size_mismatch_is_an_error);
  RUN_TEST(test_empty_input_gives_empty_stack);

  return UNITY_END();
}
