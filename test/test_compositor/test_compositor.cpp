/**
 * Black-transparent compositing across tracks.
 */

#include <unity.h>

#include "TestPatterns.h"
#include "render/Compositor.h"

using namespace Lmx;
using namespace LmxTest;

void setUp(void) {}
void tearDown(void) {}

static const MatrixSize One{1, 1};

static void assertPixel(Pixel want, Pixel got) {
  TEST_ASSERT_EQUAL_UINT8(want.r, got.r);
  TEST_ASSERT_EQUAL_UINT8(want.g, got.g);
  TEST_ASSERT_EQUAL_UINT8(want.b, got.b);
}

void test_empty_stack_renders_black() {
  const LayerStack stack(MatrixSize{4, 2});
  TEST_ASSERT_TRUE(
      same(makeBlackBuffer({4, 2}), Compositor::render(stack, 0)));
}

void test_black_top_layer_is_transparent() {
  std::vector<LayerTrack> tracks;
  tracks.push_back(trackWith("bottom", 0, 0, pixels({Red})));
  tracks.push_back(trackWith("top", 1, 0, pixels({Black})));
  assertPixel(Red, Compositor::render(tracks, {}, 0, One)[0]);

  tracks[1].frames.find(0)->pixels = pixels({White});
  assertPixel(White, Compositor::render(tracks, {}, 0, One)[0]);
}

void test_half_opacity_dims_top_layer() {
  std::vector<LayerTrack> tracks;
  tracks.push_back(trackWith("A", 0, 0, pixels({Red})));
  tracks[0].opacity = 0.5;
  assertPixel(Pixel{127, 0, 0}, Compositor::render(tracks, {}, 0, One)[0]);
}

void test_dimmed_to_black_disappears() {
  std::vector<LayerTrack> tracks;
  tracks.push_back(trackWith("bottom", 0, 0, pixels({Blue})));
  tracks.push_back(trackWith("top", 1, 0, pixels({Red})));
  tracks[1].opacity = 0.0;
  assertPixel(Blue, Compositor::render(tracks, {}, 0, One)[0]);
}

void test_inactive_top_track_lets_lower_colour_through() {
  std::vector<LayerTrack> tracks;
  tracks.push_back(trackWith("bottom", 0, 0, pixels({Red})));
  tracks[0].frames.insert(3, frameOf(pixels({Red})));

  // Stored frame at 3, but the window only opens at 5.
  tracks.push_back(trackWith("late", 1, 3, pixels({White})));
  tracks[1].window.start = 5;
  // Window covers 0, but nothing is stored there.
  tracks.push_back(trackWith("sparse", 2, 7, pixels({Green})));

  assertPixel(Red, Compositor::render(tracks, {}, 3, One)[0]);
  assertPixel(Red, Compositor::render(tracks, {}, 0, One)[0]);

  tracks[1].window.start = 0;
  assertPixel(White, Compositor::render(tracks, {}, 3, One)[0]);
}

void test_z_order_beats_insertion_order() {
  std::vector<LayerTrack> tracks;
  tracks.push_back(trackWith("high", 5, 0, pixels({Red})));
  tracks.push_back(trackWith("low", 1, 0, pixels({Green})));
  assertPixel(Red, Compositor::render(tracks, {}, 0, One)[0]);
}

void test_z_ties_keep_insertion_order() {
  std::vector<LayerTrack> tracks;
  tracks.push_back(trackWith("first", 2, 0, pixels({Red})));
  tracks.push_back(trackWith("second", 2, 0, pixels({Green})));
  assertPixel(Green, Compositor::render(tracks, {}, 0, One)[0]);
}

void test_render_is_deterministic_across_call_order() {
  const MatrixSize row{8, 1};
  LayerStack stack(row);
  LayerTrack t{};
  for (FrameIndex f = 0; f < 8; ++f)
    t.frames.insert(f, frameOf(dot(row, 0)));
  LayerAction scroll{};
  scroll.params = ScrollParams{ScrollDirection::Right, 1};
  t.automation.push_back(scroll);
  TEST_ASSERT_TRUE(stack.adoptTrack(std::move(t)).has_value());

  const PixelBuffer a = Compositor::render(stack, 5);
  const PixelBuffer b = Compositor::render(stack, 1);
  const PixelBuffer c = Compositor::render(stack, 5);

  TEST_ASSERT_TRUE(same(a, c));
  TEST_ASSERT_TRUE(same(dot(row, 5), a));
  TEST_ASSERT_TRUE(same(dot(row, 1), b));
}

void test_groups_resolve_by_id() {
  LayerStack stack(One);
  LayerGroup g{};
  g.id = 7;
  g.visible = false;
  TEST_ASSERT_EQUAL_UINT(7, stack.addGroup(g));

  LayerTrack t = trackWith("A", 0, 0, pixels({Red}));
  t.group = 7;
  TEST_ASSERT_TRUE(stack.adoptTrack(std::move(t)).has_value());
  assertPixel(Black, Compositor::render(stack, 0)[0]);

  stack.group(7)->visible = true;
  assertPixel(Red, Compositor::render(stack, 0)[0]);
}

void test_render_scope_is_released() {
  const LayerStack stack(One);
  (void)Compositor::render(stack, 0);
  TEST_ASSERT_FALSE(stack.isRendering());
  {
    LayerStack::RenderScope scope(stack);
    TEST_ASSERT_TRUE(stack.isRendering());
  }
  TEST_ASSERT_FALSE(stack.isRendering());
}

void test_render_range_and_pack() {
  LayerStack stack(MatrixSize{2, 1});
  TEST_ASSERT_TRUE(
      stack.adoptTrack(trackWith("A", 0, 1, pixels({Red, Blue}))).has_value());

  const std::vector<PixelBuffer> frames = Compositor::renderRange(stack, 0, 2);
  TEST_ASSERT_EQUAL_UINT(3, (unsigned)frames.size());
  TEST_ASSERT_TRUE(same(makeBlackBuffer({2, 1}), frames[0]));
  TEST_ASSERT_TRUE(same(makeBlackBuffer({2, 1}), frames[2]));

  const std::vector<uint8_t> bytes = packRgb(frames[1]);
  const uint8_t want[] = {255, 0, 0, 0, 0, 255};
  TEST_ASSERT_EQUAL_UINT(6, (unsigned)bytes.size());
  TEST_ASSERT_EQUAL_UINT8_ARRAY(want, bytes.data(), 6);
  TEST_ASSERT_EQUAL_STRING("ff00000000ff", toHex(frames[1]).c_str());
}

int main(int argc, char **argv) {
  (void)argc;
  (void)argv;
  UNITY_BEGIN();

  RUN_TEST(test_empty_stack_renders_black);
  RUN_TEST(test_black_top_layer_is_transparent);
  RUN_TEST(test_half_opacity_dims_top_layer);
  RUN_TEST(test_dimmed_to_black_disappears);
  RUN_TEST(test_inactive_top_track_lets_lower_colour_through);
  RUN_TEST(test_z_order_beats_insertion_order);
  RUN_TEST(test_z_ties_keep_insertion_order);
  RUN_TEST(test_render_is_deterministic_across_call_order);
  RUN_TEST(test_groups_resolve_by_id);
  RUN_TEST(test_render_scope_is_released);
  RUN_TEST(test_render_range_and_pack);

  return UNITY_END();
}
