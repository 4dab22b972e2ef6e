/**
 * Action windows, local steps, fixed priorities and name parsing.
 */

#include <unity.h>

#include "automation/AutomationPipeline.h"
#include "automation/LayerAction.h"

#include <cstdint>

using namespace Lmx;

void setUp(void) {}
void tearDown(void) {}

static LayerAction windowed(FrameIndex start, std::optional<FrameIndex> end) {
  LayerAction a{};
  a.start = start;
  a.end = end;
  return a;
}

void test_step_is_none_before_start() {
  const LayerAction a = windowed(10, 20);
  TEST_ASSERT_FALSE(actionStep(a, 9).has_value());
}

void test_step_starts_at_zero() {
  const LayerAction a = windowed(10, 20);
  TEST_ASSERT_TRUE(actionStep(a, 10).has_value());
  TEST_ASSERT_EQUAL_INT(0, (int)*actionStep(a, 10));
}

void test_step_inside_window() {
  const LayerAction a = windowed(10, 20);
  TEST_ASSERT_EQUAL_INT(5, (int)*actionStep(a, 15));
}

void test_step_end_is_inclusive() {
  const LayerAction a = windowed(10, 20);
  TEST_ASSERT_TRUE(actionStep(a, 20).has_value());
  TEST_ASSERT_EQUAL_INT(10, (int)*actionStep(a, 20));
}

void test_step_is_none_after_end() {
  const LayerAction a = windowed(10, 20);
  TEST_ASSERT_FALSE(actionStep(a, 21).has_value());
}

void test_step_unbounded_end() {
  const LayerAction a = windowed(10, std::nullopt);
  TEST_ASSERT_EQUAL_INT(90, (int)*actionStep(a, 100));
  TEST_ASSERT_FALSE(actionStep(a, 9).has_value());
}

void test_step_saturates_across_full_range() {
  const LayerAction a = windowed(INT64_MIN + 1, std::nullopt);
  const auto far = actionStep(a, INT64_MAX);
  TEST_ASSERT_TRUE(far.has_value());
  TEST_ASSERT_TRUE(*far == INT64_MAX);

  const LayerAction b = windowed(-5, std::nullopt);
  TEST_ASSERT_EQUAL_INT(15, (int)*actionStep(b, 10));
}

void test_fixed_priorities() {
  TEST_ASSERT_EQUAL_INT(10, actionPriority(ActionKind::Scroll));
  TEST_ASSERT_EQUAL_INT(20, actionPriority(ActionKind::Rotate));
  TEST_ASSERT_EQUAL_INT(30, actionPriority(ActionKind::Mirror));
  TEST_ASSERT_EQUAL_INT(40, actionPriority(ActionKind::Bounce));
  TEST_ASSERT_EQUAL_INT(50, actionPriority(ActionKind::Wipe));
  TEST_ASSERT_EQUAL_INT(60, actionPriority(ActionKind::Reveal));
  TEST_ASSERT_EQUAL_INT(80, actionPriority(ActionKind::ColourCycle));
  TEST_ASSERT_EQUAL_INT(90, actionPriority(ActionKind::Invert));
}

void test_kind_follows_params() {
  LayerAction a{};
  a.params = InvertParams{};
  TEST_ASSERT_TRUE(a.kind() == ActionKind::Invert);
  TEST_ASSERT_EQUAL_INT(90, a.priority());
  TEST_ASSERT_FALSE(a.isTimeBased());

  a.params = WipeParams{WipeMode::TopToBottom, 2};
  TEST_ASSERT_TRUE(a.kind() == ActionKind::Wipe);
  TEST_ASSERT_TRUE(a.isTimeBased());
}

void test_sorted_actions_is_stable_by_priority() {
  std::vector<LayerAction> list(4);
  list[0].params = InvertParams{};
  list[1].params = ScrollParams{ScrollDirection::Left, 1};
  list[2].params = MirrorParams{MirrorAxis::Vertical};
  list[3].params = ScrollParams{ScrollDirection::Up, 2};

  const auto sorted = AutomationPipeline::sortedActions(list);
  TEST_ASSERT_EQUAL_PTR(&list[1], sorted[0]);
  TEST_ASSERT_EQUAL_PTR(&list[3], sorted[1]);
  TEST_ASSERT_EQUAL_PTR(&list[2], sorted[2]);
  TEST_ASSERT_EQUAL_PTR(&list[0], sorted[3]);
}

void test_parse_kind_aliases() {
  TEST_ASSERT_TRUE(parseActionKind("flip") == ActionKind::Mirror);
  TEST_ASSERT_TRUE(parseActionKind("Mirror") == ActionKind::Mirror);
  TEST_ASSERT_TRUE(parseActionKind("color_cycle") == ActionKind::ColourCycle);
  TEST_ASSERT_TRUE(parseActionKind("SCROLL") == ActionKind::Scroll);
  TEST_ASSERT_FALSE(parseActionKind("radial").has_value());
  TEST_ASSERT_EQUAL_STRING("colour_cycle",
                           actionKindName(ActionKind::ColourCycle));
}

void test_parse_rotate_counter_clockwise() {
  TEST_ASSERT_TRUE(parseRotateMode("90 Clockwise") == RotateMode::Clockwise90);
  TEST_ASSERT_TRUE(parseRotateMode("90 Counter-Clockwise") ==
                   RotateMode::CounterClockwise90);
  TEST_ASSERT_TRUE(parseRotateMode("anticlockwise") ==
                   RotateMode::CounterClockwise90);
}

void test_parse_wipe_modes() {
  TEST_ASSERT_TRUE(parseWipeMode("Left to Right") == WipeMode::LeftToRight);
  TEST_ASSERT_TRUE(parseWipeMode("Right to Left") == WipeMode::RightToLeft);
  TEST_ASSERT_TRUE(parseWipeMode("Top to Bottom") == WipeMode::TopToBottom);
  TEST_ASSERT_TRUE(parseWipeMode("Bottom to Top") == WipeMode::BottomToTop);
  TEST_ASSERT_FALSE(parseWipeMode("sideways").has_value());
}

void test_parse_params() {
  TEST_ASSERT_TRUE(parseScrollDirection("Down") == ScrollDirection::Down);
  TEST_ASSERT_TRUE(parseMirrorAxis("vertical") == MirrorAxis::Vertical);
  TEST_ASSERT_TRUE(parseRevealEdge("bottom") == RevealEdge::Bottom);
  TEST_ASSERT_TRUE(parseColourCycleMode("RYB") == ColourCycleMode::Ryb);
  TEST_ASSERT_FALSE(parseScrollDirection("diagonal").has_value());
}

int main(int argc, char **argv) {
  (void)argc;
  (void)argv;
  UNITY_BEGIN();

  RUN_TEST(test_step_is_none_before_start);
  RUN_TEST(test_step_starts_at_zero);
  RUN_TEST(test_step_inside_window);
  RUN_TEST(test_step_end_is_inclusive);
  RUN_TEST(test_step_is_none_after_end);
  RUN_TEST(test_step_unbounded_end);
  RUN_TEST(test_step_saturates_across_full_range);
  RUN_TEST(test_fixed_priorities);
  RUN_TEST(test_kind_follows_params);
  RUN_TEST(test_sorted_actions_is_stable_by_priority);
  RUN_TEST(test_parse_kind_aliases);
  RUN_TEST(test_parse_rotate_counter_clockwise);
  RUN_TEST(test_parse_wipe_modes);
  RUN_TEST(test_parse_params);

  return UNITY_END();
}
