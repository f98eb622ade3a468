#include <gtest/gtest.h>
#include <canvas/gestures.hpp>
#include <geometry/transform.hpp>
#include "test_helpers.hpp"
#include <cmath>

using geometry::CanvasState;
using geometry::Point;

class GesturesTest : public ::testing::Test {
protected:
    canvas::ViewConfig config;
    CanvasState view{ 1.0, 0.0, 0.0 };
};

TEST_F(GesturesTest, DragPansByPointerDelta) {
    auto drag = canvas::begin_drag({ 100.0, 100.0 }, 0.0);
    const auto step = canvas::drag_move(drag, view, { 130.0, 90.0 }, 16.0, config.momentum.smoothing);
    EXPECT_DOUBLE_EQ(step.view.translate_x, 30.0);
    EXPECT_DOUBLE_EQ(step.view.translate_y, -10.0);
    EXPECT_NEAR(step.drag.distance, std::hypot(30.0, 10.0), 1e-12);
    EXPECT_DOUBLE_EQ(step.drag.last.x, 130.0);
}

TEST_F(GesturesTest, InactiveDragChangesNothing) {
    canvas::DragState idle;
    const auto step = canvas::drag_move(idle, view, { 50.0, 50.0 }, 16.0, config.momentum.smoothing);
    test_utils::expect_state_near(step.view, view, 0.0);
    EXPECT_DOUBLE_EQ(step.drag.distance, 0.0);
}

TEST_F(GesturesTest, VelocityIsExponentiallySmoothed) {
    auto drag = canvas::begin_drag({ 0.0, 0.0 }, 0.0);
    auto step = canvas::drag_move(drag, view, { 16.0, 0.0 }, 16.0, 0.3);
    EXPECT_NEAR(step.drag.velocity.x, 0.3, 1e-12);
    step = canvas::drag_move(step.drag, step.view, { 32.0, 0.0 }, 32.0, 0.3);
    EXPECT_NEAR(step.drag.velocity.x, 0.3 * 0.7 + 0.3, 1e-12);
}

TEST_F(GesturesTest, SameTimestampSamplesKeepTheirDisplacement) {
    auto drag = canvas::begin_drag({ 0.0, 0.0 }, 0.0);
    auto step = canvas::drag_move(drag, view, { 10.0, 0.0 }, 16.0, 1.0);
    EXPECT_NEAR(step.drag.velocity.x, 0.625, 1e-12);

    // Second sample in the same millisecond: view moves, velocity waits.
    step = canvas::drag_move(step.drag, step.view, { 20.0, 0.0 }, 16.0, 1.0);
    EXPECT_NEAR(step.drag.velocity.x, 0.625, 1e-12);
    EXPECT_DOUBLE_EQ(step.view.translate_x, 20.0);

    step = canvas::drag_move(step.drag, step.view, { 30.0, 0.0 }, 32.0, 1.0);
    EXPECT_NEAR(step.drag.velocity.x, 20.0 / 16.0, 1e-12);
    EXPECT_DOUBLE_EQ(step.view.translate_x, 30.0);
    EXPECT_DOUBLE_EQ(step.drag.distance, 30.0);
}

TEST_F(GesturesTest, FastReleaseProducesMomentum) {
    auto drag = canvas::begin_drag({ 0.0, 0.0 }, 0.0);
    drag.velocity = { 1.0, -0.5 };
    drag.last_time_ms = 100.0;
    const auto target = canvas::momentum_target(drag, view, 110.0, config.momentum);
    ASSERT_TRUE(target.has_value());
    EXPECT_DOUBLE_EQ(target->translate_x, 180.0);
    EXPECT_DOUBLE_EQ(target->translate_y, -90.0);
    EXPECT_DOUBLE_EQ(target->scale, 1.0);
}

TEST_F(GesturesTest, SlowReleaseHasNoMomentum) {
    auto drag = canvas::begin_drag({ 0.0, 0.0 }, 0.0);
    drag.velocity = { 0.1, 0.1 };
    EXPECT_FALSE(canvas::momentum_target(drag, view, 10.0, config.momentum).has_value());
}

TEST_F(GesturesTest, RestingPointerHasNoMomentum) {
    auto drag = canvas::begin_drag({ 0.0, 0.0 }, 0.0);
    drag.velocity = { 2.0, 0.0 };
    drag.last_time_ms = 100.0;
    EXPECT_FALSE(canvas::momentum_target(drag, view, 100.0 + config.momentum.release_idle_ms + 1.0,
        config.momentum).has_value());
}

TEST_F(GesturesTest, TapBelowThreshold) {
    canvas::DragState drag;
    drag.distance = 4.9;
    EXPECT_TRUE(canvas::is_tap(drag, config.interaction.drag_threshold));
    drag.distance = 5.0;
    EXPECT_FALSE(canvas::is_tap(drag, config.interaction.drag_threshold));
}

TEST_F(GesturesTest, PinchScalesByDistanceRatioAtMidpoint) {
    const Point a0{ 100.0, 100.0 };
    const Point b0{ 200.0, 100.0 };
    const auto pinch = canvas::begin_pinch(a0, b0);
    EXPECT_DOUBLE_EQ(pinch.distance, 100.0);

    const Point a1{ 75.0, 100.0 };
    const Point b1{ 225.0, 100.0 };
    const Point mid{ 150.0, 100.0 };
    const Point world_mid = geometry::screen_to_world(mid, view);

    const auto step = canvas::pinch_move(pinch, view, a1, b1, config.zoom);
    EXPECT_DOUBLE_EQ(step.view.scale, 1.5);
    EXPECT_DOUBLE_EQ(step.pinch.distance, 150.0);
    const Point after = geometry::screen_to_world(mid, step.view);
    EXPECT_NEAR(after.x, world_mid.x, 1e-9);
    EXPECT_NEAR(after.y, world_mid.y, 1e-9);
}

TEST_F(GesturesTest, PinchClampsScale) {
    const auto pinch = canvas::begin_pinch({ 0.0, 0.0 }, { 10.0, 0.0 });
    const auto step = canvas::pinch_move(pinch, view, { 0.0, 0.0 }, { 100.0, 0.0 }, config.zoom);
    EXPECT_DOUBLE_EQ(step.view.scale, config.zoom.max_scale);
}

TEST_F(GesturesTest, WheelDirection) {
    const Point anchor{ 400.0, 300.0 };
    EXPECT_DOUBLE_EQ(canvas::wheel_zoom(view, anchor, -1.0, config.zoom).scale, 1.1);
    EXPECT_DOUBLE_EQ(canvas::wheel_zoom(view, anchor, 3.0, config.zoom).scale, 0.9);
    EXPECT_DOUBLE_EQ(canvas::wheel_zoom(view, anchor, 0.0, config.zoom).scale, 1.0);
}

TEST_F(GesturesTest, ZoomByClampsAtLimits) {
    const CanvasState small{ 0.31, 0.0, 0.0 };
    EXPECT_DOUBLE_EQ(canvas::zoom_by(small, { 0.0, 0.0 }, 0.5, config.zoom).scale, config.zoom.min_scale);
}
