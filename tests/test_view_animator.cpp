#include <gtest/gtest.h>
#include <animation/frame_scheduler.hpp>
#include <animation/view_animator.hpp>
#include "test_helpers.hpp"

using animation::AnimationJob;
using animation::FrameQueue;
using animation::ViewAnimator;
using animation::ViewTarget;
using geometry::CanvasState;

TEST(InterpolateTest, StartAndEndAreExact) {
    AnimationJob job;
    job.start = CanvasState{ 1.0, 0.0, 0.0 };
    job.target = ViewTarget{ 2.0, 100.0, -50.0 };
    job.start_time_ms = 1000.0;
    job.duration_ms = 400.0;

    test_utils::expect_state_near(animation::interpolate(job, 1000.0), job.start, 0.0);
    const CanvasState end = animation::interpolate(job, 1400.0);
    EXPECT_EQ(end.scale, 2.0);
    EXPECT_EQ(end.translate_x, 100.0);
    EXPECT_EQ(end.translate_y, -50.0);
    EXPECT_EQ(animation::interpolate(job, 5000.0).scale, 2.0);
}

TEST(InterpolateTest, EaseOutIsMonotonicAndFrontLoaded) {
    AnimationJob job;
    job.start = CanvasState{ 1.0, 0.0, 0.0 };
    job.target = ViewTarget{ std::nullopt, 100.0, std::nullopt };
    job.duration_ms = 300.0;

    double previous = 0.0;
    for (double t = 10.0; t <= 300.0; t += 10.0) {
        const double x = animation::interpolate(job, t).translate_x;
        EXPECT_GT(x, previous);
        EXPECT_LE(x, 100.0);
        previous = x;
    }
    // Half the time covers 1 - 0.5^3 of the distance.
    EXPECT_NEAR(animation::interpolate(job, 150.0).translate_x, 87.5, 1e-9);
}

TEST(InterpolateTest, UnsetFieldsKeepStartValue) {
    AnimationJob job;
    job.start = CanvasState{ 1.5, 10.0, 20.0 };
    job.target = ViewTarget{ std::nullopt, 50.0, std::nullopt };
    job.duration_ms = 100.0;

    const CanvasState mid = animation::interpolate(job, 50.0);
    EXPECT_DOUBLE_EQ(mid.scale, 1.5);
    EXPECT_DOUBLE_EQ(mid.translate_y, 20.0);
}

class ViewAnimatorTest : public ::testing::Test {
protected:
    FrameQueue queue;
    CanvasState state;
    ViewAnimator animator{ queue, state };
};

TEST_F(ViewAnimatorTest, ReachesTargetExactly) {
    int updates = 0;
    animator.set_on_update([&] { ++updates; });
    animator.animate_to(ViewTarget{ 2.0, 40.0, 80.0 }, 400.0);
    EXPECT_TRUE(animator.is_animating());

    queue.advance(200.0);
    EXPECT_TRUE(animator.is_animating());
    EXPECT_GT(state.scale, 1.0);
    EXPECT_LT(state.scale, 2.0);

    queue.advance(250.0);
    EXPECT_FALSE(animator.is_animating());
    EXPECT_EQ(state.scale, 2.0);
    EXPECT_EQ(state.translate_x, 40.0);
    EXPECT_EQ(state.translate_y, 80.0);
    EXPECT_GT(updates, 1);
    EXPECT_EQ(queue.pending(), 0u);
}

TEST_F(ViewAnimatorTest, CancelFreezesAtLastInterpolatedValue) {
    animator.animate_to(ViewTarget{ std::nullopt, 100.0, std::nullopt }, 400.0);
    queue.advance(100.0);
    const CanvasState frozen = state;
    EXPECT_GT(frozen.translate_x, 0.0);

    animator.cancel();
    EXPECT_FALSE(animator.is_animating());
    queue.advance(500.0);
    test_utils::expect_state_near(state, frozen, 0.0);
}

TEST_F(ViewAnimatorTest, NewJobReplacesInFlightJobFromCurrentState) {
    animator.animate_to(ViewTarget{ std::nullopt, 100.0, std::nullopt }, 400.0);
    queue.advance(100.0);
    const double mid = state.translate_x;

    animator.animate_to(ViewTarget{ std::nullopt, -100.0, std::nullopt }, 200.0);
    ASSERT_TRUE(animator.target_state().has_value());
    EXPECT_DOUBLE_EQ(animator.target_state()->translate_x, -100.0);
    EXPECT_DOUBLE_EQ(state.translate_x, mid);

    queue.advance(300.0);
    EXPECT_EQ(state.translate_x, -100.0);
    EXPECT_FALSE(animator.target_state().has_value());
}

TEST_F(ViewAnimatorTest, ZeroDurationAppliesImmediately) {
    bool updated = false;
    animator.set_on_update([&] { updated = true; });
    animator.animate_to(ViewTarget{ 0.5, std::nullopt, std::nullopt }, 0.0);
    EXPECT_FALSE(animator.is_animating());
    EXPECT_EQ(state.scale, 0.5);
    EXPECT_TRUE(updated);
}
