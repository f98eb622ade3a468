#include <gtest/gtest.h>
#include <animation/frame_scheduler.hpp>
#include <animation/opacity_animator.hpp>

using animation::FrameQueue;
using animation::OpacityAnimator;

class OpacityAnimatorTest : public ::testing::Test {
protected:
    FrameQueue queue;
    OpacityAnimator animator{ queue };
};

TEST_F(OpacityAnimatorTest, UnknownKeyStartsAtTarget) {
    animator.set_target("a|b", 0.8);
    EXPECT_DOUBLE_EQ(animator.get_current("a|b"), 0.8);
    EXPECT_TRUE(animator.settled());
    EXPECT_DOUBLE_EQ(animator.get_current("missing", 0.3), 0.3);
}

TEST_F(OpacityAnimatorTest, EasesEveryKeyTowardItsTarget) {
    animator.set_duration(300.0);
    animator.set_immediate("a|b", 0.3);
    animator.set_immediate("b|c", 0.3);
    animator.set_target("a|b", 0.8);
    animator.set_target("b|c", 0.1);
    animator.start();
    EXPECT_TRUE(animator.is_animating());

    queue.advance(16.0);
    const double rising = animator.get_current("a|b");
    const double falling = animator.get_current("b|c");
    EXPECT_GT(rising, 0.3);
    EXPECT_LT(rising, 0.8);
    EXPECT_LT(falling, 0.3);
    EXPECT_GT(falling, 0.1);

    queue.advance(2000.0);
    EXPECT_FALSE(animator.is_animating());
    EXPECT_EQ(animator.get_current("a|b"), 0.8);
    EXPECT_EQ(animator.get_current("b|c"), 0.1);
}

TEST_F(OpacityAnimatorTest, StartWhenSettledSchedulesNothing) {
    animator.set_immediate("a|b", 0.3);
    animator.start();
    EXPECT_FALSE(animator.is_animating());
    EXPECT_EQ(queue.pending(), 0u);
}

TEST_F(OpacityAnimatorTest, TickSnapsWithinEpsilon) {
    animator.set_immediate("k", 0.5);
    animator.set_target("k", 0.5 + OpacityAnimator::epsilon * 0.5);
    EXPECT_TRUE(animator.tick(1.0));
    EXPECT_DOUBLE_EQ(animator.get_current("k"), animator.get_target("k"));
}

TEST_F(OpacityAnimatorTest, UpdateCallbackFiresEachFrame) {
    int updates = 0;
    animator.set_on_update([&] { ++updates; });
    animator.set_immediate("k", 0.0);
    animator.set_target("k", 1.0);
    animator.start();
    queue.run_frame(16.0);
    queue.run_frame(32.0);
    EXPECT_EQ(updates, 2);
}

TEST_F(OpacityAnimatorTest, ClearStopsTheLoop) {
    animator.set_immediate("k", 0.0);
    animator.set_target("k", 1.0);
    animator.start();
    animator.clear();
    EXPECT_FALSE(animator.is_animating());
    EXPECT_EQ(queue.pending(), 0u);
    EXPECT_DOUBLE_EQ(animator.get_current("k", -1.0), -1.0);
}
