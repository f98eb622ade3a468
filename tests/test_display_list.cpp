#include <gtest/gtest.h>
#include <service_render/display_list.hpp>
#include <service_render/scene_painter.hpp>
#include <service_render/style.hpp>

using service_render::Color;
using service_render::DisplayList;
using service_render::DrawCommandKind;

TEST(ColorTest, WithAlphaScalesAndClamps) {
    const Color c{ 10, 20, 30, 200 };
    EXPECT_EQ(service_render::with_alpha(c, 0.5).a, 100);
    EXPECT_EQ(service_render::with_alpha(c, 2.0).a, 200);
    EXPECT_EQ(service_render::with_alpha(c, -1.0).a, 0);
    EXPECT_EQ(service_render::with_alpha(c, 0.5).r, 10);
}

TEST(ColorTest, FromRgbHex) {
    const Color c = service_render::from_rgb_hex(0x8B5CF6);
    EXPECT_EQ(c.r, 139);
    EXPECT_EQ(c.g, 92);
    EXPECT_EQ(c.b, 246);
    EXPECT_EQ(c.a, 255);
}

TEST(DisplayListTest, ClearDropsCommandsAndResetsAlpha) {
    DisplayList list;
    list.set_global_alpha(0.5);
    list.draw_line({ 0, 0 }, { 1, 1 }, Color{ 255, 255, 255, 255 }, 1.0);
    EXPECT_EQ(list.commands().size(), 1u);
    EXPECT_EQ(list.commands()[0].color.a, 128);

    list.clear(service_render::style::background);
    EXPECT_TRUE(list.commands().empty());
    EXPECT_DOUBLE_EQ(list.global_alpha(), 1.0);
    EXPECT_EQ(list.clear_count(), 1u);
}

TEST(DisplayListTest, RoundedGradientSplitsIntoCapsAndSpan) {
    service_render::DrawCommand cmd;
    cmd.kind = DrawCommandKind::RectGradient;
    cmd.a = { 10.0, 0.0 };
    cmd.b = { 110.0, 40.0 };
    cmd.rounding = 8.0;
    auto span = service_render::split_rounded_gradient(cmd);
    EXPECT_DOUBLE_EQ(span.rounding, 8.0);
    EXPECT_DOUBLE_EQ(span.inner_min_x, 18.0);
    EXPECT_DOUBLE_EQ(span.inner_max_x, 102.0);

    // Rounding never exceeds half the shorter side.
    cmd.rounding = 30.0;
    span = service_render::split_rounded_gradient(cmd);
    EXPECT_DOUBLE_EQ(span.rounding, 20.0);
    EXPECT_DOUBLE_EQ(span.inner_min_x, 30.0);
    EXPECT_DOUBLE_EQ(span.inner_max_x, 90.0);

    cmd.rounding = 0.0;
    span = service_render::split_rounded_gradient(cmd);
    EXPECT_DOUBLE_EQ(span.rounding, 0.0);
    EXPECT_DOUBLE_EQ(span.inner_min_x, 10.0);
    EXPECT_DOUBLE_EQ(span.inner_max_x, 110.0);
}

TEST(ScenePainterTest, NodeDrawsShadowBodyAndLabel) {
    DisplayList list;
    service_render::NodeVisual node;
    node.center = { 100.0, 50.0 };
    node.width = 120.0;
    node.height = 40.0;
    node.scale = 2.0;
    node.label = "Lambda";
    node.category = "compute";

    service_render::paint_node(list, node);
    EXPECT_EQ(list.count(DrawCommandKind::RectGradient), 2u);
    EXPECT_EQ(list.count(DrawCommandKind::RectStroke), 0u);
    EXPECT_EQ(list.count(DrawCommandKind::TextCentered), 1u);

    const auto& body = list.commands()[1];
    EXPECT_DOUBLE_EQ(body.a.x, -20.0);
    EXPECT_DOUBLE_EQ(body.b.x, 220.0);
    EXPECT_DOUBLE_EQ(body.a.y, 10.0);
    EXPECT_DOUBLE_EQ(body.b.y, 90.0);
    EXPECT_DOUBLE_EQ(body.rounding, service_render::style::node_rounding * 2.0);
}

TEST(ScenePainterTest, SelectedNodeHasBorder) {
    DisplayList list;
    service_render::NodeVisual node;
    node.width = 100.0;
    node.height = 40.0;
    node.selected = true;
    service_render::paint_node(list, node);
    ASSERT_EQ(list.count(DrawCommandKind::RectStroke), 1u);
    EXPECT_EQ(list.count(DrawCommandKind::TextCentered), 0u);
}

TEST(ScenePainterTest, HighlightedConnectionIsThicker) {
    DisplayList list;
    service_render::paint_connection(list, { 0, 0 }, { 10, 0 }, 0.3, false, 1.0);
    service_render::paint_connection(list, { 0, 0 }, { 10, 0 }, 0.8, true, 1.0);
    ASSERT_EQ(list.commands().size(), 2u);
    EXPECT_DOUBLE_EQ(list.commands()[0].thickness, service_render::style::connection_width_normal);
    EXPECT_DOUBLE_EQ(list.commands()[1].thickness, service_render::style::connection_width_highlighted);
    EXPECT_LT(list.commands()[0].color.a, list.commands()[1].color.a);
}

TEST(CategoryColorsTest, UnknownCategoryIsGrey) {
    const auto known = service_render::category_colors("compute");
    const auto unknown = service_render::category_colors("no-such-category");
    EXPECT_EQ(unknown.start.r, unknown.start.g);
    EXPECT_EQ(unknown.start.g, unknown.start.b);
    EXPECT_FALSE(known.start.r == known.start.g && known.start.g == known.start.b);
}
