#include <gtest/gtest.h>
#include <service_layout/node_widths.hpp>
#include "test_helpers.hpp"
#include <string>

namespace {

double eight_px_per_char(const std::string& text) {
    return static_cast<double>(text.size()) * 8.0;
}

} // namespace

TEST(NodeWidthsTest, LabelWidthPlusPadding) {
    EXPECT_DOUBLE_EQ(service_layout::compute_node_width("Lambda Function", eight_px_per_char), 15 * 8.0 + 24.0);
}

TEST(NodeWidthsTest, ClampedToMinimum) {
    EXPECT_DOUBLE_EQ(service_layout::compute_node_width("S3", eight_px_per_char), 80.0);
}

TEST(NodeWidthsTest, ClampedToMaximum) {
    const std::string label(60, 'x');
    EXPECT_DOUBLE_EQ(service_layout::compute_node_width(label, eight_px_per_char), 200.0);
}

TEST(NodeWidthsTest, CustomLimits) {
    service_layout::NodeWidthConfig config;
    config.min_width = 10.0;
    config.max_width = 1000.0;
    config.horizontal_padding = 0.0;
    EXPECT_DOUBLE_EQ(service_layout::compute_node_width("abc", eight_px_per_char, config), 24.0);
}

TEST(NodeWidthsTest, MapKeyedByServiceKey) {
    const std::vector<service_model::Service> services = {
        test_utils::make_service("ec2", "Elastic Compute Cloud", "compute"),
        test_utils::make_service("s3", "S3", "storage"),
    };
    const auto widths = service_layout::compute_node_widths(services, eight_px_per_char);
    ASSERT_EQ(widths.size(), 2u);
    EXPECT_DOUBLE_EQ(widths.at("ec2"), 21 * 8.0 + 24.0);
    EXPECT_DOUBLE_EQ(widths.at("s3"), 80.0);
}
