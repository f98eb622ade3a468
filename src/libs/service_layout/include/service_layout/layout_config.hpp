#pragma once

#include <service_model/categories.hpp>
#include <string>
#include <vector>

namespace service_layout {

// All values in world units.
struct LayoutConfig {
    double default_node_width = 120.0;
    double node_height = 40.0;
    double node_padding = 30.0;      // between nodes inside a category
    double category_padding = 80.0;  // between category groups
    int category_columns = 4;        // category groups per row
    // Placement priority; categories missing here follow in alphabetical order.
    std::vector<std::string> category_order = service_model::default_category_order();
};

struct NodeWidthConfig {
    double min_width = 80.0;
    double max_width = 200.0;
    double horizontal_padding = 24.0; // 12 on each side of the label
};

} // namespace service_layout
