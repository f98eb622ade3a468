#pragma once

#include <geometry/types.hpp>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace service_layout {

// Service key -> display width in pixels (precomputed from text measurement).
using NodeWidthMap = std::unordered_map<std::string, double>;

struct LayoutNode {
    std::string id;
    std::string category;
    double width = 0;
};

struct PositionedNode {
    std::string id;
    std::string category;
    double x = 0; // centre
    double y = 0; // centre
    double width = 0;
};

struct CategoryGroup {
    std::string category;
    std::vector<std::string> node_ids;
    geometry::Rect rect;
};

struct Bounds {
    double min_x = 0;
    double max_x = 0;
    double min_y = 0;
    double max_y = 0;

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
};

struct LayoutResult {
    std::vector<PositionedNode> nodes;   // category order, then id order
    std::vector<CategoryGroup> groups;   // category order
    Bounds bounds;
};

using OverlapPair = std::pair<std::string, std::string>;

} // namespace service_layout
