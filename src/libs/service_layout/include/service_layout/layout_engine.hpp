#pragma once

#include <service_layout/layout_config.hpp>
#include <service_layout/types.hpp>
#include <service_model/types.hpp>
#include <vector>

namespace service_layout {

// Deterministic grid placement: categories form a grid of `category_columns`
// groups per row, each group is a near-square grid of its members. Pure.
LayoutResult compute_layout(const std::vector<LayoutNode>& nodes, const LayoutConfig& config = {});

// Builds layout input from a catalog; missing widths use config.default_node_width.
std::vector<LayoutNode> make_layout_nodes(const service_model::ServiceCatalog& catalog,
    const NodeWidthMap& widths, const LayoutConfig& config = {});

// Catalog services carrying the computed centres, in layout order.
std::vector<service_model::PositionedService> apply_layout(const service_model::ServiceCatalog& catalog,
    const LayoutResult& layout);

// Closed-interval test: rectangles that touch count as overlapping.
bool nodes_overlap(const PositionedNode& a, const PositionedNode& b, double node_height);

// Every colliding pair (i < j, input order).
std::vector<OverlapPair> validate_all(const std::vector<PositionedNode>& nodes, double node_height);

} // namespace service_layout
