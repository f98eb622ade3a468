#include <service_layout/layout_engine.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <unordered_map>
#include <unordered_set>

namespace service_layout {

namespace {

struct GroupDims {
    std::string category;
    std::vector<const LayoutNode*> members;
    int cols = 1;
    int rows = 1;
    double max_node_width = 0;
    double width = 0;
    double height = 0;
};

// Listed categories first (priority order), then the rest alphabetically.
std::vector<std::string> ordered_categories(const std::map<std::string, std::vector<const LayoutNode*>>& grouped,
    const std::vector<std::string>& priority)
{
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& c : priority) {
        if (grouped.count(c) && seen.insert(c).second)
            out.push_back(c);
    }
    for (const auto& kv : grouped) {
        if (!seen.count(kv.first))
            out.push_back(kv.first);
    }
    return out;
}

GroupDims measure_group(const std::string& category, std::vector<const LayoutNode*> members,
    const LayoutConfig& config)
{
    GroupDims g;
    g.category = category;
    std::sort(members.begin(), members.end(),
        [](const LayoutNode* a, const LayoutNode* b) { return a->id < b->id; });
    g.members = std::move(members);

    const auto n = static_cast<int>(g.members.size());
    g.cols = std::max(1, static_cast<int>(std::ceil(std::sqrt(static_cast<double>(n)))));
    g.rows = (n + g.cols - 1) / g.cols;

    for (const auto* m : g.members)
        g.max_node_width = std::max(g.max_node_width, m->width);

    g.width = g.cols * (g.max_node_width + config.node_padding) - config.node_padding;
    g.height = g.rows * (config.node_height + config.node_padding) - config.node_padding;
    return g;
}

} // namespace

LayoutResult compute_layout(const std::vector<LayoutNode>& nodes, const LayoutConfig& config) {
    LayoutResult out;
    if (nodes.empty()) return out;

    std::map<std::string, std::vector<const LayoutNode*>> grouped;
    for (const auto& n : nodes)
        grouped[n.category].push_back(&n);

    std::vector<GroupDims> groups;
    for (const auto& category : ordered_categories(grouped, config.category_order))
        groups.push_back(measure_group(category, grouped[category], config));

    const int columns = std::max(1, config.category_columns);
    const double cell_height = config.node_height + config.node_padding;

    double current_x = 0.0;
    double current_y = 0.0;
    double row_max_height = 0.0;
    int col_count = 0;

    double min_x = std::numeric_limits<double>::infinity();
    double max_x = -std::numeric_limits<double>::infinity();
    double min_y = std::numeric_limits<double>::infinity();
    double max_y = -std::numeric_limits<double>::infinity();

    for (const auto& g : groups) {
        if (col_count >= columns) {
            current_x = 0.0;
            current_y += row_max_height + config.category_padding;
            row_max_height = 0.0;
            col_count = 0;
        }

        CategoryGroup cg;
        cg.category = g.category;
        cg.rect = geometry::Rect{ current_x, current_y, g.width, g.height };

        const double cell_width = g.max_node_width + config.node_padding;
        for (std::size_t i = 0; i < g.members.size(); ++i) {
            const auto* m = g.members[i];
            const auto col = static_cast<int>(i) % g.cols;
            const auto row = static_cast<int>(i) / g.cols;

            PositionedNode pn;
            pn.id = m->id;
            pn.category = m->category;
            pn.width = m->width;
            pn.x = current_x + col * cell_width + g.max_node_width * 0.5;
            pn.y = current_y + row * cell_height + config.node_height * 0.5;

            min_x = std::min(min_x, pn.x - pn.width * 0.5);
            max_x = std::max(max_x, pn.x + pn.width * 0.5);
            min_y = std::min(min_y, pn.y - config.node_height * 0.5);
            max_y = std::max(max_y, pn.y + config.node_height * 0.5);

            cg.node_ids.push_back(pn.id);
            out.nodes.push_back(std::move(pn));
        }
        out.groups.push_back(std::move(cg));

        current_x += g.width + config.category_padding;
        row_max_height = std::max(row_max_height, g.height);
        ++col_count;
    }

    out.bounds = Bounds{ min_x, max_x, min_y, max_y };
    return out;
}

std::vector<LayoutNode> make_layout_nodes(const service_model::ServiceCatalog& catalog,
    const NodeWidthMap& widths, const LayoutConfig& config)
{
    std::vector<LayoutNode> out;
    out.reserve(catalog.services.size());
    for (const auto& s : catalog.services) {
        LayoutNode n;
        n.id = s.key;
        n.category = s.category;
        const auto it = widths.find(s.key);
        n.width = it != widths.end() ? it->second : config.default_node_width;
        out.push_back(std::move(n));
    }
    return out;
}

std::vector<service_model::PositionedService> apply_layout(const service_model::ServiceCatalog& catalog,
    const LayoutResult& layout)
{
    std::unordered_map<std::string, const service_model::Service*> by_key;
    for (const auto& s : catalog.services)
        by_key[s.key] = &s;

    std::vector<service_model::PositionedService> out;
    out.reserve(layout.nodes.size());
    for (const auto& n : layout.nodes) {
        const auto it = by_key.find(n.id);
        if (it == by_key.end()) continue;
        service_model::PositionedService ps;
        ps.service = *it->second;
        ps.x = n.x;
        ps.y = n.y;
        out.push_back(std::move(ps));
    }
    return out;
}

bool nodes_overlap(const PositionedNode& a, const PositionedNode& b, double node_height) {
    const double half_h = node_height * 0.5;
    const double a_left = a.x - a.width * 0.5;
    const double a_right = a.x + a.width * 0.5;
    const double b_left = b.x - b.width * 0.5;
    const double b_right = b.x + b.width * 0.5;
    return !(a_right < b_left || a_left > b_right ||
             a.y + half_h < b.y - half_h || a.y - half_h > b.y + half_h);
}

std::vector<OverlapPair> validate_all(const std::vector<PositionedNode>& nodes, double node_height) {
    std::vector<OverlapPair> overlaps;
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        for (std::size_t j = i + 1; j < nodes.size(); ++j) {
            if (nodes_overlap(nodes[i], nodes[j], node_height))
                overlaps.emplace_back(nodes[i].id, nodes[j].id);
        }
    }
    return overlaps;
}

} // namespace service_layout
