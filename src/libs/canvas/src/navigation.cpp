#include <canvas/navigation.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <tuple>

namespace canvas {

std::optional<std::size_t> find_in_direction(const std::vector<geometry::Point>& centers,
    std::size_t from, Direction direction, double threshold, double perpendicular_weight)
{
    if (from >= centers.size()) return std::nullopt;
    const geometry::Point origin = centers[from];

    std::optional<std::size_t> best;
    double best_score = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < centers.size(); ++i) {
        if (i == from) continue;
        const double dx = centers[i].x - origin.x;
        const double dy = centers[i].y - origin.y;

        double primary = 0.0;
        double perpendicular = 0.0;
        switch (direction) {
        case Direction::Right: primary = dx; perpendicular = dy; break;
        case Direction::Left: primary = -dx; perpendicular = dy; break;
        case Direction::Down: primary = dy; perpendicular = dx; break;
        case Direction::Up: primary = -dy; perpendicular = dx; break;
        }
        if (primary <= threshold) continue;

        const double score = primary + std::abs(perpendicular) * perpendicular_weight;
        if (score < best_score) {
            best_score = score;
            best = i;
        }
    }
    return best;
}

std::vector<std::size_t> tab_order(const std::vector<service_model::PositionedService>& services) {
    std::vector<std::size_t> order(services.size());
    for (std::size_t i = 0; i < order.size(); ++i)
        order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&services](std::size_t a, std::size_t b) {
        const auto& sa = services[a].service;
        const auto& sb = services[b].service;
        return std::tie(sa.category, sa.name, sa.key) < std::tie(sb.category, sb.name, sb.key);
    });
    return order;
}

geometry::Point pan_delta(Direction direction, double step) {
    switch (direction) {
    case Direction::Left: return { step, 0.0 };
    case Direction::Right: return { -step, 0.0 };
    case Direction::Up: return { 0.0, step };
    case Direction::Down: return { 0.0, -step };
    }
    return {};
}

} // namespace canvas
