#pragma once

#include <geometry/types.hpp>
#include <service_model/types.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace canvas {

enum class Direction { Up, Down, Left, Right };

// Nearest node from `from` in `direction`: candidates must lie more than
// `threshold` away along the primary axis; the lowest
// `primary + perpendicular * perpendicular_weight` wins, earlier index on ties.
std::optional<std::size_t> find_in_direction(const std::vector<geometry::Point>& centers,
    std::size_t from, Direction direction, double threshold, double perpendicular_weight);

// Indices sorted by (category, name, key).
std::vector<std::size_t> tab_order(const std::vector<service_model::PositionedService>& services);

// Pan delta that shows more of the world in `direction`.
geometry::Point pan_delta(Direction direction, double step);

} // namespace canvas
