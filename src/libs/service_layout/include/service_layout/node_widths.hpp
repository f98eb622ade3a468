#pragma once

#include <service_layout/layout_config.hpp>
#include <service_layout/types.hpp>
#include <service_model/types.hpp>
#include <functional>
#include <string>
#include <vector>

namespace service_layout {

// Returns the rendered width of a label in pixels.
using TextMeasure = std::function<double(const std::string&)>;

double compute_node_width(const std::string& text, const TextMeasure& measure,
    const NodeWidthConfig& config = {});

NodeWidthMap compute_node_widths(const std::vector<service_model::Service>& services,
    const TextMeasure& measure, const NodeWidthConfig& config = {});

} // namespace service_layout
