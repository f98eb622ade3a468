#include <service_layout/node_widths.hpp>
#include <algorithm>

namespace service_layout {

double compute_node_width(const std::string& text, const TextMeasure& measure,
    const NodeWidthConfig& config)
{
    const double text_width = measure ? measure(text) : 0.0;
    const double width = text_width + config.horizontal_padding;
    return std::min(config.max_width, std::max(config.min_width, width));
}

NodeWidthMap compute_node_widths(const std::vector<service_model::Service>& services,
    const TextMeasure& measure, const NodeWidthConfig& config)
{
    NodeWidthMap widths;
    for (const auto& s : services)
        widths[s.key] = compute_node_width(s.name, measure, config);
    return widths;
}

} // namespace service_layout
