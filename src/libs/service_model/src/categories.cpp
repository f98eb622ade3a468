#include <service_model/categories.hpp>

namespace service_model {

const std::vector<CategoryInfo>& known_categories() {
    static const std::vector<CategoryInfo> categories = {
        { "networking", "Networking & Content Delivery" },
        { "compute", "Compute" },
        { "storage", "Storage" },
        { "database", "Databases" },
        { "security", "Security, Identity & Compliance" },
        { "management", "Management & Governance" },
        { "messaging", "Application Integration" },
        { "devtools", "Developer Tools" },
        { "cdn", "Edge & CDN" },
        { "cost", "Cost Management" },
    };
    return categories;
}

std::vector<std::string> default_category_order() {
    std::vector<std::string> order;
    for (const auto& c : known_categories())
        order.push_back(c.id);
    return order;
}

std::string category_label(const std::string& id) {
    for (const auto& c : known_categories())
        if (c.id == id) return c.label;
    return id;
}

bool is_known_category(const std::string& id) {
    for (const auto& c : known_categories())
        if (c.id == id) return true;
    return false;
}

} // namespace service_model
