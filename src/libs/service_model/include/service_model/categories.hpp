#pragma once

#include <string>
#include <vector>

namespace service_model {

struct CategoryInfo {
    std::string id;
    std::string label;
};

// Every known category, in default placement priority.
const std::vector<CategoryInfo>& known_categories();

// Category ids in default placement priority (related categories adjacent).
std::vector<std::string> default_category_order();

// Display label for a category id; the id itself when unknown.
std::string category_label(const std::string& id);

bool is_known_category(const std::string& id);

} // namespace service_model
