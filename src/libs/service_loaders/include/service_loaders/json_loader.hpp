#pragma once

#include <service_model/types.hpp>
#include <istream>
#include <optional>
#include <string>

namespace service_loaders {

// Catalog JSON: {"name", "services": {key: {...}}, "connections": [[a, b], ...]}.
// Service order follows the document order.
std::optional<service_model::ServiceCatalog> load_catalog_from_json(std::istream& in);
std::optional<service_model::ServiceCatalog> load_catalog_from_json_file(const std::string& path);

} // namespace service_loaders
