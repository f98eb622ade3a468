#pragma once

#include <service_model/types.hpp>

namespace service_loaders {

// Sample cloud service catalog used when no data file is found.
service_model::ServiceCatalog generate_builtin_catalog();

} // namespace service_loaders
