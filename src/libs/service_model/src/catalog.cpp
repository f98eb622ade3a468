#include <service_model/types.hpp>

namespace service_model {

const Service* ServiceCatalog::find(const std::string& key) const {
    for (const auto& s : services)
        if (s.key == key) return &s;
    return nullptr;
}

} // namespace service_model
