#include <service_loaders/json_loader.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace service_loaders {

namespace {

using json = nlohmann::ordered_json;

std::string string_or_empty(const json& j, const char* field) {
    return j.contains(field) && j[field].is_string() ? j[field].get<std::string>() : "";
}

std::optional<service_model::Service> parse_service(const std::string& key, const json& s) {
    if (!s.is_object()) return std::nullopt;
    if (!s.contains("name") || !s["name"].is_string()) return std::nullopt;
    if (!s.contains("category") || !s["category"].is_string()) return std::nullopt;

    service_model::Service service;
    service.key = key;
    service.name = s["name"].get<std::string>();
    service.category = s["category"].get<std::string>();
    service.description = string_or_empty(s, "description");
    service.details = string_or_empty(s, "details");
    service.extended_description = string_or_empty(s, "extendedDescription");

    if (s.contains("keyPoints") && s["keyPoints"].is_array()) {
        for (const auto& p : s["keyPoints"])
            if (p.is_string()) service.key_points.push_back(p.get<std::string>());
    }
    if (s.contains("resources") && s["resources"].is_array()) {
        for (const auto& r : s["resources"]) {
            if (!r.is_object()) continue;
            service.resources.push_back(service_model::Resource{ string_or_empty(r, "title"), string_or_empty(r, "url") });
        }
    }
    return service;
}

std::optional<service_model::ServiceCatalog> parse_catalog_json(const json& j) {
    service_model::ServiceCatalog out;
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("services") || !j["services"].is_object()) return std::nullopt;

    for (const auto& [key, value] : j["services"].items()) {
        auto service = parse_service(key, value);
        if (!service) return std::nullopt;
        out.services.push_back(std::move(*service));
    }

    if (j.contains("connections")) {
        if (!j["connections"].is_array()) return std::nullopt;
        for (const auto& c : j["connections"]) {
            if (!c.is_array() || c.size() != 2 || !c[0].is_string() || !c[1].is_string())
                return std::nullopt;
            out.connections.push_back(service_model::Connection{ c[0].get<std::string>(), c[1].get<std::string>() });
        }
    }

    out.name = string_or_empty(j, "name");
    return out;
}

} // namespace

std::optional<service_model::ServiceCatalog> load_catalog_from_json(std::istream& in) {
    try {
        json j = json::parse(in);
        return parse_catalog_json(j);
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::optional<service_model::ServiceCatalog> load_catalog_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_catalog_from_json(f);
}

} // namespace service_loaders
