#pragma once

#include <string>
#include <vector>

namespace service_model {

struct Resource {
    std::string title;
    std::string url;
};

struct Service {
    std::string key;
    std::string name;
    std::string category;
    std::string description;
    std::string details;
    std::vector<std::string> key_points;
    std::string extended_description;
    std::vector<Resource> resources;
};

// Undirected link between two service keys.
struct Connection {
    std::string from;
    std::string to;
};

struct ServiceCatalog {
    std::string name;
    std::vector<Service> services;
    std::vector<Connection> connections;

    const Service* find(const std::string& key) const;
};

// Service with its computed world-space centre.
struct PositionedService {
    Service service;
    double x = 0;
    double y = 0;
};

} // namespace service_model
