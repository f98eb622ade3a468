#include <gtest/gtest.h>
#include <service_loaders/builtin_catalog.hpp>
#include <service_loaders/json_loader.hpp>
#include <service_model/categories.hpp>
#include <set>
#include <sstream>
#include <string>

namespace {

std::optional<service_model::ServiceCatalog> parse(const std::string& text) {
    std::istringstream in(text);
    return service_loaders::load_catalog_from_json(in);
}

} // namespace

TEST(JsonLoaderTest, LoadsServicesInDocumentOrder) {
    const auto catalog = parse(R"({
        "name": "Sample",
        "services": {
            "s3": { "name": "S3", "category": "storage", "description": "Objects",
                    "keyPoints": ["durable", "cheap"],
                    "resources": [{ "title": "Docs", "url": "https://example.com/s3" }] },
            "ec2": { "name": "EC2", "category": "compute", "extendedDescription": "VMs" }
        },
        "connections": [["s3", "ec2"]]
    })");
    ASSERT_TRUE(catalog.has_value());
    EXPECT_EQ(catalog->name, "Sample");
    ASSERT_EQ(catalog->services.size(), 2u);
    EXPECT_EQ(catalog->services[0].key, "s3");
    EXPECT_EQ(catalog->services[1].key, "ec2");
    EXPECT_EQ(catalog->services[0].description, "Objects");
    ASSERT_EQ(catalog->services[0].key_points.size(), 2u);
    EXPECT_EQ(catalog->services[0].key_points[1], "cheap");
    ASSERT_EQ(catalog->services[0].resources.size(), 1u);
    EXPECT_EQ(catalog->services[0].resources[0].url, "https://example.com/s3");
    EXPECT_EQ(catalog->services[1].extended_description, "VMs");

    ASSERT_EQ(catalog->connections.size(), 1u);
    EXPECT_EQ(catalog->connections[0].from, "s3");
    EXPECT_EQ(catalog->connections[0].to, "ec2");
    ASSERT_NE(catalog->find("ec2"), nullptr);
    EXPECT_EQ(catalog->find("ec2")->name, "EC2");
    EXPECT_EQ(catalog->find("missing"), nullptr);
}

TEST(JsonLoaderTest, KeepsConnectionsToUnknownServices) {
    const auto catalog = parse(R"({
        "services": { "a": { "name": "A", "category": "compute" } },
        "connections": [["a", "ghost"]]
    })");
    ASSERT_TRUE(catalog.has_value());
    EXPECT_EQ(catalog->connections.size(), 1u);
}

TEST(JsonLoaderTest, MissingConnectionsIsEmpty) {
    const auto catalog = parse(R"({ "services": {} })");
    ASSERT_TRUE(catalog.has_value());
    EXPECT_TRUE(catalog->services.empty());
    EXPECT_TRUE(catalog->connections.empty());
}

TEST(JsonLoaderTest, RejectsMalformedDocuments) {
    EXPECT_FALSE(parse("not json").has_value());
    EXPECT_FALSE(parse("[]").has_value());
    EXPECT_FALSE(parse(R"({ "name": "no services" })").has_value());
    EXPECT_FALSE(parse(R"({ "services": { "a": { "category": "compute" } } })").has_value());
    EXPECT_FALSE(parse(R"({ "services": { "a": { "name": "A", "category": 3 } } })").has_value());
    EXPECT_FALSE(parse(R"({ "services": {}, "connections": [["a"]] })").has_value());
    EXPECT_FALSE(parse(R"({ "services": {}, "connections": [["a", 1]] })").has_value());
}

TEST(JsonLoaderTest, MissingFile) {
    EXPECT_FALSE(service_loaders::load_catalog_from_json_file("/nonexistent/services.json").has_value());
}

TEST(BuiltinCatalogTest, EveryServiceIsValid) {
    const auto catalog = service_loaders::generate_builtin_catalog();
    EXPECT_FALSE(catalog.services.empty());

    std::set<std::string> keys;
    std::set<std::string> categories;
    for (const auto& s : catalog.services) {
        EXPECT_TRUE(keys.insert(s.key).second) << "duplicate key " << s.key;
        EXPECT_FALSE(s.name.empty());
        EXPECT_TRUE(service_model::is_known_category(s.category)) << s.category;
        categories.insert(s.category);
    }
    EXPECT_EQ(categories.size(), service_model::known_categories().size());

    for (const auto& c : catalog.connections) {
        EXPECT_TRUE(keys.count(c.from)) << c.from;
        EXPECT_TRUE(keys.count(c.to)) << c.to;
    }
}

TEST(CategoriesTest, DefaultOrderAndLabels) {
    const auto order = service_model::default_category_order();
    ASSERT_EQ(order.size(), 10u);
    EXPECT_EQ(order.front(), "networking");
    EXPECT_EQ(order.back(), "cost");
    EXPECT_EQ(service_model::category_label("compute"), "Compute");
    EXPECT_EQ(service_model::category_label("custom"), "custom");
}
