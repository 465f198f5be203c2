/**
 * @file config_loader.cpp
 * @brief XML configuration loading implementation
 *
 * Reads the mediator configuration with pugixml. Unset elements keep their
 * defaults.
 */

#include "simlink/api/config.h"
#include <pugixml.hpp>
#include <stdexcept>

namespace simlink::config {

namespace {

Milliseconds read_ms(const pugi::xml_node& node, Milliseconds fallback) {
    return Milliseconds(node.text().as_llong(fallback.count()));
}

MediatorConfig from_document(const pugi::xml_document& doc) {
    MediatorConfig config = MediatorConfig::defaults();

    auto root = doc.child("simlink_config");
    if (!root) {
        root = doc.child("config");
    }
    if (!root) {
        throw std::runtime_error("Invalid SimLink config XML: no root element");
    }

    // Connection settings
    if (auto connection = root.child("connection")) {
        config.connection.app_name =
            connection.child("app_name").text().as_string(config.connection.app_name.c_str());
        config.connection.retries =
            connection.child("retries").text().as_uint(config.connection.retries);
        config.connection.retry_interval =
            read_ms(connection.child("retry_interval_ms"), config.connection.retry_interval);
    }

    // Request settings
    if (auto requests = root.child("requests")) {
        config.requests.timeout = read_ms(requests.child("timeout_ms"), config.requests.timeout);
        config.requests.write_cleanup_delay =
            read_ms(requests.child("write_cleanup_ms"), config.requests.write_cleanup_delay);
    }

    // Airport database
    if (auto airports = root.child("airports")) {
        config.airports.enabled = airports.child("enabled").text().as_bool(config.airports.enabled);
        config.airports.cache_path =
            airports.child("cache_path").text().as_string(config.airports.cache_path.c_str());
        config.airports.default_radius_nm =
            airports.child("default_radius_nm").text().as_double(config.airports.default_radius_nm);
        config.airports.detail_timeout =
            read_ms(airports.child("detail_timeout_ms"), config.airports.detail_timeout);
    }

    // Logging
    if (auto logging = root.child("logging")) {
        config.logging.level = logging.child("level").text().as_string(config.logging.level.c_str());
        config.logging.console = logging.child("console").text().as_bool(config.logging.console);
        config.logging.file = logging.child("file").text().as_bool(config.logging.file);
        config.logging.file_path =
            logging.child("file_path").text().as_string(config.logging.file_path.c_str());
    }

    // Additional properties
    if (auto properties = root.child("properties")) {
        for (auto node : properties.children("property")) {
            property::PropertyDefinition definition;
            definition.name = node.attribute("name").as_string();
            definition.units = node.attribute("units").as_string();
            if (definition.name.empty()) {
                throw std::runtime_error("Invalid SimLink config XML: property without a name");
            }

            std::string type = node.attribute("type").as_string("FLOAT64");
            auto data_type = transport::data_type_from_string(type);
            if (!data_type) {
                throw std::runtime_error("Invalid SimLink config XML: unknown type '" + type +
                                         "' for property '" + definition.name + "'");
            }
            definition.data_type = *data_type;
            config.properties.push_back(std::move(definition));
        }
    }

    return config;
}

} // anonymous namespace

// ============================================================================
// MediatorConfig Implementation
// ============================================================================

MediatorConfig MediatorConfig::load(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());

    if (!result) {
        throw std::runtime_error("Failed to load config: " + std::string(result.description()));
    }
    return from_document(doc);
}

MediatorConfig MediatorConfig::parse(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());

    if (!result) {
        throw std::runtime_error("Failed to parse config: " + std::string(result.description()));
    }
    return from_document(doc);
}

MediatorConfig MediatorConfig::defaults() {
    return MediatorConfig{};
}

bool MediatorConfig::save(const std::string& path) const {
    pugi::xml_document doc;

    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("simlink_config");

    // Connection settings
    auto conn = root.append_child("connection");
    conn.append_child("app_name").text().set(connection.app_name.c_str());
    conn.append_child("retries").text().set(static_cast<unsigned int>(connection.retries));
    conn.append_child("retry_interval_ms").text().set(
        static_cast<long long>(connection.retry_interval.count()));

    // Request settings
    auto req = root.append_child("requests");
    req.append_child("timeout_ms").text().set(static_cast<long long>(requests.timeout.count()));
    req.append_child("write_cleanup_ms").text().set(
        static_cast<long long>(requests.write_cleanup_delay.count()));

    // Airport database
    auto apt = root.append_child("airports");
    apt.append_child("enabled").text().set(airports.enabled);
    apt.append_child("cache_path").text().set(airports.cache_path.c_str());
    apt.append_child("default_radius_nm").text().set(airports.default_radius_nm);
    apt.append_child("detail_timeout_ms").text().set(
        static_cast<long long>(airports.detail_timeout.count()));

    // Logging
    auto log = root.append_child("logging");
    log.append_child("level").text().set(logging.level.c_str());
    log.append_child("console").text().set(logging.console);
    log.append_child("file").text().set(logging.file);
    log.append_child("file_path").text().set(logging.file_path.c_str());

    // Additional properties
    auto props = root.append_child("properties");
    for (const auto& definition : properties) {
        auto node = props.append_child("property");
        node.append_attribute("name") = definition.name.c_str();
        node.append_attribute("units") = definition.units.c_str();
        node.append_attribute("type") = transport::data_type_to_string(definition.data_type);
    }

    return doc.save_file(path.c_str());
}

} // namespace simlink::config
