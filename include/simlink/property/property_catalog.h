#pragma once
/**
 * @file property_catalog.h
 * @brief Table of simulator properties known to the mediator
 *
 * Maps a property name ("PLANE ALTITUDE") to the units and wire datatype
 * it is defined with. The built-in table covers the aircraft state used by
 * SimLink itself; applications extend it through the configuration file or
 * add().
 */

#include "simlink/transport/transport.h"
#include <map>
#include <string>
#include <vector>

namespace simlink::property {

/**
 * @brief Definition of one simulator property
 */
struct PropertyDefinition {
    std::string name;          ///< simulator name, with spaces
    std::string units;         ///< empty for string properties
    transport::DataType data_type{transport::DataType::Float64};

    bool operator==(const PropertyDefinition&) const = default;
};

class PropertyCatalog {
public:
    PropertyCatalog() = default;

    /**
     * @brief Catalog pre-populated with the built-in properties
     */
    static PropertyCatalog with_defaults();

    /**
     * @brief Add or replace a definition
     */
    void add(PropertyDefinition definition);

    /**
     * @brief Find a definition by simulator name
     * @return nullptr if unknown
     */
    const PropertyDefinition* find(const std::string& name) const;

    bool contains(const std::string& name) const { return find(name) != nullptr; }
    SizeT size() const { return definitions_.size(); }
    std::vector<std::string> names() const;

private:
    std::map<std::string, PropertyDefinition> definitions_;
};

} // namespace simlink::property
