/**
 * @file property_catalog.cpp
 * @brief Property catalog implementation
 */

#include "simlink/property/property_catalog.h"

namespace simlink::property {

using transport::DataType;

PropertyCatalog PropertyCatalog::with_defaults() {
    PropertyCatalog catalog;

    // Position
    catalog.add({"PLANE LATITUDE", "degrees", DataType::Float64});
    catalog.add({"PLANE LONGITUDE", "degrees", DataType::Float64});
    catalog.add({"PLANE ALTITUDE", "feet", DataType::Float64});
    catalog.add({"PLANE ALT ABOVE GROUND", "feet", DataType::Float64});

    // Attitude
    catalog.add({"PLANE HEADING DEGREES TRUE", "degrees", DataType::Float64});
    catalog.add({"PLANE HEADING DEGREES MAGNETIC", "degrees", DataType::Float64});
    catalog.add({"PLANE PITCH DEGREES", "degrees", DataType::Float64});
    catalog.add({"PLANE BANK DEGREES", "degrees", DataType::Float64});

    // Velocity
    catalog.add({"AIRSPEED INDICATED", "knots", DataType::Float64});
    catalog.add({"AIRSPEED TRUE", "knots", DataType::Float64});
    catalog.add({"GROUND VELOCITY", "knots", DataType::Float64});
    catalog.add({"VERTICAL SPEED", "feet per minute", DataType::Float64});

    // State
    catalog.add({"SIM ON GROUND", "bool", DataType::Int32});
    catalog.add({"CAMERA STATE", "number", DataType::Int32});
    catalog.add({"TITLE", "", DataType::String256});

    return catalog;
}

void PropertyCatalog::add(PropertyDefinition definition) {
    std::string key = definition.name;
    definitions_.insert_or_assign(std::move(key), std::move(definition));
}

const PropertyDefinition* PropertyCatalog::find(const std::string& name) const {
    auto it = definitions_.find(name);
    return it == definitions_.end() ? nullptr : &it->second;
}

std::vector<std::string> PropertyCatalog::names() const {
    std::vector<std::string> result;
    result.reserve(definitions_.size());
    for (const auto& entry : definitions_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace simlink::property
