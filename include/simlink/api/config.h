#pragma once
/**
 * @file config.h
 * @brief Mediator configuration loading and management
 *
 * Example:
 * @code{.xml}
 * <simlink_config>
 *   <connection>
 *     <app_name>SimLink</app_name>
 *     <retries>5</retries>
 *     <retry_interval_ms>2000</retry_interval_ms>
 *   </connection>
 *   <requests>
 *     <timeout_ms>10000</timeout_ms>
 *     <write_cleanup_ms>500</write_cleanup_ms>
 *   </requests>
 *   <airports>
 *     <enabled>true</enabled>
 *     <cache_path>airport.db.gz</cache_path>
 *     <default_radius_nm>200</default_radius_nm>
 *     <detail_timeout_ms>5000</detail_timeout_ms>
 *   </airports>
 *   <logging>
 *     <level>info</level>
 *     <console>true</console>
 *     <file>false</file>
 *     <file_path>simlink.log</file_path>
 *   </logging>
 *   <properties>
 *     <property name="FUEL TOTAL QUANTITY" units="gallons" type="FLOAT64"/>
 *   </properties>
 * </simlink_config>
 * @endcode
 */

#include "simlink/core/constants.h"
#include "simlink/core/logging.h"
#include "simlink/facility/airport_cache.h"
#include "simlink/property/property_catalog.h"
#include <string>
#include <vector>

namespace simlink::config {

struct ConnectionSettings {
    std::string app_name{"SimLink"};
    UInt32 retries{0};
    Milliseconds retry_interval{1000};
};

struct RequestSettings {
    Milliseconds timeout{constants::DEFAULT_REQUEST_TIMEOUT};          ///< 0 disables
    Milliseconds write_cleanup_delay{constants::DEFAULT_WRITE_CLEANUP_DELAY};
};

/**
 * @brief Mediator configuration loaded from XML
 */
struct MediatorConfig {
    ConnectionSettings connection;
    RequestSettings requests;
    facility::AirportSettings airports;
    /// Process-wide: only applied by the first Orchestrator to initialize the Logger
    LoggingOptions logging;

    /// Added to the built-in property catalog
    std::vector<property::PropertyDefinition> properties;

    /**
     * @brief Load configuration from XML file
     * @throws std::runtime_error on a missing file or malformed XML
     */
    static MediatorConfig load(const std::string& path);

    /**
     * @brief Load configuration from an XML string
     * @throws std::runtime_error on malformed XML
     */
    static MediatorConfig parse(const std::string& xml);

    /**
     * @brief Create default configuration
     */
    static MediatorConfig defaults();

    /**
     * @brief Save configuration to XML file
     */
    bool save(const std::string& path) const;
};

} // namespace simlink::config
