/**
 * @file orchestrator.cpp
 * @brief SimLink facade implementation
 */

#include "simlink/api/orchestrator.h"
#include "simlink/core/logging.h"
#include "simlink/facility/record_decoder.h"

namespace simlink::api {

using property::PropertyDefinition;
using property::PropertyValue;
using property::PropertyValues;
using transport::InboundEvent;
using transport::InboundKind;
using transport::TransportResult;

namespace {

SimError transport_error(TransportResult result, const std::string& subject) {
    return SimError(ErrorCode::TransportFailure, subject,
                    std::string("Transport refused request for \"") + subject + "\": " +
                    transport::transport_result_to_string(result));
}

SimError not_connected(const std::string& subject) {
    return SimError(ErrorCode::NotConnected, subject, "Not connected to the simulator");
}

core::Scheduler::ClockFn clock_or_steady(core::Scheduler::ClockFn clock) {
    if (clock) {
        return clock;
    }
    return [] { return Clock::now(); };
}

} // namespace

Orchestrator::Orchestrator(std::unique_ptr<transport::ITransport> transport,
                           config::MediatorConfig config,
                           std::unique_ptr<transport::ITransport> facility_transport,
                           core::Scheduler::ClockFn clock)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , facility_transport_(std::move(facility_transport))
    , catalog_(property::PropertyCatalog::with_defaults())
    , scheduler_(clock_or_steady(std::move(clock)))
    , ids_()
    , multiplexer_(*transport_, ids_)
    , correlator_(ids_, scheduler_)
    , cache_(facility_transport_ ? *facility_transport_ : *transport_,
             ids_, scheduler_, config_.airports) {

    if (Logger::is_initialized()) {
        SIMLINK_LOG_DEBUG("Logger already initialized; logging options of this instance ignored");
    } else {
        Logger::initialize(config_.logging);
    }

    for (const auto& definition : config_.properties) {
        catalog_.add(definition);
    }

    // Range notifications share one facility-list subscription, made on connect
    in_range_id_ = ids_.next_id();
    out_of_range_id_ = ids_.next_id();
    multiplexer_.register_local(AIRPORTS_IN_RANGE_EVENT, in_range_id_);
    multiplexer_.register_local(AIRPORTS_OUT_OF_RANGE_EVENT, out_of_range_id_);
}

Orchestrator::~Orchestrator() {
    disconnect();
}

// ============================================================================
// Connection
// ============================================================================

Deferred<Done> Orchestrator::connect() {
    ConnectOptions options;
    options.retries = config_.connection.retries;
    options.retry_interval = config_.connection.retry_interval;
    return connect(std::move(options));
}

Deferred<Done> Orchestrator::connect(ConnectOptions options) {
    Deferred<Done> result;
    if (connected_) {
        result.resolve(Done{});
        return result;
    }
    attempt_connect(std::move(options), result);
    return result;
}

void Orchestrator::attempt_connect(ConnectOptions options, Deferred<Done> result) {
    TransportResult status = transport_->open(config_.connection.app_name);
    if (status == TransportResult::Success || status == TransportResult::AlreadyOpen) {
        connected_ = true;
        SIMLINK_LOG_INFO("Connected to simulator as '{}'", config_.connection.app_name);
        on_connected();
        if (options.on_connect) {
            options.on_connect();
        }
        result.resolve(Done{});
        return;
    }

    if (options.retries > 0) {
        --options.retries;
        SIMLINK_LOG_WARN("Connection failed ({}); retrying in {} ms, {} retries left",
                         transport::transport_result_to_string(status),
                         options.retry_interval.count(), options.retries);
        if (options.on_retry) {
            options.on_retry(options.retries, options.retry_interval);
        }
        Milliseconds interval = options.retry_interval;
        scheduler_.call_after(interval, [this, options = std::move(options), result]() mutable {
            attempt_connect(std::move(options), result);
        });
        return;
    }

    SIMLINK_LOG_ERROR("No connection to the simulator: {}",
                      transport::transport_result_to_string(status));
    result.reject(SimError(ErrorCode::ConnectionFailed, config_.connection.app_name,
                           "No connection to the simulator"));
}

void Orchestrator::on_connected() {
    TransportResult status = transport_->subscribe_to_facility_list(
        constants::FACILITY_LIST_TYPE_AIRPORT, in_range_id_, out_of_range_id_);
    if (status != TransportResult::Success) {
        SIMLINK_LOG_ERROR("Subscribing to airport range notifications failed: {}",
                          transport::transport_result_to_string(status));
    }

    if (!config_.airports.enabled) {
        return;
    }

    if (facility_transport_) {
        status = facility_transport_->open(config_.connection.app_name + " airports");
        if (status != TransportResult::Success && status != TransportResult::AlreadyOpen) {
            SIMLINK_LOG_ERROR("Opening the airport connection failed: {}",
                              transport::transport_result_to_string(status));
        }
    }

    cache_.start();
    if (facility_transport_) {
        cache_.ready()
            .then([this](const Done&) { facility_transport_->close(); })
            .on_error([this](const SimError&) { facility_transport_->close(); });
    }
}

void Orchestrator::disconnect() {
    if (facility_transport_ && facility_transport_->is_open()) {
        facility_transport_->close();
    }
    if (transport_->is_open()) {
        transport_->close();
    }
    if (connected_) {
        SIMLINK_LOG_INFO("Disconnected from simulator");
    }
    connected_ = false;
}

void Orchestrator::clear_definition(ResourceId id) {
    TransportResult status = transport_->clear_definition(id);
    if (status != TransportResult::Success) {
        SIMLINK_LOG_WARN("Clearing definition {} failed: {}",
                         id, transport::transport_result_to_string(status));
    }
}

// ============================================================================
// Properties
// ============================================================================

Deferred<PropertyValues> Orchestrator::get(const std::vector<std::string>& names) {
    if (!connected_) {
        return rejected<PropertyValues>(not_connected(names.empty() ? "" : names.front()));
    }
    if (names.empty()) {
        return rejected<PropertyValues>(
            SimError(ErrorCode::InvalidValue, "", "No properties requested"));
    }

    std::vector<std::string> sim_names;
    sim_names.reserve(names.size());
    for (const auto& name : names) {
        sim_names.push_back(property::sim_name(name));
    }

    // Filled by issue(), read by the response handler
    auto definitions = std::make_shared<std::vector<PropertyDefinition>>();

    request::IssueFn issue = [this, sim_names, definitions](ResourceId id)
        -> std::optional<SimError> {
        for (const auto& name : sim_names) {
            const PropertyDefinition* definition = catalog_.find(name);
            if (!definition) {
                SIMLINK_LOG_WARN("get: unknown property '{}'", name);
                return SimError::unknown_property(name, "get");
            }
            TransportResult status = transport_->define_property(
                id, definition->name, definition->units, definition->data_type);
            if (status != TransportResult::Success) {
                return transport_error(status, name);
            }
            definitions->push_back(*definition);
        }

        // The definition ID doubles as the request ID
        TransportResult status = transport_->request_data_once(id, id);
        if (status != TransportResult::Success) {
            return transport_error(status, sim_names.front());
        }
        return std::nullopt;
    };

    std::function<PropertyValues(const InboundEvent&)> on_match =
        [definitions](const InboundEvent& event) {
            std::optional<PropertyValues> values =
                property::decode_property_values(*definitions, event.payload);
            if (!values) {
                throw SimError(ErrorCode::DecodeFailed, definitions->front().name,
                               "Data response for request " + std::to_string(event.id) +
                               " is too short (" + std::to_string(event.payload.size()) +
                               " bytes)");
            }
            return std::move(*values);
        };

    request::RequestOptions options;
    options.timeout = config_.requests.timeout;
    options.cleanup = [this](ResourceId id) { clear_definition(id); };

    return correlator_.request<PropertyValues>(std::move(issue), std::move(on_match),
                                               std::move(options));
}

Deferred<Done> Orchestrator::set(const std::string& name, const PropertyValue& value) {
    std::string sim = property::sim_name(name);
    if (!connected_) {
        return rejected<Done>(not_connected(sim));
    }

    request::IssueFn issue = [this, sim, value](ResourceId id) -> std::optional<SimError> {
        const PropertyDefinition* definition = catalog_.find(sim);
        if (!definition) {
            SIMLINK_LOG_WARN("set: unknown property '{}'", sim);
            return SimError::unknown_property(sim, "set");
        }

        std::optional<std::vector<UInt8>> payload = property::encode_property_value(*definition, value);
        if (!payload) {
            return SimError(ErrorCode::InvalidValue, sim,
                            "Cannot set SimVar: \"" + sim + "\" to a value of the wrong type.");
        }

        TransportResult status = transport_->define_property(
            id, definition->name, definition->units, definition->data_type);
        if (status != TransportResult::Success) {
            return transport_error(status, sim);
        }
        status = transport_->write_data(id, *payload);
        if (status != TransportResult::Success) {
            return transport_error(status, sim);
        }
        return std::nullopt;
    };

    return correlator_.fire_and_forget(std::move(issue), config_.requests.write_cleanup_delay,
                                       [this](ResourceId id) { clear_definition(id); });
}

ScheduleToken Orchestrator::schedule(ScheduleHandler handler, Milliseconds interval,
                                     std::vector<std::string> names) {
    auto running = std::make_shared<bool>(true);
    run_schedule(std::move(handler), interval, std::move(names), running);
    return ScheduleToken(running);
}

void Orchestrator::run_schedule(ScheduleHandler handler, Milliseconds interval,
                                std::vector<std::string> names, std::shared_ptr<bool> running) {
    auto next_tick = [this, handler, interval, names, running] {
        if (!*running) {
            return;
        }
        scheduler_.call_after(interval, [this, handler, interval, names, running] {
            if (*running) {
                run_schedule(handler, interval, names, running);
            }
        });
    };

    get(names)
        .then([handler, next_tick](const PropertyValues& values) {
            handler(values);
            next_tick();
        })
        .on_error([running, next_tick](const SimError& error) {
            SIMLINK_LOG_WARN("Scheduled get failed: {}", error.what());
            if (error.code() == ErrorCode::UnknownProperty) {
                *running = false;
                return;
            }
            next_tick();
        });
}

Deferred<facility::SpecialResult> Orchestrator::get_special(const std::string& name) {
    std::optional<facility::SpecialQuery> query =
        facility::parse_special_query(name, config_.airports.default_radius_nm);
    if (!query) {
        return rejected<facility::SpecialResult>(SimError::unknown_property(name, "get"));
    }
    if (!cache_.is_ready()) {
        return rejected<facility::SpecialResult>(
            SimError(ErrorCode::NotReady, name, "Airport database is not ready"));
    }

    Deferred<facility::SpecialResult> result;
    if (!std::holds_alternative<facility::NearbyAirports>(*query)) {
        result.resolve(cache_.query(*query));
        return result;
    }

    get({"PLANE LATITUDE", "PLANE LONGITUDE"})
        .then([this, result, query](const PropertyValues& values) mutable {
            std::optional<Real> latitude = property::as_number(values.at("PLANE_LATITUDE"));
            std::optional<Real> longitude = property::as_number(values.at("PLANE_LONGITUDE"));
            if (!latitude || !longitude) {
                result.reject(SimError(ErrorCode::DecodeFailed,
                                       latitude ? "PLANE LONGITUDE" : "PLANE LATITUDE",
                                       "Aircraft position is not numeric"));
                return;
            }
            result.resolve(cache_.query(*query, facility::Position{*latitude, *longitude}));
        })
        .on_error([result](const SimError& error) mutable {
            result.reject(error);
        });
    return result;
}

// ============================================================================
// Events
// ============================================================================

ListenerId Orchestrator::on(const std::string& name, events::EventListener handler) {
    return multiplexer_.add_listener(name, std::move(handler));
}

bool Orchestrator::off(const std::string& name, ListenerId id) {
    return multiplexer_.remove_listener(name, id);
}

Deferred<Done> Orchestrator::trigger(const std::string& name, UInt32 value) {
    if (!connected_) {
        return rejected<Done>(not_connected(name));
    }

    request::IssueFn issue = [this, name, value](ResourceId id) -> std::optional<SimError> {
        TransportResult status = transport_->map_client_event(id, name);
        if (status != TransportResult::Success) {
            return transport_error(status, name);
        }
        status = transport_->transmit_client_event(id, value);
        if (status != TransportResult::Success) {
            return transport_error(status, name);
        }
        return std::nullopt;
    };
    return correlator_.fire_and_forget(std::move(issue), config_.requests.write_cleanup_delay);
}

// ============================================================================
// Processing
// ============================================================================

SizeT Orchestrator::poll() {
    SizeT processed = 0;
    auto sink = [this](const InboundEvent& event) { route(event); };

    if (transport_->is_open()) {
        processed += transport_->poll(sink);
    }
    if (facility_transport_ && facility_transport_->is_open()) {
        processed += facility_transport_->poll(sink);
    }
    processed += scheduler_.run_due();
    return processed;
}

void Orchestrator::route(const InboundEvent& event) {
    switch (event.kind) {
        case InboundKind::Data:
            if (!correlator_.on_response(event)) {
                anomaly(event);
            }
            break;

        case InboundKind::SystemEvent: {
            events::EventData data;
            data.value = event.value;
            if (!multiplexer_.dispatch(event.id, data)) {
                ++anomalies_;
            }
            break;
        }

        case InboundKind::FacilityListPage:
            if (multiplexer_.owns(event.id)) {
                events::EventData data;
                if (auto airports = facility::decode_facility_list(event.payload)) {
                    data.airports = std::move(*airports);
                } else {
                    SIMLINK_LOG_WARN("Malformed airport range notification ({} bytes)",
                                     event.payload.size());
                }
                multiplexer_.dispatch(event.id, data);
            } else if (!cache_.on_event(event)) {
                anomaly(event);
            }
            break;

        case InboundKind::FacilityDetailField:
        case InboundKind::FacilityDetailEnd:
            if (!cache_.on_event(event)) {
                anomaly(event);
            }
            break;

        case InboundKind::Exception:
            SIMLINK_LOG_ERROR("Simulator exception {}: {}", event.value, event.text);
            break;
    }
}

void Orchestrator::anomaly(const InboundEvent& event) {
    ++anomalies_;
    SIMLINK_LOG_WARN("{} for id {} matches no pending operation; dropped",
                     transport::inbound_kind_to_string(event.kind), event.id);
}

} // namespace simlink::api
