#pragma once
/**
 * @file error.h
 * @brief Error codes and the exception type used to reject async operations
 */

#include "simlink/core/types.h"
#include <stdexcept>
#include <string>

namespace simlink {

// ============================================================================
// Error Codes
// ============================================================================

/**
 * @brief Error codes carried by SimError
 */
enum class ErrorCode : UInt8 {
    // Request errors
    UnknownProperty = 1,
    InvalidValue,
    UnknownSpecialQuery,

    // Lifecycle errors
    NotConnected,
    ConnectionFailed,
    NotReady,

    // Completion errors
    Timeout,
    Cancelled,

    // Transport / data errors
    TransportFailure,
    DecodeFailed
};

/**
 * @brief Convert ErrorCode to string
 */
inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::UnknownProperty: return "UnknownProperty";
        case ErrorCode::InvalidValue: return "InvalidValue";
        case ErrorCode::UnknownSpecialQuery: return "UnknownSpecialQuery";
        case ErrorCode::NotConnected: return "NotConnected";
        case ErrorCode::ConnectionFailed: return "ConnectionFailed";
        case ErrorCode::NotReady: return "NotReady";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::TransportFailure: return "TransportFailure";
        case ErrorCode::DecodeFailed: return "DecodeFailed";
        default: return "Unknown";
    }
}

// ============================================================================
// SimError
// ============================================================================

/**
 * @brief Error delivered to rejected Deferred results
 *
 * Carries the code and the subject the error refers to (a property name,
 * an event name, an ICAO code), so callers can report which input failed.
 */
class SimError : public std::runtime_error {
public:
    SimError(ErrorCode code, std::string subject, const std::string& message)
        : std::runtime_error(message)
        , code_(code)
        , subject_(std::move(subject)) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& subject() const noexcept { return subject_; }

    static SimError unknown_property(const std::string& name, const char* verb) {
        return SimError(ErrorCode::UnknownProperty, name,
                        std::string("Cannot ") + verb + " SimVar: \"" + name + "\" unknown.");
    }

private:
    ErrorCode code_;
    std::string subject_;
};

} // namespace simlink
