#pragma once
/**
 * @file logging.h
 * @brief Logging wrapper for SimLink
 *
 * Thin static facade over spdlog with a colored stderr sink and an optional
 * rotating file sink.
 *
 * Environment variables override the options passed to initialize():
 * - SIMLINK_LOG_LEVEL   : trace|debug|info|warn|error|critical|off
 * - SIMLINK_LOG_FILE    : enable file logging (0|1)
 * - SIMLINK_LOG_CONSOLE : enable console logging (0|1)
 *
 * Usage:
 * @code
 *   simlink::Logger::initialize();
 *   SIMLINK_LOG_INFO("Connected to {}", app_name);
 *   simlink::Logger::shutdown();
 * @endcode
 */

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace simlink {

/**
 * @brief Logger configuration
 */
struct LoggingOptions {
    std::string level{"info"};
    bool console{true};
    bool file{false};
    std::string file_path{"simlink.log"};
    std::size_t max_file_size{5 * 1024 * 1024};
    std::size_t max_files{3};
};

class Logger {
public:
    /**
     * @brief Initialize the logging system
     *
     * Safe to call more than once; later calls are ignored until shutdown().
     *
     * @return true if initialization succeeded
     */
    static bool initialize(const LoggingOptions& options = {});

    /**
     * @brief Flush and release all sinks
     */
    static void shutdown();

    static std::shared_ptr<spdlog::logger> get_logger();

    static void flush();

    static bool is_initialized();

private:
    static std::shared_ptr<spdlog::logger> s_logger;
    static bool s_initialized;
};

} // namespace simlink

// ============================================================================
// Logging Macros
// ============================================================================

#define SIMLINK_LOG_AT(method, ...) \
    do { \
        if (::simlink::Logger::is_initialized()) { \
            ::simlink::Logger::get_logger()->method(__VA_ARGS__); \
        } \
    } while (0)

#if defined(NDEBUG)
    #define SIMLINK_LOG_TRACE(...)    ((void)0)
    #define SIMLINK_LOG_DEBUG(...)    ((void)0)
#else
    #define SIMLINK_LOG_TRACE(...)    SIMLINK_LOG_AT(trace, __VA_ARGS__)
    #define SIMLINK_LOG_DEBUG(...)    SIMLINK_LOG_AT(debug, __VA_ARGS__)
#endif

#define SIMLINK_LOG_INFO(...)         SIMLINK_LOG_AT(info, __VA_ARGS__)
#define SIMLINK_LOG_WARN(...)         SIMLINK_LOG_AT(warn, __VA_ARGS__)
#define SIMLINK_LOG_ERROR(...)        SIMLINK_LOG_AT(error, __VA_ARGS__)
#define SIMLINK_LOG_CRITICAL(...)     SIMLINK_LOG_AT(critical, __VA_ARGS__)
