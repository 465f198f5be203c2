/**
 * @file logging.cpp
 * @brief Implementation of the SimLink logging wrapper
 */

#include "simlink/core/logging.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <vector>

namespace simlink {

std::shared_ptr<spdlog::logger> Logger::s_logger = nullptr;
bool Logger::s_initialized = false;

namespace {

// ============================================================================
// Helper Functions
// ============================================================================

spdlog::level::level_enum parse_level(std::string level) {
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level == "trace")    return spdlog::level::trace;
    if (level == "debug")    return spdlog::level::debug;
    if (level == "info")     return spdlog::level::info;
    if (level == "warn")     return spdlog::level::warn;
    if (level == "error")    return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off")      return spdlog::level::off;

    return spdlog::level::info;
}

bool env_flag(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    return std::atoi(value) != 0;
}

} // namespace

// ============================================================================
// Public Interface
// ============================================================================

bool Logger::initialize(const LoggingOptions& options) {
    if (s_initialized) {
        return true;
    }

    LoggingOptions effective = options;
    if (const char* level = std::getenv("SIMLINK_LOG_LEVEL")) {
        effective.level = level;
    }
    effective.file = env_flag("SIMLINK_LOG_FILE", effective.file);
    effective.console = env_flag("SIMLINK_LOG_CONSOLE", effective.console);

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (effective.console) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }

        if (effective.file) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                effective.file_path,
                effective.max_file_size,
                effective.max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] %v");
            sinks.push_back(file_sink);
        }

        s_logger = std::make_shared<spdlog::logger>("simlink", sinks.begin(), sinks.end());
        s_logger->set_level(parse_level(effective.level));
        s_logger->flush_on(spdlog::level::warn);

        s_initialized = true;

        SIMLINK_LOG_DEBUG("Logging initialized at level {}",
                          spdlog::level::to_string_view(s_logger->level()));
        return true;
    }
    catch (const spdlog::spdlog_ex& ex) {
        std::fprintf(stderr, "Failed to initialize logging: %s\n", ex.what());
        s_logger = nullptr;
        return false;
    }
}

void Logger::shutdown() {
    if (s_initialized && s_logger) {
        s_logger->flush();
        s_logger = nullptr;
        s_initialized = false;
    }
}

std::shared_ptr<spdlog::logger> Logger::get_logger() {
    return s_logger;
}

void Logger::flush() {
    if (s_initialized && s_logger) {
        s_logger->flush();
    }
}

bool Logger::is_initialized() {
    return s_initialized;
}

} // namespace simlink
