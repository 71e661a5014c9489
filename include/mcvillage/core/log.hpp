#pragma once

/// @file log.hpp
/// @brief Logging utilities for mcvillage

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define MCV_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define MCV_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define MCV_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define MCV_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define MCV_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define MCV_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace mcv_core {

// =============================================================================
// Basic Logging (Inline)
// =============================================================================

/// @brief Initialize the logging system (basic)
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 5 * 1024 * 1024;  // 5 MB
    std::size_t max_files = 3;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger for grid generation
std::shared_ptr<spdlog::logger> gridgen_logger();

/// Logger for the teleport network
std::shared_ptr<spdlog::logger> teleport_logger();

/// Logger for scene graph and volume tracking
std::shared_ptr<spdlog::logger> scene_logger();

/// Logger for material effects
std::shared_ptr<spdlog::logger> fx_logger();

/// Logger for doors, trigger animations and chains
std::shared_ptr<spdlog::logger> props_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Set log level for specific logger
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Log entry with key/value fields appended
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for timing a block at trace level
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "mcv_core");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define MCV_LOG_SCOPE(name, logger) ::mcv_core::LogScope _log_scope_##__LINE__(name, logger)

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace mcv_core
