/**
 * @file log_types.hpp
 * @brief Core type definitions and constants for the rotating file sink
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <chrono>

#include <sys/types.h>

#include "fmt_config.hpp" // IWYU pragma: keep

namespace rotolog
{

// Writer defaults
// These seed writer_config; every value can be overridden per writer instance.
inline constexpr size_t DEFAULT_ENTRY_CAPACITY    = 32;                            // Records admitted before producers block
inline constexpr auto DEFAULT_FLUSH_INTERVAL      = std::chrono::milliseconds(100); // Periodic flush of the write buffer
inline constexpr size_t DEFAULT_WRITE_BUFFER_SIZE = 4096;                          // Buffered writer capacity in bytes
inline constexpr mode_t DEFAULT_FILE_MODE         = 0660;                          // Creation mode for log files

// File rotation constants
inline constexpr int ARCHIVE_MAX_SEQUENCE = 999;                                  // Highest archive sequence number tried
inline constexpr auto PERIOD_END_OFFSET   = std::chrono::hours(1);                // Subtracted from archive stamp on day/hour rollover

// Metrics collection configuration
// Define before including log.hpp to enable writer statistics:
// #define ROTOLOG_COLLECT_WRITER_METRICS 1

/**
 * @brief Enumeration of log levels in ascending order of severity
 */
enum class log_level : int8_t
{
    trace = 0, ///< Finest-grained information
    debug = 1, ///< Debugging information
    info  = 2, ///< General information
    warn  = 3, ///< Warning messages
    error = 4, ///< Error messages
    fatal = 5, ///< Critical errors
};

// Log level names for formatting
inline constexpr std::array<const char *, 6> log_level_names = {"TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"};

/**
 * @brief Fixed-width level name used by the %L placeholder
 * @param level The log level
 * @return Upper-case name, or "?????" for out of range values
 */
inline const char *log_level_name(log_level level)
{
    auto idx = static_cast<int>(level);
    if (idx < 0 || idx >= static_cast<int>(log_level_names.size())) return "?????";
    return log_level_names[idx];
}

/**
 * @brief Convert log_level to string
 * @param level The log level
 * @return String representation of the level
 */
inline const char *string_from_log_level(log_level level)
{
    switch (level)
    {
    case log_level::trace: return "trace";
    case log_level::debug: return "debug";
    case log_level::info: return "info";
    case log_level::warn: return "warn";
    case log_level::error: return "error";
    case log_level::fatal: return "fatal";
    default: return "unknown";
    }
}

} // namespace rotolog
