/**
 * @file log_rotation_policy.hpp
 * @brief Rotation decisions and archive naming for log files
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * This file provides the pure part of file rotation:
 * - Line-count based rotation (rotate once a file holds max_lines records)
 * - Size based rotation (rotate once a file holds max_bytes of records)
 * - Daily and hourly rotation (rotate when the local day/hour differs from
 *   the one the file was opened in)
 * - Archive naming `{path}-{YYYY}-{MM}-{DD}-{HH}+{seq:03}` with a bounded
 *   search for a free sequence number
 *
 * Day and hour rollovers attribute the retired file to the period that just
 * ended: the archive stamp is taken one hour before the rotation moment.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <sys/stat.h>

#include "log_types.hpp"
#include "log_utils.hpp"

namespace rotolog
{

/**
 * @brief Rotation thresholds and retention
 *
 * Every trigger is independent; a zero or false value disables it.
 */
struct rotate_policy
{
    uint64_t max_lines  = 0;     ///< Records per file before rotation (0 = disabled)
    uint64_t max_bytes  = 0;     ///< Bytes of records per file before rotation (0 = disabled)
    bool daily          = false; ///< Rotate when the local day changes
    bool hourly         = false; ///< Rotate when the local hour changes
    bool keep_old_files = false; ///< Rename the retiring file to an archive name instead of appending to it
};

/**
 * @brief Why a rotation happens
 */
enum class rotate_reason : uint8_t
{
    none,      ///< No rotation needed
    lines,     ///< max_lines reached
    bytes,     ///< max_bytes reached
    daily,     ///< Local day changed since open
    hourly,    ///< Local hour changed since open
    requested, ///< Explicit request or initial open
};

inline const char *string_from_rotate_reason(rotate_reason reason)
{
    switch (reason)
    {
    case rotate_reason::none: return "none";
    case rotate_reason::lines: return "lines";
    case rotate_reason::bytes: return "bytes";
    case rotate_reason::daily: return "daily";
    case rotate_reason::hourly: return "hourly";
    case rotate_reason::requested: return "requested";
    default: return "unknown";
    }
}

/**
 * @brief True for rollovers whose archive is stamped with the period that just ended
 */
inline bool is_period_end(rotate_reason reason)
{
    return reason == rotate_reason::daily || reason == rotate_reason::hourly;
}

/**
 * @brief Per-file counters, owned by the writer thread
 */
struct rotation_state
{
    uint64_t lines_written = 0;
    uint64_t bytes_written = 0;
    int open_day           = -1; ///< tm_mday at open
    int open_hour          = -1; ///< tm_hour at open

    /**
     * @brief Start a new period at @p now with zeroed counters
     */
    void reset(std::chrono::system_clock::time_point now)
    {
        const std::tm tm = detail::local_tm(now);
        lines_written    = 0;
        bytes_written    = 0;
        open_day         = tm.tm_mday;
        open_hour        = tm.tm_hour;
    }
};

/**
 * @brief Decide whether a rotation must precede the next write
 *
 * Checks run in fixed order (lines, bytes, day, hour) and the first one that
 * fires wins.
 */
inline rotate_reason evaluate_rotation(const rotate_policy &policy,
                                       const rotation_state &state,
                                       std::chrono::system_clock::time_point now)
{
    if (policy.max_lines > 0 && state.lines_written >= policy.max_lines) return rotate_reason::lines;
    if (policy.max_bytes > 0 && state.bytes_written >= policy.max_bytes) return rotate_reason::bytes;

    if (policy.daily || policy.hourly)
    {
        const std::tm tm = detail::local_tm(now);
        if (policy.daily && tm.tm_mday != state.open_day) return rotate_reason::daily;
        if (policy.hourly && tm.tm_hour != state.open_hour) return rotate_reason::hourly;
    }
    return rotate_reason::none;
}

/**
 * @brief Moment an archive name is stamped with
 */
inline std::chrono::system_clock::time_point archive_stamp(rotate_reason reason,
                                                            std::chrono::system_clock::time_point now)
{
    return is_period_end(reason) ? now - PERIOD_END_OFFSET : now;
}

/**
 * @brief Archive name for @p path with sequence number @p seq
 */
inline std::string archive_filename(const std::string &path, std::chrono::system_clock::time_point stamp, int seq)
{
    const std::tm tm = detail::local_tm(stamp);
    return fmt::format("{}-{}-{:02}-{:02}-{:02}+{:03}",
                       path,
                       tm.tm_year + 1900,
                       tm.tm_mon + 1,
                       tm.tm_mday,
                       tm.tm_hour,
                       seq);
}

/**
 * @brief Find the first archive name for @p stamp that does not exist yet
 * @return The free name, or std::nullopt when all ARCHIVE_MAX_SEQUENCE slots are taken
 */
inline std::optional<std::string> find_archive_slot(const std::string &path, std::chrono::system_clock::time_point stamp)
{
    struct stat st;
    for (int seq = 1; seq <= ARCHIVE_MAX_SEQUENCE; ++seq)
    {
        std::string candidate = archive_filename(path, stamp, seq);
        if (::lstat(candidate.c_str(), &st) != 0) { return candidate; }
    }
    return std::nullopt;
}

/**
 * @brief Archive name for the file currently at @p path
 * @return The name to rename to, or std::nullopt when there is no file at @p path
 * @throws rotation_error if all archive slots for @p stamp are taken
 */
inline std::optional<std::string> select_archive_name(const std::string &path, std::chrono::system_clock::time_point stamp)
{
    struct stat st;
    if (::lstat(path.c_str(), &st) != 0) { return std::nullopt; }

    auto slot = find_archive_slot(path, stamp);
    if (!slot) { throw rotation_error(path, "Rotate: cannot find free log number to rename " + path); }
    return slot;
}

} // namespace rotolog
