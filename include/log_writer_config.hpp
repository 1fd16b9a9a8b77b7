/**
 * @file log_writer_config.hpp
 * @brief Configuration for the rotating file log writer
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A writer_config is assembled before the writer is constructed and copied
 * into it. The writer never exposes its copy, so the format, templates and
 * thresholds in effect for the first record stay in effect for the lifetime
 * of the writer.
 *
 * @code
 * auto config = writer_config{}
 *                   .set_format("[%D %T] [%L] %M")
 *                   .set_rotate_size(10 * 1024 * 1024)
 *                   .set_rotate_daily(true)
 *                   .set_keep_old_files(true);
 * file_log_writer writer("/var/log/app.log", config);
 * @endcode
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "log_types.hpp"
#include "log_record.hpp"
#include "log_formatters.hpp"
#include "log_rotation_policy.hpp"

namespace rotolog
{

/// Renders a record with a pattern; header and footer go through it too
using record_formatter = std::function<std::string(std::string_view pattern, const log_record &rec)>;

/// Source of "now" for rotation decisions and header/footer stamps
using clock_function = std::function<std::chrono::system_clock::time_point()>;

/// Receives operational failures; must not block for long, runs on the writer thread
using error_handler = std::function<void(const std::string &path, const std::string &message)>;

/**
 * @brief Default error handler, prints to stderr
 */
inline void stderr_error_handler(const std::string &path, const std::string &message)
{
    fmt::print(stderr, "file_log_writer(\"{}\"): {}\n", path, message);
}

struct writer_config
{
    /// @name Output templates
    /// @{
    std::string format = std::string(DEFAULT_FORMAT); ///< Pattern for every record
    std::string header;                               ///< Written when a file is opened (empty = none)
    std::string footer;                               ///< Written when a file is closed (empty = none)
    /// @}

    rotate_policy rotation;   ///< Rotation thresholds and retention
    std::string trim_prefix; ///< Prefix stripped from record sources at write time

    /// @name Pipeline tuning
    /// @{
    size_t entry_capacity                   = DEFAULT_ENTRY_CAPACITY;
    std::chrono::milliseconds flush_interval = DEFAULT_FLUSH_INTERVAL;
    size_t write_buffer_size                = DEFAULT_WRITE_BUFFER_SIZE;
    mode_t file_mode                        = DEFAULT_FILE_MODE;
    /// @}

    /// @name Collaborators
    /// @{
    record_formatter formatter = format_log_record;
    clock_function clock       = [] { return std::chrono::system_clock::now(); };
    error_handler on_error     = stderr_error_handler;
    /// @}

    /**
     * @brief Preset writing XML records framed by a <log> element
     */
    static writer_config xml()
    {
        writer_config config;
        config.format = std::string(XML_FORMAT);
        config.header = std::string(XML_HEADER);
        config.footer = std::string(XML_FOOTER);
        return config;
    }

    writer_config &set_format(std::string f)
    {
        format = std::move(f);
        return *this;
    }

    writer_config &set_head_foot(std::string head, std::string foot)
    {
        header = std::move(head);
        footer = std::move(foot);
        return *this;
    }

    writer_config &set_rotate_lines(uint64_t max_lines)
    {
        rotation.max_lines = max_lines;
        return *this;
    }

    writer_config &set_rotate_size(uint64_t max_bytes)
    {
        rotation.max_bytes = max_bytes;
        return *this;
    }

    writer_config &set_rotate_daily(bool daily)
    {
        rotation.daily = daily;
        return *this;
    }

    writer_config &set_rotate_hourly(bool hourly)
    {
        rotation.hourly = hourly;
        return *this;
    }

    writer_config &set_keep_old_files(bool keep)
    {
        rotation.keep_old_files = keep;
        return *this;
    }

    writer_config &set_trim_prefix(std::string prefix)
    {
        trim_prefix = std::move(prefix);
        return *this;
    }

    writer_config &set_entry_capacity(size_t capacity)
    {
        entry_capacity = capacity;
        return *this;
    }

    writer_config &set_flush_interval(std::chrono::milliseconds interval)
    {
        flush_interval = interval;
        return *this;
    }

    writer_config &set_write_buffer_size(size_t size)
    {
        write_buffer_size = size;
        return *this;
    }

    writer_config &set_formatter(record_formatter f)
    {
        formatter = std::move(f);
        return *this;
    }

    writer_config &set_clock(clock_function c)
    {
        clock = std::move(c);
        return *this;
    }

    writer_config &set_error_handler(error_handler h)
    {
        on_error = std::move(h);
        return *this;
    }

    /**
     * @brief Reject values the writer cannot run with
     * @throws std::invalid_argument naming the offending setting
     */
    void validate() const
    {
        if (entry_capacity == 0) throw std::invalid_argument("entry_capacity must be greater than zero");
        if (write_buffer_size == 0) throw std::invalid_argument("write_buffer_size must be greater than zero");
        if (flush_interval.count() <= 0) throw std::invalid_argument("flush_interval must be positive");
        if (!formatter) throw std::invalid_argument("formatter must be set");
        if (!clock) throw std::invalid_argument("clock must be set");
    }
};

} // namespace rotolog
