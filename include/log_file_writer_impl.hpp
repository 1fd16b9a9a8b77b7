/**
 * @file log_file_writer_impl.hpp
 * @brief Implementation of the rotating file writer, its writer thread and shutdown
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <exception>
#include <stdexcept>

#include "log_file_writer.hpp"

namespace rotolog
{

inline writer_config file_log_writer::validated(writer_config config)
{
    config.validate();
    if (!config.on_error) config.on_error = stderr_error_handler;
    return config;
}

inline file_log_writer::file_log_writer(std::string path, writer_config config)
: path_(std::move(path)),
  config_(validated(std::move(config))),
  session_(path_, config_.write_buffer_size, config_.file_mode),
  queue_(config_.entry_capacity)
{
    if (path_.empty()) { throw std::invalid_argument("log file path must not be empty"); }

    // Open the file for the first time; failures here are fatal to construction
    auto now = config_.clock();
    std::optional<std::string> archive;
    if (config_.rotation.keep_old_files) { archive = select_archive_name(path_, now); }
    session_.open(stamp(config_.header, now), archive);
    state_.reset(now);

    queue_.start();
    writer_thread_ = std::thread(&file_log_writer::writer_thread_func, this);
}

inline file_log_writer::~file_log_writer() { close(); }

inline void file_log_writer::write(log_record rec)
{
    if (!queue_.enqueue(std::move(rec)))
    {
#ifdef ROTOLOG_COLLECT_WRITER_METRICS
        records_dropped_.fetch_add(1, std::memory_order_relaxed);
#endif
        report("Write after close, record dropped");
    }
}

inline void file_log_writer::request_rotation()
{
    if (closed_.load(std::memory_order_acquire))
    {
        report("Rotation requested after close, ignored");
        return;
    }
    rotate_requested_.store(true, std::memory_order_release);
    queue_.interrupt();
}

inline void file_log_writer::close()
{
    // Only close once
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) { return; }

    // Stop the relay, then the writer thread
    queue_.shutdown();
    if (writer_thread_.joinable()) { writer_thread_.join(); }

    // The writer thread is gone; from here on this thread owns the session.
    // Remaining records come out oldest first: offered, backlog, entry channel.
    for (auto &rec : queue_.drain()) { write_record(rec, false); }

    // The file is closed even when the clock fails; the footer then carries the system time
    auto now = std::chrono::system_clock::now();
    read_clock(now);
    close_session(now);
}

inline void file_log_writer::writer_thread_func()
{
    auto next_flush = std::chrono::steady_clock::now() + config_.flush_interval;
    log_record rec;

    while (true)
    {
        auto status = queue_.wait_dequeue_until(rec, next_flush);
        if (status == dequeue_status::cancelled) { break; }

        if (status == dequeue_status::item) { write_record(rec, true); }

        if (rotate_requested_.exchange(false, std::memory_order_acq_rel)) { handle_rotation_request(); }

        // Flush on schedule even while records keep arriving
        auto steady_now = std::chrono::steady_clock::now();
        if (steady_now >= next_flush)
        {
            flush_session();
            next_flush = steady_now + config_.flush_interval;
        }
    }
}

inline void file_log_writer::write_record(log_record &rec, bool allow_rotation)
{
    std::chrono::system_clock::time_point now;
    if (!read_clock(now))
    {
#ifdef ROTOLOG_COLLECT_WRITER_METRICS
        records_dropped_.fetch_add(1, std::memory_order_relaxed);
#endif
        return;
    }

    try
    {
        if (!session_.is_open()) { reopen(now); }
        else if (allow_rotation)
        {
            auto reason = evaluate_rotation(config_.rotation, state_, now);
            if (reason != rotate_reason::none) { rotate(reason, now); }
        }
    }
    catch (const std::exception &e)
    {
        // The record that triggered the rotation is dropped, not retried
#ifdef ROTOLOG_COLLECT_WRITER_METRICS
        rotation_failures_.fetch_add(1, std::memory_order_relaxed);
        records_dropped_.fetch_add(1, std::memory_order_relaxed);
#endif
        report(e.what());

        // Still on the old file: retry at the next threshold, not on every record
        if (session_.is_open()) { state_.reset(now); }
        return;
    }

    std::string text;
    try
    {
        rec.source = detail::trim_prefix(rec.source, config_.trim_prefix);
        text       = config_.formatter(config_.format, rec);
    }
    catch (const std::exception &e)
    {
#ifdef ROTOLOG_COLLECT_WRITER_METRICS
        records_dropped_.fetch_add(1, std::memory_order_relaxed);
#endif
        report(std::string("Failed to format record: ") + e.what());
        return;
    }

    if (int err = session_.write(text))
    {
#ifdef ROTOLOG_COLLECT_WRITER_METRICS
        write_failures_.fetch_add(1, std::memory_order_relaxed);
        records_dropped_.fetch_add(1, std::memory_order_relaxed);
#endif
        report("Failed to write record: " + get_error_string(err));
        return;
    }

    state_.lines_written++;
    state_.bytes_written += text.size();
#ifdef ROTOLOG_COLLECT_WRITER_METRICS
    records_written_.fetch_add(1, std::memory_order_relaxed);
#endif
}

inline void file_log_writer::handle_rotation_request()
{
    std::chrono::system_clock::time_point now;
    if (!read_clock(now))
    {
#ifdef ROTOLOG_COLLECT_WRITER_METRICS
        rotation_failures_.fetch_add(1, std::memory_order_relaxed);
#endif
        return;
    }

    try
    {
        if (session_.is_open()) { rotate(rotate_reason::requested, now); }
        else { reopen(now); }
    }
    catch (const std::exception &e)
    {
#ifdef ROTOLOG_COLLECT_WRITER_METRICS
        rotation_failures_.fetch_add(1, std::memory_order_relaxed);
#endif
        report(e.what());
        if (session_.is_open()) { state_.reset(now); }
    }
}

inline void file_log_writer::rotate(rotate_reason reason, std::chrono::system_clock::time_point now)
{
    // Pick the archive name while the retiring file is still open, so running
    // out of slots leaves the current session untouched
    std::optional<std::string> archive;
    if (config_.rotation.keep_old_files) { archive = select_archive_name(path_, archive_stamp(reason, now)); }

    close_session(now);

    session_.open(stamp(config_.header, now), archive);
    state_.reset(now);

#ifdef ROTOLOG_COLLECT_WRITER_METRICS
    rotations_.fetch_add(1, std::memory_order_relaxed);
#endif
}

// Start a new session on the primary path after a failed rotation left none open
inline void file_log_writer::reopen(std::chrono::system_clock::time_point now)
{
    session_.open(stamp(config_.header, now));
    state_.reset(now);
}

inline void file_log_writer::close_session(std::chrono::system_clock::time_point now)
{
    std::string footer;
    try
    {
        footer = stamp(config_.footer, now);
    }
    catch (const std::exception &e)
    {
        report(std::string("Failed to format footer: ") + e.what());
    }

    if (auto failure = session_.close(footer)) { report(*failure); }
}

inline void file_log_writer::flush_session()
{
    if (int err = session_.flush()) { report("Failed to flush: " + get_error_string(err)); }
#ifdef ROTOLOG_COLLECT_WRITER_METRICS
    else { flushes_.fetch_add(1, std::memory_order_relaxed); }
#endif
}

// On failure the error is reported and @p now is left as it was
inline bool file_log_writer::read_clock(std::chrono::system_clock::time_point &now) const
{
    try
    {
        now = config_.clock();
        return true;
    }
    catch (const std::exception &e)
    {
        report(std::string("Failed to read clock: ") + e.what());
        return false;
    }
}

inline std::string file_log_writer::stamp(const std::string &pattern, std::chrono::system_clock::time_point now) const
{
    if (pattern.empty()) return {};

    log_record rec;
    rec.created = now;
    return config_.formatter(pattern, rec);
}

inline void file_log_writer::report(const std::string &message) const
{
    try
    {
        config_.on_error(path_, message);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "file_log_writer(\"{}\"): {} (error handler threw: {})\n", path_, message, e.what());
    }
}

#ifdef ROTOLOG_COLLECT_WRITER_METRICS
inline file_log_writer::stats file_log_writer::get_stats() const
{
    stats s;
    s.records_written   = records_written_.load();
    s.records_dropped   = records_dropped_.load();
    s.rotations         = rotations_.load();
    s.rotation_failures = rotation_failures_.load();
    s.write_failures    = write_failures_.load();
    s.flushes           = flushes_.load();
    return s;
}
#endif

} // namespace rotolog
