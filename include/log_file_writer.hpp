/**
 * @file log_file_writer.hpp
 * @brief Asynchronous rotating file log writer
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * file_log_writer accepts records from any number of threads and writes them
 * to a single file in submission order from one background thread, rotating
 * the file when the configured line, size, day or hour thresholds are crossed.
 *
 * Threads:
 * - the relay thread of the hand-off queue, moving admitted records towards
 *   the writer without ever touching the disk;
 * - the writer thread, the only user of the file: it applies the rotation
 *   policy, formats, writes, and flushes its buffer every flush_interval.
 *
 * Producers only block when the bounded entry channel is full. close() stops
 * both threads, writes every record admitted before it, and closes the file.
 *
 * Failures after construction are passed to writer_config::on_error together
 * with the path and never reach producers:
 * - rotation failure (no free archive slot, rename failure): the record that
 *   triggered the rotation is dropped, the writer keeps running;
 * - write failure: the record is dropped and not counted towards thresholds;
 * - clock failure: the record, or the requested rotation, is dropped;
 * - footer/flush failure at close: reported, the file is closed anyway.
 *
 * When a rotation fails while the old file is still open, the line and byte
 * counters and the open day and hour are reset to the time of the failure.
 * The next attempt therefore comes at the next threshold crossing, and a
 * failed daily or hourly rotation is retried only at the following day or
 * hour change. If the old file was already closed, the next record reopens
 * the primary path.
 *
 * @code
 * file_log_writer writer("app.log", writer_config{}.set_rotate_lines(10000).set_keep_old_files(true));
 * writer.write({log_level::info, std::chrono::system_clock::now(), "main.cpp", "started"});
 * writer.close();
 * @endcode
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <thread>

#include "log_types.hpp"
#include "log_record.hpp"
#include "log_utils.hpp"
#include "log_writer_config.hpp"
#include "log_rotation_policy.hpp"
#include "log_file_session.hpp"
#include "log_handoff_queue.hpp"

namespace rotolog
{

class file_log_writer
{
  public:
#ifdef ROTOLOG_COLLECT_WRITER_METRICS
    /**
     * @brief Writer statistics for monitoring and diagnostics
     */
    struct stats
    {
        uint64_t records_written;   ///< Records formatted and handed to the file
        uint64_t records_dropped;   ///< Records lost to rotation/write failures or late submission
        uint64_t rotations;         ///< Completed rotations (initial open excluded)
        uint64_t rotation_failures; ///< Rotations that could not be completed
        uint64_t write_failures;    ///< Failed record writes
        uint64_t flushes;           ///< Timer driven flushes
    };
#endif

    /**
     * @brief Open @p path and start the background threads
     *
     * With keep_old_files set, a file already at @p path is archived first.
     * The header is written stamped with the current time.
     *
     * @throws std::invalid_argument for an empty path or an unusable config
     * @throws rotation_error if a pre-existing file cannot be archived
     * @throws file_error if the file cannot be opened
     */
    explicit file_log_writer(std::string path, writer_config config = {});

    file_log_writer(const file_log_writer &)            = delete;
    file_log_writer &operator=(const file_log_writer &) = delete;

    /**
     * @brief Closes the writer if close() was not called
     */
    ~file_log_writer();

    /**
     * @brief Submit a record
     *
     * Returns once the record is admitted; blocks only while the entry
     * channel is full. A record submitted after close() completed is dropped
     * and reported.
     */
    void write(log_record rec);

    /**
     * @brief Ask the writer thread to rotate now
     *
     * Does not wait. Requests made before the writer gets to them collapse
     * into a single rotation.
     */
    void request_rotation();

    /**
     * @brief Write all submitted records, then close the file
     *
     * Blocks until both background threads have stopped and every record
     * admitted before the call is written. Records drained here never trigger
     * a rotation. Call once; later calls return immediately.
     */
    void close();

    const std::string &path() const { return path_; }

#ifdef ROTOLOG_COLLECT_WRITER_METRICS
    stats get_stats() const;
#endif

  private:
    static writer_config validated(writer_config config);

    void writer_thread_func();

    void write_record(log_record &rec, bool allow_rotation);
    void handle_rotation_request();
    void rotate(rotate_reason reason, std::chrono::system_clock::time_point now);
    void reopen(std::chrono::system_clock::time_point now);
    void close_session(std::chrono::system_clock::time_point now);
    void flush_session();

    bool read_clock(std::chrono::system_clock::time_point &now) const;
    std::string stamp(const std::string &pattern, std::chrono::system_clock::time_point now) const;
    void report(const std::string &message) const;

    std::string path_;
    writer_config config_;

    // Writer thread state; touched by close() only after the thread is joined
    file_session session_;
    rotation_state state_;

    handoff_queue<log_record> queue_;
    std::atomic<bool> rotate_requested_{false};
    std::atomic<bool> closed_{false};
    std::thread writer_thread_;

#ifdef ROTOLOG_COLLECT_WRITER_METRICS
    std::atomic<uint64_t> records_written_{0};
    std::atomic<uint64_t> records_dropped_{0};
    std::atomic<uint64_t> rotations_{0};
    std::atomic<uint64_t> rotation_failures_{0};
    std::atomic<uint64_t> write_failures_{0};
    std::atomic<uint64_t> flushes_{0};
#endif
};

} // namespace rotolog

#include "log_file_writer_impl.hpp" // IWYU pragma: keep
