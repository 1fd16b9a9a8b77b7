#pragma once

/**
 * @file log.hpp
 * @brief Asynchronous rotating file log writer
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * This library provides:
 * - Non-blocking submission from any number of threads (producers block only
 *   on a bounded admission channel, never on disk I/O)
 * - Strict submission order in the output file
 * - Rotation by line count, size, day or hour, with optional archiving of
 *   retired files as `{path}-{YYYY}-{MM}-{DD}-{HH}+{seq:03}`
 * - Header/footer templates written at every file open/close
 * - Buffered output with a periodic flush
 * - Lossless shutdown: close() writes every record submitted before it
 *
 * Basic Usage:
 * @code
 * using namespace rotolog;
 *
 * file_log_writer writer("service.log",
 *                        writer_config{}
 *                            .set_rotate_size(64 * 1024 * 1024)
 *                            .set_rotate_daily(true)
 *                            .set_keep_old_files(true)
 *                            .set_trim_prefix("/home/build/service/"));
 *
 * writer.write({log_level::info, std::chrono::system_clock::now(), __FILE__, "Service started"});
 * writer.request_rotation();
 * writer.close();
 * @endcode
 *
 * XML output:
 * @code
 * file_log_writer writer("service.xml", writer_config::xml());
 * @endcode
 *
 * Compile-time Configuration:
 * - ROTOLOG_COLLECT_WRITER_METRICS - Writer statistics via file_log_writer::get_stats()
 * - ROTOLOG_VERSION_STRING - Version reported by rotolog::VERSION
 *
 * Thread Safety:
 * - write() and request_rotation() may be called from any thread
 * - close() must be called by the owner, once, after which write() drops
 * - The error handler may be called from producer threads (late writes) and
 *   from the writer thread, and must be thread-safe
 */

#include "log_version.hpp"
#include "log_types.hpp"
#include "log_utils.hpp"
#include "log_record.hpp"
#include "log_formatters.hpp"
#include "log_rotation_policy.hpp"
#include "log_writers.hpp"
#include "log_file_session.hpp"
#include "log_handoff_queue.hpp"
#include "log_writer_config.hpp"
#include "log_file_writer.hpp"
