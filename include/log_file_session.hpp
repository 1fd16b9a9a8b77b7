/**
 * @file log_file_session.hpp
 * @brief One open log file plus its write buffer
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A session lasts from the moment a file is opened (and its header written)
 * to the moment it is closed (footer written, buffer flushed, descriptor
 * released). The rotating writer runs one session at a time per path and
 * closes the old one before opening the next.
 *
 * Sessions are not thread-safe; the writer thread is their only user.
 * Destroying an open session releases the file without writing the footer
 * or the buffered bytes; call close() first.
 */
#pragma once

#include <errno.h>
#include <stdio.h>

#include <optional>
#include <string>
#include <string_view>

#include "log_types.hpp"
#include "log_utils.hpp"
#include "log_writers.hpp"

namespace rotolog
{

class file_session
{
  public:
    file_session(std::string path, size_t buffer_size = DEFAULT_WRITE_BUFFER_SIZE, mode_t mode = DEFAULT_FILE_MODE)
    : path_(std::move(path)), buffer_size_(buffer_size), mode_(mode)
    {
    }

    file_session(const file_session &)            = delete;
    file_session &operator=(const file_session &) = delete;

    const std::string &path() const { return path_; }
    bool is_open() const { return writer_.has_value(); }

    /**
     * @brief Start a session
     *
     * When @p archive_name is given the file currently at the path is renamed
     * to it first. The file is then created or opened for appending and
     * @p header is staged as its first output.
     *
     * @throws rotation_error if the rename fails (no session is started)
     * @throws file_error if the file cannot be opened
     */
    void open(std::string_view header, const std::optional<std::string> &archive_name = std::nullopt)
    {
        if (writer_) { throw file_error(path_, "Session already open"); }

        if (archive_name && ::rename(path_.c_str(), archive_name->c_str()) != 0)
        {
            throw rotation_error(path_, "Rotate: rename to " + *archive_name + " failed", errno);
        }

        writer_.emplace(file_writer(path_, mode_), buffer_size_);

        if (!header.empty())
        {
            if (int err = writer_->write(header))
            {
                writer_.reset();
                throw file_error(path_, "Failed to write header", err);
            }
        }
    }

    /**
     * @brief Stage @p text for output
     * @return 0 on success, otherwise the errno of the failing write
     */
    int write(std::string_view text)
    {
        if (!writer_) return EBADF;
        return writer_->write(text);
    }

    /**
     * @brief Push buffered output to the file
     * @return 0 on success, otherwise the errno of the failing write
     */
    int flush()
    {
        if (!writer_) return 0;
        return writer_->flush();
    }

    /**
     * @brief End the session: write @p footer, flush, release the file
     *
     * The descriptor is released even when writing the footer or flushing
     * fails; the first failure is reported through the return value.
     *
     * @return std::nullopt on success, otherwise a description of the first failure
     */
    std::optional<std::string> close(std::string_view footer)
    {
        if (!writer_) return std::nullopt;

        std::optional<std::string> failure;
        if (!footer.empty())
        {
            if (int err = writer_->write(footer)) { failure = "Failed to write footer: " + get_error_string(err); }
        }
        if (int err = writer_->flush(); err && !failure) { failure = "Failed to flush: " + get_error_string(err); }
        if (int err = writer_->close(); err && !failure) { failure = "Failed to close: " + get_error_string(err); }

        writer_.reset();
        return failure;
    }

  private:
    std::string path_;
    size_t buffer_size_;
    mode_t mode_;
    std::optional<buffered_writer> writer_;
};

} // namespace rotolog
