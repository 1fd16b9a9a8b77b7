/**
 * @file log_writers.hpp
 * @brief Log file output writers
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstring>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>

#include "log_types.hpp"
#include "log_utils.hpp"

namespace rotolog
{

/**
 * @brief Owning handle to a log file opened for appending
 *
 * Move-only. The descriptor is closed on destruction; use close() to learn
 * whether the close itself failed.
 */
class file_writer
{
  public:
    file_writer() = default;

    /**
     * @brief Open (create or append) @p filename
     * @throws file_error if the file cannot be opened
     */
    explicit file_writer(const std::string &filename, mode_t mode = DEFAULT_FILE_MODE) : filename_(filename)
    {
        fd_ = ::open(filename.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, mode);
        if (fd_ < 0) { throw file_error(filename, "Failed to open log file", errno); }
    }

    file_writer(const file_writer &)            = delete;
    file_writer &operator=(const file_writer &) = delete;

    file_writer(file_writer &&other) noexcept
    : filename_(std::move(other.filename_)), fd_(std::exchange(other.fd_, -1))
    {
    }

    file_writer &operator=(file_writer &&other) noexcept
    {
        if (this != &other)
        {
            if (fd_ >= 0) ::close(fd_);
            filename_ = std::move(other.filename_);
            fd_       = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    ~file_writer()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    bool is_open() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    const std::string &filename() const { return filename_; }

    /**
     * @brief Write all of @p data, retrying on EINTR and short writes
     * @param written_out If not null, receives the bytes that reached the file,
     *                    also when the write fails part way through
     * @return Bytes written, or -1 with errno set
     */
    ssize_t write(const char *data, size_t len, size_t *written_out = nullptr) const
    {
        size_t total_written = 0;
        if (written_out) *written_out = 0;

        if (fd_ < 0)
        {
            errno = EBADF;
            return -1;
        }

        while (total_written < len)
        {
            ssize_t written = ::write(fd_, data + total_written, len - total_written);
            if (written < 0)
            {
                if (errno == EINTR) { continue; }
                int err = errno;
                if (written_out) *written_out = total_written;
                errno = err;
                return -1;
            }
            total_written += written;
        }
        if (written_out) *written_out = total_written;
        return static_cast<ssize_t>(total_written);
    }

    /**
     * @brief Release the descriptor
     * @return 0 on success, otherwise the errno of the failing close
     */
    int close()
    {
        if (fd_ < 0) return 0;
        int rc = ::close(fd_);
        fd_    = -1;
        return rc == 0 ? 0 : errno;
    }

  private:
    std::string filename_;
    int fd_{-1};
};

/**
 * @brief Fixed-size write buffer in front of a file_writer
 *
 * Data is staged in memory and reaches the file when the buffer fills or
 * flush() is called. A write larger than the buffer is passed straight
 * through after the staged bytes and is never staged, even when it fails.
 * When a flush fails part way through, the bytes that reached the file are
 * removed from the buffer and only the unwritten tail stays staged, so no
 * byte is ever written twice.
 */
class buffered_writer
{
  public:
    explicit buffered_writer(file_writer writer, size_t capacity = DEFAULT_WRITE_BUFFER_SIZE)
    : writer_(std::move(writer))
    {
        buffer_.reserve(capacity);
        capacity_ = capacity;
    }

    buffered_writer(buffered_writer &&)            = default;
    buffered_writer &operator=(buffered_writer &&) = default;

    /**
     * @brief Stage @p data for output
     * @return 0 on success, otherwise the errno of the failing write
     */
    int write(std::string_view data)
    {
        if (buffer_.size() + data.size() > capacity_)
        {
            if (int err = flush()) return err;
        }

        if (data.size() > capacity_)
        {
            // Not staged: whatever part reached the file stays there, the rest is lost
            if (writer_.write(data.data(), data.size()) < 0) return errno;
            return 0;
        }

        buffer_.insert(buffer_.end(), data.begin(), data.end());
        return 0;
    }

    /**
     * @brief Push staged bytes to the file
     *
     * On failure the bytes that were written are dropped from the buffer; the
     * unwritten tail is kept.
     *
     * @return 0 on success, otherwise the errno of the failing write
     */
    int flush()
    {
        if (buffer_.empty()) return 0;

        size_t written = 0;
        if (writer_.write(buffer_.data(), buffer_.size(), &written) < 0)
        {
            int err = errno;
            buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(written));
            return err;
        }
        buffer_.clear();
        return 0;
    }

    /**
     * @brief Release the file; staged bytes are discarded
     * @return 0 on success, otherwise the errno of the failing close
     */
    int close()
    {
        buffer_.clear();
        return writer_.close();
    }

    size_t buffered() const { return buffer_.size(); }
    size_t capacity() const { return capacity_; }
    bool is_open() const { return writer_.is_open(); }

  private:
    file_writer writer_;
    std::vector<char> buffer_;
    size_t capacity_;
};

} // namespace rotolog
