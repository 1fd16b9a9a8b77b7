/**
 * @file log_utils.hpp
 * @brief Common utilities and error types for the rotolog file sink
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <ctime>
#include <stdexcept>
#include <string>
#include <string_view>
#include <string.h>

namespace rotolog
{

// Thread-safe error string helper
inline std::string get_error_string(int err)
{
    char errbuf[256];

#ifdef _GNU_SOURCE
    // GNU version returns char* which may or may not use the buffer
    const char *msg = strerror_r(err, errbuf, sizeof(errbuf));
    return std::string(msg);
#else
    // POSIX version returns int and always uses the buffer
    int ret = strerror_r(err, errbuf, sizeof(errbuf));
    if (ret != 0) { return "Unknown error " + std::to_string(err); }
    return std::string(errbuf);
#endif
}

/**
 * @brief I/O failure on a log file
 *
 * Carries the affected path and the errno captured at the failing call
 * (0 when the failure did not come from a system call).
 */
class file_error : public std::runtime_error
{
  public:
    file_error(std::string path, const std::string &what, int err = 0)
    : std::runtime_error(err ? what + ": " + get_error_string(err) : what), path_(std::move(path)), errno_(err)
    {
    }

    const std::string &path() const noexcept { return path_; }
    int error_code() const noexcept { return errno_; }

  private:
    std::string path_;
    int errno_;
};

/**
 * @brief Failure to retire the current file (no free archive slot, rename failed)
 */
class rotation_error : public file_error
{
  public:
    using file_error::file_error;
};

namespace detail
{

/**
 * @brief Remove a leading prefix from a source tag
 * @return The tag without @p prefix, or the tag unchanged when it does not start with it
 */
inline std::string trim_prefix(std::string_view text, std::string_view prefix)
{
    if (!prefix.empty() && text.substr(0, prefix.size()) == prefix) { text.remove_prefix(prefix.size()); }
    return std::string(text);
}

/**
 * @brief Last '/'-separated component of a source tag
 */
inline std::string_view last_path_component(std::string_view text)
{
    auto pos = text.rfind('/');
    return pos == std::string_view::npos ? text : text.substr(pos + 1);
}

// Broken-down local time, reentrant
inline std::tm local_tm(std::chrono::system_clock::time_point tp)
{
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

} // namespace detail

} // namespace rotolog
