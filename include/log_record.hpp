/**
 * @file log_record.hpp
 * @brief Log record consumed by the file sink
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <string>

#include "log_types.hpp"

namespace rotolog
{

/**
 * @brief One log event as handed over by the front-end
 *
 * Records are built by the producer and moved into the sink. The sink only
 * reads @ref created (rotation decisions use the sink clock instead) and
 * rewrites @ref source once, at write time, to strip the configured prefix.
 */
struct log_record
{
    log_level level = log_level::info;
    std::chrono::system_clock::time_point created{};
    std::string source;
    std::string message;
};

} // namespace rotolog
