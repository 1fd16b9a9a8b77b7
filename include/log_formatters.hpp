/**
 * @file log_formatters.hpp
 * @brief Pattern based record formatting
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Patterns are plain text with single-letter placeholders introduced by '%':
 *
 * | Placeholder | Expands to                                  |
 * |-------------|---------------------------------------------|
 * | %T          | time with zone, `15:04:05 UTC`              |
 * | %t          | short time, `15:04`                         |
 * | %D          | date, `2025/01/02`                          |
 * | %d          | short date, `01/02/25`                      |
 * | %L          | level name                                  |
 * | %S          | source tag                                  |
 * | %s          | last '/'-separated component of the source  |
 * | %M          | message                                     |
 *
 * Dates and times are rendered in local time. Unknown placeholders are
 * dropped. Every formatted record ends with a newline; an empty pattern
 * formats to an empty string so unset headers and footers write nothing.
 */
#pragma once

#include <iterator>
#include <string>
#include <string_view>

#include "log_types.hpp"
#include "log_record.hpp"
#include "log_utils.hpp"

namespace rotolog
{

inline constexpr std::string_view DEFAULT_FORMAT = "[%D %T] [%L] (%S) %M";

// XML preset
inline constexpr std::string_view XML_FORMAT = "\t<record level=\"%L\">\n"
                                               "\t\t<timestamp>%D %T</timestamp>\n"
                                               "\t\t<source>%S</source>\n"
                                               "\t\t<message>%M</message>\n"
                                               "\t</record>";
inline constexpr std::string_view XML_HEADER = "<log created=\"%D %T\">";
inline constexpr std::string_view XML_FOOTER = "</log>";

/**
 * @brief Format a record according to @p pattern
 * @param pattern Format pattern, see file documentation for placeholders
 * @param rec Record to render
 * @return Formatted text including the trailing newline
 */
inline std::string format_log_record(std::string_view pattern, const log_record &rec)
{
    if (pattern.empty()) return {};

    const std::tm tm = detail::local_tm(rec.created);

    fmt::memory_buffer out;
    auto it = std::back_inserter(out);

    size_t pos   = 0;
    bool leading = true;
    while (pos <= pattern.size())
    {
        size_t next = pattern.find('%', pos);
        if (next == std::string_view::npos) next = pattern.size();
        std::string_view piece = pattern.substr(pos, next - pos);
        pos                    = next + 1;

        if (leading)
        {
            out.append(piece);
            leading = false;
            continue;
        }
        if (piece.empty()) continue;

        switch (piece.front())
        {
        case 'T': fmt::format_to(it, "{:%H:%M:%S %Z}", tm); break;
        case 't': fmt::format_to(it, "{:%H:%M}", tm); break;
        case 'D': fmt::format_to(it, "{:04}/{:02}/{:02}", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday); break;
        case 'd': fmt::format_to(it, "{:02}/{:02}/{:02}", tm.tm_mon + 1, tm.tm_mday, tm.tm_year % 100); break;
        case 'L': out.append(std::string_view(log_level_name(rec.level))); break;
        case 'S': out.append(std::string_view(rec.source)); break;
        case 's': out.append(detail::last_path_component(rec.source)); break;
        case 'M': out.append(std::string_view(rec.message)); break;
        default: break;
        }
        out.append(piece.substr(1));
    }

    out.push_back('\n');
    return fmt::to_string(out);
}

} // namespace rotolog
