/**
 * @file test_formatters.cpp
 * @brief Tests for pattern based record formatting
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <ctime>

#include "log.hpp"

using namespace rotolog;
using Catch::Matchers::StartsWith;

namespace
{

std::chrono::system_clock::time_point make_local(int year, int month, int day, int hour, int min, int sec)
{
    std::tm tm{};
    tm.tm_year  = year - 1900;
    tm.tm_mon   = month - 1;
    tm.tm_mday  = day;
    tm.tm_hour  = hour;
    tm.tm_min   = min;
    tm.tm_sec   = sec;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

log_record sample_record()
{
    log_record rec;
    rec.level   = log_level::warn;
    rec.created = make_local(2025, 3, 7, 9, 5, 4);
    rec.source  = "net/tcp/connection.cpp";
    rec.message = "peer reset";
    return rec;
}

} // namespace

TEST_CASE("Date and time placeholders", "[formatter]")
{
    auto rec = sample_record();

    SECTION("Long date") { REQUIRE(format_log_record("%D", rec) == "2025/03/07\n"); }

    SECTION("Short date") { REQUIRE(format_log_record("%d", rec) == "03/07/25\n"); }

    SECTION("Short time") { REQUIRE(format_log_record("%t", rec) == "09:05\n"); }

    SECTION("Long time carries the zone")
    {
        auto text = format_log_record("%T", rec);
        REQUIRE_THAT(text, StartsWith("09:05:04 "));
        REQUIRE(text.back() == '\n');
        REQUIRE(text.size() > std::string("09:05:04 \n").size());
    }
}

TEST_CASE("Record field placeholders", "[formatter]")
{
    auto rec = sample_record();

    SECTION("Level") { REQUIRE(format_log_record("%L", rec) == "WARN \n"); }

    SECTION("Full and short source")
    {
        REQUIRE(format_log_record("%S", rec) == "net/tcp/connection.cpp\n");
        REQUIRE(format_log_record("%s", rec) == "connection.cpp\n");
    }

    SECTION("Short source without separators is the whole source")
    {
        rec.source = "main.cpp";
        REQUIRE(format_log_record("%s", rec) == "main.cpp\n");
    }

    SECTION("Message") { REQUIRE(format_log_record("%M", rec) == "peer reset\n"); }
}

TEST_CASE("Pattern text handling", "[formatter]")
{
    auto rec = sample_record();

    SECTION("Default format")
    {
        auto text = format_log_record(DEFAULT_FORMAT, rec);
        REQUIRE_THAT(text, StartsWith("[2025/03/07 09:05:04 "));
        REQUIRE_THAT(text, Catch::Matchers::EndsWith("] [WARN ] (net/tcp/connection.cpp) peer reset\n"));
    }

    SECTION("Literal text around placeholders is kept")
    {
        REQUIRE(format_log_record("<%L|%M>", rec) == "<WARN |peer reset>\n");
    }

    SECTION("Unknown placeholders are dropped")
    {
        REQUIRE(format_log_record("a%xb", rec) == "ab\n");
    }

    SECTION("Doubled percent signs produce nothing")
    {
        REQUIRE(format_log_record("100%%", rec) == "100\n");
    }

    SECTION("Trailing percent sign is ignored")
    {
        REQUIRE(format_log_record("end%", rec) == "end\n");
    }

    SECTION("Empty pattern formats to nothing")
    {
        REQUIRE(format_log_record("", rec).empty());
    }

    SECTION("Text without placeholders gets a newline")
    {
        REQUIRE(format_log_record("BEGIN", rec) == "BEGIN\n");
    }
}

TEST_CASE("XML preset", "[formatter]")
{
    auto rec = sample_record();

    auto text = format_log_record(XML_FORMAT, rec);
    REQUIRE_THAT(text, StartsWith("\t<record level=\"WARN \">\n"));
    REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("<source>net/tcp/connection.cpp</source>"));
    REQUIRE_THAT(text, Catch::Matchers::EndsWith("\t\t<message>peer reset</message>\n\t</record>\n"));

    REQUIRE_THAT(format_log_record(XML_HEADER, rec), StartsWith("<log created=\"2025/03/07 09:05:04 "));
    REQUIRE(format_log_record(XML_FOOTER, rec) == "</log>\n");
}
