/**
 * @file test_rotation_policy.cpp
 * @brief Tests for rotation decisions and archive naming
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

#include "log.hpp"

using namespace rotolog;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace
{

std::chrono::system_clock::time_point make_local(int year, int month, int day, int hour, int min)
{
    std::tm tm{};
    tm.tm_year  = year - 1900;
    tm.tm_mon   = month - 1;
    tm.tm_mday  = day;
    tm.tm_hour  = hour;
    tm.tm_min   = min;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

} // namespace

class policy_test_fixture
{
  protected:
    std::string test_dir;
    std::string base_filename;

    policy_test_fixture()
    {
        auto pid = getpid();
        auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
        test_dir = "/tmp/test_rotation_policy_" + std::to_string(pid) + "_" + std::to_string(tid);
        fs::create_directories(test_dir);
        base_filename = test_dir + "/test.log";
    }

    ~policy_test_fixture()
    {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void touch(const std::string &path) { std::ofstream(path) << "x"; }
};

TEST_CASE("Rotation decision order", "[rotation][policy]")
{
    auto now = make_local(2025, 1, 14, 10, 15);

    rotation_state state;
    state.reset(now);

    rotate_policy policy;

    SECTION("Nothing configured never rotates")
    {
        state.lines_written = 1000000;
        state.bytes_written = 1000000;
        REQUIRE(evaluate_rotation(policy, state, now + 48h) == rotate_reason::none);
    }

    SECTION("Line threshold fires at the limit, not before")
    {
        policy.max_lines    = 3;
        state.lines_written = 2;
        REQUIRE(evaluate_rotation(policy, state, now) == rotate_reason::none);
        state.lines_written = 3;
        REQUIRE(evaluate_rotation(policy, state, now) == rotate_reason::lines);
    }

    SECTION("Byte threshold fires at the limit, not before")
    {
        policy.max_bytes    = 100;
        state.bytes_written = 99;
        REQUIRE(evaluate_rotation(policy, state, now) == rotate_reason::none);
        state.bytes_written = 100;
        REQUIRE(evaluate_rotation(policy, state, now) == rotate_reason::bytes);
    }

    SECTION("Lines win over bytes")
    {
        policy.max_lines    = 1;
        policy.max_bytes    = 1;
        state.lines_written = 5;
        state.bytes_written = 500;
        REQUIRE(evaluate_rotation(policy, state, now) == rotate_reason::lines);
    }

    SECTION("Bytes win over day change")
    {
        policy.max_bytes    = 10;
        policy.daily        = true;
        state.bytes_written = 10;
        REQUIRE(evaluate_rotation(policy, state, now + 24h) == rotate_reason::bytes);
    }

    SECTION("Day change wins over hour change")
    {
        policy.daily  = true;
        policy.hourly = true;
        REQUIRE(evaluate_rotation(policy, state, now + 24h) == rotate_reason::daily);
    }

    SECTION("Daily ignores hour changes within the day")
    {
        policy.daily = true;
        REQUIRE(evaluate_rotation(policy, state, now + 3h) == rotate_reason::none);
    }

    SECTION("Hourly fires on the next hour")
    {
        policy.hourly = true;
        REQUIRE(evaluate_rotation(policy, state, now + 10min) == rotate_reason::none);
        REQUIRE(evaluate_rotation(policy, state, now + 1h) == rotate_reason::hourly);
    }

    SECTION("Reset clears counters and records the open period")
    {
        state.lines_written = 7;
        state.bytes_written = 70;
        state.reset(make_local(2025, 1, 15, 0, 30));
        REQUIRE(state.lines_written == 0);
        REQUIRE(state.bytes_written == 0);
        REQUIRE(state.open_day == 15);
        REQUIRE(state.open_hour == 0);
    }
}

TEST_CASE("Archive stamps", "[rotation][policy]")
{
    auto now = make_local(2025, 1, 15, 0, 30);

    REQUIRE(is_period_end(rotate_reason::daily));
    REQUIRE(is_period_end(rotate_reason::hourly));
    REQUIRE_FALSE(is_period_end(rotate_reason::lines));
    REQUIRE_FALSE(is_period_end(rotate_reason::bytes));
    REQUIRE_FALSE(is_period_end(rotate_reason::requested));

    REQUIRE(archive_stamp(rotate_reason::lines, now) == now);
    REQUIRE(archive_stamp(rotate_reason::daily, now) == now - 1h);
    REQUIRE(archive_stamp(rotate_reason::hourly, now) == now - 1h);

    // The day boundary is attributed to the day that just ended
    REQUIRE(archive_filename("app.log", archive_stamp(rotate_reason::daily, now), 1) == "app.log-2025-01-14-23+001");
}

TEST_CASE("Archive names", "[rotation][policy]")
{
    auto stamp = make_local(2025, 3, 7, 9, 5);

    REQUIRE(archive_filename("/var/log/app.log", stamp, 1) == "/var/log/app.log-2025-03-07-09+001");
    REQUIRE(archive_filename("/var/log/app.log", stamp, 42) == "/var/log/app.log-2025-03-07-09+042");
    REQUIRE(archive_filename("/var/log/app.log", stamp, 999) == "/var/log/app.log-2025-03-07-09+999");
}

TEST_CASE_METHOD(policy_test_fixture, "Archive slot search", "[rotation][policy]")
{
    auto stamp = make_local(2025, 3, 7, 9, 5);

    SECTION("First slot when none are taken")
    {
        auto slot = find_archive_slot(base_filename, stamp);
        REQUIRE(slot.has_value());
        REQUIRE(*slot == archive_filename(base_filename, stamp, 1));
    }

    SECTION("Taken slots are skipped")
    {
        touch(archive_filename(base_filename, stamp, 1));
        touch(archive_filename(base_filename, stamp, 2));

        auto slot = find_archive_slot(base_filename, stamp);
        REQUIRE(slot.has_value());
        REQUIRE(*slot == archive_filename(base_filename, stamp, 3));
    }

    SECTION("Slots of other hours do not count")
    {
        touch(archive_filename(base_filename, stamp - 1h, 1));

        auto slot = find_archive_slot(base_filename, stamp);
        REQUIRE(*slot == archive_filename(base_filename, stamp, 1));
    }

    SECTION("All slots taken")
    {
        for (int seq = 1; seq <= ARCHIVE_MAX_SEQUENCE; ++seq) { touch(archive_filename(base_filename, stamp, seq)); }

        REQUIRE_FALSE(find_archive_slot(base_filename, stamp).has_value());

        touch(base_filename);
        REQUIRE_THROWS_AS(select_archive_name(base_filename, stamp), rotation_error);
    }

    SECTION("No archive needed when the file does not exist")
    {
        REQUIRE_FALSE(select_archive_name(base_filename, stamp).has_value());
    }

    SECTION("Existing file gets the first free slot")
    {
        touch(base_filename);
        touch(archive_filename(base_filename, stamp, 1));

        auto name = select_archive_name(base_filename, stamp);
        REQUIRE(name.has_value());
        REQUIRE(*name == archive_filename(base_filename, stamp, 2));
    }
}
