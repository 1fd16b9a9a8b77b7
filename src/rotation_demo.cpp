/**
 * @file rotation_demo.cpp
 * @brief Demonstration of file rotation with the rotating file writer
 * @author dorgby.net
 *
 * This demo showcases the rotation features:
 * - Line count rotation
 * - Size-based rotation
 * - Hourly rotation
 * - Explicit rotation requests
 * - Archiving vs reopening in place
 * - Multi-threaded logging
 */

#include <iostream>
#include <thread>
#include <chrono>
#include <vector>
#include <filesystem>
#include <atomic>
#include <random>
#include <memory>

#include "log.hpp"

using namespace rotolog;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

// Global control flags
std::atomic<bool> stop_threads{false};
std::atomic<uint64_t> total_messages{0};

const std::string log_dir = "/tmp/rotation_demo";

void print_header(const std::string &title)
{
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << " " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void print_metrics(const file_log_writer &writer)
{
#ifdef ROTOLOG_COLLECT_WRITER_METRICS
    auto stats = writer.get_stats();

    std::cout << "\nWriter Metrics:\n";
    std::cout << "  Records written: " << stats.records_written << "\n";
    std::cout << "  Records dropped: " << stats.records_dropped << "\n";
    std::cout << "  Rotations: " << stats.rotations << "\n";
    if (stats.rotation_failures > 0) { std::cout << "  Rotation failures: " << stats.rotation_failures << "\n"; }
    if (stats.write_failures > 0) { std::cout << "  Write failures: " << stats.write_failures << "\n"; }
    std::cout << "  Timer flushes: " << stats.flushes << "\n";

    std::cout << std::flush;
#else
    (void)writer;
    std::cout << "\nWriter metrics not collected (Release build)\n";
#endif
}

void count_rotated_files(const std::string &base_path)
{
    fs::path base(base_path);
    fs::path dir = base.parent_path();
    if (dir.empty()) dir = ".";
    std::string prefix = base.filename().string() + "-";

    size_t count      = 0;
    size_t total_size = 0;

    for (const auto &entry : fs::directory_iterator(dir))
    {
        if (entry.is_regular_file())
        {
            std::string filename = entry.path().filename().string();
            if (filename.find(prefix) == 0)
            {
                count++;
                total_size += entry.file_size();
            }
        }
    }

    std::cout << "  Archived files: " << count << " (total size: " << total_size / 1024 << " KB)\n";
}

log_record make_record(log_level level, std::string message)
{
    return log_record{level, std::chrono::system_clock::now(), __FILE__, std::move(message)};
}

// Worker thread for continuous logging
void logging_worker(file_log_writer &writer, int thread_id, int messages_per_second)
{
    auto delay = std::chrono::milliseconds(1000 / messages_per_second);
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> size_dist(50, 200);

    while (!stop_threads.load())
    {
        int msg_size = size_dist(gen);
        std::string padding(msg_size, 'X');

        writer.write(make_record(log_level::info, fmt::format("Thread-{} msg#{} {}", thread_id,
                                                              total_messages.fetch_add(1), padding)));

        std::this_thread::sleep_for(delay);
    }
}

// Demo 1: Line count rotation
void demo_line_rotation()
{
    print_header("Demo 1: Line Count Rotation");

    std::string log_file = log_dir + "/lines.log";

    file_log_writer writer(log_file, writer_config{}.set_rotate_lines(250).set_keep_old_files(true));

    std::cout << "Configuration:\n";
    std::cout << "  Max lines per file: 250\n";
    std::cout << "  Keep old files: yes\n";
    std::cout << "  Log file: " << log_file << "\n\n";

    std::cout << "Writing 1000 records...\n";
    for (int i = 0; i < 1000; ++i) { writer.write(make_record(log_level::info, fmt::format("Line rotation record {}", i))); }

    writer.close();

    count_rotated_files(log_file);
    print_metrics(writer);
}

// Demo 2: Size-based rotation
void demo_size_rotation()
{
    print_header("Demo 2: Size-Based Rotation");

    std::string log_file = log_dir + "/size_rotation.log";

    file_log_writer writer(log_file, writer_config{}.set_rotate_size(100 * 1024).set_keep_old_files(true));

    std::cout << "Configuration:\n";
    std::cout << "  Max file size: 100 KB\n";
    std::cout << "  Keep old files: yes\n";
    std::cout << "  Log file: " << log_file << "\n\n";

    std::cout << "Generating logs to trigger rotation...\n";
    for (int i = 0; i < 3000; ++i)
    {
        writer.write(make_record(log_level::info,
                                 fmt::format("Size rotation test message {} - Lorem ipsum dolor sit amet, consectetur "
                                             "adipiscing elit. Sed do eiusmod tempor incididunt ut labore.",
                                             i)));

        if (i % 500 == 0) { std::cout << "  Generated " << i << " messages\n"; }
    }

    writer.close();

    count_rotated_files(log_file);
    print_metrics(writer);
}

// Demo 3: Hourly rotation with a simulated clock
void demo_hourly_rotation()
{
    print_header("Demo 3: Hourly Rotation (Simulated Clock)");

    std::string log_file = log_dir + "/hourly.log";

    // Every call advances the clock by 10 minutes
    auto start   = std::chrono::system_clock::now();
    auto minutes = std::make_shared<std::atomic<int>>(0);
    auto config  = writer_config{}
                      .set_rotate_hourly(true)
                      .set_keep_old_files(true)
                      .set_head_foot("=== opened [%D %T] ===", "=== closed [%D %T] ===")
                      .set_clock([start, minutes] { return start + std::chrono::minutes(minutes->fetch_add(10)); });

    file_log_writer writer(log_file, config);

    std::cout << "Configuration:\n";
    std::cout << "  Rotation: hourly\n";
    std::cout << "  Clock: +10 minutes per reading\n";
    std::cout << "  Log file: " << log_file << "\n\n";

    for (int i = 0; i < 30; ++i) { writer.write(make_record(log_level::info, fmt::format("Hourly record {}", i))); }

    writer.close();

    std::cout << "  Archives are stamped with the hour they cover\n";
    count_rotated_files(log_file);
    print_metrics(writer);
}

// Demo 4: Explicit rotation, e.g. from a SIGHUP handler thread
void demo_requested_rotation()
{
    print_header("Demo 4: Requested Rotation");

    std::string log_file = log_dir + "/requested.log";

    file_log_writer writer(log_file, writer_config{}.set_keep_old_files(true));

    for (int round = 0; round < 3; ++round)
    {
        for (int i = 0; i < 10; ++i)
        {
            writer.write(make_record(log_level::info, fmt::format("Round {} record {}", round, i)));
        }
        std::cout << "  Requesting rotation after round " << round << "\n";
        writer.request_rotation();
        std::this_thread::sleep_for(50ms);
    }

    writer.close();

    count_rotated_files(log_file);
    print_metrics(writer);
}

// Demo 5: Rotation without archiving
void demo_reopen_in_place()
{
    print_header("Demo 5: Rotation Without Archiving");

    std::string log_file = log_dir + "/in_place.log";

    file_log_writer writer(log_file, writer_config{}.set_rotate_lines(5).set_head_foot("--- header ---", "--- footer ---"));

    std::cout << "Without keep_old_files the file is closed and reopened in append mode;\n";
    std::cout << "footer and header mark every rotation point.\n\n";

    for (int i = 0; i < 12; ++i) { writer.write(make_record(log_level::debug, fmt::format("In-place record {}", i))); }

    writer.close();

    std::cout << "  File size: " << fs::file_size(log_file) << " bytes\n";
    count_rotated_files(log_file);
    print_metrics(writer);
}

// Demo 6: Multi-threaded logging with rotation
void demo_multithreaded()
{
    print_header("Demo 6: Multi-threaded Stress Test");

    std::string log_file = log_dir + "/multithread.log";

    file_log_writer writer(log_file, writer_config{}.set_rotate_size(1024 * 1024).set_keep_old_files(true));

    std::cout << "Configuration:\n";
    std::cout << "  Max file size: 1 MB\n";
    std::cout << "  Worker threads: 4\n";
    std::cout << "  Duration: 5 seconds\n";
    std::cout << "  Log file: " << log_file << "\n\n";

    total_messages.store(0);
    stop_threads.store(false);

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) { workers.emplace_back(logging_worker, std::ref(writer), i, 200); }

    auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < 5s)
    {
        std::this_thread::sleep_for(1s);
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start).count();
        std::cout << "  Progress: " << elapsed << "s, Messages: " << total_messages.load() << "\n";
    }

    stop_threads.store(true);
    for (auto &t : workers) { t.join(); }

    writer.close();

    std::cout << "\nResults:\n";
    std::cout << "  Total messages logged: " << total_messages.load() << "\n";

    count_rotated_files(log_file);
    print_metrics(writer);
}

int main(int argc, char *argv[])
{
    std::cout << "rotolog File Rotation Demo " << VERSION << "\n";
    std::cout << "==========================\n";

    fs::create_directories(log_dir);

    try
    {
        if (argc > 1)
        {
            std::string demo = argv[1];
            if (demo == "1" || demo == "lines") { demo_line_rotation(); }
            else if (demo == "2" || demo == "size") { demo_size_rotation(); }
            else if (demo == "3" || demo == "hourly") { demo_hourly_rotation(); }
            else if (demo == "4" || demo == "requested") { demo_requested_rotation(); }
            else if (demo == "5" || demo == "inplace") { demo_reopen_in_place(); }
            else if (demo == "6" || demo == "multithread") { demo_multithreaded(); }
            else
            {
                std::cout << "\nUsage: " << argv[0] << " [demo_number|demo_name]\n";
                std::cout << "  1 or lines       - Line count rotation\n";
                std::cout << "  2 or size        - Size-based rotation\n";
                std::cout << "  3 or hourly      - Hourly rotation\n";
                std::cout << "  4 or requested   - Requested rotation\n";
                std::cout << "  5 or inplace     - Rotation without archiving\n";
                std::cout << "  6 or multithread - Multi-threaded stress test\n";
                return 1;
            }
        }
        else
        {
            demo_line_rotation();
            demo_size_rotation();
            demo_hourly_rotation();
            demo_requested_rotation();
            demo_reopen_in_place();
            demo_multithreaded();
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Demo failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nDemo complete. Files are in " << log_dir << "\n";
    return 0;
}
