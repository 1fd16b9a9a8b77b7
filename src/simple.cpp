#include <iostream>
#include <cstring>
#include <string>
#include <thread>
#include <vector>
#include "log.hpp"

using namespace rotolog;
using namespace std::chrono_literals;

void print_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " [options]\n"
              << "Options:\n"
              << "  -f <file>         Output file (default: /tmp/log.txt)\n"
              << "  -n <count>        Records per thread (default: 100000)\n"
              << "  -t <threads>      Producer threads (default: 1)\n"
              << "  -l <lines>        Rotate after this many lines (default: off)\n"
              << "  -s <bytes>        Rotate after this many bytes (default: off)\n"
              << "  -x                Write XML records\n"
              << "  -d                Show detailed statistics\n"
              << "  -h                Show this help\n";
}

int main(int argc, char *argv[])
{
    // Default parameters
    std::string output_file = "/tmp/log.txt";
    long count = 100000;
    int threads = 1;
    uint64_t rotate_lines = 0;
    uint64_t rotate_bytes = 0;
    bool xml = false;
    [[maybe_unused]] bool show_detailed_stats = false;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) {
            output_file = argv[++i];
        } else if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            count = std::stol(argv[++i]);
        } else if (strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            threads = std::stoi(argv[++i]);
        } else if (strcmp(argv[i], "-l") == 0 && i + 1 < argc) {
            rotate_lines = std::stoull(argv[++i]);
        } else if (strcmp(argv[i], "-s") == 0 && i + 1 < argc) {
            rotate_bytes = std::stoull(argv[++i]);
        } else if (strcmp(argv[i], "-x") == 0) {
            xml = true;
        } else if (strcmp(argv[i], "-d") == 0) {
#ifdef ROTOLOG_COLLECT_WRITER_METRICS
            show_detailed_stats = true;
#endif
        } else if (strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    auto config = xml ? writer_config::xml() : writer_config{};
    config.set_rotate_lines(rotate_lines).set_rotate_size(rotate_bytes).set_keep_old_files(rotate_lines || rotate_bytes);

    try {
        file_log_writer writer(output_file, config);

        auto start = std::chrono::steady_clock::now();

        std::vector<std::thread> producers;
        for (int t = 0; t < threads; ++t) {
            producers.emplace_back([&writer, t, count] {
                for (long i = 0; i < count; ++i) {
                    writer.write({log_level::info, std::chrono::system_clock::now(), __FILE__,
                                  fmt::format("Hello world from producer {} record {}", t, i)});
                }
            });
        }
        for (auto &p : producers) p.join();

        writer.write({log_level::warn, std::chrono::system_clock::now(), __FILE__, "Log blast test done"});
        writer.close();

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        std::cerr << "Wrote " << count * threads + 1 << " records to " << output_file << " in " << elapsed.count() << " ms\n";

#ifdef ROTOLOG_COLLECT_WRITER_METRICS
        if (show_detailed_stats) {
            auto stats = writer.get_stats();
            std::cerr << "========== WRITER METRICS ==========\n";
            std::cerr << "  Records written: " << stats.records_written << "\n";
            std::cerr << "  Records dropped: " << stats.records_dropped << "\n";
            std::cerr << "  Rotations: " << stats.rotations << "\n";
            std::cerr << "  Rotation failures: " << stats.rotation_failures << "\n";
            std::cerr << "  Write failures: " << stats.write_failures << "\n";
            std::cerr << "  Timer flushes: " << stats.flushes << "\n";
            std::cerr << "====================================\n";
        }
#endif
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
