/**
 * @file test_handoff_queue.cpp
 * @brief Tests for the ordered hand-off queue
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "log_handoff_queue.hpp"

using namespace rotolog;
using namespace std::chrono_literals;

namespace
{

// Collect up to @p count items, giving up after @p limit without progress
std::vector<int> consume(handoff_queue<int> &queue, size_t count, std::chrono::milliseconds limit = 5000ms)
{
    std::vector<int> items;
    int item = 0;
    while (items.size() < count)
    {
        auto status = queue.wait_dequeue_until(item, std::chrono::steady_clock::now() + limit);
        if (status != dequeue_status::item) break;
        items.push_back(item);
    }
    return items;
}

} // namespace

TEST_CASE("Single producer keeps its order", "[queue]")
{
    handoff_queue<int> queue(4);
    queue.start();

    std::thread producer(
        [&]
        {
            for (int i = 0; i < 1000; ++i) queue.enqueue(i);
        });

    auto items = consume(queue, 1000);
    producer.join();

    REQUIRE(items.size() == 1000);
    for (int i = 0; i < 1000; ++i) REQUIRE(items[i] == i);
}

TEST_CASE("Total order across producers follows admission", "[queue]")
{
    handoff_queue<int> queue(2);
    queue.start();

    // Tickets are taken and enqueued under one lock, so admission order is the ticket order
    std::mutex admit_mutex;
    int next_ticket = 0;

    constexpr int producers    = 8;
    constexpr int per_producer = 250;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p)
    {
        threads.emplace_back(
            [&]
            {
                for (int i = 0; i < per_producer; ++i)
                {
                    std::lock_guard<std::mutex> lock(admit_mutex);
                    queue.enqueue(next_ticket++);
                }
            });
    }

    auto items = consume(queue, producers * per_producer);
    for (auto &t : threads) t.join();

    REQUIRE(items.size() == producers * per_producer);
    for (size_t i = 0; i < items.size(); ++i) REQUIRE(items[i] == static_cast<int>(i));
}

TEST_CASE("Slow consumer does not block producers", "[queue]")
{
    handoff_queue<int> queue(1);
    queue.start();

    // Nobody consumes; the relay moves everything into its backlog
    std::atomic<bool> done{false};
    std::thread producer(
        [&]
        {
            for (int i = 0; i < 500; ++i) queue.enqueue(i);
            done = true;
        });

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!done && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(1ms);
    REQUIRE(done);
    producer.join();

    auto items = consume(queue, 500);
    REQUIRE(items.size() == 500);
    for (int i = 0; i < 500; ++i) REQUIRE(items[i] == i);
}

TEST_CASE("Producers block while the entry channel is full", "[queue]")
{
    handoff_queue<int> queue(2);

    // Relay not running yet: the entry channel is all there is
    REQUIRE(queue.enqueue(0));
    REQUIRE(queue.enqueue(1));

    std::atomic<int> admitted{0};
    std::thread producer(
        [&]
        {
            for (int i = 2; i < 5; ++i)
            {
                queue.enqueue(i);
                admitted++;
            }
        });

    std::this_thread::sleep_for(50ms);
    REQUIRE(admitted == 0);

    queue.start();
    auto items = consume(queue, 5);
    producer.join();

    REQUIRE(admitted == 3);
    REQUIRE(items == std::vector<int>{0, 1, 2, 3, 4});
}

TEST_CASE("Consumer wake-ups", "[queue]")
{
    handoff_queue<int> queue(4);
    queue.start();
    int item = -1;

    SECTION("Timeout without items")
    {
        auto start  = std::chrono::steady_clock::now();
        auto status = queue.wait_dequeue_until(item, start + 20ms);
        REQUIRE(status == dequeue_status::timeout);
        REQUIRE(std::chrono::steady_clock::now() - start >= 20ms);
    }

    SECTION("Interrupts collapse into one")
    {
        queue.interrupt();
        queue.interrupt();
        REQUIRE(queue.wait_dequeue_until(item, std::chrono::steady_clock::now() + 1s) == dequeue_status::interrupted);
        REQUIRE(queue.wait_dequeue_until(item, std::chrono::steady_clock::now() + 10ms) == dequeue_status::timeout);
    }

    SECTION("Interrupt from another thread")
    {
        std::thread waker(
            [&]
            {
                std::this_thread::sleep_for(10ms);
                queue.interrupt();
            });
        REQUIRE(queue.wait_dequeue_until(item, std::chrono::steady_clock::now() + 5s) == dequeue_status::interrupted);
        waker.join();
    }

    SECTION("Shutdown cancels the consumer")
    {
        std::thread stopper(
            [&]
            {
                std::this_thread::sleep_for(10ms);
                queue.shutdown();
            });
        REQUIRE(queue.wait_dequeue_until(item, std::chrono::steady_clock::now() + 5s) == dequeue_status::cancelled);
        stopper.join();
    }
}

TEST_CASE("Drain returns everything in order", "[queue]")
{
    handoff_queue<int> queue(64);
    queue.start();

    for (int i = 0; i < 10; ++i) REQUIRE(queue.enqueue(i));

    // Take two, leave the rest spread over slot, backlog and entry channel
    auto taken = consume(queue, 2);
    REQUIRE(taken == std::vector<int>{0, 1});

    for (int i = 10; i < 20; ++i) REQUIRE(queue.enqueue(i));

    queue.shutdown();
    int item = -1;
    REQUIRE(queue.wait_dequeue_until(item, std::chrono::steady_clock::now() + 1s) == dequeue_status::cancelled);

    // Admission still works between shutdown and drain
    REQUIRE(queue.enqueue(20));

    auto rest = queue.drain();
    REQUIRE(rest.size() == 19);
    for (size_t i = 0; i < rest.size(); ++i) REQUIRE(rest[i] == static_cast<int>(i) + 2);
    REQUIRE(queue.closed());
}

TEST_CASE("Drained queue rejects producers", "[queue]")
{
    SECTION("Later enqueue calls")
    {
        handoff_queue<int> queue(4);
        queue.start();
        REQUIRE(queue.drain().empty());
        REQUIRE_FALSE(queue.enqueue(1));
        REQUIRE(queue.drain().empty());
    }

    SECTION("Producers blocked on a full channel")
    {
        handoff_queue<int> queue(1);
        REQUIRE(queue.enqueue(0));

        std::atomic<int> result{-1};
        std::thread producer([&] { result = queue.enqueue(1) ? 1 : 0; });

        std::this_thread::sleep_for(20ms);
        auto rest = queue.drain();
        producer.join();

        REQUIRE(rest == std::vector<int>{0});
        REQUIRE(result == 0);
    }
}
