/**
 * @file log_handoff_queue.hpp
 * @brief Ordered multi-producer / single-consumer hand-off queue
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Producers push into a bounded entry channel. A relay thread moves admitted
 * items into an unbounded overflow list and keeps at most one item on offer
 * to the consumer through a single slot:
 *
 * @code
 *   producers --> [entry, bounded] --relay--> [overflow] -> current -> [slot] --> consumer
 * @endcode
 *
 * Items always leave through the front of the overflow list, so the consumer
 * sees them in exactly the order enqueue() admitted them. Producers block only
 * while the entry channel is full, i.e. only when the relay itself falls
 * behind; a slow consumer grows the overflow list instead.
 *
 * Shutdown is two-step: shutdown() stops the relay (putting an offered but
 * unconsumed item back in front of the overflow list) and drain() hands every
 * remaining item to the caller in order and closes the queue for good.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace rotolog
{

/**
 * @brief Outcome of a consumer wait
 */
enum class dequeue_status
{
    item,        ///< An item was moved into the output argument
    timeout,     ///< The deadline passed without an item
    interrupted, ///< interrupt() was called
    cancelled,   ///< shutdown() was called; remaining items are available via drain()
};

template <typename T> class handoff_queue
{
  public:
    /**
     * @param capacity Items the entry channel admits before producers block (at least 1)
     */
    explicit handoff_queue(size_t capacity) : capacity_(capacity ? capacity : 1) {}

    handoff_queue(const handoff_queue &)            = delete;
    handoff_queue &operator=(const handoff_queue &) = delete;

    ~handoff_queue() { shutdown(); }

    /**
     * @brief Start the relay thread
     */
    void start()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (relay_thread_.joinable() || cancelled_) return;
        relay_thread_ = std::thread(&handoff_queue::relay_thread_func, this);
    }

    /**
     * @brief Admit an item, blocking while the entry channel is full
     * @return false if the queue was drained (closed) before the item could be admitted
     */
    bool enqueue(T item)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_cv_.wait(lock, [this] { return closed_ || entry_.size() < capacity_; });
        if (closed_) return false;

        entry_.push_back(std::move(item));
        relay_cv_.notify_one();
        return true;
    }

    /**
     * @brief Wait for the next item, an interrupt, shutdown or @p deadline
     *
     * Only one thread may consume.
     */
    template <typename Clock, typename Duration>
    dequeue_status wait_dequeue_until(T &out, const std::chrono::time_point<Clock, Duration> &deadline)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        consumer_cv_.wait_until(lock, deadline, [this] { return cancelled_ || slot_.has_value() || interrupted_; });

        if (cancelled_) return dequeue_status::cancelled;
        if (slot_)
        {
            out = std::move(*slot_);
            slot_.reset();
            relay_cv_.notify_one();
            return dequeue_status::item;
        }
        if (interrupted_)
        {
            interrupted_ = false;
            return dequeue_status::interrupted;
        }
        return dequeue_status::timeout;
    }

    /**
     * @brief Wake the consumer with dequeue_status::interrupted
     *
     * Interrupts that arrive before the consumer waits again collapse into one.
     */
    void interrupt()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = true;
        consumer_cv_.notify_one();
    }

    /**
     * @brief Stop the relay and wake the consumer with dequeue_status::cancelled
     *
     * Producers keep being admitted while there is room in the entry channel;
     * everything admitted is returned by drain(). Safe to call more than once.
     */
    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        relay_cv_.notify_all();
        consumer_cv_.notify_all();
        if (relay_thread_.joinable() && relay_thread_.get_id() != std::this_thread::get_id()) { relay_thread_.join(); }
    }

    /**
     * @brief Close the queue and return every item still held, oldest first
     *
     * Stops the relay first if shutdown() was not called. Producers blocked in
     * enqueue() and all later enqueue() calls are rejected.
     */
    std::vector<T> drain()
    {
        shutdown();

        std::vector<T> remaining;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;

            remaining.reserve(overflow_.size() + entry_.size() + 2);
            if (slot_)
            {
                remaining.push_back(std::move(*slot_));
                slot_.reset();
            }
            if (current_)
            {
                remaining.push_back(std::move(*current_));
                current_.reset();
            }
            for (auto &item : overflow_) remaining.push_back(std::move(item));
            overflow_.clear();
            for (auto &item : entry_) remaining.push_back(std::move(item));
            entry_.clear();
        }
        not_full_cv_.notify_all();
        return remaining;
    }

    size_t capacity() const { return capacity_; }

    /**
     * @brief True once drain() has run
     */
    bool closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

  private:
    void relay_thread_func()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true)
        {
            relay_cv_.wait(lock, [this] { return cancelled_ || !entry_.empty() || (current_ && !slot_); });

            if (cancelled_)
            {
                // Never lose the offered item
                if (current_)
                {
                    overflow_.push_front(std::move(*current_));
                    current_.reset();
                }
                return;
            }

            if (!entry_.empty())
            {
                for (auto &item : entry_) overflow_.push_back(std::move(item));
                entry_.clear();
                not_full_cv_.notify_all();

                if (!current_) promote();
            }

            if (current_ && !slot_)
            {
                slot_ = std::move(*current_);
                current_.reset();
                promote();
                consumer_cv_.notify_one();
            }
        }
    }

    // Caller holds mutex_
    void promote()
    {
        if (overflow_.empty()) return;
        current_ = std::move(overflow_.front());
        overflow_.pop_front();
    }

    const size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_full_cv_; // producers wait for room in entry_
    std::condition_variable relay_cv_;    // relay waits for entry_ items or a free slot_
    std::condition_variable consumer_cv_; // consumer waits for slot_

    std::deque<T> entry_;       // bounded admission channel
    std::deque<T> overflow_;    // unbounded backlog, relay side
    std::optional<T> current_;  // next item to offer, relay side
    std::optional<T> slot_;     // item on offer to the consumer

    bool interrupted_{false};
    bool cancelled_{false};
    bool closed_{false};

    std::thread relay_thread_;
};

} // namespace rotolog
