#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

// fifo shared between producers and a consumer thread.
// push never blocks: a full queue rejects the item and the caller decides where it goes.
template <class T>
struct BoundedQueue {
    mutable std::mutex      mutex;
    std::condition_variable cond;
    std::deque<T>           items;
    size_t                  limit;
    bool                    stopped = false;

    auto capacity() const -> size_t {
        return limit;
    }

    auto size() const -> size_t {
        auto lock = std::lock_guard(mutex);
        return items.size();
    }

    auto empty() const -> bool {
        return size() == 0;
    }

    // item is moved from only when accepted
    auto try_push(T&& item) -> bool {
        {
            auto lock = std::lock_guard(mutex);
            if(items.size() >= limit) {
                return false;
            }
            items.push_back(std::move(item));
        }
        cond.notify_all();
        return true;
    }

    // copy of the head, the item stays queued
    auto front() const -> std::optional<T> {
        auto lock = std::lock_guard(mutex);
        if(items.empty()) {
            return std::nullopt;
        }
        return items.front();
    }

    auto pop_front() -> std::optional<T> {
        auto lock = std::lock_guard(mutex);
        if(items.empty()) {
            return std::nullopt;
        }
        auto item = std::move(items.front());
        items.pop_front();
        return item;
    }

    // blocks until an item arrives; returns nullopt once stopped and drained
    auto pop_wait() -> std::optional<T> {
        auto lock = std::unique_lock(mutex);
        cond.wait(lock, [this] { return !items.empty() || stopped; });
        if(items.empty()) {
            return std::nullopt;
        }
        auto item = std::move(items.front());
        items.pop_front();
        return item;
    }

    // returns true if the queue is non-empty on wakeup
    template <class Rep, class Period>
    auto wait_for(const std::chrono::duration<Rep, Period> timeout) -> bool {
        auto lock = std::unique_lock(mutex);
        cond.wait_for(lock, timeout, [this] { return !items.empty() || stopped; });
        return !items.empty();
    }

    auto drain() -> std::vector<T> {
        auto lock = std::lock_guard(mutex);
        auto ret  = std::vector<T>(std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));
        items.clear();
        return ret;
    }

    auto snapshot() const -> std::vector<T> {
        auto lock = std::lock_guard(mutex);
        return std::vector<T>(items.begin(), items.end());
    }

    // wakes every waiter; pushes are still accepted
    auto stop() -> void {
        {
            auto lock = std::lock_guard(mutex);
            stopped   = true;
        }
        cond.notify_all();
    }

    auto is_stopped() const -> bool {
        auto lock = std::lock_guard(mutex);
        return stopped;
    }

    explicit BoundedQueue(const size_t limit)
        : limit(limit) {}
};
