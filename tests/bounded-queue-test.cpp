#include <print>
#include <thread>

#include "bounded-queue.hpp"
#include "fakes.hpp"
#include "macros/assert.hpp"

namespace {
auto fifo_within_capacity() -> bool {
    auto queue = BoundedQueue<int>(3);
    ensure(queue.try_push(1));
    ensure(queue.try_push(2));
    ensure(queue.try_push(3));
    auto rejected = 4;
    ensure(!queue.try_push(std::move(rejected)));
    ensure(queue.size() == 3);
    ensure(queue.pop_front() == 1);
    ensure(queue.pop_front() == 2);
    ensure(queue.try_push(4));
    ensure(queue.snapshot() == std::vector{3, 4});
    return true;
}

auto rejected_item_is_kept() -> bool {
    auto queue = BoundedQueue<std::vector<int>>(1);
    ensure(queue.try_push({1}));
    auto item = std::vector{2, 3};
    ensure(!queue.try_push(std::move(item)));
    ensure(item.size() == 2, "item was consumed");
    return true;
}

auto front_does_not_remove() -> bool {
    auto queue = BoundedQueue<int>(2);
    ensure(!queue.front());
    ensure(queue.try_push(7));
    ensure(queue.front() == 7);
    ensure(queue.front() == 7);
    ensure(queue.size() == 1);
    return true;
}

auto wait_wakes_on_push() -> bool {
    auto queue  = BoundedQueue<int>(2);
    auto pusher = std::thread([&queue] {
        std::this_thread::sleep_for(20ms);
        queue.try_push(1);
    });
    const auto begin = std::chrono::steady_clock::now();
    const auto woken = queue.wait_for(5s);
    pusher.join();
    ensure(woken);
    ensure(std::chrono::steady_clock::now() - begin < 4s);
    return true;
}

auto pop_wait_drains_after_stop() -> bool {
    auto queue = BoundedQueue<int>(4);
    ensure(queue.try_push(1));
    ensure(queue.try_push(2));
    queue.stop();
    ensure(queue.pop_wait() == 1);
    ensure(queue.pop_wait() == 2);
    ensure(!queue.pop_wait());
    ensure(!queue.wait_for(1s));
    return true;
}

auto stop_wakes_blocked_consumer() -> bool {
    auto queue    = BoundedQueue<int>(4);
    auto result   = std::optional<int>(0);
    auto consumer = std::thread([&] { result = queue.pop_wait(); });
    std::this_thread::sleep_for(20ms);
    queue.stop();
    consumer.join();
    ensure(!result);
    return true;
}
} // namespace

auto main() -> int {
    auto ok = true;
    ok &= fifo_within_capacity();
    ok &= rejected_item_is_kept();
    ok &= front_does_not_remove();
    ok &= wait_wakes_on_push();
    ok &= pop_wait_drains_after_stop();
    ok &= stop_wakes_blocked_consumer();
    std::println("bounded-queue-test: {}", ok ? "pass" : "fail");
    return ok ? 0 : 1;
}
