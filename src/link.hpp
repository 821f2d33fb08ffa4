#pragma once
#include <chrono>
#include <functional>
#include <span>
#include <string_view>

#include <coop/promise.hpp>

namespace ble {
using NotifyHandler = std::function<void(std::span<const std::byte> data)>;

// gatt client of the wearable, provided by the wireless stack.
// notifications and on_disconnected may arrive on any thread until disconnect() returns.
struct Link {
    std::function<void()> on_disconnected;

    virtual auto connect(std::string_view address, std::chrono::milliseconds timeout) -> coop::Async<bool> = 0;
    virtual auto subscribe(std::string_view characteristic, NotifyHandler handler) -> bool = 0;
    virtual auto unsubscribe(std::string_view characteristic) -> void = 0;
    // no-op when not connected
    virtual auto disconnect() -> void = 0;

    virtual ~Link() = default;
};
} // namespace ble
