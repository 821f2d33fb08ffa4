#pragma once
#include <functional>
#include <span>
#include <string_view>

#include "errors.hpp"

namespace capture {
// may be invoked on any thread
using FrameHandler = std::function<void(std::string_view source_id, std::span<const std::byte> frame)>;

struct Source {
    // asynchronous failure after a successful start
    std::function<void(Error)> on_failed;

    virtual auto name() const -> std::string_view = 0;
    virtual auto start(FrameHandler handler) -> bool = 0;
    // idempotent, releases the hardware
    virtual auto stop() -> void = 0;

    virtual ~Source() = default;
};
} // namespace capture
