#pragma once
#include <cstddef>
#include <span>

// destination of decoded audio.
// failure is signaled by returning false; the delivery engine treats a thrown exception the same way.
struct NetworkSink {
    virtual auto send(std::span<const std::byte> payload, bool bypass) -> bool = 0;

    virtual ~NetworkSink() = default;
};
