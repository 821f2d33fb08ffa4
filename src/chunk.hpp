#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

struct AudioChunk {
    std::vector<std::byte> data;
    bool                   bypass     = false; // skip downstream filtering(silence suppression)
    int64_t                created_at = 0;     // unix time in ms
};

inline auto unix_time_ms() -> int64_t {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

inline auto make_chunk(std::span<const std::byte> data, const bool bypass) -> AudioChunk {
    return AudioChunk{
        .data       = std::vector<std::byte>(data.begin(), data.end()),
        .bypass     = bypass,
        .created_at = unix_time_ms(),
    };
}
