#pragma once
#include <span>
#include <vector>

#include "opus.hpp"

// turns one raw device frame into pcm.
// an empty result means the frame is dropped, it is not an error.
struct FrameDecoder {
    virtual auto decode(std::span<const std::byte> frame) -> std::vector<std::byte> = 0;

    virtual ~FrameDecoder() = default;
};

// empty when the frame carries no payload
auto strip_device_header(std::span<const std::byte> frame) -> std::span<const std::byte>;

struct OpusFrameDecoder : FrameDecoder {
    static constexpr auto max_consecutive_errors = 5;

    opus::Decoder decoder;
    int           consecutive_errors = 0;

    auto init() -> bool;
    auto decode(std::span<const std::byte> frame) -> std::vector<std::byte> override;
};

// the microphone already produces pcm behind a placeholder header
struct PcmFrameDecoder : FrameDecoder {
    auto decode(std::span<const std::byte> frame) -> std::vector<std::byte> override;
};
