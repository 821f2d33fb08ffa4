#pragma once
#include <optional>
#include <span>
#include <vector>

#include "macros/autoptr.hpp"

extern "C" {
struct OpusEncoder;
struct OpusDecoder;

auto opus_encoder_destroy(OpusEncoder* st) -> void;
auto opus_decoder_destroy(OpusDecoder* st) -> void;
}

namespace opus {
declare_autoptr(OpusEncoder, OpusEncoder, opus_encoder_destroy);
declare_autoptr(OpusDecoder, OpusDecoder, opus_decoder_destroy);

struct Encoder {
    AutoOpusEncoder state;

    auto init(uint32_t freq) -> bool;
    auto encode(std::span<const int16_t> pcm) -> std::optional<std::vector<std::byte>>;
};

struct Decoder {
    AutoOpusDecoder state;

    auto init(uint32_t freq) -> bool;
    // at most max_samples per packet
    auto decode(std::span<const std::byte> packet, size_t max_samples) -> std::optional<std::vector<int16_t>>;
};
} // namespace opus
