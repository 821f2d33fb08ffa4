#include <cmath>
#include <numbers>
#include <print>

#include "config.hpp"
#include "decoder.hpp"
#include "fakes.hpp"
#include "macros/assert.hpp"

namespace {
auto sine_frame() -> std::vector<int16_t> {
    auto pcm = std::vector<int16_t>(config::frame_samples);
    for(auto i = 0uz; i < pcm.size(); i += 1) {
        pcm[i] = int16_t(8000 * std::sin(2 * std::numbers::pi * 440 * i / config::sample_rate));
    }
    return pcm;
}

auto with_header(const std::span<const std::byte> payload) -> std::vector<std::byte> {
    auto frame = bytes({0, 0, 7});
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

auto header_is_stripped() -> bool {
    const auto frame = bytes({9, 8, 7, 1, 2});
    const auto body  = strip_device_header(frame);
    ensure(body.size() == 2);
    ensure(body[0] == std::byte(1) && body[1] == std::byte(2));
    ensure(strip_device_header(bytes({9, 8, 7})).empty());
    ensure(strip_device_header(bytes({9})).empty());
    return true;
}

auto pcm_passthrough() -> bool {
    auto decoder = PcmFrameDecoder();
    ensure(decoder.decode(bytes({0, 0, 0, 10, 20, 30, 40})) == bytes({10, 20, 30, 40}));
    ensure(decoder.decode(bytes({0, 0, 0})).empty());
    ensure(decoder.decode({}).empty());
    return true;
}

auto opus_frames_decode_to_pcm() -> bool {
    auto encoder = opus::Encoder();
    ensure(encoder.init(config::sample_rate));
    auto decoder = OpusFrameDecoder();
    ensure(decoder.init());

    const auto pcm = sine_frame();
    for(auto i = 0; i < 3; i += 1) {
        const auto packet = encoder.encode(pcm);
        ensure(packet);
        const auto decoded = decoder.decode(with_header(*packet));
        ensure(decoded.size() == config::frame_samples * sizeof(int16_t), "size={}", decoded.size());
    }
    ensure(decoder.consecutive_errors == 0);
    return true;
}

auto short_opus_frame_is_dropped() -> bool {
    auto decoder = OpusFrameDecoder();
    ensure(decoder.init());
    ensure(decoder.decode(bytes({1, 2, 3})).empty());
    ensure(decoder.consecutive_errors == 0);
    return true;
}

auto decoder_recovers_from_errors() -> bool {
    auto encoder = opus::Encoder();
    ensure(encoder.init(config::sample_rate));
    auto decoder = OpusFrameDecoder();
    ensure(decoder.init());

    // a lone code 3 toc byte is not a valid packet
    const auto broken = bytes({0, 0, 0, 0xff});
    for(auto i = 1; i < OpusFrameDecoder::max_consecutive_errors; i += 1) {
        ensure(decoder.decode(broken).empty());
        ensure(decoder.consecutive_errors == i);
    }
    ensure(decoder.decode(broken).empty());
    ensure(decoder.consecutive_errors == 0, "decoder was not recreated");

    const auto packet = encoder.encode(sine_frame());
    ensure(packet);
    ensure(decoder.decode(with_header(*packet)).size() == config::frame_samples * sizeof(int16_t));
    return true;
}
} // namespace

auto main() -> int {
    auto ok = true;
    ok &= header_is_stripped();
    ok &= pcm_passthrough();
    ok &= opus_frames_decode_to_pcm();
    ok &= short_opus_frame_is_dropped();
    ok &= decoder_recovers_from_errors();
    std::println("decoder-test: {}", ok ? "pass" : "fail");
    return ok ? 0 : 1;
}
