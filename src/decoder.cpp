#include "config.hpp"
#include "decoder.hpp"
#include "macros/logger.hpp"

namespace {
auto logger = Logger("WEARCAST_DECODER");
} // namespace

auto strip_device_header(const std::span<const std::byte> frame) -> std::span<const std::byte> {
    if(frame.size() <= config::device_header_size) {
        return {};
    }
    return frame.subspan(config::device_header_size);
}

auto OpusFrameDecoder::init() -> bool {
    consecutive_errors = 0;
    return decoder.init(config::sample_rate);
}

auto OpusFrameDecoder::decode(const std::span<const std::byte> frame) -> std::vector<std::byte> {
    const auto packet = strip_device_header(frame);
    if(packet.empty()) {
        return {};
    }
    if(const auto pcm = decoder.decode(packet, config::frame_samples)) {
        consecutive_errors = 0;
        const auto bytes   = std::as_bytes(std::span(*pcm));
        return std::vector<std::byte>(bytes.begin(), bytes.end());
    }

    consecutive_errors += 1;
    LOG_WARN(logger, "opus decode error consecutive={}", consecutive_errors);
    if(consecutive_errors >= max_consecutive_errors) {
        LOG_WARN(logger, "too many consecutive errors, recreating decoder");
        if(!init()) {
            LOG_ERROR(logger, "failed to recreate decoder");
        }
    }
    return {};
}

auto PcmFrameDecoder::decode(const std::span<const std::byte> frame) -> std::vector<std::byte> {
    const auto pcm = strip_device_header(frame);
    return std::vector<std::byte>(pcm.begin(), pcm.end());
}
