#include <opus/opus.h>

#include "macros/logger.hpp"
#include "opus.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/assert.hpp"

namespace opus {
namespace {
auto logger = Logger("WEARCAST_OPUS");
} // namespace

auto Encoder::init(const uint32_t freq) -> bool {
    auto error = 0;
    state      = AutoOpusEncoder(opus_encoder_create(freq, 1, OPUS_APPLICATION_VOIP, &error));
    ensure(state && error == OPUS_OK, "error={}", error);
    return true;
}

auto Encoder::encode(const std::span<const int16_t> pcm) -> std::optional<std::vector<std::byte>> {
    auto out = std::vector<std::byte>(pcm.size() * sizeof(int16_t));
    auto ret = opus_encode(state.get(), pcm.data(), pcm.size(), (unsigned char*)out.data(), out.size());
    ensure(ret > 0, "ret={}", ret);
    out.resize(ret);
    return out;
}

auto Decoder::init(const uint32_t freq) -> bool {
    auto error = 0;
    state      = AutoOpusDecoder(opus_decoder_create(freq, 1, &error));
    ensure(state && error == OPUS_OK, "error={}", error);
    return true;
}

auto Decoder::decode(const std::span<const std::byte> packet, const size_t max_samples) -> std::optional<std::vector<int16_t>> {
    ensure(state, "decoder is not initialized");
    auto out = std::vector<int16_t>(max_samples);
    auto ret = opus_decode(state.get(), (const unsigned char*)packet.data(), packet.size(), out.data(), out.size(), 0);
    ensure(ret > 0, "{}", opus_strerror(ret));
    out.resize(ret);
    return out;
}
} // namespace opus
