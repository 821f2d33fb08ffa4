#include <algorithm>
#include <array>
#include <bit>

#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

#include "config.hpp"
#include "macros/logger.hpp"
#include "microphone.hpp"
#include "util/cleaner.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/assert.hpp"

namespace {
auto logger = Logger("WEARCAST_MIC");

constexpr auto frame_bytes = config::frame_samples * sizeof(int16_t);

auto on_process(void* const userdata) -> void {
    std::bit_cast<MicrophoneSource*>(userdata)->on_process();
}

auto on_state_changed(void* const userdata, const pw_stream_state /*old*/, const pw_stream_state state, const char* const error) -> void {
    if(state == PW_STREAM_STATE_ERROR) {
        LOG_ERROR(logger, "capture stream error: {}", error != NULL ? error : "unknown");
        std::bit_cast<MicrophoneSource*>(userdata)->on_stream_error();
    } else {
        LOG_DEBUG(logger, "capture stream state={}", pw_stream_state_as_string(state));
    }
}

const auto stream_events = pw_stream_events{
    .version       = PW_VERSION_STREAM_EVENTS,
    .state_changed = on_state_changed,
    .process       = on_process,
};
} // namespace

auto MicrophoneSource::append(const std::span<const std::byte> pcm) -> void {
    pending.insert(pending.end(), pcm.begin(), pcm.end());
    auto frame = std::vector<std::byte>(config::device_header_size + frame_bytes);
    while(pending.size() >= frame_bytes) {
        // header stays zero
        std::copy_n(pending.begin(), frame_bytes, frame.begin() + config::device_header_size);
        pending.erase(pending.begin(), pending.begin() + frame_bytes);
        handler(name(), frame);
    }
}

auto MicrophoneSource::on_process() -> void {
    const auto pw_buffer = pw_stream_dequeue_buffer(stream.get());
    if(pw_buffer == NULL) {
        LOG_WARN(logger, "out of buffers");
        return;
    }
    auto cleaner = Cleaner{[this, pw_buffer] { pw_stream_queue_buffer(stream.get(), pw_buffer); }};

    const auto& data = pw_buffer->buffer->datas[0];
    if(data.data == NULL || data.chunk == NULL) {
        return;
    }
    const auto offset = std::min(data.chunk->offset, data.maxsize);
    const auto size   = std::min(data.chunk->size, data.maxsize - offset);
    append({std::bit_cast<const std::byte*>(data.data) + offset, size});
}

auto MicrophoneSource::on_stream_error() -> void {
    if(failure_reported) {
        return;
    }
    failure_reported = true;
    if(on_failed) {
        on_failed(Error::CaptureSourceUnavailable);
    }
}

auto MicrophoneSource::name() const -> std::string_view {
    return "microphone";
}

auto MicrophoneSource::start(capture::FrameHandler handler) -> bool {
    ensure(!running, "microphone already running");
    pw_init(NULL, NULL);

    auto new_loop = AutoPWThreadLoop(pw_thread_loop_new("wearcast-mic", NULL));
    ensure(new_loop.get() != NULL);

    const auto props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        NULL);
    ensure(props != NULL);
    // the stream takes ownership of props
    auto new_stream = AutoPWStream(pw_stream_new_simple(pw_thread_loop_get_loop(new_loop.get()), "wearcast-capture", props, &stream_events, this));
    ensure(new_stream.get() != NULL, "{}: cannot create capture stream", to_string(Error::CaptureSourceUnavailable));

    // "The POD start is always aligned to 8 bytes."
    alignas(8) auto pod_builder_buffer = std::array<std::byte, 1024>();
    auto            pod_builder        = spa_pod_builder{.data = pod_builder_buffer.data(), .size = pod_builder_buffer.size()};

    auto       format = spa_audio_info_raw{.format = SPA_AUDIO_FORMAT_S16, .rate = config::sample_rate, .channels = 1};
    const auto params = std::array{
        spa_format_audio_raw_build(&pod_builder, SPA_PARAM_EnumFormat, &format),
    };
    ensure(pw_stream_connect(new_stream.get(),
                             PW_DIRECTION_INPUT,
                             PW_ID_ANY,
                             pw_stream_flags(PW_STREAM_FLAG_AUTOCONNECT |
                                             PW_STREAM_FLAG_MAP_BUFFERS |
                                             PW_STREAM_FLAG_RT_PROCESS),
                             (const spa_pod**)params.data(), params.size()) == 0,
           "{}: cannot connect capture stream", to_string(Error::CaptureSourceUnavailable));

    this->handler = std::move(handler);
    pending.clear();
    failure_reported = false;
    loop   = std::move(new_loop);
    stream = std::move(new_stream);
    if(pw_thread_loop_start(loop.get()) != 0) {
        LOG_ERROR(logger, "{}: cannot start capture loop", to_string(Error::CaptureSourceUnavailable));
        stream.reset();
        loop.reset();
        return false;
    }
    running = true;
    LOG_INFO(logger, "started microphone capture rate={} frame={}", config::sample_rate, config::frame_samples);
    return true;
}

auto MicrophoneSource::stop() -> void {
    if(!running) {
        return;
    }
    running = false;
    LOG_INFO(logger, "stopping microphone capture");
    pw_thread_loop_stop(loop.get());
    stream.reset();
    loop.reset();
    pw_deinit();
}

MicrophoneSource::~MicrophoneSource() {
    stop();
}
