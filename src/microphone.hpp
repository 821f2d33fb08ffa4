#pragma once
#include <vector>

#include "capture.hpp"
#include "macros/autoptr.hpp"

extern "C" {
struct pw_thread_loop;
struct pw_stream;

auto pw_thread_loop_destroy(pw_thread_loop* loop) -> void;
auto pw_stream_destroy(pw_stream* stream) -> void;
}

declare_autoptr(PWThreadLoop, pw_thread_loop, pw_thread_loop_destroy);
declare_autoptr(PWStream, pw_stream, pw_stream_destroy);

// secondary capture source.
// frames carry pcm behind a zeroed device header so that they look like peripheral frames.
struct MicrophoneSource : capture::Source {
    AutoPWThreadLoop       loop;
    AutoPWStream           stream;
    capture::FrameHandler  handler;
    std::vector<std::byte> pending;                  // loop thread only
    bool                   failure_reported = false; // loop thread only
    bool                   running          = false;

    // splits captured pcm into frames
    auto append(std::span<const std::byte> pcm) -> void;
    auto on_process() -> void;
    // reports the dead stream once through on_failed, from the loop thread
    auto on_stream_error() -> void;

    auto name() const -> std::string_view override;
    auto start(capture::FrameHandler handler) -> bool override;
    auto stop() -> void override;

    ~MicrophoneSource();
};
