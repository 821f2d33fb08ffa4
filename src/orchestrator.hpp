#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

#include <coop/promise.hpp>
#include <coop/thread-event.hpp>

#include "bounded-queue.hpp"
#include "capture.hpp"
#include "decoder.hpp"
#include "delivery.hpp"

// owns every pipeline component: capture sources, the frame channel, decode and delivery
struct Orchestrator {
    struct Slot {
        std::unique_ptr<capture::Source> source;
        std::unique_ptr<FrameDecoder>    decoder;
    };

    // raw frame in flight from a capture source to the pump
    struct Frame {
        FrameDecoder*          decoder;
        std::vector<std::byte> data;
    };

    struct Failure {
        Slot* slot;
        Error error;
    };

    Slot                primary;
    Slot                secondary;
    delivery::Engine    engine;
    BoundedQueue<Frame> frames;
    std::thread         pump_thread;
    Slot*               active = nullptr;
    bool                bypass = false;
    bool                failed = false;

    // wakes run() on stop or on a reported failure
    coop::ThreadEvent    wakeup;
    std::mutex           failures_lock;
    std::vector<Failure> failures;
    std::atomic<bool>    stopping = false;

    auto activate(Slot& slot) -> bool;
    // any thread
    auto report_failure(Slot& slot, Error error) -> void;
    // runner thread
    auto on_source_failed(Slot& slot, Error error) -> void;
    // decodes frames and hands them to the delivery engine
    auto pump_main() -> void;
    auto shutdown() -> void;

    // runs until stop(); false if no capture source could run or the engine could not start
    auto run() -> coop::Async<bool>;
    // any thread
    auto stop() -> void;

    Orchestrator(Slot primary, Slot secondary, delivery::Config delivery_config, std::shared_ptr<NetworkSink> sink, bool bypass);
};
