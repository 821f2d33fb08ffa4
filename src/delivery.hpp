#pragma once
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <thread>

#include "bounded-queue.hpp"
#include "chunk.hpp"
#include "config.hpp"
#include "record.hpp"
#include "sink.hpp"

namespace delivery {
enum class State {
    Online,  // send directly, buffer on failure
    Offline, // persist directly until a probe succeeds
};

struct Config {
    size_t                    capacity          = config::queue_capacity;
    std::chrono::milliseconds retry_interval    = std::chrono::milliseconds(config::retry_interval_ms);
    int                       probe_multiplier  = config::offline_probe_multiplier;
    size_t                    failure_threshold = config::offline_failure_threshold;
    size_t                    batch_size        = config::persisted_batch_size;
    std::chrono::milliseconds join_timeout      = std::chrono::milliseconds(config::worker_join_timeout_ms);
    std::filesystem::path     storage_dir       = config::default_storage_dir;
};

// state shared by producers and the retry worker.
// the worker holds its own reference so that a worker outliving stop() stays valid.
struct Shared {
    Config                       config;
    std::shared_ptr<NetworkSink> sink;
    BoundedQueue<AudioChunk>     queue;
    record::Store                store;
    std::atomic<State>           state                = State::Online;
    std::atomic<size_t>          consecutive_failures = 0;

    std::mutex              stop_lock;
    std::condition_variable stop_cond;
    bool                    stopping      = false;
    bool                    worker_exited = false;

    // sink call; anything thrown counts as failure
    auto deliver(std::span<const std::byte> payload, bool bypass) -> bool;
    auto deliver(const AudioChunk& chunk) -> bool;
    auto record_success() -> void;
    auto record_failure() -> size_t;
    auto persist(const AudioChunk& chunk) -> bool;
    // sleeps unless stop is requested; returns false when stopping
    auto sleep(std::chrono::milliseconds duration) -> bool;
    auto is_stopping() -> bool;

    auto load_persisted() -> size_t;
    auto probe() -> bool;
    auto retry_head() -> void;
    auto process_persisted() -> size_t;
    auto worker_main() -> void;

    Shared(Config config, std::shared_ptr<NetworkSink> sink);
};

struct Engine {
    std::shared_ptr<Shared> shared;
    std::thread             worker;

    // restores persisted records and launches the retry worker.
    // fails only on configuration errors(storage not writable).
    auto start() -> bool;
    // the worker finishes its current attempt; unsent items stay queued on disk
    auto stop() -> void;
    // true when the chunk was delivered, buffered or persisted
    auto send(AudioChunk chunk) -> bool;

    auto get_state() const -> State;
    auto queued() const -> size_t;
    auto persisted() const -> size_t;

    Engine(Config config, std::shared_ptr<NetworkSink> sink);
    ~Engine();
};
} // namespace delivery
