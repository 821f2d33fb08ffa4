#include <array>

#include "delivery.hpp"
#include "errors.hpp"
#include "macros/logger.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/assert.hpp"

namespace delivery {
namespace {
auto logger = Logger("WEARCAST_DELIVERY");

// sent while offline to find out whether the sink is back
constexpr auto probe_payload = std::array{std::byte(0), std::byte(0)};
} // namespace

auto Shared::deliver(const std::span<const std::byte> payload, const bool bypass) -> bool {
    try {
        return sink->send(payload, bypass);
    } catch(const std::exception& e) {
        LOG_ERROR(logger, "{}: sink threw: {}", to_string(Error::Delivery), e.what());
        return false;
    } catch(...) {
        LOG_ERROR(logger, "{}: sink threw a non-standard exception", to_string(Error::Delivery));
        return false;
    }
}

auto Shared::deliver(const AudioChunk& chunk) -> bool {
    return deliver(chunk.data, chunk.bypass);
}

auto Shared::record_success() -> void {
    consecutive_failures = 0;
}

auto Shared::record_failure() -> size_t {
    return consecutive_failures += 1;
}

auto Shared::persist(const AudioChunk& chunk) -> bool {
    if(!store.write(chunk)) {
        LOG_ERROR(logger, "failed to persist chunk, {} bytes lost", chunk.data.size());
        return false;
    }
    return true;
}

auto Shared::sleep(const std::chrono::milliseconds duration) -> bool {
    auto lock = std::unique_lock(stop_lock);
    return !stop_cond.wait_for(lock, duration, [this] { return stopping; });
}

auto Shared::is_stopping() -> bool {
    auto lock = std::lock_guard(stop_lock);
    return stopping;
}

auto Shared::load_persisted() -> size_t {
    const auto files = store.list();
    if(files.empty()) {
        return 0;
    }
    LOG_INFO(logger, "found {} persisted chunks", files.size());

    auto loaded = 0uz;
    for(const auto& path : files) {
        if(queue.size() >= queue.capacity()) {
            LOG_WARN(logger, "queue full, {} persisted chunks left for the worker", files.size() - loaded);
            break;
        }
        auto chunk = store.read(path);
        if(!chunk) {
            LOG_ERROR(logger, "{}: {}", to_string(Error::PersistenceCorruption), path.string());
            if(!store.quarantine(path)) {
                LOG_ERROR(logger, "corrupted record {} stays in place", path.string());
            }
            continue;
        }
        if(!queue.try_push(std::move(*chunk))) {
            break;
        }
        if(!store.remove(path)) {
            // the queued copy is delivered anyway, the file would be sent twice
            LOG_WARN(logger, "persisted chunk {} may be delivered twice", path.string());
        }
        loaded += 1;
    }
    LOG_INFO(logger, "restored {} persisted chunks into the queue", loaded);
    return loaded;
}

auto Shared::probe() -> bool {
    LOG_INFO(logger, "testing connection to leave offline mode");
    if(!deliver(probe_payload, true)) {
        LOG_WARN(logger, "still offline");
        return false;
    }
    LOG_INFO(logger, "connection restored, leaving offline mode");
    state = State::Online;
    record_success();
    return true;
}

auto Shared::retry_head() -> void {
    const auto head = queue.front();
    if(!head) {
        return;
    }
    if(deliver(*head)) {
        // only the worker pops, the head is still the same item
        queue.pop_front();
        record_success();
        LOG_DEBUG(logger, "resent buffered chunk remaining={}", queue.size());
    } else {
        const auto failures = record_failure();
        LOG_DEBUG(logger, "{}: resend failed failures={}", to_string(Error::Delivery), failures);
        sleep(config.retry_interval);
    }
}

auto Shared::process_persisted() -> size_t {
    auto sent = 0uz;
    for(const auto& path : store.list(config.batch_size)) {
        if(is_stopping()) {
            break;
        }
        const auto chunk = store.read(path);
        if(!chunk) {
            LOG_ERROR(logger, "{}: {}", to_string(Error::PersistenceCorruption), path.string());
            if(!store.quarantine(path)) {
                LOG_ERROR(logger, "corrupted record {} stays in place", path.string());
            }
            continue;
        }
        if(!deliver(*chunk)) {
            record_failure();
            LOG_DEBUG(logger, "{}: persisted chunk {} not sent, retrying later", to_string(Error::Delivery), path.filename().string());
            break;
        }
        if(!store.remove(path)) {
            LOG_WARN(logger, "persisted chunk {} may be delivered twice", path.string());
        }
        record_success();
        LOG_INFO(logger, "sent persisted chunk {}", path.filename().string());
        sent += 1;
    }
    return sent;
}

auto Shared::worker_main() -> void {
    LOG_DEBUG(logger, "retry worker started");
    while(!is_stopping()) {
        if(state == State::Offline) {
            if(!probe()) {
                sleep(config.retry_interval * config.probe_multiplier);
            }
            continue;
        }
        if(!queue.empty()) {
            retry_head();
            continue;
        }
        if(process_persisted() == config.batch_size) {
            // more records may be waiting
            continue;
        }
        // woken early by a new buffered chunk or stop
        queue.wait_for(config.retry_interval);
    }
    {
        auto lock     = std::lock_guard(stop_lock);
        worker_exited = true;
    }
    stop_cond.notify_all();
    LOG_DEBUG(logger, "retry worker exited");
}

Shared::Shared(Config config, std::shared_ptr<NetworkSink> sink)
    : config(std::move(config)),
      sink(std::move(sink)),
      queue(this->config.capacity),
      store(this->config.storage_dir) {}

auto Engine::start() -> bool {
    if(worker.joinable()) {
        LOG_WARN(logger, "delivery engine already started");
        return true;
    }
    ensure(shared->store.init());
    shared->load_persisted();
    worker = std::thread([shared = shared] { shared->worker_main(); });
    LOG_INFO(logger, "delivery engine started capacity={} storage={}", shared->config.capacity, shared->config.storage_dir.string());
    return true;
}

auto Engine::stop() -> void {
    if(!worker.joinable()) {
        return;
    }
    {
        auto lock        = std::lock_guard(shared->stop_lock);
        shared->stopping = true;
    }
    shared->stop_cond.notify_all();
    shared->queue.stop();

    auto exited = false;
    {
        auto lock = std::unique_lock(shared->stop_lock);
        exited    = shared->stop_cond.wait_for(lock, shared->config.join_timeout, [this] { return shared->worker_exited; });
    }
    if(exited) {
        worker.join();
    } else {
        LOG_WARN(logger, "retry worker did not exit within {}ms, detaching", shared->config.join_timeout.count());
        worker.detach();
    }

    // keep unsent chunks for the next run
    const auto rest      = shared->queue.drain();
    auto       persisted = 0uz;
    for(const auto& chunk : rest) {
        persisted += shared->persist(chunk) ? 1 : 0;
    }
    LOG_INFO(logger, "delivery engine stopped, {} of {} queued chunks persisted", persisted, rest.size());
}

auto Engine::send(AudioChunk chunk) -> bool {
    auto& s = *shared;
    if(s.state == State::Offline || s.is_stopping()) {
        return s.persist(chunk);
    }
    if(s.deliver(chunk)) {
        s.record_success();
        return true;
    }

    const auto failures = s.record_failure();
    if(failures >= s.config.failure_threshold) {
        auto online = State::Online;
        if(s.state.compare_exchange_strong(online, State::Offline)) {
            LOG_WARN(logger, "switching to offline mode after {} consecutive failures", failures);
        }
    }
    if(s.queue.try_push(std::move(chunk))) {
        LOG_DEBUG(logger, "chunk buffered queue={}", s.queue.size());
        return true;
    }
    return s.persist(chunk);
}

auto Engine::get_state() const -> State {
    return shared->state;
}

auto Engine::queued() const -> size_t {
    return shared->queue.size();
}

auto Engine::persisted() const -> size_t {
    return shared->store.count();
}

Engine::Engine(Config config, std::shared_ptr<NetworkSink> sink)
    : shared(std::make_shared<Shared>(std::move(config), std::move(sink))) {}

Engine::~Engine() {
    stop();
}
} // namespace delivery
