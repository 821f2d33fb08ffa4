#include "config.hpp"
#include "macros/logger.hpp"
#include "orchestrator.hpp"

namespace {
auto logger = Logger("WEARCAST_ORCHESTRATOR");
} // namespace

auto Orchestrator::activate(Slot& slot) -> bool {
    if(!slot.source) {
        return false;
    }
    slot.source->on_failed = [this, &slot](const Error error) { report_failure(slot, error); };

    const auto decoder = slot.decoder.get();
    const auto started = slot.source->start([this, decoder](const std::string_view source_id, const std::span<const std::byte> data) {
        if(!frames.try_push(Frame{decoder, {data.begin(), data.end()}})) {
            LOG_WARN(logger, "frame channel full, dropping frame from {}", source_id);
        }
    });
    if(!started) {
        LOG_WARN(logger, "{}: {} did not start", to_string(Error::CaptureSourceUnavailable), slot.source->name());
        return false;
    }
    active = &slot;
    LOG_INFO(logger, "capturing from {}", slot.source->name());
    return true;
}

auto Orchestrator::report_failure(Slot& slot, const Error error) -> void {
    {
        auto lock = std::lock_guard(failures_lock);
        failures.push_back({&slot, error});
    }
    wakeup.notify();
}

auto Orchestrator::on_source_failed(Slot& slot, const Error error) -> void {
    if(stopping || active != &slot) {
        return;
    }
    LOG_WARN(logger, "{} failed: {}", slot.source->name(), to_string(error));
    slot.source->stop();
    active = nullptr;
    if(&slot == &primary) {
        LOG_INFO(logger, "failing over to the secondary capture source");
        if(activate(secondary)) {
            return;
        }
    }
    LOG_ERROR(logger, "{}: no capture source remains", to_string(Error::CaptureSourceUnavailable));
    failed = true;
    stop();
}

auto Orchestrator::pump_main() -> void {
    while(const auto frame = frames.pop_wait()) {
        const auto pcm = frame->decoder->decode(frame->data);
        if(pcm.empty()) {
            continue;
        }
        if(!engine.send(make_chunk(pcm, bypass))) {
            LOG_ERROR(logger, "chunk of {} bytes could not be delivered or persisted", pcm.size());
        }
    }
}

auto Orchestrator::shutdown() -> void {
    if(active != nullptr) {
        active->source->stop();
        active = nullptr;
    }
    // the pump drains what the source already produced
    frames.stop();
    if(pump_thread.joinable()) {
        pump_thread.join();
    }
    engine.stop();
    LOG_INFO(logger, "pipeline stopped, {} chunks waiting on disk", engine.persisted());
}

auto Orchestrator::run() -> coop::Async<bool> {
    if(!engine.start()) {
        LOG_ERROR(logger, "delivery engine could not start");
        co_return false;
    }
    pump_thread = std::thread(&Orchestrator::pump_main, this);

    if(!activate(primary) && !activate(secondary)) {
        LOG_ERROR(logger, "{}: no capture source available", to_string(Error::CaptureSourceUnavailable));
        failed = true;
    } else {
        while(!stopping) {
            co_await wakeup;
            auto pending = std::vector<Failure>();
            {
                auto lock = std::lock_guard(failures_lock);
                pending.swap(failures);
            }
            for(const auto& failure : pending) {
                on_source_failed(*failure.slot, failure.error);
            }
        }
    }
    shutdown();
    co_return !failed;
}

auto Orchestrator::stop() -> void {
    if(stopping.exchange(true)) {
        return;
    }
    wakeup.notify();
}

Orchestrator::Orchestrator(Slot primary, Slot secondary, delivery::Config delivery_config, std::shared_ptr<NetworkSink> sink, const bool bypass)
    : primary(std::move(primary)),
      secondary(std::move(secondary)),
      engine(std::move(delivery_config), std::move(sink)),
      frames(config::frame_channel_slots),
      bypass(bypass) {}
