#include "macros/logger.hpp"
#include "peripheral.hpp"

namespace {
auto logger = Logger("WEARCAST_PERIPHERAL");
} // namespace

auto PeripheralSource::listen_main(const capture::FrameHandler handler) -> coop::Async<void> {
    const auto error = co_await manager.run(address, [this, &handler](const std::span<const std::byte> data) {
        handler(address, data);
    });
    running = false;
    LOG_ERROR(logger, "peripheral {} lost: {}", address, to_string(error));
    if(on_failed) {
        on_failed(error);
    }
}

auto PeripheralSource::name() const -> std::string_view {
    return address;
}

auto PeripheralSource::start(capture::FrameHandler handler) -> bool {
    if(running) {
        LOG_WARN(logger, "peripheral {} already running", address);
        return false;
    }
    if(address.empty()) {
        LOG_WARN(logger, "{}: no peripheral address", to_string(Error::CaptureSourceUnavailable));
        return false;
    }
    running = true;
    runner.push_task(listen_main(std::move(handler)), &task);
    return true;
}

auto PeripheralSource::stop() -> void {
    if(!running) {
        return;
    }
    running = false;
    LOG_INFO(logger, "stopping peripheral {}", address);
    task.cancel();
}

PeripheralSource::PeripheralSource(coop::Runner& runner, std::unique_ptr<ble::Link> link, std::string address, ble::Config config)
    : runner(runner),
      link(std::move(link)),
      manager(*this->link, std::move(config)),
      address(std::move(address)) {}

PeripheralSource::~PeripheralSource() {
    stop();
}
