#pragma once
#include <memory>

#include <coop/runner.hpp>
#include <coop/task-handle.hpp>

#include "capture.hpp"
#include "connection.hpp"

// primary capture source: the wearable over its wireless link
struct PeripheralSource : capture::Source {
    coop::Runner&              runner;
    std::unique_ptr<ble::Link> link;
    ble::ConnectionManager     manager;
    std::string                address;
    coop::TaskHandle           task;
    bool                       running = false;

    auto listen_main(capture::FrameHandler handler) -> coop::Async<void>;

    auto name() const -> std::string_view override;
    auto start(capture::FrameHandler handler) -> bool override;
    auto stop() -> void override;

    PeripheralSource(coop::Runner& runner, std::unique_ptr<ble::Link> link, std::string address, ble::Config config = {});
    ~PeripheralSource();
};
