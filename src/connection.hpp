#pragma once
#include <atomic>
#include <string>

#include "config.hpp"
#include "errors.hpp"
#include "link.hpp"

namespace ble {
enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
};

struct Config {
    int                       max_attempts    = config::max_retry_attempts;
    std::chrono::milliseconds retry_delay     = std::chrono::milliseconds(config::retry_delay_ms);
    std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(config::connect_timeout_ms);
    std::string               characteristic  = config::audio_characteristic_uuid;
};

struct ConnectionManager {
    Link&                        link;
    Config                       config;
    std::atomic<ConnectionState> state = ConnectionState::Disconnected;

    // one connect-subscribe-listen cycle.
    // returns true if notifications were flowing before the link went away.
    auto session(std::string_view address, const NotifyHandler& handler) -> coop::Async<bool>;
    // keeps the link up until retries are exhausted, then returns Error::FatalLink.
    // cancelling the task unsubscribes and closes the link.
    auto run(std::string address, NotifyHandler handler) -> coop::Async<Error>;

    ConnectionManager(Link& link, Config config);
};
} // namespace ble
