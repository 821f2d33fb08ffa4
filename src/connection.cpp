#include <coop/thread-event.hpp>
#include <coop/timer.hpp>

#include "connection.hpp"
#include "macros/logger.hpp"
#include "util/cleaner.hpp"

namespace ble {
namespace {
auto logger = Logger("WEARCAST_LINK");
} // namespace

auto ConnectionManager::session(const std::string_view address, const NotifyHandler& handler) -> coop::Async<bool> {
    auto disconnected = coop::ThreadEvent();
    auto subscribed   = false;
    // also runs when the task is cancelled at any suspension point.
    // on_disconnected may fire until disconnect() returns, so it is cleared last.
    auto cleaner = Cleaner{[this, &subscribed] {
        if(subscribed) {
            link.unsubscribe(config.characteristic);
        }
        link.disconnect();
        link.on_disconnected = {};
        state = ConnectionState::Disconnected;
    }};

    state = ConnectionState::Connecting;
    LOG_INFO(logger, "connecting to {}", address);
    if(!co_await link.connect(address, config.connect_timeout)) {
        LOG_WARN(logger, "{}: cannot connect to {}", to_string(Error::TransientLink), address);
        co_return false;
    }
    link.on_disconnected = [&disconnected] { disconnected.notify(); };

    if(!link.subscribe(config.characteristic, handler)) {
        LOG_WARN(logger, "{}: cannot subscribe to {}", to_string(Error::TransientLink), config.characteristic);
        co_return false;
    }
    subscribed = true;
    state      = ConnectionState::Connected;
    LOG_INFO(logger, "connected to {}, listening for audio data", address);

    co_await disconnected;
    LOG_WARN(logger, "device {} disconnected", address);
    co_return true;
}

auto ConnectionManager::run(const std::string address, const NotifyHandler handler) -> coop::Async<Error> {
    auto failures = 0;
loop:
    if(co_await session(address, handler)) {
        // notifications were flowing, start a fresh retry budget
        failures = 0;
    } else {
        failures += 1;
        if(failures >= config.max_attempts) {
            LOG_ERROR(logger, "failed to connect after {} attempts", failures);
            co_return Error::FatalLink;
        }
    }
    LOG_INFO(logger, "retrying connection in {}ms (attempt {}/{})", config.retry_delay.count(), failures + 1, config.max_attempts);
    co_await coop::sleep(config.retry_delay);
    goto loop;
}

ConnectionManager::ConnectionManager(Link& link, Config config)
    : link(link),
      config(std::move(config)) {}
} // namespace ble
