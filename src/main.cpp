#include <csignal>
#include <cstdlib>
#include <cstring>
#include <print>

#include <coop/io.hpp>
#include <coop/runner.hpp>
#include <coop/task-handle.hpp>
#include <coop/thread.hpp>
#include <sys/signalfd.h>
#include <unistd.h>

#include "config.hpp"
#include "decoder.hpp"
#include "http-sink.hpp"
#include "macros/logger.hpp"
#include "microphone.hpp"
#include "orchestrator.hpp"
#include "util/argument-parser.hpp"
#include "util/fd.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/coop-unwrap.hpp"

namespace {
auto logger = Logger("WEARCAST");

auto backend_url    = config::default_backend_url;
auto storage_dir    = config::default_storage_dir;
auto queue_capacity = uint16_t(config::queue_capacity);
auto retry_interval = uint16_t(config::retry_interval_ms / 1000);
auto bypass_silence = false;
auto exit_code      = 0;

auto create_signal_fd() -> std::optional<FileDescriptor> {
    auto mask = sigset_t();
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    ensure(sigprocmask(SIG_BLOCK, &mask, NULL) == 0, "errno={}({})", errno, strerror(errno));
    auto fd = FileDescriptor(signalfd(-1, &mask, SFD_CLOEXEC));
    ensure(fd.as_handle() >= 0, "errno={}({})", errno, strerror(errno));
    return fd;
}

auto signal_main(const int fd, Orchestrator& orchestrator, bool& done) -> coop::Async<void> {
    const auto result = co_await coop::wait_for_file(fd, true, false);
    if(result.error) {
        LOG_ERROR(logger, "signal fd aborted");
    } else {
        auto info = signalfd_siginfo();
        if(read(fd, &info, sizeof(info)) == ssize_t(sizeof(info))) {
            LOG_INFO(logger, "received signal {}, stopping", info.ssi_signo);
        }
    }
    done = true;
    orchestrator.stop();
}

auto async_main() -> coop::Async<bool> {
    // block the signals before any thread is spawned
    coop_unwrap(signal_fd, create_signal_fd());

    coop_unwrap_mut(url, http::parse_url(backend_url));
    const auto sink = std::make_shared<http::Sink>(std::move(url), http::generate_session_id());
    auto reachable = false;
    co_await coop::run_blocking([&] { reachable = sink->check_backend(); });
    if(!reachable) {
        LOG_WARN(logger, "backend is down, audio is buffered until it comes back");
    }

    // the wireless stack is not part of this build, the peripheral slot stays empty
    auto primary = Orchestrator::Slot();
    LOG_INFO(logger, "no peripheral link available, capturing from the microphone");

    auto secondary = Orchestrator::Slot{
        .source  = std::make_unique<MicrophoneSource>(),
        .decoder = std::make_unique<PcmFrameDecoder>(),
    };

    auto delivery_config           = delivery::Config();
    delivery_config.capacity       = queue_capacity;
    delivery_config.retry_interval = std::chrono::seconds(retry_interval);
    delivery_config.storage_dir    = storage_dir;

    auto orchestrator = Orchestrator(std::move(primary), std::move(secondary), std::move(delivery_config), sink, bypass_silence);

    auto  signal_task = coop::TaskHandle();
    auto  signaled    = false;
    auto& runner      = *co_await coop::reveal_runner();
    runner.push_task(signal_main(signal_fd.as_handle(), orchestrator, signaled), &signal_task);

    const auto ok = co_await orchestrator.run();
    if(!signaled) {
        signal_task.cancel();
    }
    co_return ok;
}

auto async_main_wrapper() -> coop::Async<void> {
    exit_code = co_await async_main() ? 0 : 1;
}
} // namespace

auto main(const int argc, const char* const* argv) -> int {
    if(const auto env = std::getenv("BACKEND_URL")) {
        backend_url = env;
    }
    {
        auto parser = args::Parser<uint16_t>();
        auto help   = false;
        parser.kwarg(&backend_url, {"-b", "--backend"}, "URL", "backend base url, also read from $BACKEND_URL", {.state = args::State::DefaultValue});
        parser.kwarg(&storage_dir, {"-s", "--storage"}, "DIR", "directory for chunks that could not be sent", {.state = args::State::DefaultValue});
        parser.kwarg(&queue_capacity, {"-q", "--queue-capacity"}, "N", "chunks buffered in memory before spilling to disk", {.state = args::State::DefaultValue});
        parser.kwarg(&retry_interval, {"-r", "--retry-interval"}, "SECONDS", "delay between delivery retries", {.state = args::State::DefaultValue});
        parser.kwflag(&bypass_silence, {"--bypass-silence"}, "ask the backend to skip silence filtering", {});
        parser.kwflag(&help, {"-h", "--help"}, "print this help message", {.no_error_check = true});
        if(!parser.parse(argc, argv) || help) {
            std::println("usage: wearcast {}", parser.get_help());
            return 0;
        }
    }
    if(queue_capacity == 0 || retry_interval == 0) {
        std::println(stderr, "queue capacity and retry interval must be positive");
        return 1;
    }

    auto runner = coop::Runner();
    runner.push_task(async_main_wrapper());
    runner.run();
    return exit_code;
}
