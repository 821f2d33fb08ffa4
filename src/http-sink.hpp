#pragma once
#include <chrono>
#include <optional>
#include <string>

#include "config.hpp"
#include "sink.hpp"

namespace http {
struct Url {
    std::string host;
    uint16_t    port = 80;
    std::string path; // without trailing slash
};

// only plain http is supported
auto parse_url(std::string_view url) -> std::optional<Url>;
auto encode_base64(std::span<const std::byte> data) -> std::string;
auto generate_session_id() -> std::string;
auto parse_status(std::string_view response) -> std::optional<int>;

// posts {"audioData", "sessionId", "bypassSilenceCheck"} json to the backend
struct Sink : NetworkSink {
    Url                       backend;
    std::string               session_id;
    std::chrono::milliseconds timeout = std::chrono::milliseconds(config::http_timeout_ms);

    // returns the status code
    auto request(std::string_view method, std::string_view path, std::string_view body) -> std::optional<int>;
    auto check_backend() -> bool;
    auto send(std::span<const std::byte> payload, bool bypass) -> bool override;

    Sink(Url backend, std::string session_id);
};
} // namespace http
