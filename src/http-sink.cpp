#include <charconv>
#include <format>
#include <random>

#include "http-sink.hpp"
#include "macros/logger.hpp"
#include "net.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/coop-unwrap.hpp"

namespace http {
namespace {
auto logger = Logger("WEARCAST_HTTP");

constexpr auto scheme = std::string_view("http://");

auto parse_port(const std::string_view str) -> std::optional<uint16_t> {
    auto       port = uint16_t();
    const auto end  = str.data() + str.size();
    const auto [ptr, ec] = std::from_chars(str.data(), end, port);
    if(str.empty() || ec != std::errc() || ptr != end || port == 0) {
        return std::nullopt;
    }
    return port;
}
} // namespace

auto parse_url(std::string_view url) -> std::optional<Url> {
    ensure(url.starts_with(scheme), "unsupported url {}", url);
    url.remove_prefix(scheme.size());

    auto       ret       = Url();
    const auto slash     = url.find('/');
    const auto authority = url.substr(0, slash);
    if(slash != std::string_view::npos) {
        ret.path = url.substr(slash);
        while(ret.path.ends_with('/')) {
            ret.path.pop_back();
        }
    }
    const auto colon = authority.rfind(':');
    if(colon != std::string_view::npos) {
        const auto port = parse_port(authority.substr(colon + 1));
        ensure(port, "bad port in {}", url);
        ret.port = *port;
        ret.host = authority.substr(0, colon);
    } else {
        ret.host = authority;
    }
    ensure(!ret.host.empty(), "missing host in {}", url);
    return ret;
}

auto encode_base64(const std::span<const std::byte> data) -> std::string {
    constexpr auto table = std::string_view("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/");

    auto ret = std::string();
    ret.reserve((data.size() + 2) / 3 * 4);
    auto i = 0uz;
    for(; i + 3 <= data.size(); i += 3) {
        const auto v = uint32_t(data[i]) << 16 | uint32_t(data[i + 1]) << 8 | uint32_t(data[i + 2]);
        ret += table[v >> 18 & 0x3f];
        ret += table[v >> 12 & 0x3f];
        ret += table[v >> 6 & 0x3f];
        ret += table[v & 0x3f];
    }
    if(const auto rem = data.size() - i; rem == 1) {
        const auto v = uint32_t(data[i]) << 16;
        ret += table[v >> 18 & 0x3f];
        ret += table[v >> 12 & 0x3f];
        ret += "==";
    } else if(rem == 2) {
        const auto v = uint32_t(data[i]) << 16 | uint32_t(data[i + 1]) << 8;
        ret += table[v >> 18 & 0x3f];
        ret += table[v >> 12 & 0x3f];
        ret += table[v >> 6 & 0x3f];
        ret += '=';
    }
    return ret;
}

auto generate_session_id() -> std::string {
    auto device = std::random_device();
    auto engine = std::mt19937_64(uint64_t(device()) << 32 | device());
    auto hi     = engine();
    auto lo     = engine();
    // version 4, variant 1
    hi = (hi & ~0xf000ull) | 0x4000ull;
    lo = (lo & ~(0x3ull << 62)) | (0x2ull << 62);
    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       hi >> 32, hi >> 16 & 0xffff, hi & 0xffff,
                       lo >> 48, lo & 0xffff'ffff'ffffull);
}

auto parse_status(const std::string_view response) -> std::optional<int> {
    // HTTP/1.1 200 OK
    ensure(response.starts_with("HTTP/"), "malformed response");
    const auto space = response.find(' ');
    ensure(space != std::string_view::npos && response.size() >= space + 4, "malformed status line");
    auto       status = 0;
    const auto digits = response.substr(space + 1, 3);
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), status);
    ensure(ec == std::errc() && ptr == digits.data() + digits.size(), "malformed status code");
    return status;
}

auto Sink::request(const std::string_view method, const std::string_view path, const std::string_view body) -> std::optional<int> {
    unwrap(sock, connect_tcp(backend.host.c_str(), backend.port, timeout));

    auto req = std::format("{} {}{} HTTP/1.1\r\n"
                           "Host: {}:{}\r\n"
                           "Connection: close\r\n",
                           method, backend.path, path, backend.host, backend.port);
    if(!body.empty()) {
        req += std::format("Content-Type: application/json\r\n"
                           "Content-Length: {}\r\n",
                           body.size());
    }
    req += "\r\n";
    req += body;
    ensure(send_all(sock.as_handle(), std::as_bytes(std::span(req)), timeout));

    unwrap(response, receive_until(sock.as_handle(), "\r\n", config::max_response_header, timeout));
    return parse_status(response);
}

auto Sink::check_backend() -> bool {
    const auto status = request("GET", "/", {});
    if(!status) {
        LOG_WARN(logger, "backend at {}:{} is not reachable", backend.host, backend.port);
        return false;
    }
    LOG_INFO(logger, "connected to backend at {}:{} status={} session={}", backend.host, backend.port, *status, session_id);
    return true;
}

auto Sink::send(const std::span<const std::byte> payload, const bool bypass) -> bool {
    const auto body = std::format(R"({{"audioData":"{}","sessionId":"{}","bypassSilenceCheck":{}}})",
                                  encode_base64(payload), session_id, bypass);
    unwrap(status, request("POST", config::audio_stream_endpoint, body));
    ensure(status >= 200 && status < 300, "backend returned status {}", status);
    LOG_DEBUG(logger, "sent {} bytes", payload.size());
    return true;
}

Sink::Sink(Url backend, std::string session_id)
    : backend(std::move(backend)),
      session_id(std::move(session_id)) {}
} // namespace http
