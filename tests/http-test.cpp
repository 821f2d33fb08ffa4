#include <array>
#include <charconv>
#include <print>
#include <thread>

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "fakes.hpp"
#include "http-sink.hpp"
#include "macros/assert.hpp"
#include "util/fd.hpp"

namespace {
// accepts a single connection, records the request, answers with status
struct OneShotServer {
    FileDescriptor listener;
    uint16_t       port = 0;
    std::string    request;
    std::thread    thread;

    auto init() -> bool {
        listener = FileDescriptor(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
        ensure(listener.as_handle() >= 0);
        auto addr            = sockaddr_in();
        addr.sin_family      = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port        = 0;
        ensure(bind(listener.as_handle(), (sockaddr*)&addr, sizeof(addr)) == 0);
        ensure(listen(listener.as_handle(), 1) == 0);
        auto len = socklen_t(sizeof(addr));
        ensure(getsockname(listener.as_handle(), (sockaddr*)&addr, &len) == 0);
        port = ntohs(addr.sin_port);
        return true;
    }

    auto serve(const int status) -> void {
        thread = std::thread([this, status] {
            const auto client = FileDescriptor(accept(listener.as_handle(), nullptr, nullptr));
            if(client.as_handle() < 0) {
                return;
            }
            auto buf = std::array<char, 4096>();
            while(true) {
                const auto header_end = request.find("\r\n\r\n");
                if(header_end != std::string::npos) {
                    auto       length = 0uz;
                    const auto key    = request.find("Content-Length: ");
                    if(key != std::string::npos) {
                        const auto value = request.data() + key + 16;
                        std::from_chars(value, request.data() + request.size(), length);
                    }
                    if(request.size() >= header_end + 4 + length) {
                        break;
                    }
                }
                const auto len = ::read(client.as_handle(), buf.data(), buf.size());
                if(len <= 0) {
                    break;
                }
                request.append(buf.data(), len);
            }
            const auto response = std::format("HTTP/1.1 {} Whatever\r\nContent-Length: 0\r\n\r\n", status);
            if(::write(client.as_handle(), response.data(), response.size()) != ssize_t(response.size())) {
                std::println(stderr, "short write");
            }
        });
    }

    ~OneShotServer() {
        if(thread.joinable()) {
            thread.join();
        }
    }
};

auto urls_are_parsed() -> bool {
    const auto full = http::parse_url("http://backend.local:3000/api/");
    ensure(full);
    ensure(full->host == "backend.local");
    ensure(full->port == 3000);
    ensure(full->path == "/api");

    const auto bare = http::parse_url("http://example.com");
    ensure(bare);
    ensure(bare->host == "example.com" && bare->port == 80 && bare->path.empty());

    ensure(!http::parse_url("https://example.com"));
    ensure(!http::parse_url("http://:3000"));
    ensure(!http::parse_url("http://host:0"));
    ensure(!http::parse_url("http://host:abc/x"));
    return true;
}

auto base64_vectors() -> bool {
    const auto encode = [](const std::string_view str) {
        return http::encode_base64(std::as_bytes(std::span(str)));
    };
    ensure(encode("") == "");
    ensure(encode("f") == "Zg==");
    ensure(encode("fo") == "Zm8=");
    ensure(encode("foo") == "Zm9v");
    ensure(encode("foobar") == "Zm9vYmFy");
    ensure(http::encode_base64(bytes({0xff, 0xfe, 0x00})) == "//4A");
    return true;
}

auto status_lines() -> bool {
    ensure(http::parse_status("HTTP/1.1 200 OK\r\n") == 200);
    ensure(http::parse_status("HTTP/1.0 503 Service Unavailable") == 503);
    ensure(!http::parse_status("garbage"));
    ensure(!http::parse_status("HTTP/1.1 2x0 OK"));
    ensure(!http::parse_status("HTTP/1.1"));
    return true;
}

auto session_ids_are_uuid4() -> bool {
    const auto a = http::generate_session_id();
    const auto b = http::generate_session_id();
    ensure(a != b);
    ensure(a.size() == 36);
    for(const auto pos : {8, 13, 18, 23}) {
        ensure(a[pos] == '-', "id={}", a);
    }
    ensure(a[14] == '4', "id={}", a);
    ensure(std::string_view("89ab").contains(a[19]), "id={}", a);
    return true;
}

auto accepted_post_carries_json() -> bool {
    auto server = OneShotServer();
    ensure(server.init());
    server.serve(200);

    auto sink = http::Sink(http::Url{.host = "127.0.0.1", .port = server.port, .path = "/base"}, "session-1");
    ensure(sink.send(bytes({'f', 'o', 'o'}), true));
    server.thread.join();

    ensure(server.request.starts_with("POST /base/stream/audio HTTP/1.1\r\n"), "request={}", server.request);
    ensure(server.request.contains("Content-Type: application/json\r\n"));
    ensure(server.request.ends_with(R"({"audioData":"Zm9v","sessionId":"session-1","bypassSilenceCheck":true})"), "request={}", server.request);
    return true;
}

auto server_error_is_a_failure() -> bool {
    auto server = OneShotServer();
    ensure(server.init());
    server.serve(500);

    auto sink = http::Sink(http::Url{.host = "127.0.0.1", .port = server.port, .path = ""}, "session-2");
    ensure(!sink.send(bytes({1, 2, 3}), false));
    server.thread.join();
    ensure(server.request.contains(R"("bypassSilenceCheck":false)"));
    return true;
}

auto refused_connection_is_a_failure() -> bool {
    // bind and close to get a port nobody listens on
    auto port = uint16_t();
    {
        auto server = OneShotServer();
        ensure(server.init());
        port = server.port;
    }
    auto sink = http::Sink(http::Url{.host = "127.0.0.1", .port = port, .path = ""}, "session-3");
    sink.timeout = 500ms;
    ensure(!sink.send(bytes({1}), false));
    ensure(!sink.check_backend());
    return true;
}
} // namespace

auto main() -> int {
    auto ok = true;
    ok &= urls_are_parsed();
    ok &= base64_vectors();
    ok &= status_lines();
    ok &= session_ids_are_uuid4();
    ok &= accepted_post_carries_json();
    ok &= server_error_is_a_failure();
    ok &= refused_connection_is_a_failure();
    std::println("http-test: {}", ok ? "pass" : "fail");
    return ok ? 0 : 1;
}
