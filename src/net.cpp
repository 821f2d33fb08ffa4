#include <algorithm>
#include <array>
#include <cstring>

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>

#include "macros/autoptr.hpp"
#include "macros/logger.hpp"
#include "net.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/assert.hpp"

namespace {
auto logger = Logger("WEARCAST_NET");

declare_autoptr(AddrInfo, addrinfo, freeaddrinfo);

auto wait_fd(const int fd, const short events, const std::chrono::milliseconds timeout) -> bool {
loop:
    auto pfd = pollfd{.fd = fd, .events = events, .revents = 0};
    const auto ret = poll(&pfd, 1, int(timeout.count()));
    if(ret < 0 && errno == EINTR) {
        goto loop;
    }
    ensure(ret >= 0, "poll failed errno={}({})", errno, strerror(errno));
    ensure(ret > 0, "timed out after {}ms", timeout.count());
    return true;
}
} // namespace

auto connect_tcp(const char* const host, const uint16_t port, const std::chrono::milliseconds timeout) -> std::optional<FileDescriptor> {
    auto hints        = addrinfo();
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const auto service = std::to_string(port);
    auto       result  = (addrinfo*)(nullptr);
    const auto ret     = getaddrinfo(host, service.c_str(), &hints, &result);
    ensure(ret == 0, "cannot resolve {}: {}", host, gai_strerror(ret));
    const auto results = AutoAddrInfo(result);

    for(auto ai = result; ai != nullptr; ai = ai->ai_next) {
        auto sock = FileDescriptor(socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol));
        if(sock.as_handle() < 0) {
            continue;
        }
        if(connect(sock.as_handle(), ai->ai_addr, ai->ai_addrlen) != 0 && errno != EINPROGRESS) {
            LOG_DEBUG(logger, "connect to {}:{} failed errno={}({})", host, port, errno, strerror(errno));
            continue;
        }
        if(!wait_fd(sock.as_handle(), POLLOUT, timeout)) {
            continue;
        }
        auto error = 0;
        auto len   = socklen_t(sizeof(error));
        if(getsockopt(sock.as_handle(), SOL_SOCKET, SO_ERROR, &error, &len) != 0 || error != 0) {
            LOG_DEBUG(logger, "connect to {}:{} failed error={}({})", host, port, error, strerror(error));
            continue;
        }
        return sock;
    }
    bail("cannot connect to {}:{}", host, port);
}

auto send_all(const int fd, std::span<const std::byte> data, const std::chrono::milliseconds timeout) -> bool {
    while(!data.empty()) {
        ensure(wait_fd(fd, POLLOUT, timeout));
        const auto ret = send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if(ret < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        ensure(ret > 0, "send failed errno={}({})", errno, strerror(errno));
        data = data.subspan(ret);
    }
    return true;
}

auto receive_until(const int fd, const std::string_view terminator, const size_t limit, const std::chrono::milliseconds timeout) -> std::optional<std::string> {
    auto buffer = std::string();
    auto chunk  = std::array<char, 1024>();
    while(buffer.size() < limit && buffer.find(terminator) == std::string::npos) {
        ensure(wait_fd(fd, POLLIN, timeout));
        const auto ret = recv(fd, chunk.data(), std::min(chunk.size(), limit - buffer.size()), 0);
        if(ret < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        ensure(ret >= 0, "recv failed errno={}({})", errno, strerror(errno));
        if(ret == 0) {
            break;
        }
        buffer.append(chunk.data(), ret);
    }
    return buffer;
}
