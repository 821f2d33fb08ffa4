#pragma once
#include <chrono>
#include <optional>
#include <span>
#include <string>

#include "util/fd.hpp"

auto connect_tcp(const char* host, uint16_t port, std::chrono::milliseconds timeout) -> std::optional<FileDescriptor>;
auto send_all(int fd, std::span<const std::byte> data, std::chrono::milliseconds timeout) -> bool;
// reads until terminator is seen, the peer closes, or limit bytes arrived
auto receive_until(int fd, std::string_view terminator, size_t limit, std::chrono::milliseconds timeout) -> std::optional<std::string>;
