#pragma once
#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

#include "chunk.hpp"

namespace record {
// on-disk layout: Header followed by payload_size bytes
struct Header {
    uint32_t magic;
    uint16_t version;
    uint8_t  bypass;
    uint8_t  reserved;
    int64_t  created_at;
    uint64_t payload_size;
};

constexpr auto magic   = uint32_t(0x31524357); // "WCR1"
constexpr auto version = uint16_t(1);

constexpr auto record_prefix     = "chunk-";
constexpr auto record_suffix     = ".bin";
constexpr auto temporary_suffix  = ".tmp";
constexpr auto quarantine_prefix = "corrupted-";

auto format_name(uint64_t sequence) -> std::string;
auto parse_sequence(std::string_view name) -> std::optional<uint64_t>;

struct Store {
    std::filesystem::path dir;
    std::mutex            write_lock;
    std::atomic<uint64_t> next_sequence = 0;
    bool                  initialized   = false; // guarded by write_lock

    // creates the directory, drops partial writes and resumes the sequence past the newest record
    auto init() -> bool;
    auto write(const AudioChunk& chunk) -> bool;
    // oldest first, at most limit entries(0 = all)
    auto list(size_t limit = 0) const -> std::vector<std::filesystem::path>;
    auto count() const -> size_t;
    auto read(const std::filesystem::path& path) const -> std::optional<AudioChunk>;
    auto remove(const std::filesystem::path& path) const -> bool;
    auto quarantine(const std::filesystem::path& path) const -> bool;

    explicit Store(std::filesystem::path dir);
};
} // namespace record
