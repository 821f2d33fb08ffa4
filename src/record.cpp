#include <algorithm>
#include <bit>
#include <charconv>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "macros/logger.hpp"
#include "record.hpp"
#include "util/fd.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/assert.hpp"

namespace record {
namespace {
auto logger = Logger("WEARCAST_RECORD");

auto write_all(const int fd, const std::byte* data, size_t size) -> bool {
    while(size > 0) {
        const auto ret = ::write(fd, data, size);
        if(ret < 0 && errno == EINTR) {
            continue;
        }
        ensure(ret > 0, "write failed errno={}({})", errno, strerror(errno));
        data += ret;
        size -= ret;
    }
    return true;
}

auto read_all(const int fd, std::byte* data, size_t size) -> bool {
    while(size > 0) {
        const auto ret = ::read(fd, data, size);
        if(ret < 0 && errno == EINTR) {
            continue;
        }
        if(ret <= 0) {
            return false;
        }
        data += ret;
        size -= ret;
    }
    return true;
}
} // namespace

auto format_name(const uint64_t sequence) -> std::string {
    return std::format("{}{:016}{}", record_prefix, sequence, record_suffix);
}

auto parse_sequence(const std::string_view name) -> std::optional<uint64_t> {
    if(!name.starts_with(record_prefix) || !name.ends_with(record_suffix)) {
        return std::nullopt;
    }
    const auto digits = name.substr(std::strlen(record_prefix), name.size() - std::strlen(record_prefix) - std::strlen(record_suffix));
    if(digits.empty()) {
        return std::nullopt;
    }
    auto       sequence = uint64_t();
    const auto end      = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), end, sequence);
    if(ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return sequence;
}

auto Store::init() -> bool {
    auto ec = std::error_code();
    std::filesystem::create_directories(dir, ec);
    ensure(!ec, "cannot create storage directory {}: {}", dir.string(), ec.message());
    ensure(::access(dir.c_str(), W_OK) == 0, "storage directory {} is not writable", dir.string());

    auto newest   = std::optional<uint64_t>();
    auto leftover = std::vector<std::filesystem::path>();
    for(const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        const auto name = entry.path().filename().string();
        if(const auto sequence = parse_sequence(name)) {
            newest = std::max(newest.value_or(0), *sequence);
        } else if(name.starts_with(record_prefix) && name.ends_with(temporary_suffix)) {
            leftover.push_back(entry.path());
        }
    }
    ensure(!ec, "cannot list storage directory {}: {}", dir.string(), ec.message());
    // interrupted writes never became records
    for(const auto& path : leftover) {
        if(!std::filesystem::remove(path, ec)) {
            LOG_WARN(logger, "cannot remove partial record {}: {}", path.string(), ec.message());
        }
    }

    auto lock     = std::lock_guard(write_lock);
    next_sequence = newest ? *newest + 1 : 0;
    initialized   = true;
    LOG_DEBUG(logger, "storage={} next_sequence={}", dir.string(), next_sequence.load());
    return true;
}

auto Store::write(const AudioChunk& chunk) -> bool {
    // one writer at a time, and a record only appears under its final name once complete
    auto lock = std::lock_guard(write_lock);
    // the sequence is only known after init, an earlier write could replace a record
    ensure(initialized, "storage {} is not initialized", dir.string());

    const auto name      = format_name(next_sequence.fetch_add(1));
    const auto path      = dir / name;
    auto       temporary = path;
    temporary += temporary_suffix;

    const auto header = Header{
        .magic        = magic,
        .version      = version,
        .bypass       = uint8_t(chunk.bypass ? 1 : 0),
        .reserved     = 0,
        .created_at   = chunk.created_at,
        .payload_size = chunk.data.size(),
    };
    {
        auto fd = FileDescriptor(::open(temporary.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
        ensure(fd.as_handle() >= 0, "cannot create {} errno={}({})", temporary.string(), errno, strerror(errno));
        ensure(write_all(fd.as_handle(), std::bit_cast<const std::byte*>(&header), sizeof(header)));
        ensure(write_all(fd.as_handle(), chunk.data.data(), chunk.data.size()));
        ensure(::fsync(fd.as_handle()) == 0, "fsync failed errno={}({})", errno, strerror(errno));
    }
    auto ec = std::error_code();
    std::filesystem::rename(temporary, path, ec);
    ensure(!ec, "cannot rename {}: {}", temporary.string(), ec.message());
    LOG_INFO(logger, "persisted chunk {} bytes={}", name, chunk.data.size());
    return true;
}

auto Store::list(const size_t limit) const -> std::vector<std::filesystem::path> {
    struct Entry {
        uint64_t              sequence;
        std::filesystem::path path;
    };

    auto entries = std::vector<Entry>();
    auto ec      = std::error_code();
    for(const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if(const auto sequence = parse_sequence(entry.path().filename().string())) {
            entries.push_back({*sequence, entry.path()});
        }
    }
    if(ec) {
        LOG_ERROR(logger, "cannot list storage directory {}: {}", dir.string(), ec.message());
        return {};
    }
    std::ranges::sort(entries, {}, &Entry::sequence);
    if(limit != 0 && entries.size() > limit) {
        entries.resize(limit);
    }

    auto ret = std::vector<std::filesystem::path>();
    ret.reserve(entries.size());
    for(auto& entry : entries) {
        ret.push_back(std::move(entry.path));
    }
    return ret;
}

auto Store::count() const -> size_t {
    return list().size();
}

auto Store::read(const std::filesystem::path& path) const -> std::optional<AudioChunk> {
    auto fd = FileDescriptor(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    ensure(fd.as_handle() >= 0, "cannot open {} errno={}({})", path.string(), errno, strerror(errno));

    struct stat st = {};
    ensure(::fstat(fd.as_handle(), &st) == 0);
    const auto file_size = size_t(st.st_size);
    ensure(file_size >= sizeof(Header), "{} is truncated size={}", path.string(), file_size);

    auto header = Header();
    ensure(read_all(fd.as_handle(), std::bit_cast<std::byte*>(&header), sizeof(header)));
    ensure(header.magic == magic && header.version == version, "{} has bad magic or version", path.string());
    ensure(header.payload_size == file_size - sizeof(Header), "{} payload size mismatch header={} file={}", path.string(), header.payload_size, file_size - sizeof(Header));

    auto chunk = AudioChunk{
        .data       = std::vector<std::byte>(header.payload_size),
        .bypass     = header.bypass != 0,
        .created_at = header.created_at,
    };
    ensure(read_all(fd.as_handle(), chunk.data.data(), chunk.data.size()));
    return chunk;
}

auto Store::remove(const std::filesystem::path& path) const -> bool {
    auto ec = std::error_code();
    std::filesystem::remove(path, ec);
    ensure(!ec, "cannot remove {}: {}", path.string(), ec.message());
    return true;
}

auto Store::quarantine(const std::filesystem::path& path) const -> bool {
    const auto target = path.parent_path() / (std::string(quarantine_prefix) + path.filename().string());

    auto ec = std::error_code();
    std::filesystem::rename(path, target, ec);
    ensure(!ec, "cannot quarantine {}: {}", path.string(), ec.message());
    LOG_WARN(logger, "moved corrupted record to {}", target.string());
    return true;
}

Store::Store(std::filesystem::path dir)
    : dir(std::move(dir)) {}
} // namespace record
