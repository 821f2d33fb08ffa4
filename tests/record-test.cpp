#include <fstream>
#include <print>

#include "fakes.hpp"
#include "macros/assert.hpp"
#include "record.hpp"

namespace {
auto make_test_chunk(const int tag, const bool bypass = false) -> AudioChunk {
    return AudioChunk{.data = bytes({tag, tag + 1, tag + 2}), .bypass = bypass, .created_at = 1700000000000 + tag};
}

auto sequence_names() -> bool {
    ensure(record::format_name(42) == "chunk-0000000000000042.bin");
    ensure(record::parse_sequence("chunk-0000000000000042.bin") == 42u);
    ensure(!record::parse_sequence("chunk-.bin"));
    ensure(!record::parse_sequence("chunk-12x4.bin"));
    ensure(!record::parse_sequence("chunk-0000000000000042.bin.tmp"));
    ensure(!record::parse_sequence("corrupted-chunk-0000000000000042.bin"));
    return true;
}

auto write_then_read() -> bool {
    const auto dir   = TempDir();
    auto       store = record::Store(dir.path);
    ensure(store.init());

    const auto chunk = make_test_chunk(9, true);
    ensure(store.write(chunk));
    const auto paths = store.list();
    ensure(paths.size() == 1);
    ensure(paths[0].filename() == "chunk-0000000000000000.bin");
    ensure(dir.files().size() == 1, "temporary file left behind");

    const auto loaded = store.read(paths[0]);
    ensure(loaded);
    ensure(loaded->data == chunk.data);
    ensure(loaded->bypass);
    ensure(loaded->created_at == chunk.created_at);
    return true;
}

auto list_is_oldest_first_and_limited() -> bool {
    const auto dir   = TempDir();
    auto       store = record::Store(dir.path);
    ensure(store.init());
    for(auto i = 0; i < 12; i += 1) {
        ensure(store.write(make_test_chunk(i)));
    }
    const auto all = store.list();
    ensure(all.size() == 12);
    for(auto i = 0uz; i < all.size(); i += 1) {
        ensure(record::parse_sequence(all[i].filename().string()) == i);
    }
    const auto batch = store.list(5);
    ensure(batch.size() == 5);
    ensure(batch.front() == all.front() && batch.back() == all[4]);
    return true;
}

auto sequence_resumes_after_restart() -> bool {
    const auto dir = TempDir();
    {
        auto store = record::Store(dir.path);
        ensure(store.init());
        ensure(store.write(make_test_chunk(1)));
        ensure(store.write(make_test_chunk(2)));
        ensure(store.remove(store.list(1)[0]));
    }
    auto store = record::Store(dir.path);
    ensure(store.init());
    ensure(store.next_sequence == 2u);
    ensure(store.write(make_test_chunk(3)));
    const auto paths = store.list();
    ensure(paths.size() == 2);
    ensure(store.read(paths[0])->data == make_test_chunk(2).data);
    ensure(store.read(paths[1])->data == make_test_chunk(3).data);
    return true;
}

auto corrupted_records_are_detected() -> bool {
    const auto dir   = TempDir();
    auto       store = record::Store(dir.path);
    ensure(store.init());
    ensure(store.write(make_test_chunk(1)));
    const auto path = store.list()[0];

    // truncate the payload
    std::filesystem::resize_file(path, std::filesystem::file_size(path) - 1);
    ensure(!store.read(path));

    const auto garbage = dir.path / record::format_name(7);
    std::ofstream(garbage) << "not a record";
    ensure(!store.read(garbage));

    ensure(store.quarantine(garbage));
    ensure(!std::filesystem::exists(garbage));
    ensure(std::filesystem::exists(dir.path / "corrupted-chunk-0000000000000007.bin"));
    ensure(store.count() == 1, "quarantined record is still listed");
    return true;
}

auto partial_writes_are_removed_on_init() -> bool {
    const auto dir = TempDir();
    std::ofstream(dir.path / "chunk-0000000000000003.bin.tmp") << "partial";
    std::ofstream(dir.path / "notes.txt") << "unrelated";
    auto store = record::Store(dir.path);
    ensure(store.init());
    ensure(store.next_sequence == 0u);
    ensure(store.list().empty());
    ensure(dir.files() == std::vector<std::string>{"notes.txt"});
    return true;
}

auto write_before_init_is_refused() -> bool {
    const auto dir = TempDir();
    {
        auto store = record::Store(dir.path);
        ensure(store.init());
        ensure(store.write(make_test_chunk(1)));
    }

    auto store = record::Store(dir.path);
    ensure(!store.write(make_test_chunk(2)));
    ensure(store.count() == 1);
    ensure(store.init());
    ensure(store.write(make_test_chunk(3)));

    const auto paths = store.list();
    ensure(paths.size() == 2);
    ensure(store.read(paths[0])->data == make_test_chunk(1).data, "existing record was replaced");
    ensure(store.read(paths[1])->data == make_test_chunk(3).data);
    return true;
}

auto unwritable_directory_fails_init() -> bool {
    const auto dir  = TempDir();
    const auto file = dir.path / "file";
    std::ofstream(file) << "x";
    auto store = record::Store(file / "sub");
    ensure(!store.init());
    return true;
}
} // namespace

auto main() -> int {
    auto ok = true;
    ok &= sequence_names();
    ok &= write_then_read();
    ok &= list_is_oldest_first_and_limited();
    ok &= sequence_resumes_after_restart();
    ok &= corrupted_records_are_detected();
    ok &= partial_writes_are_removed_on_init();
    ok &= write_before_init_is_refused();
    ok &= unwritable_directory_fails_init();
    std::println("record-test: {}", ok ? "pass" : "fail");
    return ok ? 0 : 1;
}
