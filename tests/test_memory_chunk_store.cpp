#include <catch2/catch_test_macros.hpp>
#include "rangefs/memory_chunk_store.hpp"
#include "test_helpers.hpp"

using namespace rangefs;
using rangefs::test::run_task;

namespace {

SharedChunk make_chunk(const std::string& object_id, uint64_t offset, ByteBuffer data) {
    uint64_t size = data.size();
    return std::make_shared<Chunk>(ChunkId::derive(object_id, offset), object_id,
                                   offset, size, std::move(data));
}

}  // namespace

TEST_CASE("MemoryChunkStore store and load", "[memory_store]") {
    MemoryChunkStore store;
    REQUIRE(run_task(store.start()).ok());

    SECTION("Miss on empty store") {
        auto chunk = run_task(store.load(ChunkId::derive("a", 0)));
        REQUIRE(chunk == nullptr);
        REQUIRE(store.stats().misses == 1);
    }

    SECTION("Stored chunk is returned") {
        REQUIRE(run_task(store.store(make_chunk("a", 0, {1, 2, 3}))).ok());

        auto chunk = run_task(store.load(ChunkId::derive("a", 0)));
        REQUIRE(chunk != nullptr);
        REQUIRE(chunk->copy_data() == ByteBuffer{1, 2, 3});

        auto stats = store.stats();
        REQUIRE(stats.hits == 1);
        REQUIRE(stats.stores == 1);
        REQUIRE(stats.entry_count == 1);
        REQUIRE(stats.size_bytes == 3);
        REQUIRE(stats.bytes_read == 3);
    }

    SECTION("Other offsets stay misses") {
        REQUIRE(run_task(store.store(make_chunk("a", 0, {1}))).ok());
        REQUIRE(run_task(store.load(ChunkId::derive("a", 1))) == nullptr);
        REQUIRE(run_task(store.load(ChunkId::derive("b", 0))) == nullptr);
    }

    SECTION("Chunk without id is rejected") {
        auto status = run_task(store.store(std::make_shared<Chunk>()));
        REQUIRE(status.code() == ErrorCode::InvalidArgument);

        status = run_task(store.store(nullptr));
        REQUIRE(status.code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("MemoryChunkStore upsert replaces", "[memory_store]") {
    MemoryChunkStore store;

    REQUIRE(run_task(store.store(make_chunk("a", 0, {1, 2, 3, 4}))).ok());
    REQUIRE(run_task(store.store(make_chunk("a", 0, {9, 9}))).ok());

    auto chunk = run_task(store.load(ChunkId::derive("a", 0)));
    REQUIRE(chunk != nullptr);
    REQUIRE(chunk->copy_data() == ByteBuffer{9, 9});

    auto stats = store.stats();
    REQUIRE(stats.entry_count == 1);
    REQUIRE(stats.size_bytes == 2);
    REQUIRE(stats.stores == 2);
}

TEST_CASE("MemoryChunkStore clear_all", "[memory_store]") {
    MemoryChunkStore store;

    for (uint64_t offset = 0; offset < 5; ++offset) {
        REQUIRE(run_task(store.store(make_chunk("a", offset * 10, ByteBuffer(10, 1)))).ok());
    }
    REQUIRE(store.stats().entry_count == 5);

    REQUIRE(run_task(store.clear_all()).ok());

    auto stats = store.stats();
    REQUIRE(stats.entry_count == 0);
    REQUIRE(stats.size_bytes == 0);
    REQUIRE(run_task(store.load(ChunkId::derive("a", 0))) == nullptr);
}
