#include <catch2/catch_test_macros.hpp>
#include "rangefs/chunk.hpp"
#include <unordered_set>

using namespace rangefs;

TEST_CASE("ChunkId derivation", "[chunk]") {
    SECTION("Textual form") {
        auto id = ChunkId::derive("abc", 4096);
        REQUIRE(id.str() == "abc:4096");
        REQUIRE(!id.empty());
    }

    SECTION("Deterministic") {
        auto a = ChunkId::derive("abc", 10);
        auto b = ChunkId::derive("abc", 10);
        REQUIRE(a == b);
        REQUIRE(a.hash() == b.hash());
        REQUIRE(std::hash<ChunkId>{}(a) == std::hash<ChunkId>{}(b));
    }

    SECTION("Distinct objects and offsets") {
        std::unordered_set<ChunkId> ids;
        ids.insert(ChunkId::derive("abc", 0));
        ids.insert(ChunkId::derive("abc", 1));
        ids.insert(ChunkId::derive("abd", 0));
        ids.insert(ChunkId::derive("abc", 0));
        REQUIRE(ids.size() == 3);
    }

    SECTION("Empty id") {
        ChunkId id;
        REQUIRE(id.empty());
        REQUIRE(id.hash().is_zero());
    }
}

TEST_CASE("Chunk basic operations", "[chunk]") {
    ByteBuffer data = {'h', 'e', 'l', 'l', 'o'};
    Chunk chunk(ChunkId::derive("obj", 0), "obj", 0, 8, std::move(data));

    REQUIRE(chunk.size() == 5);
    REQUIRE(!chunk.empty());
    REQUIRE(chunk.offset() == 0);
    REQUIRE(chunk.object_id() == "obj");
    REQUIRE(chunk.requested_size() == 8);
    REQUIRE(chunk.is_short());

    auto copy = chunk.copy_data();
    REQUIRE(copy.size() == 5);
    REQUIRE(chunk.size() == 5);

    auto released = chunk.release();
    REQUIRE(released == copy);
}

TEST_CASE("Chunk record codec", "[chunk]") {
    ByteBuffer payload(1000);
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i * 7);
    }
    Chunk original(ChunkId::derive("object/with:colon", 12345), "object/with:colon",
                   12345, 1000, payload);

    auto record = original.encode();

    SECTION("Decode restores every field") {
        auto decoded = Chunk::decode(record);
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->id() == original.id());
        REQUIRE(decoded->object_id() == "object/with:colon");
        REQUIRE(decoded->offset() == 12345);
        REQUIRE(decoded->requested_size() == 1000);
        REQUIRE(decoded->copy_data() == payload);
    }

    SECTION("Empty payload") {
        Chunk empty(ChunkId::derive("o", 0), "o", 0, 0, {});
        auto decoded = Chunk::decode(empty.encode());
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->empty());
    }

    SECTION("Bad magic") {
        record[0] ^= 0xFF;
        REQUIRE(!Chunk::decode(record).has_value());
    }

    SECTION("Truncated record") {
        record.resize(record.size() - 1);
        REQUIRE(!Chunk::decode(record).has_value());
    }

    SECTION("Trailing garbage") {
        record.push_back(0);
        REQUIRE(!Chunk::decode(record).has_value());
    }

    SECTION("Too short for a header") {
        ByteBuffer tiny = {0x52, 0x46};
        REQUIRE(!Chunk::decode(tiny).has_value());
    }
}
