#pragma once

#include "types.hpp"
#include "chunk.hpp"
#include <elio/coro/task.hpp>

namespace rangefs {

// Chunk persistence interface.
// Implementations provide atomic upsert and lookup per id and are safe for
// concurrent use by several StreamBuffer sessions.
class IChunkStore {
public:
    virtual ~IChunkStore() = default;

    // Upsert by chunk id; a second store with the same id replaces the payload
    virtual elio::coro::task<Status> store(SharedChunk chunk) = 0;

    // Point lookup; nullptr when the chunk is not cached
    virtual elio::coro::task<SharedChunk> load(const ChunkId& id) = 0;

    // Remove every stored chunk
    virtual elio::coro::task<Status> clear_all() = 0;

    // Statistics
    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t stores = 0;
        uint64_t store_failures = 0;
        uint64_t bytes_read = 0;
        uint64_t bytes_written = 0;
        size_t entry_count = 0;
        size_t size_bytes = 0;
    };

    virtual Stats stats() const = 0;

    // Lifecycle
    virtual elio::coro::task<Status> start() = 0;
};

}  // namespace rangefs
