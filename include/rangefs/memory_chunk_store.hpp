#pragma once

#include "chunk_store.hpp"
#include <elio/sync/primitives.hpp>
#include <atomic>
#include <unordered_map>

namespace rangefs {

// In-process chunk store, used for memory-only caches and tests
class MemoryChunkStore : public IChunkStore {
public:
    MemoryChunkStore();
    ~MemoryChunkStore() override;

    elio::coro::task<Status> store(SharedChunk chunk) override;
    elio::coro::task<SharedChunk> load(const ChunkId& id) override;
    elio::coro::task<Status> clear_all() override;

    Stats stats() const override;

    elio::coro::task<Status> start() override;

private:
    mutable elio::sync::shared_mutex mutex_;
    std::unordered_map<ChunkId, SharedChunk> chunks_;

    // Statistics
    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> stores_{0};
    std::atomic<uint64_t> bytes_read_{0};
    std::atomic<uint64_t> bytes_written_{0};
    std::atomic<size_t> entry_count_{0};
    std::atomic<size_t> current_size_{0};
};

}  // namespace rangefs
