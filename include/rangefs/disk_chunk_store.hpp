#pragma once

#include "chunk_store.hpp"
#include "config.hpp"
#include <elio/coro/task.hpp>
#include <elio/sync/primitives.hpp>
#include <elio/io/io_context.hpp>
#include <elio/io/io_awaitables.hpp>
#include <atomic>
#include <filesystem>
#include <unordered_map>

namespace rangefs {

// Forward declarations
class DiskStore;

// Chunk store backed by one record file per chunk.
// Layout: <path>/chunks/<hh>/<hash>.chunk, hash = xxHash3-128 of the chunk id.
class DiskChunkStore : public IChunkStore {
public:
    DiskChunkStore(const CacheConfig& config, elio::io::io_context& ctx);
    ~DiskChunkStore() override;

    elio::coro::task<Status> store(SharedChunk chunk) override;
    elio::coro::task<SharedChunk> load(const ChunkId& id) override;
    elio::coro::task<Status> clear_all() override;

    Stats stats() const override;

    elio::coro::task<Status> start() override;

    std::filesystem::path chunk_path(const ChunkId& id) const;

private:
    CacheConfig config_;
    elio::io::io_context& io_ctx_;
    std::unique_ptr<DiskStore> store_;

    // Record sizes of what is on disk, keyed by file name hash
    mutable elio::sync::shared_mutex index_mutex_;
    std::unordered_map<Hash128, size_t> index_;

    // Statistics
    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> stores_{0};
    std::atomic<uint64_t> store_failures_{0};
    std::atomic<uint64_t> bytes_read_{0};
    std::atomic<uint64_t> bytes_written_{0};
    std::atomic<size_t> entry_count_{0};
    std::atomic<size_t> current_size_{0};

    std::filesystem::path chunks_dir() const { return config_.path / "chunks"; }
};

// Low-level disk I/O (uses async file operations)
class DiskStore {
public:
    DiskStore(const CacheConfig& config, elio::io::io_context& ctx);
    ~DiskStore();

    // Creates <path>/chunks and its 256 shard directories
    elio::coro::task<Status> init();

    // Whole-file read; empty buffer when the file is missing
    elio::coro::task<ByteBuffer> read_file(const std::filesystem::path& path);

    // Writes to "<path>.tmp" and renames over path
    elio::coro::task<Status> write_file_atomic(
        const std::filesystem::path& path,
        ByteView data,
        bool sync = false);

    elio::coro::task<Status> remove_tree(const std::filesystem::path& path);

    // Directory operations
    elio::coro::task<Status> ensure_directory(const std::filesystem::path& path);
    elio::coro::task<Status> ensure_shards(const std::filesystem::path& root);

private:
    CacheConfig config_;
    elio::io::io_context& io_ctx_;
};

}  // namespace rangefs
