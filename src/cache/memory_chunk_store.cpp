#include "rangefs/memory_chunk_store.hpp"

namespace rangefs {

MemoryChunkStore::MemoryChunkStore() = default;

MemoryChunkStore::~MemoryChunkStore() = default;

elio::coro::task<Status> MemoryChunkStore::start() {
    co_return Status::make_ok();
}

elio::coro::task<Status> MemoryChunkStore::store(SharedChunk chunk) {
    if (!chunk || chunk->id().empty()) {
        co_return Status::error(ErrorCode::InvalidArgument, "Chunk without id");
    }

    size_t size = chunk->size();

    co_await mutex_.lock();
    auto [it, inserted] = chunks_.try_emplace(chunk->id(), chunk);
    if (!inserted) {
        // Full replace, no merge with the previous payload
        current_size_ -= it->second->size();
        it->second = chunk;
    } else {
        entry_count_++;
    }
    current_size_ += size;
    mutex_.unlock();

    stores_++;
    bytes_written_ += size;
    co_return Status::make_ok();
}

elio::coro::task<SharedChunk> MemoryChunkStore::load(const ChunkId& id) {
    co_await mutex_.lock_shared();
    SharedChunk result;
    auto it = chunks_.find(id);
    if (it != chunks_.end()) {
        result = it->second;
    }
    mutex_.unlock_shared();

    if (!result) {
        misses_++;
        co_return nullptr;
    }

    hits_++;
    bytes_read_ += result->size();
    co_return result;
}

elio::coro::task<Status> MemoryChunkStore::clear_all() {
    co_await mutex_.lock();
    chunks_.clear();
    entry_count_ = 0;
    current_size_ = 0;
    mutex_.unlock();
    co_return Status::make_ok();
}

IChunkStore::Stats MemoryChunkStore::stats() const {
    Stats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.stores = stores_.load();
    s.bytes_read = bytes_read_.load();
    s.bytes_written = bytes_written_.load();
    s.entry_count = entry_count_.load();
    s.size_bytes = current_size_.load();
    return s;
}

}  // namespace rangefs
