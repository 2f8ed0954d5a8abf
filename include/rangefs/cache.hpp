#pragma once

#include "chunk_store.hpp"
#include "object_store.hpp"
#include "stream_buffer.hpp"
#include "config.hpp"
#include <elio/io/io_context.hpp>
#include <memory>

namespace rangefs {

// Cache subsystem: the chunk store backend selected by config plus the
// object metadata store. Chunks do not survive a restart; start() drops
// whatever a previous run stored. With the disk backend object metadata and
// the page token are kept under the same path and reloaded by start().
class Cache {
public:
    // Constructor requires io_context for async disk I/O
    Cache(const Config& config, elio::io::io_context& io_ctx);
    ~Cache();

    elio::coro::task<Status> start();

    // New read session bound to this cache's chunk store
    std::unique_ptr<StreamBuffer> open_buffer(IRemoteObjectClient& client, RemoteObject object);

    IChunkStore& chunks() { return *chunks_; }
    ObjectStore& objects() { return *objects_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    elio::io::io_context& io_ctx_;
    std::unique_ptr<IChunkStore> chunks_;
    std::unique_ptr<ObjectStore> objects_;
};

}  // namespace rangefs
