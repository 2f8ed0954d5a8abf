#include "rangefs/cache.hpp"
#include "rangefs/disk_chunk_store.hpp"
#include "rangefs/memory_chunk_store.hpp"
#include "rangefs/logging.hpp"

namespace rangefs {

Cache::Cache(const Config& config, elio::io::io_context& io_ctx)
    : config_(config)
    , io_ctx_(io_ctx)
{
    if (config_.cache.backend == "memory") {
        chunks_ = std::make_unique<MemoryChunkStore>();
        objects_ = std::make_unique<ObjectStore>();
    } else {
        chunks_ = std::make_unique<DiskChunkStore>(config_.cache, io_ctx_);
        objects_ = std::make_unique<ObjectStore>(config_.cache.path, io_ctx_);
    }
}

Cache::~Cache() = default;

elio::coro::task<Status> Cache::start() {
    log().debug("Opening {} chunk cache", config_.cache.backend);

    auto status = co_await chunks_->start();
    if (!status) {
        co_return status;
    }

    // Delete old chunks
    status = co_await chunks_->clear_all();
    if (!status) {
        log().warn("{}", status.to_string());
    }

    status = co_await objects_->start();
    if (!status) {
        co_return status;
    }

    co_return Status::make_ok();
}

std::unique_ptr<StreamBuffer> Cache::open_buffer(IRemoteObjectClient& client, RemoteObject object) {
    return std::make_unique<StreamBuffer>(client, *chunks_, std::move(object));
}

}  // namespace rangefs
