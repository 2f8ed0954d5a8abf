#include "rangefs/stream_buffer.hpp"
#include "rangefs/logging.hpp"
#include <algorithm>
#include <atomic>

namespace rangefs {

StreamBuffer::StreamBuffer(IRemoteObjectClient& client, IChunkStore& chunks, RemoteObject object)
    : client_(client)
    , chunks_(chunks)
    , object_(std::move(object))
    , session_id_(next_session_id(object_.object_id))
{}

// An open stream is released by its own destructor
StreamBuffer::~StreamBuffer() = default;

std::string StreamBuffer::next_session_id(const std::string& object_id) {
    static std::atomic<uint64_t> counter{0};
    return object_id + "#" + std::to_string(++counter);
}

elio::coro::task<ReadResult> StreamBuffer::read(uint64_t offset, uint64_t size) {
    ReadResult result;
    if (size == 0) {
        co_return result;
    }
    if (size > MAX_READ_SIZE) {
        result.status = Status::error(ErrorCode::InvalidArgument,
            "Read of " + std::to_string(size) + " bytes exceeds the " +
            std::to_string(MAX_READ_SIZE) + " byte limit");
        co_return result;
    }

    auto id = ChunkId::derive(object_.object_id, offset);

    auto cached = co_await chunks_.load(id);
    if (cached) {
        log().debug("Found chunk {} in cache", id.str());
        result.data = cached->copy_data();
        result.cache_hit = true;
        co_return result;
    }

    log().debug("Loading chunk {} from remote", id.str());
    result = co_await read_from_remote(offset, size);
    if (!result.ok()) {
        co_return result;
    }

    // Best-effort write-back; the read succeeds either way
    auto chunk = std::make_shared<Chunk>(id, object_.object_id, offset, size, result.data);
    auto status = co_await chunks_.store(std::move(chunk));
    if (!status) {
        log().warn("Could not cache chunk {}: {}", id.str(), status.to_string());
    }

    co_return result;
}

elio::coro::task<ReadResult> StreamBuffer::read_from_remote(uint64_t offset, uint64_t size) {
    ReadResult result;

    if (offset >= object_.size) {
        result.status = Status::error(ErrorCode::EndOfData,
            "Offset " + std::to_string(offset) + " is past the end of " + object_.object_id);
        co_return result;
    }

    if (should_reopen(offset)) {
        auto status = co_await reopen(offset);
        if (!status) {
            result.status = std::move(status);
            co_return result;
        }
    }

    // Never allocate past the declared end of the object
    uint64_t wanted = std::min(size, object_.size - offset);
    ByteBuffer buffer(wanted);
    size_t filled = 0;

    while (filled < wanted) {
        auto chunk = co_await stream_->read(buffer.data() + filled, wanted - filled);
        if (!chunk.status) {
            log().debug("Read on {} failed: {}", session_id_, chunk.status.to_string());
            // Position of a failed stream is unknown; next read reopens
            stream_.reset();
            result.status = Status::error(ErrorCode::NetworkError,
                "Could not read bytes at offset " + std::to_string(offset) +
                " for stream " + session_id_ + " (" + chunk.status.message() + ")");
            co_return result;
        }
        if (chunk.eof()) {
            break;
        }
        filled += chunk.bytes;
        cursor_ += chunk.bytes;
    }

    if (filled == 0) {
        log().debug("Stream {} ended before offset {}", session_id_, offset);
        result.status = Status::error(ErrorCode::EndOfData,
            "No data at offset " + std::to_string(offset) + " for " + object_.object_id);
        co_return result;
    }

    buffer.resize(filled);
    result.data = std::move(buffer);
    co_return result;
}

bool StreamBuffer::should_reopen(uint64_t offset) const noexcept {
    return stream_ == nullptr || offset != cursor_;
}

elio::coro::task<Status> StreamBuffer::reopen(uint64_t offset) {
    if (stream_) {
        auto status = co_await stream_->close();
        if (!status) {
            log().warn("Could not close old stream handler {}: {}", session_id_, status.to_string());
        }
        stream_.reset();
    }

    log().debug("Open new stream handler {} at offset {}", session_id_, offset);
    auto opened = co_await client_.open(object_, offset);
    if (!opened.ok()) {
        log().debug("Open of {} failed: {}", session_id_, opened.status.to_string());
        co_return Status::error(ErrorCode::NetworkError,
            "Could not open stream " + session_id_ + " for object " + object_.object_id +
            " (" + opened.status.message() + ")");
    }

    stream_ = std::move(opened.stream);
    cursor_ = offset;
    reopens_++;
    co_return Status::make_ok();
}

elio::coro::task<Status> StreamBuffer::close() {
    if (!stream_) {
        co_return Status::make_ok();
    }

    // The session is closed from here on, whatever close() reports
    auto stream = std::move(stream_);
    auto status = co_await stream->close();
    if (!status) {
        log().debug("Close of {} failed: {}", session_id_, status.to_string());
        co_return Status::error(ErrorCode::NetworkError, "Could not close stream " + session_id_);
    }
    co_return Status::make_ok();
}

}  // namespace rangefs
