#pragma once

#include "types.hpp"
#include "object.hpp"
#include "chunk_store.hpp"
#include "remote_client.hpp"
#include <elio/coro/task.hpp>
#include <memory>
#include <string>

namespace rangefs {

// Result of StreamBuffer::read
struct ReadResult {
    Status status;
    ByteBuffer data;
    bool cache_hit = false;

    bool ok() const noexcept { return status.ok(); }
    bool is_end_of_data() const noexcept { return status.is_end_of_data(); }
};

// Chunked streaming buffer for one open file handle.
//
// Serves read(offset, size) from the chunk store when possible and from a
// single remote stream otherwise. The stream is kept open between reads and
// reused as long as requests stay sequential; any other offset pays for a
// reopen. Every network read is written back to the chunk store under
// (object id, offset).
//
// Not safe for concurrent calls; one in-flight read per session.
class StreamBuffer {
public:
    StreamBuffer(IRemoteObjectClient& client, IChunkStore& chunks, RemoteObject object);
    ~StreamBuffer();

    StreamBuffer(const StreamBuffer&) = delete;
    StreamBuffer& operator=(const StreamBuffer&) = delete;

    // Bytes at [offset, offset + size), possibly fewer near the end of the
    // object. EndOfData when offset is at or past the object's size and the
    // range is not cached; NetworkError when the stream cannot be opened or read;
    // InvalidArgument when size is above MAX_READ_SIZE.
    elio::coro::task<ReadResult> read(uint64_t offset, uint64_t size);

    // Releases the live stream. A close failure is reported, but the
    // session is closed either way.
    elio::coro::task<Status> close();

    const std::string& session_id() const noexcept { return session_id_; }
    const RemoteObject& object() const noexcept { return object_; }
    uint64_t cursor() const noexcept { return cursor_; }
    bool has_stream() const noexcept { return stream_ != nullptr; }
    uint64_t reopen_count() const noexcept { return reopens_; }

private:
    IRemoteObjectClient& client_;
    IChunkStore& chunks_;
    RemoteObject object_;
    std::string session_id_;

    uint64_t cursor_ = 0;
    std::unique_ptr<IByteStream> stream_;
    uint64_t reopens_ = 0;

    elio::coro::task<ReadResult> read_from_remote(uint64_t offset, uint64_t size);
    elio::coro::task<Status> reopen(uint64_t offset);
    bool should_reopen(uint64_t offset) const noexcept;

    static std::string next_session_id(const std::string& object_id);
};

}  // namespace rangefs
