#pragma once

#include "types.hpp"
#include "object.hpp"
#include <elio/coro/task.hpp>
#include <memory>

namespace rangefs {

// Result of a single stream read.
// bytes == 0 with an ok status means end of stream.
struct StreamRead {
    Status status;
    size_t bytes = 0;

    bool eof() const noexcept { return status.ok() && bytes == 0; }
};

// Forward-only byte stream over a remote object.
// Destroying the stream releases the underlying connection or descriptor.
class IByteStream {
public:
    virtual ~IByteStream() = default;

    virtual elio::coro::task<StreamRead> read(uint8_t* buffer, size_t length) = 0;
    virtual elio::coro::task<Status> close() = 0;
};

struct OpenResult {
    Status status;
    std::unique_ptr<IByteStream> stream;

    bool ok() const noexcept { return status.ok() && stream != nullptr; }
};

// Opens byte-range streams on remote objects.
// The first read of a stream opened at offset N yields the byte at N.
class IRemoteObjectClient {
public:
    virtual ~IRemoteObjectClient() = default;

    virtual elio::coro::task<OpenResult> open(const RemoteObject& object, uint64_t offset) = 0;
};

}  // namespace rangefs
