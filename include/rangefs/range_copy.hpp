#pragma once

#include "types.hpp"
#include "stream_buffer.hpp"
#include <elio/coro/task.hpp>
#include <functional>

namespace rangefs {

// Receives each block in order; a non-ok status stops the copy
using BlockSink = std::function<Status(ByteView)>;

struct CopyResult {
    Status status;
    uint64_t bytes = 0;
    uint64_t blocks = 0;
    uint64_t cache_hits = 0;

    bool ok() const noexcept { return status.ok(); }
};

// Sequential block_size reads of [offset, offset + length) handed to sink.
// Stops early, with an ok status, when the object ends inside the range.
// The buffer is left open.
elio::coro::task<CopyResult> copy_range(StreamBuffer& buffer,
                                        uint64_t offset, uint64_t length,
                                        size_t block_size, BlockSink sink);

}  // namespace rangefs
