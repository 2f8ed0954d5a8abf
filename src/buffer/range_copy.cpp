#include "rangefs/range_copy.hpp"
#include "rangefs/logging.hpp"
#include <algorithm>

namespace rangefs {

elio::coro::task<CopyResult> copy_range(StreamBuffer& buffer,
                                        uint64_t offset, uint64_t length,
                                        size_t block_size, BlockSink sink) {
    CopyResult out;
    if (block_size == 0) {
        out.status = Status::error(ErrorCode::InvalidArgument, "Block size must be positive");
        co_return out;
    }

    uint64_t end = length > UINT64_MAX - offset ? UINT64_MAX : offset + length;
    uint64_t position = offset;

    while (position < end) {
        uint64_t want = std::min<uint64_t>(block_size, end - position);
        auto result = co_await buffer.read(position, want);
        if (result.is_end_of_data()) {
            break;
        }
        if (!result.ok()) {
            out.status = std::move(result.status);
            break;
        }

        auto status = sink(ByteView(result.data.data(), result.data.size()));
        if (!status) {
            out.status = std::move(status);
            break;
        }

        out.blocks++;
        out.bytes += result.data.size();
        if (result.cache_hit) out.cache_hits++;
        position += result.data.size();
    }

    log().debug("Copied {} bytes of {} in {} blocks", out.bytes,
                buffer.object().object_id, out.blocks);
    co_return out;
}

}  // namespace rangefs
