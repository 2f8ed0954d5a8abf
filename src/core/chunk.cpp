#include "rangefs/chunk.hpp"
#include "record_codec.hpp"

namespace rangefs {

using codec::append_pod;
using codec::append_string;

// ChunkId implementation
ChunkId::ChunkId(std::string key)
    : key_(std::move(key))
    , hash_(key_.empty() ? Hash128{} : Hash128::of(key_))
{}

ChunkId ChunkId::derive(std::string_view object_id, uint64_t offset) {
    std::string key;
    key.reserve(object_id.size() + 21);
    key.append(object_id);
    key.push_back(':');
    key.append(std::to_string(offset));
    return ChunkId(std::move(key));
}

// Chunk implementation
Chunk::Chunk(ChunkId id, std::string object_id, uint64_t offset,
             uint64_t requested_size, ByteBuffer data)
    : id_(std::move(id))
    , object_id_(std::move(object_id))
    , offset_(offset)
    , requested_size_(requested_size)
    , data_(std::move(data))
{}

ByteBuffer Chunk::encode() const {
    ByteBuffer out;
    out.reserve(4 + 2 + 8 + id_.str().size() + object_id_.size() + 24 + data_.size());

    append_pod<uint32_t>(out, RECORD_MAGIC);
    append_pod<uint16_t>(out, RECORD_VERSION);
    append_string(out, id_.str());
    append_string(out, object_id_);
    append_pod<uint64_t>(out, offset_);
    append_pod<uint64_t>(out, requested_size_);
    append_pod<uint64_t>(out, data_.size());
    out.insert(out.end(), data_.begin(), data_.end());
    return out;
}

std::optional<Chunk> Chunk::decode(ByteView record) {
    codec::Reader reader(record);

    uint32_t magic = 0;
    uint16_t version = 0;
    if (!reader.read_pod(magic) || magic != RECORD_MAGIC) return std::nullopt;
    if (!reader.read_pod(version) || version != RECORD_VERSION) return std::nullopt;

    std::string id;
    std::string object_id;
    uint64_t offset = 0;
    uint64_t requested = 0;
    uint64_t payload_len = 0;
    if (!reader.read_string(id, MAX_CHUNK_ID_SIZE) ||
        !reader.read_string(object_id, MAX_CHUNK_ID_SIZE)) return std::nullopt;
    if (!reader.read_pod(offset) || !reader.read_pod(requested)) return std::nullopt;
    if (!reader.read_pod(payload_len)) return std::nullopt;

    ByteBuffer data;
    if (!reader.read_bytes(data, payload_len) || !reader.at_end()) return std::nullopt;

    return Chunk(ChunkId(std::move(id)), std::move(object_id), offset, requested, std::move(data));
}

}  // namespace rangefs
