#pragma once

#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace rangefs {

// Chunk identifier
// Derived from (object id, offset) so repeated reads at the same position
// always land on the same cache slot. Textual form is "<object id>:<offset>".
class ChunkId {
public:
    ChunkId() = default;
    explicit ChunkId(std::string key);

    static ChunkId derive(std::string_view object_id, uint64_t offset);

    const std::string& str() const noexcept { return key_; }
    bool empty() const noexcept { return key_.empty(); }

    // xxHash3-128 of the textual form, used to name disk records
    Hash128 hash() const noexcept { return hash_; }

    bool operator==(const ChunkId& other) const noexcept {
        return hash_ == other.hash_ && key_ == other.key_;
    }

    std::string to_string() const { return key_; }

private:
    std::string key_;
    Hash128 hash_;
};

// A cached byte range of a remote object.
// data().size() may be smaller than requested_size() for reads that ran
// into the end of the object; such chunks are stored and served as-is.
class Chunk {
public:
    Chunk() = default;
    Chunk(ChunkId id, std::string object_id, uint64_t offset,
          uint64_t requested_size, ByteBuffer data);

    // Move-only (large data)
    Chunk(Chunk&&) = default;
    Chunk& operator=(Chunk&&) = default;
    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;

    const ChunkId& id() const noexcept { return id_; }
    const std::string& object_id() const noexcept { return object_id_; }
    uint64_t offset() const noexcept { return offset_; }
    uint64_t requested_size() const noexcept { return requested_size_; }

    // Access
    ByteView data() const noexcept { return {data_.data(), data_.size()}; }
    size_t size() const noexcept { return data_.size(); }
    bool empty() const noexcept { return data_.empty(); }
    bool is_short() const noexcept { return data_.size() < requested_size_; }

    ByteBuffer copy_data() const { return data_; }
    ByteBuffer release() { return std::move(data_); }

    // Record codec used by the disk backend
    ByteBuffer encode() const;
    static std::optional<Chunk> decode(ByteView record);

    static constexpr uint32_t RECORD_MAGIC = 0x4B434652;  // "RFCK"
    static constexpr uint16_t RECORD_VERSION = 1;

private:
    ChunkId id_;
    std::string object_id_;
    uint64_t offset_ = 0;
    uint64_t requested_size_ = 0;
    ByteBuffer data_;
};

// Shared chunk, handed out by stores without copying the payload
using SharedChunk = std::shared_ptr<Chunk>;

}  // namespace rangefs

namespace std {

template<>
struct hash<rangefs::ChunkId> {
    size_t operator()(const rangefs::ChunkId& c) const noexcept {
        return c.hash().low ^ c.hash().high;
    }
};

}  // namespace std
