#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rangefs {

// A file or directory hosted by the remote storage provider
struct RemoteObject {
    std::string object_id;          // Stable provider id
    std::string name;
    bool is_dir = false;
    uint64_t size = 0;              // Bytes
    Timestamp last_modified;
    std::string download_url;       // Locator used to open byte-range streams
    std::vector<std::string> parents;
    bool can_trash = false;

    bool has_parent(const std::string& parent) const;

    // Record codec used by the persistent object store
    ByteBuffer encode() const;
    static std::optional<RemoteObject> decode(ByteView record);

    static constexpr uint32_t RECORD_MAGIC = 0x424F4652;  // "RFOB"
    static constexpr uint16_t RECORD_VERSION = 1;
    static constexpr size_t MAX_FIELD_SIZE = 64 * 1024;
};

}  // namespace rangefs
