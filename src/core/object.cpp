#include "rangefs/object.hpp"
#include "record_codec.hpp"
#include <algorithm>
#include <chrono>

namespace rangefs {

using codec::append_pod;
using codec::append_string;

bool RemoteObject::has_parent(const std::string& parent) const {
    return std::find(parents.begin(), parents.end(), parent) != parents.end();
}

ByteBuffer RemoteObject::encode() const {
    ByteBuffer out;
    out.reserve(64 + object_id.size() + name.size() + download_url.size());

    auto modified = std::chrono::duration_cast<std::chrono::milliseconds>(
        last_modified.time_since_epoch()).count();

    append_pod<uint32_t>(out, RECORD_MAGIC);
    append_pod<uint16_t>(out, RECORD_VERSION);
    append_string(out, object_id);
    append_string(out, name);
    append_string(out, download_url);
    append_pod<uint8_t>(out, is_dir ? 1 : 0);
    append_pod<uint8_t>(out, can_trash ? 1 : 0);
    append_pod<uint64_t>(out, size);
    append_pod<int64_t>(out, static_cast<int64_t>(modified));
    append_pod<uint32_t>(out, static_cast<uint32_t>(parents.size()));
    for (const auto& parent : parents) {
        append_string(out, parent);
    }
    return out;
}

std::optional<RemoteObject> RemoteObject::decode(ByteView record) {
    codec::Reader reader(record);

    uint32_t magic = 0;
    uint16_t version = 0;
    if (!reader.read_pod(magic) || magic != RECORD_MAGIC) return std::nullopt;
    if (!reader.read_pod(version) || version != RECORD_VERSION) return std::nullopt;

    RemoteObject object;
    if (!reader.read_string(object.object_id, MAX_FIELD_SIZE) ||
        !reader.read_string(object.name, MAX_FIELD_SIZE) ||
        !reader.read_string(object.download_url, MAX_FIELD_SIZE)) return std::nullopt;

    uint8_t is_dir = 0;
    uint8_t can_trash = 0;
    int64_t modified = 0;
    uint32_t parent_count = 0;
    if (!reader.read_pod(is_dir) || !reader.read_pod(can_trash)) return std::nullopt;
    if (!reader.read_pod(object.size) || !reader.read_pod(modified)) return std::nullopt;
    if (!reader.read_pod(parent_count)) return std::nullopt;

    for (uint32_t i = 0; i < parent_count; ++i) {
        std::string parent;
        if (!reader.read_string(parent, MAX_FIELD_SIZE)) return std::nullopt;
        object.parents.push_back(std::move(parent));
    }
    if (!reader.at_end() || object.object_id.empty()) return std::nullopt;

    object.is_dir = is_dir != 0;
    object.can_trash = can_trash != 0;
    object.last_modified = Timestamp(std::chrono::milliseconds(modified));
    return object;
}

}  // namespace rangefs
