#pragma once

#include "rangefs/types.hpp"
#include <cstring>
#include <string>

namespace rangefs::codec {

// Host byte order, length-prefixed strings

template<typename T>
void append_pod(ByteBuffer& out, T value) {
    auto* p = reinterpret_cast<const uint8_t*>(&value);
    out.insert(out.end(), p, p + sizeof(T));
}

inline void append_string(ByteBuffer& out, const std::string& s) {
    append_pod<uint32_t>(out, static_cast<uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

// Bounds-checked reader over a record
class Reader {
public:
    explicit Reader(ByteView data) : data_(data) {}

    template<typename T>
    bool read_pod(T& value) {
        if (data_.size() - pos_ < sizeof(T)) return false;
        std::memcpy(&value, data_.data() + pos_, sizeof(T));
        pos_ += sizeof(T);
        return true;
    }

    bool read_string(std::string& s, size_t max_len) {
        uint32_t len = 0;
        if (!read_pod(len)) return false;
        if (len > max_len || data_.size() - pos_ < len) return false;
        s.assign(reinterpret_cast<const char*>(data_.data() + pos_), len);
        pos_ += len;
        return true;
    }

    bool read_bytes(ByteBuffer& out, uint64_t len) {
        if (data_.size() - pos_ < len) return false;
        out.assign(data_.begin() + pos_, data_.begin() + pos_ + len);
        pos_ += len;
        return true;
    }

    bool at_end() const { return pos_ == data_.size(); }

private:
    ByteView data_;
    size_t pos_ = 0;
};

}  // namespace rangefs::codec
