#include "rangefs/types.hpp"
#include <sstream>
#include <iomanip>
#include <charconv>
#include <xxhash.h>

namespace rangefs {

// Hash128 implementation
std::string Hash128::to_hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(16) << high << std::setw(16) << low;
    return oss.str();
}

Hash128 Hash128::from_hex(std::string_view hex) {
    // Zero hash for anything that is not 32 hex digits
    Hash128 h;
    if (hex.size() != 32) {
        return h;
    }
    auto high = std::from_chars(hex.data(), hex.data() + 16, h.high, 16);
    auto low = std::from_chars(hex.data() + 16, hex.data() + 32, h.low, 16);
    if (high.ptr != hex.data() + 16 || low.ptr != hex.data() + 32) {
        return Hash128{};
    }
    return h;
}

Hash128 Hash128::of(std::string_view data) {
    XXH128_hash_t h = XXH3_128bits(data.data(), data.size());
    Hash128 result;
    result.low = h.low64;
    result.high = h.high64;
    return result;
}

// Status helpers
const char* error_code_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::EndOfData: return "End of data";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::DiskError: return "Disk error";
        case ErrorCode::CorruptData: return "Corrupt data";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

std::string Status::to_string() const {
    if (message_.empty()) {
        return error_code_string(code_);
    }
    return std::string(error_code_string(code_)) + ": " + message_;
}

}  // namespace rangefs
