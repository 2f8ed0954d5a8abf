#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <chrono>
#include <functional>
#include <utility>

namespace rangefs {

// Constants
constexpr size_t MAX_CHUNK_ID_SIZE = 8 * 1024;          // 8KB
constexpr size_t DEFAULT_BLOCK_SIZE = 128 * 1024;       // 128KB, typical FUSE read size
constexpr size_t MAX_READ_SIZE = 64 * 1024 * 1024;      // 64MB per read call

// Time types
using SystemClock = std::chrono::system_clock;
using Timestamp = SystemClock::time_point;

// Hash type (128-bit, names chunk records on disk)
struct Hash128 {
    uint64_t low = 0;
    uint64_t high = 0;

    bool operator==(const Hash128& other) const noexcept {
        return low == other.low && high == other.high;
    }

    bool operator<(const Hash128& other) const noexcept {
        return high < other.high || (high == other.high && low < other.low);
    }

    bool is_zero() const noexcept { return low == 0 && high == 0; }

    std::string to_hex() const;
    static Hash128 from_hex(std::string_view hex);
    static Hash128 of(std::string_view data);
};

// Error codes
enum class ErrorCode {
    Ok = 0,
    NotFound,
    EndOfData,
    NetworkError,
    DiskError,
    CorruptData,
    InvalidArgument,
    NotSupported,
    InternalError
};

const char* error_code_string(ErrorCode code);

// Status wrapper
class Status {
public:
    Status() : code_(ErrorCode::Ok) {}
    explicit Status(ErrorCode code, std::string msg = {})
        : code_(code), message_(std::move(msg)) {}

    static Status make_ok() { return Status(); }
    static Status error(ErrorCode code, std::string msg = {}) {
        return Status(code, std::move(msg));
    }

    bool ok() const noexcept { return code_ == ErrorCode::Ok; }
    bool is_ok() const noexcept { return code_ == ErrorCode::Ok; }
    bool is_error() const noexcept { return code_ != ErrorCode::Ok; }
    bool is_not_found() const noexcept { return code_ == ErrorCode::NotFound; }
    bool is_end_of_data() const noexcept { return code_ == ErrorCode::EndOfData; }
    explicit operator bool() const noexcept { return is_ok(); }

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }

    // "<code>: <message>" for log lines
    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
};

// Buffer types
using ByteBuffer = std::vector<uint8_t>;
using ByteView = std::span<const uint8_t>;

}  // namespace rangefs

namespace std {

template<>
struct hash<rangefs::Hash128> {
    size_t operator()(const rangefs::Hash128& h) const noexcept {
        return h.low ^ h.high;
    }
};

}  // namespace std
