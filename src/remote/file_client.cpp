#include "rangefs/file_client.hpp"
#include "rangefs/logging.hpp"
#include <elio/io/io_awaitables.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace rangefs {

namespace {

class FileByteStream : public IByteStream {
public:
    FileByteStream(int fd, uint64_t position, elio::io::io_context& ctx)
        : fd_(fd)
        , position_(position)
        , io_ctx_(ctx)
    {}

    ~FileByteStream() override {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    elio::coro::task<StreamRead> read(uint8_t* buffer, size_t length) override {
        StreamRead out;
        if (fd_ < 0 || length == 0) {
            co_return out;
        }

        auto result = co_await elio::io::async_read(
            io_ctx_, fd_, buffer, length, static_cast<int64_t>(position_));
        if (!result.success() || result.result < 0) {
            out.status = Status::error(ErrorCode::DiskError,
                "Read failed at offset " + std::to_string(position_));
            co_return out;
        }

        out.bytes = static_cast<size_t>(result.result);
        position_ += out.bytes;
        co_return out;
    }

    elio::coro::task<Status> close() override {
        if (fd_ >= 0) {
            int fd = fd_;
            fd_ = -1;
            co_await elio::io::async_close(io_ctx_, fd);
        }
        co_return Status::make_ok();
    }

private:
    int fd_;
    uint64_t position_;
    elio::io::io_context& io_ctx_;
};

}  // namespace

FileObjectClient::FileObjectClient(std::filesystem::path root, elio::io::io_context& ctx)
    : root_(std::move(root))
    , io_ctx_(ctx)
{}

FileObjectClient::~FileObjectClient() = default;

std::filesystem::path FileObjectClient::resolve(const RemoteObject& object) const {
    std::filesystem::path rel = object.download_url.empty() ? object.object_id : object.download_url;
    rel = rel.relative_path().lexically_normal();
    if (rel.empty() || rel == "." || *rel.begin() == "..") {
        return {};
    }
    return root_ / rel;
}

elio::coro::task<OpenResult> FileObjectClient::open(const RemoteObject& object, uint64_t offset) {
    OpenResult out;
    auto path = resolve(object);
    if (path.empty()) {
        out.status = Status::error(ErrorCode::InvalidArgument,
            "Object " + object.object_id + " resolves outside the mirror root");
        co_return out;
    }

    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        out.status = Status::error(ErrorCode::NotFound,
            "Could not open " + path.string() + ": " + std::strerror(errno));
        co_return out;
    }

    log().trace("Mirror stream for {} opened at {}", object.object_id, offset);
    out.stream = std::make_unique<FileByteStream>(fd, offset, io_ctx_);
    co_return out;
}

}  // namespace rangefs
