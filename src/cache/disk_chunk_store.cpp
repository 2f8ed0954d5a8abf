#include "rangefs/disk_chunk_store.hpp"
#include "rangefs/logging.hpp"
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace rangefs {

namespace {

std::atomic<uint64_t> g_tmp_counter{0};

}  // namespace

// DiskStore implementation

DiskStore::DiskStore(const CacheConfig& config, elio::io::io_context& ctx)
    : config_(config)
    , io_ctx_(ctx)
{}

DiskStore::~DiskStore() = default;

elio::coro::task<Status> DiskStore::init() {
    auto status = co_await ensure_directory(config_.path);
    if (!status) {
        co_return status;
    }
    co_return co_await ensure_shards(config_.path / "chunks");
}

elio::coro::task<Status> DiskStore::ensure_shards(const std::filesystem::path& root) {
    // Sharding by first 2 hex chars of the record hash
    for (int i = 0; i < 256; ++i) {
        char dir[3];
        snprintf(dir, sizeof(dir), "%02x", i);
        auto status = co_await ensure_directory(root / dir);
        if (!status) {
            co_return status;
        }
    }
    co_return Status::make_ok();
}

elio::coro::task<ByteBuffer> DiskStore::read_file(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        co_return ByteBuffer{};
    }

    struct stat st;
    if (fstat(fd, &st) != 0 || st.st_size <= 0) {
        co_await elio::io::async_close(io_ctx_, fd);
        co_return ByteBuffer{};
    }

    uint64_t length = static_cast<uint64_t>(st.st_size);
    ByteBuffer buffer(length);
    size_t total_read = 0;

    while (total_read < length) {
        auto result = co_await elio::io::async_read(
            io_ctx_, fd,
            buffer.data() + total_read,
            length - total_read,
            static_cast<int64_t>(total_read));

        if (!result.success() || result.result <= 0) {
            break;
        }
        total_read += result.result;
    }

    co_await elio::io::async_close(io_ctx_, fd);

    buffer.resize(total_read);
    co_return buffer;
}

elio::coro::task<Status> DiskStore::write_file_atomic(
    const std::filesystem::path& path,
    ByteView data,
    bool sync)
{
    auto tmp = path;
    tmp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(g_tmp_counter++);

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        co_return Status::error(ErrorCode::DiskError,
            "Failed to open " + tmp.string() + " for writing");
    }

    // Ensure file is readable regardless of umask
    fchmod(fd, 0644);

    size_t total_written = 0;
    while (total_written < data.size()) {
        auto result = co_await elio::io::async_write(
            io_ctx_, fd,
            data.data() + total_written,
            data.size() - total_written,
            static_cast<int64_t>(total_written));

        if (!result.success() || result.result <= 0) {
            co_await elio::io::async_close(io_ctx_, fd);
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            co_return Status::error(ErrorCode::DiskError, "Write failed: " + tmp.string());
        }
        total_written += result.result;
    }

    if (sync && fsync(fd) != 0) {
        co_await elio::io::async_close(io_ctx_, fd);
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        co_return Status::error(ErrorCode::DiskError, "fsync failed: " + tmp.string());
    }

    co_await elio::io::async_close(io_ctx_, fd);

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        co_return Status::error(ErrorCode::DiskError,
            "Failed to move record into place: " + ec.message());
    }
    co_return Status::make_ok();
}

elio::coro::task<Status> DiskStore::remove_tree(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        co_return Status::error(ErrorCode::DiskError,
            "Failed to remove " + path.string() + ": " + ec.message());
    }
    co_return Status::make_ok();
}

elio::coro::task<Status> DiskStore::ensure_directory(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        std::filesystem::create_directories(path, ec);
        if (ec) {
            co_return Status::error(ErrorCode::DiskError,
                "Failed to create directory: " + ec.message());
        }
    }
    co_return Status::make_ok();
}

// DiskChunkStore implementation

DiskChunkStore::DiskChunkStore(const CacheConfig& config, elio::io::io_context& ctx)
    : config_(config)
    , io_ctx_(ctx)
    , store_(std::make_unique<DiskStore>(config, ctx))
{}

DiskChunkStore::~DiskChunkStore() = default;

elio::coro::task<Status> DiskChunkStore::start() {
    auto status = co_await store_->init();
    if (!status) {
        co_return status;
    }

    // Index whatever a previous run left behind
    std::error_code ec;
    for (const auto& shard : std::filesystem::directory_iterator(chunks_dir(), ec)) {
        if (!shard.is_directory()) continue;
        for (const auto& record : std::filesystem::directory_iterator(shard.path(), ec)) {
            if (record.path().extension() != ".chunk") continue;

            auto hash = Hash128::from_hex(record.path().stem().string());
            if (hash.is_zero()) continue;
            auto size = std::filesystem::file_size(record.path(), ec);
            if (ec) continue;

            co_await index_mutex_.lock();
            if (index_.emplace(hash, size).second) {
                entry_count_++;
                current_size_ += size;
            }
            index_mutex_.unlock();
        }
    }

    log().info("Disk chunk store at {} ({} existing records)",
               config_.path.string(), entry_count_.load());
    co_return Status::make_ok();
}

std::filesystem::path DiskChunkStore::chunk_path(const ChunkId& id) const {
    auto hex = id.hash().to_hex();
    return chunks_dir() / hex.substr(0, 2) / (hex + ".chunk");
}

elio::coro::task<Status> DiskChunkStore::store(SharedChunk chunk) {
    if (!chunk || chunk->id().empty()) {
        co_return Status::error(ErrorCode::InvalidArgument, "Chunk without id");
    }
    if (chunk->id().str().size() > MAX_CHUNK_ID_SIZE) {
        co_return Status::error(ErrorCode::InvalidArgument,
            "Chunk id too large: " + std::to_string(chunk->id().str().size()));
    }

    auto record = chunk->encode();
    auto status = co_await store_->write_file_atomic(
        chunk_path(chunk->id()), record, config_.sync_writes);
    if (!status) {
        store_failures_++;
        co_return Status::error(status.code(),
            "Could not store chunk " + chunk->id().str() + " (" + status.message() + ")");
    }

    co_await index_mutex_.lock();
    auto [it, inserted] = index_.try_emplace(chunk->id().hash(), record.size());
    if (inserted) {
        entry_count_++;
    } else {
        current_size_ -= it->second;
        it->second = record.size();
    }
    current_size_ += record.size();
    index_mutex_.unlock();

    stores_++;
    bytes_written_ += chunk->size();
    co_return Status::make_ok();
}

elio::coro::task<SharedChunk> DiskChunkStore::load(const ChunkId& id) {
    auto data = co_await store_->read_file(chunk_path(id));
    if (data.empty()) {
        misses_++;
        co_return nullptr;
    }

    auto chunk = Chunk::decode(data);
    if (!chunk) {
        log().warn("Discarding unreadable chunk record for {}", id.str());
        misses_++;
        co_return nullptr;
    }

    // Hash collision or stale record
    if (!(chunk->id() == id)) {
        misses_++;
        co_return nullptr;
    }

    hits_++;
    bytes_read_ += chunk->size();
    co_return std::make_shared<Chunk>(std::move(*chunk));
}

elio::coro::task<Status> DiskChunkStore::clear_all() {
    co_await index_mutex_.lock();
    index_.clear();
    entry_count_ = 0;
    current_size_ = 0;
    index_mutex_.unlock();

    auto status = co_await store_->remove_tree(chunks_dir());
    if (!status) {
        co_return Status::error(status.code(),
            "Could not delete chunks (" + status.message() + ")");
    }
    co_return co_await store_->ensure_shards(chunks_dir());
}

IChunkStore::Stats DiskChunkStore::stats() const {
    Stats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.stores = stores_.load();
    s.store_failures = store_failures_.load();
    s.bytes_read = bytes_read_.load();
    s.bytes_written = bytes_written_.load();
    s.entry_count = entry_count_.load();
    s.size_bytes = current_size_.load();
    return s;
}

}  // namespace rangefs
