#include "rangefs/object_store.hpp"
#include "rangefs/disk_chunk_store.hpp"
#include "rangefs/logging.hpp"
#include <algorithm>
#include <mutex>

namespace rangefs {

ObjectStore::ObjectStore() = default;

ObjectStore::ObjectStore(std::filesystem::path root, elio::io::io_context& ctx)
    : root_(std::move(root))
{
    CacheConfig config;
    config.path = root_;
    disk_ = std::make_unique<DiskStore>(config, ctx);
}

ObjectStore::~ObjectStore() = default;

std::filesystem::path ObjectStore::object_path(const std::string& object_id) const {
    auto hex = Hash128::of(object_id).to_hex();
    return objects_dir() / hex.substr(0, 2) / (hex + ".obj");
}

elio::coro::task<Status> ObjectStore::start() {
    if (!disk_) {
        co_return Status::make_ok();
    }

    auto status = co_await disk_->ensure_directory(root_);
    if (!status) {
        co_return status;
    }
    status = co_await disk_->ensure_shards(objects_dir());
    if (!status) {
        co_return status;
    }

    // Load every persisted record
    std::vector<RemoteObject> loaded;
    size_t skipped = 0;
    std::error_code ec;
    for (const auto& shard : std::filesystem::directory_iterator(objects_dir(), ec)) {
        if (!shard.is_directory()) continue;
        for (const auto& entry : std::filesystem::directory_iterator(shard.path(), ec)) {
            if (entry.path().extension() != ".obj") continue;

            auto data = co_await disk_->read_file(entry.path());
            auto object = RemoteObject::decode(data);
            if (!object) {
                skipped++;
                continue;
            }
            loaded.push_back(std::move(*object));
        }
    }
    if (skipped > 0) {
        log().warn("Skipped {} unreadable object records under {}", skipped, objects_dir().string());
    }

    auto token = co_await disk_->read_file(token_path());

    {
        std::unique_lock lock(mutex_);
        for (auto& object : loaded) {
            insert_locked(std::move(object));
        }
        if (!token.empty()) {
            page_token_ = std::string(token.begin(), token.end());
        }
    }

    log().info("Object store at {} ({} objects)", root_.string(), count());
    co_return Status::make_ok();
}

Lookup<RemoteObject> ObjectStore::get(const std::string& object_id) const {
    std::shared_lock lock(mutex_);
    auto it = objects_.find(object_id);
    if (it == objects_.end()) {
        return {Status::error(ErrorCode::NotFound, "Could not find object " + object_id + " in cache")};
    }
    log().trace("Got object {} from cache", object_id);
    return {Status::make_ok(), it->second};
}

Lookup<std::vector<RemoteObject>> ObjectStore::children(const std::string& parent) const {
    std::shared_lock lock(mutex_);
    std::vector<RemoteObject> result;
    auto [begin, end] = by_parent_.equal_range(parent);
    for (auto it = begin; it != end; ++it) {
        auto obj = objects_.find(it->second);
        if (obj != objects_.end()) {
            result.push_back(obj->second);
        }
    }
    log().trace("Got {} children for {}", result.size(), parent);
    return {Status::make_ok(), std::move(result)};
}

Lookup<RemoteObject> ObjectStore::find_child(const std::string& parent,
                                             const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto [begin, end] = by_parent_.equal_range(parent);
    for (auto it = begin; it != end; ++it) {
        auto obj = objects_.find(it->second);
        if (obj != objects_.end() && obj->second.name == name) {
            return {Status::make_ok(), obj->second};
        }
    }
    return {Status::error(ErrorCode::NotFound,
        "Could not find object with name " + name + " in parent " + parent)};
}

elio::coro::task<Status> ObjectStore::upsert(RemoteObject object) {
    if (object.object_id.empty()) {
        co_return Status::error(ErrorCode::InvalidArgument,
            "Could not update/save object without id (" + object.name + ")");
    }
    if (object.object_id.size() > RemoteObject::MAX_FIELD_SIZE ||
        object.name.size() > RemoteObject::MAX_FIELD_SIZE ||
        object.download_url.size() > RemoteObject::MAX_FIELD_SIZE ||
        std::any_of(object.parents.begin(), object.parents.end(), [](const std::string& p) {
            return p.size() > RemoteObject::MAX_FIELD_SIZE;
        })) {
        co_return Status::error(ErrorCode::InvalidArgument,
            "Object " + object.object_id.substr(0, 64) + " has an oversized field");
    }

    co_await write_mutex_.lock();
    if (disk_) {
        auto record = object.encode();
        auto status = co_await disk_->write_file_atomic(object_path(object.object_id), record);
        if (!status) {
            write_mutex_.unlock();
            co_return Status::error(status.code(),
                "Could not save object " + object.object_id + " (" + status.message() + ")");
        }
    }
    {
        std::unique_lock lock(mutex_);
        insert_locked(std::move(object));
    }
    write_mutex_.unlock();
    co_return Status::make_ok();
}

elio::coro::task<Status> ObjectStore::remove(const std::string& object_id) {
    co_await write_mutex_.lock();
    if (!contains(object_id)) {
        write_mutex_.unlock();
        co_return Status::error(ErrorCode::NotFound, "Could not delete object " + object_id);
    }

    if (disk_) {
        std::error_code ec;
        std::filesystem::remove(object_path(object_id), ec);
        if (ec) {
            write_mutex_.unlock();
            co_return Status::error(ErrorCode::DiskError,
                "Could not delete object record " + object_id + ": " + ec.message());
        }
    }
    {
        std::unique_lock lock(mutex_);
        auto it = objects_.find(object_id);
        if (it != objects_.end()) {
            unlink_parents(it->second);
            objects_.erase(it);
        }
    }
    write_mutex_.unlock();
    co_return Status::make_ok();
}

elio::coro::task<Status> ObjectStore::store_start_page_token(std::string token) {
    if (token.empty()) {
        co_return Status::error(ErrorCode::InvalidArgument, "Empty page token");
    }
    log().debug("Storing page token {} in cache", token);

    co_await write_mutex_.lock();
    if (disk_) {
        ByteView data(reinterpret_cast<const uint8_t*>(token.data()), token.size());
        auto status = co_await disk_->write_file_atomic(token_path(), data);
        if (!status) {
            write_mutex_.unlock();
            co_return Status::error(status.code(),
                "Could not save page token (" + status.message() + ")");
        }
    }
    {
        std::unique_lock lock(mutex_);
        page_token_ = std::move(token);
    }
    write_mutex_.unlock();
    co_return Status::make_ok();
}

Lookup<std::string> ObjectStore::start_page_token() const {
    std::shared_lock lock(mutex_);
    if (!page_token_) {
        return {Status::error(ErrorCode::NotFound, "Could not get token from cache")};
    }
    return {Status::make_ok(), *page_token_};
}

bool ObjectStore::contains(const std::string& object_id) const {
    std::shared_lock lock(mutex_);
    return objects_.count(object_id) > 0;
}

size_t ObjectStore::count() const {
    std::shared_lock lock(mutex_);
    return objects_.size();
}

void ObjectStore::insert_locked(RemoteObject object) {
    auto it = objects_.find(object.object_id);
    if (it != objects_.end()) {
        unlink_parents(it->second);
    }
    for (const auto& parent : object.parents) {
        by_parent_.emplace(parent, object.object_id);
    }
    auto id = object.object_id;
    objects_[id] = std::move(object);
}

void ObjectStore::unlink_parents(const RemoteObject& object) {
    for (const auto& parent : object.parents) {
        auto [begin, end] = by_parent_.equal_range(parent);
        for (auto it = begin; it != end; ++it) {
            if (it->second == object.object_id) {
                by_parent_.erase(it);
                break;
            }
        }
    }
}

}  // namespace rangefs
