#pragma once

#include "types.hpp"
#include "object.hpp"
#include <elio/coro/task.hpp>
#include <elio/io/io_context.hpp>
#include <elio/sync/primitives.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rangefs {

class DiskStore;

// Lookup result for metadata queries
template<typename T>
struct Lookup {
    Status status;
    T value{};

    bool ok() const noexcept { return status.ok(); }
};

// Thread-safe metadata store for remote objects and the change-feed cursor.
// Filled by the synchronization layer, queried by the filesystem layer.
//
// Lookups are served from memory. With a root directory every change is
// also written through to disk and start() loads it back, so metadata and
// the page token survive a restart:
//   <root>/objects/<hh>/<hash>.obj   one record per object
//   <root>/page_token
class ObjectStore {
public:
    // In-memory only
    ObjectStore();
    // Persisted under root
    ObjectStore(std::filesystem::path root, elio::io::io_context& ctx);
    ~ObjectStore();

    ObjectStore(const ObjectStore&) = delete;
    ObjectStore& operator=(const ObjectStore&) = delete;

    // Creates the layout and loads what a previous run persisted
    elio::coro::task<Status> start();

    Lookup<RemoteObject> get(const std::string& object_id) const;

    // All objects listing parent among their parents
    Lookup<std::vector<RemoteObject>> children(const std::string& parent) const;

    Lookup<RemoteObject> find_child(const std::string& parent, const std::string& name) const;

    // Insert or replace by object id
    elio::coro::task<Status> upsert(RemoteObject object);

    // NotFound when the id is unknown
    elio::coro::task<Status> remove(const std::string& object_id);

    elio::coro::task<Status> store_start_page_token(std::string token);
    Lookup<std::string> start_page_token() const;

    bool contains(const std::string& object_id) const;
    size_t count() const;
    bool persistent() const noexcept { return disk_ != nullptr; }

    std::filesystem::path object_path(const std::string& object_id) const;

private:
    std::filesystem::path root_;
    std::unique_ptr<DiskStore> disk_;

    // Serializes write-through so disk order matches memory order
    elio::sync::mutex write_mutex_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, RemoteObject> objects_;
    // parent id -> child ids
    std::unordered_multimap<std::string, std::string> by_parent_;
    std::optional<std::string> page_token_;

    void insert_locked(RemoteObject object);
    void unlink_parents(const RemoteObject& object);

    std::filesystem::path objects_dir() const { return root_ / "objects"; }
    std::filesystem::path token_path() const { return root_ / "page_token"; }
};

}  // namespace rangefs
