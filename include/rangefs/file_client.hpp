#pragma once

#include "remote_client.hpp"
#include <elio/coro/task.hpp>
#include <elio/io/io_context.hpp>
#include <filesystem>

namespace rangefs {

// Serves objects from a local directory tree that mirrors the remote store.
// An object resolves to <root>/<download_url>, or <root>/<object_id> when
// the object has no download URL. Paths escaping the root resolve to empty.
class FileObjectClient : public IRemoteObjectClient {
public:
    FileObjectClient(std::filesystem::path root, elio::io::io_context& ctx);
    ~FileObjectClient() override;

    elio::coro::task<OpenResult> open(const RemoteObject& object, uint64_t offset) override;

    std::filesystem::path resolve(const RemoteObject& object) const;

private:
    std::filesystem::path root_;
    elio::io::io_context& io_ctx_;
};

}  // namespace rangefs
