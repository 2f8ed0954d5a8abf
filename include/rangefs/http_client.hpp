#pragma once

#include "remote_client.hpp"
#include "config.hpp"
#include <elio/coro/task.hpp>
#include <elio/http/http_client.hpp>
#include <elio/io/io_context.hpp>
#include <memory>

namespace rangefs {

// Opens objects with HTTP range requests against their download URL.
// http and https URLs are accepted. A stream asks for at most fetch_size
// bytes per request and issues the next bounded range once the current one
// is consumed, so nothing past what the reader asks for stays in flight.
class HttpObjectClient : public IRemoteObjectClient {
public:
    HttpObjectClient(const RemoteConfig& config, elio::io::io_context& ctx);
    ~HttpObjectClient() override;

    elio::coro::task<OpenResult> open(const RemoteObject& object, uint64_t offset) override;

    // One response body covering [offset, offset + length)
    struct Window {
        Status status;
        ByteBuffer data;
        bool last = false;  // Nothing follows data
    };

    // Single range request. An empty last window means offset is at or past
    // the end of the object.
    elio::coro::task<Window> fetch(const RemoteObject& object, uint64_t offset, uint64_t length);

    uint64_t fetch_size() const noexcept { return config_.fetch_size; }

private:
    RemoteConfig config_;
    elio::io::io_context& io_ctx_;
    std::unique_ptr<elio::http::client> client_;
};

}  // namespace rangefs
