#include "rangefs/http_client.hpp"
#include "rangefs/logging.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <optional>
#include <string_view>

namespace rangefs {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
            return std::tolower(x) == std::tolower(y);
        });
}

// Start offset from "bytes <start>-<end>/<total>"
std::optional<uint64_t> content_range_start(std::string_view value) {
    constexpr std::string_view unit = "bytes ";
    if (value.size() <= unit.size() || !iequals(value.substr(0, unit.size()), unit)) {
        return std::nullopt;
    }
    value.remove_prefix(unit.size());
    uint64_t start = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), start);
    if (ec != std::errc() || ptr == value.data() + value.size() || *ptr != '-') {
        return std::nullopt;
    }
    return start;
}

// Serves reads from the current window and fetches the next one on demand
class HttpByteStream : public IByteStream {
public:
    HttpByteStream(HttpObjectClient& client, RemoteObject object, uint64_t position,
                   HttpObjectClient::Window first)
        : client_(client)
        , object_(std::move(object))
        , position_(position)
        , window_(std::move(first.data))
        , last_(first.last)
    {}

    elio::coro::task<StreamRead> read(uint8_t* buffer, size_t length) override {
        StreamRead out;
        if (closed_ || length == 0) {
            co_return out;
        }

        if (window_offset_ == window_.size()) {
            if (last_) {
                co_return out;
            }
            auto next = co_await client_.fetch(object_, position_, client_.fetch_size());
            if (!next.status) {
                out.status = std::move(next.status);
                co_return out;
            }
            window_ = std::move(next.data);
            window_offset_ = 0;
            last_ = next.last;
            if (window_.empty()) {
                co_return out;
            }
        }

        size_t n = std::min(length, window_.size() - window_offset_);
        std::memcpy(buffer, window_.data() + window_offset_, n);
        window_offset_ += n;
        position_ += n;
        out.bytes = n;
        co_return out;
    }

    elio::coro::task<Status> close() override {
        closed_ = true;
        window_.clear();
        window_offset_ = 0;
        co_return Status::make_ok();
    }

private:
    HttpObjectClient& client_;
    RemoteObject object_;
    uint64_t position_;
    ByteBuffer window_;
    size_t window_offset_ = 0;
    bool last_ = false;
    bool closed_ = false;
};

}  // namespace

HttpObjectClient::HttpObjectClient(const RemoteConfig& config, elio::io::io_context& ctx)
    : config_(config)
    , io_ctx_(ctx)
{
    elio::http::client_config client_config;
    client_config.user_agent = "rangefs";
    // Room for a full window plus a response head
    client_config.max_response_size = config_.fetch_size + 64 * 1024;
    client_ = std::make_unique<elio::http::client>(io_ctx_, client_config);
}

HttpObjectClient::~HttpObjectClient() = default;

elio::coro::task<HttpObjectClient::Window> HttpObjectClient::fetch(
    const RemoteObject& object, uint64_t offset, uint64_t length)
{
    Window out;
    if (length == 0) {
        out.last = true;
        co_return out;
    }

    auto target = elio::http::url::parse(object.download_url);
    if (!target) {
        out.status = Status::error(ErrorCode::InvalidArgument,
            "Bad download URL for " + object.object_id + ": " + object.download_url);
        co_return out;
    }

    uint64_t last_byte = length > UINT64_MAX - offset ? UINT64_MAX : offset + length - 1;
    elio::http::request req(elio::http::method::GET, target->path_with_query());
    req.set_header("Range", "bytes=" + std::to_string(offset) + "-" + std::to_string(last_byte));
    req.set_header("Accept-Encoding", "identity");
    if (!config_.auth_token.empty()) {
        req.set_header("Authorization", "Bearer " + config_.auth_token);
    }

    auto resp = co_await client_->send(req, *target);
    if (!resp) {
        out.status = Status::error(ErrorCode::NetworkError,
            "Range request for " + object.object_id + " at " + std::to_string(offset) + " failed");
        co_return out;
    }

    auto code = static_cast<int>(resp->get_status());
    std::optional<uint64_t> range_start;
    for (const auto& [name, value] : resp->get_headers()) {
        if (iequals(name, "Content-Range")) {
            range_start = content_range_start(value);
        }
    }
    auto body = resp->body();

    switch (code) {
        case 206:
            if (!range_start || *range_start != offset) {
                out.status = Status::error(ErrorCode::NetworkError,
                    "Server answered range for " + object.object_id + " at " +
                    (range_start ? std::to_string(*range_start) : std::string("?")) +
                    " instead of " + std::to_string(offset));
                co_return out;
            }
            if (body.size() > length) {
                out.status = Status::error(ErrorCode::NetworkError,
                    "Server sent " + std::to_string(body.size()) + " bytes for a " +
                    std::to_string(length) + " byte range of " + object.object_id);
                co_return out;
            }
            out.data.assign(body.begin(), body.end());
            out.last = body.size() < length;
            break;
        case 200: {
            // Range ignored; the body is the whole object
            if (offset < body.size()) {
                auto begin = body.begin() + static_cast<std::ptrdiff_t>(offset);
                auto end = body.begin() + static_cast<std::ptrdiff_t>(
                    std::min<uint64_t>(body.size(), offset + length));
                out.data.assign(begin, end);
            }
            out.last = offset + out.data.size() >= body.size();
            if (!out.last) {
                // Only the requested part is kept; later windows refetch
                log().debug("Server ignored range request for {}", object.object_id);
            }
            break;
        }
        case 416:
            out.last = true;
            break;
        default:
            out.status = Status::error(ErrorCode::NetworkError,
                "HTTP " + std::to_string(code) + " for " + object.object_id);
            co_return out;
    }

    log().trace("Fetched {} bytes of {} at {} (HTTP {})", out.data.size(),
                object.object_id, offset, code);
    co_return out;
}

elio::coro::task<OpenResult> HttpObjectClient::open(const RemoteObject& object, uint64_t offset) {
    OpenResult out;

    auto first = co_await fetch(object, offset, config_.fetch_size);
    if (!first.status) {
        out.status = std::move(first.status);
        co_return out;
    }

    log().trace("Range stream for {} opened at {}", object.object_id, offset);
    out.stream = std::make_unique<HttpByteStream>(*this, object, offset, std::move(first));
    co_return out;
}

}  // namespace rangefs
