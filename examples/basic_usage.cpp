/*
 * rangefs Basic Usage Example
 *
 * This example demonstrates:
 * - Setting up a memory-backed chunk cache
 * - Reading an object sequentially through a StreamBuffer
 * - Serving a repeated read from the cache
 */

#include "rangefs/rangefs.hpp"
#include <elio/runtime/scheduler.hpp>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <string>

namespace {

elio::coro::task<void> demo(rangefs::Cache& cache, rangefs::IRemoteObjectClient& client,
                            rangefs::RemoteObject object, std::promise<void>& done) {
    auto status = co_await cache.start();
    if (!status) {
        std::cerr << "Cache start failed: " << status.to_string() << "\n";
        done.set_value();
        co_return;
    }

    auto buffer = cache.open_buffer(client, object);
    std::cout << "Session " << buffer->session_id() << "\n";

    // Two sequential reads share one stream
    for (uint64_t offset = 0; offset < object.size; offset += 16) {
        auto result = co_await buffer->read(offset, 16);
        if (!result.ok()) {
            std::cerr << "Read failed: " << result.status.to_string() << "\n";
            break;
        }
        std::cout << "  [" << offset << "] "
                  << std::string(result.data.begin(), result.data.end())
                  << (result.cache_hit ? " (cache)" : " (remote)") << "\n";
    }

    // Going back to the start is served from the chunk store
    auto again = co_await buffer->read(0, 16);
    std::cout << "  [0] again: " << (again.cache_hit ? "cache hit" : "cache miss") << "\n";

    auto stats = cache.chunks().stats();
    std::cout << "Stream opens: " << buffer->reopen_count()
              << ", hits: " << stats.hits << ", misses: " << stats.misses
              << ", chunks: " << stats.entry_count << "\n";

    auto closed = co_await buffer->close();
    if (!closed) {
        std::cerr << "Close failed: " << closed.to_string() << "\n";
    }
    done.set_value();
}

}  // namespace

int main() {
    using namespace rangefs;

    std::cout << "rangefs Basic Usage Example\n";
    std::cout << "===========================\n\n";

    // A local directory stands in for the remote store
    auto root = std::filesystem::temp_directory_path() / "rangefs_example";
    std::filesystem::create_directories(root);
    const std::string content = "The quick brown fox jumps over the lazy dog";
    {
        std::ofstream out(root / "fox.txt", std::ios::binary);
        out << content;
    }

    Config config;
    config.cache.backend = "memory";
    auto status = config.validate();
    if (!status) {
        std::cerr << "Invalid config: " << status.message() << "\n";
        return 1;
    }

    elio::io::io_context io_ctx;
    elio::runtime::scheduler sched(1);
    sched.set_io_context(&io_ctx);
    sched.start();

    Cache cache(config, io_ctx);
    FileObjectClient client(root, io_ctx);

    RemoteObject object;
    object.object_id = "fox";
    object.name = "fox.txt";
    object.download_url = "fox.txt";
    object.size = content.size();

    std::promise<void> done;
    auto finished = done.get_future();
    auto task = demo(cache, client, object, done);
    sched.spawn(task.release());
    finished.wait();
    sched.shutdown();

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    return 0;
}
