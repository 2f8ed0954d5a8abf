#include "rangefs/rangefs.hpp"
#include <elio/runtime/scheduler.hpp>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <future>
#include <iostream>
#include <optional>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options] <url>\n"
              << "Reads a byte range of a remote object through the chunk cache\n"
              << "and writes it to stdout.\n"
              << "Options:\n"
              << "  -c, --config <file>      Configuration file path\n"
              << "  -i, --id <id>            Object id (default: the url)\n"
              << "  -s, --size <bytes>       Object size (required)\n"
              << "  -o, --offset <bytes>     First byte to read (default: 0)\n"
              << "  -l, --length <bytes>     Bytes to read (default: to end of object)\n"
              << "  -b, --block-size <bytes> Size of each read (default: 131072)\n"
              << "  -d, --cache-dir <path>   Disk cache directory\n"
              << "  -m, --memory             Keep chunks in memory instead of on disk\n"
              << "  -r, --root <path>        Read from a local mirror; <url> is relative to it\n"
              << "  -t, --token <token>      Bearer token for range requests\n"
              << "  -L, --log-level <level>  trace|debug|info|warn|error|off\n"
              << "  -h, --help               Show this help\n"
              << "  -v, --version            Show version\n";
}

void print_version() {
    std::cout << "rangefs-cat version " << rangefs::Version::string() << "\n"
              << "Cached byte-range reads of remote objects\n";
}

struct Options {
    std::string config_file;
    std::string url;
    std::string object_id;
    std::optional<uint64_t> size;
    uint64_t offset = 0;
    std::optional<uint64_t> length;
    std::optional<size_t> block_size;
    std::optional<std::string> cache_dir;
    bool memory = false;
    std::optional<std::string> root;
    std::optional<std::string> token;
    std::optional<std::string> log_level;
};

// Copies [offset, offset + length) of object to stdout through the cache
elio::coro::task<rangefs::Status> cat_range(rangefs::Cache& cache,
                                            rangefs::IRemoteObjectClient& client,
                                            rangefs::RemoteObject object,
                                            uint64_t offset, uint64_t length,
                                            size_t block_size) {
    auto status = co_await cache.start();
    if (!status) {
        co_return status;
    }

    auto buffer = cache.open_buffer(client, std::move(object));
    auto copied = co_await rangefs::copy_range(*buffer, offset, length, block_size,
        [](rangefs::ByteView block) {
            if (std::fwrite(block.data(), 1, block.size(), stdout) != block.size()) {
                return rangefs::Status::error(rangefs::ErrorCode::InternalError,
                                              "Write to stdout failed");
            }
            return rangefs::Status::make_ok();
        });
    std::fflush(stdout);

    rangefs::log().info("Read {} bytes ({} cache hits, {} stream opens)",
                        copied.bytes, copied.cache_hits, buffer->reopen_count());

    auto closed = co_await buffer->close();
    if (!copied.ok()) {
        if (!closed) {
            rangefs::log().warn("{}", closed.to_string());
        }
        co_return copied.status;
    }
    co_return closed;
}

}  // namespace

int main(int argc, char* argv[]) {
    Options opts;

    // Parse command line arguments
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            }

            if (arg == "-v" || arg == "--version") {
                print_version();
                return 0;
            }

            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                opts.config_file = argv[++i];
            }
            else if ((arg == "-i" || arg == "--id") && i + 1 < argc) {
                opts.object_id = argv[++i];
            }
            else if ((arg == "-s" || arg == "--size") && i + 1 < argc) {
                opts.size = std::stoull(argv[++i]);
            }
            else if ((arg == "-o" || arg == "--offset") && i + 1 < argc) {
                opts.offset = std::stoull(argv[++i]);
            }
            else if ((arg == "-l" || arg == "--length") && i + 1 < argc) {
                opts.length = std::stoull(argv[++i]);
            }
            else if ((arg == "-b" || arg == "--block-size") && i + 1 < argc) {
                opts.block_size = std::stoull(argv[++i]);
            }
            else if ((arg == "-d" || arg == "--cache-dir") && i + 1 < argc) {
                opts.cache_dir = argv[++i];
            }
            else if (arg == "-m" || arg == "--memory") {
                opts.memory = true;
            }
            else if ((arg == "-r" || arg == "--root") && i + 1 < argc) {
                opts.root = argv[++i];
            }
            else if ((arg == "-t" || arg == "--token") && i + 1 < argc) {
                opts.token = argv[++i];
            }
            else if ((arg == "-L" || arg == "--log-level") && i + 1 < argc) {
                opts.log_level = argv[++i];
            }
            else if (!arg.empty() && arg[0] != '-' && opts.url.empty()) {
                opts.url = arg;
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        return 1;
    }

    if (opts.url.empty() || !opts.size) {
        print_usage(argv[0]);
        return 1;
    }

    rangefs::Config config;
    if (!opts.config_file.empty()) {
        try {
            config = rangefs::Config::load(opts.config_file);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config: " << e.what() << "\n";
            return 1;
        }
    }

    // Command line wins over the config file
    if (opts.block_size) config.read.block_size = *opts.block_size;
    if (opts.cache_dir) config.cache.path = *opts.cache_dir;
    if (opts.memory) config.cache.backend = "memory";
    if (opts.root) config.remote.mirror_root = *opts.root;
    if (opts.token) config.remote.auth_token = *opts.token;
    if (opts.log_level) config.logging.level = *opts.log_level;

    auto status = config.validate();
    if (!status) {
        std::cerr << "Invalid configuration: " << status.message() << "\n";
        return 1;
    }
    status = rangefs::set_log_level(config.logging.level);
    if (!status) {
        std::cerr << status.message() << "\n";
        return 1;
    }

    rangefs::RemoteObject object;
    object.object_id = opts.object_id.empty() ? opts.url : opts.object_id;
    object.name = opts.url;
    object.size = *opts.size;
    object.download_url = opts.url;

    if (opts.offset >= object.size) {
        return 0;
    }
    uint64_t length = opts.length.value_or(object.size - opts.offset);

    try {
        elio::io::io_context io_ctx;
        elio::runtime::scheduler sched(2);
        sched.set_io_context(&io_ctx);
        sched.start();

        rangefs::Cache cache(config, io_ctx);

        std::unique_ptr<rangefs::IRemoteObjectClient> client;
        if (!config.remote.mirror_root.empty()) {
            client = std::make_unique<rangefs::FileObjectClient>(config.remote.mirror_root, io_ctx);
        } else {
            client = std::make_unique<rangefs::HttpObjectClient>(config.remote, io_ctx);
        }

        std::promise<rangefs::Status> done;
        auto finished = done.get_future();

        auto run_task = [&]() -> elio::coro::task<void> {
            try {
                auto result = co_await cat_range(cache, *client, object, opts.offset, length,
                                                 config.read.block_size);
                done.set_value(std::move(result));
            } catch (...) {
                done.set_exception(std::current_exception());
            }
        };

        auto task = run_task();
        sched.spawn(task.release());

        try {
            status = finished.get();
        } catch (...) {
            sched.shutdown();
            throw;
        }
        sched.shutdown();

        if (!status) {
            rangefs::log().error("{}", status.to_string());
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
