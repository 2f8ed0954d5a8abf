#pragma once

#include "types.hpp"
#include <string>
#include <filesystem>

namespace rangefs {

// Chunk cache configuration
struct CacheConfig {
    std::string backend = "disk";                      // "disk" or "memory"
    std::filesystem::path path = "/var/cache/rangefs";
    bool sync_writes = false;                          // fsync chunk records
};

// Remote object access
struct RemoteConfig {
    std::string auth_token;                  // Bearer token for HTTP range requests
    std::filesystem::path mirror_root;       // Serve objects from a local tree instead
    uint64_t fetch_size = 8 * 1024 * 1024;   // Bytes asked for per HTTP range request
};

// Read path tuning
struct ReadConfig {
    size_t block_size = DEFAULT_BLOCK_SIZE;  // Size of each sequential read
};

struct LoggingConfig {
    std::string level = "info";  // trace|debug|info|warn|error|off
};

// Main configuration
struct Config {
    CacheConfig cache;
    RemoteConfig remote;
    ReadConfig read;
    LoggingConfig logging;

    // Load from file
    static Config load(const std::filesystem::path& path);
    static Config load_json(const std::string& json);

    // Save to file
    void save(const std::filesystem::path& path) const;
    std::string to_json() const;

    // Validation
    Status validate() const;
};

}  // namespace rangefs
