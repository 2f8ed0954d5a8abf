#include "rangefs/config.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace rangefs {

// Minimal JSON reader for the flat, two-level config layout

namespace {

class SimpleJson {
public:
    explicit SimpleJson(std::string json) : json_(std::move(json)) {}

    std::string get_string(const std::string& key, const std::string& def = "") const {
        auto pos = value_start(key);
        if (pos == std::string::npos || json_[pos] != '"') return def;

        std::string out;
        for (size_t i = pos + 1; i < json_.size(); ++i) {
            char c = json_[i];
            if (c == '"') return out;
            if (c == '\\' && i + 1 < json_.size()) {
                c = json_[++i];
            }
            out.push_back(c);
        }
        return def;
    }

    uint64_t get_uint(const std::string& key, uint64_t def = 0) const {
        auto pos = value_start(key);
        if (pos == std::string::npos) return def;

        auto end = pos;
        while (end < json_.size() && std::isdigit(static_cast<unsigned char>(json_[end]))) ++end;

        if (end == pos) return def;
        return std::stoull(json_.substr(pos, end - pos));
    }

    bool get_bool(const std::string& key, bool def = false) const {
        auto pos = value_start(key);
        if (pos == std::string::npos) return def;

        if (json_.compare(pos, 4, "true") == 0) return true;
        if (json_.compare(pos, 5, "false") == 0) return false;
        return def;
    }

    SimpleJson get_object(const std::string& key) const {
        auto pos = value_start(key);
        if (pos == std::string::npos || json_[pos] != '{') return SimpleJson("{}");

        int depth = 1;
        size_t end = pos + 1;
        while (end < json_.size() && depth > 0) {
            if (json_[end] == '{') ++depth;
            else if (json_[end] == '}') --depth;
            ++end;
        }

        return SimpleJson(json_.substr(pos, end - pos));
    }

private:
    std::string json_;

    // Position of the first non-space character after "key":
    size_t value_start(const std::string& key) const {
        auto pos = json_.find("\"" + key + "\"");
        if (pos == std::string::npos) return pos;

        pos = json_.find(':', pos + key.size() + 2);
        if (pos == std::string::npos) return pos;

        ++pos;
        while (pos < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos]))) ++pos;
        return pos < json_.size() ? pos : std::string::npos;
    }
};

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

}  // namespace

Config Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_json(buffer.str());
}

Config Config::load_json(const std::string& json) {
    Config config;
    SimpleJson j(json);

    // Cache config
    auto cache = j.get_object("cache");
    config.cache.backend = cache.get_string("backend", config.cache.backend);
    auto cache_path = cache.get_string("path", "");
    if (!cache_path.empty()) {
        config.cache.path = cache_path;
    }
    config.cache.sync_writes = cache.get_bool("sync_writes", false);

    // Remote config
    auto remote = j.get_object("remote");
    config.remote.auth_token = remote.get_string("auth_token", "");
    auto mirror = remote.get_string("mirror_root", "");
    if (!mirror.empty()) {
        config.remote.mirror_root = mirror;
    }
    config.remote.fetch_size = remote.get_uint("fetch_size", config.remote.fetch_size);

    // Read config
    auto read = j.get_object("read");
    config.read.block_size = read.get_uint("block_size", config.read.block_size);

    auto logging = j.get_object("logging");
    config.logging.level = logging.get_string("level", config.logging.level);

    return config;
}

void Config::save(const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file for writing: " + path.string());
    }
    file << to_json();
}

std::string Config::to_json() const {
    std::ostringstream oss;
    oss << "{\n";

    oss << "  \"cache\": {\n";
    oss << "    \"backend\": \"" << json_escape(cache.backend) << "\",\n";
    oss << "    \"path\": \"" << json_escape(cache.path.string()) << "\",\n";
    oss << "    \"sync_writes\": " << (cache.sync_writes ? "true" : "false") << "\n";
    oss << "  },\n";

    oss << "  \"remote\": {\n";
    oss << "    \"auth_token\": \"" << json_escape(remote.auth_token) << "\",\n";
    oss << "    \"mirror_root\": \"" << json_escape(remote.mirror_root.string()) << "\",\n";
    oss << "    \"fetch_size\": " << remote.fetch_size << "\n";
    oss << "  },\n";

    oss << "  \"read\": {\n";
    oss << "    \"block_size\": " << read.block_size << "\n";
    oss << "  },\n";

    oss << "  \"logging\": {\n";
    oss << "    \"level\": \"" << json_escape(logging.level) << "\"\n";
    oss << "  }\n";

    oss << "}\n";
    return oss.str();
}

Status Config::validate() const {
    if (cache.backend != "disk" && cache.backend != "memory") {
        return Status::error(ErrorCode::InvalidArgument,
                            "Cache backend must be \"disk\" or \"memory\"");
    }

    if (cache.backend == "disk" && cache.path.empty()) {
        return Status::error(ErrorCode::InvalidArgument,
                            "Disk cache requires a path");
    }

    if (read.block_size == 0 || read.block_size > MAX_READ_SIZE) {
        return Status::error(ErrorCode::InvalidArgument,
                            "Block size must be between 1 byte and 64MB");
    }

    if (remote.fetch_size < 4096 || remote.fetch_size > MAX_READ_SIZE) {
        return Status::error(ErrorCode::InvalidArgument,
                            "Fetch size must be between 4KB and 64MB");
    }

    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "off"};
    bool known_level = false;
    for (const char* level : levels) {
        if (logging.level == level) known_level = true;
    }
    if (!known_level) {
        return Status::error(ErrorCode::InvalidArgument,
                            "Unknown log level: " + logging.level);
    }

    return Status::make_ok();
}

}  // namespace rangefs
