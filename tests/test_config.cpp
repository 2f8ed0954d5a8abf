#include <catch2/catch_test_macros.hpp>
#include "rangefs/config.hpp"
#include "rangefs/logging.hpp"
#include "test_helpers.hpp"
#include <fstream>

using namespace rangefs;
using rangefs::test::TempDir;

TEST_CASE("Config defaults", "[config]") {
    Config config;

    REQUIRE(config.cache.backend == "disk");
    REQUIRE(config.cache.path == "/var/cache/rangefs");
    REQUIRE(config.cache.sync_writes == false);
    REQUIRE(config.read.block_size == DEFAULT_BLOCK_SIZE);
    REQUIRE(config.remote.auth_token.empty());
    REQUIRE(config.remote.mirror_root.empty());
    REQUIRE(config.remote.fetch_size == 8 * 1024 * 1024);
    REQUIRE(config.logging.level == "info");
    REQUIRE(config.validate().ok());
}

TEST_CASE("Config JSON loading", "[config]") {
    SECTION("All fields") {
        auto config = Config::load_json(R"({
            "cache": { "backend": "memory", "path": "/tmp/rf", "sync_writes": true },
            "remote": { "auth_token": "abc\"def", "mirror_root": "/srv/mirror", "fetch_size": 8192 },
            "read": { "block_size": 65536 },
            "logging": { "level": "debug" }
        })");

        REQUIRE(config.cache.backend == "memory");
        REQUIRE(config.cache.path == "/tmp/rf");
        REQUIRE(config.cache.sync_writes == true);
        REQUIRE(config.remote.auth_token == "abc\"def");
        REQUIRE(config.remote.mirror_root == "/srv/mirror");
        REQUIRE(config.remote.fetch_size == 8192);
        REQUIRE(config.read.block_size == 65536);
        REQUIRE(config.logging.level == "debug");
    }

    SECTION("Missing sections keep defaults") {
        auto config = Config::load_json(R"({ "read": { "block_size": 4096 } })");
        REQUIRE(config.read.block_size == 4096);
        REQUIRE(config.cache.backend == "disk");
        REQUIRE(config.logging.level == "info");
    }

    SECTION("Round trip through a file") {
        TempDir tmp;
        Config config;
        config.cache.backend = "memory";
        config.remote.auth_token = "secret";
        config.read.block_size = 1024;
        config.save(tmp.path() / "rangefs.json");

        auto loaded = Config::load(tmp.path() / "rangefs.json");
        REQUIRE(loaded.cache.backend == "memory");
        REQUIRE(loaded.remote.auth_token == "secret");
        REQUIRE(loaded.read.block_size == 1024);
    }

    SECTION("Missing file throws") {
        REQUIRE_THROWS(Config::load("/nonexistent/rangefs.json"));
    }
}

TEST_CASE("Config validation", "[config]") {
    Config config;

    SECTION("Unknown backend") {
        config.cache.backend = "s3";
        REQUIRE(config.validate().code() == ErrorCode::InvalidArgument);
    }

    SECTION("Disk backend needs a path") {
        config.cache.path.clear();
        REQUIRE(!config.validate().ok());

        config.cache.backend = "memory";
        REQUIRE(config.validate().ok());
    }

    SECTION("Block size bounds") {
        config.read.block_size = 0;
        REQUIRE(!config.validate().ok());
        config.read.block_size = MAX_READ_SIZE + 1;
        REQUIRE(!config.validate().ok());
        config.read.block_size = MAX_READ_SIZE;
        REQUIRE(config.validate().ok());
    }

    SECTION("Fetch size") {
        config.remote.fetch_size = 100;
        REQUIRE(!config.validate().ok());
        config.remote.fetch_size = MAX_READ_SIZE + 1;
        REQUIRE(!config.validate().ok());
        config.remote.fetch_size = 4096;
        REQUIRE(config.validate().ok());
    }

    SECTION("Log level") {
        config.logging.level = "verbose";
        REQUIRE(!config.validate().ok());
        config.logging.level = "warn";
        REQUIRE(config.validate().ok());
    }
}

TEST_CASE("Log level setting", "[config]") {
    REQUIRE(set_log_level("debug").ok());
    REQUIRE(log().level() == spdlog::level::debug);

    REQUIRE(set_log_level("off").ok());
    REQUIRE(log().level() == spdlog::level::off);

    REQUIRE(set_log_level("loud").code() == ErrorCode::InvalidArgument);
    REQUIRE(log().level() == spdlog::level::off);

    REQUIRE(set_log_level("info").ok());
}
