#include <catch2/catch_test_macros.hpp>
#include "rangefs/object_store.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <fstream>

using namespace rangefs;
using rangefs::test::TempDir;
using rangefs::test::run_task;

namespace {

RemoteObject make_object(std::string id, std::string name, std::vector<std::string> parents) {
    RemoteObject object;
    object.object_id = std::move(id);
    object.name = std::move(name);
    object.parents = std::move(parents);
    object.size = 42;
    return object;
}

}  // namespace

TEST_CASE("ObjectStore get and upsert", "[object_store]") {
    ObjectStore store;
    REQUIRE_FALSE(store.persistent());

    SECTION("Unknown id is not found") {
        auto result = store.get("missing");
        REQUIRE(result.status.is_not_found());
        REQUIRE(result.status.message().find("missing") != std::string::npos);
    }

    SECTION("Upsert then get") {
        REQUIRE(run_task(store.upsert(make_object("a", "a.txt", {"root"}))).ok());
        auto result = store.get("a");
        REQUIRE(result.ok());
        REQUIRE(result.value.name == "a.txt");
        REQUIRE(result.value.size == 42);
        REQUIRE(store.count() == 1);
        REQUIRE(store.contains("a"));
    }

    SECTION("Upsert replaces") {
        REQUIRE(run_task(store.upsert(make_object("a", "a.txt", {"root"}))).ok());
        auto renamed = make_object("a", "b.txt", {"root"});
        renamed.size = 7;
        REQUIRE(run_task(store.upsert(renamed)).ok());

        auto result = store.get("a");
        REQUIRE(result.value.name == "b.txt");
        REQUIRE(result.value.size == 7);
        REQUIRE(store.count() == 1);
    }

    SECTION("Object without id is rejected") {
        auto status = run_task(store.upsert(make_object("", "orphan", {})));
        REQUIRE(status.code() == ErrorCode::InvalidArgument);
        REQUIRE(store.count() == 0);
    }

    SECTION("Oversized name is rejected") {
        auto object = make_object("big", std::string(RemoteObject::MAX_FIELD_SIZE + 1, 'n'), {});
        REQUIRE(run_task(store.upsert(object)).code() == ErrorCode::InvalidArgument);
        REQUIRE_FALSE(store.contains("big"));
    }
}

TEST_CASE("ObjectStore children", "[object_store]") {
    ObjectStore store;
    REQUIRE(run_task(store.upsert(make_object("d1", "docs", {"root"}))).ok());
    REQUIRE(run_task(store.upsert(make_object("f1", "one.txt", {"d1"}))).ok());
    REQUIRE(run_task(store.upsert(make_object("f2", "two.txt", {"d1", "d2"}))).ok());
    REQUIRE(run_task(store.upsert(make_object("f3", "three.txt", {"d2"}))).ok());

    SECTION("Children of a parent") {
        auto result = store.children("d1");
        REQUIRE(result.ok());
        REQUIRE(result.value.size() == 2);

        std::vector<std::string> ids;
        for (const auto& object : result.value) ids.push_back(object.object_id);
        std::sort(ids.begin(), ids.end());
        REQUIRE(ids == std::vector<std::string>{"f1", "f2"});
    }

    SECTION("No children is an empty list") {
        auto result = store.children("nothing");
        REQUIRE(result.ok());
        REQUIRE(result.value.empty());
    }

    SECTION("Find child by name") {
        auto result = store.find_child("d2", "two.txt");
        REQUIRE(result.ok());
        REQUIRE(result.value.object_id == "f2");

        REQUIRE(store.find_child("d2", "one.txt").status.is_not_found());
    }

    SECTION("Moving an object updates the parent index") {
        REQUIRE(run_task(store.upsert(make_object("f1", "one.txt", {"d2"}))).ok());
        REQUIRE(store.children("d1").value.size() == 1);
        REQUIRE(store.children("d2").value.size() == 3);
    }

    SECTION("Remove") {
        REQUIRE(run_task(store.remove("f2")).ok());
        REQUIRE(store.get("f2").status.is_not_found());
        REQUIRE(store.children("d1").value.size() == 1);
        REQUIRE(store.children("d2").value.size() == 1);

        REQUIRE(run_task(store.remove("f2")).is_not_found());
    }
}

TEST_CASE("ObjectStore page token", "[object_store]") {
    ObjectStore store;

    REQUIRE(store.start_page_token().status.is_not_found());

    REQUIRE(run_task(store.store_start_page_token("token-1")).ok());
    REQUIRE(store.start_page_token().value == "token-1");

    REQUIRE(run_task(store.store_start_page_token("token-2")).ok());
    auto result = store.start_page_token();
    REQUIRE(result.ok());
    REQUIRE(result.value == "token-2");

    REQUIRE(run_task(store.store_start_page_token("")).code() == ErrorCode::InvalidArgument);
    REQUIRE(store.start_page_token().value == "token-2");
}

TEST_CASE("RemoteObject record", "[object_store]") {
    auto object = make_object("f1", "clip.mkv", {"d1", "d2"});
    object.download_url = "https://origin.example/f1?alt=media";
    object.can_trash = true;
    object.last_modified = Timestamp(std::chrono::milliseconds(1700000000123));

    SECTION("Decodes what was encoded") {
        auto decoded = RemoteObject::decode(object.encode());
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->object_id == "f1");
        REQUIRE(decoded->name == "clip.mkv");
        REQUIRE(decoded->parents == std::vector<std::string>{"d1", "d2"});
        REQUIRE(decoded->download_url == object.download_url);
        REQUIRE(decoded->size == 42);
        REQUIRE(decoded->can_trash);
        REQUIRE_FALSE(decoded->is_dir);
        REQUIRE(decoded->last_modified == object.last_modified);
    }

    SECTION("Truncated record is rejected") {
        auto record = object.encode();
        record.pop_back();
        REQUIRE_FALSE(RemoteObject::decode(record).has_value());
    }

    SECTION("Trailing bytes are rejected") {
        auto record = object.encode();
        record.push_back(0);
        REQUIRE_FALSE(RemoteObject::decode(record).has_value());
    }

    SECTION("Wrong magic is rejected") {
        auto record = object.encode();
        record[0] ^= 0xFF;
        REQUIRE_FALSE(RemoteObject::decode(record).has_value());
    }
}

TEST_CASE("ObjectStore restart keeps objects and page token", "[object_store]") {
    TempDir tmp;
    elio::io::io_context io_ctx;
    auto root = tmp.path() / "cache";

    {
        ObjectStore store(root, io_ctx);
        REQUIRE(store.persistent());
        REQUIRE(run_task(store.start(), &io_ctx).ok());
        REQUIRE(std::filesystem::is_directory(root / "objects" / "00"));

        REQUIRE(run_task(store.upsert(make_object("d1", "docs", {"root"})), &io_ctx).ok());
        REQUIRE(run_task(store.upsert(make_object("f1", "one.txt", {"d1"})), &io_ctx).ok());
        REQUIRE(run_task(store.upsert(make_object("f2", "two.txt", {"d1"})), &io_ctx).ok());
        REQUIRE(run_task(store.store_start_page_token("page-7"), &io_ctx).ok());

        REQUIRE(std::filesystem::exists(store.object_path("f2")));
        REQUIRE(run_task(store.remove("f2"), &io_ctx).ok());
        REQUIRE_FALSE(std::filesystem::exists(store.object_path("f2")));
    }

    SECTION("Records are reloaded") {
        ObjectStore store(root, io_ctx);
        REQUIRE(store.count() == 0);
        REQUIRE(run_task(store.start(), &io_ctx).ok());

        REQUIRE(store.count() == 2);
        REQUIRE(store.find_child("d1", "one.txt").value.object_id == "f1");
        REQUIRE(store.get("f2").status.is_not_found());
        REQUIRE(store.start_page_token().value == "page-7");
    }

    SECTION("Unreadable record is skipped") {
        ObjectStore store(root, io_ctx);
        {
            std::ofstream out(store.object_path("junk"), std::ios::binary);
            out << "not a record";
        }

        REQUIRE(run_task(store.start(), &io_ctx).ok());
        REQUIRE(store.count() == 2);
        REQUIRE_FALSE(store.contains("junk"));
    }
}
