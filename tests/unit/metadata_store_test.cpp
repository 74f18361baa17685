#include <catch2/catch_test_macros.hpp>
#include <string>

#include "hoard/metadata/metadata_store.hpp"
#include <tests/support/test_doubles.hpp>

using hoard::metadata::ItemRecord;
using hoard::metadata::MetadataStore;

namespace {

auto record(const std::string& uuid, const std::string& path, const std::string& filename) -> ItemRecord {
    return ItemRecord{.timestamp = 1700000000, .uuid = uuid, .path = path, .filename = filename};
}

} // anonymous namespace

TEST_CASE("rows are found by uuid, path and filename", "[metadata]") {
    auto store = MetadataStore::open_in_memory();
    REQUIRE(store.has_value());

    auto id1 = store->insert_row(record("u-1", "trips/2023", "beach.jpg"));
    auto id2 = store->insert_row(record("u-2", "trips/2023", "dune.png"));
    auto id3 = store->insert_row(record("u-3", "", "beach.jpg"));
    REQUIRE(id1.has_value());
    REQUIRE(id2.has_value());
    REQUIRE(id3.has_value());
    REQUIRE(*id1 < *id2);

    auto by_uuid = store->select_by_uuid("u-2");
    REQUIRE(by_uuid.has_value());
    REQUIRE(by_uuid->has_value());
    REQUIRE((*by_uuid)->relative_path() == "trips/2023/dune.png");
    REQUIRE((*by_uuid)->timestamp == 1700000000);

    REQUIRE(store->select_by_path("trips/2023")->size() == 2);
    REQUIRE(store->select_by_filename("beach.jpg")->size() == 2);
    auto root_file = store->select_by_path_and_filename("", "beach.jpg");
    REQUIRE(root_file.has_value());
    REQUIRE((*root_file)->uuid == "u-3");
    REQUIRE((*root_file)->relative_path() == "beach.jpg");

    REQUIRE_FALSE(store->select_by_uuid("missing")->has_value());
    REQUIRE(store->row_count().value() == 3);
}

TEST_CASE("uuid is required and unique", "[metadata]") {
    auto store = MetadataStore::open_in_memory();
    REQUIRE(store.has_value());

    auto empty = store->insert_row(record("", "a", "b.jpg"));
    REQUIRE_FALSE(empty.has_value());
    REQUIRE(empty.error().code == hoard::core::error_code::invalid_argument);

    REQUIRE(store->insert_row(record("same", "a", "b.jpg")).has_value());
    auto dup = store->insert_row(record("same", "c", "d.jpg"));
    REQUIRE_FALSE(dup.has_value());
    REQUIRE(dup.error().code == hoard::core::error_code::precondition_failed);
    REQUIRE(store->row_count().value() == 1);
}

TEST_CASE("delete and clean_all_data", "[metadata]") {
    auto store = MetadataStore::open_in_memory();
    REQUIRE(store.has_value());
    REQUIRE(store->insert_row(record("u-1", "", "a.jpg")).has_value());
    REQUIRE(store->insert_row(record("u-2", "", "b.jpg")).has_value());

    REQUIRE(store->delete_by_uuid("u-1").value());
    REQUIRE_FALSE(store->delete_by_uuid("u-1").value());
    REQUIRE(store->row_count().value() == 1);

    REQUIRE(store->clean_all_data().has_value());
    REQUIRE(store->row_count().value() == 0);
    REQUIRE(store->select_all()->empty());
}

TEST_CASE("rows persist across reopen", "[metadata][sqlite]") {
    test_support::TempDir dir("metadata_reopen");
    const auto file = dir.path() / "items.db";
    {
        auto store = MetadataStore::open(file);
        REQUIRE(store.has_value());
        REQUIRE(store->insert_row(record("u-9", "x", "y.gif")).has_value());
    }
    auto store = MetadataStore::open(file);
    REQUIRE(store.has_value());
    auto all = store->select_all();
    REQUIRE(all.has_value());
    REQUIRE(all->size() == 1);
    REQUIRE(all->front().uuid == "u-9");
}
