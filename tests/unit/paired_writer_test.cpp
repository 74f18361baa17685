#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <vector>

#include "hoard/library/paired_writer.hpp"
#include "hoard/vector/local_vector_store.hpp"
#include "hoard/vector/remote_vector_store.hpp"
#include <tests/support/fake_redis.hpp>
#include <tests/support/test_doubles.hpp>

using hoard::library::PairedWriter;
using hoard::library::ScanProfile;
using hoard::metadata::ItemRecord;
using hoard::metadata::MetadataStore;

namespace {

auto row(const std::string& uuid, const std::string& filename) -> ItemRecord {
    return ItemRecord{.timestamp = 1, .uuid = uuid, .path = "", .filename = filename};
}

} // anonymous namespace

TEST_CASE("paired writes land in records, vectors and profile together", "[library][paired]") {
    test_support::TempDir dir("paired_ok");
    auto records = MetadataStore::open_in_memory();
    auto vectors = hoard::vector::LocalVectorStore::open(dir.path() / "v.idx");
    REQUIRE(records.has_value());
    REQUIRE(vectors.has_value());
    REQUIRE((*vectors)->initialize_index(2).has_value());
    ScanProfile profile;

    PairedWriter w(*records, **vectors, profile);
    REQUIRE(w.write("a.jpg", row("u-a", "a.jpg"), std::vector<float>{1, 0}).has_value());
    REQUIRE(w.write("b.jpg", row("u-b", "b.jpg"), std::vector<float>{0, 1}).has_value());
    REQUIRE(w.written() == 2);
    REQUIRE(records->row_count().value() == 2);
    REQUIRE((*vectors)->size().value() == 2);
    REQUIRE(profile.uuid_of("b.jpg") == std::optional<std::string>("u-b"));

    w.commit();
    REQUIRE(w.written() == 0);
    REQUIRE(w.rollback().has_value());
    REQUIRE(records->row_count().value() == 2);
}

TEST_CASE("a rejected vector leaves no orphan record", "[library][paired]") {
    test_support::TempDir dir("paired_reject");
    auto records = MetadataStore::open_in_memory();
    auto vectors = hoard::vector::LocalVectorStore::open(dir.path() / "v.idx");
    REQUIRE(records.has_value());
    REQUIRE(vectors.has_value());
    REQUIRE((*vectors)->initialize_index(2).has_value());
    ScanProfile profile;

    PairedWriter w(*records, **vectors, profile);
    auto r = w.write("a.jpg", row("u-a", "a.jpg"), std::vector<float>{1, 0, 0});
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == hoard::core::error_code::data_integrity);
    REQUIRE(records->row_count().value() == 0);
    REQUIRE(profile.empty());
    REQUIRE(w.written() == 0);
}

TEST_CASE("rollback undoes flushed and staged writes", "[library][paired][redis]") {
    auto state = std::make_shared<test_support::FakeRedisState>();
    auto vectors = hoard::vector::RemoteVectorStore::open(
        std::make_unique<test_support::FakeRedisConnection>(state), "lib");
    auto records = MetadataStore::open_in_memory();
    REQUIRE(vectors.has_value());
    REQUIRE(records.has_value());
    auto batch = (*vectors)->get_batch_writer(2);
    REQUIRE(batch.has_value());

    ScanProfile profile;
    profile.set("old.jpg", "u-old");
    PairedWriter w(*records, **vectors, profile, batch->get());
    for (const char* name : {"a.jpg", "b.jpg", "c.jpg"}) {
        REQUIRE(w.write(name, row(std::string("u-") + name, name), std::vector<float>{1, 2}).has_value());
    }
    // a and b were flushed as one batch, c is still staged
    REQUIRE(state->hash_count("lib:") == 2);
    REQUIRE((*batch)->staged_count() == 1);

    REQUIRE(w.rollback().has_value());
    REQUIRE(state->hash_count("lib:") == 0);
    REQUIRE((*batch)->staged_count() == 0);
    REQUIRE(records->row_count().value() == 0);
    REQUIRE(profile.size() == 1);
    REQUIRE(profile.contains("old.jpg"));
}
