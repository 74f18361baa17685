#include <catch2/catch_test_macros.hpp>
#include <vector>

#include "hoard/vector/batch_writer.hpp"

using hoard::vector::BatchWriter;
using hoard::vector::StagedVector;

TEST_CASE("batch writer flushes when the batch fills", "[vector][batch]") {
    std::vector<std::size_t> flushes;
    BatchWriter w(3, [&](const std::vector<StagedVector>& batch) -> std::expected<void, hoard::core::error> {
        flushes.push_back(batch.size());
        return {};
    });

    REQUIRE(w.stage("a", {1.0f}).has_value());
    REQUIRE(w.stage("b", {2.0f}).has_value());
    REQUIRE(flushes.empty());
    REQUIRE(w.staged_count() == 2);
    REQUIRE(w.stage("c", {3.0f}).has_value());
    REQUIRE(flushes == std::vector<std::size_t>{3});
    REQUIRE(w.staged_count() == 0);

    REQUIRE(w.stage("d", {4.0f}).has_value());
    REQUIRE(w.flush().has_value());
    REQUIRE(w.flush().has_value());
    REQUIRE(flushes == std::vector<std::size_t>{3, 1});
    REQUIRE(w.flushed_keys() == std::vector<std::string>{"a", "b", "c", "d"});
}

TEST_CASE("discard drops unflushed writes", "[vector][batch]") {
    std::size_t sent = 0;
    BatchWriter w(10, [&](const std::vector<StagedVector>& batch) -> std::expected<void, hoard::core::error> {
        sent += batch.size();
        return {};
    });
    REQUIRE(w.stage("a", {1.0f}).has_value());
    w.discard();
    REQUIRE(w.flush().has_value());
    REQUIRE(sent == 0);
    REQUIRE(w.flushed_keys().empty());
}

TEST_CASE("a failed flush keeps the batch staged", "[vector][batch]") {
    bool fail = true;
    BatchWriter w(0, [&](const std::vector<StagedVector>&) -> std::expected<void, hoard::core::error> {
        if (fail) return hoard::core::fail(hoard::core::error_code::unavailable, "down", "test");
        return {};
    });
    REQUIRE(w.batch_size() == 1);
    auto r = w.stage("a", {1.0f});
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == hoard::core::error_code::unavailable);
    REQUIRE(w.staged_count() == 1);

    fail = false;
    REQUIRE(w.flush().has_value());
    REQUIRE(w.flushed_keys() == std::vector<std::string>{"a"});
}
