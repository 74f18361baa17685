#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include "hoard/core/uuid.hpp"
#include "hoard/library/image_library.hpp"
#include "hoard/vector/remote_vector_store.hpp"
#include <tests/support/fake_redis.hpp>
#include <tests/support/test_doubles.hpp>

using hoard::core::error_code;
using hoard::library::ImageLibrary;
using hoard::library::LibraryOptions;
namespace fs = std::filesystem;

namespace {

enum class Backend { local, redis };

/** \brief Library root with a handful of images plus files the scan must ignore. */
struct LibraryFixture {
    explicit LibraryFixture(const std::string& name, Backend backend = Backend::local, std::size_t batch_size = 200)
        : dir(name), uuid(hoard::core::make_uuid()), redis(std::make_shared<test_support::FakeRedisState>()),
          embedder(std::make_shared<test_support::HashEmbedder>(8)) {
        options.vectors.batch_size = batch_size;
        if (backend == Backend::redis) {
            options.vectors.backend = hoard::vector::VectorStoreConfig::Backend::redis;
            options.vector_factory = [state = redis](const hoard::vector::VectorStoreConfig& cfg)
                -> std::expected<std::unique_ptr<hoard::vector::VectorStore>, hoard::core::error> {
                auto store = hoard::vector::RemoteVectorStore::open(
                    std::make_unique<test_support::FakeRedisConnection>(state), cfg.namespace_id);
                if (!store) return std::unexpected(store.error());
                return std::unique_ptr<hoard::vector::VectorStore>(std::move(*store));
            };
        }
        test_support::write_png(root() / "a.png", "a");
        test_support::write_jpeg(root() / "b.jpg", "b");
        test_support::write_png(root() / "trips" / "2023" / "c.png", "c");
        test_support::write_jpeg(root() / "trips" / "d.jpg", "d");
        test_support::write_text(root() / "notes.txt", "not an image at all");
        test_support::write_png(root() / "node_modules" / "icon.png", "ignored");
        test_support::write_png(root() / "Thumbs.db", "ignored");
    }

    [[nodiscard]] const fs::path& root() const { return dir.path(); }

    auto open() -> std::unique_ptr<ImageLibrary> {
        auto lib = ImageLibrary::open(root(), "Photos", uuid, options);
        REQUIRE(lib.has_value());
        (*lib)->set_embedder(embedder);
        return std::move(*lib);
    }

    test_support::TempDir dir;
    std::string uuid;
    std::shared_ptr<test_support::FakeRedisState> redis;
    std::shared_ptr<test_support::HashEmbedder> embedder;
    LibraryOptions options;
};

/** \brief Records, vectors and profile describe exactly the same items. */
void require_consistent(const ImageLibrary& lib) {
    const auto profile = lib.embedded_files();
    auto records = lib.records();
    auto vectors = lib.vectors();
    REQUIRE(records);
    REQUIRE(vectors);
    REQUIRE(records->row_count().value() == profile.size());
    REQUIRE(vectors->size().value() == profile.size());
    for (const auto& [path, uuid] : profile) {
        auto rec = records->select_by_uuid(uuid);
        REQUIRE(rec.has_value());
        REQUIRE(rec->has_value());
        REQUIRE((*rec)->relative_path() == path);
    }
}

auto embedded_paths(const ImageLibrary& lib) -> std::set<std::string> {
    std::set<std::string> out;
    for (const auto& [path, uuid] : lib.embedded_files()) out.insert(path);
    return out;
}

} // anonymous namespace

TEST_CASE("full scan embeds every image and nothing else", "[library][scan]") {
    for (auto backend : {Backend::local, Backend::redis}) {
        LibraryFixture fx(backend == Backend::local ? "scan_full_local" : "scan_full_redis", backend);
        auto lib = fx.open();
        REQUIRE_FALSE(lib->lib_is_ready());

        std::vector<int> progress;
        auto report = lib->initialize(false, [&](int p) { progress.push_back(p); });
        REQUIRE(report.has_value());
        REQUIRE(report->full_scan);
        REQUIRE(report->added == 4);
        REQUIRE(report->skipped == 1);   // notes.txt
        REQUIRE(lib->lib_is_ready());

        REQUIRE(embedded_paths(*lib) ==
                std::set<std::string>{"a.png", "b.jpg", "trips/2023/c.png", "trips/d.jpg"});
        require_consistent(*lib);
        REQUIRE(lib->item_count().value() == 4);
        REQUIRE(lib->vectors()->dimension() == 8);

        REQUIRE_FALSE(progress.empty());
        REQUIRE(std::is_sorted(progress.begin(), progress.end()));
        REQUIRE(std::adjacent_find(progress.begin(), progress.end()) == progress.end());
        REQUIRE(progress.back() == 100);

        REQUIRE(lib->scan_gap_days().value() == 0);
        REQUIRE_FALSE(lib->metadata().last_scanned.empty());
    }
}

TEST_CASE("scan requires an embedder", "[library][scan]") {
    LibraryFixture fx("scan_no_embedder");
    auto lib = ImageLibrary::open(fx.root(), "Photos", fx.uuid);
    REQUIRE(lib.has_value());
    REQUIRE((*lib)->scan_gap_days().error().code == error_code::not_found);
    auto r = (*lib)->initialize();
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::not_initialized);
}

TEST_CASE("open validates identity", "[library][open]") {
    LibraryFixture fx("open_identity");
    REQUIRE(ImageLibrary::open(fx.root(), "", fx.uuid).error().code == error_code::invalid_argument);
    REQUIRE(ImageLibrary::open(fx.root(), "Photos", "").error().code == error_code::invalid_argument);
    REQUIRE(ImageLibrary::open(fx.root() / "missing", "Photos", fx.uuid).error().code == error_code::not_found);

    auto lib = fx.open();
    REQUIRE(lib->metadata().name == "Photos");
    REQUIRE(fs::exists(fx.root() / ".hoard" / "library.meta"));
    auto other = ImageLibrary::open(fx.root(), "Photos", hoard::core::make_uuid());
    REQUIRE_FALSE(other.has_value());
    REQUIRE(other.error().code == error_code::data_integrity);
}

TEST_CASE("initialize is idempotent unless forced", "[library][scan]") {
    LibraryFixture fx("scan_idempotent");
    auto lib = fx.open();
    REQUIRE(lib->initialize().has_value());
    const auto before = lib->embedded_files();
    const auto calls = fx.embedder->file_calls();

    auto again = lib->initialize();
    REQUIRE(again.has_value());
    REQUIRE(again->added == 0);
    REQUIRE(fx.embedder->file_calls() == calls);
    REQUIRE(lib->embedded_files() == before);

    // A reopened library finds its data and does not rescan
    lib.reset();
    auto reopened = fx.open();
    auto third = reopened->initialize();
    REQUIRE(third.has_value());
    REQUIRE(third->added == 0);
    REQUIRE(reopened->embedded_files() == before);
    require_consistent(*reopened);

    auto forced = reopened->initialize(true);
    REQUIRE(forced.has_value());
    REQUIRE(forced->added == 4);
    std::set<std::string> before_paths;
    for (const auto& [path, uuid] : before) before_paths.insert(path);
    REQUIRE(embedded_paths(*reopened) == before_paths);
    REQUIRE(reopened->embedded_files() != before);   // fresh identifiers
    require_consistent(*reopened);
}

TEST_CASE("incremental scan adds new files and drops vanished ones", "[library][scan][incremental]") {
    for (auto backend : {Backend::local, Backend::redis}) {
        LibraryFixture fx(backend == Backend::local ? "scan_incr_local" : "scan_incr_redis", backend);
        auto lib = fx.open();

        // Nothing embedded yet: falls back to a full scan
        auto first = lib->incremental_initialize();
        REQUIRE(first.has_value());
        REQUIRE(first->full_scan);
        REQUIRE(first->added == 4);
        const auto kept_uuid = lib->embedded_files().at("a.png");

        fs::remove(fx.root() / "b.jpg");
        test_support::write_jpeg(fx.root() / "new" / "e.jpg", "e");
        auto second = lib->incremental_initialize();
        REQUIRE(second.has_value());
        REQUIRE_FALSE(second->full_scan);
        REQUIRE(second->added == 1);
        REQUIRE(second->removed == 1);

        REQUIRE(embedded_paths(*lib) ==
                std::set<std::string>{"a.png", "new/e.jpg", "trips/2023/c.png", "trips/d.jpg"});
        REQUIRE(lib->embedded_files().at("a.png") == kept_uuid);
        require_consistent(*lib);

        auto third = lib->incremental_initialize();
        REQUIRE(third.has_value());
        REQUIRE(third->added == 0);
        REQUIRE(third->removed == 0);
    }
}

TEST_CASE("cancelled first scan leaves an empty library", "[library][scan][cancel]") {
    for (auto backend : {Backend::local, Backend::redis}) {
        // Batch larger than the library: on redis nothing is flushed before the cancel
        LibraryFixture fx(backend == Backend::local ? "scan_cancel_local" : "scan_cancel_redis", backend, 100);
        auto lib = fx.open();
        hoard::core::CancelToken cancel;
        fx.embedder->cancel_token = &cancel;
        fx.embedder->cancel_after_calls = 2;

        auto r = lib->initialize(false, {}, &cancel);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == error_code::cancelled);
        REQUIRE(r.error().message == "Library initialization cancelled");

        REQUIRE(lib->embedded_files().empty());
        REQUIRE(lib->records()->row_count().value() == 0);
        REQUIRE(lib->vectors()->db_is_empty().value());
        REQUIRE(lib->vectors()->dimension() == 0);
        REQUIRE(fx.redis->hash_count(fx.uuid + ":") == 0);
        REQUIRE(lib->scan_gap_days().error().code == error_code::not_found);

        // The lock was released and a new scan succeeds
        fx.embedder->cancel_token = nullptr;
        cancel.reset();
        auto retry = lib->initialize(false, {}, &cancel);
        REQUIRE(retry.has_value());
        REQUIRE(retry->added == 4);
        require_consistent(*lib);
    }
}

TEST_CASE("cancelled forced rescan keeps the items of earlier scans", "[library][scan][cancel]") {
    for (auto backend : {Backend::local, Backend::redis}) {
        LibraryFixture fx(backend == Backend::local ? "scan_cancel_rescan_local" : "scan_cancel_rescan_redis",
                          backend, 100);
        auto lib = fx.open();
        REQUIRE(lib->initialize().has_value());
        const auto before = lib->embedded_files();
        const auto last_scanned = lib->metadata().last_scanned;
        REQUIRE(before.size() == 4);

        hoard::core::CancelToken cancel;
        fx.embedder->cancel_token = &cancel;
        fx.embedder->cancel_after_calls = fx.embedder->file_calls() + 1;

        auto r = lib->initialize(true, {}, &cancel);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == error_code::cancelled);

        REQUIRE(lib->embedded_files() == before);
        require_consistent(*lib);
        REQUIRE(lib->vectors()->dimension() == 8);
        REQUIRE(lib->metadata().last_scanned == last_scanned);
        if (backend == Backend::redis) REQUIRE(fx.redis->hash_count(fx.uuid + ":") == 4);
        auto on_disk = hoard::library::ScanProfile::load(fx.root() / ".hoard" / "scan_profile");
        REQUIRE(on_disk.has_value());
        REQUIRE(on_disk->entries() == before);

        // The old items still answer queries
        auto hits = lib->search_by_item(fx.root() / "a.png", 1);
        REQUIRE(hits.has_value());
        REQUIRE(hits->size() == 1);
        REQUIRE(hits->front().record.uuid == before.at("a.png"));
    }
}

TEST_CASE("cancelled incremental scan keeps items whose files vanished", "[library][scan][cancel]") {
    for (auto backend : {Backend::local, Backend::redis}) {
        LibraryFixture fx(backend == Backend::local ? "scan_cancel_vanished_local" : "scan_cancel_vanished_redis",
                          backend, 100);
        auto lib = fx.open();
        REQUIRE(lib->initialize().has_value());
        const auto before = lib->embedded_files();

        fs::remove(fx.root() / "a.png");
        for (const char* name : {"x.png", "y.png", "z.png"}) {
            test_support::write_png(fx.root() / "added" / name, name);
        }
        hoard::core::CancelToken cancel;
        fx.embedder->cancel_token = &cancel;
        fx.embedder->cancel_after_calls = fx.embedder->file_calls() + 1;

        auto r = lib->incremental_initialize({}, &cancel);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == error_code::cancelled);
        REQUIRE(lib->embedded_files() == before);
        REQUIRE(lib->records()->select_by_uuid(before.at("a.png")).value().has_value());
        require_consistent(*lib);

        // Once the scan completes the vanished item goes
        fx.embedder->cancel_token = nullptr;
        cancel.reset();
        auto done = lib->incremental_initialize({}, &cancel);
        REQUIRE(done.has_value());
        REQUIRE(done->added == 3);
        REQUIRE(done->removed == 1);
        REQUIRE_FALSE(lib->embedded_files().contains("a.png"));
        REQUIRE_FALSE(lib->records()->select_by_uuid(before.at("a.png")).value().has_value());
        require_consistent(*lib);
    }
}

TEST_CASE("removal is rejected while a scan runs", "[library][lock][remove]") {
    for (auto backend : {Backend::local, Backend::redis}) {
        LibraryFixture fx(backend == Backend::local ? "remove_during_scan_local" : "remove_during_scan_redis",
                          backend);
        auto lib = fx.open();
        REQUIRE(lib->initialize().has_value());
        test_support::write_png(fx.root() / "later" / "e.png", "e");

        std::vector<error_code> rejected;
        bool tried = false;
        auto r = lib->incremental_initialize([&](int) {
            if (tried) return;
            tried = true;
            std::thread other([&] {
                auto removed = lib->remove_embeddings({"a.png"});
                auto deleted = lib->delete_files({"b.jpg"});
                if (!removed) rejected.push_back(removed.error().code);
                if (!deleted) rejected.push_back(deleted.error().code);
            });
            other.join();
        });
        REQUIRE(r.has_value());
        REQUIRE(tried);
        REQUIRE(rejected == std::vector<error_code>(2, error_code::lock_contention));
        REQUIRE(fs::exists(fx.root() / "b.jpg"));
        REQUIRE(lib->embedded_files().size() == 5);
        require_consistent(*lib);

        // After the scan the same removal goes through
        REQUIRE(lib->remove_embeddings({"a.png"}).value() == 1);
        require_consistent(*lib);
    }
}

TEST_CASE("cancelled incremental scan restores the previous state", "[library][scan][cancel]") {
    for (auto backend : {Backend::local, Backend::redis}) {
        LibraryFixture fx(backend == Backend::local ? "scan_cancel_incr_local" : "scan_cancel_incr_redis", backend, 2);
        auto lib = fx.open();
        REQUIRE(lib->initialize().has_value());
        const auto before = lib->embedded_files();

        for (const char* name : {"n1.png", "n2.png", "n3.png", "n4.png", "n5.png"}) {
            test_support::write_png(fx.root() / "batch" / name, name);
        }
        hoard::core::CancelToken cancel;
        fx.embedder->cancel_token = &cancel;
        fx.embedder->cancel_after_calls = fx.embedder->file_calls() + 3;

        auto r = lib->incremental_initialize({}, &cancel);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == error_code::cancelled);
        REQUIRE(lib->embedded_files() == before);
        require_consistent(*lib);

        auto reopened_profile = hoard::library::ScanProfile::load(fx.root() / ".hoard" / "scan_profile");
        REQUIRE(reopened_profile.has_value());
        REQUIRE(reopened_profile->entries() == before);
    }
}

TEST_CASE("a dimension change aborts the scan and rolls back", "[library][scan]") {
    LibraryFixture fx("scan_dimension");
    auto lib = fx.open();
    fx.embedder->change_dim_after = 1;
    auto r = lib->initialize();
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == error_code::data_integrity);
    REQUIRE(lib->embedded_files().empty());
    REQUIRE(lib->records()->row_count().value() == 0);
    REQUIRE(lib->vectors()->size().value() == 0);
}

TEST_CASE("per-item failures skip, fatal failures abort", "[library][scan]") {
    LibraryFixture fx("scan_item_errors");
    auto lib = fx.open();
    fx.embedder->reject_names = {"b.jpg"};
    auto r = lib->initialize();
    REQUIRE(r.has_value());
    REQUIRE(r->added == 3);
    REQUIRE(r->skipped == 2);
    REQUIRE_FALSE(lib->embedded_files().contains("b.jpg"));

    const auto before = lib->embedded_files();
    fx.embedder->reject_names.clear();
    fx.embedder->fatal_name = "d.jpg";
    auto forced = lib->initialize(true);
    REQUIRE_FALSE(forced.has_value());
    REQUIRE(forced.error().code == error_code::io_failed);
    REQUIRE(lib->embedded_files() == before);
    require_consistent(*lib);
}

TEST_CASE("only one scan runs at a time", "[library][lock]") {
    LibraryFixture fx("scan_lock");
    auto lib = fx.open();

    std::vector<error_code> rejected;
    bool probed = false;
    auto r = lib->initialize(false, [&](int) {
        if (probed) return;
        probed = true;
        std::thread other([&] {
            auto a = lib->initialize(true);
            auto b = lib->incremental_initialize();
            auto c = lib->demolish();
            if (!a) rejected.push_back(a.error().code);
            if (!b) rejected.push_back(b.error().code);
            if (!c) rejected.push_back(c.error().code);
        });
        other.join();
    });
    REQUIRE(r.has_value());
    REQUIRE(rejected == std::vector<error_code>(3, error_code::lock_contention));
    require_consistent(*lib);
}

TEST_CASE("remove_embeddings and delete_files keep both stores in step", "[library][remove]") {
    for (auto backend : {Backend::local, Backend::redis}) {
        LibraryFixture fx(backend == Backend::local ? "remove_local" : "remove_redis", backend);
        auto lib = fx.open();
        REQUIRE(lib->remove_embeddings({"a.png"}).error().code == error_code::not_initialized);
        REQUIRE(lib->delete_files({"a.png"}).error().code == error_code::not_initialized);
        REQUIRE(lib->initialize().has_value());

        auto removed = lib->remove_embeddings({"/a.png", "not-there.png", ""});
        REQUIRE(removed.has_value());
        REQUIRE(*removed == 1);
        REQUIRE(fs::exists(fx.root() / "a.png"));
        require_consistent(*lib);

        auto escape = lib->delete_files({"trips/d.jpg", "../outside.png"});
        REQUIRE_FALSE(escape.has_value());
        REQUIRE(escape.error().code == error_code::invalid_argument);
        REQUIRE(fs::exists(fx.root() / "trips" / "d.jpg"));

        auto deleted = lib->delete_files({"trips/d.jpg"});
        REQUIRE(deleted.has_value());
        REQUIRE(*deleted == 1);
        REQUIRE_FALSE(fs::exists(fx.root() / "trips" / "d.jpg"));
        REQUIRE(embedded_paths(*lib) == std::set<std::string>{"b.jpg", "trips/2023/c.png"});
        require_consistent(*lib);
    }
}

TEST_CASE("search by item and by text", "[library][search]") {
    for (auto backend : {Backend::local, Backend::redis}) {
        LibraryFixture fx(backend == Backend::local ? "search_local" : "search_redis", backend);
        auto lib = fx.open();
        REQUIRE(lib->search_by_text("beach", 3).error().code == error_code::not_initialized);
        REQUIRE(lib->initialize().has_value());

        auto hits = lib->search_by_item(fx.root() / "trips" / "2023" / "c.png", 2);
        REQUIRE(hits.has_value());
        REQUIRE(hits->size() == 2);
        REQUIRE(hits->front().record.relative_path() == "trips/2023/c.png");
        REQUIRE(hits->front().distance == 0.0f);
        REQUIRE(hits->front().distance <= (*hits)[1].distance);

        auto text = lib->search_by_text("sunset over water", 10);
        REQUIRE(text.has_value());
        REQUIRE(text->size() == 4);
        REQUIRE(lib->search_by_text("", 10)->empty());
        REQUIRE(lib->search_by_text("beach", 0)->empty());
    }
}

TEST_CASE("demolish removes the index and the data folder", "[library][demolish]") {
    for (auto backend : {Backend::local, Backend::redis}) {
        LibraryFixture fx(backend == Backend::local ? "demolish_local" : "demolish_redis", backend);
        {
            auto lib = fx.open();
            REQUIRE(lib->initialize().has_value());
        }
        // A fresh handle has no open stores; demolish opens the vector store itself
        auto lib = fx.open();
        REQUIRE(lib->demolish().has_value());
        REQUIRE_FALSE(fs::exists(fx.root() / ".hoard"));
        REQUIRE(fs::exists(fx.root() / "a.png"));
        REQUIRE(fx.redis->hash_count(fx.uuid + ":") == 0);
        REQUIRE_FALSE(lib->lib_is_ready());
    }
}
