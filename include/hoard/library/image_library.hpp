#pragma once

/** \file image_library.hpp
 *  \brief Scan engine of an image library: keeps records, vectors and the scan
 *         profile consistent across full and incremental scans.
 *
 * A library is a folder tree rooted at `root`. Its state lives in `root/.hoard`:
 * library.meta, scan_profile, items.db and (local backend) vectors.idx.
 *
 * Example usage:
 * ```cpp
 * auto lib = ImageLibrary::open("/photos", "Photos", core::make_uuid());
 * (*lib)->set_embedder(embedder);
 * core::CancelToken cancel;
 * auto report = (*lib)->initialize(false, [](int pct) { ... }, &cancel);
 * auto hits = (*lib)->search_by_text("sunset over water", 10);
 * ```
 *
 * Concurrency: scans, remove_embeddings(), delete_files() and demolish() share
 * one non-blocking scan lock; a second caller fails with lock_contention.
 * Queries are not gated by the lock and may observe a scan in progress.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "hoard/core/cancel_token.hpp"
#include "hoard/core/progress.hpp"
#include "hoard/core/scan_lock.hpp"
#include "hoard/error.hpp"
#include "hoard/library/library_metadata.hpp"
#include "hoard/library/scan_profile.hpp"
#include "hoard/metadata/metadata_store.hpp"
#include "hoard/model/content_probe.hpp"
#include "hoard/model/embedder.hpp"
#include "hoard/vector/vector_store.hpp"

namespace hoard::library {

class PairedWriter;

/** \brief Name of the data folder under the library root. */
inline constexpr const char* kDataFolder = ".hoard";

using VectorStoreFactory =
    std::function<std::expected<std::unique_ptr<vector::VectorStore>, core::error>(const vector::VectorStoreConfig&)>;

struct LibraryOptions {
    vector::VectorStoreConfig vectors;   /**< backend; local_file and namespace_id are filled by open() */
    VectorStoreFactory vector_factory;   /**< empty: vector::make_vector_store */

    /** \brief Apply HOARD_VECTOR_BACKEND / HOARD_REDIS_* / HOARD_BATCH_SIZE. */
    static auto from_env(LibraryOptions base = {}) -> std::expected<LibraryOptions, core::error>;
};

/** \brief Outcome of one scan. */
struct ScanReport {
    std::size_t added{0};      /**< items embedded and written */
    std::size_t removed{0};    /**< vanished items dropped (incremental) */
    std::size_t skipped{0};    /**< items rejected by the probe or the embedder */
    bool full_scan{false};
};

struct SearchHit {
    metadata::ItemRecord record;
    float distance{0.0f};
};

class ImageLibrary {
public:
    /** \brief Open or create the library at \p root.
     *
     * Empty \p name or \p uuid is invalid_argument. An existing library.meta
     * must carry the same uuid (data_integrity otherwise). No store is opened
     * until a scan runs.
     */
    static auto open(const std::filesystem::path& root, std::string name, std::string uuid,
                     LibraryOptions options = {})
        -> std::expected<std::unique_ptr<ImageLibrary>, core::error>;

    ~ImageLibrary();
    ImageLibrary(const ImageLibrary&) = delete;
    ImageLibrary& operator=(const ImageLibrary&) = delete;

    void set_embedder(std::shared_ptr<model::Embedder> embedder);

    /** \brief Replace the item validator (default MagicBytesProbe); null disables probing. */
    void set_probe(std::shared_ptr<model::ContentProbe> probe);

    /** \brief Metadata present, both stores open and an embedder set. */
    [[nodiscard]] bool lib_is_ready() const;

    /** \brief Full scan.
     *
     * Without \p force_reinit a ready library, or one whose stores already hold
     * data, is left untouched. Otherwise every file is embedded afresh and the
     * items stored before the scan are dropped once the new ones are committed.
     * On cancellation or failure every write of this scan is undone and the
     * library keeps its pre-scan items.
     */
    auto initialize(bool force_reinit = false, core::ProgressCallback progress = {},
                    const core::CancelToken* cancel = nullptr) -> std::expected<ScanReport, core::error>;

    /** \brief Embed files missing from the profile and drop vanished ones.
     *
     * Vanished items are dropped only after the new ones are committed, so a
     * cancelled scan leaves them in place. Falls back to a forced full scan
     * when nothing is embedded yet.
     */
    auto incremental_initialize(core::ProgressCallback progress = {}, const core::CancelToken* cancel = nullptr)
        -> std::expected<ScanReport, core::error>;

    /** \brief Drop records and vectors of the given relative paths; returns how many were embedded. */
    auto remove_embeddings(const std::vector<std::string>& rel_paths) -> std::expected<std::size_t, core::error>;

    /** \brief Delete the files from disk, then remove_embeddings(). Paths escaping the root are rejected. */
    auto delete_files(const std::vector<std::string>& rel_paths) -> std::expected<std::size_t, core::error>;

    /** \brief Drop the vector index and remove the data folder. */
    auto demolish() -> std::expected<void, core::error>;

    auto search_by_item(const std::filesystem::path& file, std::size_t top_k) const
        -> std::expected<std::vector<SearchHit>, core::error>;

    auto search_by_text(std::string_view text, std::size_t top_k) const
        -> std::expected<std::vector<SearchHit>, core::error>;

    auto item_count() const -> std::expected<std::size_t, core::error>;

    /** \brief Snapshot of the relative-path -> uuid map. */
    [[nodiscard]] auto embedded_files() const -> ScanProfile::Map;

    /** \brief Whole days since the last successful scan; not_found before the first. */
    auto scan_gap_days() const -> std::expected<std::int64_t, core::error>;

    [[nodiscard]] auto metadata() const -> LibraryMetadata;
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] const std::filesystem::path& data_dir() const noexcept { return data_dir_; }

    /** \brief Open stores for inspection (null until a scan opened them). */
    [[nodiscard]] auto records() const -> std::shared_ptr<metadata::MetadataStore>;
    [[nodiscard]] auto vectors() const -> std::shared_ptr<vector::VectorStore>;

private:
    ImageLibrary(std::filesystem::path root, LibraryOptions options);

    auto open_stores() -> std::expected<void, core::error>;
    auto enumerate_files() const -> std::set<std::string>;
    auto initialize_locked(bool force_reinit, core::ProgressCallback progress, const core::CancelToken* cancel)
        -> std::expected<ScanReport, core::error>;
    auto run_scan(const std::set<std::string>& paths, ScanProfile working, const std::set<std::string>& retired,
                  core::ProgressCallback progress, const core::CancelToken* cancel, ScanReport& report)
        -> std::expected<void, core::error>;
    auto retire(const std::set<std::string>& uuids) -> std::size_t;
    void rollback_scan(PairedWriter& writer, bool store_was_empty);
    auto remove_embeddings_impl(const std::vector<std::string>& rel_paths) -> std::expected<std::size_t, core::error>;
    auto mark_scanned() -> std::expected<void, core::error>;
    auto hydrate(const std::vector<vector::VectorHit>& hits) const
        -> std::expected<std::vector<SearchHit>, core::error>;

    std::filesystem::path root_;
    std::filesystem::path data_dir_;
    LibraryOptions options_;

    core::ScanLock scan_lock_;

    // Guards the members below; never held across embedding.
    mutable std::mutex state_mutex_;
    LibraryMetadata meta_;
    ScanProfile profile_;
    std::shared_ptr<model::Embedder> embedder_;
    std::shared_ptr<model::ContentProbe> probe_;
    std::shared_ptr<metadata::MetadataStore> records_;
    std::shared_ptr<vector::VectorStore> vectors_;
};

} // namespace hoard::library
