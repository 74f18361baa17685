#pragma once

/** \file metadata_store.hpp
 *  \brief Relational table of Item Records backed by SQLite.
 *
 * Schema (table "items"):
 *   id INTEGER PRIMARY KEY, timestamp INTEGER NOT NULL, uuid TEXT, path TEXT, filename TEXT
 * with a unique index on uuid. `path` is the parent folder relative to the
 * library root; the file is `<root>/<path>/<filename>`.
 *
 * Rows are never updated in place: a content change is a delete followed by an
 * insert with a fresh uuid. uuid is the only key shared with the vector store.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hoard/error.hpp"

namespace hoard::metadata {

/** \brief One indexed file. */
struct ItemRecord {
    std::int64_t id{0};           /**< auto-increment row id (ignored on insert) */
    std::int64_t timestamp{0};    /**< seconds since Unix epoch */
    std::string uuid;             /**< identity shared with the vector store */
    std::string path;             /**< parent folder relative to the library root */
    std::string filename;

    /** \brief Relative path of the file, generic separators. */
    [[nodiscard]] auto relative_path() const -> std::string {
        return path.empty() ? filename : path + "/" + filename;
    }
};

/** \brief SQLite-backed item table.
 *
 * Example usage:
 * ```cpp
 * auto store = MetadataStore::open(data_dir / "items.db");
 * auto id = store->insert_row({.timestamp = now, .uuid = u, .path = "trips", .filename = "a.jpg"});
 * auto rec = store->select_by_uuid(u);   // std::optional<ItemRecord>
 * ```
 *
 * Thread-safety: all methods are safe to call concurrently; writers are
 * serialized, readers share the connection.
 */
class MetadataStore {
public:
    /** \brief Open (creating if needed) the database file and its schema. */
    static auto open(const std::filesystem::path& db_file)
        -> std::expected<MetadataStore, core::error>;

    /** \brief Private in-memory database, mainly for tests. */
    static auto open_in_memory() -> std::expected<MetadataStore, core::error>;

    ~MetadataStore();
    MetadataStore(MetadataStore&&) noexcept;
    MetadataStore& operator=(MetadataStore&&) noexcept;
    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    /** \brief Insert a row; returns its id. A duplicate uuid is precondition_failed. */
    auto insert_row(const ItemRecord& row) -> std::expected<std::int64_t, core::error>;

    auto select_by_uuid(const std::string& uuid) const
        -> std::expected<std::optional<ItemRecord>, core::error>;

    auto select_by_path(const std::string& path) const
        -> std::expected<std::vector<ItemRecord>, core::error>;

    auto select_by_filename(const std::string& filename) const
        -> std::expected<std::vector<ItemRecord>, core::error>;

    auto select_by_path_and_filename(const std::string& path, const std::string& filename) const
        -> std::expected<std::optional<ItemRecord>, core::error>;

    /** \brief All rows in id order. */
    auto select_all() const -> std::expected<std::vector<ItemRecord>, core::error>;

    /** \brief Delete by uuid; true if a row was removed. */
    auto delete_by_uuid(const std::string& uuid) -> std::expected<bool, core::error>;

    auto row_count() const -> std::expected<std::size_t, core::error>;

    /** \brief Drop every row; the schema stays. */
    auto clean_all_data() -> std::expected<void, core::error>;

private:
    class Impl;
    explicit MetadataStore(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

} // namespace hoard::metadata
