/** \file metadata_store.cpp
 *  \brief SQLite implementation of the item table
 */

#include "hoard/metadata/metadata_store.hpp"

#include <mutex>
#include <shared_mutex>
#include <utility>

#include <sqlite3.h>

#include "hoard/core/log.hpp"

namespace hoard::metadata {

namespace {

constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS items ("
    "id INTEGER PRIMARY KEY, "
    "timestamp INTEGER NOT NULL, "
    "uuid TEXT, "
    "path TEXT, "
    "filename TEXT);"
    "CREATE UNIQUE INDEX IF NOT EXISTS items_uuid ON items(uuid);"
    "CREATE INDEX IF NOT EXISTS items_path ON items(path, filename);";

constexpr const char* kSelectColumns = "SELECT id, timestamp, uuid, path, filename FROM items ";

// Finalizes on every exit path
class Statement {
public:
    Statement() = default;
    ~Statement() { if (stmt_) sqlite3_finalize(stmt_); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt** out() { return &stmt_; }
    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_{nullptr};
};

inline std::string column_text(sqlite3_stmt* s, int col) {
    const auto* p = sqlite3_column_text(s, col);
    return p ? std::string(reinterpret_cast<const char*>(p)) : std::string();
}

inline ItemRecord read_row(sqlite3_stmt* s) {
    ItemRecord r;
    r.id = sqlite3_column_int64(s, 0);
    r.timestamp = sqlite3_column_int64(s, 1);
    r.uuid = column_text(s, 2);
    r.path = column_text(s, 3);
    r.filename = column_text(s, 4);
    return r;
}

inline void bind_text(sqlite3_stmt* s, int idx, const std::string& v) {
    sqlite3_bind_text(s, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

} // anonymous namespace

class MetadataStore::Impl {
public:
    explicit Impl(sqlite3* db) : db_(db) {}
    ~Impl() { if (db_) sqlite3_close(db_); }

    auto sql_error(const char* op, int rc) const -> std::unexpected<core::error> {
        const auto code = (rc == SQLITE_CONSTRAINT) ? core::error_code::precondition_failed
                                                    : core::error_code::io_failed;
        return core::fail(code, std::string(op) + ": " + sqlite3_errmsg(db_), "metadata.sqlite");
    }

    auto prepare(const std::string& sql, Statement& st, const char* op) const
        -> std::expected<void, core::error> {
        const int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, st.out(), nullptr);
        if (rc != SQLITE_OK) return sql_error(op, rc);
        return {};
    }

    auto exec(const char* sql, const char* op) -> std::expected<void, core::error> {
        char* msg = nullptr;
        const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &msg);
        if (rc != SQLITE_OK) {
            std::string text = msg ? msg : sqlite3_errmsg(db_);
            sqlite3_free(msg);
            return core::fail(core::error_code::io_failed, std::string(op) + ": " + text, "metadata.sqlite");
        }
        return {};
    }

    auto insert_row(const ItemRecord& row) -> std::expected<std::int64_t, core::error> {
        std::unique_lock lock(mutex_);
        Statement st;
        if (auto p = prepare("INSERT INTO items (timestamp, uuid, path, filename) VALUES (?, ?, ?, ?);",
                             st, "insert_row"); !p) {
            return std::unexpected(p.error());
        }
        sqlite3_bind_int64(st.get(), 1, row.timestamp);
        bind_text(st.get(), 2, row.uuid);
        bind_text(st.get(), 3, row.path);
        bind_text(st.get(), 4, row.filename);
        const int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) return sql_error("insert_row", rc);
        return sqlite3_last_insert_rowid(db_);
    }

    auto select_many(const std::string& where, const std::vector<std::string>& args, const char* op) const
        -> std::expected<std::vector<ItemRecord>, core::error> {
        std::shared_lock lock(mutex_);
        Statement st;
        if (auto p = prepare(std::string(kSelectColumns) + where, st, op); !p) {
            return std::unexpected(p.error());
        }
        for (std::size_t i = 0; i < args.size(); ++i) {
            bind_text(st.get(), static_cast<int>(i + 1), args[i]);
        }
        std::vector<ItemRecord> out;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
            out.push_back(read_row(st.get()));
        }
        if (rc != SQLITE_DONE) return sql_error(op, rc);
        return out;
    }

    auto delete_by_uuid(const std::string& uuid) -> std::expected<bool, core::error> {
        std::unique_lock lock(mutex_);
        Statement st;
        if (auto p = prepare("DELETE FROM items WHERE uuid = ?;", st, "delete_by_uuid"); !p) {
            return std::unexpected(p.error());
        }
        bind_text(st.get(), 1, uuid);
        const int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) return sql_error("delete_by_uuid", rc);
        return sqlite3_changes(db_) > 0;
    }

    auto row_count() const -> std::expected<std::size_t, core::error> {
        std::shared_lock lock(mutex_);
        Statement st;
        if (auto p = prepare("SELECT COUNT(*) FROM items;", st, "row_count"); !p) {
            return std::unexpected(p.error());
        }
        const int rc = sqlite3_step(st.get());
        if (rc != SQLITE_ROW) return sql_error("row_count", rc);
        return static_cast<std::size_t>(sqlite3_column_int64(st.get(), 0));
    }

    auto clean_all_data() -> std::expected<void, core::error> {
        std::unique_lock lock(mutex_);
        return exec("DELETE FROM items;", "clean_all_data");
    }

private:
    sqlite3* db_;
    mutable std::shared_mutex mutex_;
};

namespace {

auto open_db(const std::string& target, int extra_flags)
    -> std::expected<sqlite3*, core::error> {
    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | extra_flags;
    const int rc = sqlite3_open_v2(target.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        return core::fail(core::error_code::io_failed, "cannot open " + target + ": " + msg, "metadata.open");
    }
    sqlite3_busy_timeout(db, 5000);
    return db;
}

} // anonymous namespace

MetadataStore::MetadataStore(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
MetadataStore::~MetadataStore() = default;
MetadataStore::MetadataStore(MetadataStore&&) noexcept = default;
MetadataStore& MetadataStore::operator=(MetadataStore&&) noexcept = default;

auto MetadataStore::open(const std::filesystem::path& db_file)
    -> std::expected<MetadataStore, core::error> {
    auto db = open_db(db_file.string(), 0);
    if (!db) return std::unexpected(db.error());
    auto impl = std::make_unique<Impl>(*db);
    if (auto s = impl->exec("PRAGMA journal_mode = WAL;", "pragma"); !s) {
        core::log_warn("metadata", "WAL journal unavailable, using default: " + s.error().message);
    }
    if (auto s = impl->exec(kSchema, "schema"); !s) return std::unexpected(s.error());
    return MetadataStore(std::move(impl));
}

auto MetadataStore::open_in_memory() -> std::expected<MetadataStore, core::error> {
    auto db = open_db(":memory:", 0);
    if (!db) return std::unexpected(db.error());
    auto impl = std::make_unique<Impl>(*db);
    if (auto s = impl->exec(kSchema, "schema"); !s) return std::unexpected(s.error());
    return MetadataStore(std::move(impl));
}

auto MetadataStore::insert_row(const ItemRecord& row) -> std::expected<std::int64_t, core::error> {
    if (row.uuid.empty()) {
        return core::fail(core::error_code::invalid_argument, "uuid must not be empty", "metadata.insert_row");
    }
    return impl_->insert_row(row);
}

auto MetadataStore::select_by_uuid(const std::string& uuid) const
    -> std::expected<std::optional<ItemRecord>, core::error> {
    auto rows = impl_->select_many("WHERE uuid = ?;", {uuid}, "select_by_uuid");
    if (!rows) return std::unexpected(rows.error());
    if (rows->empty()) return std::optional<ItemRecord>{};
    return std::optional<ItemRecord>(std::move(rows->front()));
}

auto MetadataStore::select_by_path(const std::string& path) const
    -> std::expected<std::vector<ItemRecord>, core::error> {
    return impl_->select_many("WHERE path = ? ORDER BY id;", {path}, "select_by_path");
}

auto MetadataStore::select_by_filename(const std::string& filename) const
    -> std::expected<std::vector<ItemRecord>, core::error> {
    return impl_->select_many("WHERE filename = ? ORDER BY id;", {filename}, "select_by_filename");
}

auto MetadataStore::select_by_path_and_filename(const std::string& path, const std::string& filename) const
    -> std::expected<std::optional<ItemRecord>, core::error> {
    auto rows = impl_->select_many("WHERE path = ? AND filename = ? ORDER BY id;", {path, filename},
                                   "select_by_path_and_filename");
    if (!rows) return std::unexpected(rows.error());
    if (rows->empty()) return std::optional<ItemRecord>{};
    return std::optional<ItemRecord>(std::move(rows->front()));
}

auto MetadataStore::select_all() const -> std::expected<std::vector<ItemRecord>, core::error> {
    return impl_->select_many("ORDER BY id;", {}, "select_all");
}

auto MetadataStore::delete_by_uuid(const std::string& uuid) -> std::expected<bool, core::error> {
    return impl_->delete_by_uuid(uuid);
}

auto MetadataStore::row_count() const -> std::expected<std::size_t, core::error> {
    return impl_->row_count();
}

auto MetadataStore::clean_all_data() -> std::expected<void, core::error> {
    return impl_->clean_all_data();
}

} // namespace hoard::metadata
