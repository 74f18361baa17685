/** \file image_library.cpp
 *  \brief Full/incremental scans with paired writes and rollback.
 */

#include "hoard/library/image_library.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>
#include <unordered_set>

#include "hoard/core/log.hpp"
#include "hoard/core/uuid.hpp"
#include "hoard/kernels/distance.hpp"
#include "hoard/library/paired_writer.hpp"

namespace hoard::library {

namespace {

constexpr const char* kMetaFile = "library.meta";
constexpr const char* kProfileFile = "scan_profile";
constexpr const char* kRecordsFile = "items.db";
constexpr const char* kVectorsFile = "vectors.idx";

// Matched against every path component
const std::unordered_set<std::string>& excluded_names() {
    static const std::unordered_set<std::string> names{
        kDataFolder, "$RECYCLE.BIN", "System Volume Information", "Thumbs.db", "desktop.ini",
        ".DS_Store", ".localized", "__pycache__", "node_modules",
    };
    return names;
}

std::string strip_leading_separators(std::string p) {
    const auto first = p.find_first_not_of("/\\");
    return first == std::string::npos ? std::string() : p.substr(first);
}

std::int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

auto invalid_embedding(const std::string& rel, const std::string& why) -> std::unexpected<core::error> {
    return core::fail(core::error_code::data_integrity, "Invalid embedding for " + rel + ": " + why, "library.scan");
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LibraryOptions
// ---------------------------------------------------------------------------

auto LibraryOptions::from_env(LibraryOptions base) -> std::expected<LibraryOptions, core::error> {
    auto vectors = vector::VectorStoreConfig::from_env(base.vectors);
    if (!vectors) return std::unexpected(vectors.error());
    base.vectors = std::move(*vectors);
    return base;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

ImageLibrary::ImageLibrary(std::filesystem::path root, LibraryOptions options)
    : root_(std::move(root)), data_dir_(root_ / kDataFolder), options_(std::move(options)),
      probe_(std::make_shared<model::MagicBytesProbe>()) {}

ImageLibrary::~ImageLibrary() = default;

auto ImageLibrary::open(const std::filesystem::path& root, std::string name, std::string uuid,
                        LibraryOptions options) -> std::expected<std::unique_ptr<ImageLibrary>, core::error> {
    if (uuid.empty() || name.empty()) {
        return core::fail(core::error_code::invalid_argument, "Invalid UUID or library name", "library.open");
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return core::fail(core::error_code::not_found, "library root is not a directory: " + root.string(),
                          "library.open");
    }

    std::unique_ptr<ImageLibrary> lib(new ImageLibrary(std::filesystem::absolute(root, ec), std::move(options)));
    std::filesystem::create_directories(lib->data_dir_, ec);
    if (ec) {
        return core::fail(core::error_code::io_failed,
                          "cannot create " + lib->data_dir_.string() + ": " + ec.message(), "library.open");
    }

    const auto meta_file = lib->data_dir_ / kMetaFile;
    auto meta = LibraryMetadata::load(meta_file);
    if (meta) {
        if (meta->uuid != uuid) {
            return core::fail(core::error_code::data_integrity,
                              "library at " + root.string() + " has uuid " + meta->uuid + ", not " + uuid,
                              "library.open");
        }
        lib->meta_ = std::move(*meta);
    } else if (meta.error().code == core::error_code::not_found) {
        lib->meta_ = LibraryMetadata{uuid, name, "image", ""};
        if (auto s = lib->meta_.save(meta_file); !s) return std::unexpected(s.error());
        core::log_info("library", "created library '" + name + "' at " + lib->root_.string());
    } else {
        return std::unexpected(meta.error());
    }

    auto profile = ScanProfile::load(lib->data_dir_ / kProfileFile);
    if (!profile) return std::unexpected(profile.error());
    lib->profile_ = std::move(*profile);

    lib->options_.vectors.local_file = lib->data_dir_ / kVectorsFile;
    lib->options_.vectors.namespace_id = lib->meta_.uuid;
    return lib;
}

void ImageLibrary::set_embedder(std::shared_ptr<model::Embedder> embedder) {
    std::lock_guard lock(state_mutex_);
    embedder_ = std::move(embedder);
}

void ImageLibrary::set_probe(std::shared_ptr<model::ContentProbe> probe) {
    std::lock_guard lock(state_mutex_);
    probe_ = std::move(probe);
}

bool ImageLibrary::lib_is_ready() const {
    std::lock_guard lock(state_mutex_);
    std::error_code ec;
    return records_ && vectors_ && embedder_ && std::filesystem::exists(data_dir_ / kMetaFile, ec);
}

auto ImageLibrary::open_stores() -> std::expected<void, core::error> {
    {
        std::lock_guard lock(state_mutex_);
        if (records_ && vectors_) return {};
    }
    auto records = metadata::MetadataStore::open(data_dir_ / kRecordsFile);
    if (!records) return std::unexpected(records.error());

    auto vectors = options_.vector_factory ? options_.vector_factory(options_.vectors)
                                           : vector::make_vector_store(options_.vectors);
    if (!vectors) return std::unexpected(vectors.error());

    std::lock_guard lock(state_mutex_);
    records_ = std::make_shared<metadata::MetadataStore>(std::move(*records));
    vectors_ = std::shared_ptr<vector::VectorStore>(std::move(*vectors));
    return {};
}

// ---------------------------------------------------------------------------
// Scanning
// ---------------------------------------------------------------------------

auto ImageLibrary::enumerate_files() const -> std::set<std::string> {
    namespace fs = std::filesystem;
    std::set<std::string> out;
    const auto& excluded = excluded_names();
    std::error_code ec;
    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        core::log_warn("scan", "cannot walk " + root_.string() + ": " + ec.message());
        return out;
    }
    const auto end = fs::recursive_directory_iterator();
    for (; it != end; it.increment(ec)) {
        if (ec) {
            core::log_warn("scan", "walk stopped: " + ec.message());
            break;
        }
        const auto name = it->path().filename().string();
        if (excluded.contains(name)) {
            if (it->is_directory(ec)) it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(ec)) continue;
        auto rel = it->path().lexically_relative(root_).generic_string();
        if (rel.find('\n') != std::string::npos) {
            core::log_warn("scan", "skipping file with a newline in its name");
            continue;
        }
        out.insert(std::move(rel));
    }
    return out;
}

auto ImageLibrary::initialize(bool force_reinit, core::ProgressCallback progress,
                              const core::CancelToken* cancel) -> std::expected<ScanReport, core::error> {
    auto guard = scan_lock_.acquire("initialization");
    if (!guard) return std::unexpected(guard.error());
    return initialize_locked(force_reinit, std::move(progress), cancel);
}

auto ImageLibrary::initialize_locked(bool force_reinit, core::ProgressCallback progress,
                                     const core::CancelToken* cancel) -> std::expected<ScanReport, core::error> {
    if (lib_is_ready() && !force_reinit) return ScanReport{};
    {
        std::lock_guard lock(state_mutex_);
        if (!embedder_) {
            return core::fail(core::error_code::not_initialized, "Embedder not set", "library.scan");
        }
    }
    if (auto s = open_stores(); !s) return std::unexpected(s.error());

    auto records = this->records();
    auto vectors = this->vectors();
    if (!force_reinit) {
        auto rows = records->row_count();
        if (!rows) return std::unexpected(rows.error());
        auto empty = vectors->db_is_empty();
        if (!empty) return std::unexpected(empty.error());
        if (*rows > 0 && !*empty) return ScanReport{};
    }

    // Everything stored before this scan, including rows no profile names,
    // is retired once the new items are committed
    std::set<std::string> retired;
    auto existing = records->select_all();
    if (!existing) return std::unexpected(existing.error());
    for (const auto& row : *existing) retired.insert(row.uuid);
    {
        std::lock_guard lock(state_mutex_);
        for (const auto& [path, uuid] : profile_.entries()) retired.insert(uuid);
    }

    const auto files = enumerate_files();
    core::log_info("scan", "Library scanned, found " + std::to_string(files.size()) + " files in " +
                               root_.string());
    ScanReport report;
    report.full_scan = true;
    if (auto r = run_scan(files, ScanProfile{}, retired, std::move(progress), cancel, report); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = mark_scanned(); !r) return std::unexpected(r.error());
    core::log_info("scan", "Image library initialized with " + std::to_string(report.added) + " items");
    return report;
}

auto ImageLibrary::incremental_initialize(core::ProgressCallback progress, const core::CancelToken* cancel)
    -> std::expected<ScanReport, core::error> {
    auto guard = scan_lock_.acquire("incremental initialization");
    if (!guard) return std::unexpected(guard.error());

    bool nothing_embedded = false;
    {
        std::lock_guard lock(state_mutex_);
        if (!embedder_) {
            return core::fail(core::error_code::not_initialized, "Embedder not set", "library.scan");
        }
        nothing_embedded = profile_.empty();
    }
    if (nothing_embedded) return initialize_locked(true, std::move(progress), cancel);
    if (auto s = open_stores(); !s) return std::unexpected(s.error());

    const auto current = enumerate_files();
    ScanProfile working;
    std::set<std::string> retired;
    std::set<std::string> to_embed;
    {
        std::lock_guard lock(state_mutex_);
        working = profile_;
        for (const auto& [path, uuid] : profile_.entries()) {
            if (current.contains(path)) continue;
            retired.insert(uuid);
            working.erase(path);
        }
        for (const auto& path : current) {
            if (!profile_.contains(path)) to_embed.insert(path);
        }
    }

    core::log_info("scan", "Incremental scan, found " + std::to_string(to_embed.size()) + " new files and " +
                               std::to_string(retired.size()) + " removed files in " + root_.string());

    ScanReport report;
    if (auto r = run_scan(to_embed, std::move(working), retired, std::move(progress), cancel, report); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = mark_scanned(); !r) return std::unexpected(r.error());
    return report;
}

auto ImageLibrary::run_scan(const std::set<std::string>& paths, ScanProfile working,
                            const std::set<std::string>& retired, core::ProgressCallback progress,
                            const core::CancelToken* cancel, ScanReport& report)
    -> std::expected<void, core::error> {
    std::shared_ptr<model::Embedder> embedder;
    std::shared_ptr<model::ContentProbe> probe;
    {
        std::lock_guard lock(state_mutex_);
        embedder = embedder_;
        probe = probe_;
    }
    auto records = this->records();
    auto vectors = this->vectors();

    std::unique_ptr<vector::BatchWriter> batch;
    if (auto w = vectors->get_batch_writer(options_.vectors.batch_size); w) {
        batch = std::move(*w);
    } else if (w.error().code != core::error_code::unsupported) {
        return std::unexpected(w.error());
    }

    auto was_empty = vectors->db_is_empty();
    if (!was_empty) return std::unexpected(was_empty.error());

    PairedWriter writer(*records, *vectors, working, batch.get());
    auto fail_scan = [&](core::error e) -> std::unexpected<core::error> {
        rollback_scan(writer, *was_empty);
        return std::unexpected(std::move(e));
    };

    core::ProgressThrottle throttle(std::move(progress), paths.size());
    std::size_t dimension = vectors->dimension();
    std::size_t index = 0;
    for (const auto& rel : paths) {
        if (core::is_cancelled(cancel)) {
            core::log_info("scan", "Library initialization cancelled");
            return fail_scan(core::error{core::error_code::cancelled, "Library initialization cancelled", "library.scan"});
        }
        throttle.update(index++);

        const auto file = root_ / rel;
        if (probe) {
            if (auto ok = probe->probe(file); !ok) {
                if (ok.error().code != core::error_code::item_invalid) return fail_scan(ok.error());
                core::log_info("scan", "Invalid image: " + rel + ", skip");
                ++report.skipped;
                continue;
            }
        }

        const auto started = std::chrono::steady_clock::now();
        auto embedding = embedder->embed_file(file);
        if (!embedding) {
            if (embedding.error().code != core::error_code::item_invalid) return fail_scan(embedding.error());
            core::log_info("scan", "Cannot embed " + rel + ", skip: " + embedding.error().message);
            ++report.skipped;
            continue;
        }
        if (embedding->empty()) return fail_scan(invalid_embedding(rel, "empty vector").error());
        if (!kernels::all_finite(*embedding)) return fail_scan(invalid_embedding(rel, "non-finite component").error());

        if (dimension == 0) {
            dimension = embedding->size();
            if (vectors->requires_index_before_add()) {
                core::log_debug("scan", "creating index, dimension " + std::to_string(dimension));
                if (auto r = vectors->initialize_index(dimension); !r) return fail_scan(r.error());
            }
        } else if (embedding->size() != dimension) {
            // Existing vectors stay until retirement, so a model change needs demolish() first
            return fail_scan(invalid_embedding(rel, "dimension " + std::to_string(embedding->size()) +
                                                    " differs from library dimension " +
                                                    std::to_string(dimension))
                             .error());
        }

        const std::filesystem::path rel_path(rel);
        metadata::ItemRecord row;
        row.timestamp = now_seconds();
        row.uuid = core::make_uuid();
        row.path = rel_path.parent_path().generic_string();
        row.filename = rel_path.filename().string();
        if (auto w = writer.write(rel, row, *embedding); !w) return fail_scan(w.error());
        ++report.added;

        if (core::log_debug_enabled()) {
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - started).count();
            core::log_debug("scan", "Image embedded: " + rel + ", dimension: " + std::to_string(dimension) +
                                        ", cost: " + std::to_string(ms) + "ms");
        }
    }

    if (auto r = writer.flush(); !r) return fail_scan(r.error());
    if (!vectors->requires_index_before_add() && dimension > 0) {
        if (auto r = vectors->initialize_index(dimension); !r) return fail_scan(r.error());
    }
    if (auto r = vectors->persist(); !r) return fail_scan(r.error());
    if (auto r = working.save(data_dir_ / kProfileFile); !r) return fail_scan(r.error());

    writer.commit();
    {
        std::lock_guard lock(state_mutex_);
        profile_ = std::move(working);
    }
    const auto dropped = retire(retired);
    if (!report.full_scan) report.removed = dropped;
    throttle.finish();
    return {};
}

auto ImageLibrary::retire(const std::set<std::string>& uuids) -> std::size_t {
    if (uuids.empty()) return 0;
    auto records = this->records();
    auto vectors = this->vectors();
    std::size_t retired = 0;
    for (const auto& uuid : uuids) {
        if (auto r = vectors->remove(uuid); !r && r.error().code != core::error_code::not_found) {
            core::log_warn("scan", "cannot drop vector " + uuid + ": " + r.error().message);
            continue;
        }
        if (auto r = records->delete_by_uuid(uuid); !r) {
            core::log_warn("scan", "cannot drop record " + uuid + ": " + r.error().message);
            continue;
        }
        ++retired;
    }
    if (auto r = vectors->persist(); !r) {
        core::log_warn("scan", "cannot persist vector store after retiring items: " + r.error().message);
    }
    return retired;
}

void ImageLibrary::rollback_scan(PairedWriter& writer, bool store_was_empty) {
    if (auto r = writer.rollback(); !r) {
        core::log_warn("scan", "rollback incomplete: " + r.error().message);
    }
    auto vectors = this->vectors();
    if (store_was_empty) {
        // Also forget the dimension pinned during this scan
        auto empty = vectors->db_is_empty();
        if (empty && *empty) {
            if (auto r = vectors->clean_all_data(); !r) {
                core::log_warn("scan", "cannot reset vector store: " + r.error().message);
            }
        }
    } else if (auto r = vectors->persist(); !r) {
        core::log_warn("scan", "cannot persist vector store after rollback: " + r.error().message);
    }
}

auto ImageLibrary::mark_scanned() -> std::expected<void, core::error> {
    std::lock_guard lock(state_mutex_);
    meta_.last_scanned = format_timestamp(std::chrono::system_clock::now());
    return meta_.save(data_dir_ / kMetaFile);
}

// ---------------------------------------------------------------------------
// Removal
// ---------------------------------------------------------------------------

auto ImageLibrary::remove_embeddings(const std::vector<std::string>& rel_paths)
    -> std::expected<std::size_t, core::error> {
    if (!lib_is_ready()) {
        return core::fail(core::error_code::not_initialized, "library is not initialized", "library.remove");
    }
    auto guard = scan_lock_.acquire("remove embeddings");
    if (!guard) return std::unexpected(guard.error());
    return remove_embeddings_impl(rel_paths);
}

auto ImageLibrary::remove_embeddings_impl(const std::vector<std::string>& rel_paths)
    -> std::expected<std::size_t, core::error> {
    if (rel_paths.empty()) return std::size_t{0};
    auto records = this->records();
    auto vectors = this->vectors();

    std::size_t removed = 0;
    std::lock_guard lock(state_mutex_);
    for (const auto& raw : rel_paths) {
        const auto rel = strip_leading_separators(raw);
        if (rel.empty()) continue;
        auto uuid = profile_.uuid_of(rel);
        if (!uuid) continue;
        if (auto r = vectors->remove(*uuid); !r) {
            if (r.error().code != core::error_code::not_found) return std::unexpected(r.error());
            core::log_warn("library", "vector of " + rel + " was already missing");
        }
        if (auto r = records->delete_by_uuid(*uuid); !r) return std::unexpected(r.error());
        profile_.erase(rel);
        ++removed;
    }
    if (auto r = vectors->persist(); !r) return std::unexpected(r.error());
    if (auto r = profile_.save(data_dir_ / kProfileFile); !r) return std::unexpected(r.error());
    return removed;
}

auto ImageLibrary::delete_files(const std::vector<std::string>& rel_paths)
    -> std::expected<std::size_t, core::error> {
    if (!lib_is_ready()) {
        return core::fail(core::error_code::not_initialized, "library is not initialized", "library.delete");
    }
    auto guard = scan_lock_.acquire("delete files");
    if (!guard) return std::unexpected(guard.error());
    std::vector<std::filesystem::path> targets;
    for (const auto& raw : rel_paths) {
        const auto rel = strip_leading_separators(raw);
        if (rel.empty()) continue;
        const auto normal = std::filesystem::path(rel).lexically_normal();
        if (normal.is_absolute() || normal.empty() || *normal.begin() == "..") {
            return core::fail(core::error_code::invalid_argument, "path escapes the library: " + raw,
                              "library.delete");
        }
        targets.push_back(root_ / normal);
    }
    for (const auto& target : targets) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(target, ec)) continue;
        std::filesystem::remove(target, ec);
        if (ec) {
            return core::fail(core::error_code::io_failed, "cannot delete " + target.string() + ": " + ec.message(),
                              "library.delete");
        }
    }
    return remove_embeddings_impl(rel_paths);
}

auto ImageLibrary::demolish() -> std::expected<void, core::error> {
    auto guard = scan_lock_.acquire("demolish");
    if (!guard) {
        return core::fail(core::error_code::lock_contention,
                          "There is already a scan task running, cancel the task and try again", "library.lock");
    }

    auto vectors = this->vectors();
    if (!vectors) {
        auto opened = options_.vector_factory ? options_.vector_factory(options_.vectors)
                                              : vector::make_vector_store(options_.vectors);
        if (!opened) return std::unexpected(opened.error());
        vectors = std::shared_ptr<vector::VectorStore>(std::move(*opened));
    }
    if (auto r = vectors->delete_store(); !r) return std::unexpected(r.error());

    {
        std::lock_guard lock(state_mutex_);
        embedder_.reset();
        records_.reset();
        vectors_.reset();
        profile_.clear();
    }
    std::error_code ec;
    std::filesystem::remove_all(data_dir_, ec);
    if (ec) {
        return core::fail(core::error_code::io_failed, "cannot remove " + data_dir_.string() + ": " + ec.message(),
                          "library.demolish");
    }
    core::log_info("library", "demolished library at " + root_.string());
    return {};
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

auto ImageLibrary::hydrate(const std::vector<vector::VectorHit>& hits) const
    -> std::expected<std::vector<SearchHit>, core::error> {
    auto records = this->records();
    std::vector<SearchHit> out;
    out.reserve(hits.size());
    for (const auto& h : hits) {
        auto row = records->select_by_uuid(h.key);
        if (!row) return std::unexpected(row.error());
        if (!*row) continue;
        out.push_back(SearchHit{std::move(**row), h.distance});
    }
    return out;
}

auto ImageLibrary::search_by_item(const std::filesystem::path& file, std::size_t top_k) const
    -> std::expected<std::vector<SearchHit>, core::error> {
    if (file.empty() || top_k == 0) return std::vector<SearchHit>{};
    if (!lib_is_ready()) {
        return core::fail(core::error_code::not_initialized, "library is not initialized", "library.search");
    }
    std::shared_ptr<model::Embedder> embedder;
    {
        std::lock_guard lock(state_mutex_);
        embedder = embedder_;
    }
    const auto started = std::chrono::steady_clock::now();
    auto embedding = embedder->embed_file(file);
    if (!embedding) return std::unexpected(embedding.error());
    auto hits = vectors()->query(*embedding, top_k);
    if (!hits) return std::unexpected(hits.error());
    core::log_debug("search", "image similarity search took " +
                                  std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                                                     std::chrono::steady_clock::now() - started).count()) +
                                  "ms");
    return hydrate(*hits);
}

auto ImageLibrary::search_by_text(std::string_view text, std::size_t top_k) const
    -> std::expected<std::vector<SearchHit>, core::error> {
    if (text.empty() || top_k == 0) return std::vector<SearchHit>{};
    if (!lib_is_ready()) {
        return core::fail(core::error_code::not_initialized, "library is not initialized", "library.search");
    }
    std::shared_ptr<model::Embedder> embedder;
    {
        std::lock_guard lock(state_mutex_);
        embedder = embedder_;
    }
    auto embedding = embedder->embed_text(text);
    if (!embedding) return std::unexpected(embedding.error());
    auto hits = vectors()->query(*embedding, top_k);
    if (!hits) return std::unexpected(hits.error());
    return hydrate(*hits);
}

auto ImageLibrary::item_count() const -> std::expected<std::size_t, core::error> {
    auto records = this->records();
    if (!records) {
        return core::fail(core::error_code::not_initialized, "library is not initialized", "library.count");
    }
    return records->row_count();
}

auto ImageLibrary::embedded_files() const -> ScanProfile::Map {
    std::lock_guard lock(state_mutex_);
    return profile_.entries();
}

auto ImageLibrary::scan_gap_days() const -> std::expected<std::int64_t, core::error> {
    std::string last;
    {
        std::lock_guard lock(state_mutex_);
        last = meta_.last_scanned;
    }
    if (last.empty()) {
        return core::fail(core::error_code::not_found, "library has never been scanned", "library.meta");
    }
    auto tp = parse_timestamp(last);
    if (!tp) {
        return core::fail(core::error_code::data_integrity, "malformed last_scanned '" + last + "'", "library.meta");
    }
    const auto gap = std::chrono::system_clock::now() - *tp;
    return std::chrono::duration_cast<std::chrono::hours>(gap).count() / 24;
}

auto ImageLibrary::metadata() const -> LibraryMetadata {
    std::lock_guard lock(state_mutex_);
    return meta_;
}

auto ImageLibrary::records() const -> std::shared_ptr<metadata::MetadataStore> {
    std::lock_guard lock(state_mutex_);
    return records_;
}

auto ImageLibrary::vectors() const -> std::shared_ptr<vector::VectorStore> {
    std::lock_guard lock(state_mutex_);
    return vectors_;
}

} // namespace hoard::library
