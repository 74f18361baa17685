#include "hoard/vector/local_vector_store.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <limits>
#include <mutex>
#include <sstream>
#include <system_error>

#include "hoard/core/atomic_file.hpp"
#include "hoard/core/binary_io.hpp"
#include "hoard/core/log.hpp"
#include "hoard/kernels/distance.hpp"

namespace hoard::vector {

namespace {

constexpr char kMagic[8] = {'H', 'R', 'D', 'F', 'L', 'A', 'T', '1'};
constexpr const char* kComponent = "vector.local";

} // anonymous namespace

LocalVectorStore::LocalVectorStore(std::filesystem::path file, tombstone::TombstoneConfig tombstones)
    : file_(std::move(file)), tombstones_(tombstones) {}

auto LocalVectorStore::open(std::filesystem::path file, tombstone::TombstoneConfig tombstones)
    -> std::expected<std::unique_ptr<LocalVectorStore>, core::error> {
    std::unique_ptr<LocalVectorStore> store(new LocalVectorStore(std::move(file), tombstones));
    std::error_code ec;
    if (std::filesystem::exists(store->file_, ec)) {
        if (auto r = store->load(); !r) return std::unexpected(r.error());
    }
    return store;
}

auto LocalVectorStore::load() -> std::expected<void, core::error> {
    auto bytes = core::read_file(file_);
    if (!bytes) return std::unexpected(bytes.error());
    std::istringstream in(*bytes, std::ios::binary);

    char magic[8]{};
    if (!in.read(magic, sizeof(magic)) || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
        return core::fail(core::error_code::data_integrity, "bad magic in " + file_.string(), kComponent);
    }
    std::uint64_t dim = 0, slots = 0;
    if (!core::bin::read_pod(in, dim) || !core::bin::read_pod(in, slots) ||
        slots > std::numeric_limits<std::uint32_t>::max()) {
        return core::fail(core::error_code::data_integrity, "truncated header in " + file_.string(), kComponent);
    }
    std::vector<std::string> keys(static_cast<std::size_t>(slots));
    for (auto& k : keys) {
        if (!core::bin::read_string(in, k, 4096)) {
            return core::fail(core::error_code::data_integrity, "truncated key table", kComponent);
        }
    }
    std::vector<float> data;
    if (!core::bin::read_vector(in, data) || data.size() != slots * dim) {
        return core::fail(core::error_code::data_integrity, "vector block size mismatch", kComponent);
    }
    std::string tomb_bytes;
    if (!core::bin::read_string(in, tomb_bytes)) {
        return core::fail(core::error_code::data_integrity, "missing tombstone block", kComponent);
    }
    if (auto r = tombstones_.deserialize(tomb_bytes); !r) return std::unexpected(r.error());

    std::unordered_map<std::string, std::uint32_t> map;
    for (std::uint32_t s = 0; s < keys.size(); ++s) {
        if (tombstones_.is_deleted(s)) continue;
        if (!map.emplace(keys[s], s).second) {
            return core::fail(core::error_code::data_integrity, "duplicate key " + keys[s], kComponent);
        }
    }

    dim_ = static_cast<std::size_t>(dim);
    index_created_ = dim_ > 0;
    data_ = std::move(data);
    slot_keys_ = std::move(keys);
    slots_ = std::move(map);
    core::log_debug("vector", "loaded " + std::to_string(slots_.size()) + " vectors of dim " +
                                  std::to_string(dim_.load()) + " from " + file_.string());
    return {};
}

auto LocalVectorStore::initialize_index(std::size_t dimension) -> std::expected<void, core::error> {
    if (dimension == 0) {
        return core::fail(core::error_code::invalid_argument, "dimension must be positive", kComponent);
    }
    std::unique_lock lock(mutex_);
    if (index_created_) {
        if (dim_ != dimension) {
            return core::fail(core::error_code::data_integrity,
                              "index already created with dimension " + std::to_string(dim_.load()), kComponent);
        }
        return {};
    }
    dim_ = dimension;
    index_created_ = true;
    return {};
}

auto LocalVectorStore::add(const std::string& key, std::span<const float> vec, BatchWriter* writer)
    -> std::expected<void, core::error> {
    if (writer != nullptr) {
        return core::fail(core::error_code::unsupported, "local store does not batch writes", kComponent);
    }
    std::unique_lock lock(mutex_);
    if (!index_created_) {
        return core::fail(core::error_code::not_initialized, "add before initialize_index", kComponent);
    }
    if (vec.size() != dim_) {
        return core::fail(core::error_code::data_integrity,
                          "dimension mismatch: expected " + std::to_string(dim_.load()) + ", got " +
                              std::to_string(vec.size()),
                          kComponent);
    }
    if (!kernels::all_finite(vec)) {
        return core::fail(core::error_code::data_integrity, "non-finite vector for " + key, kComponent);
    }
    if (slots_.contains(key)) {
        return core::fail(core::error_code::precondition_failed, "duplicate key " + key, kComponent);
    }
    if (slot_keys_.size() >= std::numeric_limits<std::uint32_t>::max()) {
        return core::fail(core::error_code::unavailable, "slot space exhausted", kComponent);
    }
    const auto slot = static_cast<std::uint32_t>(slot_keys_.size());
    data_.insert(data_.end(), vec.begin(), vec.end());
    slot_keys_.push_back(key);
    slots_.emplace(key, slot);
    return {};
}

auto LocalVectorStore::remove(const std::string& key) -> std::expected<void, core::error> {
    std::unique_lock lock(mutex_);
    auto it = slots_.find(key);
    if (it == slots_.end()) {
        return core::fail(core::error_code::not_found, "no vector for " + key, kComponent);
    }
    if (auto r = tombstones_.mark_deleted(it->second); !r) return std::unexpected(r.error());
    slots_.erase(it);
    return {};
}

auto LocalVectorStore::query(std::span<const float> vec, std::size_t top_k) const
    -> std::expected<std::vector<VectorHit>, core::error> {
    std::shared_lock lock(mutex_);
    std::vector<VectorHit> hits;
    if (top_k == 0 || slots_.empty()) return hits;
    if (vec.size() != dim_) {
        return core::fail(core::error_code::data_integrity,
                          "query dimension " + std::to_string(vec.size()) + " != " + std::to_string(dim_.load()),
                          kComponent);
    }
    const std::size_t dim = dim_;
    hits.reserve(slots_.size());
    for (const auto& [key, slot] : slots_) {
        std::span<const float> row(data_.data() + static_cast<std::size_t>(slot) * dim, dim);
        hits.push_back(VectorHit{key, kernels::l2_sq(vec, row)});
    }
    order_hits(hits, top_k);
    return hits;
}

void LocalVectorStore::compact_locked() {
    const std::size_t dim = dim_;
    std::vector<float> data;
    std::vector<std::string> keys;
    data.reserve(slots_.size() * dim);
    keys.reserve(slots_.size());
    std::unordered_map<std::string, std::uint32_t> map;
    map.reserve(slots_.size());
    for (std::uint32_t s = 0; s < slot_keys_.size(); ++s) {
        if (tombstones_.is_deleted(s)) continue;
        const auto* row = data_.data() + static_cast<std::size_t>(s) * dim;
        data.insert(data.end(), row, row + dim);
        map.emplace(slot_keys_[s], static_cast<std::uint32_t>(keys.size()));
        keys.push_back(std::move(slot_keys_[s]));
    }
    core::log_debug("vector", "compacted " + std::to_string(slot_keys_.size()) + " -> " +
                                  std::to_string(keys.size()) + " slots");
    data_ = std::move(data);
    slot_keys_ = std::move(keys);
    slots_ = std::move(map);
    tombstones_.clear();
}

auto LocalVectorStore::persist() -> std::expected<void, core::error> {
    std::unique_lock lock(mutex_);
    if (tombstones_.deleted_count() > 0 && tombstones_.needs_compaction(slot_keys_.size())) {
        compact_locked();
    }
    std::ostringstream out(std::ios::binary);
    out.write(kMagic, sizeof(kMagic));
    core::bin::write_pod(out, static_cast<std::uint64_t>(dim_.load()));
    core::bin::write_pod(out, static_cast<std::uint64_t>(slot_keys_.size()));
    for (const auto& k : slot_keys_) core::bin::write_string(out, k);
    core::bin::write_vector(out, data_);
    core::bin::write_string(out, tombstones_.serialize());
    return core::write_file_atomic(file_, out.str());
}

auto LocalVectorStore::clean_all_data() -> std::expected<void, core::error> {
    std::unique_lock lock(mutex_);
    data_.clear();
    slot_keys_.clear();
    slots_.clear();
    tombstones_.clear();
    dim_ = 0;
    index_created_ = false;
    std::error_code ec;
    std::filesystem::remove(file_, ec);
    if (ec) {
        return core::fail(core::error_code::io_failed, "cannot remove " + file_.string() + ": " + ec.message(),
                          kComponent);
    }
    return {};
}

auto LocalVectorStore::delete_store() -> std::expected<void, core::error> {
    return clean_all_data();
}

auto LocalVectorStore::db_is_empty() const -> std::expected<bool, core::error> {
    std::shared_lock lock(mutex_);
    return slots_.empty();
}

auto LocalVectorStore::size() const -> std::expected<std::size_t, core::error> {
    std::shared_lock lock(mutex_);
    return slots_.size();
}

auto LocalVectorStore::dimension() const noexcept -> std::size_t {
    return dim_.load(std::memory_order_acquire);
}

auto LocalVectorStore::get_batch_writer(std::size_t)
    -> std::expected<std::unique_ptr<BatchWriter>, core::error> {
    return core::fail(core::error_code::unsupported, "local store writes per item", kComponent);
}

auto LocalVectorStore::slot_count() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return slot_keys_.size();
}

} // namespace hoard::vector
