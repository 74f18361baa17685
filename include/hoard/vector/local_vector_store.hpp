#pragma once

/** \file local_vector_store.hpp
 *  \brief Exact in-process vector store persisted to a single file.
 *
 * Vectors live in one dense slot array. remove() tombstones the slot in a
 * Roaring bitmap; persist() compacts the array once the tombstone manager says
 * it pays off, otherwise it writes the bitmap next to the data.
 *
 * File layout (host endian):
 *   "HRDFLAT1" | u64 dim | u64 slots | slots x string key | f32[slots*dim] | string tombstones
 */

#include <atomic>
#include <filesystem>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "hoard/tombstone/tombstone_manager.hpp"
#include "hoard/vector/vector_store.hpp"

namespace hoard::vector {

class LocalVectorStore final : public VectorStore {
public:
    /** \brief Open the store at \p file, loading it when the file exists. */
    static auto open(std::filesystem::path file, tombstone::TombstoneConfig tombstones = {})
        -> std::expected<std::unique_ptr<LocalVectorStore>, core::error>;

    auto initialize_index(std::size_t dimension) -> std::expected<void, core::error> override;
    auto add(const std::string& key, std::span<const float> vec, BatchWriter* writer = nullptr)
        -> std::expected<void, core::error> override;
    auto remove(const std::string& key) -> std::expected<void, core::error> override;
    auto query(std::span<const float> vec, std::size_t top_k) const
        -> std::expected<std::vector<VectorHit>, core::error> override;
    auto persist() -> std::expected<void, core::error> override;
    auto clean_all_data() -> std::expected<void, core::error> override;
    auto delete_store() -> std::expected<void, core::error> override;
    auto db_is_empty() const -> std::expected<bool, core::error> override;
    auto size() const -> std::expected<std::size_t, core::error> override;
    [[nodiscard]] auto dimension() const noexcept -> std::size_t override;
    [[nodiscard]] auto requires_index_before_add() const noexcept -> bool override { return true; }
    auto get_batch_writer(std::size_t batch_size)
        -> std::expected<std::unique_ptr<BatchWriter>, core::error> override;

    /** \brief Slots occupied including tombstoned ones (compaction diagnostics). */
    [[nodiscard]] auto slot_count() const -> std::size_t;

private:
    LocalVectorStore(std::filesystem::path file, tombstone::TombstoneConfig tombstones);

    auto load() -> std::expected<void, core::error>;
    void compact_locked();

    std::filesystem::path file_;
    mutable std::shared_mutex mutex_;
    std::atomic<std::size_t> dim_{0};
    bool index_created_{false};
    std::vector<float> data_;
    std::vector<std::string> slot_keys_;
    std::unordered_map<std::string, std::uint32_t> slots_;
    tombstone::TombstoneManager tombstones_;
};

} // namespace hoard::vector
