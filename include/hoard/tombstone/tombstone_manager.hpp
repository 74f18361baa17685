/** \file tombstone_manager.hpp
 *  \brief Removed-slot tracking for the in-process vector index.
 */

#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "hoard/error.hpp"
#include "roaring.hh"

namespace hoard::tombstone {

/**
 * \brief Configuration for tombstone management
 */
struct TombstoneConfig {
    std::size_t compaction_threshold{10000};  // Compact after this many deletions
    double compaction_ratio{0.2};             // Compact when 20% of slots are deleted
};

/**
 * \brief Marks slots of a dense vector array as deleted without moving data.
 *
 * Slots are compacted away by the owner (see LocalVectorStore::persist); the
 * manager only answers membership and decides when compaction pays off.
 */
class TombstoneManager {
public:
    explicit TombstoneManager(TombstoneConfig config = {});
    ~TombstoneManager();

    TombstoneManager(TombstoneManager&&) noexcept;
    TombstoneManager& operator=(TombstoneManager&&) noexcept;
    TombstoneManager(const TombstoneManager&) = delete;
    TombstoneManager& operator=(const TombstoneManager&) = delete;

    /** \brief Mark a slot as deleted; precondition_failed if already deleted. */
    auto mark_deleted(std::uint32_t slot) -> std::expected<void, core::error>;

    /** \brief Undo a deletion; not_found if the slot is live. */
    auto restore(std::uint32_t slot) -> std::expected<void, core::error>;

    [[nodiscard]] auto is_deleted(std::uint32_t slot) const -> bool;

    [[nodiscard]] auto deleted_count() const -> std::uint64_t;

    /** \brief Deleted slots in ascending order. */
    [[nodiscard]] auto deleted_slots() const -> std::vector<std::uint32_t>;

    auto clear() -> void;

    /** \brief True once deletions cross the absolute or relative threshold. */
    [[nodiscard]] auto needs_compaction(std::uint64_t total_slots) const -> bool;

    /** \brief Portable Roaring serialization of the deleted set. */
    [[nodiscard]] auto serialize() const -> std::string;

    /** \brief Replace the deleted set from serialize() output. */
    auto deserialize(const std::string& bytes) -> std::expected<void, core::error>;

private:
    TombstoneConfig config_;
    mutable std::shared_mutex mutex_;
    std::unique_ptr<roaring::Roaring> deleted_bitmap_;
};

} // namespace hoard::tombstone
