#include "hoard/tombstone/tombstone_manager.hpp"

#include <mutex>
#include <stdexcept>
#include <string>

namespace hoard::tombstone {

namespace {
constexpr const char* kComponent = "tombstone";
}

TombstoneManager::TombstoneManager(TombstoneConfig config)
    : config_(config)
    , deleted_bitmap_(std::make_unique<roaring::Roaring>()) {}

TombstoneManager::~TombstoneManager() = default;

TombstoneManager::TombstoneManager(TombstoneManager&& other) noexcept
    : config_(other.config_)
    , deleted_bitmap_(std::move(other.deleted_bitmap_)) {
    other.deleted_bitmap_ = std::make_unique<roaring::Roaring>();
}

TombstoneManager& TombstoneManager::operator=(TombstoneManager&& other) noexcept {
    if (this != &other) {
        std::unique_lock lock(mutex_);
        config_ = other.config_;
        deleted_bitmap_ = std::move(other.deleted_bitmap_);
        other.deleted_bitmap_ = std::make_unique<roaring::Roaring>();
    }
    return *this;
}

auto TombstoneManager::mark_deleted(std::uint32_t slot)
    -> std::expected<void, core::error> {
    std::unique_lock lock(mutex_);

    if (deleted_bitmap_->contains(slot)) {
        return core::fail(core::error_code::precondition_failed,
                          "slot " + std::to_string(slot) + " is already removed", kComponent);
    }

    deleted_bitmap_->add(slot);
    // Long removal streaks form runs; re-encode every 1024 removals
    if ((deleted_bitmap_->cardinality() & 1023u) == 0) deleted_bitmap_->runOptimize();
    return {};
}

auto TombstoneManager::restore(std::uint32_t slot)
    -> std::expected<void, core::error> {
    std::unique_lock lock(mutex_);

    if (!deleted_bitmap_->contains(slot)) {
        return core::fail(core::error_code::not_found, "slot " + std::to_string(slot) + " is live", kComponent);
    }
    deleted_bitmap_->remove(slot);
    return {};
}

auto TombstoneManager::is_deleted(std::uint32_t slot) const -> bool {
    std::shared_lock lock(mutex_);
    return deleted_bitmap_->contains(slot);
}

auto TombstoneManager::deleted_count() const -> std::uint64_t {
    std::shared_lock lock(mutex_);
    return deleted_bitmap_->cardinality();
}

auto TombstoneManager::deleted_slots() const -> std::vector<std::uint32_t> {
    std::shared_lock lock(mutex_);

    std::vector<std::uint32_t> slots(deleted_bitmap_->cardinality());
    deleted_bitmap_->toUint32Array(slots.data());
    return slots;
}

auto TombstoneManager::clear() -> void {
    std::unique_lock lock(mutex_);
    deleted_bitmap_ = std::make_unique<roaring::Roaring>();
}

auto TombstoneManager::needs_compaction(std::uint64_t total_slots) const -> bool {
    if (total_slots == 0) return false;

    std::shared_lock lock(mutex_);
    const auto removed = deleted_bitmap_->cardinality();
    return removed >= config_.compaction_threshold ||
           static_cast<double>(removed) >= config_.compaction_ratio * static_cast<double>(total_slots);
}

auto TombstoneManager::serialize() const -> std::string {
    std::shared_lock lock(mutex_);
    std::string out(deleted_bitmap_->getSizeInBytes(/*portable=*/true), '\0');
    deleted_bitmap_->write(out.data(), /*portable=*/true);
    return out;
}

auto TombstoneManager::deserialize(const std::string& bytes)
    -> std::expected<void, core::error> {
    std::unique_lock lock(mutex_);
    if (bytes.empty()) {
        deleted_bitmap_ = std::make_unique<roaring::Roaring>();
        return {};
    }
    try {
        deleted_bitmap_ = std::make_unique<roaring::Roaring>(
            roaring::Roaring::readSafe(bytes.data(), bytes.size()));
    } catch (const std::exception& e) {
        // readSafe throws on truncated or malformed input
        return core::fail(core::error_code::data_integrity, std::string("corrupt tombstone bitmap: ") + e.what(),
                          kComponent);
    }
    return {};
}

} // namespace hoard::tombstone
