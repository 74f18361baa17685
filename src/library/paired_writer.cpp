#include "hoard/library/paired_writer.hpp"

#include <optional>

#include "hoard/core/log.hpp"

namespace hoard::library {

PairedWriter::PairedWriter(metadata::MetadataStore& records, vector::VectorStore& vectors,
                           ScanProfile& profile, vector::BatchWriter* batch)
    : records_(records), vectors_(vectors), profile_(profile), batch_(batch) {}

auto PairedWriter::write(const std::string& rel_path, const metadata::ItemRecord& row,
                         std::span<const float> vec) -> std::expected<void, core::error> {
    auto id = records_.insert_row(row);
    if (!id) return std::unexpected(id.error());

    if (auto added = vectors_.add(row.uuid, vec, batch_); !added) {
        if (auto undo = records_.delete_by_uuid(row.uuid); !undo) {
            core::log_warn("paired", "could not remove orphan record " + row.uuid + ": " + undo.error().message);
        }
        return std::unexpected(added.error());
    }
    profile_.set(rel_path, row.uuid);
    journal_.push_back(JournalEntry{rel_path, row.uuid});
    return {};
}

auto PairedWriter::flush() -> std::expected<void, core::error> {
    if (batch_ == nullptr) return {};
    return batch_->flush();
}

auto PairedWriter::rollback() -> std::expected<void, core::error> {
    if (batch_ != nullptr) {
        if (batch_->staged_count() > 0) {
            core::log_debug("paired", "discarding " + std::to_string(batch_->staged_count()) + " staged vectors");
        }
        batch_->discard();
    }
    std::optional<core::error> first;
    for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
        if (auto r = vectors_.remove(it->uuid); !r && r.error().code != core::error_code::not_found) {
            if (!first) first = r.error();
        }
        if (auto r = records_.delete_by_uuid(it->uuid); !r) {
            if (!first) first = r.error();
        }
        profile_.erase(it->rel_path);
    }
    core::log_info("paired", "rolled back " + std::to_string(journal_.size()) + " writes");
    journal_.clear();
    if (first) return std::unexpected(*first);
    return {};
}

} // namespace hoard::library
