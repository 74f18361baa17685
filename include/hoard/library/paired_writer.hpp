#pragma once

/** \file paired_writer.hpp
 *  \brief One logical write of an Item Record, its vector and its profile entry.
 *
 * Every successful write() is journaled. rollback() is the only undo path:
 * it drops anything still staged in the batch writer, then removes journaled
 * vectors, records and profile entries newest first. A vector that never left
 * the batch is reported not_found by the store, which rollback tolerates.
 */

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "hoard/error.hpp"
#include "hoard/library/scan_profile.hpp"
#include "hoard/metadata/metadata_store.hpp"
#include "hoard/vector/vector_store.hpp"

namespace hoard::library {

class PairedWriter {
public:
    struct JournalEntry {
        std::string rel_path;
        std::string uuid;
    };

    /** \param batch optional writer; vectors are staged through it when given */
    PairedWriter(metadata::MetadataStore& records, vector::VectorStore& vectors, ScanProfile& profile,
                 vector::BatchWriter* batch = nullptr);

    PairedWriter(const PairedWriter&) = delete;
    PairedWriter& operator=(const PairedWriter&) = delete;

    /** \brief Insert the record, then the vector, then the profile entry.
     *
     * If the vector is rejected the record is deleted again before returning,
     * so a failed write leaves nothing behind.
     */
    auto write(const std::string& rel_path, const metadata::ItemRecord& row, std::span<const float> vec)
        -> std::expected<void, core::error>;

    /** \brief Flush the batch writer, if any. */
    auto flush() -> std::expected<void, core::error>;

    /** \brief Undo every journaled write. Continues past failures and reports the first. */
    auto rollback() -> std::expected<void, core::error>;

    /** \brief Forget the journal; the writes become permanent. */
    void commit() noexcept { journal_.clear(); }

    [[nodiscard]] std::size_t written() const noexcept { return journal_.size(); }
    [[nodiscard]] const std::vector<JournalEntry>& journal() const noexcept { return journal_; }

private:
    metadata::MetadataStore& records_;
    vector::VectorStore& vectors_;
    ScanProfile& profile_;
    vector::BatchWriter* batch_;
    std::vector<JournalEntry> journal_;
};

} // namespace hoard::library
