#pragma once

/** \file batch_writer.hpp
 *  \brief Staging buffer for pipelined vector writes.
 *
 * A BatchWriter collects (key, vector) pairs and hands them to its sink in
 * insertion order once `batch_size` are staged, or on an explicit flush().
 * discard() drops whatever is still staged; keys already flushed are reported
 * through flushed_keys() so a caller can undo them.
 */

#include <cstddef>
#include <expected>
#include <functional>
#include <string>
#include <vector>

#include "hoard/error.hpp"

namespace hoard::vector {

struct StagedVector {
    std::string key;
    std::vector<float> values;
};

/** \brief Receives one full batch; must apply it in order or fail as a whole. */
using FlushSink = std::function<std::expected<void, core::error>(const std::vector<StagedVector>&)>;

class BatchWriter {
public:
    BatchWriter(std::size_t batch_size, FlushSink sink);

    BatchWriter(const BatchWriter&) = delete;
    BatchWriter& operator=(const BatchWriter&) = delete;

    /** \brief Stage one write; flushes automatically when the batch is full. */
    auto stage(std::string key, std::vector<float> values) -> std::expected<void, core::error>;

    /** \brief Send everything staged; a no-op when nothing is staged. */
    auto flush() -> std::expected<void, core::error>;

    /** \brief Drop unflushed writes. */
    void discard() noexcept;

    [[nodiscard]] std::size_t staged_count() const noexcept { return staged_.size(); }
    [[nodiscard]] std::size_t batch_size() const noexcept { return batch_size_; }
    [[nodiscard]] const std::vector<std::string>& flushed_keys() const noexcept { return flushed_keys_; }

private:
    std::size_t batch_size_;
    FlushSink sink_;
    std::vector<StagedVector> staged_;
    std::vector<std::string> flushed_keys_;
};

} // namespace hoard::vector
