#include "hoard/vector/batch_writer.hpp"

#include <utility>

namespace hoard::vector {

BatchWriter::BatchWriter(std::size_t batch_size, FlushSink sink)
    : batch_size_(batch_size == 0 ? 1 : batch_size), sink_(std::move(sink)) {
    staged_.reserve(batch_size_);
}

auto BatchWriter::stage(std::string key, std::vector<float> values)
    -> std::expected<void, core::error> {
    staged_.push_back(StagedVector{std::move(key), std::move(values)});
    if (staged_.size() >= batch_size_) return flush();
    return {};
}

auto BatchWriter::flush() -> std::expected<void, core::error> {
    if (staged_.empty()) return {};
    if (!sink_) {
        return core::fail(core::error_code::internal, "batch writer has no sink", "vector.batch");
    }
    if (auto r = sink_(staged_); !r) return std::unexpected(r.error());
    for (auto& s : staged_) flushed_keys_.push_back(std::move(s.key));
    staged_.clear();
    return {};
}

void BatchWriter::discard() noexcept {
    staged_.clear();
}

} // namespace hoard::vector
