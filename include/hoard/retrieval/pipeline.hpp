#pragma once

/** \file pipeline.hpp
 *  \brief Two-stage retrieval: wide IVF-Flat recall followed by a ranker pass.
 *
 * Build: every corpus document is embedded in order, an IVF-Flat index is
 * trained on the full matrix and populated with ids equal to row numbers. The
 * result is persisted as one blob:
 *
 *   "HRDRIDX1" | string corpus_id | u64 rows | u64 dim | f32 matrix | IvfFlatIndex
 *
 * Query: query() asks retrieve() for k * retrieval_multiplier neighbours,
 * rerank() scores each (query, candidate) pair and query() keeps the best k.
 *
 * Example usage:
 * ```cpp
 * auto p = RetrievalPipeline::create(embedder, ranker, text_corpus_resolver(dir));
 * (*p)->initialize(dir / "chat.idx", "chat", dir / "chat.txt");
 * auto answers = (*p)->query("when is the meetup?", 5);
 * ```
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "hoard/error.hpp"
#include "hoard/index/ivf_flat.hpp"
#include "hoard/model/embedder.hpp"
#include "hoard/model/ranker.hpp"
#include "hoard/retrieval/corpus.hpp"

namespace hoard::retrieval {

struct RetrievalParams {
    std::uint32_t nlist{50};                 /**< clusters; clamped to the corpus size */
    std::uint32_t retrieval_multiplier{20};  /**< first-stage over-fetch factor */
    std::uint32_t nprobe{8};                 /**< lists probed per query */
    std::uint32_t max_iter{25};
    std::uint32_t seed{42};

    /** \brief Apply HOARD_NLIST / HOARD_RETRIEVAL_MULTIPLIER / HOARD_NPROBE. */
    static auto from_env(RetrievalParams base) -> std::expected<RetrievalParams, core::error>;
    static auto from_env() -> std::expected<RetrievalParams, core::error>;
};

inline auto RetrievalParams::from_env() -> std::expected<RetrievalParams, core::error> {
    return from_env(RetrievalParams{});
}

class RetrievalPipeline {
public:
    /** \brief Null embedder or ranker is precondition_failed.
     *
     * With \p index_path the serialized index is loaded eagerly; a load
     * failure is logged and leaves the pipeline uninitialized.
     */
    static auto create(std::shared_ptr<model::Embedder> embedder, std::shared_ptr<model::Ranker> ranker,
                       CorpusResolver resolver, RetrievalParams params = {},
                       std::optional<std::filesystem::path> index_path = std::nullopt)
        -> std::expected<std::unique_ptr<RetrievalPipeline>, core::error>;

    /** \brief Build or warm-start the index.
     *
     * Without \p raw_source an already loaded index, or the blob at
     * \p index_path, is reused. Otherwise the corpus is (re)imported, embedded,
     * indexed and saved to \p index_path.
     */
    auto initialize(const std::filesystem::path& index_path, const std::string& corpus_id,
                    const std::optional<std::filesystem::path>& raw_source = std::nullopt)
        -> std::expected<void, core::error>;

    /** \brief First stage: up to k resolvable documents, nearest first. */
    auto retrieve(std::string_view text, int k) const -> std::expected<std::vector<std::string>, core::error>;

    /** \brief Second stage: \p candidates sorted by descending ranker score, ties in input order.
     *  A non-finite score is data_integrity. */
    auto rerank(std::string_view text, std::vector<std::string> candidates) const
        -> std::expected<std::vector<std::string>, core::error>;

    /** \brief rerank(retrieve(text, k * retrieval_multiplier)) truncated to k. */
    auto query(std::string_view text, int k) const -> std::expected<std::vector<std::string>, core::error>;

    [[nodiscard]] bool is_initialized() const;
    [[nodiscard]] auto corpus_id() const -> std::string;
    [[nodiscard]] auto document_count() const -> std::size_t;
    [[nodiscard]] const RetrievalParams& params() const noexcept { return params_; }

private:
    RetrievalPipeline(std::shared_ptr<model::Embedder> embedder, std::shared_ptr<model::Ranker> ranker,
                      CorpusResolver resolver, RetrievalParams params);

    auto load(const std::filesystem::path& index_path) -> std::expected<void, core::error>;
    auto build(const std::filesystem::path& index_path, const std::string& corpus_id,
               const std::optional<std::filesystem::path>& raw_source) -> std::expected<void, core::error>;

    std::shared_ptr<model::Embedder> embedder_;
    std::shared_ptr<model::Ranker> ranker_;
    CorpusResolver resolver_;
    RetrievalParams params_;

    mutable std::shared_mutex mutex_;
    std::string corpus_id_;
    std::shared_ptr<Corpus> corpus_;
    std::vector<float> embeddings_;     // [rows x dim]
    std::size_t dim_{0};
    std::unique_ptr<index::IvfFlatIndex> index_;
};

} // namespace hoard::retrieval
