/** \file pipeline.cpp
 *  \brief Retrieve-then-rerank over a persisted IVF-Flat index.
 */

#include "hoard/retrieval/pipeline.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <mutex>
#include <numeric>
#include <sstream>
#include <system_error>

#include "hoard/core/atomic_file.hpp"
#include "hoard/core/binary_io.hpp"
#include "hoard/core/log.hpp"
#include "hoard/core/platform_utils.hpp"
#include "hoard/kernels/distance.hpp"

namespace hoard::retrieval {

namespace {

constexpr char kMagic[8] = {'H', 'R', 'D', 'R', 'I', 'D', 'X', '1'};
constexpr const char* kComponent = "retrieval.pipeline";

auto not_initialized() -> std::unexpected<core::error> {
    return core::fail(core::error_code::not_initialized, "Not initialized", kComponent);
}

} // anonymous namespace

auto RetrievalParams::from_env(RetrievalParams base) -> std::expected<RetrievalParams, core::error> {
    auto nlist = core::env_u32("HOARD_NLIST", base.nlist);
    if (!nlist) return std::unexpected(nlist.error());
    auto multiplier = core::env_u32("HOARD_RETRIEVAL_MULTIPLIER", base.retrieval_multiplier);
    if (!multiplier) return std::unexpected(multiplier.error());
    auto nprobe = core::env_u32("HOARD_NPROBE", base.nprobe);
    if (!nprobe) return std::unexpected(nprobe.error());
    base.nlist = *nlist;
    base.retrieval_multiplier = *multiplier;
    base.nprobe = *nprobe;
    return base;
}

RetrievalPipeline::RetrievalPipeline(std::shared_ptr<model::Embedder> embedder,
                                     std::shared_ptr<model::Ranker> ranker, CorpusResolver resolver,
                                     RetrievalParams params)
    : embedder_(std::move(embedder)), ranker_(std::move(ranker)), resolver_(std::move(resolver)),
      params_(params) {}

auto RetrievalPipeline::create(std::shared_ptr<model::Embedder> embedder, std::shared_ptr<model::Ranker> ranker,
                               CorpusResolver resolver, RetrievalParams params,
                               std::optional<std::filesystem::path> index_path)
    -> std::expected<std::unique_ptr<RetrievalPipeline>, core::error> {
    if (!embedder || !ranker) {
        return core::fail(core::error_code::precondition_failed, "embedder and ranker are required", kComponent);
    }
    if (!resolver) {
        return core::fail(core::error_code::precondition_failed, "corpus resolver is required", kComponent);
    }
    if (params.nlist == 0 || params.retrieval_multiplier == 0 || params.nprobe == 0) {
        return core::fail(core::error_code::config_invalid, "nlist, multiplier and nprobe must be positive",
                          kComponent);
    }
    std::unique_ptr<RetrievalPipeline> p(
        new RetrievalPipeline(std::move(embedder), std::move(ranker), std::move(resolver), params));
    if (index_path) {
        std::error_code ec;
        if (std::filesystem::exists(*index_path, ec)) {
            if (auto r = p->load(*index_path); !r) {
                core::log_warn("retrieval", "cannot load " + index_path->string() + ": " + r.error().message);
            }
        }
    }
    return p;
}

auto RetrievalPipeline::initialize(const std::filesystem::path& index_path, const std::string& corpus_id,
                                   const std::optional<std::filesystem::path>& raw_source)
    -> std::expected<void, core::error> {
    if (!raw_source) {
        if (is_initialized()) return {};
        std::error_code ec;
        if (std::filesystem::exists(index_path, ec)) return load(index_path);
    }
    return build(index_path, corpus_id, raw_source);
}

auto RetrievalPipeline::load(const std::filesystem::path& index_path) -> std::expected<void, core::error> {
    auto bytes = core::read_file(index_path);
    if (!bytes) return std::unexpected(bytes.error());
    std::istringstream in(*bytes, std::ios::binary);

    char magic[8]{};
    if (!in.read(magic, sizeof(magic)) || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
        return core::fail(core::error_code::data_integrity, "bad magic in " + index_path.string(), kComponent);
    }
    std::string corpus_id;
    std::uint64_t rows = 0, dim = 0;
    std::vector<float> matrix;
    if (!core::bin::read_string(in, corpus_id, 4096) || !core::bin::read_pod(in, rows) ||
        !core::bin::read_pod(in, dim) || !core::bin::read_vector(in, matrix) || matrix.size() != rows * dim) {
        return core::fail(core::error_code::data_integrity, "truncated header or matrix in " + index_path.string(),
                          kComponent);
    }
    auto ivf = index::IvfFlatIndex::read(in);
    if (!ivf) return std::unexpected(ivf.error());
    if (ivf->dimension() != dim || ivf->size() != rows) {
        return core::fail(core::error_code::data_integrity, "index does not match the embedding matrix",
                          kComponent);
    }
    auto corpus = resolver_(corpus_id, std::nullopt);
    if (!corpus) return std::unexpected(corpus.error());
    if ((*corpus)->size() != rows) {
        core::log_warn("retrieval", "corpus '" + corpus_id + "' has " + std::to_string((*corpus)->size()) +
                                        " documents, index has " + std::to_string(rows));
    }

    std::unique_lock lock(mutex_);
    corpus_id_ = std::move(corpus_id);
    corpus_ = std::move(*corpus);
    embeddings_ = std::move(matrix);
    dim_ = static_cast<std::size_t>(dim);
    index_ = std::make_unique<index::IvfFlatIndex>(std::move(*ivf));
    core::log_info("retrieval", "loaded index for '" + corpus_id_ + "' with " + std::to_string(rows) +
                                    " documents");
    return {};
}

auto RetrievalPipeline::build(const std::filesystem::path& index_path, const std::string& corpus_id,
                              const std::optional<std::filesystem::path>& raw_source)
    -> std::expected<void, core::error> {
    auto corpus = resolver_(corpus_id, raw_source);
    if (!corpus) return std::unexpected(corpus.error());
    const std::size_t n = (*corpus)->size();
    if (n == 0) {
        return core::fail(core::error_code::precondition_failed, "corpus '" + corpus_id + "' is empty", kComponent);
    }

    std::vector<float> matrix;
    std::size_t dim = 0;
    for (std::size_t row = 0; row < n; ++row) {
        const auto doc = (*corpus)->document(row);
        auto emb = embedder_->embed_text(doc.value_or(std::string{}));
        if (!emb) return std::unexpected(emb.error());
        if (emb->empty() || !kernels::all_finite(*emb)) {
            return core::fail(core::error_code::data_integrity, "invalid embedding for row " + std::to_string(row),
                              kComponent);
        }
        if (row == 0) {
            dim = emb->size();
            matrix.reserve(n * dim);
        } else if (emb->size() != dim) {
            return core::fail(core::error_code::data_integrity,
                              "row " + std::to_string(row) + " has dimension " + std::to_string(emb->size()) +
                                  ", expected " + std::to_string(dim),
                              kComponent);
        }
        matrix.insert(matrix.end(), emb->begin(), emb->end());
    }
    core::log_info("retrieval", "embedded " + std::to_string(n) + " documents, dimension " + std::to_string(dim));

    index::IvfFlatTrainParams train;
    train.nlist = static_cast<std::uint32_t>(std::min<std::size_t>(params_.nlist, n));
    train.max_iter = params_.max_iter;
    train.seed = params_.seed;
    auto ivf = std::make_unique<index::IvfFlatIndex>();
    if (auto r = ivf->train(matrix.data(), n, dim, train); !r) return std::unexpected(r.error());
    std::vector<std::uint64_t> ids(n);
    std::iota(ids.begin(), ids.end(), std::uint64_t{0});
    if (auto r = ivf->add(ids.data(), matrix.data(), n); !r) return std::unexpected(r.error());

    std::ostringstream out(std::ios::binary);
    out.write(kMagic, sizeof(kMagic));
    core::bin::write_string(out, corpus_id);
    core::bin::write_pod(out, static_cast<std::uint64_t>(n));
    core::bin::write_pod(out, static_cast<std::uint64_t>(dim));
    core::bin::write_vector(out, matrix);
    if (auto r = ivf->write(out); !r) return std::unexpected(r.error());

    std::error_code ec;
    if (index_path.has_parent_path()) std::filesystem::create_directories(index_path.parent_path(), ec);
    if (auto w = core::write_file_atomic(index_path, out.str()); !w) return std::unexpected(w.error());

    std::unique_lock lock(mutex_);
    corpus_id_ = corpus_id;
    corpus_ = std::move(*corpus);
    embeddings_ = std::move(matrix);
    dim_ = dim;
    index_ = std::move(ivf);
    core::log_info("retrieval", "built index with " + std::to_string(train.nlist) + " lists at " +
                                    index_path.string());
    return {};
}

auto RetrievalPipeline::retrieve(std::string_view text, int k) const
    -> std::expected<std::vector<std::string>, core::error> {
    std::shared_lock lock(mutex_);
    if (!index_ || !corpus_) return not_initialized();
    std::vector<std::string> out;
    if (text.empty() || k <= 0) return out;

    auto q = embedder_->embed_text(text);
    if (!q) return std::unexpected(q.error());

    index::IvfFlatSearchParams search;
    search.k = static_cast<std::uint32_t>(k);
    search.nprobe = params_.nprobe;
    auto hits = index_->search(q->data(), q->size(), search);
    if (!hits) return std::unexpected(hits.error());

    out.reserve(hits->size());
    for (const auto& h : *hits) {
        if (auto doc = corpus_->document(static_cast<std::size_t>(h.id))) out.push_back(std::move(*doc));
    }
    return out;
}

auto RetrievalPipeline::rerank(std::string_view text, std::vector<std::string> candidates) const
    -> std::expected<std::vector<std::string>, core::error> {
    if (!is_initialized()) return not_initialized();
    if (candidates.empty()) return candidates;

    auto scores = ranker_->score_batch(text, candidates);
    if (!scores) return std::unexpected(scores.error());
    if (scores->size() != candidates.size()) {
        return core::fail(core::error_code::internal,
                          "ranker returned " + std::to_string(scores->size()) + " scores for " +
                              std::to_string(candidates.size()) + " candidates",
                          kComponent);
    }
    if (!std::all_of(scores->begin(), scores->end(), [](float v) { return std::isfinite(v); })) {
        return core::fail(core::error_code::data_integrity, "ranker returned a non-finite score", kComponent);
    }
    std::vector<std::size_t> order(candidates.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    const auto& s = *scores;
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) { return s[a] > s[b]; });

    std::vector<std::string> out;
    out.reserve(order.size());
    for (auto i : order) out.push_back(std::move(candidates[i]));
    return out;
}

auto RetrievalPipeline::query(std::string_view text, int k) const
    -> std::expected<std::vector<std::string>, core::error> {
    if (!is_initialized()) return not_initialized();
    if (text.empty() || k <= 0) return std::vector<std::string>{};
    const auto wide = std::min<std::int64_t>(static_cast<std::int64_t>(k) * params_.retrieval_multiplier,
                                             std::numeric_limits<int>::max());
    auto candidates = retrieve(text, static_cast<int>(wide));
    if (!candidates) return std::unexpected(candidates.error());
    auto ranked = rerank(text, std::move(*candidates));
    if (!ranked) return std::unexpected(ranked.error());
    if (ranked->size() > static_cast<std::size_t>(k)) ranked->resize(static_cast<std::size_t>(k));
    return ranked;
}

bool RetrievalPipeline::is_initialized() const {
    std::shared_lock lock(mutex_);
    return index_ != nullptr && corpus_ != nullptr;
}

auto RetrievalPipeline::corpus_id() const -> std::string {
    std::shared_lock lock(mutex_);
    return corpus_id_;
}

auto RetrievalPipeline::document_count() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return index_ ? index_->size() : 0;
}

} // namespace hoard::retrieval
