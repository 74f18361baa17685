#include "hoard/index/ivf_flat.hpp"

#include <algorithm>
#include <cstring>
#include <span>
#include <string>

#include "hoard/core/binary_io.hpp"
#include "hoard/index/kmeans.hpp"
#include "hoard/kernels/distance.hpp"

namespace hoard::index {

namespace {

constexpr char kMagic[8] = {'H', 'R', 'D', 'I', 'V', 'F', '0', '1'};

inline bool hit_less(const IvfHit& a, const IvfHit& b) {
    if (a.distance == b.distance) return a.id < b.id;
    return a.distance < b.distance;
}

} // anonymous namespace

auto IvfFlatIndex::train(const float* data, std::size_t n, std::size_t dim,
                         const IvfFlatTrainParams& params) -> std::expected<void, core::error> {
    if (data == nullptr || dim == 0) {
        return core::fail(core::error_code::invalid_argument, "empty training matrix", "ivf_flat.train");
    }
    if (params.nlist == 0 || n < params.nlist) {
        return core::fail(core::error_code::precondition_failed,
                          "need at least nlist training vectors (n=" + std::to_string(n) +
                          ", nlist=" + std::to_string(params.nlist) + ")",
                          "ivf_flat.train");
    }

    KmeansParams kp;
    kp.k = params.nlist;
    kp.max_iter = params.max_iter;
    kp.seed = params.seed;
    auto km = kmeans_cluster(data, n, dim, kp);
    if (!km) return std::unexpected(km.error());

    dim_ = dim;
    total_ = 0;
    centroids_ = std::move(km->centroids);
    lists_.assign(centroids_.size(), InvertedList{});
    return {};
}

auto IvfFlatIndex::add(const std::uint64_t* ids, const float* data, std::size_t n)
    -> std::expected<void, core::error> {
    if (!is_trained()) {
        return core::fail(core::error_code::not_initialized, "index is not trained", "ivf_flat.add");
    }
    if (n == 0) return {};
    if (ids == nullptr || data == nullptr) {
        return core::fail(core::error_code::invalid_argument, "null ids or data", "ivf_flat.add");
    }
    for (std::size_t i = 0; i < n; ++i) {
        const float* v = data + i * dim_;
        const auto list = nearest_centroid(v, centroids_);
        auto& inv = lists_[list];
        inv.ids.push_back(ids[i]);
        inv.vectors.insert(inv.vectors.end(), v, v + dim_);
    }
    total_ += n;
    return {};
}

auto IvfFlatIndex::search(const float* query, std::size_t dim, const IvfFlatSearchParams& params) const
    -> std::expected<std::vector<IvfHit>, core::error> {
    if (!is_trained()) {
        return core::fail(core::error_code::not_initialized, "index is not trained", "ivf_flat.search");
    }
    if (dim != dim_) {
        return core::fail(core::error_code::data_integrity,
                          "query dimension " + std::to_string(dim) + " != index dimension " +
                          std::to_string(dim_),
                          "ivf_flat.search");
    }
    if (params.k == 0 || total_ == 0) return std::vector<IvfHit>{};

    const std::span<const float> q(query, dim_);

    // Rank centroids; ties on distance resolve to the lower list number
    std::vector<std::pair<float, std::uint32_t>> coarse(centroids_.size());
    for (std::uint32_t c = 0; c < centroids_.size(); ++c) {
        coarse[c] = {kernels::l2_sq(q, centroids_[c]), c};
    }
    const std::size_t probe = std::clamp<std::size_t>(params.nprobe, 1, coarse.size());
    std::partial_sort(coarse.begin(), coarse.begin() + static_cast<std::ptrdiff_t>(probe), coarse.end());

    std::vector<IvfHit> hits;
    for (std::size_t p = 0; p < probe; ++p) {
        const auto& inv = lists_[coarse[p].second];
        for (std::size_t j = 0; j < inv.ids.size(); ++j) {
            const std::span<const float> v(inv.vectors.data() + j * dim_, dim_);
            hits.push_back({inv.ids[j], kernels::l2_sq(q, v)});
        }
    }

    if (hits.size() > params.k) {
        auto kth = hits.begin() + params.k;
        std::nth_element(hits.begin(), kth, hits.end(), hit_less);
        hits.resize(params.k);
    }
    std::sort(hits.begin(), hits.end(), hit_less);
    return hits;
}

auto IvfFlatIndex::list_sizes() const -> std::vector<std::size_t> {
    std::vector<std::size_t> out;
    out.reserve(lists_.size());
    for (const auto& l : lists_) out.push_back(l.ids.size());
    return out;
}

auto IvfFlatIndex::write(std::ostream& os) const -> std::expected<void, core::error> {
    using namespace core::bin;
    os.write(kMagic, sizeof(kMagic));
    write_pod(os, static_cast<std::uint64_t>(dim_));
    write_pod(os, static_cast<std::uint64_t>(centroids_.size()));
    for (const auto& c : centroids_) {
        os.write(reinterpret_cast<const char*>(c.data()), static_cast<std::streamsize>(dim_ * sizeof(float)));
    }
    for (const auto& l : lists_) {
        write_vector(os, l.ids);
        write_vector(os, l.vectors);
    }
    if (!os.good()) {
        return core::fail(core::error_code::io_failed, "index stream write failed", "ivf_flat.write");
    }
    return {};
}

auto IvfFlatIndex::read(std::istream& is) -> std::expected<IvfFlatIndex, core::error> {
    using namespace core::bin;
    auto corrupt = [](const char* what) {
        return core::fail(core::error_code::data_integrity, what, "ivf_flat.read");
    };

    char magic[sizeof(kMagic)]{};
    if (!is.read(magic, sizeof(magic)) || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
        return corrupt("bad ivf magic");
    }
    std::uint64_t dim = 0, nlist = 0;
    if (!read_pod(is, dim) || !read_pod(is, nlist) || dim == 0 || dim > (1u << 20) || nlist > (1u << 24)) {
        return corrupt("bad ivf header");
    }

    // Centroids alone need nlist * dim floats; a header promising more than the stream holds is corrupt
    if (!fits_in_stream(is, nlist * dim, sizeof(float))) return corrupt("ivf header exceeds stream size");

    IvfFlatIndex idx;
    idx.dim_ = static_cast<std::size_t>(dim);
    idx.centroids_.assign(static_cast<std::size_t>(nlist), std::vector<float>(idx.dim_));
    for (auto& c : idx.centroids_) {
        if (!is.read(reinterpret_cast<char*>(c.data()), static_cast<std::streamsize>(idx.dim_ * sizeof(float)))) {
            return corrupt("truncated centroids");
        }
    }
    idx.lists_.resize(static_cast<std::size_t>(nlist));
    for (auto& l : idx.lists_) {
        if (!read_vector(is, l.ids) || !read_vector(is, l.vectors)) return corrupt("truncated inverted list");
        if (l.vectors.size() != l.ids.size() * idx.dim_) return corrupt("inverted list size mismatch");
        idx.total_ += l.ids.size();
    }
    return idx;
}

} // namespace hoard::index
