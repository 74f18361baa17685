#include "hoard/index/kmeans.hpp"
#include "hoard/kernels/distance.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <random>
#include <string>

namespace hoard::index {

namespace {

using Centroids = std::vector<std::vector<float>>;

inline auto row_span(const float* data, std::size_t row, std::size_t dim) -> std::span<const float> {
    return {data + row * dim, dim};
}

/** \brief Nearest centroid and its squared distance; lowest index wins ties. */
auto closest(std::span<const float> point, const Centroids& centroids) -> std::pair<std::uint32_t, float> {
    std::pair<std::uint32_t, float> best{0, std::numeric_limits<float>::infinity()};
    for (std::uint32_t c = 0; c < centroids.size(); ++c) {
        const float d = kernels::l2_sq(point, centroids[c]);
        if (d < best.second) best = {c, d};
    }
    return best;
}

// Relative inertia change below epsilon ends Lloyd's iterations
inline bool converged(double previous, double current, float epsilon) {
    if (!std::isfinite(previous)) return false;
    return std::abs(previous - current) <= static_cast<double>(epsilon) * std::max(previous, 1e-12);
}

auto sizes_of(std::span<const std::uint32_t> assignments, std::uint32_t k) -> std::vector<std::uint32_t> {
    std::vector<std::uint32_t> sizes(k, 0);
    for (auto a : assignments) ++sizes[a];
    return sizes;
}

} // anonymous namespace

auto nearest_centroid(const float* point, const std::vector<std::vector<float>>& centroids)
    -> std::uint32_t {
    if (centroids.empty()) return 0;
    return closest({point, centroids.front().size()}, centroids).first;
}

auto kmeans_plusplus_init(const float* data, std::size_t n, std::size_t dim,
                          std::uint32_t k, std::uint32_t seed)
    -> std::vector<std::vector<float>> {
    Centroids centroids;
    if (n == 0 || k == 0) return centroids;
    centroids.reserve(k);

    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<std::size_t> uniform(0, n - 1);
    auto take = [&](std::size_t row) {
        const auto r = row_span(data, row, dim);
        centroids.emplace_back(r.begin(), r.end());
    };
    take(uniform(rng));

    // D(x)^2 to the nearest chosen centroid, refreshed against the newest one only
    std::vector<double> weight(n, std::numeric_limits<double>::infinity());
    while (centroids.size() < k) {
        const auto& newest = centroids.back();
        double total = 0.0;

        #pragma omp parallel for reduction(+:total)
        for (long long i = 0; i < static_cast<long long>(n); ++i) {
            const auto row = static_cast<std::size_t>(i);
            const double d = kernels::l2_sq(row_span(data, row, dim), newest);
            weight[row] = std::min(weight[row], d);
            total += weight[row];
        }

        if (total <= 0.0) {
            // Every point already coincides with a centroid
            take(uniform(rng));
            continue;
        }
        std::discrete_distribution<std::size_t> by_weight(weight.begin(), weight.end());
        take(by_weight(rng));
    }
    return centroids;
}

auto kmeans_assign(const float* data, std::size_t n,
                   const std::vector<std::vector<float>>& centroids,
                   std::span<std::uint32_t> assignments) -> float {
    if (centroids.empty() || n == 0) return 0.0f;
    const std::size_t dim = centroids.front().size();
    double inertia = 0.0;

    #pragma omp parallel for reduction(+:inertia)
    for (long long i = 0; i < static_cast<long long>(n); ++i) {
        const auto row = static_cast<std::size_t>(i);
        const auto [c, d] = closest(row_span(data, row, dim), centroids);
        assignments[row] = c;
        inertia += d;
    }
    return static_cast<float>(inertia);
}

auto kmeans_update_centroids(const float* data, std::size_t n, std::size_t dim,
                             std::span<const std::uint32_t> assignments,
                             std::uint32_t k,
                             std::vector<std::vector<float>>& centroids) -> void {
    // One flat [k x dim] accumulator in double keeps large clusters exact enough
    std::vector<double> acc(static_cast<std::size_t>(k) * dim, 0.0);
    std::vector<std::size_t> members(k, 0);

    for (std::size_t row = 0; row < n; ++row) {
        const auto c = assignments[row];
        ++members[c];
        double* sum = acc.data() + static_cast<std::size_t>(c) * dim;
        const float* x = data + row * dim;
        for (std::size_t j = 0; j < dim; ++j) sum[j] += x[j];
    }

    for (std::uint32_t c = 0; c < k; ++c) {
        if (members[c] == 0) continue;
        const double inv = 1.0 / static_cast<double>(members[c]);
        const double* sum = acc.data() + static_cast<std::size_t>(c) * dim;
        std::transform(sum, sum + dim, centroids[c].begin(),
                       [inv](double s) { return static_cast<float>(s * inv); });
    }
}

auto kmeans_cluster(const float* data, std::size_t n, std::size_t dim,
                    const KmeansParams& params)
    -> std::expected<KmeansResult, core::error> {
    if (params.k == 0) {
        return core::fail(core::error_code::precondition_failed, "k must be > 0", "kmeans");
    }
    if (n < params.k) {
        return core::fail(core::error_code::precondition_failed,
                          "need at least k points (n=" + std::to_string(n) + ", k=" + std::to_string(params.k) + ")",
                          "kmeans");
    }
    if (dim == 0 || data == nullptr) {
        return core::fail(core::error_code::invalid_argument, "empty input matrix", "kmeans");
    }

    std::optional<KmeansResult> best;
    const std::uint32_t runs = std::max<std::uint32_t>(params.n_redo, 1);

    for (std::uint32_t run = 0; run < runs; ++run) {
        KmeansResult r;
        r.centroids = kmeans_plusplus_init(data, n, dim, params.k, params.seed + run);
        r.assignments.assign(n, 0);

        double previous = std::numeric_limits<double>::infinity();
        while (r.iterations < params.max_iter) {
            const double inertia = kmeans_assign(data, n, r.centroids, r.assignments);
            ++r.iterations;
            if (converged(previous, inertia, params.epsilon)) break;
            previous = inertia;
            kmeans_update_centroids(data, n, dim, r.assignments, params.k, r.centroids);
        }

        // Final pass so assignments match the centroids handed back
        r.inertia = kmeans_assign(data, n, r.centroids, r.assignments);
        r.cluster_sizes = sizes_of(r.assignments, params.k);

        if (!best || r.inertia < best->inertia) best = std::move(r);
    }
    return std::move(*best);
}

} // namespace hoard::index
