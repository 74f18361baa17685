#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <algorithm>
#include <limits>
#include <random>
#include <vector>

#include "hoard/index/kmeans.hpp"

using Catch::Matchers::WithinAbs;

namespace {

/** \brief Generate synthetic clustered data for testing. */
auto generate_clustered_data(std::size_t n_clusters, std::size_t points_per_cluster,
                             std::size_t dim, std::uint32_t seed) -> std::vector<float> {
    std::mt19937 gen(seed);
    std::normal_distribution<float> center_dist(0.0f, 10.0f);
    std::normal_distribution<float> noise_dist(0.0f, 0.5f);

    std::vector<float> data(n_clusters * points_per_cluster * dim);
    for (std::size_t c = 0; c < n_clusters; ++c) {
        std::vector<float> center(dim);
        for (auto& x : center) x = center_dist(gen);
        for (std::size_t p = 0; p < points_per_cluster; ++p) {
            const std::size_t row = c * points_per_cluster + p;
            for (std::size_t d = 0; d < dim; ++d) data[row * dim + d] = center[d] + noise_dist(gen);
        }
    }
    return data;
}

/** \brief Fraction of points whose cluster majority label matches their own. */
auto compute_purity(const std::vector<std::uint32_t>& assignments, std::size_t points_per_cluster,
                    std::uint32_t k) -> float {
    std::size_t correct = 0;
    for (std::uint32_t c = 0; c < k; ++c) {
        std::vector<std::size_t> label_counts(k, 0);
        for (std::size_t i = 0; i < assignments.size(); ++i) {
            if (assignments[i] == c) label_counts[i / points_per_cluster]++;
        }
        correct += *std::max_element(label_counts.begin(), label_counts.end());
    }
    return static_cast<float>(correct) / static_cast<float>(assignments.size());
}

} // anonymous namespace

TEST_CASE("K-means clustering", "[kmeans]") {

    SECTION("K-means++ initialization produces k distinct centroids") {
        const std::size_t n = 100, dim = 8;
        const std::uint32_t k = 5;
        auto data = generate_clustered_data(k, n / k, dim, 42);

        auto centroids = hoard::index::kmeans_plusplus_init(data.data(), n, dim, k, 42);
        REQUIRE(centroids.size() == k);
        for (std::size_t i = 0; i < k; ++i) {
            REQUIRE(centroids[i].size() == dim);
            for (std::size_t j = i + 1; j < k; ++j) REQUIRE(centroids[i] != centroids[j]);
        }
    }

    SECTION("assignment covers every point") {
        const std::size_t n = 100, dim = 8;
        const std::uint32_t k = 5;
        auto data = generate_clustered_data(k, n / k, dim, 42);
        auto centroids = hoard::index::kmeans_plusplus_init(data.data(), n, dim, k, 42);

        std::vector<std::uint32_t> assignments(n);
        const float inertia = hoard::index::kmeans_assign(data.data(), n, centroids, assignments);
        REQUIRE(inertia > 0.0f);
        REQUIRE(inertia < std::numeric_limits<float>::max());
        for (auto a : assignments) REQUIRE(a < k);
    }

    SECTION("converges on well-separated clusters") {
        const std::uint32_t n_clusters = 4;
        const std::size_t per_cluster = 25, dim = 8;
        const std::size_t n = n_clusters * per_cluster;
        auto data = generate_clustered_data(n_clusters, per_cluster, dim, 42);

        hoard::index::KmeansParams params{.k = n_clusters, .max_iter = 100, .epsilon = 1e-4f, .seed = 42, .n_redo = 3};
        auto result = hoard::index::kmeans_cluster(data.data(), n, dim, params);
        REQUIRE(result.has_value());
        REQUIRE(result->centroids.size() == n_clusters);
        REQUIRE(result->assignments.size() == n);
        REQUIRE(result->iterations > 0);
        REQUIRE(result->iterations <= params.max_iter);
        REQUIRE(compute_purity(result->assignments, per_cluster, n_clusters) > 0.8f);
    }

    SECTION("same seed, same clustering") {
        auto data = generate_clustered_data(3, 20, 4, 7);
        hoard::index::KmeansParams params{.k = 3, .seed = 11};
        auto a = hoard::index::kmeans_cluster(data.data(), 60, 4, params);
        auto b = hoard::index::kmeans_cluster(data.data(), 60, 4, params);
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(a->assignments == b->assignments);
    }

    SECTION("edge cases") {
        const std::size_t dim = 4;

        SECTION("single cluster over identical points") {
            std::vector<float> data(10 * dim, 1.0f);
            auto result = hoard::index::kmeans_cluster(data.data(), 10, dim, {.k = 1});
            REQUIRE(result.has_value());
            REQUIRE(result->centroids.size() == 1);
            REQUIRE_THAT(result->inertia, WithinAbs(0.0f, 1e-6f));
        }

        SECTION("k equals n") {
            auto data = generate_clustered_data(5, 1, dim, 42);
            auto result = hoard::index::kmeans_cluster(data.data(), 5, dim, {.k = 5});
            REQUIRE(result.has_value());
            REQUIRE_THAT(result->inertia, WithinAbs(0.0f, 1e-6f));
        }

        SECTION("invalid parameters") {
            std::vector<float> data(10 * dim);
            REQUIRE_FALSE(hoard::index::kmeans_cluster(data.data(), 10, dim, {.k = 11}).has_value());
            auto zero = hoard::index::kmeans_cluster(data.data(), 10, dim, {.k = 0});
            REQUIRE_FALSE(zero.has_value());
            REQUIRE(zero.error().code == hoard::core::error_code::precondition_failed);
        }
    }
}
