#pragma once

/** \file kmeans.hpp
 *  \brief Lloyd k-means used to train the coarse quantizer of IvfFlatIndex.
 *
 * Seeding is k-means++ (D^2 sampling); iterations stop at max_iter or when the
 * inertia improves by less than epsilon relative to the previous pass. With
 * n_redo > 1 the run with the lowest inertia wins.
 *
 * Assignment passes run under OpenMP when the library is built with it.
 * Same seed and input give the same centroids.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "hoard/error.hpp"

namespace hoard::index {

struct KmeansParams {
    std::uint32_t k{50};
    std::uint32_t max_iter{25};
    float epsilon{1e-4f};                /**< relative inertia change that counts as converged */
    std::uint32_t seed{42};
    std::uint32_t n_redo{1};             /**< independent restarts */
};

struct KmeansResult {
    std::vector<std::vector<float>> centroids;  /**< k rows of dim floats */
    std::vector<std::uint32_t> assignments;     /**< centroid per input row */
    std::vector<std::uint32_t> cluster_sizes;
    float inertia{0.0f};                        /**< sum of squared distances to assigned centroids */
    std::uint32_t iterations{0};
};

/** \brief Cluster the row-major [n x dim] matrix \p data.
 *
 * Errors: precondition_failed when k == 0 or n < k; invalid_argument for an
 * empty matrix. Cost O(n * k * dim) per iteration.
 */
auto kmeans_cluster(const float* data, std::size_t n, std::size_t dim,
                    const KmeansParams& params)
    -> std::expected<KmeansResult, core::error>;

/** \brief k-means++ seeding: k rows of \p data, drawn with D^2 weighting. */
auto kmeans_plusplus_init(const float* data, std::size_t n, std::size_t dim,
                          std::uint32_t k, std::uint32_t seed)
    -> std::vector<std::vector<float>>;

/** \brief Write the nearest centroid of every row into \p assignments; returns the inertia. */
auto kmeans_assign(const float* data, std::size_t n,
                   const std::vector<std::vector<float>>& centroids,
                   std::span<std::uint32_t> assignments) -> float;

/** \brief Move each centroid to the mean of its members; an empty cluster keeps its centroid. */
auto kmeans_update_centroids(const float* data, std::size_t n, std::size_t dim,
                             std::span<const std::uint32_t> assignments,
                             std::uint32_t k,
                             std::vector<std::vector<float>>& centroids) -> void;

/** \brief Index of the centroid nearest to \p point (lowest index wins ties). */
auto nearest_centroid(const float* point, const std::vector<std::vector<float>>& centroids)
    -> std::uint32_t;

} // namespace hoard::index
