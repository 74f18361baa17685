#pragma once

/** \file ivf_flat.hpp
 *  \brief Inverted-file index with uncompressed (flat) vectors.
 *
 * Vectors are grouped into nlist clusters by a coarse k-means quantizer trained
 * once over a representative matrix; search probes only the nprobe clusters
 * whose centroids are closest to the query and ranks their members by exact
 * squared L2.
 *
 * Thread-safety: train/add are single-writer; const search is safe to call
 * concurrently once no writer is active.
 * Memory: O(nlist*d + N*d) floats plus 8 bytes per id.
 */

#include <cstdint>
#include <expected>
#include <istream>
#include <ostream>
#include <vector>

#include "hoard/error.hpp"

namespace hoard::index {

/** \brief Training parameters for the coarse quantizer. */
struct IvfFlatTrainParams {
    std::uint32_t nlist{50};            /**< Number of coarse centroids */
    std::uint32_t max_iter{25};         /**< Max k-means iterations */
    std::uint32_t seed{42};             /**< Random seed for reproducibility */
};

/** \brief Search parameters. */
struct IvfFlatSearchParams {
    std::uint32_t k{10};                /**< Results to return */
    std::uint32_t nprobe{8};            /**< Lists probed (clamped to nlist) */
};

/** \brief One neighbour: caller id and squared L2 distance. */
struct IvfHit {
    std::uint64_t id{};
    float distance{};
};

class IvfFlatIndex {
public:
    IvfFlatIndex() = default;

    /** \brief Train the coarse quantizer on [n x dim] row-major data.
     *
     * Preconditions: n >= params.nlist > 0, dim > 0. Retraining drops all lists.
     */
    auto train(const float* data, std::size_t n, std::size_t dim,
               const IvfFlatTrainParams& params) -> std::expected<void, core::error>;

    /** \brief Append n vectors with caller-chosen ids. Requires a trained index. */
    auto add(const std::uint64_t* ids, const float* data, std::size_t n)
        -> std::expected<void, core::error>;

    /** \brief Nearest neighbours ordered by ascending distance, ties by ascending id.
     *
     * Returns at most params.k hits; fewer when the probed lists hold fewer vectors.
     */
    auto search(const float* query, std::size_t dim, const IvfFlatSearchParams& params) const
        -> std::expected<std::vector<IvfHit>, core::error>;

    [[nodiscard]] auto is_trained() const noexcept -> bool { return !centroids_.empty(); }
    [[nodiscard]] auto dimension() const noexcept -> std::size_t { return dim_; }
    [[nodiscard]] auto nlist() const noexcept -> std::size_t { return centroids_.size(); }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return total_; }

    /** \brief Sizes of the inverted lists, in centroid order. */
    [[nodiscard]] auto list_sizes() const -> std::vector<std::size_t>;

    auto write(std::ostream& os) const -> std::expected<void, core::error>;
    static auto read(std::istream& is) -> std::expected<IvfFlatIndex, core::error>;

private:
    struct InvertedList {
        std::vector<std::uint64_t> ids;
        std::vector<float> vectors;     // [ids.size() x dim_]
    };

    std::size_t dim_{0};
    std::size_t total_{0};
    std::vector<std::vector<float>> centroids_;
    std::vector<InvertedList> lists_;
};

} // namespace hoard::index
