#pragma once

/** \file vector_store.hpp
 *  \brief Nearest-neighbour store keyed by item uuid.
 *
 * Two backends implement the interface:
 * - LocalVectorStore: exact in-process index persisted to one file. The index
 *   must be created with initialize_index() before the first add().
 * - RemoteVectorStore: Redis with the RediSearch module. Writes may be staged
 *   through a BatchWriter and the search index is built once after a scan.
 *
 * Ordering contract for query(): ascending squared L2 distance, ties broken by
 * ascending key (byte-wise). An empty store yields an empty result.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "hoard/error.hpp"
#include "hoard/vector/batch_writer.hpp"

namespace hoard::vector {

struct VectorHit {
    std::string key;
    float distance{0.0f};
};

class VectorStore {
public:
    virtual ~VectorStore() = default;

    /** \brief Create the index for vectors of \p dimension.
     *  A different dimension than an existing index is data_integrity. */
    virtual auto initialize_index(std::size_t dimension) -> std::expected<void, core::error> = 0;

    /** \brief Insert a vector. With \p writer the write is staged, otherwise applied now.
     *
     * Dimension and finiteness are checked before anything is written or staged.
     */
    virtual auto add(const std::string& key, std::span<const float> vec, BatchWriter* writer = nullptr)
        -> std::expected<void, core::error> = 0;

    /** \brief Remove a vector; not_found when the key is absent. */
    virtual auto remove(const std::string& key) -> std::expected<void, core::error> = 0;

    virtual auto query(std::span<const float> vec, std::size_t top_k) const
        -> std::expected<std::vector<VectorHit>, core::error> = 0;

    /** \brief Make every applied write durable. */
    virtual auto persist() -> std::expected<void, core::error> = 0;

    /** \brief Remove all vectors and forget the dimension; the store stays usable. */
    virtual auto clean_all_data() -> std::expected<void, core::error> = 0;

    /** \brief Remove all vectors and every persisted artifact of the store. */
    virtual auto delete_store() -> std::expected<void, core::error> = 0;

    virtual auto db_is_empty() const -> std::expected<bool, core::error> = 0;

    virtual auto size() const -> std::expected<std::size_t, core::error> = 0;

    /** \brief Dimension of the index, 0 while unknown. */
    [[nodiscard]] virtual auto dimension() const noexcept -> std::size_t = 0;

    /** \brief True when initialize_index() must precede add(). */
    [[nodiscard]] virtual auto requires_index_before_add() const noexcept -> bool = 0;

    /** \brief Writer for pipelined writes; unsupported on backends without batching. */
    virtual auto get_batch_writer(std::size_t batch_size)
        -> std::expected<std::unique_ptr<BatchWriter>, core::error> = 0;
};

/** \brief Backend selection and connection settings.
 *
 * Environment overrides (see from_env):
 *   HOARD_VECTOR_BACKEND = local | redis
 *   HOARD_REDIS_HOST, HOARD_REDIS_PORT, HOARD_BATCH_SIZE
 */
struct VectorStoreConfig {
    enum class Backend { local, redis };

    Backend backend{Backend::local};
    std::filesystem::path local_file;     /**< file of the local backend */
    std::string namespace_id;             /**< library uuid; key prefix on Redis */
    std::string redis_host{"127.0.0.1"};
    std::uint16_t redis_port{6379};
    std::uint32_t batch_size{200};
    std::uint32_t connect_timeout_ms{2000};

    /** \brief Apply environment overrides on top of \p base. */
    static auto from_env(VectorStoreConfig base) -> std::expected<VectorStoreConfig, core::error>;
};

/** \brief Build the configured backend; the only place the backend is chosen. */
auto make_vector_store(const VectorStoreConfig& config)
    -> std::expected<std::unique_ptr<VectorStore>, core::error>;

/** \brief Sort by (distance, key) and keep the first \p top_k. */
void order_hits(std::vector<VectorHit>& hits, std::size_t top_k);

} // namespace hoard::vector
