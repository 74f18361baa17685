#pragma once

/** \file remote_vector_store.hpp
 *  \brief Vector store on Redis with the RediSearch module.
 *
 * Layout for a library with uuid L:
 *   hash  L:<item uuid>   field "embedding" = float32 blob
 *   index idx:L           FT.CREATE ... ON HASH PREFIX 1 "L:" SCHEMA embedding VECTOR FLAT ...
 *   key   idx:L:dim       dimension of the index, written by initialize_index
 *
 * The dimension is pinned by the first add() or by initialize_index(),
 * whichever comes first; later mismatches fail before any command is sent.
 */

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "hoard/net/resp.hpp"
#include "hoard/vector/vector_store.hpp"

namespace hoard::vector {

class RemoteVectorStore final : public VectorStore {
public:
    /** \brief Bind to namespace \p lib_uuid; reads the dimension of an existing index. */
    static auto open(std::unique_ptr<net::RespConnection> conn, std::string lib_uuid)
        -> std::expected<std::unique_ptr<RemoteVectorStore>, core::error>;

    auto initialize_index(std::size_t dimension) -> std::expected<void, core::error> override;
    auto add(const std::string& key, std::span<const float> vec, BatchWriter* writer = nullptr)
        -> std::expected<void, core::error> override;
    auto remove(const std::string& key) -> std::expected<void, core::error> override;
    auto query(std::span<const float> vec, std::size_t top_k) const
        -> std::expected<std::vector<VectorHit>, core::error> override;
    auto persist() -> std::expected<void, core::error> override;
    auto clean_all_data() -> std::expected<void, core::error> override;
    auto delete_store() -> std::expected<void, core::error> override;
    auto db_is_empty() const -> std::expected<bool, core::error> override;
    auto size() const -> std::expected<std::size_t, core::error> override;
    [[nodiscard]] auto dimension() const noexcept -> std::size_t override;
    [[nodiscard]] auto requires_index_before_add() const noexcept -> bool override { return false; }
    auto get_batch_writer(std::size_t batch_size)
        -> std::expected<std::unique_ptr<BatchWriter>, core::error> override;

    [[nodiscard]] auto index_name() const -> std::string { return "idx:" + lib_uuid_; }
    [[nodiscard]] auto key_for(const std::string& item) const -> std::string { return lib_uuid_ + ":" + item; }

private:
    RemoteVectorStore(std::unique_ptr<net::RespConnection> conn, std::string lib_uuid);

    auto check_vector(std::span<const float> vec) -> std::expected<void, core::error>;
    auto call(const net::Command& cmd) const -> std::expected<net::RespValue, core::error>;
    auto scan_keys(std::size_t limit) const -> std::expected<std::vector<std::string>, core::error>;
    auto drop_all() -> std::expected<void, core::error>;

    std::unique_ptr<net::RespConnection> conn_;
    std::string lib_uuid_;
    mutable std::mutex mutex_;
    std::atomic<std::size_t> dim_{0};
    bool index_created_{false};
};

} // namespace hoard::vector
