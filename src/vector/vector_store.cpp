#include "hoard/vector/vector_store.hpp"

#include <algorithm>

#include "hoard/core/log.hpp"
#include "hoard/core/platform_utils.hpp"
#include "hoard/net/resp.hpp"
#include "hoard/vector/local_vector_store.hpp"
#include "hoard/vector/remote_vector_store.hpp"

namespace hoard::vector {

void order_hits(std::vector<VectorHit>& hits, std::size_t top_k) {
    auto less = [](const VectorHit& a, const VectorHit& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        return a.key < b.key;
    };
    if (hits.size() > top_k) {
        std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(top_k), hits.end(), less);
        hits.resize(top_k);
    } else {
        std::sort(hits.begin(), hits.end(), less);
    }
}

auto VectorStoreConfig::from_env(VectorStoreConfig base) -> std::expected<VectorStoreConfig, core::error> {
    if (auto backend = core::safe_getenv("HOARD_VECTOR_BACKEND"); backend && !backend->empty()) {
        if (*backend == "local") {
            base.backend = Backend::local;
        } else if (*backend == "redis") {
            base.backend = Backend::redis;
        } else {
            return core::fail(core::error_code::config_invalid,
                              "HOARD_VECTOR_BACKEND must be 'local' or 'redis', got '" + *backend + "'",
                              "vector.config");
        }
    }
    if (auto host = core::safe_getenv("HOARD_REDIS_HOST"); host && !host->empty()) {
        base.redis_host = *host;
    }
    auto port = core::env_u32("HOARD_REDIS_PORT", base.redis_port);
    if (!port) return std::unexpected(port.error());
    if (*port > 65535) {
        return core::fail(core::error_code::config_invalid, "HOARD_REDIS_PORT out of range", "vector.config");
    }
    base.redis_port = static_cast<std::uint16_t>(*port);
    auto batch = core::env_u32("HOARD_BATCH_SIZE", base.batch_size);
    if (!batch) return std::unexpected(batch.error());
    base.batch_size = *batch;
    return base;
}

auto make_vector_store(const VectorStoreConfig& config)
    -> std::expected<std::unique_ptr<VectorStore>, core::error> {
    switch (config.backend) {
    case VectorStoreConfig::Backend::local: {
        if (config.local_file.empty()) {
            return core::fail(core::error_code::invalid_argument, "local backend needs a file", "vector.factory");
        }
        auto store = LocalVectorStore::open(config.local_file);
        if (!store) return std::unexpected(store.error());
        return std::unique_ptr<VectorStore>(std::move(*store));
    }
    case VectorStoreConfig::Backend::redis: {
        auto conn = net::AsioRespConnection::connect(config.redis_host, config.redis_port,
                                                     std::chrono::milliseconds(config.connect_timeout_ms));
        if (!conn) return std::unexpected(conn.error());
        auto store = RemoteVectorStore::open(std::move(*conn), config.namespace_id);
        if (!store) return std::unexpected(store.error());
        core::log_info("vector", "using redis at " + config.redis_host + ":" + std::to_string(config.redis_port));
        return std::unique_ptr<VectorStore>(std::move(*store));
    }
    }
    return core::fail(core::error_code::internal, "unknown backend", "vector.factory");
}

} // namespace hoard::vector
