#include "hoard/vector/remote_vector_store.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include "hoard/core/log.hpp"
#include "hoard/kernels/distance.hpp"

namespace hoard::vector {

namespace {

constexpr const char* kComponent = "vector.redis";
constexpr std::size_t kScanCount = 1000;
constexpr std::size_t kDeleteBatch = 500;

auto reply_error(const std::string& op, const net::RespValue& v) -> std::unexpected<core::error> {
    return core::fail(core::error_code::io_failed, op + ": " + v.str, kComponent);
}

bool contains_ci(const std::string& hay, std::string_view needle) {
    if (needle.size() > hay.size()) return false;
    for (std::size_t i = 0; i + needle.size() <= hay.size(); ++i) {
        bool match = true;
        for (std::size_t j = 0; j < needle.size(); ++j) {
            const auto a = static_cast<unsigned char>(hay[i + j]);
            const auto b = static_cast<unsigned char>(needle[j]);
            if (std::tolower(a) != std::tolower(b)) { match = false; break; }
        }
        if (match) return true;
    }
    return false;
}

template <class T>
bool parse_number(std::string_view s, T& out) {
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && p == s.data() + s.size();
}

} // anonymous namespace

RemoteVectorStore::RemoteVectorStore(std::unique_ptr<net::RespConnection> conn, std::string lib_uuid)
    : conn_(std::move(conn)), lib_uuid_(std::move(lib_uuid)) {}

auto RemoteVectorStore::open(std::unique_ptr<net::RespConnection> conn, std::string lib_uuid)
    -> std::expected<std::unique_ptr<RemoteVectorStore>, core::error> {
    if (!conn) {
        return core::fail(core::error_code::invalid_argument, "null connection", kComponent);
    }
    if (lib_uuid.empty()) {
        return core::fail(core::error_code::invalid_argument, "empty namespace", kComponent);
    }
    std::unique_ptr<RemoteVectorStore> store(new RemoteVectorStore(std::move(conn), std::move(lib_uuid)));
    auto dim = store->call({"GET", store->index_name() + ":dim"});
    if (!dim) return std::unexpected(dim.error());
    if (dim->is_error()) return reply_error("GET", *dim);
    if (dim->type == net::RespValue::Type::bulk_string) {
        std::size_t d = 0;
        if (!parse_number(dim->str, d) || d == 0) {
            return core::fail(core::error_code::data_integrity,
                              "bad stored dimension '" + dim->str + "'", kComponent);
        }
        store->dim_ = d;
        store->index_created_ = true;
    }
    return store;
}

auto RemoteVectorStore::call(const net::Command& cmd) const -> std::expected<net::RespValue, core::error> {
    return conn_->execute(cmd);
}

auto RemoteVectorStore::initialize_index(std::size_t dimension) -> std::expected<void, core::error> {
    if (dimension == 0) {
        return core::fail(core::error_code::invalid_argument, "dimension must be positive", kComponent);
    }
    std::lock_guard lock(mutex_);
    const std::size_t pinned = dim_;
    if (pinned != 0 && pinned != dimension) {
        return core::fail(core::error_code::data_integrity,
                          "index dimension is " + std::to_string(pinned) + ", requested " +
                              std::to_string(dimension),
                          kComponent);
    }
    if (index_created_) return {};

    const auto d = std::to_string(dimension);
    auto created = call({"FT.CREATE", index_name(), "ON", "HASH", "PREFIX", "1", lib_uuid_ + ":",
                         "SCHEMA", "embedding", "VECTOR", "FLAT", "6",
                         "TYPE", "FLOAT32", "DIM", d, "DISTANCE_METRIC", "L2"});
    if (!created) return std::unexpected(created.error());
    if (created->is_error() && !contains_ci(created->str, "already exists")) {
        return reply_error("FT.CREATE", *created);
    }
    auto saved = call({"SET", index_name() + ":dim", d});
    if (!saved) return std::unexpected(saved.error());
    if (saved->is_error()) return reply_error("SET", *saved);

    dim_ = dimension;
    index_created_ = true;
    core::log_debug("redis", "created " + index_name() + " dim=" + d);
    return {};
}

auto RemoteVectorStore::check_vector(std::span<const float> vec) -> std::expected<void, core::error> {
    if (vec.empty()) {
        return core::fail(core::error_code::data_integrity, "empty vector", kComponent);
    }
    if (!kernels::all_finite(vec)) {
        return core::fail(core::error_code::data_integrity, "non-finite vector", kComponent);
    }
    std::lock_guard lock(mutex_);
    const std::size_t pinned = dim_;
    if (pinned == 0) {
        dim_ = vec.size();
        return {};
    }
    if (pinned != vec.size()) {
        return core::fail(core::error_code::data_integrity,
                          "dimension mismatch: expected " + std::to_string(pinned) + ", got " +
                              std::to_string(vec.size()),
                          kComponent);
    }
    return {};
}

auto RemoteVectorStore::add(const std::string& key, std::span<const float> vec, BatchWriter* writer)
    -> std::expected<void, core::error> {
    if (auto ok = check_vector(vec); !ok) return ok;
    if (writer != nullptr) {
        return writer->stage(key, std::vector<float>(vec.begin(), vec.end()));
    }
    std::lock_guard lock(mutex_);
    auto r = call({"HSET", key_for(key), "embedding", net::float_blob(vec)});
    if (!r) return std::unexpected(r.error());
    if (r->is_error()) return reply_error("HSET", *r);
    return {};
}

auto RemoteVectorStore::remove(const std::string& key) -> std::expected<void, core::error> {
    std::lock_guard lock(mutex_);
    auto r = call({"DEL", key_for(key)});
    if (!r) return std::unexpected(r.error());
    if (r->is_error()) return reply_error("DEL", *r);
    if (r->type == net::RespValue::Type::integer && r->integer == 0) {
        return core::fail(core::error_code::not_found, "no vector for " + key, kComponent);
    }
    return {};
}

auto RemoteVectorStore::query(std::span<const float> vec, std::size_t top_k) const
    -> std::expected<std::vector<VectorHit>, core::error> {
    std::lock_guard lock(mutex_);
    std::vector<VectorHit> hits;
    if (top_k == 0 || !index_created_) return hits;
    if (vec.size() != dim_.load()) {
        return core::fail(core::error_code::data_integrity,
                          "query dimension " + std::to_string(vec.size()) + " != " + std::to_string(dim_.load()),
                          kComponent);
    }
    const auto k = std::to_string(top_k);
    auto r = call({"FT.SEARCH", index_name(), "*=>[KNN " + k + " @embedding $vec AS dist]",
                   "PARAMS", "2", "vec", net::float_blob(vec),
                   "SORTBY", "dist", "RETURN", "1", "dist", "LIMIT", "0", k, "DIALECT", "2"});
    if (!r) return std::unexpected(r.error());
    if (r->is_error()) return reply_error("FT.SEARCH", *r);
    if (r->type != net::RespValue::Type::array || r->elements.empty()) {
        return core::fail(core::error_code::data_integrity, "unexpected FT.SEARCH reply", kComponent);
    }

    // [total, key1, [field, value, ...], key2, [...], ...]
    const auto prefix = lib_uuid_ + ":";
    const auto& e = r->elements;
    for (std::size_t i = 1; i + 1 < e.size(); i += 2) {
        const auto& key = e[i].str;
        const auto& fields = e[i + 1].elements;
        float dist = 0.0f;
        bool found = false;
        for (std::size_t f = 0; f + 1 < fields.size(); f += 2) {
            if (fields[f].str == "dist") {
                found = parse_number(fields[f + 1].str, dist);
                break;
            }
        }
        if (!found || key.compare(0, prefix.size(), prefix) != 0) {
            return core::fail(core::error_code::data_integrity, "malformed search hit '" + key + "'", kComponent);
        }
        hits.push_back(VectorHit{key.substr(prefix.size()), dist});
    }
    order_hits(hits, top_k);
    return hits;
}

auto RemoteVectorStore::persist() -> std::expected<void, core::error> {
    // Writes are applied on the server as they are sent
    return {};
}

auto RemoteVectorStore::scan_keys(std::size_t limit) const
    -> std::expected<std::vector<std::string>, core::error> {
    std::vector<std::string> keys;
    std::string cursor = "0";
    do {
        auto r = call({"SCAN", cursor, "MATCH", lib_uuid_ + ":*", "COUNT", std::to_string(kScanCount)});
        if (!r) return std::unexpected(r.error());
        if (r->is_error()) return reply_error("SCAN", *r);
        if (r->type != net::RespValue::Type::array || r->elements.size() != 2) {
            return core::fail(core::error_code::data_integrity, "unexpected SCAN reply", kComponent);
        }
        cursor = r->elements[0].str;
        for (const auto& k : r->elements[1].elements) {
            keys.push_back(k.str);
            if (keys.size() >= limit) return keys;
        }
    } while (cursor != "0");
    return keys;
}

auto RemoteVectorStore::drop_all() -> std::expected<void, core::error> {
    std::lock_guard lock(mutex_);
    auto dropped = call({"FT.DROPINDEX", index_name()});
    if (!dropped) return std::unexpected(dropped.error());
    if (dropped->is_error() && !contains_ci(dropped->str, "unknown index")) {
        return reply_error("FT.DROPINDEX", *dropped);
    }
    auto keys = scan_keys(static_cast<std::size_t>(-1));
    if (!keys) return std::unexpected(keys.error());
    keys->push_back(index_name() + ":dim");
    for (std::size_t i = 0; i < keys->size(); i += kDeleteBatch) {
        net::Command del{"DEL"};
        const auto end = std::min(keys->size(), i + kDeleteBatch);
        del.insert(del.end(), keys->begin() + static_cast<std::ptrdiff_t>(i),
                   keys->begin() + static_cast<std::ptrdiff_t>(end));
        auto r = call(del);
        if (!r) return std::unexpected(r.error());
        if (r->is_error()) return reply_error("DEL", *r);
    }
    dim_ = 0;
    index_created_ = false;
    return {};
}

auto RemoteVectorStore::clean_all_data() -> std::expected<void, core::error> {
    return drop_all();
}

auto RemoteVectorStore::delete_store() -> std::expected<void, core::error> {
    if (auto r = drop_all(); !r) return r;
    core::log_info("redis", "dropped " + index_name());
    return {};
}

auto RemoteVectorStore::db_is_empty() const -> std::expected<bool, core::error> {
    std::lock_guard lock(mutex_);
    auto keys = scan_keys(1);
    if (!keys) return std::unexpected(keys.error());
    return keys->empty();
}

auto RemoteVectorStore::size() const -> std::expected<std::size_t, core::error> {
    std::lock_guard lock(mutex_);
    auto keys = scan_keys(static_cast<std::size_t>(-1));
    if (!keys) return std::unexpected(keys.error());
    return keys->size();
}

auto RemoteVectorStore::dimension() const noexcept -> std::size_t {
    return dim_.load(std::memory_order_acquire);
}

auto RemoteVectorStore::get_batch_writer(std::size_t batch_size)
    -> std::expected<std::unique_ptr<BatchWriter>, core::error> {
    auto sink = [this](const std::vector<StagedVector>& batch) -> std::expected<void, core::error> {
        std::vector<net::Command> cmds;
        cmds.reserve(batch.size());
        for (const auto& s : batch) {
            cmds.push_back({"HSET", key_for(s.key), "embedding", net::float_blob(s.values)});
        }
        std::lock_guard lock(mutex_);
        auto replies = conn_->pipeline(cmds);
        if (!replies) return std::unexpected(replies.error());
        for (const auto& r : *replies) {
            if (r.is_error()) return reply_error("HSET (pipelined)", r);
        }
        core::log_debug("redis", "flushed " + std::to_string(batch.size()) + " vectors");
        return {};
    };
    return std::make_unique<BatchWriter>(batch_size, std::move(sink));
}

} // namespace hoard::vector
