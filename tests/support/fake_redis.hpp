#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "hoard/net/resp.hpp"

namespace test_support {

// In-process stand-in for a Redis server with the RediSearch module: strings,
// hashes, SCAN and FLAT L2 vector indexes. Every command and reply passes
// through the RESP codec so the wire format is exercised too.
struct FakeRedisState {
    struct Index {
        std::string prefix;
        std::size_t dim{0};
    };

    std::mutex mutex;
    std::map<std::string, std::string> strings;
    std::map<std::string, std::map<std::string, std::string>> hashes;
    std::map<std::string, Index> indexes;

    std::size_t commands{0};
    std::size_t pipelines{0};
    bool down{false};   // every call fails with unavailable

    [[nodiscard]] std::size_t hash_count(const std::string& prefix);
};

class FakeRedisConnection final : public hoard::net::RespConnection {
public:
    explicit FakeRedisConnection(std::shared_ptr<FakeRedisState> state) : state_(std::move(state)) {}

    auto execute(const hoard::net::Command& cmd)
        -> std::expected<hoard::net::RespValue, hoard::core::error> override;
    auto pipeline(const std::vector<hoard::net::Command>& cmds)
        -> std::expected<std::vector<hoard::net::RespValue>, hoard::core::error> override;

private:
    auto round_trip(const hoard::net::Command& cmd)
        -> std::expected<hoard::net::RespValue, hoard::core::error>;
    hoard::net::RespValue handle(const hoard::net::Command& cmd);

    std::shared_ptr<FakeRedisState> state_;
};

} // namespace test_support
