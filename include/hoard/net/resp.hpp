#pragma once

/** \file resp.hpp
 *  \brief Redis serialization protocol (RESP2) codec and a blocking connection.
 *
 * Commands are always sent as arrays of bulk strings. Replies are parsed
 * incrementally: parse_resp() reports how many bytes one complete value used,
 * or 0 when the buffer holds only a prefix of it.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "hoard/error.hpp"

namespace hoard::net {

struct RespValue {
    enum class Type { simple_string, error, integer, bulk_string, nil, array };

    Type type{Type::nil};
    std::string str;                 /**< simple_string, error, bulk_string */
    std::int64_t integer{0};
    std::vector<RespValue> elements; /**< array */

    [[nodiscard]] bool is_error() const noexcept { return type == Type::error; }
    [[nodiscard]] bool is_nil() const noexcept { return type == Type::nil; }

    static RespValue simple(std::string s) { return RespValue{Type::simple_string, std::move(s), 0, {}}; }
    static RespValue err(std::string s) { return RespValue{Type::error, std::move(s), 0, {}}; }
    static RespValue integer_value(std::int64_t v) { return RespValue{Type::integer, {}, v, {}}; }
    static RespValue bulk(std::string s) { return RespValue{Type::bulk_string, std::move(s), 0, {}}; }
    static RespValue nil() { return RespValue{}; }
    static RespValue array(std::vector<RespValue> v) { return RespValue{Type::array, {}, 0, std::move(v)}; }
};

using Command = std::vector<std::string>;

/** \brief Encode a command as a RESP array of bulk strings. */
auto encode_command(const Command& args) -> std::string;

/** \brief Encode any value (used by servers and test doubles). */
auto encode_value(const RespValue& value) -> std::string;

/** \brief Parse one value from the front of \p buf.
 *
 * \return bytes consumed, 0 if \p buf is incomplete; data_integrity on malformed input.
 */
auto parse_resp(std::string_view buf, RespValue& out) -> std::expected<std::size_t, core::error>;

/** \brief Raw little-endian float32 blob, the layout RediSearch expects for vectors. */
auto float_blob(std::span<const float> v) -> std::string;

/** \brief Inverse of float_blob(); data_integrity when the size is not a multiple of 4. */
auto blob_floats(std::string_view blob) -> std::expected<std::vector<float>, core::error>;

/** \brief A synchronous request/response channel to a Redis server. */
class RespConnection {
public:
    virtual ~RespConnection() = default;

    /** \brief Send one command and read its reply (an error reply is not a failure). */
    virtual auto execute(const Command& cmd) -> std::expected<RespValue, core::error> = 0;

    /** \brief Send all commands in one write and read the replies in order. */
    virtual auto pipeline(const std::vector<Command>& cmds)
        -> std::expected<std::vector<RespValue>, core::error> = 0;
};

/** \brief TCP connection driven by Boost.Asio. */
class AsioRespConnection final : public RespConnection {
public:
    static auto connect(const std::string& host, std::uint16_t port,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
        -> std::expected<std::unique_ptr<AsioRespConnection>, core::error>;

    ~AsioRespConnection() override;

    auto execute(const Command& cmd) -> std::expected<RespValue, core::error> override;
    auto pipeline(const std::vector<Command>& cmds)
        -> std::expected<std::vector<RespValue>, core::error> override;

private:
    class Impl;
    explicit AsioRespConnection(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

} // namespace hoard::net
