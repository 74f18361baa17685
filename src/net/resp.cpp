#include "hoard/net/resp.hpp"

#include <array>
#include <bit>
#include <charconv>
#include <cstring>
#include <mutex>
#include <utility>

#include <boost/asio.hpp>

#include "hoard/core/log.hpp"

namespace hoard::net {

namespace {

constexpr const char* kComponent = "net.resp";
constexpr std::int64_t kMaxBulk = 512ll * 1024 * 1024;
constexpr std::int64_t kMaxElements = 1ll << 24;
constexpr int kMaxDepth = 16;

auto malformed(const std::string& what) -> std::unexpected<core::error> {
    return core::fail(core::error_code::data_integrity, "malformed RESP: " + what, kComponent);
}

void append_bulk(std::string& out, std::string_view s) {
    out.push_back('$');
    out += std::to_string(s.size());
    out += "\r\n";
    out.append(s.data(), s.size());
    out += "\r\n";
}

// Returns the end offset of the value starting at pos, or 0 when incomplete.
auto parse_at(std::string_view buf, std::size_t pos, RespValue& out, int depth)
    -> std::expected<std::size_t, core::error> {
    if (depth > kMaxDepth) return malformed("nesting too deep");
    if (pos >= buf.size()) return 0;
    const auto eol = buf.find("\r\n", pos);
    if (eol == std::string_view::npos) return 0;
    const char tag = buf[pos];
    const std::string_view line = buf.substr(pos + 1, eol - pos - 1);
    const std::size_t after = eol + 2;

    auto parse_int = [&](std::int64_t& v) -> bool {
        auto [p, ec] = std::from_chars(line.data(), line.data() + line.size(), v);
        return ec == std::errc{} && p == line.data() + line.size();
    };

    switch (tag) {
    case '+':
        out = RespValue::simple(std::string(line));
        return after;
    case '-':
        out = RespValue::err(std::string(line));
        return after;
    case ':': {
        std::int64_t v = 0;
        if (!parse_int(v)) return malformed("bad integer '" + std::string(line) + "'");
        out = RespValue::integer_value(v);
        return after;
    }
    case '$': {
        std::int64_t len = 0;
        if (!parse_int(len) || len < -1 || len > kMaxBulk) return malformed("bad bulk length");
        if (len == -1) {
            out = RespValue::nil();
            return after;
        }
        const auto n = static_cast<std::size_t>(len);
        if (buf.size() < after + n + 2) return 0;
        if (buf.substr(after + n, 2) != "\r\n") return malformed("bulk string not terminated");
        out = RespValue::bulk(std::string(buf.substr(after, n)));
        return after + n + 2;
    }
    case '*': {
        std::int64_t count = 0;
        if (!parse_int(count) || count < -1 || count > kMaxElements) return malformed("bad array length");
        if (count == -1) {
            out = RespValue::nil();
            return after;
        }
        std::vector<RespValue> elems(static_cast<std::size_t>(count));
        std::size_t cur = after;
        for (auto& e : elems) {
            auto next = parse_at(buf, cur, e, depth + 1);
            if (!next) return std::unexpected(next.error());
            if (*next == 0) return 0;
            cur = *next;
        }
        out = RespValue::array(std::move(elems));
        return cur;
    }
    default:
        return malformed(std::string("unknown type byte '") + tag + "'");
    }
}

} // anonymous namespace

auto encode_command(const Command& args) -> std::string {
    std::string out;
    out.push_back('*');
    out += std::to_string(args.size());
    out += "\r\n";
    for (const auto& a : args) append_bulk(out, a);
    return out;
}

auto encode_value(const RespValue& value) -> std::string {
    std::string out;
    switch (value.type) {
    case RespValue::Type::simple_string:
        out = "+" + value.str + "\r\n";
        break;
    case RespValue::Type::error:
        out = "-" + value.str + "\r\n";
        break;
    case RespValue::Type::integer:
        out = ":" + std::to_string(value.integer) + "\r\n";
        break;
    case RespValue::Type::bulk_string:
        append_bulk(out, value.str);
        break;
    case RespValue::Type::nil:
        out = "$-1\r\n";
        break;
    case RespValue::Type::array:
        out = "*" + std::to_string(value.elements.size()) + "\r\n";
        for (const auto& e : value.elements) out += encode_value(e);
        break;
    }
    return out;
}

auto parse_resp(std::string_view buf, RespValue& out) -> std::expected<std::size_t, core::error> {
    return parse_at(buf, 0, out, 0);
}

auto float_blob(std::span<const float> v) -> std::string {
    static_assert(std::endian::native == std::endian::little, "vector blobs assume a little-endian host");
    std::string out(v.size() * sizeof(float), '\0');
    if (!v.empty()) std::memcpy(out.data(), v.data(), out.size());
    return out;
}

auto blob_floats(std::string_view blob) -> std::expected<std::vector<float>, core::error> {
    if (blob.size() % sizeof(float) != 0) {
        return core::fail(core::error_code::data_integrity,
                          "vector blob of " + std::to_string(blob.size()) + " bytes", kComponent);
    }
    std::vector<float> out(blob.size() / sizeof(float));
    if (!out.empty()) std::memcpy(out.data(), blob.data(), blob.size());
    return out;
}

// ---------------------------------------------------------------------------
// AsioRespConnection
// ---------------------------------------------------------------------------

class AsioRespConnection::Impl {
public:
    explicit Impl(std::chrono::milliseconds timeout) : socket_(io_), timeout_(timeout) {}

    ~Impl() {
        boost::system::error_code ignored;
        socket_.close(ignored);
    }

    auto connect(const std::string& host, std::uint16_t port) -> std::expected<void, core::error> {
        boost::asio::ip::tcp::resolver resolver(io_);
        boost::system::error_code ec;
        auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec) {
            return core::fail(core::error_code::unavailable,
                              "cannot resolve " + host + ": " + ec.message(), kComponent);
        }
        bool done = false;
        boost::asio::async_connect(socket_, endpoints,
            [&](const boost::system::error_code& e, const boost::asio::ip::tcp::endpoint&) {
                ec = e;
                done = true;
            });
        if (auto r = run_until(done, "connect"); !r) return r;
        if (ec) {
            return core::fail(core::error_code::unavailable,
                              "cannot connect to " + host + ":" + std::to_string(port) + ": " + ec.message(),
                              kComponent);
        }
        socket_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
        return {};
    }

    auto round_trip(const std::string& payload, std::size_t replies)
        -> std::expected<std::vector<RespValue>, core::error> {
        std::lock_guard lock(mutex_);
        if (!socket_.is_open()) {
            return core::fail(core::error_code::unavailable, "connection closed", kComponent);
        }
        if (auto w = write_all(payload); !w) return std::unexpected(w.error());
        std::vector<RespValue> out;
        out.reserve(replies);
        for (std::size_t i = 0; i < replies; ++i) {
            auto v = read_reply();
            if (!v) return std::unexpected(v.error());
            out.push_back(std::move(*v));
        }
        return out;
    }

private:
    auto run_until(bool& done, const char* op) -> std::expected<void, core::error> {
        io_.restart();
        io_.run_for(timeout_);
        if (!done) {
            boost::system::error_code ignored;
            socket_.close(ignored);
            io_.restart();
            io_.run();
            return core::fail(core::error_code::unavailable, std::string(op) + " timed out", kComponent);
        }
        return {};
    }

    auto write_all(const std::string& payload) -> std::expected<void, core::error> {
        boost::system::error_code ec;
        bool done = false;
        boost::asio::async_write(socket_, boost::asio::buffer(payload),
            [&](const boost::system::error_code& e, std::size_t) {
                ec = e;
                done = true;
            });
        if (auto r = run_until(done, "write"); !r) return r;
        if (ec) return core::fail(core::error_code::unavailable, "write failed: " + ec.message(), kComponent);
        return {};
    }

    auto read_reply() -> std::expected<RespValue, core::error> {
        for (;;) {
            RespValue v;
            auto used = parse_resp(rbuf_, v);
            if (!used) {
                boost::system::error_code ignored;
                socket_.close(ignored);
                return std::unexpected(used.error());
            }
            if (*used > 0) {
                rbuf_.erase(0, *used);
                return v;
            }
            std::array<char, 16384> chunk{};
            boost::system::error_code ec;
            std::size_t got = 0;
            bool done = false;
            socket_.async_read_some(boost::asio::buffer(chunk),
                [&](const boost::system::error_code& e, std::size_t n) {
                    ec = e;
                    got = n;
                    done = true;
                });
            if (auto r = run_until(done, "read"); !r) return std::unexpected(r.error());
            if (ec) {
                const auto code = ec == boost::asio::error::eof ? core::error_code::io_eof
                                                                 : core::error_code::unavailable;
                return core::fail(code, "read failed: " + ec.message(), kComponent);
            }
            rbuf_.append(chunk.data(), got);
        }
    }

    boost::asio::io_context io_;
    boost::asio::ip::tcp::socket socket_;
    std::chrono::milliseconds timeout_;
    std::string rbuf_;
    std::mutex mutex_;
};

AsioRespConnection::AsioRespConnection(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
AsioRespConnection::~AsioRespConnection() = default;

auto AsioRespConnection::connect(const std::string& host, std::uint16_t port,
                                 std::chrono::milliseconds timeout)
    -> std::expected<std::unique_ptr<AsioRespConnection>, core::error> {
    auto impl = std::make_unique<Impl>(timeout);
    if (auto r = impl->connect(host, port); !r) return std::unexpected(r.error());
    core::log_debug("redis", "connected to " + host + ":" + std::to_string(port));
    return std::unique_ptr<AsioRespConnection>(new AsioRespConnection(std::move(impl)));
}

auto AsioRespConnection::execute(const Command& cmd) -> std::expected<RespValue, core::error> {
    auto replies = impl_->round_trip(encode_command(cmd), 1);
    if (!replies) return std::unexpected(replies.error());
    return std::move(replies->front());
}

auto AsioRespConnection::pipeline(const std::vector<Command>& cmds)
    -> std::expected<std::vector<RespValue>, core::error> {
    if (cmds.empty()) return std::vector<RespValue>{};
    std::string payload;
    for (const auto& c : cmds) payload += encode_command(c);
    return impl_->round_trip(payload, cmds.size());
}

} // namespace hoard::net
