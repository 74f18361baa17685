#include "hoard/core/uuid.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace hoard::core {

namespace {

auto thread_rng() -> std::mt19937_64& {
    thread_local std::mt19937_64 gen([] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }());
    return gen;
}

constexpr bool is_hex(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

} // anonymous namespace

auto make_uuid() -> std::string {
    static constexpr char kHex[] = "0123456789abcdef";
    auto& gen = thread_rng();
    std::array<std::uint8_t, 16> b{};
    const std::uint64_t hi = gen();
    const std::uint64_t lo = gen();
    for (int i = 0; i < 8; ++i) {
        b[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(hi >> (i * 8));
        b[static_cast<std::size_t>(i + 8)] = static_cast<std::uint8_t>(lo >> (i * 8));
    }
    b[6] = static_cast<std::uint8_t>((b[6] & 0x0F) | 0x40); // version 4
    b[8] = static_cast<std::uint8_t>((b[8] & 0x3F) | 0x80); // RFC 4122 variant

    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < b.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(kHex[b[i] >> 4]);
        out.push_back(kHex[b[i] & 0x0F]);
    }
    return out;
}

auto is_uuid(std::string_view s) noexcept -> bool {
    if (s.size() != 36) return false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        } else if (!is_hex(s[i])) {
            return false;
        }
    }
    return true;
}

} // namespace hoard::core
