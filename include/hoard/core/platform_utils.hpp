#pragma once

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <expected>
#include <optional>
#include <string>

#include "hoard/error.hpp"

namespace hoard::core {

// Cross-platform safe getenv wrapper.
// - Windows: uses _dupenv_s and frees the allocated buffer
// - POSIX/others: uses std::getenv (read-only)
// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    const errno_t err = _dupenv_s(&buf, &len, name);
    if (err != 0 || buf == nullptr) {
        if (buf) std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

/** \brief True when the variable is set to a value starting with '1'. */
inline bool env_flag(const char* name) noexcept {
    auto v = safe_getenv(name);
    return v && !v->empty() && (*v)[0] == '1';
}

/** \brief Read an unsigned override; unset or empty keeps \p fallback.
 *
 * Malformed or zero values are rejected with config_invalid so a typo in the
 * environment never silently changes behavior.
 */
inline auto env_u32(const char* name, std::uint32_t fallback)
    -> std::expected<std::uint32_t, error> {
    auto v = safe_getenv(name);
    if (!v || v->empty()) return fallback;
    std::uint32_t out = 0;
    const char* first = v->data();
    const char* last = v->data() + v->size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last || out == 0) {
        return std::unexpected(error{error_code::config_invalid,
                                     std::string("malformed value for ") + name + ": '" + *v + "'",
                                     "core.env"});
    }
    return out;
}

} // namespace hoard::core
