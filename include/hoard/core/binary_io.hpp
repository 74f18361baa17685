#pragma once

/** \file binary_io.hpp
 *  \brief Host-endian POD/string/vector stream helpers for index files.
 *
 * Files written by these helpers are not portable across endianness; every
 * format that uses them starts with an 8-byte magic so a foreign or truncated
 * file is rejected as data_integrity.
 */

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace hoard::core::bin {

template <class T>
inline void write_pod(std::ostream& os, const T& v) {
    static_assert(std::is_trivially_copyable_v<T>);
    os.write(reinterpret_cast<const char*>(&v), sizeof(T));
}

template <class T>
inline bool read_pod(std::istream& is, T& v) {
    static_assert(std::is_trivially_copyable_v<T>);
    return static_cast<bool>(is.read(reinterpret_cast<char*>(&v), sizeof(T)));
}

/** \brief Bytes left between the read position and the end of \p is; UINT64_MAX when the stream cannot seek. */
inline auto remaining_bytes(std::istream& is) -> std::uint64_t {
    const auto here = is.tellg();
    if (here == std::istream::pos_type(-1)) return UINT64_MAX;
    is.seekg(0, std::ios::end);
    const auto end = is.tellg();
    is.seekg(here);
    if (end == std::istream::pos_type(-1) || end < here) return UINT64_MAX;
    return static_cast<std::uint64_t>(end - here);
}

/** \brief True when \p count elements of \p elem_size bytes can still be read from \p is. */
inline bool fits_in_stream(std::istream& is, std::uint64_t count, std::uint64_t elem_size) {
    if (elem_size != 0 && count > UINT64_MAX / elem_size) return false;
    return count * elem_size <= remaining_bytes(is);
}

inline void write_string(std::ostream& os, const std::string& s) {
    write_pod(os, static_cast<std::uint64_t>(s.size()));
    os.write(s.data(), static_cast<std::streamsize>(s.size()));
}

/** \brief Read a length-prefixed string; lengths above \p max_len are rejected. */
inline bool read_string(std::istream& is, std::string& out, std::uint64_t max_len = (1ull << 30)) {
    std::uint64_t n{};
    if (!read_pod(is, n) || n > max_len || !fits_in_stream(is, n, 1)) return false;
    out.resize(static_cast<std::size_t>(n));
    return static_cast<bool>(is.read(out.data(), static_cast<std::streamsize>(n)));
}

template <class T>
inline void write_vector(std::ostream& os, const std::vector<T>& v) {
    static_assert(std::is_trivially_copyable_v<T>);
    write_pod(os, static_cast<std::uint64_t>(v.size()));
    os.write(reinterpret_cast<const char*>(v.data()), static_cast<std::streamsize>(v.size() * sizeof(T)));
}

template <class T>
inline bool read_vector(std::istream& is, std::vector<T>& out, std::uint64_t max_elems = (1ull << 32)) {
    static_assert(std::is_trivially_copyable_v<T>);
    std::uint64_t n{};
    if (!read_pod(is, n) || n > max_elems || !fits_in_stream(is, n, sizeof(T))) return false;
    out.resize(static_cast<std::size_t>(n));
    return static_cast<bool>(is.read(reinterpret_cast<char*>(out.data()),
                                     static_cast<std::streamsize>(n * sizeof(T))));
}

} // namespace hoard::core::bin
