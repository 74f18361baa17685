#pragma once

/** \file atomic_file.hpp
 *  \brief Crash-safe whole-file replacement for small state files.
 *
 * Atomic, durable save:
 * - Write contents to a temporary sibling file (<name>.tmp) in the same directory
 * - fsync(tmp)
 * - std::filesystem::rename(tmp, dst) (rename(2), replaces if exists)
 * - Best-effort fsync of the parent directory
 * - On failure, the temporary is removed and io_failed is returned; the previous
 *   contents of dst are left untouched.
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "hoard/error.hpp"

namespace hoard::core {

auto write_file_atomic(const std::filesystem::path& dst, std::string_view contents)
    -> std::expected<void, error>;

/** \brief Read a whole file; not_found when it does not exist. */
auto read_file(const std::filesystem::path& src) -> std::expected<std::string, error>;

} // namespace hoard::core
