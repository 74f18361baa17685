#pragma once

/** \file library_metadata.hpp
 *  \brief Identity and scan timestamp of a library, stored as key=value text.
 *
 * File format:
 *   hoard-library v1
 *   uuid=<uuid>
 *   name=<display name>
 *   type=image
 *   last_scanned=YYYY-MM-DD HH:MM:SS     (empty before the first scan)
 */

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include "hoard/error.hpp"

namespace hoard::library {

struct LibraryMetadata {
    std::string uuid;
    std::string name;
    std::string type{"image"};
    std::string last_scanned;

    /** \brief Load from \p file; not_found when absent, data_integrity when malformed. */
    static auto load(const std::filesystem::path& file) -> std::expected<LibraryMetadata, core::error>;

    /** \brief Atomic replace of \p file. */
    auto save(const std::filesystem::path& file) const -> std::expected<void, core::error>;
};

/** \brief Local time formatted as "YYYY-MM-DD HH:MM:SS". */
auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string;

/** \brief Inverse of format_timestamp(); nullopt on malformed text. */
auto parse_timestamp(const std::string& text) -> std::optional<std::chrono::system_clock::time_point>;

} // namespace hoard::library
