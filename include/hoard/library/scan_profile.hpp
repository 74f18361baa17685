#pragma once

/** \file scan_profile.hpp
 *  \brief Persisted relative-path -> uuid map; the record of what is embedded.
 *
 * File format, one entry per line after the header:
 *   hoard-scan-profile v1
 *   <uuid>\t<relative path>
 */

#include <cstddef>
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "hoard/error.hpp"

namespace hoard::library {

class ScanProfile {
public:
    using Map = std::map<std::string, std::string>;

    /** \brief Load \p file; an absent file yields an empty profile. */
    static auto load(const std::filesystem::path& file) -> std::expected<ScanProfile, core::error>;

    /** \brief Atomic replace of \p file (temp + fsync + rename). */
    auto save(const std::filesystem::path& file) const -> std::expected<void, core::error>;

    [[nodiscard]] bool contains(const std::string& rel_path) const { return entries_.contains(rel_path); }
    [[nodiscard]] auto uuid_of(const std::string& rel_path) const -> std::optional<std::string>;

    void set(const std::string& rel_path, const std::string& uuid) { entries_[rel_path] = uuid; }
    bool erase(const std::string& rel_path) { return entries_.erase(rel_path) > 0; }
    void clear() noexcept { entries_.clear(); }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] const Map& entries() const noexcept { return entries_; }

private:
    Map entries_;
};

} // namespace hoard::library
