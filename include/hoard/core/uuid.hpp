#pragma once

/** \file uuid.hpp
 *  \brief Random (version 4) UUIDs in canonical 8-4-4-4-12 text form.
 */

#include <string>
#include <string_view>

namespace hoard::core {

/** \brief Generate a fresh random UUID. Thread-safe. */
auto make_uuid() -> std::string;

/** \brief True if \p s is a canonical lowercase/uppercase hex UUID string. */
auto is_uuid(std::string_view s) noexcept -> bool;

} // namespace hoard::core
