#pragma once

/** \file log.hpp
 *  \brief Tagged diagnostic lines on stderr.
 *
 * Lines look like "[hoard][scan] Library scanned, found 12 files".
 * - HOARD_QUIET=1 suppresses info lines (warnings are always printed)
 * - HOARD_DEBUG=1 enables debug lines
 */

#include <iostream>
#include <string_view>

#include "hoard/core/platform_utils.hpp"

namespace hoard::core {

inline bool log_quiet() {
    static const bool quiet = env_flag("HOARD_QUIET");
    return quiet;
}

inline bool log_debug_enabled() {
    static const bool dbg = env_flag("HOARD_DEBUG");
    return dbg;
}

inline void log_info(std::string_view tag, std::string_view msg) {
    if (log_quiet()) return;
    std::cerr << "[hoard][" << tag << "] " << msg << '\n';
}

inline void log_warn(std::string_view tag, std::string_view msg) {
    std::cerr << "[hoard][" << tag << "][warn] " << msg << '\n';
}

inline void log_debug(std::string_view tag, std::string_view msg) {
    if (!log_debug_enabled()) return;
    std::cerr << "[hoard][" << tag << "][debug] " << msg << std::endl;
}

} // namespace hoard::core
