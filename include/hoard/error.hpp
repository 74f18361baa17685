#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; callers branch on the code, never on text.
 * - Human-readable message and originating component for diagnostics.
 * - Scan-level outcomes map onto the codes as follows:
 *     usage errors          -> not_initialized / precondition_failed / invalid_argument
 *     consistency errors    -> data_integrity
 *     scan already running  -> lock_contention
 *     cooperative abort     -> cancelled (expected termination, state rolled back)
 *     corrupt single item   -> item_invalid (skipped by the scan loop)
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace hoard::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  io_eof = 1002,
  config_invalid = 2001,
  data_integrity = 3001,
  item_invalid = 3002,
  precondition_failed = 4001,
  not_found = 6001,
  unavailable = 7001,
  lock_contention = 7002,
  cancelled = 8001,
  internal = 9001,
  invalid_argument = 9002,
  not_initialized = 9003,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "library.scan" */
};

/** \brief Shorthand for building an unexpected error value. */
inline auto fail(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

/** \brief Stable lowercase name of a code, used in log lines. */
constexpr auto to_string(error_code code) -> std::string_view {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::io_eof: return "io_eof";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::item_invalid: return "item_invalid";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::not_found: return "not_found";
    case error_code::unavailable: return "unavailable";
    case error_code::lock_contention: return "lock_contention";
    case error_code::cancelled: return "cancelled";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::not_initialized: return "not_initialized";
    case error_code::unsupported: return "unsupported";
  }
  return "internal";
}

} // namespace hoard::core
