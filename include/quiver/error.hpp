#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; values never change once published.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace quiver::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  io_eof = 1002,
  data_integrity = 3001,
  dimension_mismatch = 4001,
  insufficient_data = 4002,
  column_resolution = 4003,
  index_exists = 5001,
  build_in_progress = 5002,
  index_not_found = 6001,
  cancelled = 8001,
  internal = 9001,
  invalid_parameter = 9002,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "index.ivf_pq" */
};

/** \brief Stable, lowercase name of an error code (used in logs). */
constexpr auto to_string(error_code ec) noexcept -> std::string_view {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::io_eof: return "io_eof";
    case error_code::data_integrity: return "data_integrity";
    case error_code::dimension_mismatch: return "dimension_mismatch";
    case error_code::insufficient_data: return "insufficient_data";
    case error_code::column_resolution: return "column_resolution";
    case error_code::index_exists: return "index_exists";
    case error_code::build_in_progress: return "build_in_progress";
    case error_code::index_not_found: return "index_not_found";
    case error_code::cancelled: return "cancelled";
    case error_code::internal: return "internal";
    case error_code::invalid_parameter: return "invalid_parameter";
    case error_code::unsupported: return "unsupported";
  }
  return "unknown";
}

/** \brief Shorthand for building an unexpected error value. */
inline auto make_error(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

} // namespace quiver::core
