#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling by API and worker layers.
 * - Human-readable message and originating component for diagnostics.
 * - Structural errors (not found, conflict, forbidden, dimension mismatch) are raised
 *   before any write; lock errors are retryable by resubmission.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace embdb::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  config_invalid = 2001,
  data_integrity = 3001,
  precondition_failed = 4001,
  not_found = 6001,
  already_exists = 6002,
  collection_not_found = 6101,
  create_collection_conflict = 6102,
  delete_blue_forbidden = 6103,
  dimension_mismatch = 6104,
  unavailable = 7001,
  lock_not_available = 7101,
  lock_acquisition_failed = 7102,
  internal = 9001,
  invalid_argument = 9002,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "store.memory" */
};

/** \brief Stable lower-case name of an error code (for logs and API mapping). */
auto to_string(error_code code) -> std::string_view;

/** \brief True for errors a caller may resolve by resubmitting the same request. */
inline bool is_retryable(const error& e) noexcept {
  return e.code == error_code::lock_acquisition_failed || e.code == error_code::lock_not_available;
}

inline auto make_error(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

} // namespace embdb::core
