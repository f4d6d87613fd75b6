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

namespace verity::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  internal = 9001,
  invalid_argument = 9002,
  out_of_range = 9004,
  unrecognized_token = 10001, /**< malformed fragment consumed by the parser */
  syntax_error = 10002,       /**< grammar violation */
  type_mismatch = 10003,      /**< operator applied to incompatible values */
  nesting_too_deep = 10004,   /**< parse_options::max_depth exceeded */
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "parser" */
};

/** \brief Short stable name of an error code, e.g. "syntax_error". */
auto to_string(error_code ec) noexcept -> const char*;

} // namespace verity::core
