#pragma once

#include "verity/error.hpp"
#include "verity/c/verity.h"

namespace verity::core {

constexpr verity_status_t to_c_status(error_code ec) {
  switch (ec) {
    case error_code::ok: return VERITY_OK;
    case error_code::internal: return VERITY_E_INTERNAL;
    case error_code::invalid_argument: return VERITY_E_INVALID_ARGUMENT;
    case error_code::out_of_range: return VERITY_E_OUT_OF_RANGE;
    case error_code::unrecognized_token: return VERITY_E_UNRECOGNIZED_TOKEN;
    case error_code::syntax_error: return VERITY_E_SYNTAX;
    case error_code::type_mismatch: return VERITY_E_TYPE_MISMATCH;
    case error_code::nesting_too_deep: return VERITY_E_NESTING_TOO_DEEP;
  }
  return VERITY_E_INTERNAL;
}

constexpr error_code from_c_status(verity_status_t st) {
  switch (st) {
    case VERITY_OK: return error_code::ok;
    case VERITY_E_INTERNAL: return error_code::internal;
    case VERITY_E_INVALID_ARGUMENT: return error_code::invalid_argument;
    case VERITY_E_OUT_OF_RANGE: return error_code::out_of_range;
    case VERITY_E_UNRECOGNIZED_TOKEN: return error_code::unrecognized_token;
    case VERITY_E_SYNTAX: return error_code::syntax_error;
    case VERITY_E_TYPE_MISMATCH: return error_code::type_mismatch;
    case VERITY_E_NESTING_TOO_DEEP: return error_code::nesting_too_deep;
    default: return error_code::internal;
  }
}

} // namespace verity::core
