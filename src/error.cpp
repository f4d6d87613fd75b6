#include "verity/error.hpp"

namespace verity::core {

auto to_string(error_code ec) noexcept -> const char* {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::out_of_range: return "out_of_range";
    case error_code::unrecognized_token: return "unrecognized_token";
    case error_code::syntax_error: return "syntax_error";
    case error_code::type_mismatch: return "type_mismatch";
    case error_code::nesting_too_deep: return "nesting_too_deep";
  }
  return "unknown";
}

} // namespace verity::core
