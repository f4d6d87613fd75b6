#include "verity/c/verity.h"

#include <cstring>
#include <exception>
#include <memory>
#include <new>
#include <string>

#include "verity/error_mapping.hpp"
#include "verity/expression.hpp"

struct verity_expr_t_ {
  verity::expression expr;
};

struct verity_binding_t_ {
  verity::binding vars;
};

#include "verity_c_error.hpp"

thread_local std::string verity_c::g_last_error;
using verity_c::set_error;
using verity_c::clear_error;

namespace {

verity_status_t report(const verity::core::error& e) {
  set_error(e.component + ": " + e.message);
  return verity::core::to_c_status(e.code);
}

template <typename F>
verity_status_t guarded(const char* what, F&& body) {
  try {
    return body();
  } catch (const std::bad_alloc&) {
    set_error(std::string("allocation failure in ") + what);
    return VERITY_E_INTERNAL;
  } catch (const std::exception& e) {
    set_error(e.what());
    return VERITY_E_INTERNAL;
  }
}

verity_status_t set_value(verity_binding_t* binding, const char* name, verity::value v) {
  if (!binding || !name) return VERITY_E_INVALID_ARGUMENT;
  clear_error();
  return guarded("verity_binding_set", [&] {
    binding->vars.insert_or_assign(std::string(name), std::move(v));
    return VERITY_OK;
  });
}

} // namespace

extern "C" {

VERITY_C_API const char* verity_get_last_error(void) {
  return verity_c::g_last_error.c_str();
}

VERITY_C_API const char* verity_version(void) {
  return "0.1.0";
}

VERITY_C_API verity_status_t verity_expr_compile(const char* text, verity_expr_t** out_expr) {
  if (!text || !out_expr) return VERITY_E_INVALID_ARGUMENT;
  clear_error();
  return guarded("verity_expr_compile", [&] {
    auto compiled = verity::expression::compile(text, verity::parser::parse_options::from_env());
    if (!compiled) return report(compiled.error());
    *out_expr = new verity_expr_t_{std::move(*compiled)};
    return VERITY_OK;
  });
}

VERITY_C_API verity_status_t verity_expr_destroy(verity_expr_t* expr) {
  clear_error();
  delete expr;
  return VERITY_OK;
}

VERITY_C_API verity_status_t verity_expr_matches(const verity_expr_t* expr,
                                                 const verity_binding_t* binding,
                                                 int* out_match) {
  if (!expr || !binding || !out_match) return VERITY_E_INVALID_ARGUMENT;
  clear_error();
  return guarded("verity_expr_matches", [&] {
    auto hit = expr->expr.matches(binding->vars);
    if (!hit) return report(hit.error());
    *out_match = *hit ? 1 : 0;
    return VERITY_OK;
  });
}

VERITY_C_API verity_status_t verity_expr_to_string(const verity_expr_t* expr,
                                                   char* out_buffer, size_t buffer_size,
                                                   size_t* out_required_size) {
  if (!expr) return VERITY_E_INVALID_ARGUMENT;
  clear_error();
  return guarded("verity_expr_to_string", [&] {
    const std::string s = expr->expr.to_string();
    const size_t required = s.size() + 1; // include NUL
    if (out_required_size) *out_required_size = required;
    if (!out_buffer || buffer_size == 0) {
      // Size query only
      return VERITY_OK;
    }
    if (buffer_size < required) {
      set_error("buffer too small for expression text");
      return VERITY_E_OUT_OF_RANGE;
    }
    std::memcpy(out_buffer, s.c_str(), required);
    return VERITY_OK;
  });
}

VERITY_C_API verity_status_t verity_binding_create(verity_binding_t** out_binding) {
  if (!out_binding) return VERITY_E_INVALID_ARGUMENT;
  clear_error();
  return guarded("verity_binding_create", [&] {
    *out_binding = new verity_binding_t_{};
    return VERITY_OK;
  });
}

VERITY_C_API verity_status_t verity_binding_destroy(verity_binding_t* binding) {
  clear_error();
  delete binding;
  return VERITY_OK;
}

VERITY_C_API verity_status_t verity_binding_set_bool(verity_binding_t* binding, const char* name, int value) {
  return set_value(binding, name, verity::value{value != 0});
}

VERITY_C_API verity_status_t verity_binding_set_number(verity_binding_t* binding, const char* name, double value) {
  return set_value(binding, name, verity::value{value});
}

VERITY_C_API verity_status_t verity_binding_set_string(verity_binding_t* binding, const char* name, const char* value) {
  if (!value) return VERITY_E_INVALID_ARGUMENT;
  return set_value(binding, name, verity::value{std::string(value)});
}

} // extern "C"
