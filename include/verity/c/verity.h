#ifndef VERITY_C_H
#define VERITY_C_H

#ifdef __cplusplus
extern "C" {
#endif

// Symbol visibility
#if defined(_WIN32)
  #if defined(VERITY_C_API_EXPORTS)
    #define VERITY_C_API __declspec(dllexport)
  #else
    #define VERITY_C_API __declspec(dllimport)
  #endif
#else
  #define VERITY_C_API __attribute__((visibility("default")))
#endif

#include <stddef.h>
#include <stdint.h>

// VERITY_C_ABI_VERSION increments on incompatible changes.
#define VERITY_C_ABI_VERSION 1

// Status codes (mirror verity::core::error_code)
typedef enum {
  VERITY_OK = 0,
  VERITY_E_INTERNAL = 9001,
  VERITY_E_INVALID_ARGUMENT = 9002,
  VERITY_E_OUT_OF_RANGE = 9004,
  VERITY_E_UNRECOGNIZED_TOKEN = 10001,
  VERITY_E_SYNTAX = 10002,
  VERITY_E_TYPE_MISMATCH = 10003,
  VERITY_E_NESTING_TOO_DEEP = 10004
} verity_status_t;

// Opaque handles
// - Ownership: handles returned through out-parameters belong to the caller; release with *_destroy().
typedef struct verity_expr_t_ verity_expr_t;
typedef struct verity_binding_t_ verity_binding_t;

// Thread-local description of the last failure on this thread ("" if none)
VERITY_C_API const char* verity_get_last_error(void);

// Version info (semantic version string)
VERITY_C_API const char* verity_version(void);

// Expressions. Compilation honours VERITY_MAX_DEPTH and VERITY_TRACE.
VERITY_C_API verity_status_t verity_expr_compile(const char* text, verity_expr_t** out_expr);
VERITY_C_API verity_status_t verity_expr_destroy(verity_expr_t* expr);

// Evaluate and write the truthiness of the result (0 or 1) to out_match.
// A compiled expression may be evaluated from several threads at once.
VERITY_C_API verity_status_t verity_expr_matches(const verity_expr_t* expr,
                                                 const verity_binding_t* binding,
                                                 int* out_match);

// Canonical form of the parsed tree. Pass out_buffer == NULL to query the size;
// out_required_size includes the NUL terminator.
VERITY_C_API verity_status_t verity_expr_to_string(const verity_expr_t* expr,
                                                   char* out_buffer, size_t buffer_size,
                                                   size_t* out_required_size);

// Variable bindings. Setting an existing name replaces its value.
VERITY_C_API verity_status_t verity_binding_create(verity_binding_t** out_binding);
VERITY_C_API verity_status_t verity_binding_destroy(verity_binding_t* binding);
VERITY_C_API verity_status_t verity_binding_set_bool(verity_binding_t* binding, const char* name, int value);
VERITY_C_API verity_status_t verity_binding_set_number(verity_binding_t* binding, const char* name, double value);
VERITY_C_API verity_status_t verity_binding_set_string(verity_binding_t* binding, const char* name, const char* value);

#ifdef __cplusplus
} // extern "C"
#endif

#endif // VERITY_C_H
