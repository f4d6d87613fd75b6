#pragma once

/** \file token.hpp
 *  \brief Lexical tokens produced by the expression tokenizer.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace verity::lexer {

/** \brief Token classification. */
enum class token_kind : std::uint8_t {
  number,
  string,
  variable,
  gt,
  gte,
  lt,
  lte,
  eq,
  neq,
  string_prefix, /**< `.*` starts-with operator */
  lparen,
  rparen,
  kw_and,
  kw_or,
  unrecognized,  /**< fragment matching no known shape; rejected by the parser when consumed */
};

/** \brief A classified fragment of the source text. */
struct token {
  token_kind kind{token_kind::unrecognized};
  std::string text;      /**< trimmed source fragment (quotes included for strings) */
  std::size_t offset{0}; /**< byte offset of the fragment in the source */
};

/** \brief Human-readable name of a token kind, e.g. "variable" or "'>='". */
auto to_string(token_kind kind) noexcept -> const char*;

/** \brief True for `>`, `>=`, `<`, `<=`, `==`, `!=` and `.*`. */
constexpr bool is_comparison(token_kind kind) noexcept {
  switch (kind) {
    case token_kind::gt:
    case token_kind::gte:
    case token_kind::lt:
    case token_kind::lte:
    case token_kind::eq:
    case token_kind::neq:
    case token_kind::string_prefix:
      return true;
    default:
      return false;
  }
}

} // namespace verity::lexer
