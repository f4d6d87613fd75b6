#pragma once

/** \file tokenizer.hpp
 *  \brief Split-based tokenizer for rule expressions.
 *
 * The source is cut at operator delimiters, which are kept as tokens. The
 * remaining fragments are trimmed, empty ones dropped, and each is classified
 * as string, number, variable or unrecognized. Tokenization itself never
 * fails: malformed fragments are tagged and left for the parser to reject.
 *
 * Delimiters, in match priority (two-character operators before their
 * one-character prefixes):
 *   and  or  !=  ==  <=  >=  <  >  (  )  .*
 * The keywords only match as whole words.
 */

#include <string>
#include <string_view>
#include <vector>

#include "verity/token.hpp"

namespace verity::lexer {

/** \brief Tokenize an expression; whitespace-only fragments are dropped. */
auto tokenize(std::string_view source) -> std::vector<token>;

/** \brief Classify a single trimmed, non-delimiter fragment. */
auto classify(std::string_view fragment) noexcept -> token_kind;

/** \brief Inner content of a quoted string token text. */
auto unquote(std::string_view text) -> std::string;

/** \brief Parse a complete decimal floating-point literal; false if `text` is not one.
 *
 *  Literals beyond the range of double saturate: overflow yields +/-infinity
 *  and underflow yields +/-0. The spellings "inf" and "nan" are not numbers.
 */
auto parse_number(std::string_view text, double& out) noexcept -> bool;

} // namespace verity::lexer
