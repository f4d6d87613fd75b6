#pragma once

/** \file parser.hpp
 *  \brief Recursive-descent parser from tokens to an expression tree.
 *
 * Grammar (loosest binding first):
 * ```
 * Expression   := AndTerm ( 'or' AndTerm )*
 * AndTerm      := Condition ( 'and' Condition )*
 * Condition    := '(' Expression ')' | Terminal [ ComparisonOp Terminal ]
 * Terminal     := NUMBER | STRING | VARIABLE
 * ComparisonOp := '>' | '>=' | '<' | '<=' | '==' | '!=' | '.*'
 * ```
 * Binary operators fold left. The whole token sequence must be consumed.
 */

#include <cstddef>
#include <expected>
#include <memory>
#include <vector>

#include "verity/error.hpp"
#include "verity/expr_ast.hpp"
#include "verity/token.hpp"

namespace verity::parser {

/** \brief Parser configuration. */
struct parse_options {
  std::size_t max_depth{128}; /**< maximum parenthesis nesting and tree height */
  bool trace{false};          /**< dump tokens and tree to stderr */

  /** \brief Defaults overridden by VERITY_MAX_DEPTH and VERITY_TRACE. */
  static auto from_env() -> parse_options;
};

/** \brief Parse a token sequence.
 *
 * \param tokens Output of lexer::tokenize
 * \param options Depth limit and tracing
 * \return Root of the tree, or syntax_error / unrecognized_token / nesting_too_deep
 */
auto parse(const std::vector<lexer::token>& tokens, const parse_options& options = {})
    -> std::expected<std::unique_ptr<expr_node>, core::error>;

} // namespace verity::parser
