#pragma once

/** \file evaluator.hpp
 *  \brief Tree-walking evaluation of an expression against a binding.
 *
 * Evaluation is a pure walk: the tree is never mutated and nothing is cached,
 * so one tree may be evaluated concurrently against different bindings.
 *
 * Semantics:
 * - Missing variables evaluate to `false`; `!name` yields `!truthy(lookup)`.
 * - `> >= < <=` order number/number, string/string (bytewise) and bool/bool;
 *   other pairings fail with type_mismatch.
 * - `== !=` compare structurally; values of different types are unequal.
 * - `.*` requires two strings and tests whether the left starts with the right.
 * - `and`/`or` always evaluate both sides and combine their truthiness.
 */

#include <expected>

#include "verity/error.hpp"
#include "verity/expr_ast.hpp"
#include "verity/value.hpp"

namespace verity::eval {

/** \brief Evaluate `root` against `vars`. Errors are type_mismatch only. */
auto evaluate(const expr_node& root, const binding& vars) -> std::expected<value, core::error>;

} // namespace verity::eval
