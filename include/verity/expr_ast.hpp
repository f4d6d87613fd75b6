#pragma once

/** \file expr_ast.hpp
 *  \brief Expression tree for rule predicates.
 *
 * One struct per node kind, held in a closed variant. Operator nodes own
 * exactly two children; the parser never hands out a tree with a null child.
 * Ownership: the tree is move-only and exclusively owned by its root.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

namespace verity {

struct expr_node;

/** \brief Ordering, equality and starts-with operators. */
enum class comparison_op : std::uint8_t { gt, gte, lt, lte, eq, neq, starts_with };

/** \brief Boolean connectives. */
enum class logical_op : std::uint8_t { and_op, or_op };

struct number_literal {
  double value{};
};

struct string_literal {
  std::string value; /**< unquoted content */
};

/** \brief Variable lookup; `negated` when the source name carried a leading `!`. */
struct variable_ref {
  std::string name; /**< name without the negation marker */
  bool negated{false};
};

struct comparison {
  comparison_op op{comparison_op::eq};
  std::unique_ptr<expr_node> left;
  std::unique_ptr<expr_node> right;
};

struct logical {
  logical_op op{logical_op::and_op};
  std::unique_ptr<expr_node> left;
  std::unique_ptr<expr_node> right;
};

/** \brief Recursive expression node. */
struct expr_node {
  std::variant<number_literal, string_literal, variable_ref, comparison, logical> node;
};

/** \brief Operator spelling as written in source, e.g. ">=" or "and". */
auto to_string(comparison_op op) noexcept -> const char*;
auto to_string(logical_op op) noexcept -> const char*;

/** \brief Canonical prefix form, e.g. `(or (and a b) (>= age 18))`.
 *
 * Numbers print in shortest round-trip form, strings double-quoted,
 * negated variables with their leading `!`.
 */
auto format(const expr_node& node) -> std::string;

/** \brief Structural equality of two trees. */
auto same_shape(const expr_node& a, const expr_node& b) noexcept -> bool;

} // namespace verity
