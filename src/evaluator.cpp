#include "verity/evaluator.hpp"

#include <string>
#include <type_traits>

namespace verity::eval {

namespace {

using result = std::expected<value, core::error>;

auto type_error(comparison_op op, const value& l, const value& r) -> std::unexpected<core::error> {
  return std::unexpected(core::error{
      core::error_code::type_mismatch,
      std::string("cannot apply '") + to_string(op) + "' to " + type_name(l) + " and " + type_name(r),
      "eval"});
}

template <typename T>
auto ordered(comparison_op op, const T& a, const T& b) noexcept -> bool {
  switch (op) {
    case comparison_op::gt: return a > b;
    case comparison_op::gte: return a >= b;
    case comparison_op::lt: return a < b;
    case comparison_op::lte: return a <= b;
    // compare() settles these before ordering.
    case comparison_op::eq:
    case comparison_op::neq:
    case comparison_op::starts_with:
      break;
  }
  return false;
}

auto compare(comparison_op op, const value& l, const value& r) -> result {
  switch (op) {
    case comparison_op::eq:
      return value{l == r};
    case comparison_op::neq:
      return value{l != r};
    case comparison_op::starts_with: {
      const auto* s = std::get_if<std::string>(&l);
      const auto* prefix = std::get_if<std::string>(&r);
      if (!s || !prefix) return type_error(op, l, r);
      return value{s->starts_with(*prefix)};
    }
    case comparison_op::gt:
    case comparison_op::gte:
    case comparison_op::lt:
    case comparison_op::lte:
      break;
  }

  if (l.index() != r.index()) return type_error(op, l, r);
  return std::visit([op, &r](const auto& a) -> result {
    using T = std::decay_t<decltype(a)>;
    return value{ordered(op, a, std::get<T>(r))};
  }, l);
}

auto eval_node(const expr_node& e, const binding& vars) -> result {
  return std::visit([&vars](const auto& n) -> result {
    using T = std::decay_t<decltype(n)>;
    if constexpr (std::is_same_v<T, number_literal>) {
      return value{n.value};
    } else if constexpr (std::is_same_v<T, string_literal>) {
      return value{n.value};
    } else if constexpr (std::is_same_v<T, variable_ref>) {
      auto it = vars.find(n.name);
      if (it == vars.end()) return value{n.negated};
      if (n.negated) return value{!truthy(it->second)};
      return it->second;
    } else if constexpr (std::is_same_v<T, comparison>) {
      auto lhs = eval_node(*n.left, vars);
      if (!lhs) return lhs;
      auto rhs = eval_node(*n.right, vars);
      if (!rhs) return rhs;
      return compare(n.op, *lhs, *rhs);
    } else {
      // Both sides are always evaluated.
      auto lhs = eval_node(*n.left, vars);
      if (!lhs) return lhs;
      auto rhs = eval_node(*n.right, vars);
      if (!rhs) return rhs;
      const bool l = truthy(*lhs);
      const bool r = truthy(*rhs);
      return value{n.op == logical_op::and_op ? (l && r) : (l || r)};
    }
  }, e.node);
}

} // namespace

auto evaluate(const expr_node& root, const binding& vars) -> std::expected<value, core::error> {
  return eval_node(root, vars);
}

} // namespace verity::eval
