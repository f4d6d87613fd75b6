#include "verity/expr_ast.hpp"

#include <array>
#include <charconv>
#include <system_error>
#include <type_traits>

namespace verity {

auto to_string(comparison_op op) noexcept -> const char* {
  switch (op) {
    case comparison_op::gt: return ">";
    case comparison_op::gte: return ">=";
    case comparison_op::lt: return "<";
    case comparison_op::lte: return "<=";
    case comparison_op::eq: return "==";
    case comparison_op::neq: return "!=";
    case comparison_op::starts_with: return ".*";
  }
  return "?";
}

auto to_string(logical_op op) noexcept -> const char* {
  return op == logical_op::and_op ? "and" : "or";
}

static void format_number(double v, std::string& out) {
  std::array<char, 32> buf{};
  auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), v);
  if (ec == std::errc{}) out.append(buf.data(), ptr);
  else out += std::to_string(v);
}

static void format_impl(const expr_node& e, std::string& out) {
  std::visit([&out](const auto& n) {
    using T = std::decay_t<decltype(n)>;
    if constexpr (std::is_same_v<T, number_literal>) {
      format_number(n.value, out);
    } else if constexpr (std::is_same_v<T, string_literal>) {
      out += '"';
      out += n.value;
      out += '"';
    } else if constexpr (std::is_same_v<T, variable_ref>) {
      if (n.negated) out += '!';
      out += n.name;
    } else {
      out += '(';
      out += to_string(n.op);
      out += ' ';
      format_impl(*n.left, out);
      out += ' ';
      format_impl(*n.right, out);
      out += ')';
    }
  }, e.node);
}

auto format(const expr_node& node) -> std::string {
  std::string out;
  format_impl(node, out);
  return out;
}

auto same_shape(const expr_node& a, const expr_node& b) noexcept -> bool {
  if (a.node.index() != b.node.index()) return false;
  return std::visit([&b](const auto& lhs) -> bool {
    using T = std::decay_t<decltype(lhs)>;
    const auto& rhs = std::get<T>(b.node);
    if constexpr (std::is_same_v<T, number_literal>) {
      return lhs.value == rhs.value;
    } else if constexpr (std::is_same_v<T, string_literal>) {
      return lhs.value == rhs.value;
    } else if constexpr (std::is_same_v<T, variable_ref>) {
      return lhs.negated == rhs.negated && lhs.name == rhs.name;
    } else {
      return lhs.op == rhs.op && same_shape(*lhs.left, *rhs.left) && same_shape(*lhs.right, *rhs.right);
    }
  }, a.node);
}

} // namespace verity
