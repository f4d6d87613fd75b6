/** \file expression.cpp
 *  \brief Compiled expression facade and batch filtering.
 */

#include "verity/expression.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>

#include "verity/evaluator.hpp"
#include "verity/tokenizer.hpp"

namespace verity {

namespace {

void collect_variables(const expr_node& e, std::vector<std::string>& out) {
  std::visit([&out](const auto& n) {
    using T = std::decay_t<decltype(n)>;
    if constexpr (std::is_same_v<T, variable_ref>) {
      if (std::find(out.begin(), out.end(), n.name) == out.end()) out.push_back(n.name);
    } else if constexpr (std::is_same_v<T, comparison> || std::is_same_v<T, logical>) {
      collect_variables(*n.left, out);
      collect_variables(*n.right, out);
    }
  }, e.node);
}

} // namespace

auto expression::compile(std::string_view text, const parser::parse_options& options)
    -> std::expected<expression, core::error> {
  auto tokens = lexer::tokenize(text);
  auto root = parser::parse(tokens, options);
  if (!root) return std::unexpected(std::move(root.error()));
  return expression(std::string(text), std::move(*root));
}

auto expression::evaluate(const binding& vars) const -> std::expected<value, core::error> {
  return eval::evaluate(*root_, vars);
}

auto expression::matches(const binding& vars) const -> std::expected<bool, core::error> {
  auto v = evaluate(vars);
  if (!v) return std::unexpected(std::move(v.error()));
  return truthy(*v);
}

auto expression::variables() const -> std::vector<std::string> {
  std::vector<std::string> names;
  collect_variables(*root_, names);
  return names;
}

auto apply_filter(const expression* expr, const std::vector<record_view>& store)
    -> std::expected<std::vector<std::uint64_t>, core::error> {
  std::vector<std::uint64_t> ids;
  ids.reserve(store.size());
  if (!expr) {
    for (const auto& r : store) ids.push_back(r.id);
    return ids;
  }
  static const binding empty{};
  for (const auto& r : store) {
    auto hit = expr->matches(r.vars ? *r.vars : empty);
    if (!hit) {
      auto err = std::move(hit.error());
      err.message = "record " + std::to_string(r.id) + ": " + err.message;
      return std::unexpected(std::move(err));
    }
    if (*hit) ids.push_back(r.id);
  }
  return ids;
}

} // namespace verity
