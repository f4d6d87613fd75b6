#pragma once

/** \file expression.hpp
 *  \brief Compiled rule expression: tokenize and parse once, evaluate many times.
 *
 * Example usage:
 * ```cpp
 * auto rule = verity::expression::compile("os == 'windows' and (arch .* 'x86' or !legacy)");
 * if (!rule) return std::unexpected(rule.error());
 *
 * verity::binding vars{{"os", std::string("windows")}, {"arch", std::string("x86_64")}};
 * auto hit = rule->matches(vars);   // std::expected<bool, core::error>
 * ```
 *
 * Thread-safety: a compiled expression is immutable; evaluate() and matches()
 * may be called concurrently with read-only bindings.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "verity/error.hpp"
#include "verity/expr_ast.hpp"
#include "verity/parser.hpp"
#include "verity/value.hpp"

namespace verity {

class expression {
public:
  /** \brief Tokenize and parse `text`.
   *
   * \param text Expression source
   * \param options Parser limits and tracing
   * \return Compiled expression or the first lexical/syntax error
   */
  static auto compile(std::string_view text, const parser::parse_options& options = {})
      -> std::expected<expression, core::error>;

  expression(expression&&) noexcept = default;
  expression& operator=(expression&&) noexcept = default;
  expression(const expression&) = delete;
  expression& operator=(const expression&) = delete;
  ~expression() = default;

  /** \brief Raw result; a bare terminal root yields a number or string. */
  auto evaluate(const binding& vars) const -> std::expected<value, core::error>;

  /** \brief Truthiness of evaluate(). */
  auto matches(const binding& vars) const -> std::expected<bool, core::error>;

  /** \brief Distinct variable names in first-appearance order, without `!`. */
  auto variables() const -> std::vector<std::string>;

  /** \brief Canonical prefix form of the tree (see verity::format). */
  auto to_string() const -> std::string { return format(*root_); }

  auto source() const noexcept -> const std::string& { return source_; }
  auto root() const noexcept -> const expr_node& { return *root_; }

private:
  expression(std::string source, std::unique_ptr<expr_node> root)
      : source_(std::move(source)), root_(std::move(root)) {}

  std::string source_;
  std::unique_ptr<expr_node> root_;
};

/** \brief A record to filter: an id and the binding it is evaluated against. */
struct record_view {
  std::uint64_t id;
  const binding* vars;
};

/** \brief Ids of records matching `expr`, in store order.
 *
 * A null expression matches every record. The first evaluation error aborts
 * the scan and is returned.
 */
auto apply_filter(const expression* expr, const std::vector<record_view>& store)
    -> std::expected<std::vector<std::uint64_t>, core::error>;

} // namespace verity
