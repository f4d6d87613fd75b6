/** \file parser.cpp
 *  \brief Recursive-descent parser over an immutable token vector.
 */

#include "verity/parser.hpp"

#include <algorithm>
#include <charconv>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

#include "verity/core/platform_utils.hpp"
#include "verity/tokenizer.hpp"

namespace verity::parser {

namespace {

using node_ptr = std::unique_ptr<expr_node>;
using node_result = std::expected<node_ptr, core::error>;

// A subtree together with its height. Terminals have height 1.
struct parsed {
  node_ptr node;
  std::size_t height{1};
};
using parsed_result = std::expected<parsed, core::error>;

auto fail(core::error_code code, std::string message) -> std::unexpected<core::error> {
  return std::unexpected(core::error{code, std::move(message), "parser"});
}

auto describe(const lexer::token& t) -> std::string {
  return "'" + t.text + "' at offset " + std::to_string(t.offset);
}

auto to_comparison_op(lexer::token_kind kind) noexcept -> comparison_op {
  switch (kind) {
    case lexer::token_kind::gt: return comparison_op::gt;
    case lexer::token_kind::gte: return comparison_op::gte;
    case lexer::token_kind::lt: return comparison_op::lt;
    case lexer::token_kind::lte: return comparison_op::lte;
    case lexer::token_kind::eq: return comparison_op::eq;
    case lexer::token_kind::neq: return comparison_op::neq;
    case lexer::token_kind::string_prefix: return comparison_op::starts_with;
    // Callers check is_comparison() first.
    case lexer::token_kind::number:
    case lexer::token_kind::string:
    case lexer::token_kind::variable:
    case lexer::token_kind::lparen:
    case lexer::token_kind::rparen:
    case lexer::token_kind::kw_and:
    case lexer::token_kind::kw_or:
    case lexer::token_kind::unrecognized:
      break;
  }
  return comparison_op::eq;
}

auto make_binary(logical_op op, node_ptr lhs, node_ptr rhs) -> node_ptr {
  return std::make_unique<expr_node>(expr_node{logical{op, std::move(lhs), std::move(rhs)}});
}

class cursor_parser {
public:
  cursor_parser(const std::vector<lexer::token>& tokens, const parse_options& options)
      : tokens_(tokens), options_(options) {}

  auto run() -> node_result {
    auto root = parse_expression();
    if (!root) return std::unexpected(std::move(root.error()));
    if (!at_end()) {
      const auto& t = peek();
      if (t.kind == lexer::token_kind::unrecognized) return unrecognized(t);
      return fail(core::error_code::syntax_error,
                  "expected operator or end of input, got " + describe(t));
    }
    return std::move(root->node);
  }

private:
  const std::vector<lexer::token>& tokens_;
  const parse_options& options_;
  std::size_t pos_{0};
  std::size_t depth_{0};

  auto at_end() const noexcept -> bool { return pos_ >= tokens_.size(); }
  auto peek() const noexcept -> const lexer::token& { return tokens_[pos_]; }
  auto check(lexer::token_kind kind) const noexcept -> bool { return !at_end() && peek().kind == kind; }
  auto advance() noexcept -> const lexer::token& { return tokens_[pos_++]; }

  static auto unrecognized(const lexer::token& t) -> std::unexpected<core::error> {
    return fail(core::error_code::unrecognized_token, "unrecognized token " + describe(t));
  }

  auto too_deep() const -> std::unexpected<core::error> {
    return fail(core::error_code::nesting_too_deep,
                "expression nesting exceeds " + std::to_string(options_.max_depth));
  }

  // Folds rhs into lhs. The tree height is capped at max_depth so that
  // evaluation, printing and destruction recurse a bounded number of times.
  auto fold(logical_op op, parsed& lhs, parsed rhs) -> bool {
    const std::size_t height = 1 + std::max(lhs.height, rhs.height);
    if (height > options_.max_depth) return false;
    lhs.node = make_binary(op, std::move(lhs.node), std::move(rhs.node));
    lhs.height = height;
    return true;
  }

  // Expression := AndTerm ( 'or' AndTerm )*
  auto parse_expression() -> parsed_result {
    if (++depth_ > options_.max_depth) return too_deep();
    auto lhs = parse_and_term();
    if (!lhs) return lhs;
    while (check(lexer::token_kind::kw_or)) {
      advance();
      auto rhs = parse_and_term();
      if (!rhs) return rhs;
      if (!fold(logical_op::or_op, *lhs, std::move(*rhs))) return too_deep();
    }
    --depth_;
    return lhs;
  }

  // AndTerm := Condition ( 'and' Condition )*
  auto parse_and_term() -> parsed_result {
    auto lhs = parse_condition();
    if (!lhs) return lhs;
    while (check(lexer::token_kind::kw_and)) {
      advance();
      auto rhs = parse_condition();
      if (!rhs) return rhs;
      if (!fold(logical_op::and_op, *lhs, std::move(*rhs))) return too_deep();
    }
    return lhs;
  }

  // Condition := '(' Expression ')' | Terminal [ ComparisonOp Terminal ]
  auto parse_condition() -> parsed_result {
    if (check(lexer::token_kind::lparen)) {
      advance();
      auto inner = parse_expression();
      if (!inner) return inner;
      if (at_end()) {
        return fail(core::error_code::syntax_error, "expected ')' but reached end of input");
      }
      const auto& t = peek();
      if (t.kind == lexer::token_kind::unrecognized) return unrecognized(t);
      if (t.kind != lexer::token_kind::rparen) {
        return fail(core::error_code::syntax_error, "expected ')', got " + describe(t));
      }
      advance();
      return inner;
    }

    auto lhs = parse_terminal();
    if (!lhs) return std::unexpected(std::move(lhs.error()));
    if (at_end() || !lexer::is_comparison(peek().kind)) return parsed{std::move(*lhs), 1};

    const comparison_op op = to_comparison_op(advance().kind);
    auto rhs = parse_terminal();
    if (!rhs) return std::unexpected(std::move(rhs.error()));
    if (options_.max_depth < 2) return too_deep();
    return parsed{std::make_unique<expr_node>(expr_node{comparison{op, std::move(*lhs), std::move(*rhs)}}), 2};
  }

  // Terminal := NUMBER | STRING | VARIABLE
  auto parse_terminal() -> node_result {
    if (at_end()) {
      return fail(core::error_code::syntax_error,
                  "expected number, string or variable but reached end of input");
    }
    const auto& t = peek();
    switch (t.kind) {
      case lexer::token_kind::number: {
        double v{};
        if (!lexer::parse_number(t.text, v)) {
          return std::unexpected(core::error{core::error_code::internal,
                                             "number token does not parse: " + describe(t), "parser"});
        }
        advance();
        return std::make_unique<expr_node>(expr_node{number_literal{v}});
      }
      case lexer::token_kind::string:
        advance();
        return std::make_unique<expr_node>(expr_node{string_literal{lexer::unquote(t.text)}});
      case lexer::token_kind::variable: {
        advance();
        variable_ref ref{t.text, false};
        if (!ref.name.empty() && ref.name.front() == '!') {
          ref.name.erase(0, 1);
          ref.negated = true;
        }
        return std::make_unique<expr_node>(expr_node{std::move(ref)});
      }
      case lexer::token_kind::unrecognized:
        return unrecognized(t);
      default:
        return fail(core::error_code::syntax_error,
                    std::string("expected number, string or variable, got ") + lexer::to_string(t.kind) +
                        " at offset " + std::to_string(t.offset));
    }
  }
};

void trace_tokens(const std::vector<lexer::token>& tokens) {
  std::cerr << "[verity][parser] " << tokens.size() << " tokens:";
  for (const auto& t : tokens) {
    std::cerr << ' ' << lexer::to_string(t.kind) << '@' << t.offset << "=" << t.text;
  }
  std::cerr << std::endl;
}

} // namespace

auto parse_options::from_env() -> parse_options {
  parse_options opts{};
  if (auto v = core::safe_getenv("VERITY_MAX_DEPTH")) {
    std::size_t depth{};
    const char* first = v->data();
    const char* last = first + v->size();
    auto [ptr, ec] = std::from_chars(first, last, depth);
    if (ec == std::errc{} && ptr == last && depth > 0) opts.max_depth = depth;
  }
  opts.trace = core::env_flag("VERITY_TRACE");
  return opts;
}

auto parse(const std::vector<lexer::token>& tokens, const parse_options& options)
    -> std::expected<std::unique_ptr<expr_node>, core::error> {
  const bool trace = options.trace || core::env_flag("VERITY_TRACE");
  if (trace) trace_tokens(tokens);

  cursor_parser p(tokens, options);
  auto root = p.run();

  if (trace) {
    if (root) {
      std::cerr << "[verity][parser] tree: " << format(**root) << std::endl;
    } else {
      std::cerr << "[verity][parser] error: " << core::to_string(root.error().code)
                << ": " << root.error().message << std::endl;
    }
  }
  return root;
}

} // namespace verity::parser
