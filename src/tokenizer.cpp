/** \file tokenizer.cpp
 *  \brief Delimiter-splitting tokenizer and fragment classification.
 */

#include "verity/tokenizer.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <system_error>

namespace verity::lexer {

namespace {

struct delimiter {
  std::string_view text;
  token_kind kind;
  bool keyword;
};

// Order matters: the first delimiter matching at a position wins.
constexpr std::array<delimiter, 11> kDelimiters{{
    {"and", token_kind::kw_and, true},
    {"or", token_kind::kw_or, true},
    {"!=", token_kind::neq, false},
    {"==", token_kind::eq, false},
    {"<=", token_kind::lte, false},
    {">=", token_kind::gte, false},
    {"<", token_kind::lt, false},
    {">", token_kind::gt, false},
    {"(", token_kind::lparen, false},
    {")", token_kind::rparen, false},
    {".*", token_kind::string_prefix, false},
}};

inline bool is_word_char(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

inline bool is_variable_char(char c) noexcept {
  return is_word_char(c) || c == '-' || c == '!';
}

inline bool is_space(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Returns the delimiter matching at `pos`, or nullptr.
auto match_delimiter(std::string_view s, std::size_t pos) noexcept -> const delimiter* {
  for (const auto& d : kDelimiters) {
    if (s.compare(pos, d.text.size(), d.text) != 0) continue;
    if (d.keyword) {
      const std::size_t end = pos + d.text.size();
      if (pos > 0 && is_word_char(s[pos - 1])) continue;
      if (end < s.size() && is_word_char(s[end])) continue;
    }
    return &d;
  }
  return nullptr;
}

void push_fragment(std::string_view source, std::size_t begin, std::size_t end,
                   std::vector<token>& out) {
  while (begin < end && is_space(source[begin])) ++begin;
  while (end > begin && is_space(source[end - 1])) --end;
  if (begin == end) return;
  const auto fragment = source.substr(begin, end - begin);
  out.push_back(token{classify(fragment), std::string(fragment), begin});
}

// from_chars reports overflow and underflow alike as result_out_of_range.
// The two lie hundreds of decades apart, so the sign of the literal's
// decimal magnitude tells them apart.
auto overflows(std::string_view literal) noexcept -> bool {
  const auto e = literal.find_first_of("eE");
  const std::string_view mantissa = literal.substr(0, e);
  long long exponent = 0;
  if (e != std::string_view::npos) {
    std::string_view digits = literal.substr(e + 1);
    if (!digits.empty() && digits.front() == '+') digits.remove_prefix(1);
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), exponent);
    if (ec == std::errc::result_out_of_range) return !digits.empty() && digits.front() != '-';
  }
  const auto dot = mantissa.find('.');
  const std::string_view whole = mantissa.substr(0, dot);
  const auto lead = whole.find_first_not_of("-0");
  if (lead != std::string_view::npos) {
    return exponent > -static_cast<long long>(whole.size() - lead);
  }
  const std::string_view fraction =
      dot == std::string_view::npos ? std::string_view{} : mantissa.substr(dot + 1);
  const auto zeros = fraction.find_first_not_of('0');
  if (zeros == std::string_view::npos) return false;
  return exponent > static_cast<long long>(zeros);
}

} // namespace

auto tokenize(std::string_view source) -> std::vector<token> {
  std::vector<token> tokens;
  std::size_t fragment_start = 0;
  std::size_t pos = 0;
  while (pos < source.size()) {
    const delimiter* d = match_delimiter(source, pos);
    if (!d) {
      ++pos;
      continue;
    }
    push_fragment(source, fragment_start, pos, tokens);
    tokens.push_back(token{d->kind, std::string(d->text), pos});
    pos += d->text.size();
    fragment_start = pos;
  }
  push_fragment(source, fragment_start, source.size(), tokens);
  return tokens;
}

auto parse_number(std::string_view text, double& out) noexcept -> bool {
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
    if (!text.empty() && text.front() == '-') return false;
  }
  if (text.empty()) return false;
  double v{};
  const char* first = text.data();
  const char* last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, v, std::chars_format::general);
  if (ptr != last) return false;
  if (ec == std::errc::result_out_of_range) {
    const bool negative = text.front() == '-';
    if (overflows(text)) {
      out = negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
    } else {
      out = negative ? -0.0 : 0.0;
    }
    return true;
  }
  if (ec != std::errc{}) return false;
  // from_chars also accepts "inf" and "nan"; those stay usable as variable names.
  if (!std::isfinite(v)) return false;
  out = v;
  return true;
}

auto classify(std::string_view fragment) noexcept -> token_kind {
  if (fragment.size() >= 2) {
    const char q = fragment.front();
    if ((q == '"' || q == '\'') && fragment.back() == q) return token_kind::string;
  }
  double ignored{};
  if (parse_number(fragment, ignored)) return token_kind::number;

  if (fragment.empty()) return token_kind::unrecognized;
  for (char c : fragment) {
    if (!is_variable_char(c)) return token_kind::unrecognized;
  }
  if (fragment.size() == 1 && fragment.front() == '!') return token_kind::unrecognized;
  return token_kind::variable;
}

auto unquote(std::string_view text) -> std::string {
  if (text.size() < 2) return std::string(text);
  return std::string(text.substr(1, text.size() - 2));
}

auto to_string(token_kind kind) noexcept -> const char* {
  switch (kind) {
    case token_kind::number: return "number";
    case token_kind::string: return "string";
    case token_kind::variable: return "variable";
    case token_kind::gt: return "'>'";
    case token_kind::gte: return "'>='";
    case token_kind::lt: return "'<'";
    case token_kind::lte: return "'<='";
    case token_kind::eq: return "'=='";
    case token_kind::neq: return "'!='";
    case token_kind::string_prefix: return "'.*'";
    case token_kind::lparen: return "'('";
    case token_kind::rparen: return "')'";
    case token_kind::kw_and: return "'and'";
    case token_kind::kw_or: return "'or'";
    case token_kind::unrecognized: return "unrecognized";
  }
  return "unknown";
}

} // namespace verity::lexer
