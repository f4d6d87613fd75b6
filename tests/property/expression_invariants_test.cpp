#include <catch2/catch_all.hpp>
#include <verity/expression.hpp>

#include <random>
#include <string>
#include <vector>

using namespace verity;

// Flat chains `v0 op v1 op ... vn` checked against the reference reading:
// an OR of maximal AND-runs.
TEST_CASE("and/or chains follow precedence for every assignment", "[property]") {
  std::seed_seq seed{17, 23, 43};
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> len_dist(1, 6);
  std::bernoulli_distribution coin(0.5);

  for (int t = 0; t < 200; ++t) {
    const int n = len_dist(rng);
    std::vector<bool> is_and(static_cast<std::size_t>(n > 1 ? n - 1 : 0));
    std::string text = "v0";
    for (int i = 1; i < n; ++i) {
      is_and[static_cast<std::size_t>(i - 1)] = coin(rng);
      text += is_and[static_cast<std::size_t>(i - 1)] ? " and " : " or ";
      text += "v" + std::to_string(i);
    }
    auto rule = expression::compile(text);
    REQUIRE(rule.has_value());

    for (unsigned mask = 0; mask < (1u << n); ++mask) {
      binding vars;
      for (int i = 0; i < n; ++i) vars["v" + std::to_string(i)] = ((mask >> i) & 1u) != 0;

      bool expected = false;
      bool run = (mask & 1u) != 0;
      for (int i = 1; i < n; ++i) {
        const bool vi = ((mask >> i) & 1u) != 0;
        if (is_and[static_cast<std::size_t>(i - 1)]) {
          run = run && vi;
        } else {
          expected = expected || run;
          run = vi;
        }
      }
      expected = expected || run;

      auto got = rule->matches(vars);
      REQUIRE(got.has_value());
      REQUIRE(*got == expected);
    }
  }
}

TEST_CASE("grouping changes results exactly where precedence says", "[property]") {
  auto flat = expression::compile("a and b or c");
  auto grouped = expression::compile("a and (b or c)");
  REQUIRE(flat.has_value());
  REQUIRE(grouped.has_value());
  for (unsigned mask = 0; mask < 8; ++mask) {
    const bool a = mask & 1u, b = mask & 2u, c = mask & 4u;
    binding vars{{"a", a}, {"b", b}, {"c", c}};
    REQUIRE(flat->matches(vars).value() == ((a && b) || c));
    REQUIRE(grouped->matches(vars).value() == (a && (b || c)));
  }
}

TEST_CASE("negation and missing variables are complementary", "[property]") {
  std::mt19937 rng(7);
  std::uniform_real_distribution<double> dist(-2.0, 2.0);
  auto pos = expression::compile("x");
  auto neg = expression::compile("!x");
  REQUIRE(pos.has_value());
  REQUIRE(neg.has_value());
  REQUIRE(pos->matches({}).value() != neg->matches({}).value());
  for (int i = 0; i < 100; ++i) {
    binding vars{{"x", i % 10 == 0 ? 0.0 : dist(rng)}};
    REQUIRE(pos->matches(vars).value() != neg->matches(vars).value());
  }
}

TEST_CASE("recompiling yields the same tree", "[property]") {
  const std::vector<std::string> samples{
      "a", "!a or b", "(x >= 1.5 and y < 'm') or z .* \"pre\"",
      "((a == 1) or (b != 2)) and c", "p and q and r or s and t"};
  for (const auto& s : samples) {
    auto first = expression::compile(s);
    auto second = expression::compile(s);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(same_shape(first->root(), second->root()));
    REQUIRE(first->to_string() == second->to_string());
  }
}
