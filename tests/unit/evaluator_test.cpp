#include <catch2/catch_all.hpp>
#include <verity/evaluator.hpp>
#include <verity/expression.hpp>

#include <limits>
#include <string>

using namespace verity;

static value eval_ok(const char* text, const binding& vars) {
  auto e = expression::compile(text);
  REQUIRE(e.has_value());
  auto v = e->evaluate(vars);
  REQUIRE(v.has_value());
  return *v;
}

static core::error eval_err(const char* text, const binding& vars) {
  auto e = expression::compile(text);
  REQUIRE(e.has_value());
  auto v = e->evaluate(vars);
  REQUIRE_FALSE(v.has_value());
  return v.error();
}

TEST_CASE("missing variables evaluate to false", "[eval]") {
  REQUIRE(eval_ok("x", {}) == value{false});
  REQUIRE(eval_ok("!x", {}) == value{true});
  REQUIRE(eval_ok("x == 0", {}) == value{false});
}

TEST_CASE("negation inverts truthiness of the looked-up value", "[eval]") {
  REQUIRE(eval_ok("!flag", {{"flag", true}}) == value{false});
  REQUIRE(eval_ok("!flag", {{"flag", false}}) == value{true});
  REQUIRE(eval_ok("!flag", {{"flag", 0.0}}) == value{true});
  REQUIRE(eval_ok("!flag", {{"flag", 2.5}}) == value{false});
  REQUIRE(eval_ok("!flag", {{"flag", std::string("abc")}}) == value{false});
  REQUIRE(eval_ok("!flag", {{"flag", std::string()}}) == value{true});
}

TEST_CASE("bare variables and literals yield raw values", "[eval]") {
  REQUIRE(eval_ok("is_active", {{"is_active", true}}) == value{true});
  REQUIRE(eval_ok("count", {{"count", 3.0}}) == value{3.0});
  REQUIRE(eval_ok("5", {}) == value{5.0});
  REQUIRE(eval_ok("'hi'", {}) == value{std::string("hi")});
}

TEST_CASE("string prefix operator", "[eval]") {
  REQUIRE(eval_ok("name .* \"ab\"", {{"name", std::string("abc")}}) == value{true});
  REQUIRE(eval_ok("name .* \"ab\"", {{"name", std::string("xab")}}) == value{false});
  REQUIRE(eval_ok("name .* ''", {{"name", std::string("xab")}}) == value{true});
}

TEST_CASE("equality across quote styles", "[eval]") {
  const binding vars{{"a", std::string("x")}};
  REQUIRE(eval_ok("a == \"x\"", vars) == value{true});
  REQUIRE(eval_ok("a == 'x'", vars) == value{true});
  REQUIRE(eval_ok("a != 'x'", vars) == value{false});
}

TEST_CASE("numeric ordering", "[eval]") {
  REQUIRE(eval_ok("age >= 18", {{"age", 18.0}}) == value{true});
  REQUIRE(eval_ok("age >= 18", {{"age", 17.9}}) == value{false});
  REQUIRE(eval_ok("age > 18", {{"age", 18.0}}) == value{false});
  REQUIRE(eval_ok("age < 18", {{"age", 17.9}}) == value{true});
  REQUIRE(eval_ok("age <= 17.9", {{"age", 17.9}}) == value{true});
  REQUIRE(eval_ok("-1 < 0", {}) == value{true});
}

TEST_CASE("out-of-range literals compare as saturated numbers", "[eval]") {
  REQUIRE(eval_ok("x < 1e999", {{"x", 5.0}}) == value{true});
  REQUIRE(eval_ok("x > -1e999", {{"x", -5.0}}) == value{true});
  REQUIRE(eval_ok("x == 1e-999", {{"x", 0.0}}) == value{true});
  // The literal is never looked up as a variable name.
  REQUIRE(eval_ok("1e999", {{"1e999", std::string("shadow")}}) ==
          value{std::numeric_limits<double>::infinity()});
}

TEST_CASE("string and bool ordering", "[eval]") {
  REQUIRE(eval_ok("name < 'b'", {{"name", std::string("a")}}) == value{true});
  REQUIRE(eval_ok("name > 'b'", {{"name", std::string("ba")}}) == value{true});
  REQUIRE(eval_ok("a > b", {{"a", true}, {"b", false}}) == value{true});
  REQUIRE(eval_ok("a >= b", {{"a", false}, {"b", false}}) == value{true});
}

TEST_CASE("equality never coerces between types", "[eval]") {
  REQUIRE(eval_ok("a == 1", {{"a", std::string("1")}}) == value{false});
  REQUIRE(eval_ok("a != 1", {{"a", std::string("1")}}) == value{true});
  REQUIRE(eval_ok("a == 1", {{"a", true}}) == value{false});
}

TEST_CASE("incompatible operands are type errors", "[eval][errors]") {
  auto e1 = eval_err("a < 5", {{"a", std::string("x")}});
  REQUIRE(e1.code == core::error_code::type_mismatch);
  REQUIRE(e1.component == "eval");
  REQUIRE(e1.message.find("string") != std::string::npos);
  REQUIRE(e1.message.find("number") != std::string::npos);

  REQUIRE(eval_err("a .* 'x'", {{"a", 1.0}}).code == core::error_code::type_mismatch);
  REQUIRE(eval_err("a .* 1", {{"a", std::string("1")}}).code == core::error_code::type_mismatch);
  auto e2 = eval_err("missing > 3", {});
  REQUIRE(e2.code == core::error_code::type_mismatch);
  REQUIRE(e2.message == "cannot apply '>' to bool and number");
}

TEST_CASE("logical operators combine truthiness", "[eval]") {
  REQUIRE(eval_ok("a and b", {{"a", true}, {"b", 0.0}}) == value{false});
  REQUIRE(eval_ok("a or b", {{"a", false}, {"b", std::string("x")}}) == value{true});
  REQUIRE(eval_ok("a and b", {{"a", 1.0}, {"b", std::string("x")}}) == value{true});
  REQUIRE(eval_ok("a or b", {}) == value{false});
}

TEST_CASE("both sides of and/or are always evaluated", "[eval]") {
  // The right side fails even though the left already decides the result.
  REQUIRE(eval_err("flag or x < 1", {{"flag", true}, {"x", std::string("s")}}).code ==
          core::error_code::type_mismatch);
  REQUIRE(eval_err("flag and x < 1", {{"flag", false}, {"x", std::string("s")}}).code ==
          core::error_code::type_mismatch);
}

TEST_CASE("failed evaluation leaves the tree usable", "[eval]") {
  auto e = expression::compile("age >= 18");
  REQUIRE(e.has_value());
  REQUIRE_FALSE(e->evaluate({{"age", std::string("old")}}).has_value());
  auto ok = e->evaluate({{"age", 30.0}});
  REQUIRE(ok.has_value());
  REQUIRE(*ok == value{true});
}

TEST_CASE("evaluate works directly on a tree", "[eval]") {
  auto tree = expr_node{comparison{comparison_op::eq,
                                   std::make_unique<expr_node>(expr_node{variable_ref{"k", false}}),
                                   std::make_unique<expr_node>(expr_node{string_literal{"v"}})}};
  auto v = eval::evaluate(tree, {{"k", std::string("v")}});
  REQUIRE(v.has_value());
  REQUIRE(*v == value{true});
}
