#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>

#include "verity/expression.hpp"

// Fuzzer: arbitrary text through compile and, when it parses, evaluation against a fixed binding.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  const std::string_view text{reinterpret_cast<const char*>(data), size};
  auto rule = verity::expression::compile(text);
  if (!rule) return 0;
  static const verity::binding vars{
      {"a", true}, {"n", 3.0}, {"s", std::string("abc")}};
  (void)rule->evaluate(vars);
  (void)rule->to_string();
  return 0;
}
