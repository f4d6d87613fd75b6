#include "verity/value.hpp"

#include <string>

namespace verity {

auto truthy(const value& v) noexcept -> bool {
  if (const auto* b = std::get_if<bool>(&v)) return *b;
  if (const auto* d = std::get_if<double>(&v)) return *d != 0.0;
  return !std::get_if<std::string>(&v)->empty();
}

auto type_name(const value& v) noexcept -> const char* {
  if (std::holds_alternative<bool>(v)) return "bool";
  if (std::holds_alternative<double>(v)) return "number";
  return "string";
}

} // namespace verity
