#pragma once

/** \file value.hpp
 *  \brief Runtime values produced by evaluation and supplied by bindings.
 */

#include <string>
#include <unordered_map>
#include <variant>

namespace verity {

/** \brief Boolean, number or string. No implicit conversions between alternatives. */
using value = std::variant<bool, double, std::string>;

/** \brief Flat mapping from variable name to value. */
using binding = std::unordered_map<std::string, value>;

/** \brief Boolean interpretation: numbers are true when non-zero, strings when non-empty. */
auto truthy(const value& v) noexcept -> bool;

/** \brief "bool", "number" or "string". */
auto type_name(const value& v) noexcept -> const char*;

} // namespace verity
