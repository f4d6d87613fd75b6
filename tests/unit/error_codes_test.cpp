#include <verity/error.hpp>
#include <verity/error_mapping.hpp>
#include <catch2/catch_all.hpp>

#include <string>

TEST_CASE("error codes stable subset", "[errors]") {
  using verity::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
  REQUIRE(static_cast<unsigned>(error_code::unrecognized_token) == 10001u);
  REQUIRE(static_cast<unsigned>(error_code::syntax_error) == 10002u);
  REQUIRE(static_cast<unsigned>(error_code::type_mismatch) == 10003u);
  REQUIRE(static_cast<unsigned>(error_code::nesting_too_deep) == 10004u);
}

TEST_CASE("error codes map to C status and back", "[errors]") {
  using namespace verity::core;
  for (auto ec : {error_code::ok, error_code::internal, error_code::invalid_argument,
                  error_code::out_of_range, error_code::unrecognized_token,
                  error_code::syntax_error, error_code::type_mismatch,
                  error_code::nesting_too_deep}) {
    REQUIRE(static_cast<unsigned>(to_c_status(ec)) == static_cast<unsigned>(ec));
    REQUIRE(from_c_status(to_c_status(ec)) == ec);
  }
  REQUIRE(std::string(to_string(error_code::syntax_error)) == "syntax_error");
}
