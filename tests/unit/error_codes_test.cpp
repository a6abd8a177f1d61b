#include <embdb/error.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using embdb::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::io_failed) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::collection_not_found) == 6101u);
  REQUIRE(static_cast<unsigned>(error_code::lock_acquisition_failed) == 7102u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
}

TEST_CASE("only lock errors are retryable", "[errors]") {
  using embdb::core::error;
  using embdb::core::error_code;
  REQUIRE(embdb::core::is_retryable(error{error_code::lock_acquisition_failed, "", ""}));
  REQUIRE(embdb::core::is_retryable(error{error_code::lock_not_available, "", ""}));
  REQUIRE_FALSE(embdb::core::is_retryable(error{error_code::dimension_mismatch, "", ""}));
  REQUIRE_FALSE(embdb::core::is_retryable(error{error_code::delete_blue_forbidden, "", ""}));
}

TEST_CASE("error code names", "[errors]") {
  using embdb::core::error_code;
  REQUIRE(embdb::core::to_string(error_code::delete_blue_forbidden) == "delete_blue_forbidden");
  REQUIRE(embdb::core::to_string(error_code::dimension_mismatch) == "dimension_mismatch");
  auto e = embdb::core::make_error(error_code::not_found, "gone", "unit");
  REQUIRE(e.error().code == error_code::not_found);
  REQUIRE(e.error().component == "unit");
}
