#include <strata/error.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using strata::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::io_failed) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::config_invalid) == 2001u);
  REQUIRE(static_cast<unsigned>(error_code::data_integrity) == 3001u);
  REQUIRE(static_cast<unsigned>(error_code::not_found) == 6001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
}

TEST_CASE("only internal errors are fatal", "[errors]") {
  using strata::core::error;
  using strata::core::error_code;
  REQUIRE(strata::core::is_fatal(error{error_code::internal, "multi-file merge", "compact.merge"}));
  REQUIRE_FALSE(strata::core::is_fatal(error{error_code::io_failed, "disk", "compact.upload"}));
  REQUIRE_FALSE(strata::core::is_fatal(error{error_code::precondition_failed, "zero records", "compact.merge"}));
}

TEST_CASE("describe names component and code", "[errors]") {
  using strata::core::error;
  using strata::core::error_code;
  auto s = strata::core::describe(error{error_code::not_found, "missing", "storage.file_list"});
  REQUIRE(s.find("storage.file_list") != std::string::npos);
  REQUIRE(s.find("missing") != std::string::npos);
  REQUIRE(strata::core::to_string(error_code::not_found) == "not_found");
}

#include <strata/core/log.hpp>

TEST_CASE("log level can be changed by name", "[errors][log]") {
  auto lg = strata::core::logger();
  REQUIRE(lg != nullptr);
  REQUIRE(strata::core::set_log_level("debug").has_value());
  REQUIRE(lg->level() == spdlog::level::debug);
  auto bad = strata::core::set_log_level("chatty");
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == strata::core::error_code::invalid_argument);
  REQUIRE(strata::core::set_log_level("info").has_value());
}
