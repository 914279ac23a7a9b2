#include <catch2/catch_all.hpp>

#include "month_resolver.hpp"

TEST_CASE("month names are detected as whole words", "[month]") {
  REQUIRE(detectMonthName("TAKVIMI 2024 - JANAR") == "01");
  REQUIRE(detectMonthName("kohet e namazit per muajin Nëntor") == "11");
  REQUIRE(detectMonthName("NËNTOR") == "11");
  REQUIRE(detectMonthName("Maj 2024") == "05");

  // Substrings of longer words do not count.
  REQUIRE_FALSE(detectMonthName("Marsela dhe Majlinda").has_value());
  REQUIRE_FALSE(detectMonthName("05:21 06:10").has_value());
}

TEST_CASE("earliest month name wins", "[month]") {
  REQUIRE(detectMonthName("Dhjetor 2023 - Janar 2024") == "12");
}

TEST_CASE("page month falls back to page position", "[month]") {
  REQUIRE(resolvePageMonth("Prill", 20) == "04");
  REQUIRE(resolvePageMonth("no month here", 0) == "01");
  REQUIRE(resolvePageMonth("no month here", 11) == "12");
  REQUIRE_FALSE(resolvePageMonth("no month here", 12).has_value());
}
