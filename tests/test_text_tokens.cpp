#include <catch2/catch_all.hpp>

#include "text_tokens.hpp"

#include <string>
#include <vector>

TEST_CASE("time tokens are found in arbitrary text", "[tokens]") {
  REQUIRE(firstTime("Imsaku 5:21 Sabahu 06:10") == "5:21");
  REQUIRE(firstTime("no times here") == "");
  REQUIRE(containsTime("at 19:30"));
  REQUIRE_FALSE(containsTime("19.30 or 1930"));

  std::vector<std::string> all = allTimes("1 e hënë 05:21 06:10 07:45");
  REQUIRE(all == std::vector<std::string>{"05:21", "06:10", "07:45"});

  // Values are not range checked.
  REQUIRE(firstTime("99:99") == "99:99");
}

TEST_CASE("text helpers", "[tokens]") {
  REQUIRE(trim("  Viti i Ri \t") == "Viti i Ri");
  REQUIRE(toLowerText("NËNTOR Çka") == "nëntor çka");

  std::vector<std::string> lines = splitLines("first\r\n\n  second  \nthird");
  REQUIRE(lines == std::vector<std::string>{"first", "second", "third"});

  REQUIRE(joinCells({"1", "", " e hënë ", "3"}) == "1 e hënë 3");

  REQUIRE(firstInteger("Dita 12.") == 12);
  REQUIRE_FALSE(firstInteger("none").has_value());

  REQUIRE(isAllDigits("31"));
  REQUIRE_FALSE(isAllDigits("3a"));
  REQUIRE_FALSE(isAllDigits(""));
}
