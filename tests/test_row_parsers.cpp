#include <catch2/catch_all.hpp>

#include "row_parsers.hpp"

#include <memory>
#include <string>
#include <vector>

namespace {

const RowContext kJanuary2024{2024, 1};

PrayerTimes timesOf(const std::vector<std::string>& values) {
  PrayerTimes t;
  for (size_t i = 0; i < values.size(); ++i) t.values[i] = values[i];
  return t;
}

} // namespace

TEST_CASE("fixed-schema row with weekday and festival", "[cascade]") {
  RowCascade cascade;
  std::vector<std::string> row = {
    "1", "e hënë", "3", "Viti i Ri",
    "05:21", "06:10", "07:45", "12:30", "15:10", "18:05", "19:30", "13:09"
  };

  auto rec = cascade.parseRow(row, kJanuary2024);
  REQUIRE(rec.has_value());
  REQUIRE(rec->day == 1);
  REQUIRE(rec->weekday == "e hënë");
  REQUIRE(rec->festival == "Viti i Ri");
  REQUIRE(rec->times == timesOf({"05:21", "06:10", "07:45", "12:30", "15:10", "18:05", "19:30", "13:09"}));
}

TEST_CASE("fixed-schema wins over the permissive pattern", "[cascade]") {
  RowCascade cascade;
  // The printed weekday disagrees with the date; only the fixed schema keeps it.
  const std::string line = "1 e diel 3 05:21 06:10 07:45 12:30 15:10 18:05 19:30 13:09";

  REQUIRE(PermissivePositionalParser().tryParse(line, kJanuary2024).has_value());

  auto rec = cascade.parseLine(line, kJanuary2024);
  REQUIRE(rec.has_value());
  REQUIRE(rec->weekday == "e diel");
  REQUIRE(rec->festival.empty());
  REQUIRE(rec->times[TimeField::DayLength] == "13:09");
}

TEST_CASE("fixed-schema needs exactly eight times", "[cascade]") {
  const std::string nineTimes = "1 e hënë 19 05:21 06:10 07:45 12:30 15:10 18:05 19:30 09:20 14:00";
  REQUIRE_FALSE(FixedSchemaParser().tryParse(nineTimes, kJanuary2024).has_value());

  // The next strategy reads it without shifting the fields.
  auto rec = RowCascade().parseLine(nineTimes, kJanuary2024);
  REQUIRE(rec.has_value());
  REQUIRE(rec->festival.empty());
  REQUIRE(rec->times[TimeField::DawnStart] == "05:21");
  REQUIRE(rec->times[TimeField::DawnEnd] == "06:10");

  // A time token is never taken as festival text.
  REQUIRE_FALSE(FixedSchemaParser().tryParse("1 e hënë 19 Festa 05:21 06:10 07:45 12:30 15:10 18:05 19:30 09:20 14:00",
                                             kJanuary2024).has_value());
}

TEST_CASE("loosely-delimited row computes the weekday", "[cascade]") {
  RowCascade cascade;
  const RowContext march{2024, 3};

  SECTION("single trailing time is nightfall") {
    auto rec = cascade.parseLine("12 2 Dita e Verës 05:01 05:40 06:58 12:05 15:20 17:50 19:05", march);
    REQUIRE(rec.has_value());
    REQUIRE(rec->day == 12);
    REQUIRE(rec->weekday == "e martë");
    REQUIRE(rec->festival == "Dita e Verës");
    REQUIRE(rec->times[TimeField::Sunset] == "17:50");
    REQUIRE(rec->times[TimeField::Nightfall] == "19:05");
    REQUIRE(rec->times[TimeField::DayLength].empty());
  }

  SECTION("trailing segment holds nightfall and day length") {
    auto rec = LooselyDelimitedParser().tryParse("12 - 2 05:01 05:40 06:58 12:05 15:20 17:50 19:05 / 11:52", march);
    REQUIRE(rec.has_value());
    REQUIRE(rec->festival.empty());
    REQUIRE(rec->times[TimeField::Nightfall] == "19:05");
    REQUIRE(rec->times[TimeField::DayLength] == "11:52");
  }
}

TEST_CASE("permissive row accepts partial times", "[cascade]") {
  RowCascade cascade;

  SECTION("weekday text is not taken as festival") {
    auto rec = cascade.parseLine("5 e premte 05:21 06:10 07:45", kJanuary2024);
    REQUIRE(rec.has_value());
    REQUIRE(rec->day == 5);
    REQUIRE(rec->weekday == "e premte");
    REQUIRE(rec->festival.empty());
    REQUIRE(rec->times == timesOf({"05:21", "06:10", "07:45"}));
  }

  SECTION("festival text before the first time") {
    auto rec = cascade.parseLine("20 11 Nata e Miraxhit 05:11 06:00", RowContext{2024, 2});
    REQUIRE(rec.has_value());
    REQUIRE(rec->festival == "Nata e Miraxhit");
    REQUIRE(rec->times[TimeField::DawnStart] == "05:11");
    REQUIRE(rec->times[TimeField::DawnEnd] == "06:00");
    REQUIRE(rec->times[TimeField::Sunrise].empty());
  }
}

TEST_CASE("brute force reads times anywhere in the line", "[cascade]") {
  RowCascade cascade;
  const std::string line = "7|25|Xh1|05:21|06:10|07:45|12:30|15:10|18:05|19:30";

  REQUIRE_FALSE(FixedSchemaParser().tryParse(line, kJanuary2024).has_value());
  REQUIRE_FALSE(LooselyDelimitedParser().tryParse(line, kJanuary2024).has_value());
  REQUIRE_FALSE(PermissivePositionalParser().tryParse(line, kJanuary2024).has_value());

  auto rec = cascade.parseLine(line, kJanuary2024);
  REQUIRE(rec.has_value());
  REQUIRE(rec->day == 7);
  REQUIRE(rec->weekday == "e diel");
  REQUIRE(rec->festival.empty());
  REQUIRE(rec->times == timesOf({"05:21", "06:10", "07:45", "12:30", "15:10", "18:05", "19:30"}));

  REQUIRE_FALSE(BruteForceParser().tryParse("7|25|05:21|06:10|07:45", kJanuary2024).has_value());
}

TEST_CASE("rows without a valid day are rejected", "[cascade]") {
  RowCascade cascade;
  const std::string leapDay = "29 e enjte 19 05:21 06:10 07:45 12:30 15:10 18:05 19:30 13:09";

  REQUIRE_FALSE(cascade.parseLine(leapDay, RowContext{2023, 2}).has_value());
  REQUIRE(cascade.parseLine(leapDay, RowContext{2024, 2}).has_value());

  REQUIRE_FALSE(cascade.parseLine("32 e shtunë 1 05:21 06:10 07:45 12:30 15:10 18:05 19:30 13:09", kJanuary2024).has_value());
  REQUIRE_FALSE(cascade.parseLine("Dita Imsaku Sabahu Dreka", kJanuary2024).has_value());
  REQUIRE_FALSE(cascade.parseLine("05:21 06:10 07:45 12:30 15:10 18:05 19:30 13:09", kJanuary2024).has_value());
}

TEST_CASE("cascade with a custom strategy list", "[cascade]") {
  std::vector<std::unique_ptr<RowParser>> parsers;
  parsers.push_back(std::make_unique<BruteForceParser>());
  RowCascade cascade(std::move(parsers));

  REQUIRE(cascade.size() == 1);
  auto rec = cascade.parseLine("1 e diel 3 Viti i Ri 05:21 06:10 07:45 12:30 15:10 18:05 19:30 13:09", kJanuary2024);
  REQUIRE(rec.has_value());
  // Brute force computes the weekday and drops the festival text.
  REQUIRE(rec->weekday == "e hënë");
  REQUIRE(rec->festival.empty());
}

TEST_CASE("leading weekday names are stripped", "[cascade]") {
  REQUIRE(stripLeadingWeekday(" e hënë ") == "");
  REQUIRE(stripLeadingWeekday("E Diel Bajrami") == "Bajrami");
  REQUIRE(stripLeadingWeekday("e dielli") == "e dielli");
}
