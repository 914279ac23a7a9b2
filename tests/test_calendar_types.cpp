#include <catch2/catch_all.hpp>

#include "calendar_types.hpp"

TEST_CASE("month lengths follow the leap year rule", "[calendar]") {
  REQUIRE(daysInMonth(2024, 2) == 29);
  REQUIRE(daysInMonth(2023, 2) == 28);
  REQUIRE(daysInMonth(2000, 2) == 29);
  REQUIRE(daysInMonth(1900, 2) == 28);

  REQUIRE(daysInMonth(2024, 4) == 30);
  REQUIRE(daysInMonth(2024, 6) == 30);
  REQUIRE(daysInMonth(2024, 9) == 30);
  REQUIRE(daysInMonth(2024, 11) == 30);
  REQUIRE(daysInMonth(2024, 1) == 31);
  REQUIRE(daysInMonth(2024, 12) == 31);
  REQUIRE(daysInMonth(2024, 13) == 0);
}

TEST_CASE("weekday names are Monday first", "[calendar]") {
  REQUIRE(weekdayName(2024, 1, 1) == "e hënë");
  REQUIRE(weekdayName(2024, 1, 7) == "e diel");
  REQUIRE(weekdayName(2024, 2, 29) == "e enjte");
  REQUIRE(weekdayName(2023, 12, 31) == "e diel");
  REQUIRE(weekdayName(2000, 3, 1) == "e mërkurë");
  REQUIRE(weekdayName(2023, 2, 29) == "");
}

TEST_CASE("empty year has twelve month keys", "[calendar]") {
  CalendarYear year = makeEmptyYear();
  REQUIRE(year.size() == 12);
  REQUIRE(year.begin()->first == "01");
  REQUIRE(year.rbegin()->first == "12");
  REQUIRE(countDays(year) == 0);
}

TEST_CASE("storing a record merges non-empty fields", "[calendar]") {
  MonthBucket bucket;

  DayRecord placeholder;
  placeholder.day = 5;
  placeholder.festival = "Nata e Kadrit";
  storeDayRecord(bucket, placeholder);

  DayRecord timed;
  timed.day = 5;
  timed.weekday = "e premte";
  timed.times[TimeField::DawnStart] = "04:10";
  timed.times[TimeField::Sunset] = "19:45";
  storeDayRecord(bucket, timed);
  storeDayRecord(bucket, timed);

  REQUIRE(bucket.size() == 1);
  const DayRecord& rec = bucket.at("05");
  REQUIRE(rec.day == 5);
  REQUIRE(rec.weekday == "e premte");
  REQUIRE(rec.festival == "Nata e Kadrit");
  REQUIRE(rec.times[TimeField::DawnStart] == "04:10");
  REQUIRE(rec.times[TimeField::Sunset] == "19:45");
  REQUIRE(rec.times[TimeField::DayLength].empty());
}

TEST_CASE("time field keys round trip", "[calendar]") {
  TimeField f;
  REQUIRE(timeFieldFromKey("gjatesia_e_dites", f));
  REQUIRE(f == TimeField::DayLength);
  REQUIRE(std::string(timeFieldKey(TimeField::DawnStart)) == "imsaku");
  REQUIRE_FALSE(timeFieldFromKey("imsak", f));
}
