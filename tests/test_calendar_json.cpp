#include <catch2/catch_all.hpp>

#include "calendar_json.hpp"

namespace {

DayRecord firstOfJanuary() {
  DayRecord rec;
  rec.day = 1;
  rec.weekday = "e hënë";
  rec.festival = "Viti i Ri 2024";
  rec.times[TimeField::DawnStart] = "05:20";
  rec.times[TimeField::Nightfall] = "19:30";
  return rec;
}

} // namespace

TEST_CASE("day record JSON uses the calendar field names", "[json]") {
  nlohmann::json j = toJson(firstOfJanuary());

  REQUIRE(j["data_sipas_kal_boteror"] == 1);
  REQUIRE(j["dita_javes"] == "e hënë");
  REQUIRE(j["festat_fetare_dhe_shenime_te_tjera_astronomike"] == "Viti i Ri 2024");

  const nlohmann::json& times = j["kohet"];
  REQUIRE(times.size() == 8);
  REQUIRE(times["imsaku"] == "05:20");
  REQUIRE(times["jacia"] == "19:30");
  REQUIRE(times["dreka"] == "");
  REQUIRE(times.contains("gjatesia_e_dites"));
}

TEST_CASE("year document keeps empty months", "[json]") {
  CalendarYear year = makeEmptyYear();
  year["01"]["01"] = firstOfJanuary();

  nlohmann::json doc = yearDocument(2024, year);
  REQUIRE(doc["year"] == "2024");
  REQUIRE(doc["data"].size() == 12);
  REQUIRE(doc["data"]["01"]["01"]["dita_javes"] == "e hënë");
  REQUIRE(doc["data"]["12"].is_object());
  REQUIRE(doc["data"]["12"].empty());
}

TEST_CASE("month document", "[json]") {
  MonthBucket bucket;
  bucket["01"] = firstOfJanuary();

  nlohmann::json doc = monthDocument(2024, "01", bucket);
  REQUIRE(doc["year"] == "2024");
  REQUIRE(doc["month"] == "01");
  REQUIRE(doc["data"].size() == 1);
  REQUIRE(doc["data"]["01"]["data_sipas_kal_boteror"] == 1);
}
