#include "calendar_json.hpp"

nlohmann::json toJson(const PrayerTimes& times) {
  nlohmann::json j = nlohmann::json::object();
  for (std::size_t i = 0; i < kTimeFieldCount; ++i) {
    j[timeFieldKey(static_cast<TimeField>(i))] = times.values[i];
  }
  return j;
}

nlohmann::json toJson(const DayRecord& record) {
  return {
    {"data_sipas_kal_boteror", record.day},
    {"dita_javes", record.weekday},
    {"festat_fetare_dhe_shenime_te_tjera_astronomike", record.festival},
    {"kohet", toJson(record.times)}
  };
}

nlohmann::json toJson(const MonthBucket& bucket) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto& kv : bucket) j[kv.first] = toJson(kv.second);
  return j;
}

nlohmann::json toJson(const CalendarYear& calendar) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto& kv : calendar) j[kv.first] = toJson(kv.second);
  return j;
}

nlohmann::json yearDocument(int year, const CalendarYear& calendar) {
  return {
    {"year", std::to_string(year)},
    {"data", toJson(calendar)}
  };
}

nlohmann::json monthDocument(int year, const std::string& month, const MonthBucket& bucket) {
  return {
    {"year", std::to_string(year)},
    {"month", month},
    {"data", toJson(bucket)}
  };
}
