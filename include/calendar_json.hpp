#pragma once

#include "calendar_types.hpp"

#include <string>

#include <nlohmann/json.hpp>

nlohmann::json toJson(const PrayerTimes& times);
nlohmann::json toJson(const DayRecord& record);
nlohmann::json toJson(const MonthBucket& bucket);
nlohmann::json toJson(const CalendarYear& calendar);

// {"year": "2024", "data": {...twelve months...}}
nlohmann::json yearDocument(int year, const CalendarYear& calendar);

// {"year": "2024", "month": "01", "data": {...days...}}
nlohmann::json monthDocument(int year, const std::string& month, const MonthBucket& bucket);
