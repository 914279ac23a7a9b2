#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <string>

// The eight daily time fields, in calendar column order.
enum class TimeField {
  DawnStart = 0,
  DawnEnd,
  Sunrise,
  Midday,
  Afternoon,
  Sunset,
  Nightfall,
  DayLength
};

constexpr std::size_t kTimeFieldCount = 8;

// Key used for a field in JSON documents and correction tables (e.g. "imsaku").
const char* timeFieldKey(TimeField field);

// Inverse of timeFieldKey. Returns false when the key is unknown.
bool timeFieldFromKey(const std::string& key, TimeField& field);

struct PrayerTimes {
  std::array<std::string, kTimeFieldCount> values;

  std::string& operator[](TimeField f) { return values[static_cast<std::size_t>(f)]; }
  const std::string& operator[](TimeField f) const { return values[static_cast<std::size_t>(f)]; }

  bool empty() const;
  bool operator==(const PrayerTimes& other) const { return values == other.values; }
};

struct DayRecord {
  int day = 0;
  std::string weekday;
  std::string festival;
  PrayerTimes times;
};

// Day code ("01".."31") -> record.
using MonthBucket = std::map<std::string, DayRecord>;

// Month code ("01".."12") -> bucket.
using CalendarYear = std::map<std::string, MonthBucket>;

bool isLeapYear(int year);

// 28-31; 0 for a month outside 1..12.
int daysInMonth(int year, int month);

// Albanian weekday name, Monday first ("e hënë" .. "e diel").
// Empty when the date does not exist.
std::string weekdayName(int year, int month, int day);

// The seven weekday names in Monday-first order.
const std::array<std::string, 7>& weekdayNames();

// Two-digit zero padded code, used for both month and day keys.
std::string twoDigitCode(int value);

// A year with all twelve month keys present and no days.
CalendarYear makeEmptyYear();

// Copies the non-empty fields of `incoming` over `existing`.
void mergeDayRecord(DayRecord& existing, const DayRecord& incoming);

// Inserts `record` under its day code, merging with a record already there.
void storeDayRecord(MonthBucket& bucket, const DayRecord& record);

std::size_t countDays(const CalendarYear& year);
