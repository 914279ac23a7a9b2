#include "calendar_types.hpp"

#include <fmt/format.h>

namespace {

const std::array<const char*, kTimeFieldCount> kFieldKeys = {
  "imsaku",
  "sabahu",
  "lindja_e_diellit",
  "dreka",
  "ikindia",
  "akshami",
  "jacia",
  "gjatesia_e_dites"
};

// Sakamoto's method; 0 = Sunday.
int dayOfWeek(int year, int month, int day) {
  static const int offsets[] = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
  if (month < 3) year -= 1;
  return (year + year / 4 - year / 100 + year / 400 + offsets[month - 1] + day) % 7;
}

} // namespace

const char* timeFieldKey(TimeField field) {
  return kFieldKeys[static_cast<std::size_t>(field)];
}

bool timeFieldFromKey(const std::string& key, TimeField& field) {
  for (std::size_t i = 0; i < kFieldKeys.size(); ++i) {
    if (key == kFieldKeys[i]) {
      field = static_cast<TimeField>(i);
      return true;
    }
  }
  return false;
}

bool PrayerTimes::empty() const {
  for (const auto& v : values) {
    if (!v.empty()) return false;
  }
  return true;
}

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
  switch (month) {
    case 2:
      return isLeapYear(year) ? 29 : 28;
    case 4: case 6: case 9: case 11:
      return 30;
    case 1: case 3: case 5: case 7: case 8: case 10: case 12:
      return 31;
    default:
      return 0;
  }
}

const std::array<std::string, 7>& weekdayNames() {
  static const std::array<std::string, 7> names = {
    "e hënë", "e martë", "e mërkurë", "e enjte", "e premte", "e shtunë", "e diel"
  };
  return names;
}

std::string weekdayName(int year, int month, int day) {
  if (day < 1 || day > daysInMonth(year, month)) return "";
  int mondayFirst = (dayOfWeek(year, month, day) + 6) % 7;
  return weekdayNames()[mondayFirst];
}

std::string twoDigitCode(int value) {
  return fmt::format("{:02d}", value);
}

CalendarYear makeEmptyYear() {
  CalendarYear year;
  for (int m = 1; m <= 12; ++m) year[twoDigitCode(m)] = MonthBucket{};
  return year;
}

void mergeDayRecord(DayRecord& existing, const DayRecord& incoming) {
  existing.day = incoming.day;
  if (!incoming.weekday.empty()) existing.weekday = incoming.weekday;
  if (!incoming.festival.empty()) existing.festival = incoming.festival;
  for (std::size_t i = 0; i < kTimeFieldCount; ++i) {
    if (!incoming.times.values[i].empty()) existing.times.values[i] = incoming.times.values[i];
  }
}

void storeDayRecord(MonthBucket& bucket, const DayRecord& record) {
  auto it = bucket.find(twoDigitCode(record.day));
  if (it == bucket.end()) {
    bucket.emplace(twoDigitCode(record.day), record);
  } else {
    mergeDayRecord(it->second, record);
  }
}

std::size_t countDays(const CalendarYear& year) {
  std::size_t total = 0;
  for (const auto& kv : year) total += kv.second.size();
  return total;
}
