#pragma once

#include "calendar_types.hpp"

#include <map>
#include <optional>
#include <string>

// Festival text keyed by "MM-DD". Independent of the year.
class HolidayTable {
public:
  HolidayTable() = default;
  explicit HolidayTable(std::map<std::string, std::string> entries);

  // Built-in fixed-date entries for `year` (e.g. "01-01" -> "Viti i Ri 2024").
  static HolidayTable defaults(int year);

  // JSON object {"MM-DD": "text", ...}. Throws std::runtime_error on malformed input.
  static HolidayTable fromJson(const std::string& json);
  static HolidayTable fromFile(const std::string& path);

  const std::string* find(const std::string& monthDay) const;
  const std::map<std::string, std::string>& entries() const { return entries_; }

private:
  std::map<std::string, std::string> entries_;
};

// A subset of the eight time fields; unset fields are left alone when applied.
struct TimeCorrection {
  std::array<std::optional<std::string>, kTimeFieldCount> fields;

  void set(TimeField f, const std::string& value) { fields[static_cast<std::size_t>(f)] = value; }

  // Overwrites exactly the set fields. Returns the number of fields written.
  int applyTo(PrayerTimes& times) const;
};

// Authoritative time overrides keyed by "YYYY-MM-DD".
class CorrectionTable {
public:
  CorrectionTable() = default;
  explicit CorrectionTable(std::map<std::string, TimeCorrection> entries);

  // JSON object {"YYYY-MM-DD": {"imsaku": "05:20", ...}, ...}.
  // Throws std::runtime_error on malformed input or an unknown field name.
  static CorrectionTable fromJson(const std::string& json);
  static CorrectionTable fromFile(const std::string& path);

  const TimeCorrection* find(const std::string& date) const;
  const std::map<std::string, TimeCorrection>& entries() const { return entries_; }

private:
  std::map<std::string, TimeCorrection> entries_;
};
