#include "calendar_tables.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace {

nlohmann::json parseObject(const std::string& json, const char* what) {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(json);
  } catch (const nlohmann::json::parse_error& ex) {
    throw std::runtime_error(fmt::format("invalid {} JSON: {}", what, ex.what()));
  }
  if (!doc.is_object()) {
    throw std::runtime_error(fmt::format("{} JSON must be an object", what));
  }
  return doc;
}

std::string readFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Failed to open " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

} // namespace

HolidayTable::HolidayTable(std::map<std::string, std::string> entries)
  : entries_(std::move(entries)) {}

HolidayTable HolidayTable::defaults(int year) {
  return HolidayTable({
    {"01-01", fmt::format("Viti i Ri {}", year)},
    {"03-14", "Dita e Verës"},
    {"03-22", "Dita e Nevruzit"},
    {"05-01", "Dita Ndërkombëtare e Punëtorëve"},
    {"11-28", "Dita e Pavarësisë"},
    {"11-29", "Dita e Çlirimit"},
    {"12-25", "Krishtlindjet"}
  });
}

HolidayTable HolidayTable::fromJson(const std::string& json) {
  nlohmann::json doc = parseObject(json, "holiday table");
  std::map<std::string, std::string> entries;
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    if (!it.value().is_string()) {
      throw std::runtime_error("holiday text for " + it.key() + " must be a string");
    }
    entries[it.key()] = it.value().get<std::string>();
  }
  return HolidayTable(std::move(entries));
}

HolidayTable HolidayTable::fromFile(const std::string& path) {
  return fromJson(readFile(path));
}

const std::string* HolidayTable::find(const std::string& monthDay) const {
  auto it = entries_.find(monthDay);
  return it == entries_.end() ? nullptr : &it->second;
}

int TimeCorrection::applyTo(PrayerTimes& times) const {
  int written = 0;
  for (std::size_t i = 0; i < kTimeFieldCount; ++i) {
    if (fields[i]) {
      times.values[i] = *fields[i];
      ++written;
    }
  }
  return written;
}

CorrectionTable::CorrectionTable(std::map<std::string, TimeCorrection> entries)
  : entries_(std::move(entries)) {}

CorrectionTable CorrectionTable::fromJson(const std::string& json) {
  nlohmann::json doc = parseObject(json, "correction table");
  std::map<std::string, TimeCorrection> entries;
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    if (!it.value().is_object()) {
      throw std::runtime_error("corrections for " + it.key() + " must be an object");
    }
    TimeCorrection correction;
    for (auto f = it.value().begin(); f != it.value().end(); ++f) {
      TimeField field;
      if (!timeFieldFromKey(f.key(), field)) {
        throw std::runtime_error("unknown time field '" + f.key() + "' in corrections for " + it.key());
      }
      if (!f.value().is_string()) {
        throw std::runtime_error("correction value for " + it.key() + "/" + f.key() + " must be a string");
      }
      correction.set(field, f.value().get<std::string>());
    }
    entries[it.key()] = std::move(correction);
  }
  return CorrectionTable(std::move(entries));
}

CorrectionTable CorrectionTable::fromFile(const std::string& path) {
  return fromJson(readFile(path));
}

const TimeCorrection* CorrectionTable::find(const std::string& date) const {
  auto it = entries_.find(date);
  return it == entries_.end() ? nullptr : &it->second;
}
