#include "row_parsers.hpp"

#include "text_tokens.hpp"

#include <cctype>
#include <regex>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

const std::string kTime = "(\\d{1,2}:\\d{2})";
// Any run of characters that does not contain a time token.
const std::string kNoTimeText = "(?:(?!\\d{1,2}:\\d{2}).)*?";
// Day number at line start, not the hour of a time token.
const std::string kDay = "^\\s*(\\d{1,2})(?![\\d:])";

std::string repeatTimes(int count, const std::string& separator) {
  std::string out;
  for (int i = 0; i < count; ++i) out += separator + kTime;
  return out;
}

DayRecord makeRecord(int day, const RowContext& ctx) {
  DayRecord rec;
  rec.day = day;
  rec.weekday = weekdayName(ctx.year, ctx.month, day);
  return rec;
}

void assignInOrder(PrayerTimes& times, const std::vector<std::string>& tokens) {
  for (std::size_t i = 0; i < tokens.size() && i < kTimeFieldCount; ++i) {
    times.values[i] = tokens[i];
  }
}

} // namespace

std::string stripLeadingWeekday(const std::string& text) {
  std::string t = trim(text);
  std::string lowered = toLowerText(t);
  for (const auto& name : weekdayNames()) {
    if (lowered.compare(0, name.size(), name) != 0) continue;
    if (lowered.size() == name.size() ||
        std::isspace(static_cast<unsigned char>(lowered[name.size()])) ||
        lowered[name.size()] == ',') {
      return trim(t.substr(name.size()));
    }
  }
  return t;
}

std::optional<DayRecord> FixedSchemaParser::tryParse(const std::string& line, const RowContext&) const {
  static const std::regex re(
    kDay + "\\s+([^\\s\\d|,;:.\\-]+(?:\\s+[^\\s\\d|,;:.\\-]+)?)\\s+(\\d{1,4})\\s+(?:(" + kNoTimeText + ")\\s+)?" +
    kTime + repeatTimes(7, "\\s+") + "(?![\\d:])(?!\\s+\\d{1,2}:\\d{2})");

  std::smatch m;
  if (!std::regex_search(line, m, re)) return std::nullopt;

  DayRecord rec;
  rec.day = std::stoi(m[1].str());
  rec.weekday = trim(m[2].str());
  rec.festival = m[4].matched ? trim(m[4].str()) : "";
  for (std::size_t i = 0; i < kTimeFieldCount; ++i) {
    rec.times.values[i] = m[5 + i].str();
  }
  return rec;
}

std::optional<DayRecord> LooselyDelimitedParser::tryParse(const std::string& line, const RowContext& ctx) const {
  static const std::regex re(
    kDay + "[^\\d]+?(\\d{1,4})(?![\\d:])(.*?)" + kTime + repeatTimes(5, "\\s+") + "(.*)$");

  std::smatch m;
  if (!std::regex_search(line, m, re)) return std::nullopt;

  // Group 10 is whatever follows the sixth time; nightfall and day length live there.
  std::vector<std::string> trailing = allTimes(m[10].str());
  if (trailing.empty()) return std::nullopt;

  DayRecord rec = makeRecord(std::stoi(m[1].str()), ctx);
  rec.festival = trim(m[3].str());
  for (std::size_t i = 0; i < 6; ++i) {
    rec.times.values[i] = m[4 + i].str();
  }
  rec.times[TimeField::Nightfall] = trailing[0];
  if (trailing.size() > 1) rec.times[TimeField::DayLength] = trailing[1];
  return rec;
}

std::optional<DayRecord> PermissivePositionalParser::tryParse(const std::string& line, const RowContext& ctx) const {
  static const std::regex re(
    kDay + "(?:[^\\d]+?(\\d{1,4})(?![\\d:]))?([^\\d]*)(?:\\s*" + kTime + ")?" +
    "(?:[^\\d]+" + kTime + ")?(?:[^\\d]+" + kTime + ")?(?:[^\\d]+" + kTime + ")?" +
    "(?:[^\\d]+" + kTime + ")?(?:[^\\d]+" + kTime + ")?(?:[^\\d]+" + kTime + ")?" +
    "(?:[^\\d]+" + kTime + ")?");

  std::smatch m;
  if (!std::regex_search(line, m, re)) return std::nullopt;

  // Time groups are consecutive; the first missing one ends the run.
  std::vector<std::string> tokens;
  for (std::size_t g = 4; g < 4 + kTimeFieldCount; ++g) {
    if (!m[g].matched) break;
    tokens.push_back(m[g].str());
  }
  if (tokens.empty()) return std::nullopt;

  DayRecord rec = makeRecord(std::stoi(m[1].str()), ctx);
  rec.festival = stripLeadingWeekday(m[3].str());
  assignInOrder(rec.times, tokens);
  return rec;
}

std::optional<DayRecord> BruteForceParser::tryParse(const std::string& line, const RowContext& ctx) const {
  static const std::regex re(kDay);

  std::smatch m;
  if (!std::regex_search(line, m, re)) return std::nullopt;

  std::vector<std::string> tokens = allTimes(line);
  if (tokens.size() < 7) return std::nullopt;

  DayRecord rec = makeRecord(std::stoi(m[1].str()), ctx);
  assignInOrder(rec.times, tokens);
  return rec;
}

RowCascade::RowCascade() {
  parsers_.push_back(std::make_unique<FixedSchemaParser>());
  parsers_.push_back(std::make_unique<LooselyDelimitedParser>());
  parsers_.push_back(std::make_unique<PermissivePositionalParser>());
  parsers_.push_back(std::make_unique<BruteForceParser>());
}

RowCascade::RowCascade(std::vector<std::unique_ptr<RowParser>> parsers)
  : parsers_(std::move(parsers)) {}

std::optional<DayRecord> RowCascade::parseLine(const std::string& line, const RowContext& ctx) const {
  for (const auto& parser : parsers_) {
    std::optional<DayRecord> rec = parser->tryParse(line, ctx);
    if (!rec) continue;

    int maxDay = daysInMonth(ctx.year, ctx.month);
    if (rec->day < 1 || rec->day > maxDay) {
      spdlog::debug("{}: day {} outside 1..{} for month {:02d}, row dropped: {}",
                    parser->name(), rec->day, maxDay, ctx.month, line);
      return std::nullopt;
    }
    spdlog::debug("{:02d}-{:02d} parsed with {}", ctx.month, rec->day, parser->name());
    return rec;
  }
  spdlog::debug("no row strategy matched: {}", line);
  return std::nullopt;
}

std::optional<DayRecord> RowCascade::parseRow(const std::vector<std::string>& cells, const RowContext& ctx) const {
  return parseLine(joinCells(cells), ctx);
}
