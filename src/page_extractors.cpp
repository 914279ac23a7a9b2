#include "page_extractors.hpp"

#include "text_tokens.hpp"

#include <array>
#include <exception>
#include <optional>

#include <spdlog/spdlog.h>

namespace {

const std::array<const char*, 6> kHeaderKeywords = {
  "imsak", "sabah", "dreka", "ikindi", "aksham", "jaci"
};

// Column where the seven times start when a header-keyword row has too few time cells.
constexpr size_t kTimeColumnOffset = 3;

std::optional<int> validDay(const std::string& cell, const RowContext& ctx) {
  std::optional<int> day = firstInteger(cell);
  if (!day || *day < 1 || *day > daysInMonth(ctx.year, ctx.month)) return std::nullopt;
  return day;
}

std::string cellAt(const std::vector<std::string>& row, size_t i) {
  return i < row.size() ? trim(row[i]) : "";
}

std::string weekdayCell(const std::vector<std::string>& row, int day, const RowContext& ctx) {
  std::string weekday = cellAt(row, 1);
  if (weekday.empty() || containsTime(weekday)) return weekdayName(ctx.year, ctx.month, day);
  return weekday;
}

std::optional<DayRecord> readKeywordRow(const std::vector<std::string>& row, const RowContext& ctx) {
  if (row.empty()) return std::nullopt;
  std::optional<int> day = validDay(row[0], ctx);
  if (!day) return std::nullopt;

  DayRecord rec;
  rec.day = *day;
  rec.weekday = weekdayCell(row, *day, ctx);

  std::vector<size_t> timeColumns;
  for (size_t i = 0; i < row.size(); ++i) {
    if (containsTime(row[i])) timeColumns.push_back(i);
  }

  if (timeColumns.size() >= 7) {
    for (size_t i = 0; i < 7; ++i) rec.times.values[i] = firstTime(row[timeColumns[i]]);
    if (timeColumns.size() > 7) rec.times[TimeField::DayLength] = firstTime(row[timeColumns[7]]);
  } else {
    for (size_t i = 0; i < 7; ++i) rec.times.values[i] = firstTime(cellAt(row, kTimeColumnOffset + i));
    if (row.size() > kTimeColumnOffset + 7) rec.times[TimeField::DayLength] = firstTime(row.back());
  }

  if (rec.times.empty()) return std::nullopt;
  return rec;
}

std::optional<DayRecord> readFixedOffsetRow(const std::vector<std::string>& row, const RowContext& ctx) {
  if (row.size() < 7 || !isAllDigits(trim(row[0]))) return std::nullopt;
  std::optional<int> day = validDay(row[0], ctx);
  if (!day) return std::nullopt;

  DayRecord rec;
  rec.day = *day;
  rec.weekday = weekdayCell(row, *day, ctx);
  rec.festival = cellAt(row, 3);
  for (size_t i = 0; i < kTimeFieldCount; ++i) {
    rec.times.values[i] = firstTime(cellAt(row, 4 + i));
  }

  if (rec.times.empty()) return std::nullopt;
  return rec;
}

template <typename RowReader>
int readRows(const Table& table, const RowContext& ctx, MonthBucket& bucket, RowReader reader) {
  int written = 0;
  for (const auto& row : table.rows) {
    try {
      if (auto rec = reader(row, ctx)) {
        storeDayRecord(bucket, *rec);
        ++written;
      }
    } catch (const std::exception& ex) {
      spdlog::warn("page {}: row skipped: {}", table.pageNumber, ex.what());
    }
  }
  return written;
}

} // namespace

int extractTextLines(const std::string& pageText, const RowContext& ctx,
                     const RowCascade& cascade, MonthBucket& bucket) {
  int written = 0;
  for (const std::string& line : splitLines(pageText)) {
    if (!containsTime(line)) continue;
    try {
      if (auto rec = cascade.parseLine(line, ctx)) {
        storeDayRecord(bucket, *rec);
        ++written;
      }
    } catch (const std::exception& ex) {
      spdlog::warn("line skipped ({}): {}", ex.what(), line);
    }
  }
  return written;
}

bool hasPrayerTimeHeader(const std::vector<std::string>& headers) {
  std::string text = toLowerText(joinCells(headers));
  for (const char* keyword : kHeaderKeywords) {
    if (text.find(keyword) != std::string::npos) return true;
  }
  return false;
}

int extractHeaderKeywordTable(const Table& table, const RowContext& ctx, MonthBucket& bucket) {
  if (!hasPrayerTimeHeader(table.headers)) return -1;
  spdlog::debug("page {}: prayer times table for month {:02d}", table.pageNumber, ctx.month);
  return readRows(table, ctx, bucket, readKeywordRow);
}

int extractFixedOffsetTable(const Table& table, const RowContext& ctx, MonthBucket& bucket) {
  return readRows(table, ctx, bucket, readFixedOffsetRow);
}

int extractPrayerTables(const std::vector<Table>& tables, const RowContext& ctx, MonthBucket& bucket) {
  int written = 0;
  for (const auto& table : tables) {
    if (table.rows.empty()) continue;
    int n = extractHeaderKeywordTable(table, ctx, bucket);
    if (n < 0) n = extractFixedOffsetTable(table, ctx, bucket);
    written += n;
  }
  return written;
}

int extractFestivalTables(const std::vector<Table>& tables, const RowContext& ctx, MonthBucket& bucket) {
  int written = 0;
  for (const auto& table : tables) {
    for (const auto& row : table.rows) {
      if (row.size() < 4) continue;
      std::optional<int> day = validDay(row[0], ctx);
      if (!day) continue;
      std::string festival = trim(row[3]);
      if (festival.empty()) continue;

      auto it = bucket.find(twoDigitCode(*day));
      if (it == bucket.end()) {
        DayRecord rec;
        rec.day = *day;
        rec.weekday = weekdayName(ctx.year, ctx.month, *day);
        rec.festival = festival;
        bucket.emplace(twoDigitCode(*day), rec);
      } else {
        it->second.festival = festival;
      }
      spdlog::debug("festival {:02d}-{:02d}: {}", ctx.month, *day, festival);
      ++written;
    }
  }
  return written;
}
