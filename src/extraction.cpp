#include "extraction.hpp"

#include "month_resolver.hpp"
#include "page_extractors.hpp"
#include "row_parsers.hpp"

#include <exception>
#include <set>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

// Runs one page's work. A backend failure aborts the whole run; anything
// else only costs this page.
template <typename Fn>
void guardPage(int pageIndex, const char* step, Fn&& fn) {
  try {
    fn();
  } catch (const DocumentUnreadable&) {
    throw;
  } catch (const std::exception& ex) {
    spdlog::warn("page {}: {} failed: {}", pageIndex + 1, step, ex.what());
  }
}

bool hasTimedDays(const MonthBucket& bucket) {
  for (const auto& kv : bucket) {
    if (!kv.second.times.empty()) return true;
  }
  return false;
}

void runMonthPass(const DocumentSource& document, int year, const PageLayout& layout,
                  const RowCascade& cascade, CalendarYear& calendar) {
  const int pages = document.pageCount();
  for (int m = 0; m < 12; ++m) {
    const int festivalPage = layout.festivalPage(m);
    const int prayerPage = layout.prayerPage(m);
    const std::string code = twoDigitCode(m + 1);
    if (festivalPage < 0 || prayerPage < 0 || festivalPage >= pages || prayerPage >= pages) {
      spdlog::debug("month {}: pages {} and {} not in document", code, festivalPage + 1, prayerPage + 1);
      continue;
    }

    RowContext ctx{year, m + 1};
    MonthBucket& bucket = calendar[code];

    guardPage(festivalPage, "festival extraction", [&]() {
      int n = extractFestivalTables(document.pageTables(festivalPage), ctx, bucket);
      spdlog::debug("month {}: {} festival entries on page {}", code, n, festivalPage + 1);
    });

    guardPage(prayerPage, "prayer times extraction", [&]() {
      int n = extractTextLines(document.pageText(prayerPage), ctx, cascade, bucket);
      if (n == 0) {
        n = extractPrayerTables(document.pageTables(prayerPage), ctx, bucket);
      }
      spdlog::debug("month {}: {} rows from page {}", code, n, prayerPage + 1);
    });

    spdlog::info("month {}: {} days after page pass", code, bucket.size());
  }
}

void runGapFill(const DocumentSource& document, int year, const RowCascade& cascade, CalendarYear& calendar) {
  std::set<std::string> missing;
  for (const auto& kv : calendar) {
    if (!hasTimedDays(kv.second)) missing.insert(kv.first);
  }
  if (missing.empty()) return;
  spdlog::warn("{} month(s) without prayer times, scanning every page", missing.size());

  const int pages = document.pageCount();
  for (int i = 0; i < pages; ++i) {
    guardPage(i, "gap fill", [&]() {
      std::string text = document.pageText(i);
      std::optional<std::string> month = detectMonthName(text);
      if (!month || missing.count(*month) == 0) return;

      RowContext ctx{year, std::stoi(*month)};
      MonthBucket& bucket = calendar[*month];
      int n = extractPrayerTables(document.pageTables(i), ctx, bucket);
      if (n == 0) n = extractTextLines(text, ctx, cascade, bucket);
      if (n > 0) spdlog::info("page {}: {} rows recovered for month {}", i + 1, n, *month);
    });
  }
}

} // namespace

CalendarYear extractCalendar(const DocumentSource& document, int year, const ExtractionOptions& options) {
  CalendarYear calendar = makeEmptyYear();
  RowCascade cascade;

  spdlog::info("Extracting calendar {} from {} pages", year, document.pageCount());
  runMonthPass(document, year, options.layout, cascade, calendar);
  runGapFill(document, year, cascade, calendar);

  int merged = mergeFestivals(calendar, options.holidays);
  int corrected = applyCorrections(calendar, year, options.corrections);
  spdlog::info("Total days extracted: {} ({} holidays merged, {} days corrected)",
               countDays(calendar), merged, corrected);
  return calendar;
}

int mergeFestivals(CalendarYear& calendar, const HolidayTable& holidays) {
  int changed = 0;
  for (auto& month : calendar) {
    for (auto& day : month.second) {
      const std::string* holiday = holidays.find(month.first + "-" + day.first);
      if (!holiday || holiday->empty()) continue;

      std::string& festival = day.second.festival;
      if (festival.empty()) {
        festival = *holiday;
      } else {
        festival += ", " + *holiday;
      }
      spdlog::debug("holiday {}-{}: {}", month.first, day.first, *holiday);
      ++changed;
    }
  }
  return changed;
}

int applyCorrections(CalendarYear& calendar, int year, const CorrectionTable& corrections) {
  int touched = 0;
  for (auto& month : calendar) {
    for (auto& day : month.second) {
      const std::string date = fmt::format("{:04d}-{}-{}", year, month.first, day.first);
      const TimeCorrection* correction = corrections.find(date);
      if (!correction) continue;
      int fields = correction->applyTo(day.second.times);
      spdlog::debug("correction {}: {} field(s)", date, fields);
      ++touched;
    }
  }
  return touched;
}

PageTableExport extractPageTable(const DocumentSource& document, int pageIndex) {
  PageTableExport result;
  if (pageIndex < 0 || pageIndex >= document.pageCount()) {
    result.message = "Invalid page number";
    return result;
  }

  std::vector<Table> tables = document.pageTables(pageIndex);
  if (tables.empty()) {
    std::string text = document.pageText(pageIndex);
    result.message = text.empty() ? "No tables found on this page" : text;
    return result;
  }

  const Table& table = tables.front();
  if (!table.headers.empty()) result.rows.push_back(table.headers);
  result.rows.insert(result.rows.end(), table.rows.begin(), table.rows.end());
  return result;
}
