#pragma once

#include "calendar_tables.hpp"
#include "calendar_types.hpp"
#include "document_source.hpp"

#include <string>
#include <vector>

// Where each month's pages sit in the document. Month m (0-based) has its
// festival page at firstMonthPage + m * pagesPerMonth and its prayer-times
// page prayerPageDelta pages later. Page indices are 0-based.
struct PageLayout {
  int firstMonthPage = 7;
  int pagesPerMonth = 2;
  int prayerPageDelta = 1;

  int festivalPage(int monthIndex) const { return firstMonthPage + monthIndex * pagesPerMonth; }
  int prayerPage(int monthIndex) const { return festivalPage(monthIndex) + prayerPageDelta; }
};

struct ExtractionOptions {
  PageLayout layout;
  HolidayTable holidays;
  CorrectionTable corrections;
};

// Extracts all twelve months of `year` from the document. The result always
// has the twelve month keys; months the document does not yield stay empty.
// Only DocumentUnreadable escapes; a page or row that fails contributes nothing.
CalendarYear extractCalendar(const DocumentSource& document, int year, const ExtractionOptions& options);

// Adds holiday text to every record whose "MM-DD" is in the table. Empty
// festival text is replaced, otherwise the holiday is appended after ", ".
// Returns the number of records changed.
int mergeFestivals(CalendarYear& calendar, const HolidayTable& holidays);

// Overwrites the corrected fields of every record whose "YYYY-MM-DD" is in the
// table. Dates without a record are ignored. Returns the number of records touched.
int applyCorrections(CalendarYear& calendar, int year, const CorrectionTable& corrections);

struct PageTableExport {
  std::vector<std::vector<std::string>> rows;
  std::string message;
};

// First table of one page (header row first). When the page has no table the
// rows are empty and `message` holds the page text instead.
PageTableExport extractPageTable(const DocumentSource& document, int pageIndex);
