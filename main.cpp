#include "calendar_json.hpp"
#include "extraction.hpp"
#include "pdf_document.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--year=YYYY] [--month=MM] [--page=N] [--holidays=file.json]"
               " [--corrections=file.json] [--first-month-page=N] [--pages-per-month=N]"
               " [--out=file.json] [--verbose|--quiet] <pdf_path>\n";
}

bool readOption(const std::string& arg, const std::string& name, std::string& value) {
  std::string prefix = "--" + name + "=";
  if (arg.rfind(prefix, 0) != 0) return false;
  value = arg.substr(prefix.size());
  return true;
}

int parseNumber(const std::string& value, const char* what) {
  try {
    size_t used = 0;
    int n = std::stoi(value, &used);
    if (used == value.size()) return n;
  } catch (const std::exception&) {
    // reported below
  }
  throw std::runtime_error(std::string("invalid ") + what + ": '" + value + "'");
}

// takvimi2024.pdf -> 2024
int yearFromFileName(const std::string& pdfPath) {
  std::string name = std::filesystem::path(pdfPath).filename().string();
  std::smatch m;
  if (std::regex_search(name, m, std::regex("(\\d{4})"))) return std::stoi(m[1].str());
  return 0;
}

} // namespace

int main(int argc, char** argv)
{
  // stdout carries the JSON/CSV output; logs go to stderr.
  spdlog::set_default_logger(spdlog::stderr_color_mt("takvimextract"));

  try {
    std::string pdfPath;
    std::string value;
    int year = 0;
    int month = 0;
    int page = 0;
    std::string holidaysPath;
    std::string correctionsPath;
    std::string outPath;
    PageLayout layout;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--verbose") {
        spdlog::set_level(spdlog::level::debug);
      } else if (arg == "--quiet") {
        spdlog::set_level(spdlog::level::warn);
      } else if (readOption(arg, "year", value)) {
        year = parseNumber(value, "year");
      } else if (readOption(arg, "month", value)) {
        month = parseNumber(value, "month");
      } else if (readOption(arg, "page", value)) {
        page = parseNumber(value, "page");
      } else if (readOption(arg, "holidays", value)) {
        holidaysPath = value;
      } else if (readOption(arg, "corrections", value)) {
        correctionsPath = value;
      } else if (readOption(arg, "first-month-page", value)) {
        layout.firstMonthPage = parseNumber(value, "first month page") - 1;
      } else if (readOption(arg, "pages-per-month", value)) {
        layout.pagesPerMonth = parseNumber(value, "pages per month");
      } else if (readOption(arg, "out", value)) {
        outPath = value;
      } else if (pdfPath.empty() && arg.rfind("--", 0) != 0) {
        pdfPath = arg;
      } else {
        std::cerr << "Unknown argument: " << arg << "\n";
        printUsage(argv[0]);
        return 2;
      }
    }

    if (pdfPath.empty()) {
      printUsage(argv[0]);
      return 2;
    }
    if (year == 0) year = yearFromFileName(pdfPath);
    if (year <= 0) {
      std::cerr << "Cannot tell the calendar year from '" << pdfPath << "'; pass --year=YYYY\n";
      return 2;
    }
    if (month != 0 && (month < 1 || month > 12)) {
      std::cerr << "Month must be a number between 01 and 12.\n";
      return 2;
    }

    PdfDocument document(pdfPath);

    if (page > 0) {
      PageTableExport exported = extractPageTable(document, page - 1);
      if (exported.rows.empty()) {
        std::cerr << "No data could be extracted from page " << page << ": " << exported.message << "\n";
        return 3;
      }
      writeTableCsv(exported.rows, std::cout);
      return 0;
    }

    ExtractionOptions options;
    options.layout = layout;
    options.holidays = holidaysPath.empty() ? HolidayTable::defaults(year) : HolidayTable::fromFile(holidaysPath);
    if (!correctionsPath.empty()) options.corrections = CorrectionTable::fromFile(correctionsPath);

    CalendarYear calendar = extractCalendar(document, year, options);
    for (const auto& kv : calendar) {
      if (kv.second.empty()) spdlog::warn("month {} has no days", kv.first);
    }

    nlohmann::json doc = month == 0
      ? yearDocument(year, calendar)
      : monthDocument(year, twoDigitCode(month), calendar.at(twoDigitCode(month)));

    if (outPath.empty()) {
      std::cout << doc.dump(2) << "\n";
    } else {
      std::ofstream ofs(outPath);
      if (!ofs) throw std::runtime_error("Failed to open " + outPath + " for writing");
      ofs << doc.dump(2) << "\n";
      spdlog::info("Calendar written to {}", outPath);
    }

    return 0;
  } catch (const DocumentUnreadable& ex) {
    std::cerr << "Extraction failed: " << ex.what() << "\n";
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
