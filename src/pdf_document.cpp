#include "pdf_document.hpp"

#include "text_tokens.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iterator>
#include <ostream>
#include <regex>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

struct WordBox {
  double xMin;
  double yMin;
  double xMax;
  double yMax;
  std::string text;

  double xCenter() const { return (xMin + xMax) * 0.5; }
  double yCenter() const { return (yMin + yMax) * 0.5; }
};

// A horizontal band of words, left to right.
struct TextRow {
  double top;
  double bottom;
  std::vector<WordBox> words;
};

// Horizontal extent shared by the words of one column.
struct ColumnSpan {
  double left;
  double right;
};

// Slack allowed between word spans of the same column.
constexpr double kColumnGap = 2.0;

std::string decodeEntities(const std::string& in) {
  static const std::array<std::pair<const char*, const char*>, 5> kEntities = {{
    {"&amp;", "&"}, {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&apos;", "'"}
  }};

  std::string out;
  out.reserve(in.size());
  size_t i = 0;
  while (i < in.size()) {
    bool replaced = false;
    if (in[i] == '&') {
      for (const auto& entity : kEntities) {
        if (in.compare(i, std::strlen(entity.first), entity.first) == 0) {
          out += entity.second;
          i += std::strlen(entity.first);
          replaced = true;
          break;
        }
      }
    }
    if (!replaced) out.push_back(in[i++]);
  }
  return out;
}

std::string readBboxLayout(const std::string& pdfPath) {
  if (std::system("command -v pdftotext >/dev/null 2>&1") != 0) {
    throw DocumentUnreadable("pdftotext not found; install poppler-utils");
  }
  const std::string cmd = "pdftotext -bbox-layout -q \"" + pdfPath + "\" -";

  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) throw DocumentUnreadable("Failed to run pdftotext -bbox-layout");

  std::string out;
  std::array<char, 4096> chunk;
  size_t n = 0;
  while ((n = std::fread(chunk.data(), 1, chunk.size(), pipe)) > 0) {
    out.append(chunk.data(), n);
  }
  if (pclose(pipe) != 0) throw DocumentUnreadable("pdftotext could not read " + pdfPath);
  return out;
}

// Words whose vertical centre falls inside the current band join it; y grows
// downwards, so rows come out top to bottom.
std::vector<TextRow> groupRows(std::vector<WordBox> words) {
  std::sort(words.begin(), words.end(), [](const WordBox& a, const WordBox& b) {
    return a.yMin != b.yMin ? a.yMin < b.yMin : a.xMin < b.xMin;
  });

  std::vector<TextRow> rows;
  for (auto& w : words) {
    double yc = w.yCenter();
    if (rows.empty() || yc < rows.back().top || yc > rows.back().bottom) {
      rows.push_back(TextRow{w.yMin, w.yMax, {}});
    }
    TextRow& row = rows.back();
    row.top = std::min(row.top, w.yMin);
    row.bottom = std::max(row.bottom, w.yMax);
    row.words.push_back(std::move(w));
  }

  for (auto& row : rows) {
    std::sort(row.words.begin(), row.words.end(), [](const WordBox& a, const WordBox& b) {
      return a.xMin < b.xMin;
    });
  }
  return rows;
}

// Overlapping word spans across all rows merge into one column.
std::vector<ColumnSpan> findColumns(const std::vector<TextRow>& rows) {
  std::vector<ColumnSpan> spans;
  for (const auto& row : rows) {
    for (const auto& w : row.words) spans.push_back(ColumnSpan{w.xMin, w.xMax});
  }
  std::sort(spans.begin(), spans.end(), [](const ColumnSpan& a, const ColumnSpan& b) {
    return a.left < b.left;
  });

  std::vector<ColumnSpan> columns;
  for (const auto& span : spans) {
    if (!columns.empty() && span.left <= columns.back().right + kColumnGap) {
      columns.back().right = std::max(columns.back().right, span.right);
    } else {
      columns.push_back(span);
    }
  }
  return columns;
}

std::vector<std::string> rowCells(const TextRow& row, const std::vector<ColumnSpan>& columns) {
  std::vector<std::string> cells(columns.size());
  for (const auto& w : row.words) {
    double xc = w.xCenter();
    auto col = std::find_if(columns.begin(), columns.end(), [xc](const ColumnSpan& c) {
      return xc <= c.right + kColumnGap;
    });
    if (col == columns.end()) col = std::prev(columns.end());
    std::string& cell = cells[static_cast<size_t>(col - columns.begin())];
    if (!cell.empty()) cell += ' ';
    cell += w.text;
  }
  return cells;
}

size_t filledCells(const std::vector<std::string>& row) {
  return std::count_if(row.begin(), row.end(), [](const std::string& c) { return !c.empty(); });
}

PageContent buildPage(std::vector<WordBox> words, int pageNumber) {
  PageContent page;
  std::vector<TextRow> rows = groupRows(std::move(words));

  for (const auto& row : rows) {
    std::string line;
    for (const auto& w : row.words) {
      if (!line.empty()) line += ' ';
      line += w.text;
    }
    page.text += line;
    page.text += '\n';
  }

  if (rows.size() < 2) return page;
  std::vector<ColumnSpan> columns = findColumns(rows);
  if (columns.size() < 2) return page;

  // Caption rows above the table fill fewer than two cells.
  auto first = std::find_if(rows.begin(), rows.end(), [&columns](const TextRow& row) {
    return filledCells(rowCells(row, columns)) >= 2;
  });
  if (std::distance(first, rows.end()) < 2) return page;

  Table t;
  t.pageNumber = pageNumber;
  t.headers = rowCells(*first, columns);
  for (auto it = std::next(first); it != rows.end(); ++it) t.rows.push_back(rowCells(*it, columns));
  page.tables.push_back(std::move(t));
  return page;
}

} // namespace

std::vector<PageContent> parseBboxLayout(const std::string& xhtml) {
  static const std::regex tokenRe(
    "(<page\\b[^>]*>)|(</page>)|"
    "<word[^>]*?xMin=\"([0-9.]+)\"[^>]*?yMin=\"([0-9.]+)\"[^>]*?xMax=\"([0-9.]+)\"[^>]*?yMax=\"([0-9.]+)\"[^>]*>([^<]*)</word>");

  std::vector<PageContent> pages;
  std::vector<WordBox> words;
  bool inPage = false;

  auto closePage = [&]() {
    pages.push_back(buildPage(std::move(words), static_cast<int>(pages.size()) + 1));
    words.clear();
    inPage = false;
  };

  auto it = std::sregex_iterator(xhtml.begin(), xhtml.end(), tokenRe);
  auto end = std::sregex_iterator();
  for (; it != end; ++it) {
    const std::smatch& m = *it;
    if (m[1].matched) {
      if (inPage) closePage();
      inPage = true;
    } else if (m[2].matched) {
      if (inPage) closePage();
    } else if (inPage) {
      WordBox w;
      w.xMin = std::stod(m[3].str());
      w.yMin = std::stod(m[4].str());
      w.xMax = std::stod(m[5].str());
      w.yMax = std::stod(m[6].str());
      w.text = decodeEntities(trim(m[7].str()));
      if (!w.text.empty()) words.push_back(std::move(w));
    }
  }
  if (inPage) closePage();
  return pages;
}

PdfDocument::PdfDocument(const std::string& pdfPath)
  : path_(pdfPath) {
  if (!std::filesystem::exists(pdfPath)) {
    throw DocumentUnreadable("PDF not found: " + pdfPath);
  }
  pages_ = parseBboxLayout(readBboxLayout(pdfPath));
  if (pages_.empty()) {
    throw DocumentUnreadable("No pages read from " + pdfPath);
  }
  spdlog::info("PDF opened: {} ({} pages)", pdfPath, pages_.size());
}

int PdfDocument::pageCount() const {
  return static_cast<int>(pages_.size());
}

const PageContent& PdfDocument::page(int pageIndex) const {
  if (pageIndex < 0 || pageIndex >= pageCount()) {
    throw std::out_of_range("page " + std::to_string(pageIndex + 1) + " not in " + path_);
  }
  return pages_[static_cast<size_t>(pageIndex)];
}

std::string PdfDocument::pageText(int pageIndex) const {
  return page(pageIndex).text;
}

std::vector<Table> PdfDocument::pageTables(int pageIndex) const {
  return page(pageIndex).tables;
}

void writeTableCsv(const std::vector<std::vector<std::string>>& rows, std::ostream& out) {
  for (const auto& row : rows) {
    for (size_t i = 0; i < row.size(); ++i) {
      const std::string& cell = row[i];
      bool needQuotes = cell.find(',') != std::string::npos || cell.find('"') != std::string::npos || cell.find('\n') != std::string::npos;
      if (needQuotes) {
        std::string escaped;
        for (char ch : cell) {
          if (ch == '"') escaped += '"';
          escaped += ch;
        }
        out << '"' << escaped << '"';
      } else {
        out << cell;
      }
      if (i + 1 < row.size()) out << ',';
    }
    out << "\n";
  }
}
