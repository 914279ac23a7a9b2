#pragma once

#include "document_source.hpp"

#include <iosfwd>
#include <string>
#include <vector>

struct PageContent {
  std::string text;
  std::vector<Table> tables;
};

// Parses the XHTML written by `pdftotext -bbox-layout`: words are clustered
// into rows by vertical position and into columns by horizontal position.
// Page text is the rows joined by newlines; each page with at least two rows
// and two columns yields one table whose leading caption rows (fewer than two
// filled cells) are dropped.
std::vector<PageContent> parseBboxLayout(const std::string& xhtml);

// A PDF read through poppler's `pdftotext`. The whole document is read once
// on construction; throws DocumentUnreadable when that fails.
class PdfDocument : public DocumentSource {
public:
  explicit PdfDocument(const std::string& pdfPath);

  int pageCount() const override;
  std::string pageText(int pageIndex) const override;
  std::vector<Table> pageTables(int pageIndex) const override;

private:
  const PageContent& page(int pageIndex) const;

  std::string path_;
  std::vector<PageContent> pages_;
};

// Writes rows as CSV, quoting cells that contain a comma, quote or newline.
void writeTableCsv(const std::vector<std::vector<std::string>>& rows, std::ostream& out);
