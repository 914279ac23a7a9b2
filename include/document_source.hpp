#pragma once

#include <stdexcept>
#include <string>
#include <vector>

struct Table {
  int pageNumber;
  std::vector<std::string> headers;
  std::vector<std::vector<std::string>> rows;
};

// The document cannot be opened or read at all.
class DocumentUnreadable : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Read-only view of a paginated document. Page indices are 0-based.
class DocumentSource {
public:
  virtual ~DocumentSource() = default;

  virtual int pageCount() const = 0;
  virtual std::string pageText(int pageIndex) const = 0;
  virtual std::vector<Table> pageTables(int pageIndex) const = 0;
};
