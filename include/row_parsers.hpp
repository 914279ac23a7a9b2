#pragma once

#include "calendar_types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

// The month a row is being read for.
struct RowContext {
  int year;
  int month;
};

// One strategy for turning a table row or text line into a day record.
// Returns std::nullopt when the line does not have the shape the strategy expects.
class RowParser {
public:
  virtual ~RowParser() = default;
  virtual const char* name() const = 0;
  virtual std::optional<DayRecord> tryParse(const std::string& line, const RowContext& ctx) const = 0;
};

// day, weekday, secondary-calendar number, optional festival, then exactly
// eight whitespace separated times. The festival holds no time token and no
// time may follow the eighth. Weekday is taken from the text.
class FixedSchemaParser : public RowParser {
public:
  const char* name() const override { return "fixed-schema"; }
  std::optional<DayRecord> tryParse(const std::string& line, const RowContext& ctx) const override;
};

// day, secondary-calendar number, festival, six times, then a trailing segment
// holding nightfall and (optionally) day length. Weekday is computed.
class LooselyDelimitedParser : public RowParser {
public:
  const char* name() const override { return "loosely-delimited"; }
  std::optional<DayRecord> tryParse(const std::string& line, const RowContext& ctx) const override;
};

// day followed by up to eight loosely separated fields; missing fields stay
// empty. Needs at least one time. Weekday is computed.
class PermissivePositionalParser : public RowParser {
public:
  const char* name() const override { return "permissive"; }
  std::optional<DayRecord> tryParse(const std::string& line, const RowContext& ctx) const override;
};

// Leading day number plus at least seven times anywhere in the line.
class BruteForceParser : public RowParser {
public:
  const char* name() const override { return "brute-force"; }
  std::optional<DayRecord> tryParse(const std::string& line, const RowContext& ctx) const override;
};

// Ordered list of strategies. The first strategy that matches decides the
// record; a record whose day falls outside the month is dropped.
class RowCascade {
public:
  // fixed-schema, loosely-delimited, permissive, brute-force.
  RowCascade();
  explicit RowCascade(std::vector<std::unique_ptr<RowParser>> parsers);

  std::optional<DayRecord> parseLine(const std::string& line, const RowContext& ctx) const;

  // Cells are joined with single spaces and parsed as one line.
  std::optional<DayRecord> parseRow(const std::vector<std::string>& cells, const RowContext& ctx) const;

  std::size_t size() const { return parsers_.size(); }

private:
  std::vector<std::unique_ptr<RowParser>> parsers_;
};

// Removes a leading weekday name ("e hënë", ...) from `text` and trims it.
std::string stripLeadingWeekday(const std::string& text);
