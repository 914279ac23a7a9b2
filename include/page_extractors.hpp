#pragma once

#include "calendar_types.hpp"
#include "document_source.hpp"
#include "row_parsers.hpp"

#include <string>
#include <vector>

// Every extractor merges what it finds into `bucket` field by field (non-empty
// values overwrite, empty ones never erase) and returns the number of day
// records written. Running one twice on the same input gives the same bucket.

// Runs the row cascade over each line of page text that holds a time token.
int extractTextLines(const std::string& pageText, const RowContext& ctx,
                     const RowCascade& cascade, MonthBucket& bucket);

// True when the header names at least one prayer-time column
// (imsak, sabah, dreka, ikindi, aksham, jaci).
bool hasPrayerTimeHeader(const std::vector<std::string>& headers);

// Reads a table whose header names prayer-time columns. Returns -1 when the
// header does not, meaning the table was declined.
int extractHeaderKeywordTable(const Table& table, const RowContext& ctx, MonthBucket& bucket);

// Reads a table by position: day, weekday, secondary, festival, 8 times.
int extractFixedOffsetTable(const Table& table, const RowContext& ctx, MonthBucket& bucket);

// Header-keyword extraction, falling back to fixed offsets for declined tables.
int extractPrayerTables(const std::vector<Table>& tables, const RowContext& ctx, MonthBucket& bucket);

// Reads day -> festival pairs (cell 0 and cell 3) and touches only the
// festival field, creating placeholder records for unseen days.
int extractFestivalTables(const std::vector<Table>& tables, const RowContext& ctx, MonthBucket& bucket);
