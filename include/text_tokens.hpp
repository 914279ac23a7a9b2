#pragma once

#include <optional>
#include <string>
#include <vector>

// Time tokens are "1-2 digits, colon, 2 digits". Values are taken verbatim,
// hour and minute ranges are not checked.

// First time token in `text`, or an empty string.
std::string firstTime(const std::string& text);

// Every time token in `text`, left to right.
std::vector<std::string> allTimes(const std::string& text);

bool containsTime(const std::string& text);

std::string trim(const std::string& s);

// ASCII lowercase that also folds the Albanian capitals Ë and Ç.
std::string toLowerText(const std::string& s);

// Non-empty trimmed lines of `text` (handles \r\n).
std::vector<std::string> splitLines(const std::string& text);

// Cells joined with single spaces, empty cells skipped.
std::string joinCells(const std::vector<std::string>& cells);

// First run of digits in `text` as an integer.
std::optional<int> firstInteger(const std::string& text);

bool isAllDigits(const std::string& text);
