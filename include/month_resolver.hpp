#pragma once

#include <optional>
#include <string>

// Month code ("01".."12") of the Albanian month name appearing earliest in
// `text`, matched case-insensitively as a whole word.
std::optional<std::string> detectMonthName(const std::string& text);

// Resolves the month a page belongs to: an explicit month name in the page
// text first, otherwise the page position (pages 0..11 map to months 01..12).
// Returns std::nullopt when neither applies and the page should be skipped.
std::optional<std::string> resolvePageMonth(const std::string& pageText, int pageIndex);
