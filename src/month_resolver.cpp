#include "month_resolver.hpp"

#include "calendar_types.hpp"
#include "text_tokens.hpp"

#include <array>
#include <cctype>

#include <spdlog/spdlog.h>

namespace {

const std::array<const char*, 12> kMonthNames = {
  "janar", "shkurt", "mars", "prill", "maj", "qershor",
  "korrik", "gusht", "shtator", "tetor", "nëntor", "dhjetor"
};

// Letters, digits and any byte of a multi-byte UTF-8 sequence count as word characters.
bool isWordByte(char ch) {
  unsigned char c = static_cast<unsigned char>(ch);
  return c >= 0x80 || std::isalnum(c) || c == '_';
}

size_t findWholeWord(const std::string& haystack, const std::string& word) {
  size_t pos = haystack.find(word);
  while (pos != std::string::npos) {
    bool startOk = pos == 0 || !isWordByte(haystack[pos - 1]);
    size_t after = pos + word.size();
    bool endOk = after >= haystack.size() || !isWordByte(haystack[after]);
    if (startOk && endOk) return pos;
    pos = haystack.find(word, pos + 1);
  }
  return std::string::npos;
}

} // namespace

std::optional<std::string> detectMonthName(const std::string& text) {
  const std::string lowered = toLowerText(text);
  size_t bestPos = std::string::npos;
  int bestMonth = 0;
  for (size_t i = 0; i < kMonthNames.size(); ++i) {
    size_t pos = findWholeWord(lowered, kMonthNames[i]);
    if (pos < bestPos) {
      bestPos = pos;
      bestMonth = static_cast<int>(i) + 1;
    }
  }
  if (bestMonth == 0) return std::nullopt;
  return twoDigitCode(bestMonth);
}

std::optional<std::string> resolvePageMonth(const std::string& pageText, int pageIndex) {
  if (auto month = detectMonthName(pageText)) {
    spdlog::debug("page {}: month {} found in text", pageIndex + 1, *month);
    return month;
  }
  if (pageIndex >= 0 && pageIndex < 12) {
    std::string inferred = twoDigitCode(pageIndex + 1);
    spdlog::debug("page {}: month {} inferred from page position", pageIndex + 1, inferred);
    return inferred;
  }
  return std::nullopt;
}
