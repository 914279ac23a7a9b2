#include "text_tokens.hpp"

#include <cctype>
#include <regex>
#include <stdexcept>

namespace {

const std::regex& timePattern() {
  static const std::regex re("\\d{1,2}:\\d{2}");
  return re;
}

} // namespace

std::string firstTime(const std::string& text) {
  std::smatch m;
  if (std::regex_search(text, m, timePattern())) return m.str();
  return "";
}

std::vector<std::string> allTimes(const std::string& text) {
  std::vector<std::string> out;
  auto begin = std::sregex_iterator(text.begin(), text.end(), timePattern());
  auto end = std::sregex_iterator();
  for (auto it = begin; it != end; ++it) out.push_back(it->str());
  return out;
}

bool containsTime(const std::string& text) {
  return std::regex_search(text, timePattern());
}

std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) b--;
  return s.substr(a, b - a);
}

std::string toLowerText(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    // UTF-8 C3 8B (Ë) -> C3 AB (ë), C3 87 (Ç) -> C3 A7 (ç)
    if (c == 0xC3 && i + 1 < s.size()) {
      unsigned char next = static_cast<unsigned char>(s[i + 1]);
      if (next == 0x8B || next == 0x87) {
        out.push_back(s[i]);
        out.push_back(static_cast<char>(next + 0x20));
        ++i;
        continue;
      }
    }
    out.push_back(c < 0x80 ? static_cast<char>(std::tolower(c)) : s[i]);
  }
  return out;
}

std::vector<std::string> splitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::regex lineBreak("\r?\n");
  std::sregex_token_iterator it(text.begin(), text.end(), lineBreak, -1);
  std::sregex_token_iterator end;
  for (; it != end; ++it) {
    std::string line = trim(*it);
    if (!line.empty()) lines.push_back(line);
  }
  return lines;
}

std::string joinCells(const std::vector<std::string>& cells) {
  std::string out;
  for (const auto& cell : cells) {
    std::string c = trim(cell);
    if (c.empty()) continue;
    if (!out.empty()) out += ' ';
    out += c;
  }
  return out;
}

std::optional<int> firstInteger(const std::string& text) {
  size_t a = 0;
  while (a < text.size() && !std::isdigit(static_cast<unsigned char>(text[a]))) a++;
  if (a == text.size()) return std::nullopt;
  size_t b = a;
  while (b < text.size() && std::isdigit(static_cast<unsigned char>(text[b]))) b++;
  try {
    return std::stoi(text.substr(a, b - a));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

bool isAllDigits(const std::string& text) {
  if (text.empty()) return false;
  for (char ch : text) {
    if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
  }
  return true;
}
